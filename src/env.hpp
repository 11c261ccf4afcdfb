#pragma once
#include "errors.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace quasar
{

  struct Blob
  {
    std::string data; // raw bytes
  };

  using Value = std::variant<std::monostate, int64_t, double, std::string, Blob>;

  struct Row
  {
    std::vector<std::string> columns;
    std::vector<Value> values;

    bool isNull(size_t i) const { return std::holds_alternative<std::monostate>(values.at(i)); }
    // empty string for NULL; throws EngineError for non-text columns
    const std::string &text(size_t i) const;
    const Blob &blob(size_t i) const;
    int64_t integer(size_t i) const;
  };

  class Env
  {
  public:
    explicit Env(const std::string &path, int busyTimeoutMs = 5000);
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    sqlite3 *raw() const;

    // runs one or more parameterless statements
    void exec(const char *sql);
    uint64_t changes() const;

  private:
    sqlite3 *db_{};
  };

  class Stmt
  {
  public:
    Stmt(Env &env, std::string_view sql);
    ~Stmt() noexcept;
    Stmt(const Stmt &) = delete;
    Stmt &operator=(const Stmt &) = delete;

    void bind(const std::vector<Value> &params);
    // true while a row is available
    bool step();
    Row row() const;

  private:
    Env &env_;
    sqlite3_stmt *stmt_{};
  };

  class Txn
  {
  public:
    explicit Txn(Env &env);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;

    void commit();
    void rollback() noexcept;

  private:
    Env &env_;
    bool active_{false};
  };

} // namespace quasar
