#pragma once
#include "env.hpp"
#include <kj/mutex.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quasar
{

  struct Statement
  {
    std::string sql;
    std::vector<Value> params{};
  };

  // Statement helpers for code that already holds the gate (see withEnv).
  std::vector<Row> query_rows(Env &env, std::string_view sql, const std::vector<Value> &params = {});
  bool table_exists(Env &env, const std::string &name);
  // BEGIN, each statement in order, COMMIT; rolls back and rethrows on failure
  uint64_t apply_transaction(Env &env, const std::vector<Statement> &statements);

  // Owns the single database handle. Every call runs under one exclusive
  // gate for its whole duration, so statements issued from different
  // threads never interleave on the connection.
  class Connection
  {
  public:
    explicit Connection(const std::string &path, int busyTimeoutMs = 5000);
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    std::vector<Row> execute(std::string_view sql, const std::vector<Value> &params = {});
    std::optional<Row> executeOne(std::string_view sql, const std::vector<Value> &params = {});

    // BEGIN, each statement in order, COMMIT. Any failure rolls back and
    // rethrows. Returns the number of rows changed by the batch.
    uint64_t executeTransaction(const std::vector<Statement> &statements);

    // Runs fn(Env &) under the gate, for a check and the work it guards
    // that must not be split by another caller.
    template <typename Fn>
    auto withEnv(Fn &&fn) -> decltype(fn(std::declval<Env &>()))
    {
      auto lock = env_.lockExclusive();
      return fn(requireOpen(*lock));
    }

    void close();
    bool isOpen() const;

  private:
    static Env &requireOpen(std::unique_ptr<Env> &env);

    kj::MutexGuarded<std::unique_ptr<Env>> env_;
  };

} // namespace quasar
