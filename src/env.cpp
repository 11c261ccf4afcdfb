#include "env.hpp"
#include <sqlite3.h>
#include <kj/debug.h>

namespace quasar
{

  namespace
  {
    [[noreturn]] void throw_engine(sqlite3 *db, int rc)
    {
      const char *msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
      throw EngineError(rc, msg ? msg : "unknown sqlite error");
    }

    const char *value_kind(const Value &v)
    {
      switch (v.index())
      {
      case 0:
        return "null";
      case 1:
        return "integer";
      case 2:
        return "real";
      case 3:
        return "text";
      default:
        return "blob";
      }
    }
  } // namespace

  // -------------------- Row --------------------

  const std::string &Row::text(size_t i) const
  {
    static const std::string empty;
    const Value &v = values.at(i);
    if (std::holds_alternative<std::monostate>(v))
      return empty;
    if (auto s = std::get_if<std::string>(&v))
      return *s;
    throw EngineError(SQLITE_MISMATCH, std::string("expected text column, got ") + value_kind(v));
  }

  const Blob &Row::blob(size_t i) const
  {
    const Value &v = values.at(i);
    if (auto b = std::get_if<Blob>(&v))
      return *b;
    throw EngineError(SQLITE_MISMATCH, std::string("expected blob column, got ") + value_kind(v));
  }

  int64_t Row::integer(size_t i) const
  {
    const Value &v = values.at(i);
    if (auto x = std::get_if<int64_t>(&v))
      return *x;
    throw EngineError(SQLITE_MISMATCH, std::string("expected integer column, got ") + value_kind(v));
  }

  // -------------------- Env --------------------

  Env::Env(const std::string &path, int busyTimeoutMs)
  {
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK)
    {
      std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
      if (db_)
      {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      throw EngineError(rc, "failed to open database " + path + ": " + err);
    }
    sqlite3_busy_timeout(db_, busyTimeoutMs);
    if (path != ":memory:" && !path.empty())
      exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
  }

  Env::~Env() noexcept
  {
    if (db_)
      sqlite3_close(db_);
  }

  Env::Env(Env &&other) noexcept : db_(other.db_)
  {
    other.db_ = nullptr;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      if (db_)
        sqlite3_close(db_);
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  sqlite3 *Env::raw() const { return db_; }

  void Env::exec(const char *sql)
  {
    char *err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
      std::string msg = err ? err : sqlite3_errstr(rc);
      sqlite3_free(err);
      throw EngineError(rc, msg);
    }
  }

  uint64_t Env::changes() const
  {
    return static_cast<uint64_t>(sqlite3_changes(db_));
  }

  // -------------------- Stmt --------------------

  Stmt::Stmt(Env &env, std::string_view sql) : env_(env)
  {
    int rc = sqlite3_prepare_v2(env_.raw(), sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK)
      throw_engine(env_.raw(), rc);
    if (!stmt_)
      throw EngineError(SQLITE_MISUSE, "empty statement");
  }

  Stmt::~Stmt() noexcept
  {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }

  void Stmt::bind(const std::vector<Value> &params)
  {
    int expected = sqlite3_bind_parameter_count(stmt_);
    if (expected != static_cast<int>(params.size()))
      throw EngineError(SQLITE_RANGE, "statement expects " + std::to_string(expected) +
                                          " parameters, got " + std::to_string(params.size()));
    for (size_t i = 0; i < params.size(); ++i)
    {
      int col = static_cast<int>(i) + 1;
      const Value &v = params[i];
      int rc = SQLITE_OK;
      if (std::holds_alternative<std::monostate>(v))
        rc = sqlite3_bind_null(stmt_, col);
      else if (auto x = std::get_if<int64_t>(&v))
        rc = sqlite3_bind_int64(stmt_, col, *x);
      else if (auto d = std::get_if<double>(&v))
        rc = sqlite3_bind_double(stmt_, col, *d);
      else if (auto s = std::get_if<std::string>(&v))
        rc = sqlite3_bind_text(stmt_, col, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
      else
      {
        const auto &b = std::get<Blob>(v).data;
        rc = sqlite3_bind_blob(stmt_, col, b.data(), static_cast<int>(b.size()), SQLITE_TRANSIENT);
      }
      if (rc != SQLITE_OK)
        throw_engine(env_.raw(), rc);
    }
  }

  bool Stmt::step()
  {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw_engine(env_.raw(), rc);
  }

  Row Stmt::row() const
  {
    Row r;
    int n = sqlite3_column_count(stmt_);
    r.columns.reserve(n);
    r.values.reserve(n);
    for (int i = 0; i < n; ++i)
    {
      const char *name = sqlite3_column_name(stmt_, i);
      r.columns.emplace_back(name ? name : "");
      switch (sqlite3_column_type(stmt_, i))
      {
      case SQLITE_INTEGER:
        r.values.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt_, i)));
        break;
      case SQLITE_FLOAT:
        r.values.emplace_back(sqlite3_column_double(stmt_, i));
        break;
      case SQLITE_TEXT:
      {
        const auto *p = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, i));
        int len = sqlite3_column_bytes(stmt_, i);
        r.values.emplace_back(std::string(p ? p : "", static_cast<size_t>(len)));
        break;
      }
      case SQLITE_BLOB:
      {
        const auto *p = static_cast<const char *>(sqlite3_column_blob(stmt_, i));
        int len = sqlite3_column_bytes(stmt_, i);
        r.values.emplace_back(Blob{p ? std::string(p, static_cast<size_t>(len)) : std::string()});
        break;
      }
      default:
        r.values.emplace_back(std::monostate{});
        break;
      }
    }
    return r;
  }

  // -------------------- Txn --------------------

  Txn::Txn(Env &env) : env_(env)
  {
    env_.exec("BEGIN TRANSACTION;");
    active_ = true;
  }

  Txn::~Txn() noexcept
  {
    rollback();
  }

  void Txn::commit()
  {
    env_.exec("COMMIT;");
    active_ = false;
  }

  void Txn::rollback() noexcept
  {
    if (!active_)
      return;
    active_ = false;
    int rc = sqlite3_exec(env_.raw(), "ROLLBACK;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
      KJ_LOG(ERROR, "rollback failed", sqlite3_errstr(rc));
  }

} // namespace quasar
