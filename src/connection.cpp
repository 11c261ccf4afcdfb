#include "connection.hpp"
#include <sqlite3.h>
#include <kj/debug.h>

namespace quasar
{

  std::vector<Row> query_rows(Env &env, std::string_view sql, const std::vector<Value> &params)
  {
    Stmt stmt(env, sql);
    stmt.bind(params);
    std::vector<Row> rows;
    while (stmt.step())
      rows.push_back(stmt.row());
    return rows;
  }

  bool table_exists(Env &env, const std::string &name)
  {
    Stmt stmt(env, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind({name});
    return stmt.step();
  }

  uint64_t apply_transaction(Env &env, const std::vector<Statement> &statements)
  {
    Txn tx(env);
    uint64_t changed = 0;
    size_t index = 0;
    try
    {
      for (; index < statements.size(); ++index)
      {
        Stmt stmt(env, statements[index].sql);
        stmt.bind(statements[index].params);
        while (stmt.step())
        {
        }
        changed += env.changes();
      }
      tx.commit();
    }
    catch (const EngineError &e)
    {
      KJ_LOG(ERROR, "transaction rolled back", index, statements.size(), e.code(), e.what());
      throw;
    }
    return changed;
  }

  Connection::Connection(const std::string &path, int busyTimeoutMs)
      : env_(std::make_unique<Env>(path, busyTimeoutMs))
  {
  }

  Env &Connection::requireOpen(std::unique_ptr<Env> &env)
  {
    if (!env)
      throw EngineError(SQLITE_MISUSE, "connection is closed");
    return *env;
  }

  std::vector<Row> Connection::execute(std::string_view sql, const std::vector<Value> &params)
  {
    return withEnv([&](Env &env)
                   { return query_rows(env, sql, params); });
  }

  std::optional<Row> Connection::executeOne(std::string_view sql, const std::vector<Value> &params)
  {
    return withEnv([&](Env &env) -> std::optional<Row>
                   {
      Stmt stmt(env, sql);
      stmt.bind(params);
      if (!stmt.step())
        return std::nullopt;
      return stmt.row(); });
  }

  uint64_t Connection::executeTransaction(const std::vector<Statement> &statements)
  {
    return withEnv([&](Env &env)
                   { return apply_transaction(env, statements); });
  }

  void Connection::close()
  {
    auto lock = env_.lockExclusive();
    lock->reset();
  }

  bool Connection::isOpen() const
  {
    auto lock = env_.lockExclusive();
    return static_cast<bool>(*lock);
  }

} // namespace quasar
