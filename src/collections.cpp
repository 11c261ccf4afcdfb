#include "collections.hpp"
#include "encode.hpp"
#include <kj/debug.h>

namespace quasar
{

  namespace
  {
    const std::string kMeta = quote_identifier(CollectionManager::kMetaTable);
  } // namespace

  bool CollectionManager::exists(const std::string &name)
  {
    return conn_.withEnv([&](Env &env)
                         { return table_exists(env, name); });
  }

  void CollectionManager::create(const std::string &name)
  {
    conn_.execute("CREATE TABLE IF NOT EXISTS " + quote_identifier(name) +
                  " ("
                  "id TEXT PRIMARY KEY, "
                  "text TEXT, "
                  "vector BLOB, "
                  "payload TEXT, "
                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)");
  }

  void CollectionManager::drop(const std::string &name)
  {
    conn_.withEnv([&](Env &env)
                  {
      std::vector<Statement> batch;
      batch.push_back(Statement{"DROP TABLE IF EXISTS " + quote_identifier(name)});
      if (table_exists(env, kMetaTable))
        batch.push_back(Statement{"DELETE FROM " + kMeta + " WHERE name = ?", {name}});
      apply_transaction(env, batch); });
  }

  std::vector<std::string> CollectionManager::list()
  {
    auto rows = conn_.execute(
        "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name");
    std::vector<std::string> names;
    names.reserve(rows.size());
    for (const auto &r : rows)
      names.push_back(r.text(0));
    return names;
  }

  size_t CollectionManager::dropAll()
  {
    size_t dropped = 0;
    for (const auto &name : list())
    {
      try
      {
        conn_.execute("DROP TABLE IF EXISTS " + quote_identifier(name));
        ++dropped;
      }
      catch (const EngineError &e)
      {
        KJ_LOG(ERROR, "failed to drop table", name, e.code(), e.what());
      }
    }
    KJ_LOG(INFO, "dropped tables", dropped);
    return dropped;
  }

  std::optional<size_t> CollectionManager::dimensionOf(Env &env, const std::string &name)
  {
    if (!table_exists(env, kMetaTable))
      return std::nullopt;
    auto rows = query_rows(env, "SELECT dimension FROM " + kMeta + " WHERE name = ?", {name});
    if (rows.empty())
      return std::nullopt;
    return static_cast<size_t>(rows.front().integer(0));
  }

  std::vector<Statement> CollectionManager::recordDimension(const std::string &name, size_t dimension)
  {
    return {
        Statement{"CREATE TABLE IF NOT EXISTS " + kMeta + " (name TEXT PRIMARY KEY, dimension INTEGER NOT NULL)"},
        Statement{"INSERT OR IGNORE INTO " + kMeta + " (name, dimension) VALUES (?, ?)",
                  {name, static_cast<int64_t>(dimension)}},
    };
  }

} // namespace quasar
