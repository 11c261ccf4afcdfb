#include "vector_store.hpp"
#include "encode.hpp"
#include <kj/debug.h>
#include <algorithm>
#include <iterator>

namespace quasar
{

  namespace
  {
    // sanitized table name; a name that had to change is logged, since
    // distinct caller names can land on the same table
    std::string table_for(const std::string &collection)
    {
      auto name = sanitize_collection_name(collection);
      if (name != collection)
        KJ_LOG(WARNING, "collection name sanitized", collection, name);
      return name;
    }

    void check_query_vector(const std::vector<float> &v)
    {
      if (v.empty())
        throw InvalidQuery("query vector must not be empty");
      if (!is_finite_vector(v))
        throw InvalidQuery("query vector has a non-finite component");
    }
  } // namespace

  VectorStore::VectorStore(Connection &conn, CollectionManager &collections, EmbeddingGateway &gateway,
                           double batchScoreFloor)
      : conn_(conn), collections_(collections), gateway_(gateway), batchScoreFloor_(batchScoreFloor)
  {
  }

  std::vector<std::vector<float>> VectorStore::embedData(const std::vector<std::string> &texts)
  {
    return gateway_.embed(texts);
  }

  std::optional<std::string> VectorStore::resolve(const std::string &collection)
  {
    try
    {
      auto name = table_for(collection);
      if (collections_.exists(name))
        return name;
      return std::nullopt;
    }
    catch (const InvalidCollectionName &e)
    {
      KJ_LOG(WARNING, "invalid collection name, reporting not found", e.what());
      return std::nullopt;
    }
    catch (const EngineError &e)
    {
      KJ_LOG(WARNING, "collection lookup failed, reporting not found", collection, e.code(), e.what());
      return std::nullopt;
    }
  }

  bool VectorStore::hasCollection(const std::string &collection)
  {
    return resolve(collection).has_value();
  }

  void VectorStore::createCollection(const std::string &collection)
  {
    auto name = table_for(collection);
    collections_.create(name);
    KJ_LOG(INFO, "collection ready", name);
  }

  void VectorStore::createDataPoints(const std::string &collection, const std::vector<DataPoint> &points)
  {
    auto name = table_for(collection);
    if (!collections_.exists(name))
      throw CollectionNotFound(name);
    if (points.empty())
      return;

    std::vector<std::string> texts;
    texts.reserve(points.size());
    for (const auto &p : points)
    {
      if (!p.embeddableText())
        throw InvalidDataPoint("data point " + p.id() + " declares no embeddable text");
      texts.push_back(*p.embeddableText());
    }

    auto vectors = gateway_.embed(texts);
    const size_t dim = vectors.front().size();
    for (size_t i = 1; i < vectors.size(); ++i)
    {
      if (vectors[i].size() != dim)
        throw InvalidDataPoint("data point " + points[i].id() + " has dimension " +
                               std::to_string(vectors[i].size()) + ", batch has " + std::to_string(dim));
    }

    const std::string sql = "INSERT OR REPLACE INTO " + quote_identifier(name) +
                            " (id, text, vector, payload) VALUES (?, ?, ?, ?)";
    std::vector<Statement> batch;
    batch.reserve(points.size() + 2);
    for (size_t i = 0; i < points.size(); ++i)
    {
      std::string payload = serialize_data_point(points[i]).dump();
      batch.push_back(Statement{sql, {points[i].id(), texts[i], Blob{encode_vector(vectors[i])}, std::move(payload)}});
    }
    for (auto &s : CollectionManager::recordDimension(name, dim))
      batch.push_back(std::move(s));

    try
    {
      conn_.withEnv([&](Env &env)
                    {
        if (!table_exists(env, name))
          throw CollectionNotFound(name);
        auto stored = CollectionManager::dimensionOf(env, name);
        if (stored && *stored != dim)
          throw InvalidDataPoint("collection " + name + " holds " + std::to_string(*stored) +
                                 "-dimensional vectors, got " + std::to_string(dim));
        apply_transaction(env, batch); });
    }
    catch (const EngineError &e)
    {
      KJ_LOG(ERROR, "failed to upsert data points", name, points.size(), e.what());
      throw;
    }
    KJ_LOG(INFO, "upserted data points", name, points.size());
  }

  void VectorStore::createVectorIndex(const std::string &indexName, const std::string &propertyName)
  {
    createCollection(indexName + "_" + propertyName);
  }

  void VectorStore::indexDataPoints(const std::string &indexName, const std::string &propertyName,
                                    const std::vector<DataPoint> &points)
  {
    const std::string collection = indexName + "_" + propertyName;
    if (!collections_.exists(sanitize_collection_name(collection)))
      createCollection(collection);

    std::vector<DataPoint> schema;
    schema.reserve(points.size());
    for (const auto &p : points)
    {
      const auto &fields = p.index().indexFields;
      if (fields.empty())
        throw InvalidDataPoint("data point " + p.id() + " declares no index fields");
      // embeddableText() already holds the value of index_fields[0]
      schema.emplace_back("IndexSchema", nlohmann::json{{"text", *p.embeddableText()}},
                          IndexSpec{{}, {"text"}}, p.id());
    }
    createDataPoints(collection, schema);
  }

  std::vector<ScoredResult> VectorStore::retrieve(const std::string &collection, const std::vector<std::string> &ids)
  {
    auto name = table_for(collection);
    auto rows = conn_.withEnv([&](Env &env)
                              {
      if (!table_exists(env, name))
        throw CollectionNotFound(name);
      std::vector<Row> found;
      for_each_id_chunk(ids, [&](std::vector<Value> params)
                        {
        auto chunk = query_rows(env, "SELECT id, payload FROM " + quote_identifier(name) + " WHERE id IN (" +
                                         placeholders(params.size()) + ")",
                                params);
        std::move(chunk.begin(), chunk.end(), std::back_inserter(found)); });
      return found; });

    std::vector<ScoredResult> out;
    out.reserve(rows.size());
    for (const auto &r : rows)
    {
      try
      {
        out.push_back(ScoredResult{r.text(0), nlohmann::json::parse(r.text(1)), 0.0, std::nullopt});
      }
      catch (const nlohmann::json::exception &e)
      {
        KJ_LOG(WARNING, "skipping row with malformed payload", name, r.text(0), e.what());
      }
    }
    return out;
  }

  std::optional<std::vector<ScannedRow>> VectorStore::scan(const std::string &table)
  {
    // existence and the SELECT share one hold of the gate, so a concurrent
    // drop reads as a missing collection
    auto rows = conn_.withEnv([&](Env &env) -> std::optional<std::vector<Row>>
                              {
      if (!table_exists(env, table))
        return std::nullopt;
      return query_rows(env, "SELECT id, vector, payload FROM " + quote_identifier(table)); });
    if (!rows)
      return std::nullopt;

    std::vector<ScannedRow> out;
    out.reserve(rows->size());
    for (const auto &r : *rows)
    {
      try
      {
        ScannedRow s;
        s.id = r.text(0);
        s.vector = decode_vector(r.blob(1).data);
        if (!is_finite_vector(s.vector))
          throw StoreError("vector has a non-finite component");
        s.payload = nlohmann::json::parse(r.text(2));
        out.push_back(std::move(s));
      }
      catch (const StoreError &e)
      {
        KJ_LOG(WARNING, "skipping malformed row", table, e.what());
      }
      catch (const nlohmann::json::exception &e)
      {
        KJ_LOG(WARNING, "skipping row with malformed payload", table, e.what());
      }
    }
    return out;
  }

  std::vector<ScoredResult> VectorStore::search(const std::string &collection, const SearchParams &params)
  {
    if (!params.queryText && !params.queryVector)
      throw MissingQueryParameter();
    if (params.queryVector)
      check_query_vector(*params.queryVector);

    auto name = resolve(collection);
    if (!name)
    {
      KJ_LOG(WARNING, "collection not found, returning empty results", collection);
      return {};
    }
    if (params.limit <= 0)
      return {};

    std::vector<float> query;
    if (params.queryVector)
      query = *params.queryVector;
    else
      query = gateway_.embed({*params.queryText}).front();

    auto rows = scan(*name);
    if (!rows)
    {
      KJ_LOG(WARNING, "collection dropped during search, returning empty results", *name);
      return {};
    }
    return rank_rows(*rows, query, RankParams{params.limit, params.withVector, std::nullopt});
  }

  std::vector<std::vector<ScoredResult>> VectorStore::batchSearch(const std::string &collection,
                                                                  const BatchSearchParams &params)
  {
    std::vector<std::vector<ScoredResult>> out(params.queryTexts.size());
    if (params.queryTexts.empty())
      return out;
    auto name = resolve(collection);
    if (!name)
    {
      KJ_LOG(WARNING, "collection not found, returning empty results", collection);
      return out;
    }
    if (params.limit <= 0)
      return out;

    auto queries = gateway_.embed(params.queryTexts);
    auto rows = scan(*name);
    if (!rows)
    {
      KJ_LOG(WARNING, "collection dropped during search, returning empty results", *name);
      return out;
    }
    RankParams rank{params.limit, params.withVectors, batchScoreFloor_};
    for (size_t i = 0; i < queries.size(); ++i)
      out[i] = rank_rows(*rows, queries[i], rank);
    return out;
  }

  uint64_t VectorStore::deleteDataPoints(const std::string &collection, const std::vector<std::string> &ids)
  {
    auto name = table_for(collection);
    std::vector<Statement> batch;
    for_each_id_chunk(ids, [&](std::vector<Value> params)
                      {
      std::string sql = "DELETE FROM " + quote_identifier(name) + " WHERE id IN (" + placeholders(params.size()) + ")";
      batch.push_back(Statement{std::move(sql), std::move(params)}); });

    uint64_t deleted = conn_.withEnv([&](Env &env) -> uint64_t
                                     {
      if (!table_exists(env, name))
        throw CollectionNotFound(name);
      if (batch.empty())
        return 0;
      return apply_transaction(env, batch); });
    KJ_LOG(INFO, "deleted data points", name, deleted);
    return deleted;
  }

  void VectorStore::prune()
  {
    collections_.dropAll();
  }

  std::vector<std::string> VectorStore::getCollectionNames()
  {
    auto names = collections_.list();
    // graph and catalog tables carry a leading underscore that sanitized
    // names never have
    names.erase(std::remove_if(names.begin(), names.end(), [](const std::string &n)
                               { return !n.empty() && n[0] == '_'; }),
                names.end());
    return names;
  }

} // namespace quasar
