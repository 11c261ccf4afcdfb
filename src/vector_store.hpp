#pragma once
#include "capabilities.hpp"
#include "collections.hpp"
#include "connection.hpp"
#include "embedding.hpp"
#include "similarity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  class VectorStore final : public VectorDb
  {
  public:
    VectorStore(Connection &conn, CollectionManager &collections, EmbeddingGateway &gateway,
                double batchScoreFloor = 0.7);

    std::vector<std::vector<float>> embedData(const std::vector<std::string> &texts) override;

    // false (not an error) for an invalid name or when the catalog lookup
    // itself fails
    bool hasCollection(const std::string &collection) override;
    void createCollection(const std::string &collection) override;

    // collection must exist; all rows are upserted in one transaction
    void createDataPoints(const std::string &collection, const std::vector<DataPoint> &points) override;
    void createVectorIndex(const std::string &indexName, const std::string &propertyName) override;
    // writes into "<indexName>_<propertyName>", creating it on demand
    void indexDataPoints(const std::string &indexName, const std::string &propertyName,
                         const std::vector<DataPoint> &points) override;

    std::vector<ScoredResult> retrieve(const std::string &collection, const std::vector<std::string> &ids) override;
    std::vector<ScoredResult> search(const std::string &collection, const SearchParams &params) override;
    std::vector<std::vector<ScoredResult>> batchSearch(const std::string &collection,
                                                       const BatchSearchParams &params) override;
    uint64_t deleteDataPoints(const std::string &collection, const std::vector<std::string> &ids) override;

    // drops every table, graph tables included
    void prune() override;
    std::vector<std::string> getCollectionNames() override;

  private:
    // sanitized name of an existing collection, or nullopt
    std::optional<std::string> resolve(const std::string &collection);
    // nullopt when the table does not exist
    std::optional<std::vector<ScannedRow>> scan(const std::string &table);

    Connection &conn_;
    CollectionManager &collections_;
    EmbeddingGateway &gateway_;
    double batchScoreFloor_;
  };

} // namespace quasar
