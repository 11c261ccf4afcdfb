#pragma once
#include "data_point.hpp"
#include "env.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  // -------------------- vector side ---------------------------

  struct ScoredResult
  {
    std::string id;
    nlohmann::json payload{};
    double score{0.0};
    std::optional<std::vector<float>> vector{};
  };

  struct SearchParams
  {
    std::optional<std::string> queryText{};
    std::optional<std::vector<float>> queryVector{};
    int64_t limit{10};
    bool withVector{false};
  };

  struct BatchSearchParams
  {
    std::vector<std::string> queryTexts{};
    int64_t limit{10};
    bool withVectors{false};
  };

  class VectorDb
  {
  public:
    virtual ~VectorDb() = default;

    virtual std::vector<std::vector<float>> embedData(const std::vector<std::string> &texts) = 0;
    virtual bool hasCollection(const std::string &collection) = 0;
    virtual void createCollection(const std::string &collection) = 0;
    virtual void createDataPoints(const std::string &collection, const std::vector<DataPoint> &points) = 0;
    virtual void createVectorIndex(const std::string &indexName, const std::string &propertyName) = 0;
    virtual void indexDataPoints(const std::string &indexName, const std::string &propertyName,
                                 const std::vector<DataPoint> &points) = 0;
    virtual std::vector<ScoredResult> retrieve(const std::string &collection, const std::vector<std::string> &ids) = 0;
    virtual std::vector<ScoredResult> search(const std::string &collection, const SearchParams &params) = 0;
    virtual std::vector<std::vector<ScoredResult>> batchSearch(const std::string &collection,
                                                               const BatchSearchParams &params) = 0;
    virtual uint64_t deleteDataPoints(const std::string &collection, const std::vector<std::string> &ids) = 0;
    virtual void prune() = 0;
    virtual std::vector<std::string> getCollectionNames() = 0;
  };

  // -------------------- graph side ---------------------------

  struct Node
  {
    std::string id;
    std::string name{};
    std::string type{};
    nlohmann::json payload{};
  };

  struct EdgeKey
  {
    std::string source;
    std::string target;
    std::string relationship;
  };

  struct Edge
  {
    std::string source;
    std::string target;
    std::string relationship;
    nlohmann::json properties = nlohmann::json::object();
  };

  // source node, edge, target node
  struct NodeConnection
  {
    Node from;
    Edge edge;
    Node to;
  };

  struct Subgraph
  {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
  };

  struct GraphMetrics
  {
    uint64_t numNodes{0};
    uint64_t numEdges{0};
    double meanDegree{0.0};
    double edgeDensity{0.0};
    uint64_t numSelfLoops{0};
    uint64_t numConnectedComponents{0};
    std::vector<uint64_t> componentSizes{}; // descending
    std::map<uint64_t, uint64_t> degreeDistribution{}; // degree -> node count
  };

  class GraphDb
  {
  public:
    virtual ~GraphDb() = default;

    // raw SQL pass-through; each row becomes a {column: value} object
    virtual std::vector<nlohmann::json> query(const std::string &sql, const std::vector<Value> &params = {}) = 0;

    virtual bool hasNode(const std::string &id) = 0;
    virtual void addNode(const DataPoint &node) = 0;
    virtual void addNodes(const std::vector<DataPoint> &nodes) = 0;
    virtual std::optional<Node> extractNode(const std::string &id) = 0;
    virtual std::vector<Node> extractNodes(const std::vector<std::string> &ids) = 0;
    virtual void deleteNode(const std::string &id) = 0;
    virtual void deleteNodes(const std::vector<std::string> &ids) = 0;

    virtual bool hasEdge(const std::string &source, const std::string &target, const std::string &relationship) = 0;
    virtual std::vector<bool> hasEdges(const std::vector<EdgeKey> &edges) = 0;
    virtual void addEdge(const std::string &source, const std::string &target, const std::string &relationship,
                         const nlohmann::json &properties = nlohmann::json::object()) = 0;
    virtual void addEdges(const std::vector<Edge> &edges) = 0;
    virtual std::vector<Edge> getEdges(const std::string &nodeId) = 0;

    virtual std::vector<Node> getNeighbors(const std::string &nodeId,
                                           const std::optional<std::string> &relationship = std::nullopt) = 0;
    virtual std::vector<Node> getPredecessors(const std::string &nodeId,
                                              const std::optional<std::string> &relationship = std::nullopt) = 0;
    virtual std::vector<Node> getSuccessors(const std::string &nodeId,
                                            const std::optional<std::string> &relationship = std::nullopt) = 0;
    virtual std::vector<NodeConnection> getConnections(const std::string &nodeId) = 0;
    virtual std::vector<std::string> getDisconnectedNodes() = 0;
    virtual uint64_t removeConnectionToPredecessorsOf(const std::vector<std::string> &nodeIds,
                                                      const std::string &relationship) = 0;
    virtual uint64_t removeConnectionToSuccessorsOf(const std::vector<std::string> &nodeIds,
                                                    const std::string &relationship) = 0;

    virtual Subgraph getNodesetSubgraph(const std::string &nodeType, const std::vector<std::string> &nodeNames) = 0;
    virtual Subgraph getGraphData() = 0;
    virtual GraphMetrics getGraphMetrics() = 0;
    virtual void deleteGraph() = 0;
  };

  // nlohmann::json conversions, found by ADL
  void to_json(nlohmann::json &j, const ScoredResult &r);
  void to_json(nlohmann::json &j, const Node &node);
  void to_json(nlohmann::json &j, const Edge &edge);
  void to_json(nlohmann::json &j, const Subgraph &graph);
  void to_json(nlohmann::json &j, const GraphMetrics &metrics);

} // namespace quasar
