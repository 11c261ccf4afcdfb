#pragma once
#include "capabilities.hpp"
#include "connection.hpp"

namespace quasar
{

  // Nodes and edges on two reserved tables of the shared connection. Edges
  // are keyed by (source, target, relationship); deleting a node leaves its
  // edges in place.
  class GraphStore final : public GraphDb
  {
  public:
    static constexpr const char *kNodeTable = "_graph_node";
    static constexpr const char *kEdgeTable = "_graph_edge";

    explicit GraphStore(Connection &conn) : conn_(conn) {}

    std::vector<nlohmann::json> query(const std::string &sql, const std::vector<Value> &params = {}) override;

    bool hasNode(const std::string &id) override;
    void addNode(const DataPoint &node) override;
    void addNodes(const std::vector<DataPoint> &nodes) override;
    std::optional<Node> extractNode(const std::string &id) override;
    std::vector<Node> extractNodes(const std::vector<std::string> &ids) override;
    void deleteNode(const std::string &id) override;
    void deleteNodes(const std::vector<std::string> &ids) override;

    bool hasEdge(const std::string &source, const std::string &target, const std::string &relationship) override;
    std::vector<bool> hasEdges(const std::vector<EdgeKey> &edges) override;
    void addEdge(const std::string &source, const std::string &target, const std::string &relationship,
                 const nlohmann::json &properties = nlohmann::json::object()) override;
    void addEdges(const std::vector<Edge> &edges) override;
    std::vector<Edge> getEdges(const std::string &nodeId) override;

    std::vector<Node> getNeighbors(const std::string &nodeId,
                                   const std::optional<std::string> &relationship = std::nullopt) override;
    std::vector<Node> getPredecessors(const std::string &nodeId,
                                      const std::optional<std::string> &relationship = std::nullopt) override;
    std::vector<Node> getSuccessors(const std::string &nodeId,
                                    const std::optional<std::string> &relationship = std::nullopt) override;
    std::vector<NodeConnection> getConnections(const std::string &nodeId) override;
    std::vector<std::string> getDisconnectedNodes() override;
    uint64_t removeConnectionToPredecessorsOf(const std::vector<std::string> &nodeIds,
                                              const std::string &relationship) override;
    uint64_t removeConnectionToSuccessorsOf(const std::vector<std::string> &nodeIds,
                                            const std::string &relationship) override;

    Subgraph getNodesetSubgraph(const std::string &nodeType, const std::vector<std::string> &nodeNames) override;
    Subgraph getGraphData() override;
    GraphMetrics getGraphMetrics() override;
    void deleteGraph() override;

  private:
    // writes only; reads treat missing tables as an empty graph
    void ensureSchema();
    std::vector<Row> readRows(const std::string &sql, const std::vector<Value> &params);
    // 0 when the graph tables are absent
    uint64_t writeIfPresent(const std::vector<Statement> &statements);
    std::vector<Node> queryNodes(const std::string &sql, const std::vector<Value> &params);
    std::vector<Edge> queryEdges(const std::string &sql, const std::vector<Value> &params);
    uint64_t removeEdgesByEndpoint(const char *column, const std::vector<std::string> &nodeIds,
                                   const std::string &relationship);

    Connection &conn_;
  };

} // namespace quasar
