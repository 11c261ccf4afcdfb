#include "capabilities.hpp"

namespace quasar
{

  void to_json(nlohmann::json &j, const ScoredResult &r)
  {
    j = {{"id", r.id}, {"payload", r.payload}, {"score", r.score}};
    if (r.vector)
      j["vector"] = *r.vector;
  }

  void to_json(nlohmann::json &j, const Node &node)
  {
    j = {{"id", node.id}, {"name", node.name}, {"type", node.type}, {"payload", node.payload}};
  }

  void to_json(nlohmann::json &j, const Edge &edge)
  {
    j = {{"source", edge.source},
         {"target", edge.target},
         {"relationship_name", edge.relationship},
         {"properties", edge.properties}};
  }

  void to_json(nlohmann::json &j, const Subgraph &graph)
  {
    j = {{"nodes", graph.nodes}, {"edges", graph.edges}};
  }

  void to_json(nlohmann::json &j, const GraphMetrics &metrics)
  {
    nlohmann::json dist = nlohmann::json::object();
    for (const auto &[degree, count] : metrics.degreeDistribution)
      dist[std::to_string(degree)] = count;
    j = {{"num_nodes", metrics.numNodes},
         {"num_edges", metrics.numEdges},
         {"mean_degree", metrics.meanDegree},
         {"edge_density", metrics.edgeDensity},
         {"num_selfloops", metrics.numSelfLoops},
         {"num_connected_components", metrics.numConnectedComponents},
         {"sizes_of_connected_components", metrics.componentSizes},
         {"degree_distribution", std::move(dist)}};
  }

} // namespace quasar
