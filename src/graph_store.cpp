#include "graph_store.hpp"
#include "encode.hpp"
#include <kj/debug.h>
#include <algorithm>
#include <functional>
#include <iterator>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace quasar
{

  namespace
  {
    const std::string kNodes = quote_identifier(GraphStore::kNodeTable);
    const std::string kEdges = quote_identifier(GraphStore::kEdgeTable);
    const std::string kNodeColumns = "n.id, n.name, n.type, n.payload";
    const std::string kEdgeColumns = "e.source_id, e.target_id, e.relationship_name, e.properties";

    nlohmann::json value_to_json(const Value &v)
    {
      if (auto x = std::get_if<int64_t>(&v))
        return *x;
      if (auto d = std::get_if<double>(&v))
        return *d;
      if (auto s = std::get_if<std::string>(&v))
        return *s;
      if (auto b = std::get_if<Blob>(&v))
        return nlohmann::json::binary(std::vector<uint8_t>(b->data.begin(), b->data.end()));
      return nullptr;
    }

    Node node_from_row(const Row &r, size_t at)
    {
      return Node{r.text(at), r.text(at + 1), r.text(at + 2), nlohmann::json::parse(r.text(at + 3))};
    }

    Edge edge_from_row(const Row &r, size_t at)
    {
      auto props = r.isNull(at + 3) ? nlohmann::json::object() : nlohmann::json::parse(r.text(at + 3));
      return Edge{r.text(at), r.text(at + 1), r.text(at + 2), std::move(props)};
    }

    Statement upsert_node(const DataPoint &node)
    {
      return Statement{"INSERT OR REPLACE INTO " + kNodes + " (id, name, type, payload) VALUES (?, ?, ?, ?)",
                       {node.id(), node.name(), node.type(), serialize_data_point(node).dump()}};
    }

    Statement upsert_edge(const Edge &edge)
    {
      return Statement{"INSERT OR REPLACE INTO " + kEdges +
                           " (source_id, target_id, relationship_name, properties) VALUES (?, ?, ?, ?)",
                       {edge.source, edge.target, edge.relationship, edge.properties.dump()}};
    }

    bool in_nodeset(const Node &node, const std::string &nodeType, const std::unordered_set<std::string> &names)
    {
      if (node.type == nodeType && names.count(node.name))
        return true;
      auto it = node.payload.find("belongs_to_set");
      if (it == node.payload.end() || !it->is_array())
        return false;
      for (const auto &tag : *it)
      {
        if (!tag.is_object())
          continue;
        auto type = tag.find("type");
        auto name = tag.find("name");
        if (type == tag.end() || name == tag.end() || !type->is_string() || !name->is_string())
          continue;
        if (type->get<std::string>() == nodeType && names.count(name->get<std::string>()))
          return true;
      }
      return false;
    }

    std::vector<Statement> delete_by_ids(const std::string &table, const char *column,
                                         const std::vector<std::string> &ids, const std::vector<Value> &extra,
                                         const std::string &extraClause)
    {
      std::vector<Statement> batch;
      for_each_id_chunk(ids, [&](std::vector<Value> params)
                        {
        std::string sql = "DELETE FROM " + table + " WHERE " + column + " IN (" + placeholders(params.size()) + ")" +
                          extraClause;
        params.insert(params.end(), extra.begin(), extra.end());
        batch.push_back(Statement{std::move(sql), std::move(params)}); });
      return batch;
    }

    bool graph_present(Env &env)
    {
      return table_exists(env, GraphStore::kNodeTable) && table_exists(env, GraphStore::kEdgeTable);
    }
  } // namespace

  void GraphStore::ensureSchema()
  {
    conn_.executeTransaction({
        Statement{"CREATE TABLE IF NOT EXISTS " + kNodes +
                  " (id TEXT PRIMARY KEY, name TEXT, type TEXT, payload TEXT, "
                  "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)"},
        Statement{"CREATE TABLE IF NOT EXISTS " + kEdges +
                  " (source_id TEXT NOT NULL, target_id TEXT NOT NULL, relationship_name TEXT NOT NULL, "
                  "properties TEXT, created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
                  "PRIMARY KEY (source_id, target_id, relationship_name))"},
        Statement{"CREATE INDEX IF NOT EXISTS " + quote_identifier(std::string(kEdgeTable) + "_target") + " ON " +
                  kEdges + " (target_id)"},
    });
  }

  std::vector<Row> GraphStore::readRows(const std::string &sql, const std::vector<Value> &params)
  {
    return conn_.withEnv([&](Env &env)
                         {
      if (!graph_present(env))
        return std::vector<Row>{};
      return query_rows(env, sql, params); });
  }

  uint64_t GraphStore::writeIfPresent(const std::vector<Statement> &statements)
  {
    return conn_.withEnv([&](Env &env) -> uint64_t
                         {
      if (!graph_present(env))
        return 0;
      return apply_transaction(env, statements); });
  }

  std::vector<Node> GraphStore::queryNodes(const std::string &sql, const std::vector<Value> &params)
  {
    std::vector<Node> out;
    for (const auto &r : readRows(sql, params))
    {
      try
      {
        out.push_back(node_from_row(r, 0));
      }
      catch (const nlohmann::json::exception &e)
      {
        KJ_LOG(WARNING, "skipping node with malformed payload", r.text(0), e.what());
      }
    }
    return out;
  }

  std::vector<Edge> GraphStore::queryEdges(const std::string &sql, const std::vector<Value> &params)
  {
    std::vector<Edge> out;
    for (const auto &r : readRows(sql, params))
    {
      try
      {
        out.push_back(edge_from_row(r, 0));
      }
      catch (const nlohmann::json::exception &e)
      {
        KJ_LOG(WARNING, "skipping edge with malformed properties", r.text(0), r.text(1), e.what());
      }
    }
    return out;
  }

  // -------------------- raw query --------------------

  std::vector<nlohmann::json> GraphStore::query(const std::string &sql, const std::vector<Value> &params)
  {
    std::vector<nlohmann::json> out;
    for (const auto &r : conn_.execute(sql, params))
    {
      nlohmann::json obj = nlohmann::json::object();
      for (size_t i = 0; i < r.values.size(); ++i)
        obj[r.columns[i]] = value_to_json(r.values[i]);
      out.push_back(std::move(obj));
    }
    return out;
  }

  // -------------------- nodes --------------------

  bool GraphStore::hasNode(const std::string &id)
  {
    return !readRows("SELECT 1 FROM " + kNodes + " WHERE id = ?", {id}).empty();
  }

  void GraphStore::addNode(const DataPoint &node)
  {
    ensureSchema();
    conn_.executeTransaction({upsert_node(node)});
  }

  void GraphStore::addNodes(const std::vector<DataPoint> &nodes)
  {
    if (nodes.empty())
      return;
    ensureSchema();
    std::vector<Statement> batch;
    batch.reserve(nodes.size());
    for (const auto &n : nodes)
      batch.push_back(upsert_node(n));
    conn_.executeTransaction(batch);
    KJ_LOG(INFO, "added nodes", nodes.size());
  }

  std::optional<Node> GraphStore::extractNode(const std::string &id)
  {
    auto nodes = extractNodes({id});
    if (nodes.empty())
      return std::nullopt;
    return std::move(nodes.front());
  }

  std::vector<Node> GraphStore::extractNodes(const std::vector<std::string> &ids)
  {
    std::vector<Node> out;
    for_each_id_chunk(ids, [&](std::vector<Value> params)
                      {
      auto chunk = queryNodes("SELECT " + kNodeColumns + " FROM " + kNodes + " n WHERE n.id IN (" +
                                  placeholders(params.size()) + ")",
                              params);
      std::move(chunk.begin(), chunk.end(), std::back_inserter(out)); });
    return out;
  }

  void GraphStore::deleteNode(const std::string &id)
  {
    deleteNodes({id});
  }

  void GraphStore::deleteNodes(const std::vector<std::string> &ids)
  {
    if (ids.empty())
      return;
    uint64_t deleted = writeIfPresent(delete_by_ids(kNodes, "id", ids, {}, ""));
    KJ_LOG(INFO, "deleted nodes", deleted);
  }

  // -------------------- edges --------------------

  bool GraphStore::hasEdge(const std::string &source, const std::string &target, const std::string &relationship)
  {
    return !readRows("SELECT 1 FROM " + kEdges + " WHERE source_id = ? AND target_id = ? AND relationship_name = ?",
                     {source, target, relationship})
                .empty();
  }

  std::vector<bool> GraphStore::hasEdges(const std::vector<EdgeKey> &edges)
  {
    std::vector<bool> out;
    out.reserve(edges.size());
    for (const auto &e : edges)
      out.push_back(hasEdge(e.source, e.target, e.relationship));
    return out;
  }

  void GraphStore::addEdge(const std::string &source, const std::string &target, const std::string &relationship,
                           const nlohmann::json &properties)
  {
    addEdges({Edge{source, target, relationship, properties}});
  }

  void GraphStore::addEdges(const std::vector<Edge> &edges)
  {
    if (edges.empty())
      return;
    ensureSchema();
    std::vector<Statement> batch;
    batch.reserve(edges.size());
    for (const auto &e : edges)
      batch.push_back(upsert_edge(e));
    conn_.executeTransaction(batch);
  }

  std::vector<Edge> GraphStore::getEdges(const std::string &nodeId)
  {
    return queryEdges("SELECT " + kEdgeColumns + " FROM " + kEdges + " e WHERE e.source_id = ?1 OR e.target_id = ?1",
                      {nodeId});
  }

  // -------------------- traversal --------------------

  std::vector<Node> GraphStore::getNeighbors(const std::string &nodeId, const std::optional<std::string> &relationship)
  {
    auto out = getSuccessors(nodeId, relationship);
    std::unordered_set<std::string> seen;
    for (const auto &n : out)
      seen.insert(n.id);
    for (auto &n : getPredecessors(nodeId, relationship))
    {
      if (seen.insert(n.id).second)
        out.push_back(std::move(n));
    }
    return out;
  }

  std::vector<Node> GraphStore::getPredecessors(const std::string &nodeId,
                                                const std::optional<std::string> &relationship)
  {
    std::string sql = "SELECT DISTINCT " + kNodeColumns + " FROM " + kEdges + " e JOIN " + kNodes +
                      " n ON n.id = e.source_id WHERE e.target_id = ?";
    std::vector<Value> params{nodeId};
    if (relationship)
    {
      sql += " AND e.relationship_name = ?";
      params.emplace_back(*relationship);
    }
    return queryNodes(sql, params);
  }

  std::vector<Node> GraphStore::getSuccessors(const std::string &nodeId,
                                              const std::optional<std::string> &relationship)
  {
    std::string sql = "SELECT DISTINCT " + kNodeColumns + " FROM " + kEdges + " e JOIN " + kNodes +
                      " n ON n.id = e.target_id WHERE e.source_id = ?";
    std::vector<Value> params{nodeId};
    if (relationship)
    {
      sql += " AND e.relationship_name = ?";
      params.emplace_back(*relationship);
    }
    return queryNodes(sql, params);
  }

  std::vector<NodeConnection> GraphStore::getConnections(const std::string &nodeId)
  {
    auto rows = readRows("SELECT s.id, s.name, s.type, s.payload, " + kEdgeColumns +
                             ", t.id, t.name, t.type, t.payload FROM " + kEdges + " e JOIN " + kNodes +
                             " s ON s.id = e.source_id JOIN " + kNodes +
                             " t ON t.id = e.target_id WHERE e.source_id = ?1 OR e.target_id = ?1",
                         {nodeId});
    std::vector<NodeConnection> out;
    out.reserve(rows.size());
    for (const auto &r : rows)
    {
      try
      {
        out.push_back(NodeConnection{node_from_row(r, 0), edge_from_row(r, 4), node_from_row(r, 8)});
      }
      catch (const nlohmann::json::exception &e)
      {
        KJ_LOG(WARNING, "skipping malformed connection", r.text(4), r.text(5), e.what());
      }
    }
    return out;
  }

  std::vector<std::string> GraphStore::getDisconnectedNodes()
  {
    auto rows = readRows("SELECT n.id FROM " + kNodes + " n WHERE NOT EXISTS (SELECT 1 FROM " + kEdges +
                             " e WHERE e.source_id = n.id OR e.target_id = n.id)",
                         {});
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto &r : rows)
      out.push_back(r.text(0));
    return out;
  }

  uint64_t GraphStore::removeEdgesByEndpoint(const char *column, const std::vector<std::string> &nodeIds,
                                             const std::string &relationship)
  {
    if (nodeIds.empty())
      return 0;
    return writeIfPresent(delete_by_ids(kEdges, column, nodeIds, {relationship}, " AND relationship_name = ?"));
  }

  uint64_t GraphStore::removeConnectionToPredecessorsOf(const std::vector<std::string> &nodeIds,
                                                        const std::string &relationship)
  {
    return removeEdgesByEndpoint("target_id", nodeIds, relationship);
  }

  uint64_t GraphStore::removeConnectionToSuccessorsOf(const std::vector<std::string> &nodeIds,
                                                      const std::string &relationship)
  {
    return removeEdgesByEndpoint("source_id", nodeIds, relationship);
  }

  // -------------------- whole graph --------------------

  Subgraph GraphStore::getNodesetSubgraph(const std::string &nodeType, const std::vector<std::string> &nodeNames)
  {
    std::unordered_set<std::string> names(nodeNames.begin(), nodeNames.end());
    Subgraph all = getGraphData();

    Subgraph out;
    std::unordered_set<std::string> ids;
    for (auto &n : all.nodes)
    {
      if (in_nodeset(n, nodeType, names))
      {
        ids.insert(n.id);
        out.nodes.push_back(std::move(n));
      }
    }
    for (auto &e : all.edges)
    {
      if (ids.count(e.source) && ids.count(e.target))
        out.edges.push_back(std::move(e));
    }
    return out;
  }

  Subgraph GraphStore::getGraphData()
  {
    Subgraph g;
    g.nodes = queryNodes("SELECT " + kNodeColumns + " FROM " + kNodes + " n", {});
    g.edges = queryEdges("SELECT " + kEdgeColumns + " FROM " + kEdges + " e", {});
    return g;
  }

  GraphMetrics GraphStore::getGraphMetrics()
  {
    Subgraph g = getGraphData();
    GraphMetrics m;
    m.numNodes = g.nodes.size();
    m.numEdges = g.edges.size();

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < g.nodes.size(); ++i)
      index.emplace(g.nodes[i].id, i);

    // union-find over weakly connected components
    std::vector<size_t> parent(g.nodes.size());
    std::iota(parent.begin(), parent.end(), size_t{0});
    auto find = [&](size_t x)
    {
      while (parent[x] != x)
      {
        parent[x] = parent[parent[x]];
        x = parent[x];
      }
      return x;
    };

    std::vector<uint64_t> degree(g.nodes.size(), 0);
    for (const auto &e : g.edges)
    {
      if (e.source == e.target)
        ++m.numSelfLoops;
      auto s = index.find(e.source);
      auto t = index.find(e.target);
      if (s != index.end())
        ++degree[s->second];
      if (t != index.end())
        ++degree[t->second];
      if (s != index.end() && t != index.end())
        parent[find(s->second)] = find(t->second);
    }

    std::unordered_map<size_t, uint64_t> components;
    uint64_t degreeSum = 0;
    for (size_t i = 0; i < g.nodes.size(); ++i)
    {
      ++components[find(i)];
      ++m.degreeDistribution[degree[i]];
      degreeSum += degree[i];
    }
    m.numConnectedComponents = components.size();
    for (const auto &c : components)
      m.componentSizes.push_back(c.second);
    std::sort(m.componentSizes.begin(), m.componentSizes.end(), std::greater<uint64_t>());

    if (m.numNodes > 0)
      m.meanDegree = static_cast<double>(degreeSum) / static_cast<double>(m.numNodes);
    if (m.numNodes > 1)
      m.edgeDensity = static_cast<double>(m.numEdges) / (static_cast<double>(m.numNodes) * (m.numNodes - 1));
    return m;
  }

  void GraphStore::deleteGraph()
  {
    conn_.executeTransaction({
        Statement{"DROP TABLE IF EXISTS " + kEdges},
        Statement{"DROP TABLE IF EXISTS " + kNodes},
    });
    KJ_LOG(INFO, "graph deleted");
  }

} // namespace quasar
