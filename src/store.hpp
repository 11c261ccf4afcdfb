#pragma once
#include "capabilities.hpp"
#include "collections.hpp"
#include "connection.hpp"
#include "embedding.hpp"
#include "graph_store.hpp"
#include "vector_store.hpp"
#include <string>

namespace quasar
{

  struct StoreOptions
  {
    std::string path{":memory:"};
    double batchScoreFloor{0.7}; // batchSearch keeps scores strictly above this
    int busyTimeoutMs{5000};
  };

  // Hybrid adapter: one connection shared by the vector and graph sides.
  // Build it once and hand vectors() / graph() to the code that needs them.
  class Store
  {
  public:
    explicit Store(const StoreOptions &options, EmbeddingEngine *embedding = nullptr);
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    VectorDb &vectors() { return vectors_; }
    GraphDb &graph() { return graph_; }

    void close();

  private:
    Connection conn_;
    CollectionManager collections_;
    EmbeddingGateway gateway_;
    VectorStore vectors_;
    GraphStore graph_;
  };

} // namespace quasar
