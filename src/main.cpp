#include "store.hpp"
#include <kj/main.h>
#include <kj/debug.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

namespace
{
  // "0.1,0.2,0.3" -> {0.1, 0.2, 0.3}
  bool parse_vector(const std::string &text, std::vector<float> &out)
  {
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
      if (item.empty())
        return false;
      errno = 0;
      char *end = nullptr;
      float v = std::strtof(item.c_str(), &end);
      if (errno != 0 || end == item.c_str() || *end != '\0')
        return false;
      out.push_back(v);
    }
    return !out.empty();
  }
} // namespace

class QuasarApp
{
public:
  explicit QuasarApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Quasar embedded vector/graph store admin tool")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'d', "database"}, KJ_BIND_METHOD(*this, optDatabase),
                          "path", "SQLite database file (default: :memory:)")
        .addSubCommand("collections", KJ_BIND_METHOD(*this, getCollectionsMain),
                       "list vector collections")
        .addSubCommand("search", KJ_BIND_METHOD(*this, getSearchMain),
                       "rank a collection against a literal vector")
        .addSubCommand("metrics", KJ_BIND_METHOD(*this, getMetricsMain),
                       "print graph metrics as JSON")
        .addSubCommand("subgraph", KJ_BIND_METHOD(*this, getSubgraphMain),
                       "print the subgraph scoped to a node set")
        .addSubCommand("prune", KJ_BIND_METHOD(*this, getPruneMain),
                       "drop every table in the database")
        .build();
  }

  kj::MainFunc getCollectionsMain()
  {
    return kj::MainBuilder(context_, "0.1", "List vector collection names, one per line.")
        .callAfterParsing(KJ_BIND_METHOD(*this, runCollections))
        .build();
  }

  kj::MainFunc getSearchMain()
  {
    return kj::MainBuilder(context_, "0.1", "Search <collection> with a comma-separated query vector.")
        .addOptionWithArg({'k', "limit"}, KJ_BIND_METHOD(*this, optLimit),
                          "n", "number of results (default: 10)")
        .expectArg("<collection>", KJ_BIND_METHOD(*this, argCollection))
        .expectArg("<vector>", KJ_BIND_METHOD(*this, argVector))
        .callAfterParsing(KJ_BIND_METHOD(*this, runSearch))
        .build();
  }

  kj::MainFunc getMetricsMain()
  {
    return kj::MainBuilder(context_, "0.1", "Print node/edge counts, degrees and components.")
        .callAfterParsing(KJ_BIND_METHOD(*this, runMetrics))
        .build();
  }

  kj::MainFunc getSubgraphMain()
  {
    return kj::MainBuilder(context_, "0.1", "Print the nodes of <type> named <name>... with their members.")
        .expectArg("<type>", KJ_BIND_METHOD(*this, argNodeType))
        .expectOneOrMoreArgs("<name>", KJ_BIND_METHOD(*this, argNodeName))
        .callAfterParsing(KJ_BIND_METHOD(*this, runSubgraph))
        .build();
  }

  kj::MainFunc getPruneMain()
  {
    return kj::MainBuilder(context_, "0.1", "Drop every table, vector and graph alike.")
        .callAfterParsing(KJ_BIND_METHOD(*this, runPrune))
        .build();
  }

private:
  kj::ProcessContext &context_;
  quasar::StoreOptions options_;
  int64_t limit_ = 10;
  std::string collection_;
  std::vector<float> query_;
  std::string nodeType_;
  std::vector<std::string> nodeNames_;

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optDatabase(kj::StringPtr value)
  {
    options_.path = value.cStr();
    return true;
  }

  kj::MainBuilder::Validity optLimit(kj::StringPtr value)
  {
    char *end = nullptr;
    long long n = std::strtoll(value.cStr(), &end, 10);
    if (end == value.cStr() || *end != '\0' || n < 0)
      return kj::MainBuilder::Validity("limit must be a non-negative integer");
    limit_ = n;
    return true;
  }

  kj::MainBuilder::Validity argCollection(kj::StringPtr value)
  {
    collection_ = value.cStr();
    return true;
  }

  kj::MainBuilder::Validity argVector(kj::StringPtr value)
  {
    query_.clear();
    if (!parse_vector(value.cStr(), query_))
      return kj::MainBuilder::Validity("vector must be comma-separated numbers");
    return true;
  }

  kj::MainBuilder::Validity argNodeType(kj::StringPtr value)
  {
    nodeType_ = value.cStr();
    return true;
  }

  kj::MainBuilder::Validity argNodeName(kj::StringPtr value)
  {
    nodeNames_.emplace_back(value.cStr());
    return true;
  }

  // Runs fn against a freshly opened store, turning store failures into a
  // non-zero exit.
  template <typename Fn>
  kj::MainBuilder::Validity withStore(Fn &&fn)
  {
    try
    {
      quasar::Store store(options_);
      fn(store);
      store.close();
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }

  kj::MainBuilder::Validity runCollections()
  {
    return withStore([](quasar::Store &store)
                     {
      for (const auto &name : store.vectors().getCollectionNames())
        std::cout << name << "\n"; });
  }

  kj::MainBuilder::Validity runSearch()
  {
    return withStore([this](quasar::Store &store)
                     {
      quasar::SearchParams params;
      params.queryVector = query_;
      params.limit = limit_;
      nlohmann::json out = store.vectors().search(collection_, params);
      std::cout << out.dump(2) << "\n"; });
  }

  kj::MainBuilder::Validity runMetrics()
  {
    return withStore([](quasar::Store &store)
                     {
      nlohmann::json out = store.graph().getGraphMetrics();
      std::cout << out.dump(2) << "\n"; });
  }

  kj::MainBuilder::Validity runSubgraph()
  {
    return withStore([this](quasar::Store &store)
                     {
      nlohmann::json out = store.graph().getNodesetSubgraph(nodeType_, nodeNames_);
      std::cout << out.dump(2) << "\n"; });
  }

  kj::MainBuilder::Validity runPrune()
  {
    return withStore([](quasar::Store &store)
                     {
      store.vectors().prune();
      KJ_LOG(INFO, "pruned", store.vectors().getCollectionNames().size()); });
  }
};

KJ_MAIN(QuasarApp);
