#include "store.hpp"
#include <kj/debug.h>

namespace quasar
{

  Store::Store(const StoreOptions &options, EmbeddingEngine *embedding)
      : conn_(options.path, options.busyTimeoutMs),
        collections_(conn_),
        gateway_(embedding),
        vectors_(conn_, collections_, gateway_, options.batchScoreFloor),
        graph_(conn_)
  {
    KJ_LOG(INFO, "store opened", options.path, gateway_.available());
  }

  void Store::close()
  {
    conn_.close();
    KJ_LOG(INFO, "store closed");
  }

} // namespace quasar
