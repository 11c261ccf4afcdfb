#pragma once
#include <stdexcept>
#include <string>

namespace quasar
{

  struct StoreError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // SQLite failure; code() is the sqlite3 result code
  struct EngineError : StoreError
  {
    EngineError(int code, const std::string &what) : StoreError(what), code_(code) {}
    int code() const { return code_; }

  private:
    int code_{0};
  };

  struct CollectionNotFound : StoreError
  {
    explicit CollectionNotFound(const std::string &collection)
        : StoreError("collection not found: " + collection), collection_(collection) {}
    const std::string &collection() const { return collection_; }

  private:
    std::string collection_;
  };

  struct MissingQueryParameter : StoreError
  {
    MissingQueryParameter() : StoreError("one of query text or query vector must be provided") {}
  };

  // query vector that cannot be scored (empty or non-finite)
  struct InvalidQuery : StoreError
  {
    using StoreError::StoreError;
  };

  struct EmbeddingUnavailable : StoreError
  {
    EmbeddingUnavailable() : StoreError("embedding engine not configured") {}
  };

  struct EmbeddingError : StoreError
  {
    using StoreError::StoreError;
  };

  struct InvalidCollectionName : StoreError
  {
    using StoreError::StoreError;
  };

  struct InvalidDataPoint : StoreError
  {
    using StoreError::StoreError;
  };

} // namespace quasar
