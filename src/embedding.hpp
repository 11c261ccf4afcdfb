#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace quasar
{

  // Text-to-vector model living outside the store.
  class EmbeddingEngine
  {
  public:
    virtual ~EmbeddingEngine() = default;

    // one vector per text, in input order
    virtual std::vector<std::vector<float>> embedText(const std::vector<std::string> &texts) = 0;
    virtual size_t vectorSize() const = 0;
  };

  class EmbeddingGateway
  {
  public:
    // engine may be null; it must outlive the gateway otherwise
    explicit EmbeddingGateway(EmbeddingEngine *engine) : engine_(engine) {}

    bool available() const { return engine_ != nullptr; }
    size_t dimensions() const;

    std::vector<std::vector<float>> embed(const std::vector<std::string> &texts);

  private:
    EmbeddingEngine *engine_;
  };

} // namespace quasar
