#include "embedding.hpp"
#include "errors.hpp"
#include "similarity.hpp"

namespace quasar
{

  size_t EmbeddingGateway::dimensions() const
  {
    if (!engine_)
      throw EmbeddingUnavailable();
    return engine_->vectorSize();
  }

  std::vector<std::vector<float>> EmbeddingGateway::embed(const std::vector<std::string> &texts)
  {
    if (!engine_)
      throw EmbeddingUnavailable();
    if (texts.empty())
      return {};

    auto vectors = engine_->embedText(texts);
    if (vectors.size() != texts.size())
      throw EmbeddingError("embedding engine returned " + std::to_string(vectors.size()) +
                           " vectors for " + std::to_string(texts.size()) + " texts");

    size_t dim = engine_->vectorSize();
    for (size_t i = 0; i < vectors.size(); ++i)
    {
      if (vectors[i].empty() || (dim != 0 && vectors[i].size() != dim))
        throw EmbeddingError("embedding " + std::to_string(i) + " has dimension " +
                             std::to_string(vectors[i].size()) + ", expected " + std::to_string(dim));
      if (!is_finite_vector(vectors[i]))
        throw EmbeddingError("embedding " + std::to_string(i) + " has a non-finite component");
    }
    return vectors;
  }

} // namespace quasar
