#pragma once
#include "capabilities.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  // dot(a, b) / (|a| * |b|); 0.0 when either magnitude is zero.
  // a and b must have the same dimension.
  double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

  // false when any component is NaN or infinite
  bool is_finite_vector(const std::vector<float> &v);

  struct ScannedRow
  {
    std::string id;
    std::vector<float> vector;
    nlohmann::json payload;
  };

  struct RankParams
  {
    int64_t limit{10};
    bool withVector{false};
    std::optional<double> minScore{}; // keep only scores strictly above
  };

  // Scores every row against query, stable-sorts by descending score (ties
  // keep scan order), truncates to limit, then applies minScore. Rows whose
  // dimension differs from the query, or whose score is not finite, are
  // skipped.
  std::vector<ScoredResult> rank_rows(const std::vector<ScannedRow> &rows, const std::vector<float> &query,
                                      const RankParams &params);

} // namespace quasar
