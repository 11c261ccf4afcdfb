#include "similarity.hpp"
#include <kj/debug.h>
#include <algorithm>
#include <cmath>

namespace quasar
{

  double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b)
  {
    double dot = 0.0, na = 0.0, nb = 0.0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i)
    {
      double x = static_cast<double>(a[i]);
      double y = static_cast<double>(b[i]);
      dot += x * y;
      na += x * x;
      nb += y * y;
    }
    if (na == 0.0 || nb == 0.0)
      return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
  }

  bool is_finite_vector(const std::vector<float> &v)
  {
    return std::all_of(v.begin(), v.end(), [](float x)
                       { return std::isfinite(x); });
  }

  std::vector<ScoredResult> rank_rows(const std::vector<ScannedRow> &rows, const std::vector<float> &query,
                                      const RankParams &params)
  {
    if (params.limit <= 0)
      return {};

    struct Cand
    {
      size_t row;
      double score;
    };
    std::vector<Cand> cands;
    cands.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i)
    {
      if (rows[i].vector.size() != query.size())
      {
        KJ_LOG(WARNING, "skipping row with mismatched dimension", rows[i].id, rows[i].vector.size(), query.size());
        continue;
      }
      double score = cosine_similarity(query, rows[i].vector);
      if (!std::isfinite(score))
      {
        KJ_LOG(WARNING, "skipping row with non-finite score", rows[i].id);
        continue;
      }
      cands.push_back(Cand{i, score});
    }

    std::stable_sort(cands.begin(), cands.end(), [](const Cand &x, const Cand &y)
                     { return x.score > y.score; });
    if (cands.size() > static_cast<uint64_t>(params.limit))
      cands.resize(static_cast<size_t>(params.limit));

    std::vector<ScoredResult> out;
    out.reserve(cands.size());
    for (const auto &c : cands)
    {
      if (params.minScore && !(c.score > *params.minScore))
        continue;
      const auto &r = rows[c.row];
      ScoredResult res{r.id, r.payload, c.score, std::nullopt};
      if (params.withVector)
        res.vector = r.vector;
      out.push_back(std::move(res));
    }
    return out;
  }

} // namespace quasar
