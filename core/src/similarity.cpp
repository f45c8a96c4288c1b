#include "rlk/similarity.h"

#include "rlk/text.h"

#include <algorithm>

namespace rlk::similarity {

size_t levenshtein(std::string_view a, std::string_view b) {
  if (a == b) return 0;
  if (a.size() < b.size()) std::swap(a, b);
  if (b.empty()) return a.size();

  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> curr(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t insert = curr[j - 1] + 1;
      const size_t remove = prev[j] + 1;
      const size_t replace = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      curr[j] = std::min({insert, remove, replace});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

double similarity_ratio(std::string_view a, std::string_view b) {
  if (a.empty() && b.empty()) return 1.0;
  const size_t dist = levenshtein(a, b);
  const size_t longest = std::max(a.size(), b.size());
  return 1.0 - static_cast<double>(dist) / static_cast<double>(longest);
}

std::optional<MatchResult> best_match(std::string_view target, const std::vector<std::string>& candidates) {
  const std::string normalized_target = text::normalize(target);
  std::optional<MatchResult> best;
  for (const auto& cand : candidates) {
    const double score = similarity_ratio(normalized_target, text::normalize(cand));
    if (!best.has_value() || score > best->score) {
      best = MatchResult{cand, score, "levenshtein"};
    }
  }
  return best;
}

} // namespace rlk::similarity
