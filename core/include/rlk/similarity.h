#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlk::similarity {

struct MatchResult {
  std::string candidate;
  double score = 0.0;
  std::string method;
};

// Unit-cost insert/delete/substitute distance, two rolling rows sized by the
// shorter input.
size_t levenshtein(std::string_view a, std::string_view b);

// 1 - distance / max(len). Two empty strings score 1.0.
double similarity_ratio(std::string_view a, std::string_view b);

// Normalizes target and every candidate, then scans linearly. Ties keep the
// earliest candidate. Returns nullopt only for an empty candidate list.
std::optional<MatchResult> best_match(std::string_view target, const std::vector<std::string>& candidates);

} // namespace rlk::similarity
