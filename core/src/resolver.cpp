#include "rlk/resolver.h"

#include "rlk/log.h"
#include "rlk/similarity.h"
#include "rlk/text.h"

#include <algorithm>

namespace rlk {

namespace {
std::vector<std::string> sorted_unique(std::vector<std::string> tokens) {
  std::sort(tokens.begin(), tokens.end());
  tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
  return tokens;
}
} // namespace

const char* match_method_name(MatchMethod method) {
  switch (method) {
    case MatchMethod::None: return "none";
    case MatchMethod::Rule: return "rule";
    case MatchMethod::Index: return "index";
    case MatchMethod::Fuzzy: return "fuzzy";
  }
  return "none";
}

Resolver::Resolver(const MappingPack& pack, const NameIndex& index) : pack_(pack), index_(index) {
  rules_.reserve(pack_.rules.size());
  for (size_t i = 0; i < pack_.rules.size(); ++i) {
    const Rule& rule = pack_.rules[i];
    CompiledRule compiled;
    compiled.rule = &rule;
    compiled.normalized_source = text::normalize(rule.source);
    compiled.tokens = sorted_unique(text::tokenize(rule.source));
    if (rule.strategy == Strategy::Regex) {
      try {
        compiled.pattern.emplace(rule.source, std::regex::ECMAScript | std::regex::icase);
      } catch (const std::regex_error& e) {
        compiled.broken = true;
        diagnostics_.push_back({i, rule.source, std::string("regex does not compile: ") + e.what()});
        log::warn("rules[" + std::to_string(i) + "] skipped, bad regex '" + rule.source + "': " + e.what());
      }
    }
    rules_.push_back(std::move(compiled));
  }
}

bool Resolver::match_exact(const CompiledRule& compiled, const std::string& normalized) const {
  return !compiled.normalized_source.empty() && compiled.normalized_source == normalized;
}

bool Resolver::match_regex(const CompiledRule& compiled, std::string_view name) const {
  if (!compiled.pattern) return false;
  return std::regex_search(name.begin(), name.end(), *compiled.pattern);
}

bool Resolver::match_token(const CompiledRule& compiled, const std::vector<std::string>& name_tokens) const {
  if (compiled.tokens.empty()) return false;
  return std::includes(name_tokens.begin(), name_tokens.end(), compiled.tokens.begin(), compiled.tokens.end());
}

bool Resolver::match_similarity(const CompiledRule& compiled, const std::string& normalized) const {
  const double threshold = compiled.rule->similarity_threshold.value_or(pack_.similarity_threshold);
  return similarity::similarity_ratio(compiled.normalized_source, normalized) >= threshold;
}

bool Resolver::matches(const CompiledRule& compiled, std::string_view name, const std::string& normalized,
                       const std::vector<std::string>& name_tokens) const {
  if (compiled.broken) return false;
  switch (compiled.rule->strategy) {
    case Strategy::Exact: return match_exact(compiled, normalized);
    case Strategy::Regex: return match_regex(compiled, name);
    case Strategy::Token: return match_token(compiled, name_tokens);
    case Strategy::Similarity: return match_similarity(compiled, normalized);
  }
  return false;
}

Resolution Resolver::resolve(std::string_view name) const {
  Resolution out;
  const std::string normalized = text::normalize(name);
  const std::vector<std::string> name_tokens = sorted_unique(text::tokenize(name));

  for (size_t i = 0; i < rules_.size(); ++i) {
    if (!matches(rules_[i], name, normalized, name_tokens)) continue;
    out.target = rules_[i].rule->target;
    out.rule = rules_[i].rule;
    out.rule_index = i;
    out.method = MatchMethod::Rule;
    out.score = 1.0;
    return out;
  }

  if (const auto* path = index_.find(normalized)) {
    out.target = path->string();
    out.method = MatchMethod::Index;
    out.score = 1.0;
    out.candidate = normalized;
    return out;
  }

  const auto best = similarity::best_match(name, index_.keys());
  if (best && best->score >= pack_.similarity_threshold) {
    if (const auto* path = index_.find(best->candidate)) {
      out.target = path->string();
      out.method = MatchMethod::Fuzzy;
      out.score = best->score;
      out.candidate = best->candidate;
    }
  }
  return out;
}

Resolution resolve(std::string_view name, const MappingPack& pack, const NameIndex& index) {
  return Resolver(pack, index).resolve(name);
}

} // namespace rlk
