#pragma once

#include "rlk/mapping_pack.h"
#include "rlk/name_index.h"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace rlk {

enum class MatchMethod {
  None,
  Rule,
  Index,
  Fuzzy
};

const char* match_method_name(MatchMethod method);

struct Resolution {
  std::optional<std::string> target;
  // Points into the pack the resolver was built from; null unless method is Rule.
  const Rule* rule = nullptr;
  std::optional<size_t> rule_index;
  MatchMethod method = MatchMethod::None;
  double score = 0.0;
  // Index key chosen by the fuzzy fallback.
  std::string candidate;

  bool resolved() const { return target.has_value(); }
};

struct RuleDiagnostic {
  size_t rule_index = 0;
  std::string source;
  std::string message;
};

// Compiles the pack's rules once and resolves names against them, then the
// index, then the fuzzy fallback. The pack and index must outlive the resolver.
class Resolver {
 public:
  Resolver(const MappingPack& pack, const NameIndex& index);

  Resolution resolve(std::string_view name) const;

  // Rules skipped because they could not be compiled.
  const std::vector<RuleDiagnostic>& diagnostics() const { return diagnostics_; }

 private:
  struct CompiledRule {
    const Rule* rule = nullptr;
    std::string normalized_source;
    std::vector<std::string> tokens;
    std::optional<std::regex> pattern;
    bool broken = false;
  };

  bool matches(const CompiledRule& compiled, std::string_view name, const std::string& normalized,
               const std::vector<std::string>& name_tokens) const;
  bool match_exact(const CompiledRule& compiled, const std::string& normalized) const;
  bool match_regex(const CompiledRule& compiled, std::string_view name) const;
  bool match_token(const CompiledRule& compiled, const std::vector<std::string>& name_tokens) const;
  bool match_similarity(const CompiledRule& compiled, const std::string& normalized) const;

  const MappingPack& pack_;
  const NameIndex& index_;
  std::vector<CompiledRule> rules_;
  std::vector<RuleDiagnostic> diagnostics_;
};

// One-shot form; broken rules are skipped silently.
Resolution resolve(std::string_view name, const MappingPack& pack, const NameIndex& index);

} // namespace rlk
