#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rlk {

enum class Strategy {
  Exact,
  Regex,
  Token,
  Similarity
};

const char* strategy_name(Strategy strategy);
bool parse_strategy(std::string_view text, Strategy& out);

struct Rule {
  std::string source;
  Strategy strategy = Strategy::Exact;
  std::string target;
  std::optional<std::string> expected_resolution;
  std::optional<double> expected_aspect;
  std::optional<double> similarity_threshold;
};

struct MappingPack {
  std::string name;
  std::string description;
  std::vector<Rule> rules;
  std::vector<std::filesystem::path> root_folders;
  double similarity_threshold = 0.9;
  double aspect_tolerance = 0.05;
};

struct FieldError {
  std::string keypath;
  std::string message;
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(std::vector<FieldError> errors);
  const std::vector<FieldError>& errors() const { return errors_; }

 private:
  std::vector<FieldError> errors_;
};

struct LoadOptions {
  // Reject regex rules whose pattern does not compile. When false such rules
  // load and are reported when a run evaluates them.
  bool strict_patterns = true;
};

bool validate_mapping_pack_detailed(const nlohmann::json& doc,
                                    std::vector<FieldError>& errors,
                                    const LoadOptions& options);

// Both throw ValidationError. Relative root folders are resolved against
// base_dir (the pack file's directory for load_mapping_pack).
MappingPack parse_mapping_pack(const nlohmann::json& doc,
                               const LoadOptions& options = {},
                               const std::filesystem::path& base_dir = {});
MappingPack load_mapping_pack(const std::filesystem::path& path, const LoadOptions& options = {});

} // namespace rlk
