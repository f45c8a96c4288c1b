#include "rlk/mapping_pack.h"

#include "rlk/asset.h"
#include "rlk/log.h"
#include "rlk_data/serialization.h"

#include <regex>
#include <sstream>

namespace rlk {

namespace {
void add_error(std::vector<FieldError>& errors, const std::string& keypath, const std::string& message) {
  errors.push_back({keypath, message});
}

std::string summarize(const std::vector<FieldError>& errors) {
  std::ostringstream oss;
  oss << "mapping pack invalid";
  const size_t limit = 10;
  for (size_t i = 0; i < errors.size() && i < limit; ++i) {
    oss << (i == 0 ? ": " : "; ");
    if (!errors[i].keypath.empty()) oss << errors[i].keypath << " -> ";
    oss << errors[i].message;
  }
  if (errors.size() > limit) {
    oss << " (and " << (errors.size() - limit) << " more)";
  }
  return oss.str();
}

bool present(const nlohmann::json& obj, const char* key) {
  return obj.contains(key) && !obj[key].is_null();
}

void check_threshold(const nlohmann::json& obj, const char* key, const std::string& keypath,
                     std::vector<FieldError>& errors) {
  if (!present(obj, key)) return;
  if (!obj[key].is_number()) {
    add_error(errors, keypath, "expected number");
    return;
  }
  const double value = obj[key].get<double>();
  if (!(value > 0.0 && value <= 1.0)) {
    add_error(errors, keypath, "expected value in (0, 1]");
  }
}

void validate_rule(const nlohmann::json& rule, const std::string& base, std::vector<FieldError>& errors,
                   const LoadOptions& options) {
  if (!rule.is_object()) {
    add_error(errors, base, "expected object");
    return;
  }
  if (!rule.contains("source") || !rule["source"].is_string()) {
    add_error(errors, base + ".source", "expected string");
  }
  if (!rule.contains("target") || !rule["target"].is_string()) {
    add_error(errors, base + ".target", "expected string");
  }

  Strategy strategy = Strategy::Exact;
  if (present(rule, "strategy")) {
    if (!rule["strategy"].is_string()) {
      add_error(errors, base + ".strategy", "expected string");
    } else if (!parse_strategy(rule["strategy"].get<std::string>(), strategy)) {
      add_error(errors, base + ".strategy", "invalid value; allowed: exact, regex, token, similarity");
    }
  }

  if (strategy == Strategy::Regex && options.strict_patterns && rule.contains("source") &&
      rule["source"].is_string()) {
    try {
      const std::regex re(rule["source"].get<std::string>(), std::regex::ECMAScript | std::regex::icase);
      (void)re;
    } catch (const std::regex_error& e) {
      add_error(errors, base + ".source", std::string("regex does not compile: ") + e.what());
    }
  }

  if (present(rule, "expected_resolution")) {
    if (!rule["expected_resolution"].is_string()) {
      add_error(errors, base + ".expected_resolution", "expected string");
    } else if (!parse_frame_size(rule["expected_resolution"].get<std::string>())) {
      add_error(errors, base + ".expected_resolution", "expected '<width>x<height>'");
    }
  }
  if (present(rule, "expected_aspect")) {
    if (!rule["expected_aspect"].is_number()) {
      add_error(errors, base + ".expected_aspect", "expected number");
    } else if (rule["expected_aspect"].get<double>() <= 0.0) {
      add_error(errors, base + ".expected_aspect", "expected positive number");
    }
  }
  check_threshold(rule, "similarity_threshold", base + ".similarity_threshold", errors);
}
} // namespace

ValidationError::ValidationError(std::vector<FieldError> errors)
    : std::runtime_error(summarize(errors)), errors_(std::move(errors)) {}

const char* strategy_name(Strategy strategy) {
  switch (strategy) {
    case Strategy::Exact: return "exact";
    case Strategy::Regex: return "regex";
    case Strategy::Token: return "token";
    case Strategy::Similarity: return "similarity";
  }
  return "unknown";
}

bool parse_strategy(std::string_view text, Strategy& out) {
  if (text.empty() || text == "exact") out = Strategy::Exact;
  else if (text == "regex") out = Strategy::Regex;
  else if (text == "token") out = Strategy::Token;
  else if (text == "similarity") out = Strategy::Similarity;
  else return false;
  return true;
}

bool validate_mapping_pack_detailed(const nlohmann::json& doc,
                                    std::vector<FieldError>& errors,
                                    const LoadOptions& options) {
  if (!doc.is_object()) {
    add_error(errors, "", "mapping pack must be an object");
    return false;
  }
  if (!doc.contains("rules") || !doc["rules"].is_array()) {
    add_error(errors, "rules", "expected array");
  } else {
    const auto& rules = doc["rules"];
    for (size_t i = 0; i < rules.size(); ++i) {
      validate_rule(rules[i], "rules[" + std::to_string(i) + "]", errors, options);
    }
  }

  if (present(doc, "root_folders")) {
    if (!doc["root_folders"].is_array()) {
      add_error(errors, "root_folders", "expected array");
    } else {
      const auto& roots = doc["root_folders"];
      for (size_t i = 0; i < roots.size(); ++i) {
        if (!roots[i].is_string()) {
          add_error(errors, "root_folders[" + std::to_string(i) + "]", "expected string");
        }
      }
    }
  }

  check_threshold(doc, "similarity_threshold", "similarity_threshold", errors);
  if (present(doc, "aspect_tolerance")) {
    if (!doc["aspect_tolerance"].is_number()) {
      add_error(errors, "aspect_tolerance", "expected number");
    } else if (doc["aspect_tolerance"].get<double>() < 0.0) {
      add_error(errors, "aspect_tolerance", "expected non-negative number");
    }
  }
  for (const char* key : {"name", "description"}) {
    if (present(doc, key) && !doc[key].is_string()) {
      add_error(errors, key, "expected string");
    }
  }
  return errors.empty();
}

MappingPack parse_mapping_pack(const nlohmann::json& doc,
                               const LoadOptions& options,
                               const std::filesystem::path& base_dir) {
  std::vector<FieldError> errors;
  if (!validate_mapping_pack_detailed(doc, errors, options)) {
    throw ValidationError(std::move(errors));
  }

  MappingPack pack;
  pack.name = doc.value("name", "");
  pack.description = doc.value("description", "");
  if (present(doc, "similarity_threshold")) {
    pack.similarity_threshold = doc["similarity_threshold"].get<double>();
  }
  if (present(doc, "aspect_tolerance")) {
    pack.aspect_tolerance = doc["aspect_tolerance"].get<double>();
  }
  if (present(doc, "root_folders")) {
    for (const auto& v : doc["root_folders"]) {
      std::filesystem::path root(v.get<std::string>());
      if (root.is_relative() && !base_dir.empty()) {
        root = base_dir / root;
      }
      pack.root_folders.push_back(root);
    }
  }

  for (const auto& entry : doc["rules"]) {
    Rule rule;
    rule.source = entry["source"].get<std::string>();
    rule.target = entry["target"].get<std::string>();
    if (present(entry, "strategy")) {
      parse_strategy(entry["strategy"].get<std::string>(), rule.strategy);
    }
    if (present(entry, "expected_resolution")) {
      rule.expected_resolution = entry["expected_resolution"].get<std::string>();
    }
    if (present(entry, "expected_aspect")) {
      rule.expected_aspect = entry["expected_aspect"].get<double>();
    }
    if (present(entry, "similarity_threshold")) {
      rule.similarity_threshold = entry["similarity_threshold"].get<double>();
    }
    pack.rules.push_back(std::move(rule));
  }
  return pack;
}

MappingPack load_mapping_pack(const std::filesystem::path& path, const LoadOptions& options) {
  nlohmann::json doc;
  std::string error;
  if (!data::load_document(path, doc, error)) {
    throw ValidationError(std::vector<FieldError>{{"", error}});
  }
  MappingPack pack = parse_mapping_pack(doc, options, path.parent_path());
  log::info("mapping pack loaded: " + path.string() + " (" + std::to_string(pack.rules.size()) + " rules, " +
            std::to_string(pack.root_folders.size()) + " roots)");
  return pack;
}

} // namespace rlk
