#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace rlk::data {

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out);

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

// Loads .json, .yaml or .yml into the JSON data model. YAML scalars are typed
// as bool, integer, float, then string, in that order. YAML that has no JSON
// form (non-scalar keys) fails with error set.
bool load_document(const std::filesystem::path& path, nlohmann::json& out, std::string& error);
nlohmann::json yaml_to_json(const YAML::Node& node);

// Writes through a sibling temp file and renames it over the destination.
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace rlk::data
