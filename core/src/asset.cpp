#include "rlk/asset.h"

#include "rlk/text.h"
#include "rlk_data/serialization.h"

#include <cctype>
#include <charconv>

namespace rlk {

namespace {
std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool parse_dimension(std::string_view s, int& out) {
  s = trim(s);
  if (s.empty()) return false;
  const auto result = std::from_chars(s.data(), s.data() + s.size(), out);
  return result.ec == std::errc() && result.ptr == s.data() + s.size() && out >= 0;
}

std::string scalar_string(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_null()) return {};
  return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const char* const kNameKeys[] = {"File Name", "Clip Name"};
const char* const kResolutionKeys[] = {"Resolution", "Clip Resolution", "Source Resolution"};

bool parse_clip_properties(const nlohmann::json& entry, AssetDescriptor& asset) {
  for (const char* key : kNameKeys) {
    if (entry.contains(key) && entry[key].is_string() && !entry[key].get<std::string>().empty()) {
      asset.name = entry[key].get<std::string>();
      break;
    }
  }
  for (const char* key : kResolutionKeys) {
    if (entry.contains(key) && entry[key].is_string()) {
      const auto value = entry[key].get<std::string>();
      if (value.find('x') != std::string::npos || value.find('X') != std::string::npos) {
        asset.resolution = value;
        break;
      }
    }
  }
  if (entry.contains("File Path") && entry["File Path"].is_string()) {
    asset.current_path = entry["File Path"].get<std::string>();
  }
  for (auto it = entry.begin(); it != entry.end(); ++it) {
    asset.metadata[it.key()] = scalar_string(it.value());
  }
  return true;
}

bool parse_entry(const nlohmann::json& entry, size_t i, AssetDescriptor& asset, std::string& error) {
  const std::string base = "assets[" + std::to_string(i) + "]";
  if (entry.is_string()) {
    asset.name = entry.get<std::string>();
    return true;
  }
  if (!entry.is_object()) {
    error = base + ": expected object or string";
    return false;
  }
  if (!entry.contains("name")) {
    return parse_clip_properties(entry, asset);
  }
  if (!entry["name"].is_string()) {
    error = base + ".name: expected string";
    return false;
  }
  asset.name = entry["name"].get<std::string>();
  if (entry.contains("resolution") && !entry["resolution"].is_null()) {
    if (!entry["resolution"].is_string()) {
      error = base + ".resolution: expected string";
      return false;
    }
    asset.resolution = entry["resolution"].get<std::string>();
  }
  if (entry.contains("current_path") && entry["current_path"].is_string()) {
    asset.current_path = entry["current_path"].get<std::string>();
  }
  if (entry.contains("metadata")) {
    if (!entry["metadata"].is_object()) {
      error = base + ".metadata: expected object";
      return false;
    }
    for (auto it = entry["metadata"].begin(); it != entry["metadata"].end(); ++it) {
      asset.metadata[it.key()] = scalar_string(it.value());
    }
  }
  if (entry.contains("transforms")) {
    if (!entry["transforms"].is_array()) {
      error = base + ".transforms: expected array";
      return false;
    }
    for (const auto& key : entry["transforms"]) {
      if (!key.is_string()) {
        error = base + ".transforms: expected strings";
        return false;
      }
      asset.metadata.emplace(key.get<std::string>(), std::string());
    }
  }
  return true;
}
} // namespace

std::optional<FrameSize> parse_frame_size(std::string_view text) {
  text = trim(text);
  size_t sep = text.find('x');
  if (sep == std::string_view::npos) sep = text.find('X');
  if (sep == std::string_view::npos) return std::nullopt;
  FrameSize size;
  if (!parse_dimension(text.substr(0, sep), size.width)) return std::nullopt;
  if (!parse_dimension(text.substr(sep + 1), size.height)) return std::nullopt;
  return size;
}

std::optional<double> aspect_ratio(std::string_view resolution) {
  const auto size = parse_frame_size(resolution);
  if (!size || size->height == 0) return std::nullopt;
  return static_cast<double>(size->width) / static_cast<double>(size->height);
}

std::map<std::string, std::string> transform_fields(const AssetDescriptor& asset) {
  std::map<std::string, std::string> fields;
  for (const auto& kv : asset.metadata) {
    const std::string lowered = text::to_lower(kv.first);
    if (lowered.find("zoom") != std::string::npos || lowered.find("pan") != std::string::npos ||
        lowered.find("position") != std::string::npos || lowered.find("rotation") != std::string::npos) {
      fields.insert(kv);
    }
  }
  return fields;
}

bool parse_asset_manifest(const nlohmann::json& doc, std::vector<AssetDescriptor>& out, std::string& error) {
  const nlohmann::json* list = &doc;
  if (doc.is_object()) {
    if (!doc.contains("assets") || !doc["assets"].is_array()) {
      error = "assets: expected array";
      return false;
    }
    list = &doc["assets"];
  } else if (!doc.is_array()) {
    error = "manifest must be an object or array";
    return false;
  }
  out.clear();
  out.reserve(list->size());
  for (size_t i = 0; i < list->size(); ++i) {
    AssetDescriptor asset;
    if (!parse_entry((*list)[i], i, asset, error)) {
      return false;
    }
    out.push_back(std::move(asset));
  }
  return true;
}

bool load_asset_manifest(const std::filesystem::path& path, std::vector<AssetDescriptor>& out, std::string& error) {
  nlohmann::json doc;
  if (!data::load_document(path, doc, error)) {
    return false;
  }
  return parse_asset_manifest(doc, out, error);
}

nlohmann::json to_json(const AssetDescriptor& asset) {
  nlohmann::json j;
  j["name"] = asset.name;
  if (asset.resolution) j["resolution"] = *asset.resolution;
  if (asset.current_path) j["current_path"] = *asset.current_path;
  if (!asset.metadata.empty()) {
    j["metadata"] = nlohmann::json::object();
    for (const auto& kv : asset.metadata) j["metadata"][kv.first] = kv.second;
  }
  return j;
}

} // namespace rlk
