#include "rlk/presets.h"

#include "rlk/log.h"
#include "rlk_data/serialization.h"

#include <algorithm>
#include <system_error>

namespace rlk {

namespace fs = std::filesystem;

namespace {
fs::path preset_dir(const ToolConfig& cfg, const std::string& tool_id) {
  return cfg.presets_dir / tool_id;
}

bool valid_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}
} // namespace

std::vector<std::string> list_presets(const ToolConfig& cfg, const std::string& tool_id) {
  std::vector<std::string> names;
  std::error_code ec;
  const fs::path dir = preset_dir(cfg, tool_id);
  if (!fs::is_directory(dir, ec)) return names;
  fs::directory_iterator it(dir, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && it->path().extension() == ".json") {
      names.push_back(it->path().stem().string());
    }
  }
  if (ec) {
    log::warn("preset listing stopped under " + dir.string() + ": " + ec.message());
  }
  std::sort(names.begin(), names.end());
  return names;
}

fs::path save_preset(const ToolConfig& cfg, const std::string& tool_id, const std::string& name,
                     const nlohmann::json& options) {
  if (!valid_name(name)) {
    throw PresetError("Invalid preset name: " + name);
  }
  const fs::path path = preset_dir(cfg, tool_id) / (name + ".json");
  const nlohmann::json doc = {{"tool_id", tool_id}, {"name", name}, {"options", options}};
  if (!data::save_json_file(path, doc)) {
    throw PresetError("Failed to save preset: " + path.string());
  }
  return path;
}

nlohmann::json load_preset(const ToolConfig& cfg, const std::string& tool_id, const std::string& name) {
  if (!valid_name(name)) {
    throw PresetError("Invalid preset name: " + name);
  }
  const fs::path path = preset_dir(cfg, tool_id) / (name + ".json");
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw PresetError("Preset not found: " + name);
  }
  nlohmann::json doc;
  if (!data::load_json_file(path, doc) || !doc.is_object()) {
    throw PresetError("Preset unreadable: " + path.string());
  }
  const std::string stored = doc.value("tool_id", "");
  if (!stored.empty() && stored != tool_id) {
    throw PresetError("Preset tool mismatch: " + stored + " != " + tool_id);
  }
  if (!doc.contains("options")) return nlohmann::json::object();
  return doc["options"];
}

} // namespace rlk
