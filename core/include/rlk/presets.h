#pragma once

#include "rlk/config.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rlk {

class PresetError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Presets live at <presets_dir>/<tool_id>/<name>.json.
std::vector<std::string> list_presets(const ToolConfig& cfg, const std::string& tool_id);
std::filesystem::path save_preset(const ToolConfig& cfg, const std::string& tool_id, const std::string& name,
                                  const nlohmann::json& options);
// Throws PresetError when missing, unreadable or stored for another tool.
nlohmann::json load_preset(const ToolConfig& cfg, const std::string& tool_id, const std::string& name);

} // namespace rlk
