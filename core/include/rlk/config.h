#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rlk {

struct ToolConfig {
  std::filesystem::path home_dir;
  std::filesystem::path logs_dir;
  std::filesystem::path reports_dir;
  std::filesystem::path packs_dir;
  std::filesystem::path presets_dir;
  std::string log_level = "info";
  bool dry_run = true;
  std::vector<std::string> report_formats = {"json", "csv", "html"};
};

// Directories come from RLK_HOME (default ~/.rlk), RLK_LOGS, RLK_REPORTS,
// RLK_PACKS and RLK_PRESETS.
ToolConfig default_tool_config();

// Overlays a .json/.yaml/.yml file on top of base. A missing file or an
// unknown extension logs a warning and returns base unchanged.
ToolConfig load_tool_config(const std::filesystem::path& path, const ToolConfig& base);

bool ensure_dirs(const ToolConfig& cfg);

} // namespace rlk
