#include "rlk/config.h"

#include "rlk/log.h"
#include "rlk_data/serialization.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <system_error>

namespace rlk {

namespace {
std::filesystem::path env_path(const char* name, const std::filesystem::path& fallback) {
  if (const char* value = std::getenv(name)) {
    if (*value != '\0') return std::filesystem::path(value);
  }
  return fallback;
}

std::filesystem::path home_default() {
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".rlk";
  }
  return std::filesystem::current_path() / ".rlk";
}

bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

std::filesystem::path read_path(const nlohmann::json& root, const char* key,
                                const std::filesystem::path& current) {
  if (root.contains(key) && root[key].is_string()) {
    return std::filesystem::path(root[key].get<std::string>());
  }
  return current;
}

void apply_fields(ToolConfig& cfg, const nlohmann::json& root) {
  cfg.home_dir = read_path(root, "home_dir", cfg.home_dir);
  cfg.logs_dir = read_path(root, "logs_dir", cfg.logs_dir);
  cfg.reports_dir = read_path(root, "reports_dir", cfg.reports_dir);
  cfg.packs_dir = read_path(root, "packs_dir", cfg.packs_dir);
  cfg.presets_dir = read_path(root, "presets_dir", cfg.presets_dir);

  if (root.contains("log_level") && root["log_level"].is_string()) {
    const auto level = root["log_level"].get<std::string>();
    log::Level parsed{};
    if (log::parse_level(level, parsed)) {
      cfg.log_level = level;
    } else {
      log::warn("unknown log_level in config: " + level);
    }
  }
  if (root.contains("dry_run") && root["dry_run"].is_boolean()) {
    cfg.dry_run = root["dry_run"].get<bool>();
  }
  if (root.contains("report_formats") && root["report_formats"].is_array()) {
    std::vector<std::string> formats;
    for (const auto& v : root["report_formats"]) {
      if (!v.is_string()) continue;
      const auto f = v.get<std::string>();
      if (f == "json" || f == "csv" || f == "html") {
        formats.push_back(f);
      } else {
        log::warn("unknown report format in config: " + f);
      }
    }
    cfg.report_formats = formats;
  }
}
} // namespace

ToolConfig default_tool_config() {
  ToolConfig cfg;
  cfg.home_dir = env_path("RLK_HOME", home_default());
  cfg.logs_dir = env_path("RLK_LOGS", cfg.home_dir / "logs");
  cfg.reports_dir = env_path("RLK_REPORTS", cfg.home_dir / "reports");
  cfg.packs_dir = env_path("RLK_PACKS", cfg.home_dir / "packs");
  cfg.presets_dir = env_path("RLK_PRESETS", cfg.home_dir / "presets");
  return cfg;
}

ToolConfig load_tool_config(const std::filesystem::path& path, const ToolConfig& base) {
  ToolConfig cfg = base;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext != ".json" && ext != ".yaml" && ext != ".yml") {
    log::warn("Unknown config extension; using defaults.");
    return cfg;
  }

  nlohmann::json doc;
  std::string error;
  if (!data::load_document(path, doc, error)) {
    log::warn("config load failed: " + error);
    return cfg;
  }
  if (!doc.is_object()) {
    log::warn("config root is not a mapping: " + path.string());
    return cfg;
  }
  const auto& root = (doc.contains("tool") && doc["tool"].is_object()) ? doc["tool"] : doc;
  apply_fields(cfg, root);
  return cfg;
}

bool ensure_dirs(const ToolConfig& cfg) {
  bool ok = true;
  for (const auto& dir : {cfg.home_dir, cfg.logs_dir, cfg.reports_dir, cfg.packs_dir, cfg.presets_dir}) {
    if (dir.empty()) continue;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      log::warn("failed to create " + dir.string() + ": " + ec.message());
      ok = false;
    }
  }
  return ok;
}

} // namespace rlk
