#include "rlk/config.h"
#include "rlk/log.h"
#include "rlk/mapping_pack.h"
#include "rlk/name_index.h"
#include "rlk/presets.h"
#include "rlk/relink.h"
#include "rlk/report.h"
#include "rlk_data/serialization.h"
#include "rlkctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRunErrors = 2;

// Stands in when the manifest cannot be opened; the run reports the manifest
// itself as unusable and any relink it still attempts fails with the reason.
class UnavailableSink final : public rlk::RelinkSink {
 public:
  explicit UnavailableSink(std::string reason) : reason_(std::move(reason)) {}

  bool relink(const rlk::AssetDescriptor&, const std::string&, std::string& error) override {
    error = reason_;
    return false;
  }

 private:
  std::string reason_;
};

void print_usage() {
  std::cout << "rlkctl commands:\n"
            << "  validate --pack <file>\n"
            << "  index --pack <file> [--out <file>]\n"
            << "  resolve --pack <file> --assets <file> [--apply|--dry-run] [--output <dir>]\n"
            << "          [--manifest-out <file>] [--lenient-patterns] [--preset <name>]\n"
            << "  projects --pack <file> --assets <file> [--assets <file> ...] [--apply|--dry-run]\n"
            << "           [--output <dir>]\n"
            << "  export --report <report.json> --output <dir> [--formats json,csv,html]\n"
            << "  preset save <name> --pack <file> --assets <file> [...resolve options]\n"
            << "  preset list\n"
            << "  preset show <name>\n"
            << "global options: --config <file>\n";
}

std::vector<std::string> split_csv(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) out.push_back(part);
  }
  return out;
}

bool to_formats(const std::vector<std::string>& names, std::vector<rlk::ReportFormat>& out) {
  out.clear();
  for (const auto& name : names) {
    rlk::ReportFormat format{};
    if (!rlk::parse_report_format(name, format)) {
      std::cerr << "unknown report format: " << name << "\n";
      return false;
    }
    out.push_back(format);
  }
  return true;
}

void print_field_errors(const std::vector<rlk::FieldError>& errors) {
  const size_t limit = 10;
  for (size_t i = 0; i < errors.size() && i < limit; ++i) {
    std::cerr << (errors[i].keypath.empty() ? "<root>" : errors[i].keypath) << " -> " << errors[i].message << "\n";
  }
  if (errors.size() > limit) {
    std::cerr << "... and " << (errors.size() - limit) << " more error(s)\n";
  }
}

std::optional<rlk::MappingPack> load_pack_or_report(const fs::path& path, const rlk::LoadOptions& options) {
  if (path.empty()) {
    std::cerr << "--pack is required\n";
    return std::nullopt;
  }
  try {
    return rlk::load_mapping_pack(path, options);
  } catch (const rlk::ValidationError& e) {
    std::cerr << "mapping pack invalid: " << path.string() << "\n";
    print_field_errors(e.errors());
    return std::nullopt;
  }
}

void print_severity_counts(const rlk::Report& report) {
  std::cout << "items: " << report.items.size()
            << " (info " << report.count(rlk::Severity::Info)
            << ", warning " << report.count(rlk::Severity::Warning)
            << ", error " << report.count(rlk::Severity::Error) << ")\n";
}

int export_outcome(const rlk::ToolConfig& cfg, const rlk::RunOutcome& outcome,
                   const std::optional<fs::path>& output_dir) {
  std::vector<rlk::ReportFormat> formats;
  if (!to_formats(cfg.report_formats, formats)) {
    return kExitUsage;
  }
  const fs::path out_dir = output_dir.value_or(cfg.reports_dir);
  for (const auto& path : rlk::save_report(outcome.report, out_dir, formats)) {
    std::cout << "report: " << path.string() << "\n";
  }
  const fs::path tx_path = out_dir / (outcome.report.tool_id + "_" + outcome.transaction.id() + ".tx.json");
  if (rlk::data::save_json_file(tx_path, rlk::to_json(outcome.transaction))) {
    std::cout << "transaction: " << tx_path.string() << "\n";
  }
  print_severity_counts(outcome.report);
  return outcome.report.has_errors() ? kExitRunErrors : kExitOk;
}

int cmd_validate(const fs::path& pack_path, const rlk::LoadOptions& options) {
  const auto pack = load_pack_or_report(pack_path, options);
  if (!pack) return kExitUsage;
  std::cout << "ok: " << pack->rules.size() << " rules, " << pack->root_folders.size()
            << " root folders, similarity_threshold " << pack->similarity_threshold
            << ", aspect_tolerance " << pack->aspect_tolerance << "\n";
  return kExitOk;
}

int cmd_index(const fs::path& pack_path, const std::optional<fs::path>& out_path) {
  const auto pack = load_pack_or_report(pack_path, {});
  if (!pack) return kExitUsage;
  const rlk::NameIndex index = rlk::build_index(pack->root_folders);
  json j = json::object();
  j["entries"] = json::object();
  for (const auto& key : index.keys()) {
    j["entries"][key] = index.find(key)->string();
  }
  j["collisions"] = json::array();
  for (const auto& c : index.collisions()) {
    j["collisions"].push_back({{"key", c.key}, {"replaced", c.replaced.string()}, {"kept", c.kept.string()}});
  }
  if (out_path) {
    if (!rlk::data::save_json_file(*out_path, j)) return kExitUsage;
    std::cout << "index: " << index.size() << " entries -> " << out_path->string() << "\n";
  } else {
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  }
  return kExitOk;
}

int cmd_resolve(rlk::ToolConfig cfg, const ResolveOptions& opts) {
  if (opts.pack_path.empty() || opts.assets_paths.size() != 1) {
    std::cerr << "resolve needs --pack and exactly one --assets\n";
    return kExitUsage;
  }
  if (opts.dry_run) cfg.dry_run = *opts.dry_run;
  rlk::LoadOptions load;
  load.strict_patterns = opts.strict_patterns;

  const fs::path& manifest = opts.assets_paths.front();
  std::string error;
  auto sink = ManifestSink::open(manifest, relinked_manifest_path(manifest, opts.manifest_out), error);
  if (!sink) {
    rlk::log::warn("asset manifest cannot be opened: " + error);
    UnavailableSink unavailable(error);
    const auto outcome = rlk::run_relink_from_files(cfg, opts.pack_path, manifest, unavailable, load);
    return export_outcome(cfg, outcome, opts.output_dir);
  }
  const auto outcome = rlk::run_relink_from_files(cfg, opts.pack_path, manifest, *sink, load);
  if (!cfg.dry_run && !sink->flush()) {
    std::cerr << "failed to write relinked manifest\n";
    return kExitRunErrors;
  }
  return export_outcome(cfg, outcome, opts.output_dir);
}

int cmd_projects(rlk::ToolConfig cfg, const ResolveOptions& opts) {
  if (opts.pack_path.empty()) {
    std::cerr << "projects needs --pack\n";
    return kExitUsage;
  }
  if (opts.dry_run) cfg.dry_run = *opts.dry_run;
  rlk::LoadOptions load;
  load.strict_patterns = opts.strict_patterns;

  std::vector<std::shared_ptr<ManifestSink>> sinks;
  const rlk::SinkFactory factory = [&sinks](const fs::path& manifest) -> std::shared_ptr<rlk::RelinkSink> {
    std::string error;
    std::shared_ptr<ManifestSink> sink = ManifestSink::open(manifest, relinked_manifest_path(manifest, std::nullopt), error);
    if (!sink) {
      rlk::log::warn("manifest sink unavailable: " + error);
      return nullptr;
    }
    sinks.push_back(sink);
    return sink;
  };
  const auto outcome = rlk::run_relink_projects(cfg, opts.pack_path, opts.assets_paths, factory, load);
  bool flushed = true;
  if (!cfg.dry_run) {
    for (const auto& sink : sinks) flushed = sink->flush() && flushed;
  }
  const int rc = export_outcome(cfg, outcome, opts.output_dir);
  return flushed ? rc : kExitRunErrors;
}

int cmd_export(const rlk::ToolConfig& cfg, const fs::path& report_path, const std::optional<fs::path>& output_dir,
               const std::vector<std::string>& format_names) {
  json doc;
  if (!rlk::data::load_json_file(report_path, doc)) {
    std::cerr << "cannot read report: " << report_path.string() << "\n";
    return kExitUsage;
  }
  rlk::Report report;
  std::string error;
  if (!rlk::parse_report(doc, report, error)) {
    std::cerr << "report invalid: " << error << "\n";
    return kExitUsage;
  }
  std::vector<rlk::ReportFormat> formats;
  if (!to_formats(format_names.empty() ? cfg.report_formats : format_names, formats)) {
    return kExitUsage;
  }
  for (const auto& path : rlk::save_report(report, output_dir.value_or(cfg.reports_dir), formats)) {
    std::cout << "report: " << path.string() << "\n";
  }
  return kExitOk;
}

bool apply_preset(const rlk::ToolConfig& cfg, const std::string& name, ResolveOptions& opts) {
  try {
    const json options = rlk::load_preset(cfg, rlk::kRelinkToolId, name);
    std::string error;
    if (!resolve_options_from_json(options, opts, error)) {
      std::cerr << "preset " << name << " invalid: " << error << "\n";
      return false;
    }
    return true;
  } catch (const rlk::PresetError& e) {
    std::cerr << e.what() << "\n";
    return false;
  }
}

int cmd_preset(const rlk::ToolConfig& cfg, const std::string& sub, const std::string& name,
               const ResolveOptions& opts) {
  if (sub == "list") {
    for (const auto& preset : rlk::list_presets(cfg, rlk::kRelinkToolId)) {
      std::cout << preset << "\n";
    }
    return kExitOk;
  }
  if (name.empty()) {
    print_usage();
    return kExitUsage;
  }
  try {
    if (sub == "save") {
      const auto path = rlk::save_preset(cfg, rlk::kRelinkToolId, name, resolve_options_to_json(opts));
      std::cout << "preset saved: " << path.string() << "\n";
      return kExitOk;
    }
    if (sub == "show") {
      const json preset = rlk::load_preset(cfg, rlk::kRelinkToolId, name);
      std::cout << preset.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
      return kExitOk;
    }
  } catch (const rlk::PresetError& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }
  print_usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }
  const std::string command = argv[1];
  int first_arg = 2;
  std::string preset_sub;
  std::string preset_name;
  if (command == "preset") {
    if (argc < 3) {
      print_usage();
      return kExitUsage;
    }
    preset_sub = argv[2];
    first_arg = 3;
    if (preset_sub != "list" && argc >= 4 && argv[3][0] != '-') {
      preset_name = argv[3];
      first_arg = 4;
    }
  }

  ResolveOptions opts;
  std::optional<fs::path> config_path;
  std::optional<fs::path> index_out;
  std::optional<fs::path> report_path;
  std::optional<std::string> use_preset;
  std::vector<std::string> formats;
  for (int i = first_arg; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--pack" && i + 1 < argc) {
      opts.pack_path = argv[++i];
    } else if (arg == "--assets" && i + 1 < argc) {
      opts.assets_paths.emplace_back(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      opts.output_dir = fs::path(argv[++i]);
    } else if (arg == "--manifest-out" && i + 1 < argc) {
      opts.manifest_out = fs::path(argv[++i]);
    } else if (arg == "--apply") {
      opts.dry_run = false;
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--lenient-patterns") {
      opts.strict_patterns = false;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = fs::path(argv[++i]);
    } else if (arg == "--out" && i + 1 < argc) {
      index_out = fs::path(argv[++i]);
    } else if (arg == "--report" && i + 1 < argc) {
      report_path = fs::path(argv[++i]);
    } else if (arg == "--formats" && i + 1 < argc) {
      formats = split_csv(argv[++i]);
    } else if (arg == "--preset" && i + 1 < argc) {
      use_preset = std::string(argv[++i]);
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      print_usage();
      return kExitUsage;
    }
  }

  rlk::ToolConfig cfg = rlk::default_tool_config();
  if (config_path) {
    cfg = rlk::load_tool_config(*config_path, cfg);
  }
  const bool dirs_ok = rlk::ensure_dirs(cfg);
  rlk::log::init("rlkctl", cfg.logs_dir);
  if (!dirs_ok) {
    rlk::log::warn("some tool directories could not be created under " + cfg.home_dir.string());
  }
  rlk::log::install_crash_handlers();
  rlk::log::Level level = rlk::log::Level::Info;
  if (rlk::log::parse_level(cfg.log_level, level)) {
    rlk::log::set_level(level);
  }

  int rc = kExitUsage;
  if (command == "validate") {
    rlk::LoadOptions load;
    load.strict_patterns = opts.strict_patterns;
    rc = cmd_validate(opts.pack_path, load);
  } else if (command == "index") {
    rc = cmd_index(opts.pack_path, index_out);
  } else if (command == "resolve" || command == "projects") {
    if (use_preset) {
      ResolveOptions merged;
      if (!apply_preset(cfg, *use_preset, merged)) {
        rlk::log::shutdown();
        return kExitUsage;
      }
      // Command-line values win over the preset.
      if (!opts.pack_path.empty()) merged.pack_path = opts.pack_path;
      if (!opts.assets_paths.empty()) merged.assets_paths = opts.assets_paths;
      if (opts.output_dir) merged.output_dir = opts.output_dir;
      if (opts.manifest_out) merged.manifest_out = opts.manifest_out;
      if (opts.dry_run) merged.dry_run = opts.dry_run;
      if (!opts.strict_patterns) merged.strict_patterns = false;
      opts = merged;
    }
    rc = command == "resolve" ? cmd_resolve(cfg, opts) : cmd_projects(cfg, opts);
  } else if (command == "export") {
    if (!report_path) {
      std::cerr << "export needs --report\n";
    } else {
      rc = cmd_export(cfg, *report_path, opts.output_dir, formats);
    }
  } else if (command == "preset") {
    rc = cmd_preset(cfg, preset_sub, preset_name, opts);
  } else {
    print_usage();
  }

  rlk::log::shutdown();
  return rc;
}
