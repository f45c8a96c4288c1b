#include "rlk/relink.h"

#include "rlk/log.h"
#include "rlk/name_index.h"
#include "rlk/resolver.h"

#include <cmath>
#include <cstdio>
#include <optional>
#include <system_error>

namespace rlk {

namespace {
struct RunCounters {
  size_t scanned = 0;
  size_t matched = 0;
  size_t unmatched = 0;
  size_t mismatched = 0;
  size_t fuzzy = 0;
  size_t applied = 0;
  size_t failed = 0;
  size_t index_size = 0;
  size_t collisions = 0;
  size_t broken_rules = 0;
};

std::string format_ratio(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return buf;
}

bool same_resolution(const std::string& a, const std::string& b) {
  const auto fa = parse_frame_size(a);
  const auto fb = parse_frame_size(b);
  if (fa && fb) return fa->width == fb->width && fa->height == fb->height;
  return a == b;
}

// Returns true when a resolution or aspect mismatch was reported.
bool check_metadata(const AssetDescriptor& asset, const Resolution& res, const MappingPack& pack, Report& report) {
  const auto transforms = transform_fields(asset);
  if (!transforms.empty()) {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& kv : transforms) fields[kv.first] = kv.second;
    report.add(item_warning("appearance", "Clip may have transforms; verify framing after relink: " + asset.name,
                            asset.name, {{"transform_fields", fields}}));
  }

  if (!res.rule || !asset.resolution) return false;
  bool mismatch = false;
  const auto& clip_res = *asset.resolution;
  if (res.rule->expected_resolution && !same_resolution(*res.rule->expected_resolution, clip_res)) {
    report.add(item_warning("resolution",
                            "Clip resolution " + clip_res + " differs from expected " +
                                *res.rule->expected_resolution,
                            asset.name,
                            {{"expected", *res.rule->expected_resolution}, {"actual", clip_res}}));
    mismatch = true;
  }
  if (res.rule->expected_aspect) {
    const auto aspect = aspect_ratio(clip_res);
    if (aspect && std::fabs(*aspect - *res.rule->expected_aspect) > pack.aspect_tolerance) {
      report.add(item_warning("aspect",
                              "Clip aspect " + format_ratio(*aspect) + " differs from expected " +
                                  format_ratio(*res.rule->expected_aspect),
                              asset.name,
                              {{"expected", *res.rule->expected_aspect},
                               {"actual", *aspect},
                               {"tolerance", pack.aspect_tolerance}}));
      mismatch = true;
    }
  }
  return mismatch;
}

nlohmann::json resolution_detail(const Resolution& res) {
  nlohmann::json detail;
  detail["method"] = match_method_name(res.method);
  detail["score"] = res.score;
  if (res.rule_index) {
    detail["rule_index"] = *res.rule_index;
    detail["strategy"] = strategy_name(res.rule->strategy);
  }
  if (!res.candidate.empty()) detail["candidate"] = res.candidate;
  return detail;
}

// Built once per run; every manifest of a run resolves against the same index.
NameIndex index_roots(const MappingPack& pack, Report& report, RunCounters& counters) {
  NameIndex index = build_index(pack.root_folders);
  counters.index_size = index.size();
  counters.collisions = index.collisions().size();
  for (const auto& c : index.collisions()) {
    report.add(item_warning("index",
                            "Index collision on '" + c.key + "': " + c.replaced.string() + " replaced by " +
                                c.kept.string(),
                            std::nullopt,
                            {{"key", c.key}, {"replaced", c.replaced.string()}, {"kept", c.kept.string()}}));
  }
  return index;
}

void report_broken_rules(const Resolver& resolver, Report& report, RunCounters& counters) {
  counters.broken_rules = resolver.diagnostics().size();
  for (const auto& d : resolver.diagnostics()) {
    report.add(item_warning("rule",
                            "Rule rules[" + std::to_string(d.rule_index) + "] ('" + d.source + "') skipped: " +
                                d.message,
                            std::nullopt,
                            {{"rule_index", d.rule_index}, {"source", d.source}}));
  }
}

void relink_assets(const MappingPack& pack,
                   const Resolver& resolver,
                   const std::vector<AssetDescriptor>& assets,
                   RelinkSink& sink,
                   Report& report,
                   Transaction& tx,
                   RunCounters& counters) {
  if (assets.empty()) {
    report.add(item_warning("input", "No assets supplied"));
  }

  for (const auto& asset : assets) {
    ++counters.scanned;
    if (asset.name.empty()) {
      continue;
    }
    const Resolution res = resolver.resolve(asset.name);
    if (!res.resolved()) {
      ++counters.unmatched;
      report.add(item_warning("match", "No target found for " + asset.name, asset.name));
      continue;
    }
    ++counters.matched;
    const std::string& target = *res.target;
    const nlohmann::json detail = resolution_detail(res);

    if (res.method == MatchMethod::Fuzzy) {
      ++counters.fuzzy;
      report.add(item_warning("fuzzy",
                              "Fuzzy match used for " + asset.name + " (score " + format_ratio(res.score) + ")",
                              asset.name, detail));
    }
    if (check_metadata(asset, res, pack, report)) {
      ++counters.mismatched;
    }

    TxAction action{"relink", asset.name, target, tx.dry_run(), detail};
    if (tx.dry_run()) {
      report.add(item_info("swap", "Dry run: relink " + asset.name + " -> " + target, asset.name, detail));
      tx.record(std::move(action));
      continue;
    }

    std::string error;
    if (sink.relink(asset, target, error)) {
      ++counters.applied;
      report.add(item_info("swap", "Relinked " + asset.name + " -> " + target, asset.name, detail));
      tx.record(std::move(action));
      if (asset.current_path) {
        tx.record_rollback({"relink", asset.name, *asset.current_path, false, nlohmann::json::object()});
      }
    } else {
      ++counters.failed;
      std::string message = "Failed to relink " + asset.name + " -> " + target;
      if (!error.empty()) message += ": " + error;
      report.add(item_error("swap", message, asset.name, detail));
      log::warn(message);
    }
  }
}

void write_summary(Report& report, const RunCounters& counters, const Transaction& tx) {
  report.summary["items_scanned"] = counters.scanned;
  report.summary["matched"] = counters.matched;
  report.summary["unmatched"] = counters.unmatched;
  report.summary["mismatched"] = counters.mismatched;
  report.summary["fuzzy"] = counters.fuzzy;
  report.summary["applied"] = counters.applied;
  report.summary["failed"] = counters.failed;
  report.summary["index_size"] = counters.index_size;
  report.summary["index_collisions"] = counters.collisions;
  report.summary["broken_rules"] = counters.broken_rules;
  report.summary["dry_run"] = tx.dry_run();
  report.summary["transaction_id"] = tx.id();
}

RunOutcome fatal_outcome(const ToolConfig& cfg, const std::string& category, const std::string& message) {
  RunOutcome out{make_report(kRelinkToolId, "Relink Resolver"), Transaction("relink", cfg.dry_run)};
  out.report.add(item_error(category, message));
  out.transaction.close();
  log::error(message);
  return out;
}

std::optional<MappingPack> load_pack_into(const std::filesystem::path& pack_path, const LoadOptions& options,
                                          std::string& error) {
  if (pack_path.empty()) {
    error = "mapping_pack_path is required";
    return std::nullopt;
  }
  std::error_code ec;
  if (!std::filesystem::exists(pack_path, ec)) {
    error = "Mapping pack not found: " + pack_path.string();
    return std::nullopt;
  }
  try {
    return load_mapping_pack(pack_path, options);
  } catch (const ValidationError& e) {
    error = e.what();
    return std::nullopt;
  }
}
} // namespace

RunOutcome run_relink(const ToolConfig& cfg,
                      const MappingPack& pack,
                      const std::vector<AssetDescriptor>& assets,
                      RelinkSink& sink) {
  RunOutcome out{make_report(kRelinkToolId, "Relink Resolver"), Transaction("relink", cfg.dry_run)};
  log::set_context("tool_id", kRelinkToolId);
  log::set_context("tx_id", out.transaction.id());
  log::info(std::string("relink run started (") + (cfg.dry_run ? "dry run" : "apply") + ", " +
            std::to_string(assets.size()) + " assets)");

  RunCounters counters;
  const NameIndex index = index_roots(pack, out.report, counters);
  const Resolver resolver(pack, index);
  report_broken_rules(resolver, out.report, counters);
  relink_assets(pack, resolver, assets, sink, out.report, out.transaction, counters);
  write_summary(out.report, counters, out.transaction);
  out.report.summary["rules"] = pack.rules.size();
  out.transaction.close();

  log::info("relink run finished: " + std::to_string(counters.matched) + " matched, " +
            std::to_string(counters.unmatched) + " unmatched");
  log::clear_context();
  return out;
}

RunOutcome run_relink_from_files(const ToolConfig& cfg,
                                 const std::filesystem::path& pack_path,
                                 const std::filesystem::path& assets_path,
                                 RelinkSink& sink,
                                 const LoadOptions& options) {
  std::string error;
  const auto pack = load_pack_into(pack_path, options, error);
  if (!pack) {
    return fatal_outcome(cfg, "config", error);
  }
  std::vector<AssetDescriptor> assets;
  if (!load_asset_manifest(assets_path, assets, error)) {
    return fatal_outcome(cfg, "input", "Asset manifest unusable: " + error);
  }
  return run_relink(cfg, *pack, assets, sink);
}

RunOutcome run_relink_projects(const ToolConfig& cfg,
                               const std::filesystem::path& pack_path,
                               const std::vector<std::filesystem::path>& manifests,
                               const SinkFactory& make_sink,
                               const LoadOptions& options) {
  std::string error;
  const auto pack = load_pack_into(pack_path, options, error);
  if (!pack) {
    return fatal_outcome(cfg, "config", error);
  }

  RunOutcome out{make_report("relink_across_projects", "Relink Across Projects"),
                 Transaction("relink_across_projects", cfg.dry_run)};
  log::set_context("tool_id", "relink_across_projects");
  log::set_context("tx_id", out.transaction.id());
  if (manifests.empty()) {
    out.report.add(item_warning("config", "No projects provided"));
  }

  nlohmann::json orchestration = nlohmann::json::array();
  RunCounters counters;
  const NameIndex index = index_roots(*pack, out.report, counters);
  const Resolver resolver(*pack, index);
  report_broken_rules(resolver, out.report, counters);
  for (const auto& manifest : manifests) {
    std::vector<AssetDescriptor> assets;
    if (!load_asset_manifest(manifest, assets, error)) {
      out.report.add(item_error("project", "Unable to load " + manifest.string() + ": " + error));
      orchestration.push_back({{"project", manifest.string()}, {"status", "failed"}});
      continue;
    }
    auto sink = make_sink(manifest);
    if (!sink) {
      out.report.add(item_error("project", "No relink target available for " + manifest.string()));
      orchestration.push_back({{"project", manifest.string()}, {"status", "failed"}});
      continue;
    }
    out.report.add(item_info("project", "Applying mapping pack to " + manifest.string()));
    const size_t before = out.report.items.size();
    relink_assets(*pack, resolver, assets, *sink, out.report, out.transaction, counters);
    orchestration.push_back({{"project", manifest.string()},
                             {"status", "ok"},
                             {"items", out.report.items.size() - before}});
  }

  write_summary(out.report, counters, out.transaction);
  out.report.summary["projects"] = manifests.size();
  out.report.summary["processed"] = orchestration.size();
  out.report.summary["orchestration"] = orchestration;
  out.transaction.close();
  log::clear_context();
  return out;
}

} // namespace rlk
