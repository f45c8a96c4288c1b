#pragma once

#include "rlk/asset.h"
#include "rlk/config.h"
#include "rlk/mapping_pack.h"
#include "rlk/report.h"
#include "rlk/transaction.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rlk {

// Receives the relinks a committed (non dry-run) run decides on.
class RelinkSink {
 public:
  virtual ~RelinkSink() = default;
  virtual bool relink(const AssetDescriptor& asset, const std::string& target, std::string& error) = 0;
};

struct RunOutcome {
  Report report;
  Transaction transaction;
};

inline constexpr const char* kRelinkToolId = "relink_resolver";

// Resolves every asset against the pack. Never throws for unmatched assets;
// every outcome lands in the report.
RunOutcome run_relink(const ToolConfig& cfg,
                      const MappingPack& pack,
                      const std::vector<AssetDescriptor>& assets,
                      RelinkSink& sink);

// Loads the pack and the asset manifest first. A missing or invalid pack or
// manifest yields a report with a single error item and no resolution.
RunOutcome run_relink_from_files(const ToolConfig& cfg,
                                 const std::filesystem::path& pack_path,
                                 const std::filesystem::path& assets_path,
                                 RelinkSink& sink,
                                 const LoadOptions& options = {});

using SinkFactory = std::function<std::shared_ptr<RelinkSink>(const std::filesystem::path& manifest)>;

// Runs the same pack over several asset manifests into one report and one
// transaction. summary.orchestration lists per-manifest status.
RunOutcome run_relink_projects(const ToolConfig& cfg,
                               const std::filesystem::path& pack_path,
                               const std::vector<std::filesystem::path>& manifests,
                               const SinkFactory& make_sink,
                               const LoadOptions& options = {});

} // namespace rlk
