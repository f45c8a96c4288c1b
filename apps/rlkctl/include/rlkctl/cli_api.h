#pragma once

#include "rlk/relink.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Stand-in for a host application: applies relinks to an asset manifest and
// writes the updated manifest on flush().
class ManifestSink final : public rlk::RelinkSink {
 public:
  ManifestSink(nlohmann::json manifest, std::filesystem::path out_path);

  static std::unique_ptr<ManifestSink> open(const std::filesystem::path& manifest_path,
                                            const std::filesystem::path& out_path,
                                            std::string& error);

  bool relink(const rlk::AssetDescriptor& asset, const std::string& target, std::string& error) override;
  bool flush();

  const nlohmann::json& manifest() const { return manifest_; }
  size_t relinked() const { return relinked_; }

 private:
  nlohmann::json* find_entry(const std::string& name);

  nlohmann::json manifest_;
  std::filesystem::path out_path_;
  size_t relinked_ = 0;
};

struct ResolveOptions {
  std::filesystem::path pack_path;
  std::vector<std::filesystem::path> assets_paths;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::filesystem::path> manifest_out;
  std::optional<bool> dry_run;
  bool strict_patterns = true;
};

nlohmann::json resolve_options_to_json(const ResolveOptions& opts);
bool resolve_options_from_json(const nlohmann::json& j, ResolveOptions& out, std::string& error);

// Output path for the relinked copy of a manifest: <stem>.relinked<ext> next
// to it unless an explicit path is given.
std::filesystem::path relinked_manifest_path(const std::filesystem::path& manifest,
                                             const std::optional<std::filesystem::path>& explicit_out);
