#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace rlk {

struct FrameSize {
  int width = 0;
  int height = 0;
};

// "<width>x<height>", 'x' in either case, surrounding spaces allowed.
std::optional<FrameSize> parse_frame_size(std::string_view text);
std::optional<double> aspect_ratio(std::string_view resolution);

struct AssetDescriptor {
  std::string name;
  std::optional<std::string> resolution;
  // Metadata keys from the host, with values where it supplied them.
  std::map<std::string, std::string> metadata;
  std::optional<std::string> current_path;
};

// Metadata keys that name a zoom, pan, position or rotation property.
std::map<std::string, std::string> transform_fields(const AssetDescriptor& asset);

// Accepts {"assets": [...]} or a bare array. Entries are either
// {name, resolution?, transforms?: [..], metadata?: {..}, current_path?} or a
// clip property map keyed by "File Name"/"Clip Name".
bool parse_asset_manifest(const nlohmann::json& doc,
                          std::vector<AssetDescriptor>& out,
                          std::string& error);
bool load_asset_manifest(const std::filesystem::path& path,
                         std::vector<AssetDescriptor>& out,
                         std::string& error);

nlohmann::json to_json(const AssetDescriptor& asset);

} // namespace rlk
