#include "rlkctl/cli_api.h"

#include "rlk/log.h"
#include "rlk_data/serialization.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
const char* const kNameKeys[] = {"name", "File Name", "Clip Name"};

std::string entry_name(const json& entry) {
  if (entry.is_string()) return entry.get<std::string>();
  if (!entry.is_object()) return {};
  for (const char* key : kNameKeys) {
    if (entry.contains(key) && entry[key].is_string()) return entry[key].get<std::string>();
  }
  return {};
}
} // namespace

ManifestSink::ManifestSink(json manifest, fs::path out_path)
    : manifest_(std::move(manifest)), out_path_(std::move(out_path)) {}

std::unique_ptr<ManifestSink> ManifestSink::open(const fs::path& manifest_path,
                                                 const fs::path& out_path,
                                                 std::string& error) {
  json doc;
  if (!rlk::data::load_document(manifest_path, doc, error)) {
    return nullptr;
  }
  return std::make_unique<ManifestSink>(std::move(doc), out_path);
}

json* ManifestSink::find_entry(const std::string& name) {
  json* list = manifest_.is_object() && manifest_.contains("assets") ? &manifest_["assets"] : &manifest_;
  if (!list->is_array()) return nullptr;
  for (auto& entry : *list) {
    if (entry_name(entry) == name) return &entry;
  }
  return nullptr;
}

bool ManifestSink::relink(const rlk::AssetDescriptor& asset, const std::string& target, std::string& error) {
  json* entry = find_entry(asset.name);
  if (!entry) {
    error = "asset not present in manifest";
    return false;
  }
  if (entry->is_string()) {
    *entry = json{{"name", entry->get<std::string>()}};
  }
  if (entry->contains("name")) {
    (*entry)["current_path"] = target;
  } else {
    (*entry)["File Path"] = target;
  }
  ++relinked_;
  return true;
}

bool ManifestSink::flush() {
  if (relinked_ == 0) return true;
  if (!rlk::data::save_json_file(out_path_, manifest_)) {
    return false;
  }
  rlk::log::info("relinked manifest written: " + out_path_.string());
  return true;
}

fs::path relinked_manifest_path(const fs::path& manifest, const std::optional<fs::path>& explicit_out) {
  if (explicit_out) return *explicit_out;
  return manifest.parent_path() / (manifest.stem().string() + ".relinked.json");
}

json resolve_options_to_json(const ResolveOptions& opts) {
  json j;
  j["pack"] = opts.pack_path.string();
  j["assets"] = json::array();
  for (const auto& p : opts.assets_paths) j["assets"].push_back(p.string());
  if (opts.output_dir) j["output"] = opts.output_dir->string();
  if (opts.manifest_out) j["manifest_out"] = opts.manifest_out->string();
  if (opts.dry_run) j["dry_run"] = *opts.dry_run;
  j["strict_patterns"] = opts.strict_patterns;
  return j;
}

bool resolve_options_from_json(const json& j, ResolveOptions& out, std::string& error) {
  if (!j.is_object()) {
    error = "preset options must be an object";
    return false;
  }
  if (j.contains("pack") && j["pack"].is_string()) out.pack_path = j["pack"].get<std::string>();
  if (j.contains("assets")) {
    if (!j["assets"].is_array()) {
      error = "assets: expected array";
      return false;
    }
    out.assets_paths.clear();
    for (const auto& v : j["assets"]) {
      if (!v.is_string()) {
        error = "assets: expected strings";
        return false;
      }
      out.assets_paths.emplace_back(v.get<std::string>());
    }
  }
  if (j.contains("output") && j["output"].is_string()) out.output_dir = fs::path(j["output"].get<std::string>());
  if (j.contains("manifest_out") && j["manifest_out"].is_string()) {
    out.manifest_out = fs::path(j["manifest_out"].get<std::string>());
  }
  if (j.contains("dry_run") && j["dry_run"].is_boolean()) out.dry_run = j["dry_run"].get<bool>();
  if (j.contains("strict_patterns") && j["strict_patterns"].is_boolean()) {
    out.strict_patterns = j["strict_patterns"].get<bool>();
  }
  return true;
}
