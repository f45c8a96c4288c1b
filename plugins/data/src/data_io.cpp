#include "rlk_data/serialization.h"

#include "rlk/log.h"

#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

namespace rlk::data {

namespace {
std::filesystem::path temp_sibling(const std::filesystem::path& path) {
  std::random_device rd;
  std::ostringstream oss;
  oss << "." << path.filename().string() << "." << std::hex << rd() << ".tmp";
  return path.parent_path() / oss.str();
}
} // namespace

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  const auto tmp = temp_sibling(path);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      rlk::log::warn(std::string("failed to write file: ") + path.string());
      return false;
    }
    out << contents;
    if (!out.good()) {
      rlk::log::warn(std::string("short write: ") + path.string());
      out.close();
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    rlk::log::warn(std::string("rename failed for ") + path.string() + ": " + ec.message());
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

bool load_document(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "file not found: " + path.string();
    return false;
  }
  const auto ext = path.extension().string();
  if (ext == ".json") {
    if (!load_json_file(path, out)) {
      error = "invalid json: " + path.string();
      return false;
    }
    return true;
  }
  if (ext == ".yaml" || ext == ".yml") {
    YAML::Node node;
    if (!load_yaml_file(path, node)) {
      error = "invalid yaml: " + path.string();
      return false;
    }
    try {
      out = yaml_to_json(node);
    } catch (const YAML::Exception& e) {
      error = "unsupported yaml in " + path.string() + ": " + e.what();
      rlk::log::warn(error);
      return false;
    }
    return true;
  }
  error = "unsupported extension: " + ext;
  return false;
}

} // namespace rlk::data
