#include "rlk_data/serialization.h"

#include "rlk/log.h"

#include <fstream>

namespace rlk::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out) {
  std::ifstream in(path);
  if (!in) {
    rlk::log::warn(std::string("JSON read failed: ") + path.string());
    return false;
  }
  try {
    in >> out;
  } catch (const std::exception& e) {
    rlk::log::warn(std::string("JSON parse failed: ") + e.what());
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node) {
  const std::string text = node.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  if (!write_text_file(path, text + "\n")) {
    rlk::log::warn(std::string("JSON write failed: ") + path.string());
    return false;
  }
  return true;
}

} // namespace rlk::data
