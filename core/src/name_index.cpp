#include "rlk/name_index.h"

#include "rlk/log.h"
#include "rlk/text.h"

#include <system_error>

namespace rlk {

namespace fs = std::filesystem;

void NameIndex::insert(const std::string& key, const fs::path& path) {
  auto it = paths_.find(key);
  if (it == paths_.end()) {
    paths_.emplace(key, path);
    keys_.push_back(key);
    return;
  }
  if (it->second != path) {
    collisions_.push_back({key, it->second, path});
  }
  it->second = path;
}

const fs::path* NameIndex::find(const std::string& key) const {
  auto it = paths_.find(key);
  if (it == paths_.end()) return nullptr;
  return &it->second;
}

NameIndex build_index(const std::vector<fs::path>& root_folders) {
  NameIndex index;
  for (const auto& root : root_folders) {
    std::error_code ec;
    if (!fs::is_directory(root, ec) || ec) {
      log::debug("index root skipped: " + root.string());
      continue;
    }
    const fs::path abs_root = fs::absolute(root, ec);
    const fs::path walk_root = ec ? root : abs_root;
    size_t files = 0;
    fs::recursive_directory_iterator it(walk_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      log::warn("index walk failed for " + root.string() + ": " + ec.message());
      continue;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        log::warn("index walk error under " + root.string() + ": " + ec.message());
        break;
      }
      std::error_code type_ec;
      if (!it->is_regular_file(type_ec) || type_ec) continue;
      index.insert(text::normalize(it->path().filename().string()), it->path());
      ++files;
    }
    log::info("indexed " + std::to_string(files) + " files under " + walk_root.string());
  }
  return index;
}

} // namespace rlk
