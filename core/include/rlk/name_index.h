#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace rlk {

struct IndexCollision {
  std::string key;
  std::filesystem::path replaced;
  std::filesystem::path kept;
};

// Normalized filename -> absolute path. Later inserts overwrite earlier ones
// for the same key; every overwrite is kept in collisions().
class NameIndex {
 public:
  void insert(const std::string& key, const std::filesystem::path& path);
  const std::filesystem::path* find(const std::string& key) const;

  // Keys in first-insertion order.
  const std::vector<std::string>& keys() const { return keys_; }
  const std::vector<IndexCollision>& collisions() const { return collisions_; }
  size_t size() const { return paths_.size(); }
  bool empty() const { return paths_.empty(); }

 private:
  std::unordered_map<std::string, std::filesystem::path> paths_;
  std::vector<std::string> keys_;
  std::vector<IndexCollision> collisions_;
};

// Recursive walk of every root that is a directory; other roots are skipped.
NameIndex build_index(const std::vector<std::filesystem::path>& root_folders);

} // namespace rlk
