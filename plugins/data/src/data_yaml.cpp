#include "rlk_data/serialization.h"

#include "rlk/log.h"

namespace rlk::data {

namespace {
nlohmann::json scalar_to_json(const YAML::Node& node) {
  // Quoted scalars carry the "!" tag and stay strings.
  if (node.Tag() == "!") {
    return node.Scalar();
  }
  bool b = false;
  if (YAML::convert<bool>::decode(node, b)) {
    return b;
  }
  long long i = 0;
  if (YAML::convert<long long>::decode(node, i)) {
    return i;
  }
  double d = 0.0;
  if (YAML::convert<double>::decode(node, d)) {
    return d;
  }
  return node.Scalar();
}
} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Scalar:
      return scalar_to_json(node);
    case YAML::NodeType::Sequence: {
      nlohmann::json arr = nlohmann::json::array();
      for (const auto& child : node) {
        arr.push_back(yaml_to_json(child));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      nlohmann::json obj = nlohmann::json::object();
      for (const auto& kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
  }
  return nullptr;
}

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out) {
  try {
    out = YAML::LoadFile(path.string());
    return true;
  } catch (const std::exception& e) {
    rlk::log::warn(std::string("YAML load failed: ") + e.what());
    return false;
  }
}

} // namespace rlk::data
