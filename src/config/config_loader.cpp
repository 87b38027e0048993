#include "config/config_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace ccwc {

namespace {

CountConfig apply_node(const YAML::Node& root, CountConfig cfg) {
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) {
    throw std::runtime_error("config: top level must be a mapping");
  }

  const YAML::Node counting = root["counting"];
  if (!counting) return cfg;
  if (!counting.IsMap()) {
    throw std::runtime_error("config: 'counting' must be a mapping");
  }

  if (counting["buffer_size"]) {
    const long long size = counting["buffer_size"].as<long long>();
    if (size < 0) {
      throw std::runtime_error("config: buffer_size must be >= 0");
    }
    cfg.chunk_size = static_cast<std::size_t>(size);
  }
  if (counting["encoding"]) {
    cfg.encoding = counting["encoding"].as<std::string>();
  }
  if (counting["whitespace"]) {
    try {
      cfg.whitespace = parse_whitespace_mode(counting["whitespace"].as<std::string>());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(std::string("config: ") + e.what());
    }
  }
  return cfg;
}

}  // namespace

CountConfig load_count_config(const std::string& path, const CountConfig& base) {
  try {
    return apply_node(YAML::LoadFile(path), base);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: cannot load " + path + ": " + e.what());
  }
}

CountConfig parse_count_config(const std::string& yaml_text, const CountConfig& base) {
  try {
    return apply_node(YAML::Load(yaml_text), base);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
}

std::vector<std::string> list_config_files(const std::string& dir) {
  namespace fs = std::filesystem;
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec)) continue;
    const auto ext = entry.path().extension().string();
    if (ext == ".yaml" || ext == ".yml") {
      out.push_back(entry.path().filename().string());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace ccwc
