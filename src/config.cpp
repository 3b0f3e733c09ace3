#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace grpr {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Plain scalars become booleans or integers when they parse completely as
 * such, otherwise strings.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    // Quoted scalars carry the non-specific "!" tag and stay strings.
    if (node.Tag() == "!") {
      return s;
    }
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size() && std::to_string(i) == s)
        return i;
    } catch (const std::logic_error &) {
      // not an integer
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Copy the source text of list-of-string keys over their converted values.
 *
 * Tool arguments must reach the tool exactly as written, so `010`, `+5` or
 * `True` are not normalised through the integer and boolean conversion.
 * Applies to the top level and to each grouping section.
 *
 * @param node Parsed YAML document.
 * @param j JSON produced by yaml_to_json() for @p node.
 */
void keep_yaml_list_text(const YAML::Node &node, nlohmann::json &j) {
  if (!node.IsMap() || !j.is_object()) {
    return;
  }
  for (const std::string key : {"default_args", "markers"}) {
    const YAML::Node value = node[key];
    if (!value.IsDefined()) {
      continue;
    }
    if (value.IsScalar()) {
      j[key] = value.Scalar();
    } else if (value.IsSequence()) {
      nlohmann::json items = nlohmann::json::array();
      for (const auto &item : value) {
        items.push_back(item.IsScalar() ? nlohmann::json(item.Scalar())
                                        : yaml_to_json(item));
      }
      j[key] = items;
    }
  }
  for (const std::string section :
       {"core", "discovery", "dispatch", "logging"}) {
    auto it = j.find(section);
    if (it != j.end()) {
      keep_yaml_list_text(node[section], *it);
    }
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };
  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());
  return nullptr;
}

/**
 * Flatten the optional grouping sections into the top level.
 *
 * Keys may be written either at the top level or under `core`, `discovery`,
 * `dispatch` or `logging`; section values win over top-level ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name : {"core", "discovery", "dispatch", "logging"}) {
    auto it = source.find(std::string{name});
    if (it == source.end() || !it->is_object()) {
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

/**
 * Read a list of strings, accepting a single string as a one-element list.
 *
 * Numbers and booleans written in JSON or TOML are stringified.
 */
std::vector<std::string> string_list(const nlohmann::json &value,
                                     const std::string &key) {
  std::vector<std::string> out;
  auto add = [&out, &key](const nlohmann::json &item) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    } else if (item.is_number() || item.is_boolean()) {
      out.push_back(item.dump());
    } else {
      throw std::runtime_error("Config key '" + key +
                               "' must contain only strings");
    }
  };
  if (value.is_array()) {
    for (const auto &item : value) {
      add(item);
    }
  } else {
    add(value);
  }
  return out;
}

} // namespace

void Config::set_markers(const std::vector<std::string> &markers) {
  markers_.clear();
  std::copy_if(markers.begin(), markers.end(), std::back_inserter(markers_),
               [](const std::string &m) { return !m.empty(); });
}

void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("dry_run")) {
    set_dry_run(cfg["dry_run"].get<bool>());
  }
  if (cfg.contains("tool")) {
    auto tool = cfg["tool"].get<std::string>();
    if (tool.empty()) {
      throw std::runtime_error("Config key 'tool' must not be empty");
    }
    set_tool(tool);
  }
  if (cfg.contains("default_args")) {
    set_default_args(string_list(cfg["default_args"], "default_args"));
  }
  if (cfg.contains("markers")) {
    set_markers(string_list(cfg["markers"], "markers"));
    if (markers_.empty()) {
      throw std::runtime_error("Config key 'markers' must name a marker");
    }
  }
  if (cfg.contains("accept_marker_files")) {
    set_accept_marker_files(cfg["accept_marker_files"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    const auto &categories = cfg["log_categories"];
    if (!categories.is_object()) {
      throw std::runtime_error(
          "Config key 'log_categories' must map names to levels");
    }
    std::unordered_map<std::string, std::string> levels;
    for (const auto &[name, level] : categories.items()) {
      levels[name] = level.get<std::string>();
    }
    set_log_categories(levels);
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  nlohmann::json j;
  Config cfg;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
      keep_yaml_list_text(node, j);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext_lower == "toml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
    cfg.load_json(j);
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  config_log()->debug("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace grpr
