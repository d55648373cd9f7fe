#ifndef LOOM_COMMON_UTILS_YAML_JSON_H
#define LOOM_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace loom {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a JSON or YAML document (JSON is tried first). Throws std::runtime_error.
nlohmann::json parse_structured_document(const std::string& text);

// Reads a file and parses it with parse_structured_document
nlohmann::json load_structured_file(const std::string& path);

} // namespace loom

#endif // LOOM_COMMON_UTILS_YAML_JSON_H
