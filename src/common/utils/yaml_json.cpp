// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace loom {

// Helper: check if string is a valid integer
inline bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Helper: float or integer, scientific notation included
inline bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // quoted scalars stay strings ("007", "true")
            if (node.Tag() == "!") return s;

            if (s == "true") return true;
            if (s == "false") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // 超出范围时按字符串处理
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
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
        default:
            return nullptr;
    }
}

nlohmann::json parse_structured_document(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Document is neither JSON nor YAML: " + std::string(e.what()));
    }
}

nlohmann::json load_structured_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_structured_document(buffer.str());
}

} // namespace loom
