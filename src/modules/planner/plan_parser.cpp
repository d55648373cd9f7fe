// modules/planner/plan_parser.cpp
#include "modules/planner/plan_parser.h"
#include "common/utils/yaml_json.h"
#include "core/types/error.h"
#include <fstream>
#include <regex>
#include <sstream>

namespace loom {

namespace {

Error plan_invalid(const std::string& message) {
    return make_error(ErrorKind::CODE, codes::PLAN_INVALID, message);
}

std::vector<std::string> string_list(const nlohmann::json& node_json, const char* key, const std::string& id) {
    std::vector<std::string> out;
    if (!node_json.contains(key) || node_json[key].is_null()) return out;
    const auto& v = node_json[key];
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) {
        throw LoomError(plan_invalid(std::string("'") + key + "' must be a string or list in node: " + id));
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw LoomError(plan_invalid(std::string("'") + key + "' entries must be strings in node: " + id));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::string extract_fenced_block(const std::string& text) {
    // ```yaml / ```json / ``` 代码块
    static const std::regex fence(R"(```[ \t]*(?:yaml|yml|json)?[ \t]*\r?\n([\s\S]*?)\r?\n[ \t]*```)",
                                  std::regex::ECMAScript | std::regex::icase);
    std::smatch match;
    if (std::regex_search(text, match, fence)) {
        return match[1].str();
    }
    return text;
}

std::vector<NodeSpec> PlanParser::parse_from_string(const std::string& text) const {
    nlohmann::json doc;
    try {
        doc = parse_structured_document(extract_fenced_block(text));
    } catch (const std::exception& e) {
        throw LoomError(plan_invalid(std::string("unreadable plan document: ") + e.what()));
    }
    return parse_document(doc);
}

std::vector<NodeSpec> PlanParser::parse_from_file(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw LoomError(plan_invalid("cannot open plan file: " + file_path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

std::vector<NodeSpec> PlanParser::parse_document(const nlohmann::json& doc) const {
    const nlohmann::json* nodes = nullptr;
    if (doc.is_array()) {
        nodes = &doc;
    } else if (doc.is_object() && doc.contains("nodes") && doc["nodes"].is_array()) {
        nodes = &doc["nodes"];
    }
    if (!nodes) {
        throw LoomError(plan_invalid("plan document needs a 'nodes' list"));
    }

    std::vector<NodeSpec> specs;
    specs.reserve(nodes->size());
    for (const auto& node_json : *nodes) {
        try {
            specs.push_back(create_node_from_json(node_json));
        } catch (const nlohmann::json::exception& e) {
            throw LoomError(plan_invalid(std::string("malformed plan node: ") + e.what()));
        }
    }
    return specs;
}

NodeSpec PlanParser::create_node_from_json(const nlohmann::json& node_json) const {
    if (!node_json.is_object()) {
        throw LoomError(plan_invalid("plan node must be a mapping"));
    }
    NodeSpec spec;
    spec.id = node_json.value("id", std::string());
    if (spec.id.empty()) {
        throw LoomError(plan_invalid("plan node missing 'id'"));
    }

    try {
        spec.kind = node_kind_from_string(node_json.value("kind", std::string("unit")));
    } catch (const std::exception& e) {
        throw LoomError(plan_invalid(std::string(e.what()) + " in node: " + spec.id));
    }
    spec.deps = string_list(node_json, "deps", spec.id);
    spec.write_fields = string_list(node_json, "write_fields", spec.id);
    spec.unit.allowed_tools = string_list(node_json, "allowed_tools", spec.id);
    spec.idempotent = node_json.value("idempotent", false);
    spec.mutating = node_json.value("mutating", false);
    spec.description = node_json.value("description", std::string());

    spec.unit.engine = node_json.value("engine", std::string("script"));
    spec.unit.code = node_json.value("code", std::string());
    spec.unit.params = node_json.value("params", nlohmann::json::object());
    if (!spec.unit.params.is_object()) {
        throw LoomError(plan_invalid("'params' must be a mapping in node: " + spec.id));
    }
    spec.unit.budget = budget_from_json(node_json.value("budget", nlohmann::json()), default_budget_);

    if (!spec.is_approval() && spec.unit.code.empty()) {
        throw LoomError(plan_invalid("node has no code: " + spec.id));
    }
    return spec;
}

} // namespace loom
