// modules/planner/planner.cpp
#include "modules/planner/planner.h"
#include "modules/policy/policy_gate.h"
#include "modules/script/lexer.h"
#include "common/logging/logging.h"
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <map>
#include <set>

namespace loom {

namespace {

constexpr const char* kScriptEngine = "script";

const char* kPlanPrompt = R"(You are the planner of a sandboxed task runner.
Goal: {{ goal }}

Tools you may use:
{% for tool in tools %}- {{ tool }}
{% endfor %}
Inputs (visible to templates as inputs.*): {{ inputs }}

Write a plan as a YAML document with a top-level "nodes" list. Each node has
id, deps, allowed_tools, params, code and optionally idempotent and mutating.
Code is a small script: let, if/else, while, for x in xs, fn, return;
call(tool, args) invokes a tool listed in allowed_tools; set_state(key, value)
publishes a value to later nodes, which read it from state; summary(text)
sets the node summary.
Prefer a single node that transforms data locally over several tool calls.
Mark a node mutating: true when it changes external state.
{% if max_nodes >= 0 %}Use at most {{ max_nodes }} nodes.
{% endif %}Answer with the YAML inside a ```yaml fence and nothing else.
)";

const char* kReplanPrompt = R"(A node of a running plan failed and must be replaced.
Goal: {{ goal }}
Failed node: {{ failed_node }} ({{ error }})
Completed nodes you may depend on: {% for id in completed %}{{ id }} {% endfor %}
Current state: {{ state }}

Tools you may use:
{% for tool in tools %}- {{ tool }}
{% endfor %}
Do not repeat the failed node unchanged.
{% if max_nodes >= 0 %}Use at most {{ max_nodes }} nodes.
{% endif %}Answer with a YAML "nodes" list inside a ```yaml fence and nothing else.
)";

Error plan_invalid(const std::string& message) {
    return make_error(ErrorKind::CODE, codes::PLAN_INVALID, message);
}

struct CodeShape {
    bool parsed = false;
    bool declares_functions = false;
    bool returns = false;
    bool sets_summary = false;
};

CodeShape inspect(const std::string& code) {
    CodeShape shape;
    std::vector<script::Token> tokens;
    try {
        tokens = script::tokenize(code);
    } catch (const LoomError&) {
        // 无法词法分析的脚本不参与融合，运行前的静态检查会报告它
        return shape;
    }
    shape.parsed = true;
    for (const auto& t : tokens) {
        if (t.type == script::TokenType::FN) shape.declares_functions = true;
        if (t.type == script::TokenType::RETURN) shape.returns = true;
        if (t.type == script::TokenType::IDENT && t.text == "summary") shape.sets_summary = true;
    }
    return shape;
}

bool local_transform(const NodeSpec& n) {
    return !n.is_approval() && n.unit.engine == kScriptEngine && n.unit.allowed_tools.empty() && !n.mutating;
}

Budget combined_budget(const Budget& a, const Budget& b) {
    Budget out;
    out.cpu_ms = a.cpu_ms + b.cpu_ms;
    out.mem_mb = std::max(a.mem_mb, b.mem_mb);
    out.max_ops = a.max_ops + b.max_ops;
    out.max_output_bytes = std::max(a.max_output_bytes, b.max_output_bytes);
    out.token_cap = std::max(a.token_cap, b.token_cap);
    out.wall_ms = (a.wall_ms < 0 || b.wall_ms < 0) ? -1 : a.wall_ms + b.wall_ms;
    return out;
}

int unit_count(const std::vector<NodeSpec>& nodes) {
    return static_cast<int>(std::count_if(nodes.begin(), nodes.end(),
                                          [](const NodeSpec& n) { return !n.is_approval(); }));
}

} // namespace

Planner::Planner(const EngineRegistry& engines, CompletionProvider* completion, Budget fallback_budget)
    : engines_(engines), completion_(completion), fallback_budget_(fallback_budget) {}

Budget Planner::default_budget(const Constraints& constraints) const {
    return constraints.default_budget.value_or(fallback_budget_);
}

nlohmann::json Planner::tool_catalog(const Constraints& constraints, const CapabilityManifest& manifest) const {
    const CapabilityManifest effective = manifest.with_denied(constraints.disallowed_tools);
    std::set<ToolName> tools;
    for (const auto& name : engines_.names()) {
        auto engine = engines_.find(name);
        if (!engine) continue;
        for (const auto& tool : engine->capabilities()) {
            if (PolicyGate::decide(CapabilityRequest{tool, false, {}}, effective)) {
                tools.insert(tool);
            }
        }
    }
    return nlohmann::json(tools);
}

Plan Planner::plan(const std::string& goal, const Constraints& constraints,
                   const CapabilityManifest& manifest) const {
    const nlohmann::json catalog = tool_catalog(constraints, manifest);
    std::vector<NodeSpec> nodes = shape(draft(goal, constraints, catalog), constraints);
    validate(nodes, constraints, manifest);

    Plan plan(std::move(nodes));
    LOOM_LOG_INFO("plan ready", {IntField("nodes", static_cast<int64_t>(plan.size())),
                                 StringField("plan_hash", plan.hash())});
    return plan;
}

std::vector<NodeSpec> Planner::draft(const std::string& goal, const Constraints& constraints,
                                     const nlohmann::json& catalog) const {
    PlanParser parser(default_budget(constraints));
    if (constraints.plan_document) {
        return parser.parse_from_string(*constraints.plan_document);
    }
    if (!completion_) {
        throw LoomError(plan_invalid("no plan document given and no completion provider configured"));
    }
    return parser.parse_from_string(ask(build_prompt(goal, constraints, catalog)));
}

std::string Planner::ask(const std::string& prompt) const {
    CompletionConstraints cc;
    cc.max_tokens = 1024;
    try {
        return completion_->complete(prompt, cc);
    } catch (const LoomError&) {
        throw;
    } catch (const std::exception& e) {
        throw LoomError(plan_invalid(std::string("completion failed: ") + e.what()));
    }
}

std::string Planner::build_prompt(const std::string& goal, const Constraints& constraints,
                                  const nlohmann::json& catalog) const {
    nlohmann::json data = {
        {"goal", goal},
        {"tools", catalog},
        {"inputs", constraints.inputs.dump()},
        {"max_nodes", constraints.max_plan_nodes}
    };
    return InjaTemplateRenderer::render(kPlanPrompt, data);
}

std::string Planner::build_replan_prompt(const ReplanRequest& request, const nlohmann::json& catalog) const {
    nlohmann::json data = {
        {"goal", request.goal},
        {"failed_node", request.failed_node},
        {"error", request.error.qualified()},
        {"completed", request.completed},
        {"state", request.state.dump()},
        {"tools", catalog},
        {"max_nodes", request.remaining_nodes}
    };
    return InjaTemplateRenderer::render(kReplanPrompt, data);
}

std::vector<NodeSpec> Planner::shape(std::vector<NodeSpec> nodes, const Constraints& constraints) const {
    if (constraints.max_node_budget) {
        for (auto& n : nodes) {
            n.unit.budget = n.unit.budget.clamped_to(*constraints.max_node_budget);
        }
    }
    nodes = fuse_local_chains(std::move(nodes));
    if (constraints.max_node_budget) {
        for (auto& n : nodes) {
            n.unit.budget = n.unit.budget.clamped_to(*constraints.max_node_budget);
        }
    }
    return insert_approvals(std::move(nodes));
}

// A -> B where both are tool-free, non-mutating scripts, B depends only on A
// and A feeds only B: B's code becomes "{A}\n{B}" and A disappears. A must
// not return, declare functions or set a summary; B must not declare
// functions. set_state in A stays visible to B through state.
std::vector<NodeSpec> Planner::fuse_local_chains(std::vector<NodeSpec> nodes) const {
    bool changed = true;
    while (changed) {
        changed = false;
        std::map<NodeId, size_t> index;
        std::map<NodeId, int> fan_out;
        for (size_t i = 0; i < nodes.size(); ++i) index[nodes[i].id] = i;
        for (const auto& n : nodes) {
            for (const auto& d : n.deps) ++fan_out[d];
        }

        for (size_t i = 0; i < nodes.size(); ++i) {
            NodeSpec& b = nodes[i];
            if (b.deps.size() != 1 || !local_transform(b)) continue;
            auto it = index.find(b.deps.front());
            if (it == index.end()) continue;
            const NodeSpec& a = nodes[it->second];
            if (!local_transform(a) || fan_out[a.id] != 1) continue;
            if (a.unit.params != b.unit.params || a.generation != b.generation) continue;

            CodeShape up = inspect(a.unit.code);
            CodeShape down = inspect(b.unit.code);
            if (!up.parsed || !down.parsed) continue;
            if (up.declares_functions || up.returns || up.sets_summary || down.declares_functions) continue;

            LOOM_LOG_DEBUG("fusing local transforms", {StringField("upstream", a.id), StringField("node", b.id)});
            b.unit.code = "{\n" + a.unit.code + "\n}\n{\n" + b.unit.code + "\n}\n";
            b.unit.budget = combined_budget(a.unit.budget, b.unit.budget);
            b.deps = a.deps;
            b.idempotent = a.idempotent && b.idempotent;
            if (!a.description.empty()) {
                b.description = b.description.empty() ? a.description : a.description + "; " + b.description;
            }
            nodes.erase(nodes.begin() + static_cast<std::ptrdiff_t>(it->second));
            changed = true;
            break;
        }
    }
    return nodes;
}

std::vector<NodeSpec> Planner::insert_approvals(std::vector<NodeSpec> nodes) const {
    std::set<NodeId> approvals;
    for (const auto& n : nodes) {
        if (n.is_approval()) approvals.insert(n.id);
    }

    std::vector<NodeSpec> added;
    for (auto& n : nodes) {
        if (n.is_approval() || !n.mutating) continue;
        bool gated = std::any_of(n.deps.begin(), n.deps.end(),
                                 [&](const NodeId& d) { return approvals.count(d) > 0; });
        if (gated) continue;

        NodeSpec approval;
        approval.id = kApprovalPrefix + n.id;
        approval.kind = NodeKind::APPROVAL;
        approval.deps = n.deps;
        approval.description = "approve write by " + n.id;
        approval.generation = n.generation;
        approval.unit.engine.clear();
        approval.unit.params = Value{{"node", n.id}, {"write_fields", n.write_fields}};

        n.deps.push_back(approval.id);
        approvals.insert(approval.id);
        added.push_back(std::move(approval));
    }
    for (auto& a : added) nodes.push_back(std::move(a));
    return nodes;
}

void Planner::validate(const std::vector<NodeSpec>& nodes, const Constraints& constraints,
                       const CapabilityManifest& manifest) const {
    if (nodes.empty()) {
        throw LoomError(plan_invalid("plan has no nodes"));
    }
    if (constraints.max_plan_nodes >= 0 && unit_count(nodes) > constraints.max_plan_nodes) {
        throw LoomError(plan_invalid("plan has " + std::to_string(unit_count(nodes)) +
                                     " nodes, limit is " + std::to_string(constraints.max_plan_nodes)));
    }

    const CapabilityManifest effective = manifest.with_denied(constraints.disallowed_tools);
    for (const auto& n : nodes) {
        if (n.is_approval()) continue;
        auto engine = engines_.find(n.unit.engine);
        if (!engine) {
            throw LoomError(plan_invalid("node '" + n.id + "' needs unknown engine '" + n.unit.engine + "'"));
        }
        const std::set<ToolName> surface = engine->capabilities();
        for (const auto& tool : n.unit.allowed_tools) {
            if (!surface.count(tool)) {
                throw LoomError(plan_invalid("node '" + n.id + "' needs tool '" + tool +
                                             "' which engine '" + n.unit.engine + "' cannot expose"));
            }
            Decision d = PolicyGate::decide(CapabilityRequest{tool, false, {}}, effective);
            if (!d) {
                throw LoomError(plan_invalid("node '" + n.id + "' needs tool '" + tool +
                                             "' denied by policy: " + d.reason->message));
            }
        }
    }
}

std::vector<NodeSpec> Planner::replan(const ReplanRequest& request, const Constraints& constraints,
                                      const CapabilityManifest& manifest) const {
    if (!completion_) return {};

    const nlohmann::json catalog = tool_catalog(constraints, manifest);
    PlanParser parser(default_budget(constraints));
    std::vector<NodeSpec> nodes = parser.parse_from_string(ask(build_replan_prompt(request, catalog)));

    const std::string prefix = "r" + std::to_string(request.generation) + ".";
    std::set<NodeId> fresh;
    for (const auto& n : nodes) fresh.insert(n.id);
    const std::set<NodeId> completed(request.completed.begin(), request.completed.end());

    for (auto& n : nodes) {
        if (!n.is_approval() && n.unit.code == request.failed_unit.code &&
            n.unit.params == request.failed_unit.params) {
            throw LoomError(plan_invalid("re-plan repeats failed node '" + request.failed_node + "'"));
        }
        n.id = prefix + n.id;
        n.generation = request.generation;
        for (auto& d : n.deps) {
            if (fresh.count(d)) {
                d = prefix + d;
            } else if (!completed.count(d)) {
                throw LoomError(plan_invalid("re-plan node '" + n.id + "' depends on unavailable node '" + d + "'"));
            }
        }
    }

    Constraints bounded = constraints;
    if (request.remaining_nodes >= 0 &&
        (bounded.max_plan_nodes < 0 || request.remaining_nodes < bounded.max_plan_nodes)) {
        bounded.max_plan_nodes = request.remaining_nodes;
    }
    nodes = shape(std::move(nodes), bounded);
    validate(nodes, bounded, manifest);

    LOOM_LOG_INFO("re-plan ready", {StringField("failed", request.failed_node),
                                    IntField("generation", request.generation),
                                    IntField("nodes", static_cast<int64_t>(nodes.size()))});
    return nodes;
}

} // namespace loom
