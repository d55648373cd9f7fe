// main.cpp
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>
#include "loom/loom.h"
#include "common/llm/llama_adapter.h"

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <manifest.yaml> <plan.yaml | \"goal\"> [--approve-all] [--config file]\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// 演示用的本地工具
void register_demo_tools(loom::ToolRegistry& registry) {
    registry.register_tool("mcp://notes.list", [](const loom::Value& args) {
        int limit = args.value("limit", 3);
        loom::Value items = loom::Value::array();
        for (int i = 1; i <= limit; ++i) {
            items.push_back({{"id", i}, {"title", "note " + std::to_string(i)}, {"words", 100 * i}});
        }
        return items;
    }, {{"description", "List stored notes"}, {"required", loom::Value::array()}});

    registry.register_tool("mcp://notes.write", [](const loom::Value& args) {
        return loom::Value{{"written", args.value("title", "")}};
    }, {{"description", "Store a note"}, {"required", {"title"}}, {"mutating", true}});
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string manifest_path = argv[1];
    std::string plan_or_goal = argv[2];
    std::string config_path;
    bool approve_all = false;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--approve-all") {
            approve_all = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        // 1. 配置与日志
        loom::LoomConfig config = loom::load_config(config_path);
        config.manifest_path = manifest_path;
        loom::init_logging(config.logging);

        // 2. 工具与沙箱引擎
        loom::ToolRegistry registry;
        register_demo_tools(registry);
        auto tools = registry.list_tools();
        auto engines = loom::make_default_engines(config, std::make_shared<loom::MemoryArtifactStore>(),
                                                  std::set<loom::ToolName>(tools.begin(), tools.end()));

        // 3. 计划文件直接执行，否则交给本地模型规划
        loom::Constraints constraints;
        std::string goal = plan_or_goal;
        std::unique_ptr<loom::LlamaAdapter> llm;
        if (std::filesystem::exists(plan_or_goal)) {
            constraints.plan_document = read_file(plan_or_goal);
            goal = "run plan " + plan_or_goal;
        } else {
            llm = std::make_unique<loom::LlamaAdapter>(loom::LlamaAdapter::config_from(config.llm));
            if (!llm->is_loaded()) {
                std::cerr << "Failed to load LLM model. Please check the path: " << config.llm.model_path << std::endl;
                return 1;
            }
        }

        auto sink = std::make_shared<loom::JsonlRunSummarySink>("run_summaries.jsonl");
        loom::Orchestrator orchestrator(config, engines, registry, llm.get(), sink);

        // 4. 执行
        loom::RunHandle handle = orchestrator.start(goal, constraints);
        std::cout << "Run " << handle.run_id << " planned with " << handle.nodes << " nodes (plan "
                  << handle.plan_hash << ")\n";

        while (orchestrator.status(handle.run_id).in_progress) {
            for (const auto& node : orchestrator.pending_approvals(handle.run_id)) {
                bool approved = approve_all;
                if (!approve_all) {
                    std::cout << "Approve " << node << "? [y/N] " << std::flush;
                    std::string answer;
                    std::getline(std::cin, answer);
                    approved = answer == "y" || answer == "Y";
                }
                orchestrator.approve(handle.run_id, node, approved);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // 5. 输出结果
        loom::RunSummary summary = orchestrator.wait(handle.run_id);
        std::cout << "[" << loom::to_string(summary.outcome) << "]\n" << summary.summary << "\n\n";
        std::cout << "Final state:\n" << summary.state.dump(2) << "\n";
        if (summary.terminating_error) {
            std::cerr << "Terminating error: " << summary.terminating_error->qualified() << " "
                      << summary.terminating_error->message << "\n";
        }

        // 6. 导出 Trace 到文件
        orchestrator.export_trace(handle.run_id, "execution_trace.json");
        std::cout << "Trace exported to execution_trace.json ("
                  << orchestrator.traces(handle.run_id).size() << " spans)\n";

        return summary.outcome == loom::RunOutcome::SUCCEEDED ? 0 : 2;
    } catch (const loom::LoomError& e) {
        std::cerr << "[FATAL] " << e.error().qualified() << " " << e.error().message << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
