// modules/sandbox/script_worker_engine.cpp
#include "modules/sandbox/script_worker_engine.h"
#include "modules/sandbox/envelope_limiter.h"
#include "modules/sandbox/static_check.h"
#include "common/logging/logging.h"
#include "common/utils/framing.h"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>

namespace loom {

namespace {

// 写入已退出的 worker 时不能让宿主进程收到 SIGPIPE
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

struct ActiveWorker {
    explicit ActiveWorker(std::atomic<int>& counter) : counter_(counter) { ++counter_; }
    ~ActiveWorker() { --counter_; }
    std::atomic<int>& counter_;
};

} // namespace

ScriptWorkerEngine::ScriptWorkerEngine(SandboxConfig config, std::shared_ptr<ArtifactStore> artifacts,
                                       std::set<ToolName> tool_surface)
    : config_(std::move(config)), artifacts_(std::move(artifacts)), tool_surface_(std::move(tool_surface)) {
    ignore_sigpipe_once();
}

int64_t ScriptWorkerEngine::wall_clock_ms(const Budget& budget) const {
    if (budget.wall_ms >= 0) return budget.wall_ms;
    return 2 * budget.cpu_ms + config_.wall_grace_ms;
}

SandboxHealth ScriptWorkerEngine::health() const {
    SandboxHealth h;
    h.active_workers = active_.load();
    h.max_workers = config_.max_concurrent_workers;
    if (config_.worker_path.empty()) {
        h.detail = "worker path is not configured";
    } else if (access(config_.worker_path.c_str(), X_OK) != 0) {
        h.detail = "worker binary not executable: " + config_.worker_path;
    } else {
        h.available = true;
        h.detail = h.idle() ? "idle" : "busy";
    }
    return h;
}

nlohmann::json ScriptWorkerEngine::execute_frame(const ExecutionUnit& unit, const ExecutionContext& ctx) const {
    return nlohmann::json{
        {"type", "execute"},
        {"node_id", ctx.node_id},
        {"unit", unit},
        {"inputs", ctx.inputs},
        {"limits", {
            {"max_ops", unit.budget.max_ops},
            {"max_call_depth", config_.script.max_call_depth},
            {"max_collection_size", config_.script.max_collection_size},
            {"max_string_bytes", config_.script.max_string_bytes},
            {"max_frame_bytes", config_.max_frame_bytes}
        }}
    };
}

ExecuteResult ScriptWorkerEngine::execute(const ExecutionUnit& unit, const ExecutionContext& ctx) {
    if (auto rejected = static_check(unit.code, config_.max_source_bytes)) {
        LOOM_LOG_INFO("script rejected before spawn",
                      {StringField("node", ctx.node_id), StringField("error", rejected->qualified())});
        return ExecuteResult::fail(*rejected);
    }
    if (ctx.cancel && ctx.cancel->cancelled()) {
        return ExecuteResult::fail(make_error(ErrorKind::SANDBOX, codes::CANCELLED, "run cancelled"));
    }

    ActiveWorker active(active_);

    WorkerLimits limits;
    limits.cpu_ms = unit.budget.cpu_ms;
    limits.mem_mb = unit.budget.mem_mb;
    limits.max_fds = config_.max_fds;
    limits.isolate_network = config_.isolate_network;
    limits.max_frame_bytes = config_.max_frame_bytes;

    std::unique_ptr<WorkerProcess> process;
    try {
        process = WorkerProcess::spawn(config_.worker_path, limits);
    } catch (const LoomError& e) {
        LOOM_LOG_ERROR("sandbox worker unavailable",
                       {StringField("node", ctx.node_id), StringField("error", e.error().message)});
        return ExecuteResult::fail(e.error());
    }

    const int64_t wall_ms = wall_clock_ms(unit.budget);
    Exchange exchange;
    Watchdog::Cause cause = Watchdog::Cause::NONE;
    {
        Watchdog watchdog(*process, std::chrono::milliseconds(wall_ms), ctx.cancel);
        if (!write_frame(process->input_fd(), execute_frame(unit, ctx))) {
            exchange.violation = true;
            exchange.violation_detail = "worker closed its input before the execute frame";
            watchdog.terminate(Watchdog::Cause::PROTOCOL);
        }
        Exchange talked = converse(*process, watchdog, ctx);
        if (!exchange.violation) exchange = std::move(talked);
        watchdog.disarm();
        cause = watchdog.cause();
    }
    process->close_input();
    WorkerExit exit = process->wait();

    Metrics metrics;
    if (exchange.envelope) metrics = exchange.envelope->metrics;
    metrics.cpu_ms = exit.cpu_ms;
    metrics.mem_mb = exit.max_rss_mb;

    if (exchange.terminal && !exchange.violation) {
        if (exchange.error) {
            return ExecuteResult::fail(*exchange.error, metrics);
        }
        ResultEnvelope envelope = std::move(*exchange.envelope);
        envelope.metrics = metrics;
        const int64_t cap = std::min<int64_t>(unit.budget.max_output_bytes, config_.envelope_cap_bytes);
        if (auto over = enforce_envelope_cap(envelope, cap, unit.budget.token_cap, artifacts_.get())) {
            return ExecuteResult::fail(*over, metrics);
        }
        return ExecuteResult::ok(std::move(envelope));
    }

    Error error = classify_abnormal_exit(cause, exit, unit.budget, exchange);
    LOOM_LOG_WARN("sandbox worker ended abnormally",
                  {StringField("node", ctx.node_id), StringField("error", error.qualified()),
                   IntField("exit_code", exit.exit_code), IntField("signal", exit.signal)});
    return ExecuteResult::fail(std::move(error), metrics);
}

ScriptWorkerEngine::Exchange ScriptWorkerEngine::converse(WorkerProcess& process, Watchdog& watchdog,
                                                          const ExecutionContext& ctx) {
    Exchange exchange;
    FrameDecoder decoder(config_.max_frame_bytes);
    char buffer[64 * 1024];
    bool draining = false; // 已请求终止，只读到 EOF 为止

    auto violate = [&](std::string detail) {
        if (!exchange.violation) {
            exchange.violation = true;
            exchange.violation_detail = std::move(detail);
        }
        watchdog.terminate(Watchdog::Cause::PROTOCOL);
        draining = true;
    };

    while (true) {
        struct pollfd pfd{process.output_fd(), POLLIN, 0};
        int rc = poll(&pfd, 1, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            violate("poll failed on worker channel");
            break;
        }
        ssize_t n = ::read(process.output_fd(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            violate("read failed on worker channel");
            break;
        }
        if (n == 0) {
            if (!draining && exchange.terminal && decoder.has_partial()) {
                exchange.violation = true;
                exchange.violation_detail = "trailing bytes after the final frame";
            }
            break;
        }
        if (draining) continue;

        decoder.feed(buffer, static_cast<size_t>(n));
        nlohmann::json frame;
        while (!draining) {
            FrameStatus status = decoder.next(frame);
            if (status == FrameStatus::NEED_MORE) break;
            if (status == FrameStatus::TOO_LARGE) {
                violate("frame above " + std::to_string(config_.max_frame_bytes) + " bytes");
                break;
            }
            if (status == FrameStatus::MALFORMED) {
                violate("malformed frame");
                break;
            }
            if (!handle_frame(frame, process, ctx, exchange)) {
                violate(exchange.violation_detail.empty()
                            ? "unexpected frame '" + frame.value("type", std::string()) + "'"
                            : exchange.violation_detail);
            }
        }
    }
    return exchange;
}

bool ScriptWorkerEngine::handle_frame(const nlohmann::json& frame, WorkerProcess& process,
                                      const ExecutionContext& ctx, Exchange& exchange) {
    auto type_field = frame.find("type");
    if (type_field == frame.end() || !type_field->is_string()) {
        exchange.violation_detail = "frame without a type";
        return false;
    }
    const std::string type = type_field->get<std::string>();
    if (exchange.terminal) {
        exchange.violation_detail = "frame '" + type + "' after the final frame";
        return false;
    }

    try {
        if (type == "tool_call") {
            const auto& id = frame.at("id");
            const ToolName tool = frame.at("tool").get<std::string>();
            const Value args = frame.value("args", Value::object());

            ToolCallResult result;
            if (!ctx.invoke_tool) {
                result = ToolCallResult::failure(make_error(ErrorKind::POLICY, codes::CAPABILITY_DENIED,
                                                            "no tools are available to this unit"));
            } else {
                try {
                    result = ctx.invoke_tool(tool, args);
                } catch (const LoomError& e) {
                    result = ToolCallResult::failure(e.error());
                } catch (const std::exception& e) {
                    result = ToolCallResult::failure(tool_error(codes::UPSTREAM, e.what()));
                }
            }

            nlohmann::json reply = {{"type", "tool_result"}, {"id", id}, {"ok", result.ok}};
            if (result.ok) {
                reply["result"] = result.result;
            } else {
                reply["error"] = result.error.value_or(tool_error(codes::UPSTREAM, "tool call failed"));
            }
            if (!write_frame(process.input_fd(), reply)) {
                exchange.violation_detail = "worker closed its input during a tool call";
                return false;
            }
            return true;
        }
        if (type == "result") {
            exchange.envelope = frame.at("envelope").get<ResultEnvelope>();
            exchange.terminal = true;
            return true;
        }
        if (type == "error") {
            exchange.error = frame.at("error").get<Error>();
            if (frame.contains("metrics")) {
                ResultEnvelope partial;
                partial.metrics = frame.at("metrics").get<Metrics>();
                exchange.envelope = std::move(partial);
            }
            exchange.terminal = true;
            return true;
        }
    } catch (const nlohmann::json::exception& e) {
        exchange.violation_detail = "bad '" + type + "' frame: " + e.what();
        return false;
    }
    return false;
}

Error ScriptWorkerEngine::classify_abnormal_exit(Watchdog::Cause cause, const WorkerExit& exit,
                                                 const Budget& budget, const Exchange& exchange) const {
    switch (cause) {
        case Watchdog::Cause::TIMEOUT:
            return make_error(ErrorKind::BUDGET, codes::CPU_LIMIT,
                              "wall clock of " + std::to_string(wall_clock_ms(budget)) + " ms exceeded");
        case Watchdog::Cause::CANCELLED:
            return make_error(ErrorKind::SANDBOX, codes::CANCELLED, "worker terminated by cancellation");
        case Watchdog::Cause::PROTOCOL:
        case Watchdog::Cause::NONE:
            break;
    }
    if (exchange.violation) {
        return make_error(ErrorKind::SANDBOX, codes::PROC_CRASH,
                          "protocol violation: " + exchange.violation_detail);
    }
    if (exit.signal == SIGXCPU || (exit.signal == SIGKILL && exit.cpu_ms >= budget.cpu_ms)) {
        return make_error(ErrorKind::BUDGET, codes::CPU_LIMIT,
                          "cpu time limit of " + std::to_string(budget.cpu_ms) + " ms exceeded");
    }
    if (exit.signal != 0) {
        return make_error(ErrorKind::SANDBOX, codes::PROC_CRASH,
                          "worker killed by signal " + std::to_string(exit.signal));
    }
    return make_error(ErrorKind::SANDBOX, codes::PROC_CRASH,
                      "worker exited with code " + std::to_string(exit.exit_code) + " before a result");
}

} // namespace loom
