// worker/worker_main.cpp
// loom_worker: runs one execution unit per process. stdin/stdout carry the
// framed protocol, stderr carries diagnostics only.
#include "common/config/loom_config.h"
#include "common/logging/logging.h"
#include "common/utils/framing.h"
#include "core/types/error.h"
#include "core/types/plan.h"
#include "core/types/result.h"
#include "modules/script/interpreter.h"
#include "modules/script/parser.h"

#include <unistd.h>

#if defined(__linux__)
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <cstddef>
#endif

#include <cerrno>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitProtocol = 2;

// The host went away or answered out of protocol while a tool call was pending
class ChannelClosed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#if defined(__linux__) && (defined(__x86_64__) || defined(__aarch64__))

#if defined(__x86_64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#else
constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#endif

std::vector<int> denied_syscalls() {
    std::vector<int> nrs = {
        __NR_socket, __NR_socketpair, __NR_connect, __NR_bind, __NR_listen, __NR_accept4,
        __NR_execve, __NR_execveat, __NR_ptrace, __NR_openat, __NR_unlinkat, __NR_renameat2,
        __NR_mkdirat, __NR_fchmodat, __NR_kill, __NR_mount, __NR_chroot, __NR_setuid,
        __NR_setgid, __NR_prlimit64, __NR_setrlimit, __NR_unshare
    };
#ifdef __NR_accept
    nrs.push_back(__NR_accept);
#endif
#ifdef __NR_fork
    nrs.push_back(__NR_fork);
#endif
#ifdef __NR_vfork
    nrs.push_back(__NR_vfork);
#endif
#ifdef __NR_open
    nrs.push_back(__NR_open);
#endif
#ifdef __NR_creat
    nrs.push_back(__NR_creat);
#endif
#ifdef __NR_unlink
    nrs.push_back(__NR_unlink);
#endif
#ifdef __NR_rename
    nrs.push_back(__NR_rename);
#endif
#ifdef __NR_renameat
    nrs.push_back(__NR_renameat);
#endif
#ifdef __NR_mkdir
    nrs.push_back(__NR_mkdir);
#endif
#ifdef __NR_chmod
    nrs.push_back(__NR_chmod);
#endif
#ifdef __NR_openat2
    nrs.push_back(__NR_openat2);
#endif
    return nrs;
}

// Denylist filter: listed syscalls fail with EPERM, a foreign arch kills
bool install_syscall_filter() {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return false;

    const std::vector<int> denied = denied_syscalls();
    std::vector<sock_filter> filter;
    filter.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0));
    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL));
    filter.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
    for (int nr : denied) {
        filter.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1));
        filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));
    }
    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog;
    prog.len = static_cast<unsigned short>(filter.size());
    prog.filter = filter.data();
    return prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == 0;
}

#else

bool install_syscall_filter() { return false; }

#endif

loom::script::InterpreterLimits limits_from(const nlohmann::json& j) {
    loom::script::InterpreterLimits limits;
    limits.max_ops = j.value("max_ops", limits.max_ops);
    limits.max_call_depth = j.value("max_call_depth", limits.max_call_depth);
    limits.max_collection_size = j.value("max_collection_size", limits.max_collection_size);
    limits.max_string_bytes = j.value("max_string_bytes", limits.max_string_bytes);
    return limits;
}

nlohmann::json error_frame(const loom::Error& error, int64_t operations, int64_t tool_calls) {
    loom::Metrics metrics;
    metrics.operation_count = operations;
    metrics.tool_call_count = tool_calls;
    return nlohmann::json{{"type", "error"}, {"error", error}, {"metrics", metrics}};
}

class WorkerSession {
public:
    explicit WorkerSession(uint32_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

    nlohmann::json run(const nlohmann::json& request) {
        using namespace loom;

        std::unique_ptr<script::Interpreter> interpreter;
        try {
            ExecutionUnit unit = request.at("unit").get<ExecutionUnit>();
            const Value inputs = request.value("inputs", Value::object());

            script::Program program = script::parse_source(unit.code);

            script::HostBindings host;
            host.call_tool = [this](const ToolName& tool, const Value& args) { return call_tool(tool, args); };
            interpreter = std::make_unique<script::Interpreter>(
                limits_from(request.value("limits", nlohmann::json::object())), std::move(host));

            script::ScriptOutcome outcome =
                interpreter->run(program, inputs.value("params", Value::object()),
                                 inputs.value("state", Value::object()));

            ResultEnvelope envelope;
            if (outcome.summary) {
                envelope.summary = *outcome.summary;
            } else if (!outcome.return_value.is_null()) {
                envelope.summary = script::to_display_string(outcome.return_value);
            }
            envelope.state_updates = std::move(outcome.state_updates);
            envelope.metrics.operation_count = outcome.operations;
            envelope.metrics.tool_call_count = outcome.tool_calls;
            nlohmann::json reply{{"type", "result"}, {"envelope", envelope}};
            // 超过帧上限的结果宿主无法读取，这里直接报 OUTPUT_LIMIT
            const size_t reply_bytes = reply.dump().size();
            if (reply_bytes > max_frame_bytes_) {
                return error_frame(make_error(ErrorKind::BUDGET, codes::OUTPUT_LIMIT,
                                              "result of " + std::to_string(reply_bytes) +
                                                  " bytes exceeds the frame limit of " +
                                                  std::to_string(max_frame_bytes_)),
                                   outcome.operations, outcome.tool_calls);
            }
            return reply;
        } catch (const LoomError& e) {
            return error_frame(e.error(), interpreter ? interpreter->operations() : 0, tool_calls_);
        } catch (const std::bad_alloc&) {
            interpreter.reset();
            return error_frame(make_error(ErrorKind::BUDGET, codes::MEM_LIMIT, "memory limit exceeded"),
                               0, tool_calls_);
        } catch (const nlohmann::json::exception& e) {
            return error_frame(make_error(ErrorKind::CODE, codes::RUNTIME_ERROR, e.what()),
                               interpreter ? interpreter->operations() : 0, tool_calls_);
        }
    }

private:
    loom::ToolCallResult call_tool(const loom::ToolName& tool, const loom::Value& args) {
        const int64_t id = ++tool_calls_;
        nlohmann::json request = {{"type", "tool_call"}, {"id", id}, {"tool", tool}, {"args", args}};
        if (!loom::write_frame(STDOUT_FILENO, request)) {
            throw ChannelClosed("host closed the channel");
        }
        std::optional<nlohmann::json> reply;
        try {
            reply = loom::read_frame(STDIN_FILENO, max_frame_bytes_);
        } catch (const std::runtime_error& e) {
            throw ChannelClosed(e.what());
        }
        if (!reply) throw ChannelClosed("host closed the channel");
        if (reply->at("type") != "tool_result" || reply->value("id", int64_t{-1}) != id) {
            throw ChannelClosed("unexpected reply to tool call");
        }
        if (reply->value("ok", false)) {
            return loom::ToolCallResult::success(reply->value("result", loom::Value()));
        }
        return loom::ToolCallResult::failure(reply->at("error").get<loom::Error>());
    }

    uint32_t max_frame_bytes_;
    int64_t tool_calls_ = 0;
};

// --max-frame-bytes N from the host; anything unparsable keeps the default
uint32_t frame_limit_from(int argc, char** argv) {
    uint32_t limit = loom::SandboxConfig{}.max_frame_bytes;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) != "--max-frame-bytes") continue;
        try {
            unsigned long long parsed = std::stoull(argv[i + 1]);
            if (parsed >= 1024 && parsed <= std::numeric_limits<uint32_t>::max()) {
                limit = static_cast<uint32_t>(parsed);
            }
        } catch (const std::logic_error&) {
            LOOM_LOG_WARN("ignoring bad --max-frame-bytes", {loom::StringField("value", argv[i + 1])});
        }
    }
    return limit;
}

} // namespace

int main(int argc, char** argv) {
    loom::LoggingConfig logging;
    logging.level = "warn";
    logging.to_stderr = true;
    loom::init_logging(logging);

    if (!install_syscall_filter()) {
        LOOM_LOG_WARN("syscall filter not installed; relying on rlimits only");
    }

    const uint32_t max_frame_bytes = frame_limit_from(argc, argv);
    int code = kExitOk;
    try {
        std::optional<nlohmann::json> request = loom::read_frame(STDIN_FILENO, max_frame_bytes);
        if (!request || request->at("type") != "execute") {
            LOOM_LOG_ERROR("worker expected an execute frame");
            code = kExitProtocol;
        } else {
            WorkerSession session(max_frame_bytes);
            nlohmann::json reply = session.run(*request);
            if (!loom::write_frame(STDOUT_FILENO, reply)) code = kExitProtocol;
        }
    } catch (const ChannelClosed& e) {
        LOOM_LOG_ERROR("worker channel closed", {loom::StringField("reason", e.what())});
        code = kExitProtocol;
    } catch (const std::runtime_error& e) {
        LOOM_LOG_ERROR("worker protocol error", {loom::StringField("reason", e.what())});
        code = kExitProtocol;
    }

    loom::shutdown_logging();
    return code;
}
