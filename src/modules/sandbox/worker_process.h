// modules/sandbox/worker_process.h
#ifndef LOOM_MODULES_SANDBOX_WORKER_PROCESS_H
#define LOOM_MODULES_SANDBOX_WORKER_PROCESS_H

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <string>

namespace loom {

// OS limits applied in the child before exec
struct WorkerLimits {
    int64_t cpu_ms = 2000;   // RLIMIT_CPU, rounded up to whole seconds
    int64_t mem_mb = 256;    // RLIMIT_AS
    int max_fds = 32;        // RLIMIT_NOFILE
    bool isolate_network = true; // unshare(CLONE_NEWNET), best effort
    uint32_t max_frame_bytes = 0; // passed as --max-frame-bytes, 0 keeps the worker default
};

struct WorkerExit {
    bool exited = false;   // normal exit
    int exit_code = -1;
    int signal = 0;        // terminating signal, 0 if none
    int64_t cpu_ms = 0;    // user + system
    int64_t max_rss_mb = 0;
};

// A spawned sandbox worker: own session, stdin/stdout pipes, no other
// inherited descriptors. stderr is shared with the host for diagnostics.
class WorkerProcess {
public:
    // Minimum address space the worker runtime needs to load
    static constexpr int64_t kMinAddressSpaceMb = 32;

    // Throws LoomError(SANDBOX/ENGINE_UNAVAILABLE) when pipes, fork or exec fail
    static std::unique_ptr<WorkerProcess> spawn(const std::string& path, const WorkerLimits& limits);

    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    pid_t pid() const { return pid_; }
    int input_fd() const { return to_child_; }    // worker stdin
    int output_fd() const { return from_child_; } // worker stdout

    void close_input();

    // SIGKILL to the worker's process group
    void kill();

    // Blocks until the worker exits; idempotent
    WorkerExit wait();
    bool reaped() const { return reaped_; }

private:
    WorkerProcess(pid_t pid, int to_child, int from_child);

    pid_t pid_;
    int to_child_;
    int from_child_;
    bool reaped_ = false;
    WorkerExit exit_;
};

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_WORKER_PROCESS_H
