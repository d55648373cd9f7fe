// modules/sandbox/worker_process.cpp
#include "modules/sandbox/worker_process.h"
#include "core/types/error.h"
#include "common/logging/logging.h"

#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace loom {

namespace {

constexpr int kExecErrorFd = 3;

void set_limit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    setrlimit(resource, &rl);
}

// 子进程中只使用 async-signal-safe 调用
void close_inherited_fds(int first, int fallback_max) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, first, ~0U, 0) == 0) return;
#endif
    for (int fd = first; fd < fallback_max; ++fd) close(fd);
}

[[noreturn]] void child_fail(int err) {
    ssize_t n;
    do {
        n = write(kExecErrorFd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    _exit(127);
}

Error spawn_error(const std::string& what, int err) {
    return make_error(ErrorKind::SANDBOX, codes::ENGINE_UNAVAILABLE,
                      "worker spawn failed: " + what + ": " + std::strerror(err));
}

} // namespace

WorkerProcess::WorkerProcess(pid_t pid, int to_child, int from_child)
    : pid_(pid), to_child_(to_child), from_child_(from_child) {}

std::unique_ptr<WorkerProcess> WorkerProcess::spawn(const std::string& path, const WorkerLimits& limits) {
    int in_pipe[2];   // host -> worker stdin
    int out_pipe[2];  // worker stdout -> host
    int err_pipe[2];  // exec failure report
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        throw LoomError(spawn_error("pipe", errno));
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(in_pipe[0]);
        close(in_pipe[1]);
        throw LoomError(spawn_error("pipe", err));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) close(fd);
        throw LoomError(spawn_error("pipe", err));
    }

    // fork 之前准备好一切，子进程里不再分配内存
    std::vector<std::string> args = {path};
    if (limits.max_frame_bytes > 0) {
        args.push_back("--max-frame-bytes");
        args.push_back(std::to_string(limits.max_frame_bytes));
    }
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env;
    if (const char* level = std::getenv("LOOM_LOG_LEVEL")) {
        env.push_back(std::string("LOOM_LOG_LEVEL=") + level);
    }
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    struct rlimit nofile;
    int fallback_max = 1024;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
        fallback_max = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, 65536));
    }

    const rlim_t mem_bytes =
        static_cast<rlim_t>(std::max(limits.mem_mb, kMinAddressSpaceMb)) * 1024 * 1024;
    const rlim_t cpu_seconds = static_cast<rlim_t>((std::max<int64_t>(limits.cpu_ms, 1) + 999) / 1000);
    const rlim_t max_fds = static_cast<rlim_t>(std::max(limits.max_fds, kExecErrorFd + 1));

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        throw LoomError(spawn_error("fork", err));
    }

    if (pid == 0) {
        if (limits.isolate_network) {
            // Needs CAP_SYS_ADMIN or a user namespace; the seccomp filter in
            // the worker still denies socket() when this fails.
            unshare(CLONE_NEWNET);
        }
        setsid();
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

        if (dup2(in_pipe[0], STDIN_FILENO) < 0) _exit(127);
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0) _exit(127);
        if (dup2(err_pipe[1], kExecErrorFd) < 0) _exit(127);
        fcntl(kExecErrorFd, F_SETFD, FD_CLOEXEC);
        close_inherited_fds(kExecErrorFd + 1, fallback_max);

        set_limit(RLIMIT_AS, mem_bytes, mem_bytes);
        set_limit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1);
        set_limit(RLIMIT_NOFILE, max_fds, max_fds);
        set_limit(RLIMIT_CORE, 0, 0);

        execve(argv[0], argv.data(), envp.data());
        child_fail(errno);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(in_pipe[1]);
        close(out_pipe[0]);
        throw LoomError(spawn_error("exec " + path, child_errno));
    }

    LOOM_LOG_DEBUG("worker spawned", {IntField("pid", pid)});
    return std::unique_ptr<WorkerProcess>(new WorkerProcess(pid, in_pipe[1], out_pipe[0]));
}

WorkerProcess::~WorkerProcess() {
    close_input();
    if (from_child_ >= 0) {
        close(from_child_);
        from_child_ = -1;
    }
    if (!reaped_) {
        kill();
        wait();
    }
}

void WorkerProcess::close_input() {
    if (to_child_ >= 0) {
        close(to_child_);
        to_child_ = -1;
    }
}

void WorkerProcess::kill() {
    if (reaped_) return;
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
}

WorkerExit WorkerProcess::wait() {
    if (reaped_) return exit_;

    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    pid_t r;
    do {
        r = wait4(pid_, &status, 0, &usage);
    } while (r < 0 && errno == EINTR);
    reaped_ = true;

    if (r == pid_) {
        if (WIFEXITED(status)) {
            exit_.exited = true;
            exit_.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_.signal = WTERMSIG(status);
        }
        exit_.cpu_ms = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
                       (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
        exit_.max_rss_mb = usage.ru_maxrss / 1024; // ru_maxrss 单位为 KB
    }
    return exit_;
}

} // namespace loom
