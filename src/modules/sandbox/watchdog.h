// modules/sandbox/watchdog.h
#ifndef LOOM_MODULES_SANDBOX_WATCHDOG_H
#define LOOM_MODULES_SANDBOX_WATCHDOG_H

#include "modules/sandbox/cancel_token.h"
#include "modules/sandbox/worker_process.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace loom {

// External monitor for one worker. It is the only party that kills the
// worker: the wall clock, a cancel token or an explicit terminate() request
// each lead to a single SIGKILL, and disarm() after normal completion makes
// any later request a no-op.
class Watchdog {
public:
    enum class Cause {
        NONE,
        TIMEOUT,   // wall clock exceeded
        PROTOCOL,  // channel violation reported by the host loop
        CANCELLED  // run cancellation
    };

    // wall < 0 disables the wall clock
    Watchdog(WorkerProcess& process, std::chrono::milliseconds wall,
             std::shared_ptr<CancelToken> cancel);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void terminate(Cause cause);

    // Stops monitoring and joins the thread; the cause is frozen afterwards
    void disarm();

    Cause cause() const;

private:
    void run(std::chrono::steady_clock::time_point deadline, bool bounded);
    void wake();

    WorkerProcess& process_;
    std::shared_ptr<CancelToken> cancel_;
    mutable std::mutex mutex_;
    Cause cause_ = Cause::NONE;
    Cause requested_ = Cause::NONE;
    bool disarmed_ = false;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::thread thread_;
};

std::string to_string(Watchdog::Cause cause);

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_WATCHDOG_H
