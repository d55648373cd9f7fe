// modules/sandbox/watchdog.cpp
#include "modules/sandbox/watchdog.h"
#include "common/logging/logging.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>

namespace loom {

std::string to_string(Watchdog::Cause cause) {
    switch (cause) {
        case Watchdog::Cause::NONE: return "none";
        case Watchdog::Cause::TIMEOUT: return "timeout";
        case Watchdog::Cause::PROTOCOL: return "protocol";
        case Watchdog::Cause::CANCELLED: return "cancelled";
    }
    return "none";
}

Watchdog::Watchdog(WorkerProcess& process, std::chrono::milliseconds wall,
                   std::shared_ptr<CancelToken> cancel)
    : process_(process), cancel_(std::move(cancel)) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::runtime_error("watchdog: cannot create wake pipe");
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];

    const bool bounded = wall.count() >= 0;
    const auto deadline = std::chrono::steady_clock::now() + std::max(wall, std::chrono::milliseconds(0));
    thread_ = std::thread([this, deadline, bounded] { run(deadline, bounded); });
}

Watchdog::~Watchdog() {
    disarm();
    close(wake_read_);
    close(wake_write_);
}

void Watchdog::wake() {
    const char byte = 'w';
    ssize_t n;
    do {
        n = ::write(wake_write_, &byte, 1);
    } while (n < 0 && errno == EINTR);
}

void Watchdog::terminate(Cause cause) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disarmed_ || requested_ != Cause::NONE) return;
        requested_ = cause;
    }
    wake();
}

void Watchdog::disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disarmed_ = true;
    }
    wake();
    if (thread_.joinable()) thread_.join();
}

Watchdog::Cause Watchdog::cause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cause_;
}

void Watchdog::run(std::chrono::steady_clock::time_point deadline, bool bounded) {
    const int cancel_fd = cancel_ ? cancel_->fd() : -1;

    while (true) {
        Cause fire = Cause::NONE;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disarmed_) return;
            fire = requested_;
        }
        if (fire == Cause::NONE && cancel_ && cancel_->cancelled()) fire = Cause::CANCELLED;

        int timeout_ms = -1;
        if (fire == Cause::NONE && bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                fire = Cause::TIMEOUT;
            } else {
                timeout_ms = static_cast<int>(std::min<int64_t>(left, 1000));
            }
        }

        if (fire != Cause::NONE) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disarmed_) return;
            cause_ = fire;
            // 进程尚未被回收，pid 不会被复用
            process_.kill();
            LOOM_LOG_WARN("watchdog killed worker",
                          {IntField("pid", process_.pid()), StringField("cause", to_string(fire))});
            return;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = {wake_read_, POLLIN, 0};
        if (cancel_fd >= 0) fds[count++] = {cancel_fd, POLLIN, 0};
        int rc = poll(fds, count, timeout_ms);
        if (rc < 0 && errno != EINTR) {
            LOOM_LOG_ERROR("watchdog poll failed", {IntField("errno", errno)});
            std::lock_guard<std::mutex> lock(mutex_);
            if (disarmed_) return;
            cause_ = Cause::PROTOCOL;
            process_.kill();
            return;
        }
        if (rc > 0 && (fds[0].revents & POLLIN)) {
            char buf[16];
            while (::read(wake_read_, buf, sizeof(buf)) > 0) {
            }
        }
    }
}

} // namespace loom
