// modules/sandbox/cancel_token.h
#ifndef LOOM_MODULES_SANDBOX_CANCEL_TOKEN_H
#define LOOM_MODULES_SANDBOX_CANCEL_TOKEN_H

#include <atomic>

namespace loom {

// Cancellation control channel. cancel() writes one byte into a self-pipe so
// that a watchdog blocked in poll() wakes up; fd() stays readable afterwards.
class CancelToken {
public:
    CancelToken();
    ~CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Read end of the control pipe, -1 if the pipe could not be created
    int fd() const { return read_fd_; }

private:
    std::atomic<bool> cancelled_{false};
    int read_fd_ = -1;
    int write_fd_ = -1;
};

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_CANCEL_TOKEN_H
