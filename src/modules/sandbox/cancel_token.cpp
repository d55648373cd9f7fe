// modules/sandbox/cancel_token.cpp
#include "modules/sandbox/cancel_token.h"
#include "common/logging/logging.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace loom {

CancelToken::CancelToken() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        LOOM_LOG_WARN("cancel token pipe unavailable", {StringField("errno", std::strerror(errno))});
        return;
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
}

CancelToken::~CancelToken() {
    if (read_fd_ >= 0) ::close(read_fd_);
    if (write_fd_ >= 0) ::close(write_fd_);
}

void CancelToken::cancel() {
    if (cancelled_.exchange(true)) return;
    if (write_fd_ < 0) return;
    const char byte = 'c';
    ssize_t n;
    do {
        n = ::write(write_fd_, &byte, 1);
    } while (n < 0 && errno == EINTR);
}

} // namespace loom
