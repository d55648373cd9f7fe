// common/utils/framing.cpp
#include "common/utils/framing.h"
#include <cerrno>
#include <stdexcept>
#include <unistd.h>

namespace loom {

namespace {

uint32_t decode_length(const char* p) {
    auto b = reinterpret_cast<const unsigned char*>(p);
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
}

bool valid_message(const nlohmann::json& j) {
    return j.is_object() && j.contains("type") && j["type"].is_string();
}

// 读取恰好 len 字节；EOF 返回 false
bool read_exact(int fd, char* out, size_t len, bool& eof_at_start) {
    size_t got = 0;
    eof_at_start = false;
    while (got < len) {
        ssize_t n = ::read(fd, out + got, len - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("frame read failed");
        }
        if (n == 0) {
            eof_at_start = (got == 0);
            return false;
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::string encode_frame(const nlohmann::json& message) {
    std::string payload = message.dump();
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(4 + payload.size());
    out.push_back(static_cast<char>((len >> 24) & 0xFF));
    out.push_back(static_cast<char>((len >> 16) & 0xFF));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
    out += payload;
    return out;
}

FrameStatus FrameDecoder::next(nlohmann::json& out) {
    if (buffer_.size() < 4) return FrameStatus::NEED_MORE;
    uint32_t len = decode_length(buffer_.data());
    if (len > max_frame_bytes_) return FrameStatus::TOO_LARGE;
    if (buffer_.size() < 4 + static_cast<size_t>(len)) return FrameStatus::NEED_MORE;

    auto parsed = nlohmann::json::parse(buffer_.begin() + 4, buffer_.begin() + 4 + len, nullptr, false);
    buffer_.erase(0, 4 + static_cast<size_t>(len));
    if (parsed.is_discarded() || !valid_message(parsed)) {
        return FrameStatus::MALFORMED;
    }
    out = std::move(parsed);
    return FrameStatus::OK;
}

bool write_frame(int fd, const nlohmann::json& message) {
    std::string bytes = encode_frame(message);
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + sent, bytes.size() - sent);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<nlohmann::json> read_frame(int fd, uint32_t max_frame_bytes) {
    char header[4];
    bool eof_at_start = false;
    if (!read_exact(fd, header, 4, eof_at_start)) {
        if (eof_at_start) return std::nullopt;
        throw std::runtime_error("truncated frame header");
    }
    uint32_t len = decode_length(header);
    if (len > max_frame_bytes) {
        throw std::runtime_error("frame exceeds size limit");
    }
    std::string payload(len, '\0');
    if (len > 0 && !read_exact(fd, payload.data(), len, eof_at_start)) {
        throw std::runtime_error("truncated frame payload");
    }
    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded() || !valid_message(parsed)) {
        throw std::runtime_error("malformed frame");
    }
    return parsed;
}

} // namespace loom
