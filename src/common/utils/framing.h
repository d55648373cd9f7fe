#ifndef LOOM_COMMON_UTILS_FRAMING_H
#define LOOM_COMMON_UTILS_FRAMING_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace loom {

// Frame = 4-byte big-endian payload length + UTF-8 JSON payload

std::string encode_frame(const nlohmann::json& message);

enum class FrameStatus {
    OK,
    NEED_MORE,  // buffer holds a partial frame
    TOO_LARGE,  // declared length above the ceiling
    MALFORMED   // payload is not a JSON object with a string "type"
};

// Incremental decoder over a byte stream
class FrameDecoder {
public:
    explicit FrameDecoder(uint32_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

    void feed(const char* data, size_t len) { buffer_.append(data, len); }

    // Pops one complete frame into out when available
    FrameStatus next(nlohmann::json& out);

    bool has_partial() const { return !buffer_.empty(); }

private:
    uint32_t max_frame_bytes_;
    std::string buffer_;
};

// Blocking helpers over raw file descriptors. write_frame retries on EINTR
// and returns false when the peer is gone; read_frame returns nullopt on EOF
// and throws std::runtime_error on a protocol violation.
bool write_frame(int fd, const nlohmann::json& message);
std::optional<nlohmann::json> read_frame(int fd, uint32_t max_frame_bytes);

} // namespace loom

#endif // LOOM_COMMON_UTILS_FRAMING_H
