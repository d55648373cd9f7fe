// modules/sandbox/envelope_limiter.cpp
#include "modules/sandbox/envelope_limiter.h"
#include <algorithm>
#include <vector>

namespace loom {

namespace {

Error output_limit(size_t size, int64_t cap) {
    return make_error(ErrorKind::BUDGET, codes::OUTPUT_LIMIT,
                      "result envelope is " + std::to_string(size) + " bytes, cap is " +
                          std::to_string(cap));
}

// Keeps whole UTF-8 sequences when cutting
size_t utf8_boundary(const std::string& s, size_t pos) {
    while (pos > 0 && pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) --pos;
    return pos;
}

} // namespace

std::optional<Error> enforce_envelope_cap(ResultEnvelope& envelope, int64_t cap_bytes,
                                          int64_t token_cap, ArtifactStore* store) {
    if (token_cap >= 0) {
        const size_t max_chars = static_cast<size_t>(token_cap * kCharsPerToken);
        if (envelope.summary.size() > max_chars) {
            if (!store) return output_limit(envelope.summary.size(), static_cast<int64_t>(max_chars));
            ArtifactHandle handle = store->put(envelope.summary, "text/plain");
            std::string marker = " [truncated, full text in " + handle.uri + "]";
            size_t keep = max_chars > marker.size() ? max_chars - marker.size() : 0;
            envelope.summary = envelope.summary.substr(0, utf8_boundary(envelope.summary, keep)) + marker;
            envelope.artifacts.push_back(std::move(handle));
        }
    }

    if (cap_bytes < 0) return std::nullopt;
    size_t size = envelope.serialized_size();
    if (size <= static_cast<size_t>(cap_bytes)) return std::nullopt;
    if (!store) return output_limit(size, cap_bytes);

    // 按体积从大到小外置，体积相同按键名
    std::vector<std::pair<std::string, size_t>> candidates;
    for (auto it = envelope.state_updates.begin(); it != envelope.state_updates.end(); ++it) {
        candidates.emplace_back(it.key(), it.value().dump().size());
    }
    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });

    const size_t threshold = static_cast<size_t>(cap_bytes) / 4;
    for (const auto& [key, value_size] : candidates) {
        if (size <= static_cast<size_t>(cap_bytes)) break;
        if (value_size <= threshold) break;
        Value& slot = envelope.state_updates[key];
        ArtifactHandle handle = store->put(slot.dump(), "application/json");
        slot = Value{{"$artifact", handle.uri}, {"size", handle.size}};
        envelope.artifacts.push_back(std::move(handle));
        size = envelope.serialized_size();
    }

    if (size > static_cast<size_t>(cap_bytes)) return output_limit(size, cap_bytes);
    return std::nullopt;
}

} // namespace loom
