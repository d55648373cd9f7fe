// common/utils/hash.cpp
#include "common/utils/hash.h"

extern "C" {
#include <blake3.h>
}

namespace loom {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[i * 2] = kHexChars[data[i] >> 4];
        out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
    }
    return out;
}

} // namespace

std::string_view domain_prefix(HashDomain domain) {
    switch (domain) {
        case HashDomain::PLAN: return "plan:";
        case HashDomain::RESULT: return "result:";
        case HashDomain::SUMMARY: return "summary:";
        case HashDomain::ARTIFACT: return "artifact:";
    }
    return "";
}

std::string hash_bytes(HashDomain domain, std::string_view data) {
    std::string_view prefix = domain_prefix(domain);

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, prefix.data(), prefix.size());
    blake3_hasher_update(&hasher, data.data(), data.size());

    uint8_t out[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, out, BLAKE3_OUT_LEN);
    return to_hex(out, BLAKE3_OUT_LEN);
}

std::string hash_json(HashDomain domain, const nlohmann::json& value) {
    return hash_bytes(domain, value.dump());
}

} // namespace loom
