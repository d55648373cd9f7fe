#ifndef LOOM_COMMON_UTILS_HASH_H
#define LOOM_COMMON_UTILS_HASH_H

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace loom {

// Domain prefixes keep hashes of different object kinds from colliding
enum class HashDomain {
    PLAN,     // "plan:"
    RESULT,   // "result:"
    SUMMARY,  // "summary:"
    ARTIFACT  // "artifact:"
};

std::string_view domain_prefix(HashDomain domain);

// BLAKE3-256 of prefix + data, lowercase hex
std::string hash_bytes(HashDomain domain, std::string_view data);

// Hash of the compact dump; nlohmann objects serialize with sorted keys
std::string hash_json(HashDomain domain, const nlohmann::json& value);

} // namespace loom

#endif // LOOM_COMMON_UTILS_HASH_H
