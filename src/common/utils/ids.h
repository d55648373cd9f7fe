#ifndef LOOM_COMMON_UTILS_IDS_H
#define LOOM_COMMON_UTILS_IDS_H

#include <array>
#include <cstdint>
#include <string>

namespace loom {

using Uuid = std::array<uint8_t, 16>;

// RFC4122 version 4
Uuid generate_uuid();
std::string to_string(const Uuid& id);

// "run-<uuid>"
std::string new_run_id();

} // namespace loom

#endif // LOOM_COMMON_UTILS_IDS_H
