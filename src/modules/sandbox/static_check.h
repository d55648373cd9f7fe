// modules/sandbox/static_check.h
#ifndef LOOM_MODULES_SANDBOX_STATIC_CHECK_H
#define LOOM_MODULES_SANDBOX_STATIC_CHECK_H

#include "core/types/error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

// Identifiers naming import, dynamic evaluation, process or I/O primitives
const std::vector<std::string>& forbidden_identifiers();

// Runs before any worker is spawned:
//   source larger than max_source_bytes   -> CODE/STATIC_REJECTED
//   forbidden identifier anywhere in code -> CODE/STATIC_REJECTED
//   lexer or parser failure               -> CODE/SYNTAX_ERROR
// Returns nullopt when the script may run.
std::optional<Error> static_check(std::string_view source, int64_t max_source_bytes);

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_STATIC_CHECK_H
