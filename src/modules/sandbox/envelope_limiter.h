// modules/sandbox/envelope_limiter.h
#ifndef LOOM_MODULES_SANDBOX_ENVELOPE_LIMITER_H
#define LOOM_MODULES_SANDBOX_ENVELOPE_LIMITER_H

#include "core/types/result.h"
#include "core/types/budget.h"
#include "modules/cache/artifact_store.h"
#include <cstdint>
#include <optional>

namespace loom {

// Approximate characters per token when bounding a summary by token_cap
inline constexpr int64_t kCharsPerToken = 4;

// Brings an envelope under the size cap, in order:
//   1. a summary longer than token_cap * kCharsPerToken is stored whole as a
//      text/plain artifact and shortened with a "[truncated ...]" marker;
//   2. state_updates values whose JSON exceeds a quarter of the cap are
//      stored as application/json artifacts and replaced by
//      {"$artifact": uri, "size": n};
//   3. anything still above the cap is BUDGET/OUTPUT_LIMIT.
// Without an artifact store every overflow is BUDGET/OUTPUT_LIMIT.
std::optional<Error> enforce_envelope_cap(ResultEnvelope& envelope, int64_t cap_bytes,
                                          int64_t token_cap, ArtifactStore* store);

} // namespace loom

#endif // LOOM_MODULES_SANDBOX_ENVELOPE_LIMITER_H
