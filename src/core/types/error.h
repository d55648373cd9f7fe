#ifndef LOOM_TYPES_ERROR_H
#define LOOM_TYPES_ERROR_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace loom {

enum class ErrorKind : uint8_t {
    TOOL,
    CODE,
    POLICY,
    BUDGET,
    SANDBOX
};

std::string to_string(ErrorKind kind);
ErrorKind error_kind_from_string(const std::string& text);

// Error codes, grouped by kind
namespace codes {
// CODE
inline constexpr const char* PLAN_INVALID = "PLAN_INVALID";
inline constexpr const char* STATIC_REJECTED = "STATIC_REJECTED";
inline constexpr const char* SYNTAX_ERROR = "SYNTAX_ERROR";
inline constexpr const char* RUNTIME_ERROR = "RUNTIME_ERROR";
// POLICY
inline constexpr const char* CAPABILITY_DENIED = "CAPABILITY_DENIED";
inline constexpr const char* RATE_LIMITED = "RATE_LIMITED";
inline constexpr const char* WRITE_SCOPE_DENIED = "WRITE_SCOPE_DENIED";
inline constexpr const char* WRITE_WITHOUT_APPROVAL = "WRITE_WITHOUT_APPROVAL";
inline constexpr const char* APPROVAL_DENIED = "APPROVAL_DENIED";
inline constexpr const char* APPROVAL_TIMEOUT = "APPROVAL_TIMEOUT";
inline constexpr const char* MANIFEST_MISSING = "MANIFEST_MISSING";
// BUDGET
inline constexpr const char* CPU_LIMIT = "CPU_LIMIT";
inline constexpr const char* MEM_LIMIT = "MEM_LIMIT";
inline constexpr const char* OP_LIMIT = "OP_LIMIT";
inline constexpr const char* DEPTH_LIMIT = "DEPTH_LIMIT";
inline constexpr const char* SIZE_LIMIT = "SIZE_LIMIT";
inline constexpr const char* OUTPUT_LIMIT = "OUTPUT_LIMIT";
inline constexpr const char* RUN_LIMIT = "RUN_LIMIT";
// SANDBOX
inline constexpr const char* PROC_CRASH = "PROC_CRASH";
inline constexpr const char* ENGINE_UNAVAILABLE = "ENGINE_UNAVAILABLE";
inline constexpr const char* CANCELLED = "CANCELLED";
// TOOL
inline constexpr const char* NOT_FOUND = "NOT_FOUND";
inline constexpr const char* INVALID_ARGS = "INVALID_ARGS";
inline constexpr const char* UNAVAILABLE = "UNAVAILABLE";
inline constexpr const char* TIMEOUT = "TIMEOUT";
inline constexpr const char* UPSTREAM = "UPSTREAM";
} // namespace codes

struct Error {
    ErrorKind kind = ErrorKind::CODE;
    std::string code;
    bool retriable = false;
    std::string message; // always redacted

    // "KIND/CODE", e.g. "POLICY/CAPABILITY_DENIED"
    std::string qualified() const;
    bool is(ErrorKind k, std::string_view c) const { return kind == k && code == c; }
};

// Strips secret-looking tokens and truncates to max_len characters.
std::string redact(std::string_view message, size_t max_len = 256);

Error make_error(ErrorKind kind, std::string code, std::string_view message, bool retriable = false);

void to_json(nlohmann::json& j, const Error& e);
void from_json(const nlohmann::json& j, Error& e);

// 运行开始前的致命错误 (manifest missing, plan invalid, engine unavailable)
class LoomError : public std::runtime_error {
public:
    explicit LoomError(Error error);
    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

} // namespace loom

#endif // LOOM_TYPES_ERROR_H
