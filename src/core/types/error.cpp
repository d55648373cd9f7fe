#include "core/types/error.h"
#include <regex>

namespace loom {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TOOL: return "TOOL";
        case ErrorKind::CODE: return "CODE";
        case ErrorKind::POLICY: return "POLICY";
        case ErrorKind::BUDGET: return "BUDGET";
        case ErrorKind::SANDBOX: return "SANDBOX";
    }
    return "CODE";
}

ErrorKind error_kind_from_string(const std::string& text) {
    if (text == "TOOL") return ErrorKind::TOOL;
    if (text == "CODE") return ErrorKind::CODE;
    if (text == "POLICY") return ErrorKind::POLICY;
    if (text == "BUDGET") return ErrorKind::BUDGET;
    if (text == "SANDBOX") return ErrorKind::SANDBOX;
    throw std::runtime_error("Unknown error kind '" + text + "'");
}

std::string Error::qualified() const {
    return to_string(kind) + "/" + code;
}

std::string redact(std::string_view message, size_t max_len) {
    static const std::regex bearer(R"((Bearer|bearer)\s+[A-Za-z0-9._~+/=-]+)");
    static const std::regex assignment(
        R"(((api[_-]?key|token|secret|password|passwd|authorization)\s*[=:]\s*)("[^"]*"|[^\s,;&]+))",
        std::regex::icase);
    static const std::regex sk_key(R"(sk-[A-Za-z0-9_-]{8,})");

    std::string out(message);
    out = std::regex_replace(out, bearer, "$1 [REDACTED]");
    out = std::regex_replace(out, assignment, "$1[REDACTED]");
    out = std::regex_replace(out, sk_key, "[REDACTED]");

    if (out.size() > max_len) {
        out.resize(max_len);
        out += "...";
    }
    return out;
}

Error make_error(ErrorKind kind, std::string code, std::string_view message, bool retriable) {
    Error e;
    e.kind = kind;
    e.code = std::move(code);
    e.retriable = retriable;
    e.message = redact(message);
    return e;
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{
        {"kind", to_string(e.kind)},
        {"code", e.code},
        {"retriable", e.retriable},
        {"message", e.message}
    };
}

void from_json(const nlohmann::json& j, Error& e) {
    e.kind = error_kind_from_string(j.at("kind").get<std::string>());
    e.code = j.at("code").get<std::string>();
    e.retriable = j.value("retriable", false);
    // messages arriving over a channel are redacted again
    e.message = redact(j.value("message", ""));
}

LoomError::LoomError(Error error)
    : std::runtime_error(error.qualified() + ": " + error.message),
      error_(std::move(error)) {}

} // namespace loom
