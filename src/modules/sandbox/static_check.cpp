// modules/sandbox/static_check.cpp
#include "modules/sandbox/static_check.h"
#include "modules/script/lexer.h"
#include "modules/script/parser.h"
#include <algorithm>

namespace loom {

const std::vector<std::string>& forbidden_identifiers() {
    static const std::vector<std::string> names = {
        "import", "eval", "exec", "require", "load", "loadstring",
        "dofile", "include", "system", "spawn", "open", "socket"
    };
    return names;
}

std::optional<Error> static_check(std::string_view source, int64_t max_source_bytes) {
    if (max_source_bytes >= 0 && static_cast<int64_t>(source.size()) > max_source_bytes) {
        return make_error(ErrorKind::CODE, codes::STATIC_REJECTED,
                          "script is " + std::to_string(source.size()) + " bytes, limit is " +
                              std::to_string(max_source_bytes));
    }

    std::vector<script::Token> tokens;
    try {
        tokens = script::tokenize(source);
    } catch (const LoomError& e) {
        return e.error();
    }

    // 只检查标识符，字符串与注释中的同名单词不算
    const auto& banned = forbidden_identifiers();
    for (const auto& token : tokens) {
        if (token.type != script::TokenType::IDENT) continue;
        if (std::find(banned.begin(), banned.end(), token.text) != banned.end()) {
            return make_error(ErrorKind::CODE, codes::STATIC_REJECTED,
                              "line " + std::to_string(token.line) + ": forbidden construct '" +
                                  token.text + "'");
        }
    }

    try {
        script::Parser parser(std::move(tokens));
        parser.parse_program();
    } catch (const LoomError& e) {
        return e.error();
    }
    return std::nullopt;
}

} // namespace loom
