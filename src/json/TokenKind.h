#ifndef JSTREAM_JSON_TOKEN_KIND_H
#define JSTREAM_JSON_TOKEN_KIND_H

#include <cstdint>
#include <string_view>

namespace jstream::json {

enum class TokenKind : std::uint8_t {
    None,
    ObjectStart,
    ObjectEnd,
    ArrayStart,
    ArrayEnd,
    PropertyName,
    String,
    Number,
    True,
    False,
    Null,
    Comment,
};

std::string_view token_kind_name(TokenKind kind) noexcept;

// Tokens that begin a JSON value.
[[nodiscard]] inline bool is_value_start(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::ObjectStart:
        case TokenKind::ArrayStart:
        case TokenKind::String:
        case TokenKind::Number:
        case TokenKind::True:
        case TokenKind::False:
        case TokenKind::Null:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline bool is_container_start(TokenKind kind) noexcept {
    return kind == TokenKind::ObjectStart || kind == TokenKind::ArrayStart;
}

} // namespace jstream::json

#endif // JSTREAM_JSON_TOKEN_KIND_H
