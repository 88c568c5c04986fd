#include "TokenKind.h"

namespace jstream::json {

std::string_view token_kind_name(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::None:
            return "none";
        case TokenKind::ObjectStart:
            return "object start";
        case TokenKind::ObjectEnd:
            return "object end";
        case TokenKind::ArrayStart:
            return "array start";
        case TokenKind::ArrayEnd:
            return "array end";
        case TokenKind::PropertyName:
            return "property name";
        case TokenKind::String:
            return "string";
        case TokenKind::Number:
            return "number";
        case TokenKind::True:
            return "true";
        case TokenKind::False:
            return "false";
        case TokenKind::Null:
            return "null";
        case TokenKind::Comment:
            return "comment";
    }
    return "unknown";
}

} // namespace jstream::json
