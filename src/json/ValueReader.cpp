#include "ValueReader.h"

#include "Scalars.h"

namespace jstream::json {

ValueReader::ValueReader(std::string_view text, const ReaderOptions &options, std::size_t base_offset)
    : tokenizer_(text, true, TokenizerState(options, base_offset)) {
}

common::StreamResult<void> ValueReader::next() {
    while (true) {
        auto more = tokenizer_.read();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return std::unexpected(
                common::syntax_error("unexpected end of input", tokenizer_.absolute_offset(tokenizer_.position())));
        }
        if (tokenizer_.kind() != TokenKind::Comment) {
            return {};
        }
    }
}

common::StreamResult<void> ValueReader::skip() {
    TokenKind start = tokenizer_.kind();
    if (start == TokenKind::PropertyName) {
        auto moved = next();
        if (!moved) {
            return moved;
        }
    }
    auto skipped = tokenizer_.try_skip();
    if (!skipped) {
        return std::unexpected(skipped.error());
    }
    if (!*skipped) {
        return std::unexpected(
            common::syntax_error("unexpected end of input", tokenizer_.absolute_offset(tokenizer_.position())));
    }
    return {};
}

common::StreamResult<void> ValueReader::finish() {
    while (true) {
        auto more = tokenizer_.read();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return {};
        }
        if (tokenizer_.kind() != TokenKind::Comment) {
            return std::unexpected(common::syntax_error("unexpected data after value",
                                                        tokenizer_.absolute_offset(tokenizer_.token_start())));
        }
    }
}

common::StreamResult<std::string> ValueReader::string_value() const {
    TokenKind current = tokenizer_.kind();
    if (current != TokenKind::String && current != TokenKind::PropertyName) {
        return std::unexpected(common::decode_error("expected a string", offset()));
    }
    return unescape_string(raw(), offset());
}

common::StreamResult<std::string_view> ValueReader::string_view_value() {
    TokenKind current = tokenizer_.kind();
    if (current != TokenKind::String && current != TokenKind::PropertyName) {
        return std::unexpected(common::decode_error("expected a string", offset()));
    }
    std::string_view token = raw();
    if (!tokenizer_.has_escapes()) {
        return token.substr(1, token.size() - 2);
    }
    auto result = unescape_string_into(token, offset(), scratch_);
    if (!result) {
        return std::unexpected(result.error());
    }
    return std::string_view(scratch_);
}

} // namespace jstream::json
