#ifndef JSTREAM_JSON_VALUE_READER_H
#define JSTREAM_JSON_VALUE_READER_H

#include <cstddef>
#include <string>
#include <string_view>

#include "../common/StreamError.h"
#include "ReaderOptions.h"
#include "Tokenizer.h"

namespace jstream::json {

// Pull reader over a complete JSON text (usually one array element). Comment
// tokens are skipped; running out of input is a syntax error.
class ValueReader {
public:
    ValueReader(std::string_view text, const ReaderOptions &options, std::size_t base_offset = 0);

    // Moves to the next token.
    [[nodiscard]] common::StreamResult<void> next();

    // When positioned on the first token of a value, moves to its last token.
    [[nodiscard]] common::StreamResult<void> skip();

    // Succeeds when no token follows the current one.
    [[nodiscard]] common::StreamResult<void> finish();

    [[nodiscard]] TokenKind kind() const noexcept {
        return tokenizer_.kind();
    }

    // Raw bytes of the current token; strings keep their quotes.
    [[nodiscard]] std::string_view raw() const noexcept {
        return tokenizer_.token_text();
    }

    // Absolute offset of the current token.
    [[nodiscard]] std::size_t offset() const noexcept {
        return tokenizer_.absolute_offset(tokenizer_.token_start());
    }

    [[nodiscard]] std::size_t depth() const noexcept {
        return tokenizer_.depth();
    }

    // Unescaped content of the current string or property name.
    [[nodiscard]] common::StreamResult<std::string> string_value() const;

    // Like string_value() without a copy when the token has no escapes. The
    // view is valid until the next call on this reader.
    [[nodiscard]] common::StreamResult<std::string_view> string_view_value();

private:
    Tokenizer tokenizer_;
    std::string scratch_;
};

} // namespace jstream::json

#endif // JSTREAM_JSON_VALUE_READER_H
