#ifndef JSTREAM_JSON_TOKENIZER_H
#define JSTREAM_JSON_TOKENIZER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "../common/StreamError.h"
#include "ReaderOptions.h"
#include "TokenKind.h"

namespace jstream::json {

enum class ContainerKind : std::uint8_t {
    Object,
    Array,
};

// What the grammar accepts at the resume point.
enum class Expect : std::uint8_t {
    Value,
    ValueOrArrayEnd,
    KeyOrObjectEnd,
    Key,
    Colon,
    CommaOrEnd,
};

// Continuation of a Tokenizer at a token boundary. Feeding a new tokenizer this
// state plus the bytes from `offset` onwards yields the same tokens the old one
// would have produced.
struct TokenizerState {
    std::vector<ContainerKind> stack;
    Expect expect = Expect::Value;
    ReaderOptions options;
    // Absolute stream offset of the resume point.
    std::size_t offset = 0;

    TokenizerState() = default;
    explicit TokenizerState(const ReaderOptions &reader_options, std::size_t start_offset = 0)
        : options(reader_options), offset(start_offset) {
    }

    [[nodiscard]] std::size_t depth() const noexcept {
        return stack.size();
    }
};

// Forward-only JSON tokenizer over one contiguous span. Structure, string
// escapes, UTF-8 and number grammar are validated; token content is not
// converted. A token cut by the end of a non-final span is not returned: the
// tokenizer rewinds to its first byte and read() reports false, so the caller
// can resume from position() once more bytes arrive. At top level any number
// of values may follow each other.
class Tokenizer {
public:
    Tokenizer(std::string_view span, bool final_span, const TokenizerState &state);

    // Advances to the next token. False when the span is exhausted.
    [[nodiscard]] common::StreamResult<bool> read();

    // On a container start, advances to its matching end. False when the span
    // ends first, which leaves the tokenizer inside the container.
    [[nodiscard]] common::StreamResult<bool> try_skip();

    [[nodiscard]] TokenKind kind() const noexcept {
        return kind_;
    }

    [[nodiscard]] std::size_t token_start() const noexcept {
        return token_start_;
    }

    // Offset just past the current token.
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    // Nesting depth of the current token: the depth outside the container for
    // start and end tokens, the depth of the enclosing container otherwise.
    [[nodiscard]] std::size_t token_depth() const noexcept {
        return token_depth_;
    }

    [[nodiscard]] std::size_t depth() const noexcept {
        return stack_.size();
    }

    [[nodiscard]] std::string_view token_text() const noexcept {
        return span_.substr(token_start_, pos_ - token_start_);
    }

    // The current string or property name contains backslash escapes.
    [[nodiscard]] bool has_escapes() const noexcept {
        return has_escapes_;
    }

    [[nodiscard]] std::size_t absolute_offset(std::size_t local) const noexcept {
        return base_offset_ + local;
    }

    [[nodiscard]] bool final_span() const noexcept {
        return final_;
    }

    void save_state(TokenizerState &out) const;
    [[nodiscard]] TokenizerState state() const;

private:
    enum class LexResult {
        Ok,
        NeedMore,
        Error,
    };

    common::StreamResult<bool> read_value(char ch);
    common::StreamResult<bool> finish_token(LexResult result);
    common::StreamResult<bool> finish_span();
    common::StreamResult<bool> open_container(ContainerKind container);
    common::StreamResult<bool> close_container(ContainerKind container);
    common::StreamResult<bool> fail(const char *message, std::size_t local);

    LexResult lex_string(TokenKind kind);
    LexResult lex_hex4(std::size_t &i, std::uint32_t &code);
    LexResult lex_number();
    LexResult lex_literal(std::string_view literal, TokenKind kind);
    LexResult lex_comment(std::size_t &end);
    LexResult need_more_or(const char *message, std::size_t local);
    LexResult set_error(const char *message, std::size_t local);

    void skip_whitespace() noexcept;
    void after_value() noexcept;
    [[nodiscard]] Expect after_comma() const noexcept;
    [[nodiscard]] bool in_array() const noexcept;
    [[nodiscard]] bool in_object() const noexcept;

    std::string_view span_;
    bool final_;
    std::vector<ContainerKind> stack_;
    Expect expect_;
    ReaderOptions options_;
    std::size_t base_offset_;
    std::size_t pos_ = 0;
    std::size_t token_start_ = 0;
    std::size_t token_depth_ = 0;
    TokenKind kind_ = TokenKind::None;
    bool has_escapes_ = false;
    std::optional<common::StreamError> error_;
};

} // namespace jstream::json

#endif // JSTREAM_JSON_TOKENIZER_H
