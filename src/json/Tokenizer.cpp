#include "Tokenizer.h"

#include "Utf.h"

namespace jstream::json {
namespace {

bool is_ws(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// '/' ends a number so that a comment may follow it directly.
bool is_delimiter(char ch) {
    return is_ws(ch) || ch == ',' || ch == ']' || ch == '}' || ch == ':' || ch == '/';
}

} // namespace

Tokenizer::Tokenizer(std::string_view span, bool final_span, const TokenizerState &state)
    : span_(span),
      final_(final_span),
      stack_(state.stack),
      expect_(state.expect),
      options_(state.options),
      base_offset_(state.offset) {
}

common::StreamResult<bool> Tokenizer::read() {
    if (error_) {
        return std::unexpected(*error_);
    }
    kind_ = TokenKind::None;
    has_escapes_ = false;
    while (true) {
        skip_whitespace();
        if (pos_ >= span_.size()) {
            return finish_span();
        }
        char ch = span_[pos_];
        token_start_ = pos_;
        if (ch == '/') {
            std::size_t end = 0;
            LexResult result = lex_comment(end);
            if (result != LexResult::Ok) {
                return finish_token(result);
            }
            pos_ = end;
            if (options_.comment_handling == CommentHandling::Allow) {
                kind_ = TokenKind::Comment;
                token_depth_ = stack_.size();
                return true;
            }
            continue;
        }
        switch (expect_) {
            case Expect::Colon:
                if (ch != ':') {
                    return fail("expected ':' after property name", pos_);
                }
                pos_ += 1;
                expect_ = Expect::Value;
                continue;
            case Expect::CommaOrEnd:
                if (ch == ',') {
                    pos_ += 1;
                    expect_ = after_comma();
                    continue;
                }
                if (ch == ']' && in_array()) {
                    return close_container(ContainerKind::Array);
                }
                if (ch == '}' && in_object()) {
                    return close_container(ContainerKind::Object);
                }
                return fail(in_array() ? "expected ',' or ']'" : "expected ',' or '}'", pos_);
            case Expect::KeyOrObjectEnd:
                if (ch == '}') {
                    return close_container(ContainerKind::Object);
                }
                [[fallthrough]];
            case Expect::Key:
                if (ch == '}') {
                    return fail("trailing comma is not allowed", pos_);
                }
                if (ch != '\"') {
                    return fail("expected property name", pos_);
                }
                return finish_token(lex_string(TokenKind::PropertyName));
            case Expect::ValueOrArrayEnd:
                if (ch == ']') {
                    return close_container(ContainerKind::Array);
                }
                [[fallthrough]];
            case Expect::Value:
                return read_value(ch);
        }
        return fail("invalid tokenizer state", pos_);
    }
}

common::StreamResult<bool> Tokenizer::try_skip() {
    if (!is_container_start(kind_)) {
        return true;
    }
    std::size_t target = token_depth_;
    while (true) {
        auto more = read();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return false;
        }
        if ((kind_ == TokenKind::ObjectEnd || kind_ == TokenKind::ArrayEnd) && token_depth_ == target) {
            return true;
        }
    }
}

void Tokenizer::save_state(TokenizerState &out) const {
    out.stack.assign(stack_.begin(), stack_.end());
    out.expect = expect_;
    out.options = options_;
    out.offset = base_offset_ + pos_;
}

TokenizerState Tokenizer::state() const {
    TokenizerState out;
    save_state(out);
    return out;
}

common::StreamResult<bool> Tokenizer::read_value(char ch) {
    switch (ch) {
        case '{':
            return open_container(ContainerKind::Object);
        case '[':
            return open_container(ContainerKind::Array);
        case '\"':
            return finish_token(lex_string(TokenKind::String));
        case 't':
            return finish_token(lex_literal("true", TokenKind::True));
        case 'f':
            return finish_token(lex_literal("false", TokenKind::False));
        case 'n':
            return finish_token(lex_literal("null", TokenKind::Null));
        case ']':
            if (in_array()) {
                return fail("trailing comma is not allowed", pos_);
            }
            break;
        default:
            if (ch == '-' || is_digit(ch)) {
                return finish_token(lex_number());
            }
            break;
    }
    return fail("unexpected character", pos_);
}

common::StreamResult<bool> Tokenizer::finish_token(LexResult result) {
    switch (result) {
        case LexResult::Ok:
            token_depth_ = stack_.size();
            if (kind_ == TokenKind::PropertyName) {
                expect_ = Expect::Colon;
            } else {
                after_value();
            }
            return true;
        case LexResult::NeedMore:
            pos_ = token_start_;
            kind_ = TokenKind::None;
            return false;
        case LexResult::Error:
            break;
    }
    kind_ = TokenKind::None;
    return std::unexpected(*error_);
}

common::StreamResult<bool> Tokenizer::finish_span() {
    pos_ = span_.size();
    token_start_ = pos_;
    if (final_ && !stack_.empty()) {
        return fail("unexpected end of input", span_.size());
    }
    return false;
}

common::StreamResult<bool> Tokenizer::open_container(ContainerKind container) {
    if (stack_.size() >= options_.effective_max_depth()) {
        return fail("maximum nesting depth exceeded", pos_);
    }
    token_depth_ = stack_.size();
    stack_.push_back(container);
    pos_ += 1;
    if (container == ContainerKind::Object) {
        kind_ = TokenKind::ObjectStart;
        expect_ = Expect::KeyOrObjectEnd;
    } else {
        kind_ = TokenKind::ArrayStart;
        expect_ = Expect::ValueOrArrayEnd;
    }
    return true;
}

common::StreamResult<bool> Tokenizer::close_container(ContainerKind container) {
    stack_.pop_back();
    token_depth_ = stack_.size();
    pos_ += 1;
    kind_ = container == ContainerKind::Object ? TokenKind::ObjectEnd : TokenKind::ArrayEnd;
    after_value();
    return true;
}

common::StreamResult<bool> Tokenizer::fail(const char *message, std::size_t local) {
    set_error(message, local);
    kind_ = TokenKind::None;
    return std::unexpected(*error_);
}

Tokenizer::LexResult Tokenizer::lex_string(TokenKind kind) {
    std::size_t i = token_start_ + 1;
    while (i < span_.size()) {
        unsigned char ch = static_cast<unsigned char>(span_[i]);
        if (ch == '\"') {
            kind_ = kind;
            pos_ = i + 1;
            return LexResult::Ok;
        }
        if (ch == '\\') {
            has_escapes_ = true;
            if (i + 1 >= span_.size()) {
                return need_more_or("unterminated escape sequence", i);
            }
            char esc = span_[i + 1];
            switch (esc) {
                case '\"':
                case '\\':
                case '/':
                case 'b':
                case 'f':
                case 'n':
                case 'r':
                case 't':
                    i += 2;
                    break;
                case 'u': {
                    i += 2;
                    std::uint32_t code = 0;
                    LexResult result = lex_hex4(i, code);
                    if (result != LexResult::Ok) {
                        return result;
                    }
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i >= span_.size()) {
                            return need_more_or("invalid unicode surrogate pair", i);
                        }
                        if (span_[i] != '\\') {
                            return set_error("invalid unicode surrogate pair", i);
                        }
                        if (i + 1 >= span_.size()) {
                            return need_more_or("invalid unicode surrogate pair", i);
                        }
                        if (span_[i + 1] != 'u') {
                            return set_error("invalid unicode surrogate pair", i);
                        }
                        i += 2;
                        std::uint32_t low = 0;
                        result = lex_hex4(i, low);
                        if (result != LexResult::Ok) {
                            return result;
                        }
                        if (low < 0xDC00 || low > 0xDFFF) {
                            return set_error("invalid unicode surrogate pair", i);
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return set_error("invalid unicode surrogate pair", i);
                    }
                    break;
                }
                default:
                    return set_error("invalid escape sequence", i);
            }
            continue;
        }
        if (ch < 0x20) {
            return set_error("invalid control character in string", i);
        }
        if (ch < 0x80) {
            i += 1;
            continue;
        }
        std::size_t cursor = i;
        std::uint32_t codepoint = 0;
        Utf8Status status = utf8_next_codepoint(span_, cursor, codepoint);
        if (status == Utf8Status::Truncated) {
            return need_more_or("invalid utf-8 sequence", i);
        }
        if (status == Utf8Status::Invalid) {
            return set_error("invalid utf-8 sequence", i);
        }
        i = cursor;
    }
    return need_more_or("unterminated string", span_.size());
}

Tokenizer::LexResult Tokenizer::lex_hex4(std::size_t &i, std::uint32_t &code) {
    code = 0;
    for (std::size_t idx = 0; idx < 4; ++idx) {
        if (i + idx >= span_.size()) {
            return need_more_or("invalid unicode escape", i);
        }
        int digit = hex_value(span_[i + idx]);
        if (digit < 0) {
            return set_error("invalid unicode escape", i + idx);
        }
        code = (code << 4) | static_cast<std::uint32_t>(digit);
    }
    i += 4;
    return LexResult::Ok;
}

Tokenizer::LexResult Tokenizer::lex_number() {
    std::size_t start = token_start_;
    std::size_t i = start;
    if (span_[i] == '-') {
        i += 1;
        if (i >= span_.size()) {
            return need_more_or("invalid number", start);
        }
    }
    if (span_[i] == '0') {
        i += 1;
        if (i < span_.size() && is_digit(span_[i])) {
            return set_error("leading zero in number", start);
        }
    } else if (span_[i] >= '1' && span_[i] <= '9') {
        while (i < span_.size() && is_digit(span_[i])) {
            i += 1;
        }
    } else {
        return set_error("invalid number", start);
    }
    if (i < span_.size() && span_[i] == '.') {
        i += 1;
        if (i >= span_.size()) {
            return need_more_or("invalid number", start);
        }
        if (!is_digit(span_[i])) {
            return set_error("invalid number", start);
        }
        while (i < span_.size() && is_digit(span_[i])) {
            i += 1;
        }
    }
    if (i < span_.size() && (span_[i] == 'e' || span_[i] == 'E')) {
        i += 1;
        if (i >= span_.size()) {
            return need_more_or("invalid number", start);
        }
        if (span_[i] == '+' || span_[i] == '-') {
            i += 1;
            if (i >= span_.size()) {
                return need_more_or("invalid number", start);
            }
        }
        if (!is_digit(span_[i])) {
            return set_error("invalid number", start);
        }
        while (i < span_.size() && is_digit(span_[i])) {
            i += 1;
        }
    }
    if (i == span_.size()) {
        if (!final_) {
            return LexResult::NeedMore;
        }
    } else if (!is_delimiter(span_[i])) {
        return set_error("invalid number", start);
    }
    kind_ = TokenKind::Number;
    pos_ = i;
    return LexResult::Ok;
}

Tokenizer::LexResult Tokenizer::lex_literal(std::string_view literal, TokenKind kind) {
    std::size_t start = token_start_;
    for (std::size_t i = 0; i < literal.size(); ++i) {
        if (start + i >= span_.size()) {
            return need_more_or("invalid literal", start);
        }
        if (span_[start + i] != literal[i]) {
            return set_error("invalid literal", start + i);
        }
    }
    kind_ = kind;
    pos_ = start + literal.size();
    return LexResult::Ok;
}

Tokenizer::LexResult Tokenizer::lex_comment(std::size_t &end) {
    std::size_t start = token_start_;
    if (options_.comment_handling == CommentHandling::Disallow) {
        return set_error("comments are not allowed", start);
    }
    if (start + 1 >= span_.size()) {
        return need_more_or("invalid comment", start);
    }
    char next = span_[start + 1];
    if (next == '/') {
        std::size_t newline = span_.find('\n', start + 2);
        if (newline == std::string_view::npos) {
            if (!final_) {
                return LexResult::NeedMore;
            }
            end = span_.size();
            return LexResult::Ok;
        }
        end = newline + 1;
        return LexResult::Ok;
    }
    if (next == '*') {
        std::size_t close = span_.find("*/", start + 2);
        if (close == std::string_view::npos) {
            return need_more_or("unterminated comment", start);
        }
        end = close + 2;
        return LexResult::Ok;
    }
    return set_error("invalid comment", start);
}

Tokenizer::LexResult Tokenizer::need_more_or(const char *message, std::size_t local) {
    if (!final_) {
        return LexResult::NeedMore;
    }
    return set_error(message, local);
}

Tokenizer::LexResult Tokenizer::set_error(const char *message, std::size_t local) {
    if (!error_) {
        error_ = common::syntax_error(message, base_offset_ + local);
    }
    return LexResult::Error;
}

void Tokenizer::skip_whitespace() noexcept {
    while (pos_ < span_.size() && is_ws(span_[pos_])) {
        pos_ += 1;
    }
}

void Tokenizer::after_value() noexcept {
    expect_ = stack_.empty() ? Expect::Value : Expect::CommaOrEnd;
}

Expect Tokenizer::after_comma() const noexcept {
    if (in_array()) {
        return options_.allow_trailing_commas ? Expect::ValueOrArrayEnd : Expect::Value;
    }
    return options_.allow_trailing_commas ? Expect::KeyOrObjectEnd : Expect::Key;
}

bool Tokenizer::in_array() const noexcept {
    return !stack_.empty() && stack_.back() == ContainerKind::Array;
}

bool Tokenizer::in_object() const noexcept {
    return !stack_.empty() && stack_.back() == ContainerKind::Object;
}

} // namespace jstream::json
