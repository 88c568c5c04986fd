#ifndef JSTREAM_JSON_READER_OPTIONS_H
#define JSTREAM_JSON_READER_OPTIONS_H

#include <cstddef>
#include <cstdint>

namespace jstream::json {

enum class CommentHandling : std::uint8_t {
    // A comment is a syntax error.
    Disallow,
    // Comments are consumed silently.
    Skip,
    // Comments are reported as TokenKind::Comment tokens.
    Allow,
};

struct ReaderOptions {
    CommentHandling comment_handling = CommentHandling::Disallow;
    bool allow_trailing_commas = false;
    // Zero selects kDefaultMaxDepth.
    std::size_t max_depth = 64;

    static constexpr std::size_t kDefaultMaxDepth = 64;

    [[nodiscard]] std::size_t effective_max_depth() const noexcept {
        return max_depth == 0 ? kDefaultMaxDepth : max_depth;
    }
};

} // namespace jstream::json

#endif // JSTREAM_JSON_READER_OPTIONS_H
