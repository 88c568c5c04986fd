#ifndef JSTREAM_JSON_UTF_H
#define JSTREAM_JSON_UTF_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jstream::json {

enum class Utf8Status {
    Ok,
    // The sequence is a valid prefix cut by the end of `data`.
    Truncated,
    Invalid,
};

// Decodes the code point at `pos` and advances past it. Overlong forms,
// surrogates and values above U+10FFFF are invalid.
[[nodiscard]] Utf8Status utf8_next_codepoint(std::string_view data, std::size_t &pos, std::uint32_t &codepoint);
void utf8_append(std::string &out, std::uint32_t codepoint);

int hex_value(char ch) noexcept;

} // namespace jstream::json

#endif // JSTREAM_JSON_UTF_H
