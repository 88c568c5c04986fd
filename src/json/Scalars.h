#ifndef JSTREAM_JSON_SCALARS_H
#define JSTREAM_JSON_SCALARS_H

#include <charconv>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../common/StreamError.h"

namespace jstream::json {

// Decodes a quoted JSON string token (quotes included) into UTF-8.
[[nodiscard]] common::StreamResult<std::string> unescape_string(std::string_view token, std::size_t offset);
[[nodiscard]] common::StreamResult<void> unescape_string_into(std::string_view token, std::size_t offset,
                                                              std::string &out);

// Integer value of a number token; nullopt when it has a fraction or exponent
// or does not fit I.
template <std::integral I>
[[nodiscard]] std::optional<I> parse_integer(std::string_view text) {
    I value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// nullopt on overflow to infinity.
[[nodiscard]] std::optional<double> parse_double(std::string_view text);

} // namespace jstream::json

#endif // JSTREAM_JSON_SCALARS_H
