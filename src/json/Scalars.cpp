#include "Scalars.h"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

#include "Utf.h"

namespace jstream::json {
namespace {

bool read_hex4(std::string_view body, std::size_t &i, std::uint32_t &code) {
    if (i + 4 > body.size()) {
        return false;
    }
    code = 0;
    for (std::size_t idx = 0; idx < 4; ++idx) {
        int digit = hex_value(body[i + idx]);
        if (digit < 0) {
            return false;
        }
        code = (code << 4) | static_cast<std::uint32_t>(digit);
    }
    i += 4;
    return true;
}

} // namespace

common::StreamResult<std::string> unescape_string(std::string_view token, std::size_t offset) {
    std::string out;
    auto result = unescape_string_into(token, offset, out);
    if (!result) {
        return std::unexpected(result.error());
    }
    return out;
}

common::StreamResult<void> unescape_string_into(std::string_view token, std::size_t offset, std::string &out) {
    out.clear();
    if (token.size() < 2 || token.front() != '\"' || token.back() != '\"') {
        return std::unexpected(common::syntax_error("invalid string token", offset));
    }
    std::string_view body = token.substr(1, token.size() - 2);
    out.reserve(body.size());
    std::size_t i = 0;
    while (i < body.size()) {
        std::size_t run = body.find('\\', i);
        if (run == std::string_view::npos) {
            out.append(body.substr(i));
            break;
        }
        out.append(body.substr(i, run - i));
        i = run;
        if (i + 1 >= body.size()) {
            return std::unexpected(common::syntax_error("unterminated escape sequence", offset + 1 + i));
        }
        char esc = body[i + 1];
        i += 2;
        switch (esc) {
            case '\"':
                out.push_back('\"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                std::uint32_t code = 0;
                if (!read_hex4(body, i, code)) {
                    return std::unexpected(common::syntax_error("invalid unicode escape", offset + 1 + i));
                }
                if (code >= 0xD800 && code <= 0xDBFF) {
                    std::uint32_t low = 0;
                    if (i + 2 > body.size() || body[i] != '\\' || body[i + 1] != 'u') {
                        return std::unexpected(
                            common::syntax_error("invalid unicode surrogate pair", offset + 1 + i));
                    }
                    i += 2;
                    if (!read_hex4(body, i, low) || low < 0xDC00 || low > 0xDFFF) {
                        return std::unexpected(
                            common::syntax_error("invalid unicode surrogate pair", offset + 1 + i));
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                } else if (code >= 0xDC00 && code <= 0xDFFF) {
                    return std::unexpected(common::syntax_error("invalid unicode surrogate pair", offset + 1 + i));
                }
                utf8_append(out, code);
                break;
            }
            default:
                return std::unexpected(common::syntax_error("invalid escape sequence", offset + 1 + i - 2));
        }
    }
    return {};
}

std::optional<double> parse_double(std::string_view text) {
    std::string number(text);
    errno = 0;
    char *end_ptr = nullptr;
    double value = std::strtod(number.c_str(), &end_ptr);
    if (end_ptr != number.c_str() + number.size()) {
        return std::nullopt;
    }
    if (errno == ERANGE && std::isinf(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace jstream::json
