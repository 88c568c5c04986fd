#include "Utf.h"

namespace jstream::json {

Utf8Status utf8_next_codepoint(std::string_view data, std::size_t &pos, std::uint32_t &codepoint) {
    unsigned char ch = static_cast<unsigned char>(data[pos]);
    if (ch < 0x80) {
        codepoint = ch;
        pos += 1;
        return Utf8Status::Ok;
    }
    int needed = 0;
    std::uint32_t code = 0;
    std::uint32_t min_value = 0;
    if ((ch & 0xE0) == 0xC0) {
        needed = 1;
        code = ch & 0x1F;
        min_value = 0x80;
    } else if ((ch & 0xF0) == 0xE0) {
        needed = 2;
        code = ch & 0x0F;
        min_value = 0x800;
    } else if ((ch & 0xF8) == 0xF0) {
        needed = 3;
        code = ch & 0x07;
        min_value = 0x10000;
    } else {
        return Utf8Status::Invalid;
    }
    for (int idx = 1; idx <= needed; ++idx) {
        if (pos + static_cast<std::size_t>(idx) >= data.size()) {
            return Utf8Status::Truncated;
        }
        unsigned char next = static_cast<unsigned char>(data[pos + idx]);
        if ((next & 0xC0) != 0x80) {
            return Utf8Status::Invalid;
        }
        code = (code << 6) | (next & 0x3F);
    }
    if (code < min_value || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return Utf8Status::Invalid;
    }
    pos += static_cast<std::size_t>(needed) + 1;
    codepoint = code;
    return Utf8Status::Ok;
}

void utf8_append(std::string &out, std::uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

} // namespace jstream::json
