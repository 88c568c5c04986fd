#ifndef JSTREAM_JSON_DECODER_OPTIONS_H
#define JSTREAM_JSON_DECODER_OPTIONS_H

#include <cstddef>
#include <cstdint>

namespace jstream::json {

enum class DecodeStrategy : std::uint8_t {
    // Plan when one is supplied or registered, generic conversion otherwise.
    Auto,
    // Plan only.
    Descriptor,
    // DOM plus from_json only.
    Generic,
};

struct DecoderOptions {
    // Property names match member names exactly; otherwise ASCII case is
    // ignored and an exact match wins.
    bool case_sensitive = false;
};

// Passed to every from_json conversion.
struct ConvertContext {
    DecoderOptions options;
    // Offset reported by conversion errors: the start of the element.
    std::size_t offset = 0;
};

} // namespace jstream::json

#endif // JSTREAM_JSON_DECODER_OPTIONS_H
