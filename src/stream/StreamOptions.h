#ifndef JSTREAM_STREAM_STREAM_OPTIONS_H
#define JSTREAM_STREAM_STREAM_OPTIONS_H

#include <cstddef>

#include "../json/DecoderOptions.h"
#include "../json/ReaderOptions.h"

namespace jstream::stream {

struct StreamOptions {
    json::ReaderOptions reader;
    json::DecoderOptions decoder;
    json::DecodeStrategy strategy = json::DecodeStrategy::Auto;
    // Slots reserved in the pooled element buffer before the first chunk.
    std::size_t initial_buffer_capacity = 32;
    // Any top-level value before the first '[' is a syntax error instead of
    // being skipped.
    bool require_array = false;
};

} // namespace jstream::stream

#endif // JSTREAM_STREAM_STREAM_OPTIONS_H
