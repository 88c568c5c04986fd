#ifndef JSTREAM_COMMON_STREAM_ERROR_H
#define JSTREAM_COMMON_STREAM_ERROR_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "IoError.h"

namespace jstream::common {

enum class StreamErr : std::uint8_t {
    None = 0,
    // Bytes violate JSON grammar under the active reader options.
    Syntax,
    // Well-formed JSON that cannot be mapped onto the element type.
    Decode,
    // The stop token was triggered; not a data error.
    Cancelled,
    // The byte source itself failed; `io` holds the cause.
    SourceFault,
    // An exception escaped a coroutine body.
    Internal,
};

struct StreamError {
    StreamErr code = StreamErr::None;
    std::string message;
    // Absolute byte offset in the stream, where one is known.
    std::size_t offset = 0;
    IoErr io = IoErr::None;
};

template <typename T>
using StreamResult = std::expected<T, StreamError>;

std::string_view stream_err_name(StreamErr err) noexcept;

StreamError syntax_error(std::string message, std::size_t offset);
StreamError decode_error(std::string message, std::size_t offset);
StreamError cancelled_error();
StreamError source_fault(IoErr io, std::string message);

// "syntax error at offset 12: invalid token"
std::string describe(const StreamError &error);

} // namespace jstream::common

#endif // JSTREAM_COMMON_STREAM_ERROR_H
