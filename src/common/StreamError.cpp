#include "StreamError.h"

#include <utility>

namespace jstream::common {

std::string_view stream_err_name(StreamErr err) noexcept {
    switch (err) {
    case StreamErr::None:
        return "none";
    case StreamErr::Syntax:
        return "syntax error";
    case StreamErr::Decode:
        return "decode error";
    case StreamErr::Cancelled:
        return "cancelled";
    case StreamErr::SourceFault:
        return "source fault";
    case StreamErr::Internal:
    default:
        return "internal error";
    }
}

StreamError syntax_error(std::string message, std::size_t offset) {
    return StreamError{StreamErr::Syntax, std::move(message), offset, IoErr::None};
}

StreamError decode_error(std::string message, std::size_t offset) {
    return StreamError{StreamErr::Decode, std::move(message), offset, IoErr::None};
}

StreamError cancelled_error() {
    return StreamError{StreamErr::Cancelled, "operation cancelled", 0, IoErr::None};
}

StreamError source_fault(IoErr io, std::string message) {
    return StreamError{StreamErr::SourceFault, std::move(message), 0, io};
}

std::string describe(const StreamError &error) {
    std::string out(stream_err_name(error.code));
    switch (error.code) {
    case StreamErr::Syntax:
    case StreamErr::Decode:
        out += " at offset ";
        out += std::to_string(error.offset);
        break;
    case StreamErr::SourceFault:
        out += " (";
        out += io_err_name(error.io);
        out += ')';
        break;
    default:
        break;
    }
    if (!error.message.empty()) {
        out += ": ";
        out += error.message;
    }
    return out;
}

} // namespace jstream::common
