#ifndef JSTREAM_COMMON_IO_ERROR_H
#define JSTREAM_COMMON_IO_ERROR_H

#include <cstdint>
#include <string_view>

namespace jstream::common {

// Failure kinds a byte source can report. Carried inside StreamError when the
// stream fails with StreamErr::SourceFault.
enum class IoErr : std::uint16_t {
    None = 0,
    WouldBlock,
    Interrupted,
    Invalid,
    BadFd,
    IsDirectory,
    NotFound,
    ConnReset,
    TimedOut,
    Permission,
    BrokenPipe,
    NoMem,
    IoFailure,
    Aborted,
    Unknown,
};

IoErr io_err_from_errno(int err) noexcept;
std::string_view io_err_name(IoErr err) noexcept;

} // namespace jstream::common

#endif // JSTREAM_COMMON_IO_ERROR_H
