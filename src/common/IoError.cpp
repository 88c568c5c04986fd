#include "IoError.h"

#include <cerrno>

namespace jstream::common {

IoErr io_err_from_errno(int err) noexcept {
    switch (err) {
    case 0:
        return IoErr::None;
    case EAGAIN:
#if EAGAIN != EWOULDBLOCK
    case EWOULDBLOCK:
#endif
        return IoErr::WouldBlock;
    case EINTR:
        return IoErr::Interrupted;
    case EINVAL:
        return IoErr::Invalid;
    case EBADF:
        return IoErr::BadFd;
    case EISDIR:
        return IoErr::IsDirectory;
    case ENOENT:
        return IoErr::NotFound;
    case ECONNRESET:
        return IoErr::ConnReset;
    case ETIMEDOUT:
        return IoErr::TimedOut;
    case EACCES:
    case EPERM:
        return IoErr::Permission;
    case EPIPE:
        return IoErr::BrokenPipe;
    case ENOMEM:
        return IoErr::NoMem;
    case EIO:
        return IoErr::IoFailure;
    case ECANCELED:
        return IoErr::Aborted;
    default:
        return IoErr::Unknown;
    }
}

std::string_view io_err_name(IoErr err) noexcept {
    switch (err) {
    case IoErr::None:
        return "none";
    case IoErr::WouldBlock:
        return "would_block";
    case IoErr::Interrupted:
        return "interrupted";
    case IoErr::Invalid:
        return "invalid";
    case IoErr::BadFd:
        return "bad_fd";
    case IoErr::IsDirectory:
        return "is_directory";
    case IoErr::NotFound:
        return "not_found";
    case IoErr::ConnReset:
        return "conn_reset";
    case IoErr::TimedOut:
        return "timed_out";
    case IoErr::Permission:
        return "permission";
    case IoErr::BrokenPipe:
        return "broken_pipe";
    case IoErr::NoMem:
        return "no_mem";
    case IoErr::IoFailure:
        return "io_failure";
    case IoErr::Aborted:
        return "aborted";
    case IoErr::Unknown:
    default:
        return "unknown";
    }
}

} // namespace jstream::common
