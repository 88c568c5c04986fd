#include "FdChunkSource.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

#include "../common/Assert.h"
#include "../common/Log.h"

namespace jstream::io {

FdChunkSource::FdChunkSource(int fd, FdChunkSourceOptions options) : fd_(fd), options_(options) {
    if (options_.read_size == 0) {
        options_.read_size = 1;
    }
}

async::Task<ReadResult> FdChunkSource::read(std::stop_token stop_token) {
    if (stop_token.stop_requested()) {
        co_return snapshot(true);
    }
    if (fault_) {
        co_return std::unexpected(*fault_);
    }
    auto filled = fill();
    if (!filled) {
        co_return std::unexpected(filled.error());
    }
    co_return snapshot(false);
}

void FdChunkSource::advance_to(std::size_t consumed, std::size_t examined) {
    JSTREAM_ASSERT(consumed <= examined);
    JSTREAM_ASSERT(examined <= last_read_size_);
    buffer_.consume(consumed);
    examined_ = examined - consumed;
    last_read_size_ = 0;
}

common::StreamResult<void> FdChunkSource::fill() {
    while (!eof_ && buffer_.size() <= examined_) {
        char *dst = buffer_.prepare(options_.read_size);
        if (!dst) {
            fault_ = common::source_fault(common::IoErr::NoMem, "read buffer allocation failed");
            return std::unexpected(*fault_);
        }
        ssize_t n = ::read(fd_, dst, options_.read_size);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            log::warn("read(fd={}) failed: {}", fd_, std::strerror(err));
            fault_ = common::source_fault(common::io_err_from_errno(err), std::string("read failed: ") + std::strerror(err));
            return std::unexpected(*fault_);
        }
        if (n == 0) {
            eof_ = true;
            log::trace("fd={} reached end of input after {} bytes", fd_, total_read_);
            break;
        }
        buffer_.commit(static_cast<std::size_t>(n));
        total_read_ += static_cast<std::size_t>(n);
    }
    return {};
}

ReadResult FdChunkSource::snapshot(bool canceled) {
    ReadResult result;
    result.buffer.append(buffer_.view());
    result.is_completed = eof_;
    result.is_canceled = canceled;
    last_read_size_ = buffer_.size();
    return result;
}

} // namespace jstream::io
