#ifndef JSTREAM_IO_FD_CHUNK_SOURCE_H
#define JSTREAM_IO_FD_CHUNK_SOURCE_H

#include <cstddef>
#include <optional>
#include <stop_token>

#include "../common/StreamError.h"
#include "../common/mem/Buffer.h"
#include "ChunkSource.h"

namespace jstream::io {

struct FdChunkSourceOptions {
    std::size_t read_size = 16 * 1024;
};

// ChunkSource over a readable file descriptor (file, pipe, stdin). Reads
// block the calling thread. The descriptor is not owned.
class FdChunkSource final : public ChunkSource {
public:
    explicit FdChunkSource(int fd, FdChunkSourceOptions options = {});
    ~FdChunkSource() override = default;
    FdChunkSource(const FdChunkSource &) = delete;
    FdChunkSource &operator=(const FdChunkSource &) = delete;

    async::Task<ReadResult> read(std::stop_token stop_token) override;
    void advance_to(std::size_t consumed, std::size_t examined) override;

    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }

    [[nodiscard]] std::size_t total_read() const noexcept {
        return total_read_;
    }

private:
    common::StreamResult<void> fill();
    ReadResult snapshot(bool canceled);

    int fd_;
    FdChunkSourceOptions options_;
    mem::Buffer buffer_;
    std::size_t examined_ = 0;
    std::size_t last_read_size_ = 0;
    std::size_t total_read_ = 0;
    bool eof_ = false;
    std::optional<common::StreamError> fault_;
};

} // namespace jstream::io

#endif // JSTREAM_IO_FD_CHUNK_SOURCE_H
