#ifndef JSTREAM_IO_CHUNK_SOURCE_H
#define JSTREAM_IO_CHUNK_SOURCE_H

#include <cstddef>
#include <stop_token>

#include "../async/Task.h"
#include "ByteSequence.h"

namespace jstream::io {

struct ReadResult {
    // Every unconsumed byte the source holds. Valid until advance_to().
    ByteSequence buffer;
    // The source will never produce more bytes than `buffer`.
    bool is_completed = false;
    // The read returned early because it was cancelled, possibly without new
    // bytes.
    bool is_canceled = false;
};

// Pull-based byte source. A reader alternates read() and advance_to():
//
//   * read() completes immediately when bytes past the examined mark are
//     buffered, or the source is completed, faulted or cancelled; otherwise it
//     suspends until one of those happens.
//   * advance_to(consumed, examined) takes offsets into the last returned
//     buffer with consumed <= examined <= buffer.size(). Bytes before
//     `consumed` are released and never delivered again; bytes up to
//     `examined` were looked at, so the next read() waits for more.
//
// A failing source completes read() with a StreamErr::SourceFault error.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual async::Task<ReadResult> read(std::stop_token stop_token) = 0;
    virtual void advance_to(std::size_t consumed, std::size_t examined) = 0;
};

} // namespace jstream::io

#endif // JSTREAM_IO_CHUNK_SOURCE_H
