#ifndef JSTREAM_IO_BYTE_SEQUENCE_H
#define JSTREAM_IO_BYTE_SEQUENCE_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jstream::io {

// Ordered, possibly non-contiguous view of bytes owned by a ChunkSource.
class ByteSequence {
public:
    ByteSequence() = default;

    void append(std::string_view segment);

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size_ == 0;
    }

    [[nodiscard]] std::size_t segment_count() const noexcept {
        return segments_.size();
    }

    [[nodiscard]] std::string_view segment(std::size_t index) const {
        return segments_[index];
    }

    // Contiguous view of the whole sequence. Returns the single segment as is;
    // otherwise copies every segment into `scratch` and views that.
    [[nodiscard]] std::string_view linearize(std::string &scratch) const;

    [[nodiscard]] std::string to_string() const;

private:
    std::vector<std::string_view> segments_;
    std::size_t size_ = 0;
};

} // namespace jstream::io

#endif // JSTREAM_IO_BYTE_SEQUENCE_H
