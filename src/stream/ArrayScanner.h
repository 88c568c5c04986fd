#ifndef JSTREAM_STREAM_ARRAY_SCANNER_H
#define JSTREAM_STREAM_ARRAY_SCANNER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "../common/StreamError.h"
#include "../json/ReaderOptions.h"
#include "../json/Tokenizer.h"

namespace jstream::stream {

struct ScannedElement {
    // Exact bytes of the element, valid while the chunk is.
    std::string_view span;
    // Absolute stream offset of span[0].
    std::size_t offset = 0;
};

// Finds the elements of the first top-level array in a sequence of chunks.
// Each chunk starts at the previous chunk's consumed() mark; the tokenizer
// state is carried across chunks only at the points consumed() covers, so a
// partial element is scanned again, whole, from the next chunk.
class ArrayScanner {
public:
    enum class Phase : std::uint8_t {
        AwaitingArrayStart,
        InsideArray,
        Done,
    };

    explicit ArrayScanner(const json::ReaderOptions &options, bool require_array = false);

    void begin_chunk(std::string_view chunk, bool final_chunk);

    // Next complete element of the current chunk; nullopt when the chunk holds
    // no further complete element or the array has ended.
    [[nodiscard]] common::StreamResult<std::optional<ScannedElement>> next_element();

    // Bytes of the current chunk that never need to be seen again.
    [[nodiscard]] std::size_t consumed() const noexcept {
        return consumed_;
    }

    [[nodiscard]] Phase phase() const noexcept {
        return phase_;
    }

    [[nodiscard]] bool done() const noexcept {
        return phase_ == Phase::Done;
    }

    // Absolute stream offset of consumed().
    [[nodiscard]] std::size_t stream_offset() const noexcept {
        return committed_.offset;
    }

    [[nodiscard]] std::size_t element_count() const noexcept {
        return element_count_;
    }

private:
    void commit();

    json::TokenizerState committed_;
    std::optional<json::Tokenizer> tokenizer_;
    std::string_view chunk_;
    std::size_t chunk_offset_ = 0;
    std::size_t consumed_ = 0;
    std::size_t element_depth_ = 0;
    std::size_t element_count_ = 0;
    Phase phase_ = Phase::AwaitingArrayStart;
    bool require_array_;
};

} // namespace jstream::stream

#endif // JSTREAM_STREAM_ARRAY_SCANNER_H
