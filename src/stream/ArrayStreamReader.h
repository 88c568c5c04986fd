#ifndef JSTREAM_STREAM_ARRAY_STREAM_READER_H
#define JSTREAM_STREAM_ARRAY_STREAM_READER_H

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "../async/AsyncGenerator.h"
#include "../common/Log.h"
#include "../common/StreamError.h"
#include "../common/mem/ElementBufferPool.h"
#include "../io/ChunkSource.h"
#include "../json/DecodePlan.h"
#include "../json/DecoderRegistry.h"
#include "../json/ElementDecoder.h"
#include "ArrayScanner.h"
#include "StreamOptions.h"

namespace jstream::stream {

template <typename T>
struct ArrayReadParams {
    StreamOptions options;
    // Explicit plan; takes precedence over the registry.
    json::DecodePlanPtr<T> plan;
    const json::DecoderRegistry *registry = nullptr;
    // Defaults to ElementBufferPool<T>::shared().
    mem::ElementBufferPool<T> *pool = nullptr;
    std::stop_token stop_token;
};

// Streams the elements of the first top-level JSON array in `source`.
//
// Each pull hands one chunk to the scanner; every element completed by that
// chunk is decoded into a pooled buffer, the source is told how far it may
// discard, and the batch is yielded in order. The stream ends after the
// closing ']' (bytes after it are left unread) or when the source completes.
// A syntax, decode or source error ends the stream after the elements decoded
// before it in the same chunk have been yielded. Cancellation through
// `params.stop_token` is checked before every pull and interrupts a pending
// one.
//
// `source`, the registry and the pool must outlive the generator.
template <typename T>
async::AsyncGenerator<T> read_array(io::ChunkSource &source, ArrayReadParams<T> params = {}) {
    const StreamOptions &options = params.options;
    auto decoder =
        json::select_decoder<T>(std::move(params.plan), params.registry, options.reader, options.decoder,
                                options.strategy);
    if (!decoder) {
        log::warn("array stream rejected: {}", common::describe(decoder.error()));
        co_return std::unexpected(std::move(decoder.error()));
    }

    mem::ElementBufferPool<T> &pool = params.pool ? *params.pool : mem::ElementBufferPool<T>::shared();
    mem::PooledBuffer<T> buffer = pool.acquire(options.initial_buffer_capacity);
    ArrayScanner scanner(options.reader, options.require_array);
    std::stop_token stop_token = params.stop_token;
    std::string scratch;
    std::size_t emitted = 0;
    std::size_t cycles = 0;

    log::debug("array stream started (buffer capacity {})", buffer.capacity());
    while (true) {
        if (stop_token.stop_requested()) {
            log::debug("array stream cancelled after {} elements", emitted);
            co_return std::unexpected(common::cancelled_error());
        }
        auto pulled = co_await source.read(stop_token);
        if (!pulled) {
            log::warn("array stream source failed: {}", common::describe(pulled.error()));
            co_return std::unexpected(std::move(pulled.error()));
        }
        if (pulled->is_canceled || stop_token.stop_requested()) {
            log::debug("array stream cancelled after {} elements", emitted);
            co_return std::unexpected(common::cancelled_error());
        }
        bool completed = pulled->is_completed;
        if (pulled->buffer.empty() && completed) {
            break;
        }

        std::string_view chunk = pulled->buffer.linearize(scratch);
        scanner.begin_chunk(chunk, completed);
        std::optional<common::StreamError> failure;
        while (true) {
            auto element = scanner.next_element();
            if (!element) {
                failure = std::move(element.error());
                break;
            }
            if (!*element) {
                break;
            }
            auto value = (*decoder)->decode((*element)->span, (*element)->offset);
            if (!value) {
                failure = std::move(value.error());
                break;
            }
            buffer.push_back(std::move(*value));
        }
        source.advance_to(scanner.consumed(), chunk.size());
        cycles += 1;
        log::trace("array stream cycle {}: {} bytes, {} consumed, {} elements", cycles, chunk.size(),
                   scanner.consumed(), buffer.size());

        for (std::size_t i = 0; i < buffer.size(); ++i) {
            co_yield std::move(buffer[i]);
        }
        emitted += buffer.size();
        buffer.clear();

        if (failure) {
            log::warn("array stream failed after {} elements: {}", emitted, common::describe(*failure));
            co_return std::unexpected(std::move(*failure));
        }
        if (scanner.done() || completed) {
            break;
        }
    }
    log::debug("array stream finished: {} elements in {} cycles", emitted, cycles);
    co_return {};
}

} // namespace jstream::stream

#endif // JSTREAM_STREAM_ARRAY_STREAM_READER_H
