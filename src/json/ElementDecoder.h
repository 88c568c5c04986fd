#ifndef JSTREAM_JSON_ELEMENT_DECODER_H
#define JSTREAM_JSON_ELEMENT_DECODER_H

#include <concepts>
#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "../common/StreamError.h"
#include "Convert.h"
#include "DecodePlan.h"
#include "DecoderOptions.h"
#include "DecoderRegistry.h"
#include "JsonValue.h"
#include "ReaderOptions.h"
#include "ValueReader.h"

namespace jstream::json {

// Turns the exact bytes of one complete array element into a T.
template <typename T>
class ElementDecoder {
public:
    virtual ~ElementDecoder() = default;

    // `offset` is the absolute stream offset of span[0].
    virtual common::StreamResult<T> decode(std::string_view span, std::size_t offset) = 0;
};

template <typename T>
    requires std::default_initializable<T>
class PlanDecoder final : public ElementDecoder<T> {
public:
    PlanDecoder(DecodePlanPtr<T> plan, const ReaderOptions &reader_options, const DecoderOptions &options)
        : plan_(std::move(plan)), reader_options_(reader_options), options_(options) {
    }

    common::StreamResult<T> decode(std::string_view span, std::size_t offset) override {
        ValueReader reader(span, reader_options_, offset);
        auto moved = reader.next();
        if (!moved) {
            return std::unexpected(moved.error());
        }
        T value{};
        auto result = plan_->read(reader, value, ConvertContext{options_, offset});
        if (!result) {
            return std::unexpected(result.error());
        }
        auto finished = reader.finish();
        if (!finished) {
            return std::unexpected(finished.error());
        }
        return value;
    }

private:
    DecodePlanPtr<T> plan_;
    ReaderOptions reader_options_;
    DecoderOptions options_;
};

template <typename T>
    requires std::default_initializable<T> && GenericDecodable<T>
class GenericDecoder final : public ElementDecoder<T> {
public:
    GenericDecoder(const ReaderOptions &reader_options, const DecoderOptions &options)
        : reader_options_(reader_options), options_(options) {
    }

    common::StreamResult<T> decode(std::string_view span, std::size_t offset) override {
        auto dom = parse_value(span, reader_options_, offset);
        if (!dom) {
            return std::unexpected(dom.error());
        }
        T value{};
        auto result = from_json(*dom, value, ConvertContext{options_, offset});
        if (!result) {
            return std::unexpected(result.error());
        }
        return value;
    }

private:
    ReaderOptions reader_options_;
    DecoderOptions options_;
};

// Picks the decoder of one stream. A plan passed in wins over a registered
// one; the generic path needs a from_json conversion for T.
template <typename T>
    requires std::default_initializable<T>
common::StreamResult<std::unique_ptr<ElementDecoder<T>>> select_decoder(DecodePlanPtr<T> plan,
                                                                        const DecoderRegistry *registry,
                                                                        const ReaderOptions &reader_options,
                                                                        const DecoderOptions &options,
                                                                        DecodeStrategy strategy) {
    if (strategy != DecodeStrategy::Generic) {
        if (!plan && registry) {
            plan = registry->lookup<T>();
        }
        if (plan) {
            return std::unique_ptr<ElementDecoder<T>>(
                std::make_unique<PlanDecoder<T>>(std::move(plan), reader_options, options));
        }
        if (strategy == DecodeStrategy::Descriptor) {
            return std::unexpected(common::decode_error("no decode plan supplied or registered for element type", 0));
        }
    }
    if constexpr (GenericDecodable<T>) {
        return std::unique_ptr<ElementDecoder<T>>(std::make_unique<GenericDecoder<T>>(reader_options, options));
    } else {
        return std::unexpected(
            common::decode_error("element type has neither a decode plan nor a from_json conversion", 0));
    }
}

} // namespace jstream::json

#endif // JSTREAM_JSON_ELEMENT_DECODER_H
