#ifndef JSTREAM_JSON_CONVERT_H
#define JSTREAM_JSON_CONVERT_H

#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../common/StreamError.h"
#include "DecoderOptions.h"
#include "JsonValue.h"

namespace jstream::json {

// Generic conversions from a parsed element. User types opt in by declaring
//
//     StreamResult<void> from_json(const JsonValue &, T &, const ConvertContext &);
//
// in their own namespace; it is found by argument-dependent lookup.

inline common::StreamError type_mismatch(std::string_view expected, const JsonValue &value,
                                         const ConvertContext &ctx) {
    std::string message = "expected ";
    message.append(expected);
    message.append(", got ");
    message.append(json_type_name(value.type()));
    return common::decode_error(std::move(message), ctx.offset);
}

inline common::StreamResult<void> from_json(const JsonValue &value, bool &out, const ConvertContext &ctx) {
    if (!value.is_bool()) {
        return std::unexpected(type_mismatch("bool", value, ctx));
    }
    out = value.as_bool();
    return {};
}

template <std::integral I>
    requires(!std::same_as<I, bool>)
common::StreamResult<void> from_json(const JsonValue &value, I &out, const ConvertContext &ctx) {
    if (!value.is_integer()) {
        return std::unexpected(type_mismatch("integer", value, ctx));
    }
    std::int64_t integer = value.as_integer();
    if (!std::in_range<I>(integer)) {
        return std::unexpected(common::decode_error("integer out of range", ctx.offset));
    }
    out = static_cast<I>(integer);
    return {};
}

template <std::floating_point F>
common::StreamResult<void> from_json(const JsonValue &value, F &out, const ConvertContext &ctx) {
    if (!value.is_number()) {
        return std::unexpected(type_mismatch("number", value, ctx));
    }
    out = static_cast<F>(value.as_number());
    return {};
}

inline common::StreamResult<void> from_json(const JsonValue &value, std::string &out, const ConvertContext &ctx) {
    if (!value.is_string()) {
        return std::unexpected(type_mismatch("string", value, ctx));
    }
    out = value.as_string();
    return {};
}

inline common::StreamResult<void> from_json(const JsonValue &value, JsonValue &out, const ConvertContext &) {
    out = value;
    return {};
}

template <typename U>
common::StreamResult<void> from_json(const JsonValue &value, std::optional<U> &out, const ConvertContext &ctx) {
    if (value.is_null()) {
        out.reset();
        return {};
    }
    U inner{};
    auto converted = from_json(value, inner, ctx);
    if (!converted) {
        return converted;
    }
    out = std::move(inner);
    return {};
}

template <typename U>
common::StreamResult<void> from_json(const JsonValue &value, std::vector<U> &out, const ConvertContext &ctx) {
    if (!value.is_array()) {
        return std::unexpected(type_mismatch("array", value, ctx));
    }
    out.clear();
    out.reserve(value.as_array().size());
    for (const JsonValue &item : value.as_array()) {
        U converted{};
        auto result = from_json(item, converted, ctx);
        if (!result) {
            return result;
        }
        out.push_back(std::move(converted));
    }
    return {};
}

template <typename U>
common::StreamResult<void> from_json(const JsonValue &value, std::map<std::string, U> &out,
                                     const ConvertContext &ctx) {
    if (!value.is_object()) {
        return std::unexpected(type_mismatch("object", value, ctx));
    }
    out.clear();
    for (const JsonMember &member : value.as_object()) {
        U converted{};
        auto result = from_json(member.value, converted, ctx);
        if (!result) {
            return result;
        }
        out.insert_or_assign(member.key, std::move(converted));
    }
    return {};
}

template <typename T>
concept GenericDecodable = requires(const JsonValue &value, T &out, const ConvertContext &ctx) {
    { from_json(value, out, ctx) } -> std::same_as<common::StreamResult<void>>;
};

// Converts member `name` of `object` into `out`. A missing member leaves `out`
// untouched; a null one is only accepted by optional members.
template <typename U>
common::StreamResult<void> read_field(const JsonValue &object, std::string_view name, U &out,
                                      const ConvertContext &ctx) {
    if (!object.is_object()) {
        return std::unexpected(type_mismatch("object", object, ctx));
    }
    const JsonValue *member = object.find(name, ctx.options.case_sensitive);
    if (!member) {
        return {};
    }
    return from_json(*member, out, ctx);
}

} // namespace jstream::json

#endif // JSTREAM_JSON_CONVERT_H
