#ifndef JSTREAM_JSON_JSON_VALUE_H
#define JSTREAM_JSON_JSON_VALUE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "../common/StreamError.h"
#include "ReaderOptions.h"

namespace jstream::json {

class JsonValue;
struct JsonMember;
class ValueReader;

using JsonArray = std::vector<JsonValue>;
// Members in document order; duplicate keys are kept.
using JsonObject = std::vector<JsonMember>;

enum class JsonType : std::uint8_t {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Array,
    Object,
};

std::string_view json_type_name(JsonType type) noexcept;

class JsonValue {
public:
    JsonValue() = default;

    static JsonValue make_null();
    static JsonValue make_bool(bool value);
    static JsonValue make_integer(std::int64_t value);
    static JsonValue make_float(double value);
    static JsonValue make_string(std::string value);
    static JsonValue make_array(JsonArray value = {});
    static JsonValue make_object(JsonObject value = {});

    [[nodiscard]] JsonType type() const noexcept {
        return static_cast<JsonType>(value_.index());
    }

    [[nodiscard]] bool is_null() const noexcept {
        return type() == JsonType::Null;
    }

    [[nodiscard]] bool is_bool() const noexcept {
        return type() == JsonType::Bool;
    }

    [[nodiscard]] bool is_integer() const noexcept {
        return type() == JsonType::Integer;
    }

    [[nodiscard]] bool is_float() const noexcept {
        return type() == JsonType::Float;
    }

    [[nodiscard]] bool is_number() const noexcept {
        return is_integer() || is_float();
    }

    [[nodiscard]] bool is_string() const noexcept {
        return type() == JsonType::String;
    }

    [[nodiscard]] bool is_array() const noexcept {
        return type() == JsonType::Array;
    }

    [[nodiscard]] bool is_object() const noexcept {
        return type() == JsonType::Object;
    }

    // Accessors require the matching type.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_float() const;
    // Integer or float, widened to double.
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string &as_string() const;
    [[nodiscard]] const JsonArray &as_array() const;
    [[nodiscard]] JsonArray &as_array();
    [[nodiscard]] const JsonObject &as_object() const;
    [[nodiscard]] JsonObject &as_object();

    // Last member named `key`, or null. Without case sensitivity an exact match
    // still wins over an ASCII case-folded one.
    [[nodiscard]] const JsonValue *find(std::string_view key, bool case_sensitive = true) const;

    friend bool operator==(const JsonValue &lhs, const JsonValue &rhs);

private:
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, JsonArray, JsonObject>;

    explicit JsonValue(Storage value) : value_(std::move(value)) {
    }

    Storage value_ = nullptr;
};

struct JsonMember {
    std::string key;
    JsonValue value;

    friend bool operator==(const JsonMember &lhs, const JsonMember &rhs) = default;
};

// Parses exactly one JSON value (surrounding whitespace allowed). Integers
// that do not fit int64 become floats.
[[nodiscard]] common::StreamResult<JsonValue> parse_value(std::string_view text, const ReaderOptions &options = {},
                                                          std::size_t base_offset = 0);

// Builds the value whose first token `reader` is positioned on; the reader is
// left on its last token.
[[nodiscard]] common::StreamResult<JsonValue> read_json_value(ValueReader &reader);

// Compact JSON text.
[[nodiscard]] std::string to_json(const JsonValue &value);

bool ascii_iequals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace jstream::json

#endif // JSTREAM_JSON_JSON_VALUE_H
