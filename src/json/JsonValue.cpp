#include "JsonValue.h"

#include <charconv>
#include <cmath>
#include <limits>

#include "../common/Assert.h"
#include "Scalars.h"
#include "ValueReader.h"

namespace jstream::json {
namespace {

char ascii_lower(char ch) {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

common::StreamResult<JsonValue> read_number(std::string_view raw, std::size_t offset) {
    if (raw.find_first_of(".eE") == std::string_view::npos) {
        if (auto integer = parse_integer<std::int64_t>(raw)) {
            return JsonValue::make_integer(*integer);
        }
    }
    auto number = parse_double(raw);
    if (!number) {
        return std::unexpected(common::syntax_error("number out of range", offset));
    }
    return JsonValue::make_float(*number);
}

void write_string(std::string &out, const std::string &str) {
    out.push_back('\"');
    for (char c : str) {
        unsigned char ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '\"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\b':
                out.append("\\b");
                break;
            case '\f':
                out.append("\\f");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    char buf[6] = {'\\', 'u', '0', '0', '0', '0'};
                    const char *hex = "0123456789ABCDEF";
                    buf[4] = hex[(ch >> 4) & 0x0F];
                    buf[5] = hex[ch & 0x0F];
                    out.append(buf, sizeof(buf));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('\"');
}

void write_value(std::string &out, const JsonValue &value) {
    switch (value.type()) {
        case JsonType::Null:
            out.append("null");
            return;
        case JsonType::Bool:
            out.append(value.as_bool() ? "true" : "false");
            return;
        case JsonType::Integer: {
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value.as_integer());
            JSTREAM_ASSERT(ec == std::errc());
            out.append(buf, static_cast<std::size_t>(ptr - buf));
            return;
        }
        case JsonType::Float: {
            double number = value.as_float();
            if (!std::isfinite(number)) {
                out.append("null");
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), number, std::chars_format::general,
                                           std::numeric_limits<double>::max_digits10);
            JSTREAM_ASSERT(ec == std::errc());
            out.append(buf, static_cast<std::size_t>(ptr - buf));
            return;
        }
        case JsonType::String:
            write_string(out, value.as_string());
            return;
        case JsonType::Array: {
            out.push_back('[');
            bool first = true;
            for (const JsonValue &item : value.as_array()) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                write_value(out, item);
            }
            out.push_back(']');
            return;
        }
        case JsonType::Object: {
            out.push_back('{');
            bool first = true;
            for (const JsonMember &member : value.as_object()) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                write_string(out, member.key);
                out.push_back(':');
                write_value(out, member.value);
            }
            out.push_back('}');
            return;
        }
    }
}

} // namespace

common::StreamResult<JsonValue> read_json_value(ValueReader &reader) {
    switch (reader.kind()) {
        case TokenKind::Null:
            return JsonValue::make_null();
        case TokenKind::True:
            return JsonValue::make_bool(true);
        case TokenKind::False:
            return JsonValue::make_bool(false);
        case TokenKind::Number:
            return read_number(reader.raw(), reader.offset());
        case TokenKind::String: {
            auto text = reader.string_value();
            if (!text) {
                return std::unexpected(text.error());
            }
            return JsonValue::make_string(std::move(*text));
        }
        case TokenKind::ArrayStart: {
            JsonArray items;
            while (true) {
                auto moved = reader.next();
                if (!moved) {
                    return std::unexpected(moved.error());
                }
                if (reader.kind() == TokenKind::ArrayEnd) {
                    break;
                }
                auto item = read_json_value(reader);
                if (!item) {
                    return item;
                }
                items.push_back(std::move(*item));
            }
            return JsonValue::make_array(std::move(items));
        }
        case TokenKind::ObjectStart: {
            JsonObject members;
            while (true) {
                auto moved = reader.next();
                if (!moved) {
                    return std::unexpected(moved.error());
                }
                if (reader.kind() == TokenKind::ObjectEnd) {
                    break;
                }
                auto key = reader.string_value();
                if (!key) {
                    return std::unexpected(key.error());
                }
                moved = reader.next();
                if (!moved) {
                    return std::unexpected(moved.error());
                }
                auto value = read_json_value(reader);
                if (!value) {
                    return value;
                }
                members.push_back(JsonMember{std::move(*key), std::move(*value)});
            }
            return JsonValue::make_object(std::move(members));
        }
        default:
            break;
    }
    return std::unexpected(common::syntax_error("expected a value", reader.offset()));
}

std::string_view json_type_name(JsonType type) noexcept {
    switch (type) {
        case JsonType::Null:
            return "null";
        case JsonType::Bool:
            return "bool";
        case JsonType::Integer:
            return "integer";
        case JsonType::Float:
            return "float";
        case JsonType::String:
            return "string";
        case JsonType::Array:
            return "array";
        case JsonType::Object:
            return "object";
    }
    return "unknown";
}

JsonValue JsonValue::make_null() {
    return JsonValue();
}

JsonValue JsonValue::make_bool(bool value) {
    return JsonValue(Storage(std::in_place_index<1>, value));
}

JsonValue JsonValue::make_integer(std::int64_t value) {
    return JsonValue(Storage(std::in_place_index<2>, value));
}

JsonValue JsonValue::make_float(double value) {
    return JsonValue(Storage(std::in_place_index<3>, value));
}

JsonValue JsonValue::make_string(std::string value) {
    return JsonValue(Storage(std::in_place_index<4>, std::move(value)));
}

JsonValue JsonValue::make_array(JsonArray value) {
    return JsonValue(Storage(std::in_place_index<5>, std::move(value)));
}

JsonValue JsonValue::make_object(JsonObject value) {
    return JsonValue(Storage(std::in_place_index<6>, std::move(value)));
}

bool JsonValue::as_bool() const {
    return std::get<bool>(value_);
}

std::int64_t JsonValue::as_integer() const {
    return std::get<std::int64_t>(value_);
}

double JsonValue::as_float() const {
    return std::get<double>(value_);
}

double JsonValue::as_number() const {
    if (is_integer()) {
        return static_cast<double>(as_integer());
    }
    return as_float();
}

const std::string &JsonValue::as_string() const {
    return std::get<std::string>(value_);
}

const JsonArray &JsonValue::as_array() const {
    return std::get<JsonArray>(value_);
}

JsonArray &JsonValue::as_array() {
    return std::get<JsonArray>(value_);
}

const JsonObject &JsonValue::as_object() const {
    return std::get<JsonObject>(value_);
}

JsonObject &JsonValue::as_object() {
    return std::get<JsonObject>(value_);
}

const JsonValue *JsonValue::find(std::string_view key, bool case_sensitive) const {
    if (!is_object()) {
        return nullptr;
    }
    const JsonValue *folded = nullptr;
    const JsonObject &members = as_object();
    for (auto it = members.rbegin(); it != members.rend(); ++it) {
        if (it->key == key) {
            return &it->value;
        }
        if (!case_sensitive && !folded && ascii_iequals(it->key, key)) {
            folded = &it->value;
        }
    }
    return folded;
}

bool operator==(const JsonValue &lhs, const JsonValue &rhs) {
    return lhs.value_ == rhs.value_;
}

common::StreamResult<JsonValue> parse_value(std::string_view text, const ReaderOptions &options,
                                            std::size_t base_offset) {
    ValueReader reader(text, options, base_offset);
    auto moved = reader.next();
    if (!moved) {
        return std::unexpected(moved.error());
    }
    auto value = read_json_value(reader);
    if (!value) {
        return value;
    }
    auto finished = reader.finish();
    if (!finished) {
        return std::unexpected(finished.error());
    }
    return value;
}

std::string to_json(const JsonValue &value) {
    std::string out;
    write_value(out, value);
    return out;
}

bool ascii_iequals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (ascii_lower(lhs[i]) != ascii_lower(rhs[i])) {
            return false;
        }
    }
    return true;
}

} // namespace jstream::json
