#ifndef JSTREAM_JSON_DECODE_PLAN_H
#define JSTREAM_JSON_DECODE_PLAN_H

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../common/StreamError.h"
#include "Convert.h"
#include "DecoderOptions.h"
#include "JsonValue.h"
#include "Scalars.h"
#include "ValueReader.h"

namespace jstream::json {

// Precomputed recipe that decodes a T straight from tokens, without building a
// JsonValue. The reader is positioned on the first token of the value and is
// left on its last token.
template <typename T>
class DecodePlan {
public:
    using ReadFn = std::function<common::StreamResult<void>(ValueReader &, T &, const ConvertContext &)>;

    explicit DecodePlan(ReadFn read) : read_(std::move(read)) {
    }

    common::StreamResult<void> read(ValueReader &reader, T &out, const ConvertContext &ctx) const {
        return read_(reader, out, ctx);
    }

private:
    ReadFn read_;
};

template <typename T>
using DecodePlanPtr = std::shared_ptr<const DecodePlan<T>>;

namespace detail {

template <typename T>
struct IsOptional : std::false_type {};

template <typename U>
struct IsOptional<std::optional<U>> : std::true_type {};

template <typename T>
struct IsVector : std::false_type {};

template <typename U>
struct IsVector<std::vector<U>> : std::true_type {};

template <typename T>
struct IsStringMap : std::false_type {};

template <typename U>
struct IsStringMap<std::map<std::string, U>> : std::true_type {};

inline common::StreamError unexpected_token(std::string_view expected, const ValueReader &reader) {
    std::string message = "expected ";
    message.append(expected);
    message.append(", got ");
    message.append(token_kind_name(reader.kind()));
    return common::decode_error(std::move(message), reader.offset());
}

} // namespace detail

// Reads one value of type M from the token stream: scalars, strings,
// std::optional, std::vector, std::map<std::string, U>, JsonValue, and any
// type with a generic from_json conversion.
template <typename M>
common::StreamResult<void> read_member(ValueReader &reader, M &out, const ConvertContext &ctx) {
    if constexpr (detail::IsOptional<M>::value) {
        if (reader.kind() == TokenKind::Null) {
            out.reset();
            return {};
        }
        typename M::value_type inner{};
        auto result = read_member(reader, inner, ctx);
        if (!result) {
            return result;
        }
        out = std::move(inner);
        return {};
    } else if constexpr (std::same_as<M, JsonValue>) {
        auto value = read_json_value(reader);
        if (!value) {
            return std::unexpected(value.error());
        }
        out = std::move(*value);
        return {};
    } else if constexpr (std::same_as<M, bool>) {
        if (reader.kind() == TokenKind::True || reader.kind() == TokenKind::False) {
            out = reader.kind() == TokenKind::True;
            return {};
        }
        return std::unexpected(detail::unexpected_token("bool", reader));
    } else if constexpr (std::integral<M>) {
        if (reader.kind() != TokenKind::Number) {
            return std::unexpected(detail::unexpected_token("integer", reader));
        }
        auto value = parse_integer<M>(reader.raw());
        if (!value) {
            return std::unexpected(common::decode_error(
                "number " + std::string(reader.raw()) + " is not a representable integer", reader.offset()));
        }
        out = *value;
        return {};
    } else if constexpr (std::floating_point<M>) {
        if (reader.kind() != TokenKind::Number) {
            return std::unexpected(detail::unexpected_token("number", reader));
        }
        auto value = parse_double(reader.raw());
        if (!value) {
            return std::unexpected(common::decode_error("number out of range", reader.offset()));
        }
        out = static_cast<M>(*value);
        return {};
    } else if constexpr (std::same_as<M, std::string>) {
        if (reader.kind() != TokenKind::String) {
            return std::unexpected(detail::unexpected_token("string", reader));
        }
        auto text = reader.string_value();
        if (!text) {
            return std::unexpected(text.error());
        }
        out = std::move(*text);
        return {};
    } else if constexpr (detail::IsVector<M>::value) {
        if (reader.kind() != TokenKind::ArrayStart) {
            return std::unexpected(detail::unexpected_token("array", reader));
        }
        out.clear();
        while (true) {
            auto moved = reader.next();
            if (!moved) {
                return moved;
            }
            if (reader.kind() == TokenKind::ArrayEnd) {
                return {};
            }
            typename M::value_type item{};
            auto result = read_member(reader, item, ctx);
            if (!result) {
                return result;
            }
            out.push_back(std::move(item));
        }
    } else if constexpr (detail::IsStringMap<M>::value) {
        if (reader.kind() != TokenKind::ObjectStart) {
            return std::unexpected(detail::unexpected_token("object", reader));
        }
        out.clear();
        while (true) {
            auto moved = reader.next();
            if (!moved) {
                return moved;
            }
            if (reader.kind() == TokenKind::ObjectEnd) {
                return {};
            }
            auto key = reader.string_value();
            if (!key) {
                return std::unexpected(key.error());
            }
            moved = reader.next();
            if (!moved) {
                return moved;
            }
            typename M::mapped_type item{};
            auto result = read_member(reader, item, ctx);
            if (!result) {
                return result;
            }
            out.insert_or_assign(std::move(*key), std::move(item));
        }
    } else {
        static_assert(GenericDecodable<M>, "member type needs a nested DecodePlan or a from_json conversion");
        std::size_t offset = reader.offset();
        auto value = read_json_value(reader);
        if (!value) {
            return std::unexpected(value.error());
        }
        ConvertContext nested = ctx;
        nested.offset = offset;
        return from_json(*value, out, nested);
    }
}

// Plan for a type read_member handles on its own.
template <typename T>
DecodePlanPtr<T> primitive_plan() {
    return std::make_shared<const DecodePlan<T>>(
        [](ValueReader &reader, T &out, const ConvertContext &ctx) { return read_member(reader, out, ctx); });
}

// Plan for a JSON array whose items follow `item_plan`.
template <typename U>
DecodePlanPtr<std::vector<U>> array_plan(DecodePlanPtr<U> item_plan) {
    return std::make_shared<const DecodePlan<std::vector<U>>>(
        [item_plan = std::move(item_plan)](ValueReader &reader, std::vector<U> &out,
                                           const ConvertContext &ctx) -> common::StreamResult<void> {
            if (reader.kind() != TokenKind::ArrayStart) {
                return std::unexpected(detail::unexpected_token("array", reader));
            }
            out.clear();
            while (true) {
                auto moved = reader.next();
                if (!moved) {
                    return moved;
                }
                if (reader.kind() == TokenKind::ArrayEnd) {
                    return {};
                }
                U item{};
                auto result = item_plan->read(reader, item, ctx);
                if (!result) {
                    return result;
                }
                out.push_back(std::move(item));
            }
        });
}

// Builds the plan of a JSON object mapped onto the members of T:
//
//     auto plan = ObjectPlanBuilder<Order>()
//                     .field("id", &Order::id)
//                     .field("customer", &Order::customer, customer_plan)
//                     .build();
//
// Unknown properties are skipped; absent ones keep their default value.
template <typename T>
class ObjectPlanBuilder {
public:
    template <typename M>
    ObjectPlanBuilder &field(std::string name, M T::*member) {
        fields_.push_back(Field{std::move(name), [member](ValueReader &reader, T &out, const ConvertContext &ctx) {
                                    return read_member(reader, out.*member, ctx);
                                }});
        return *this;
    }

    template <typename M>
    ObjectPlanBuilder &field(std::string name, M T::*member, DecodePlanPtr<M> plan) {
        fields_.push_back(Field{std::move(name),
                                [member, plan = std::move(plan)](ValueReader &reader, T &out, const ConvertContext &ctx) {
                                    return plan->read(reader, out.*member, ctx);
                                }});
        return *this;
    }

    // Nested plan for an optional member; null resets it.
    template <typename M>
    ObjectPlanBuilder &field(std::string name, std::optional<M> T::*member, DecodePlanPtr<M> plan) {
        fields_.push_back(Field{std::move(name),
                                [member, plan = std::move(plan)](ValueReader &reader, T &out,
                                                                 const ConvertContext &ctx) -> common::StreamResult<void> {
                                    if (reader.kind() == TokenKind::Null) {
                                        (out.*member).reset();
                                        return {};
                                    }
                                    M inner{};
                                    auto result = plan->read(reader, inner, ctx);
                                    if (!result) {
                                        return result;
                                    }
                                    out.*member = std::move(inner);
                                    return {};
                                }});
        return *this;
    }

    DecodePlanPtr<T> build() {
        auto fields = std::make_shared<const std::vector<Field>>(std::move(fields_));
        fields_.clear();
        return std::make_shared<const DecodePlan<T>>(
            [fields](ValueReader &reader, T &out, const ConvertContext &ctx) -> common::StreamResult<void> {
                return read_object(reader, *fields, out, ctx);
            });
    }

private:
    struct Field {
        std::string name;
        std::function<common::StreamResult<void>(ValueReader &, T &, const ConvertContext &)> read;
    };

    struct Match {
        std::size_t index;
        bool exact;
    };

    static std::optional<Match> match(const std::vector<Field> &fields, std::string_view key, bool case_sensitive) {
        std::optional<Match> folded;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (fields[i].name == key) {
                return Match{i, true};
            }
            if (!case_sensitive && !folded && ascii_iequals(fields[i].name, key)) {
                folded = Match{i, false};
            }
        }
        return folded;
    }

    // Same resolution as JsonValue::find: the last exact key wins, and a
    // folded key only counts while no exact key has been seen for the field.
    static common::StreamResult<void> read_object(ValueReader &reader, const std::vector<Field> &fields, T &out,
                                                  const ConvertContext &ctx) {
        if (reader.kind() != TokenKind::ObjectStart) {
            return std::unexpected(detail::unexpected_token("object", reader));
        }
        std::vector<bool> exact_seen(fields.size(), false);
        while (true) {
            auto moved = reader.next();
            if (!moved) {
                return moved;
            }
            if (reader.kind() == TokenKind::ObjectEnd) {
                return {};
            }
            auto key = reader.string_view_value();
            if (!key) {
                return std::unexpected(key.error());
            }
            auto found = match(fields, *key, ctx.options.case_sensitive);
            if (found && !found->exact && exact_seen[found->index]) {
                found.reset();
            }
            moved = reader.next();
            if (!moved) {
                return moved;
            }
            if (!found) {
                auto skipped = reader.skip();
                if (!skipped) {
                    return skipped;
                }
                continue;
            }
            if (found->exact) {
                exact_seen[found->index] = true;
            }
            auto result = fields[found->index].read(reader, out, ctx);
            if (!result) {
                return result;
            }
        }
    }

    std::vector<Field> fields_;
};

} // namespace jstream::json

#endif // JSTREAM_JSON_DECODE_PLAN_H
