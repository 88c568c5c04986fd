#include <gtest/gtest.h>

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "common/mem/ElementBufferPool.h"
#include "io/Pipe.h"
#include "json/Convert.h"
#include "json/DecodePlan.h"
#include "json/DecoderRegistry.h"
#include "json/JsonValue.h"
#include "stream/ArrayStreamReader.h"
#include "TestHelpers.h"

using jstream::common::IoErr;
using jstream::common::StreamErr;
using jstream::common::StreamResult;
using jstream::io::Pipe;
using jstream::json::CommentHandling;
using jstream::json::ConvertContext;
using jstream::json::DecodePlanPtr;
using jstream::json::DecodeStrategy;
using jstream::json::DecoderRegistry;
using jstream::json::DecoderRegistryBuilder;
using jstream::json::JsonValue;
using jstream::json::ObjectPlanBuilder;
using jstream::mem::ElementBufferPool;
using jstream::stream::ArrayReadParams;
using jstream::stream::read_array;
using jstream::test::Collected;
using jstream::test::decode_whole;
using jstream::test::drain;
using jstream::test::split_at;
using jstream::test::split_every;
using jstream::test::stream_chunks;
using jstream::test::stream_text;

namespace {

struct Order {
    int id = 0;
    std::string name;
    double value = 0.0;

    friend bool operator==(const Order &, const Order &) = default;
};

DecodePlanPtr<Order> order_plan() {
    return ObjectPlanBuilder<Order>()
        .field("id", &Order::id)
        .field("name", &Order::name)
        .field("value", &Order::value)
        .build();
}

StreamResult<void> from_json(const JsonValue &value, Order &out, const ConvertContext &ctx) {
    if (auto r = jstream::json::read_field(value, "id", out.id, ctx); !r) {
        return r;
    }
    if (auto r = jstream::json::read_field(value, "name", out.name, ctx); !r) {
        return r;
    }
    return jstream::json::read_field(value, "value", out.value, ctx);
}

ArrayReadParams<Order> with_plan() {
    ArrayReadParams<Order> params;
    params.plan = order_plan();
    return params;
}

constexpr const char *kMixedPayload =
    R"([{"id": 1, "name": "a\"b", "tags": [1, [2, {"x": null}]]}, 42, -0.5e2, "café 😀", )"
    R"(true, false, null, [], {}, [[1, 2], {"k": "v"}], "éè"])";

} // namespace

TEST(ArrayStreamReaderTest, TwoChunkObjects) {
    auto result = stream_chunks<Order>({R"([{"id":1,"name":"a"},{"id":2,)", R"("name":"b"}])"}, with_plan());
    EXPECT_FALSE(result.error);
    std::vector<Order> expected = {{1, "a", 0.0}, {2, "b", 0.0}};
    EXPECT_EQ(result.items, expected);
}

TEST(ArrayStreamReaderTest, IntegersInOneChunk) {
    auto result = stream_text<int>("[1,2,3,4,5]");
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, (std::vector<int>{1, 2, 3, 4, 5}));
}

TEST(ArrayStreamReaderTest, EmptyArrayYieldsNothing) {
    auto result = stream_text<int>("[]");
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.items.empty());
}

TEST(ArrayStreamReaderTest, EmptySourceYieldsNothing) {
    auto result = stream_chunks<int>({});
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.items.empty());
}

TEST(ArrayStreamReaderTest, ElementsBeforeSyntaxErrorAreEmitted) {
    auto result = stream_text<int>("[1, abc]");
    EXPECT_EQ(result.items, std::vector<int>{1});
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->code, StreamErr::Syntax);
    EXPECT_EQ(result.error->offset, 4u);
}

TEST(ArrayStreamReaderTest, SyntaxErrorInLaterChunkKeepsEarlierElements) {
    auto result = stream_chunks<int>({"[1, 2, ", "3, ]"});
    EXPECT_EQ(result.items, (std::vector<int>{1, 2, 3}));
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->code, StreamErr::Syntax);
    EXPECT_EQ(result.error->offset, 10u);
}

TEST(ArrayStreamReaderTest, UnterminatedArrayFailsAtEnd) {
    auto result = stream_chunks<int>({"[1,", "2"});
    EXPECT_EQ(result.items, (std::vector<int>{1, 2}));
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->code, StreamErr::Syntax);
}

TEST(ArrayStreamReaderTest, EverySplitPointGivesSameElements) {
    std::string payload = kMixedPayload;
    auto expected = decode_whole<JsonValue>(payload);
    ASSERT_EQ(expected.size(), 11u);
    for (std::size_t split = 0; split <= payload.size(); ++split) {
        auto result = stream_chunks<JsonValue>(split_at(payload, split));
        EXPECT_FALSE(result.error) << "split at " << split;
        EXPECT_EQ(result.items, expected) << "split at " << split;
    }
}

TEST(ArrayStreamReaderTest, ByteAtATime) {
    std::string payload = kMixedPayload;
    auto result = stream_chunks<JsonValue>(split_every(payload, 1));
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, decode_whole<JsonValue>(payload));
}

TEST(ArrayStreamReaderTest, ObjectsSplitAtEveryPointWithPlan) {
    std::string payload = R"([{"id": 1, "name": "first", "value": 1.5}, {"extra": {"a": [1]}, "id": 2}])";
    std::vector<Order> expected = {{1, "first", 1.5}, {2, "", 0.0}};
    for (std::size_t split = 0; split <= payload.size(); ++split) {
        auto result = stream_chunks<Order>(split_at(payload, split), with_plan());
        EXPECT_FALSE(result.error) << "split at " << split;
        EXPECT_EQ(result.items, expected) << "split at " << split;
    }
}

TEST(ArrayStreamReaderTest, RepeatedRunsAreIdentical) {
    std::string payload = kMixedPayload;
    auto first = stream_chunks<JsonValue>(split_every(payload, 7));
    auto second = stream_chunks<JsonValue>(split_every(payload, 7));
    EXPECT_FALSE(first.error);
    EXPECT_EQ(first.items, second.items);
}

TEST(ArrayStreamReaderTest, GenericConversionMatchesPlan) {
    std::string payload = R"([{"id": 3, "name": "x", "value": 2}, {"id": 4}])";
    ArrayReadParams<Order> generic;
    generic.options.strategy = DecodeStrategy::Generic;
    generic.plan = order_plan();
    auto by_dom = stream_text<Order>(payload, generic);
    auto by_plan = stream_text<Order>(payload, with_plan());
    EXPECT_FALSE(by_dom.error);
    EXPECT_FALSE(by_plan.error);
    EXPECT_EQ(by_dom.items, by_plan.items);
    EXPECT_EQ(by_dom.items, decode_whole<Order>(payload));
}

TEST(ArrayStreamReaderTest, DuplicateKeysResolveAlikeInBothStrategies) {
    std::string payload = R"([{"id": 1, "ID": 2}, {"ID": 2, "id": 1}, {"ID": 3, "Id": 4}, {"id": 1, "ID": 2, "id": 5}])";
    ArrayReadParams<Order> generic;
    generic.options.strategy = DecodeStrategy::Generic;
    auto by_dom = stream_text<Order>(payload, generic);
    auto by_plan = stream_text<Order>(payload, with_plan());
    EXPECT_FALSE(by_dom.error);
    EXPECT_FALSE(by_plan.error);
    std::vector<Order> expected = {{1, "", 0.0}, {1, "", 0.0}, {4, "", 0.0}, {5, "", 0.0}};
    EXPECT_EQ(by_plan.items, expected);
    EXPECT_EQ(by_dom.items, expected);
}

TEST(ArrayStreamReaderTest, PropertyNamesIgnoreCaseByDefault) {
    auto result = stream_text<Order>(R"([{"ID": 7, "Name": "n"}])", with_plan());
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, (std::vector<Order>{{7, "n", 0.0}}));

    auto strict_params = with_plan();
    strict_params.options.decoder.case_sensitive = true;
    auto strict = stream_text<Order>(R"([{"ID": 7, "Name": "n"}])", strict_params);
    EXPECT_FALSE(strict.error);
    EXPECT_EQ(strict.items, (std::vector<Order>{Order{}}));
}

TEST(ArrayStreamReaderTest, RegisteredPlanIsUsed) {
    DecoderRegistry registry = DecoderRegistryBuilder().add<Order>(order_plan()).build();
    ArrayReadParams<Order> params;
    params.registry = &registry;
    params.options.strategy = DecodeStrategy::Descriptor;
    auto result = stream_text<Order>(R"([{"id": 1}])", params);
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, (std::vector<Order>{{1, "", 0.0}}));
}

TEST(ArrayStreamReaderTest, DescriptorStrategyWithoutPlanFailsBeforeReading) {
    ArrayReadParams<Order> params;
    params.options.strategy = DecodeStrategy::Descriptor;
    Pipe pipe;
    auto task = drain(read_array<Order>(pipe, params));
    task.start();
    ASSERT_TRUE(task.done());
    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->error);
    EXPECT_EQ(result->error->code, StreamErr::Decode);
    EXPECT_FALSE(pipe.has_waiter());
}

TEST(ArrayStreamReaderTest, DecodeErrorEndsStream) {
    auto result = stream_text<Order>(R"([{"id": 1}, {"id": "two"}, {"id": 3}])", with_plan());
    EXPECT_EQ(result.items.size(), 1u);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->code, StreamErr::Decode);
    EXPECT_EQ(result.error->offset, 19u);
}

TEST(ArrayStreamReaderTest, NullNeedsOptionalElement) {
    auto optional = stream_text<std::optional<int>>("[1, null, 3]");
    EXPECT_FALSE(optional.error);
    EXPECT_EQ(optional.items, (std::vector<std::optional<int>>{1, std::nullopt, 3}));

    auto plain = stream_text<int>("[1, null, 3]");
    EXPECT_EQ(plain.items, std::vector<int>{1});
    ASSERT_TRUE(plain.error);
    EXPECT_EQ(plain.error->code, StreamErr::Decode);
}

TEST(ArrayStreamReaderTest, PrimitiveElementTypes) {
    auto strings = stream_text<std::string>(R"(["a\n", "café", ""])");
    EXPECT_FALSE(strings.error);
    EXPECT_EQ(strings.items, (std::vector<std::string>{"a\n", "caf\xC3\xA9", ""}));

    auto flags = stream_text<bool>("[true, false]");
    EXPECT_EQ(flags.items, (std::vector<bool>{true, false}));

    auto numbers = stream_text<double>("[1, 2.5, -3e2]");
    EXPECT_EQ(numbers.items, (std::vector<double>{1.0, 2.5, -300.0}));
}

TEST(ArrayStreamReaderTest, CommentsFollowReaderOptions) {
    std::string payload = "[1, /* two */ 2, // three\n 3]";
    auto rejected = stream_text<int>(payload);
    EXPECT_EQ(rejected.items, std::vector<int>{1});
    ASSERT_TRUE(rejected.error);
    EXPECT_EQ(rejected.error->code, StreamErr::Syntax);

    for (CommentHandling handling : {CommentHandling::Skip, CommentHandling::Allow}) {
        ArrayReadParams<int> params;
        params.options.reader.comment_handling = handling;
        auto result = stream_chunks<int>(split_every(payload, 3), params);
        EXPECT_FALSE(result.error);
        EXPECT_EQ(result.items, (std::vector<int>{1, 2, 3}));
    }
}

TEST(ArrayStreamReaderTest, TrailingCommasFollowReaderOptions) {
    auto rejected = stream_text<std::vector<int>>("[[1,2,], [3]]");
    ASSERT_TRUE(rejected.error);
    EXPECT_EQ(rejected.error->code, StreamErr::Syntax);

    ArrayReadParams<std::vector<int>> params;
    params.options.reader.allow_trailing_commas = true;
    auto accepted = stream_text<std::vector<int>>("[[1,2,], [3],]", params);
    EXPECT_FALSE(accepted.error);
    EXPECT_EQ(accepted.items, (std::vector<std::vector<int>>{{1, 2}, {3}}));
}

TEST(ArrayStreamReaderTest, NonArrayTopLevelIsSkippedUnlessRequired) {
    std::string payload = R"({"count": 2, "items": [10, 20]})";
    auto skipped = stream_text<int>(payload);
    EXPECT_FALSE(skipped.error);
    EXPECT_EQ(skipped.items, (std::vector<int>{10, 20}));

    ArrayReadParams<int> params;
    params.options.require_array = true;
    auto strict = stream_text<int>(payload, params);
    EXPECT_TRUE(strict.items.empty());
    ASSERT_TRUE(strict.error);
    EXPECT_EQ(strict.error->code, StreamErr::Syntax);
}

TEST(ArrayStreamReaderTest, BytesAfterArrayAreNotRead) {
    auto result = stream_chunks<int>({"[1] trailing", " garbage {"});
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, std::vector<int>{1});
}

TEST(ArrayStreamReaderTest, BufferGrowsBeyondInitialCapacity) {
    ElementBufferPool<int> pool;
    ArrayReadParams<int> params;
    params.pool = &pool;
    params.options.initial_buffer_capacity = 2;

    std::string payload = "[";
    std::vector<int> expected;
    for (int i = 0; i < 100; ++i) {
        payload += (i == 0 ? "" : ",") + std::to_string(i);
        expected.push_back(i);
    }
    payload += "]";

    auto result = stream_text<int>(payload, params);
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.items, expected);
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(ArrayStreamReaderTest, SourceFaultIsPropagated) {
    ElementBufferPool<int> pool;
    ArrayReadParams<int> params;
    params.pool = &pool;
    Pipe pipe;
    auto task = drain(read_array<int>(pipe, params));
    task.start();
    pipe.write("[1, 2");
    pipe.fail(IoErr::ConnReset, "peer went away");
    ASSERT_TRUE(task.done());

    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->items, std::vector<int>{1});
    ASSERT_TRUE(result->error);
    EXPECT_EQ(result->error->code, StreamErr::SourceFault);
    EXPECT_EQ(result->error->io, IoErr::ConnReset);
    EXPECT_EQ(result->error->message, "peer went away");
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(ArrayStreamReaderTest, CancelledBeforeFirstPull) {
    ElementBufferPool<int> pool;
    std::stop_source stop;
    stop.request_stop();
    ArrayReadParams<int> params;
    params.pool = &pool;
    params.stop_token = stop.get_token();

    Pipe pipe;
    pipe.write("[1, 2, 3]");
    auto task = drain(read_array<int>(pipe, params));
    task.start();
    ASSERT_TRUE(task.done());

    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->items.empty());
    ASSERT_TRUE(result->error);
    EXPECT_EQ(result->error->code, StreamErr::Cancelled);
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(ArrayStreamReaderTest, StopRequestInterruptsPendingPull) {
    ElementBufferPool<int> pool;
    std::stop_source stop;
    ArrayReadParams<int> params;
    params.pool = &pool;
    params.stop_token = stop.get_token();

    Pipe pipe;
    auto task = drain(read_array<int>(pipe, params));
    task.start();
    pipe.write("[1, 2, ");
    EXPECT_FALSE(task.done());
    EXPECT_TRUE(pipe.has_waiter());

    stop.request_stop();
    ASSERT_TRUE(task.done());
    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->items, (std::vector<int>{1, 2}));
    ASSERT_TRUE(result->error);
    EXPECT_EQ(result->error->code, StreamErr::Cancelled);
    EXPECT_EQ(pool.outstanding(), 0u);
}

TEST(ArrayStreamReaderTest, CancelledPendingReadEndsStream) {
    Pipe pipe;
    auto task = drain(read_array<int>(pipe));
    task.start();
    pipe.write("[1,");
    pipe.cancel_pending_read();
    ASSERT_TRUE(task.done());
    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->items, std::vector<int>{1});
    ASSERT_TRUE(result->error);
    EXPECT_EQ(result->error->code, StreamErr::Cancelled);
}

TEST(ArrayStreamReaderTest, ElementsArriveAsChunksComplete) {
    Pipe pipe;
    std::vector<int> seen;
    auto consume = [](jstream::async::AsyncGenerator<int> gen,
                      std::vector<int> &out) -> jstream::async::Task<std::size_t> {
        while (true) {
            auto item = co_await gen.next();
            if (!item) {
                co_return std::unexpected(item.error());
            }
            if (!*item) {
                break;
            }
            out.push_back(**item);
        }
        co_return out.size();
    };
    auto task = consume(read_array<int>(pipe), seen);
    task.start();

    pipe.write("[10, 2");
    EXPECT_EQ(seen, std::vector<int>{10});
    pipe.write("0, 3");
    EXPECT_EQ(seen, (std::vector<int>{10, 20}));
    pipe.write("0]");
    ASSERT_TRUE(task.done());
    EXPECT_EQ(seen, (std::vector<int>{10, 20, 30}));
    auto result = task.result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3u);
}
