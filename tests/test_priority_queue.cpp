#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "redis_objects/objects/priority_queue.hpp"
#include "mocks/in_memory_redis_client.hpp"
#include "mocks/mock_redis_client.hpp"

#include <limits>
#include <thread>

using namespace redis_objects;
using ::testing::_;
using ::testing::Return;
using nlohmann::json;

class PriorityQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<mocks::InMemoryRedisClient>();
        executor = std::make_shared<utils::ThreadPool>(2);
        queue = std::make_unique<PriorityQueue<>>("test:pq", server, executor);
    }

    std::shared_ptr<mocks::InMemoryRedisClient> server;
    std::shared_ptr<utils::ThreadPool> executor;
    std::unique_ptr<PriorityQueue<>> queue;
};

TEST_F(PriorityQueueTest, PopsHighestPriorityFirst) {
    queue->push("a", 1).get();
    queue->push("b", 5).get();
    queue->push("c", 3).get();

    EXPECT_EQ(queue->pop(std::chrono::seconds(1)).get(), json("b"));
    EXPECT_EQ(queue->pop(std::chrono::seconds(1)).get(), json("c"));
    EXPECT_EQ(queue->pop(std::chrono::seconds(1)).get(), json("a"));
}

TEST_F(PriorityQueueTest, PopReadyFollowsPriorityOrder) {
    queue->push(json{{"job", "low"}}, -2.5).get();
    queue->push(json{{"job", "high"}}, 10).get();

    EXPECT_EQ(queue->pop_ready().get(), (json{{"job", "high"}}));
    EXPECT_EQ(queue->pop_ready().get(), (json{{"job", "low"}}));
    EXPECT_FALSE(queue->pop_ready().get().has_value());
}

TEST_F(PriorityQueueTest, EqualPrioritiesPopGreatestSerializedValueFirst) {
    queue->push("apple").get();
    queue->push("cherry").get();
    queue->push("banana").get();

    EXPECT_EQ(queue->pop_ready().get(), json("cherry"));
    EXPECT_EQ(queue->pop_ready().get(), json("banana"));
    EXPECT_EQ(queue->pop_ready().get(), json("apple"));
}

TEST_F(PriorityQueueTest, RepushUpdatesPriorityWithoutDuplicating) {
    queue->push("a", 1).get();
    queue->push("b", 2).get();
    EXPECT_EQ(queue->length().get(), 2);
    EXPECT_EQ(queue->rank("a").get(), std::optional<int64_t>(1));

    queue->push("a", 10).get();

    EXPECT_EQ(queue->length().get(), 2);
    EXPECT_EQ(queue->score("a").get(), std::optional<double>(10));
    EXPECT_EQ(queue->rank("a").get(), std::optional<int64_t>(0));
    EXPECT_EQ(queue->rank("b").get(), std::optional<int64_t>(1));
}

TEST_F(PriorityQueueTest, ScoreAndRankOfMissingValueAreAbsent) {
    EXPECT_FALSE(queue->score("ghost").get().has_value());
    EXPECT_FALSE(queue->rank("ghost").get().has_value());

    queue->push("real", 1).get();
    EXPECT_FALSE(queue->score("ghost").get().has_value());
    EXPECT_FALSE(queue->rank("ghost").get().has_value());
}

TEST_F(PriorityQueueTest, DefaultPriorityIsZero) {
    queue->push("x").get();

    EXPECT_EQ(queue->score("x").get(), std::optional<double>(0));
}

TEST_F(PriorityQueueTest, LengthCountsEveryPriority) {
    queue->push("neg", -1e300).get();
    queue->push("zero", 0).get();
    queue->push("pos", 1e300).get();
    queue->push("inf", std::numeric_limits<double>::infinity()).get();

    EXPECT_EQ(queue->length().get(), 4);
}

TEST_F(PriorityQueueTest, PopTimesOutWhenEmpty) {
    auto start = std::chrono::steady_clock::now();

    EXPECT_FALSE(queue->pop(std::chrono::seconds(1)).get().has_value());

    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(950));
}

TEST_F(PriorityQueueTest, WaitingPopIsWokenByAPush) {
    auto waiting = queue->pop(std::chrono::seconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    queue->push("wake", 1).get();

    EXPECT_EQ(waiting.get(), json("wake"));
}

TEST_F(PriorityQueueTest, DroppingAWaitingPopDoesNotBlock) {
    auto start = std::chrono::steady_clock::now();
    {
        auto abandoned = queue->pop(std::chrono::seconds(3));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));

    queue->push("taken", 1).get();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (queue->length().get() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(queue->length().get(), 0);
}

TEST_F(PriorityQueueTest, ClearEmptiesTheQueue) {
    queue->push("a", 1).get();
    queue->push("b", 2).get();

    queue->clear().get();

    EXPECT_EQ(queue->length().get(), 0);
    EXPECT_FALSE(queue->pop_ready().get().has_value());
    EXPECT_FALSE(server->exists("test:pq"));
}

TEST_F(PriorityQueueTest, NanPriorityIsRejectedByTheServer) {
    auto result = queue->push("bad", std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(result.get(), CommandError);
}

TEST_F(PriorityQueueTest, TypedQueueOfIntegers) {
    PriorityQueue<int> numbers("test:numbers", server, executor);

    numbers.push(7, 7).get();
    numbers.push(42, 42).get();

    EXPECT_EQ(numbers.pop_ready().get(), std::optional<int>(42));
    EXPECT_EQ(numbers.rank(7).get(), std::optional<int64_t>(0));
}

TEST(PriorityQueueCommandTest, LengthUsesFullRangeCardinality) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    PriorityQueue<> queue("pq", client, executor);

    EXPECT_CALL(*client, zcard("pq")).WillOnce(Return(3));

    EXPECT_EQ(queue.length().get(), 3);
}

TEST(PriorityQueueCommandTest, MembersAreSerializedValues) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    PriorityQueue<> queue("pq", client, executor);

    EXPECT_CALL(*client, zadd("pq", 2.5, "{\"id\":1}")).WillOnce(Return(1));
    EXPECT_CALL(*client, zscore("pq", "{\"id\":1}")).WillOnce(Return(std::optional<double>(2.5)));
    EXPECT_CALL(*client, zrevrank("pq", "{\"id\":1}")).WillOnce(Return(std::optional<int64_t>(0)));

    queue.push(json{{"id", 1}}, 2.5).get();
    EXPECT_EQ(queue.score(json{{"id", 1}}).get(), std::optional<double>(2.5));
    EXPECT_EQ(queue.rank(json{{"id", 1}}).get(), std::optional<int64_t>(0));
}

TEST(PriorityQueueCommandTest, PopsDecodeTheMemberAndDropTheScore) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    PriorityQueue<> queue("pq", client, executor);

    EXPECT_CALL(*client, zpopmax("pq"))
        .WillOnce(Return(std::optional<client::ScoredMember>(client::ScoredMember("\"top\"", 9))))
        .WillOnce(Return(std::nullopt));
    EXPECT_CALL(*client, bzpopmax("pq", std::chrono::seconds(1)))
        .WillOnce(Return(std::optional<client::ScoredMember>(client::ScoredMember("[1,2]", 1))));

    EXPECT_EQ(queue.pop_ready().get(), json("top"));
    EXPECT_FALSE(queue.pop_ready().get().has_value());
    EXPECT_EQ(queue.pop().get(), json::array({1, 2}));
}

TEST(PriorityQueueCommandTest, ConnectionErrorsPropagate) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    PriorityQueue<> queue("pq", client, executor);

    EXPECT_CALL(*client, bzpopmax("pq", _)).WillOnce(::testing::Throw(ConnectionError("reset by peer")));

    auto result = queue.pop(std::chrono::seconds(2));
    EXPECT_THROW(result.get(), ConnectionError);
}
