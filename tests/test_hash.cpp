#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "redis_objects/objects/hash.hpp"
#include "mocks/in_memory_redis_client.hpp"
#include "mocks/mock_redis_client.hpp"

using namespace redis_objects;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using nlohmann::json;

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<mocks::InMemoryRedisClient>();
        executor = std::make_shared<utils::ThreadPool>(2);
        hash = std::make_unique<Hash<>>("test:hash", server, executor);
    }

    std::shared_ptr<mocks::InMemoryRedisClient> server;
    std::shared_ptr<utils::ThreadPool> executor;
    std::unique_ptr<Hash<>> hash;
};

TEST_F(HashTest, SetThenGetReturnsTheSameValue) {
    json document = {{"name", "widget"}, {"sizes", {1, 2, 3}}, {"active", true}, {"ratio", 0.25}};

    hash->set("doc", document).get();

    auto value = hash->get("doc").get();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, document);
}

TEST_F(HashTest, SetReportsInsertOnlyForNewFields) {
    EXPECT_TRUE(hash->set("field", 1).get());
    EXPECT_FALSE(hash->set("field", 2).get());
    EXPECT_FALSE(hash->set("field", 3).get());

    EXPECT_EQ(hash->get("field").get(), json(3));
}

TEST_F(HashTest, AddKeepsTheFirstWrite) {
    EXPECT_TRUE(hash->add("field", "first").get());
    EXPECT_FALSE(hash->add("field", "second").get());

    EXPECT_EQ(hash->get("field").get(), json("first"));
}

TEST_F(HashTest, GetMissingFieldIsAbsent) {
    EXPECT_FALSE(hash->get("missing").get().has_value());

    hash->set("present", 1).get();
    EXPECT_FALSE(hash->get("missing").get().has_value());
}

TEST_F(HashTest, StoredNullIsAValueNotAbsence) {
    hash->set("nothing", nullptr).get();

    auto value = hash->get("nothing").get();
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
}

TEST_F(HashTest, EmptyRawValueReadsAsAbsent) {
    server->put_raw_hash_field("test:hash", "blank", "");

    EXPECT_FALSE(hash->get("blank").get().has_value());
}

TEST_F(HashTest, CorruptRawValueRaisesDeserializationError) {
    server->put_raw_hash_field("test:hash", "broken", "{not json");

    auto result = hash->get("broken");
    EXPECT_THROW(result.get(), DeserializationError);
}

TEST_F(HashTest, MultiGetMapsMissingFieldsToAbsent) {
    hash->set("f1", "one").get();

    auto values = hash->multi_get({"f1", "f2"}).get();

    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values.at("f1"), json("one"));
    EXPECT_FALSE(values.at("f2").has_value());
}

TEST_F(HashTest, MultiGetWithNoFieldsIsEmpty) {
    EXPECT_TRUE(hash->multi_get({}).get().empty());
}

TEST_F(HashTest, GetAllReturnsEveryField) {
    hash->set("a", 1).get();
    hash->set("b", json::array({"x", "y"})).get();

    auto all = hash->get_all().get();

    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at("a"), json(1));
    EXPECT_EQ(all.at("b"), json::array({"x", "y"}));
}

TEST_F(HashTest, KeysAndSizeTrackFields) {
    EXPECT_EQ(hash->size().get(), 0);
    EXPECT_TRUE(hash->keys().get().empty());

    hash->set("a", 1).get();
    hash->set("b", 2).get();
    hash->set("a", 3).get();

    EXPECT_EQ(hash->size().get(), 2);
    auto keys = hash->keys().get();
    EXPECT_EQ(keys, (std::unordered_set<std::string>{"a", "b"}));
}

TEST_F(HashTest, RemoveReportsWhetherFieldExisted) {
    hash->set("a", 1).get();

    EXPECT_TRUE(hash->remove("a").get());
    EXPECT_FALSE(hash->remove("a").get());
    EXPECT_FALSE(hash->get("a").get().has_value());
}

TEST_F(HashTest, ClearRemovesTheKey) {
    hash->set("a", 1).get();
    hash->set("b", 2).get();

    hash->clear().get();

    EXPECT_FALSE(server->exists("test:hash"));
    EXPECT_EQ(hash->size().get(), 0);
    EXPECT_FALSE(hash->get("a").get().has_value());
}

TEST_F(HashTest, AccessorsWithTheSameNameShareState) {
    Hash<> other("test:hash", server, executor);

    hash->set("shared", "value").get();

    EXPECT_EQ(other.get("shared").get(), json("value"));
}

TEST_F(HashTest, WrongTypeErrorReachesTheCaller) {
    server->push_raw("test:hash", "\"list item\"");

    auto result = hash->set("a", 1);
    EXPECT_THROW(result.get(), CommandError);
}

TEST_F(HashTest, ConnectionFailureReachesTheCaller) {
    server->set_offline(true);

    auto result = hash->get("a");
    EXPECT_THROW(result.get(), ConnectionError);
}

struct Item {
    std::string name;
    int quantity;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Item, name, quantity)

TEST_F(HashTest, TypedHashRoundTripsStructs) {
    Hash<Item> items("test:items", server, executor);

    items.set("apple", Item{"apple", 3}).get();

    auto item = items.get("apple").get();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->name, "apple");
    EXPECT_EQ(item->quantity, 3);
}

TEST_F(HashTest, TypedHashRejectsMismatchedData) {
    Hash<Item> items("test:items", server, executor);
    server->put_raw_hash_field("test:items", "apple", "\"just a string\"");

    auto result = items.get("apple");
    EXPECT_THROW(result.get(), DeserializationError);
}

TEST(HashCommandTest, SetSendsCompactJson) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    Hash<> hash("h", client, executor);

    EXPECT_CALL(*client, hset("h", "f", "{\"a\":[1,2]}")).WillOnce(Return(1));

    EXPECT_TRUE(hash.set("f", json{{"a", {1, 2}}}).get());
}

TEST(HashCommandTest, MultiGetNeverParsesNilReplies) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    Hash<> hash("h", client, executor);

    EXPECT_CALL(*client, hmget("h", ElementsAre("f1", "f2", "f3")))
        .WillOnce(Return(std::vector<std::optional<std::string>>{"1", std::nullopt, ""}));

    auto values = hash.multi_get({"f1", "f2", "f3"}).get();

    EXPECT_EQ(values.at("f1"), json(1));
    EXPECT_FALSE(values.at("f2").has_value());
    EXPECT_FALSE(values.at("f3").has_value());
}

TEST(HashCommandTest, MultiGetRejectsShortReplies) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    Hash<> hash("h", client, executor);

    EXPECT_CALL(*client, hmget("h", _))
        .WillOnce(Return(std::vector<std::optional<std::string>>{"1"}));

    auto result = hash.multi_get({"f1", "f2"});
    EXPECT_THROW(result.get(), ProtocolError);
}

TEST(HashCommandTest, ClearDeletesTheKey) {
    auto client = std::make_shared<mocks::MockRedisClient>();
    auto executor = std::make_shared<utils::ThreadPool>(1);
    Hash<> hash("h", client, executor);

    EXPECT_CALL(*client, del("h")).WillOnce(Return(1));

    hash.clear().get();
}

TEST(HashCommandTest, ConstructionRequiresConnectionAndExecutor) {
    auto executor = std::make_shared<utils::ThreadPool>(1);
    EXPECT_THROW(Hash<>("h", nullptr, executor), std::invalid_argument);
    EXPECT_THROW(Hash<>("h", std::make_shared<mocks::MockRedisClient>(), nullptr), std::invalid_argument);
}
