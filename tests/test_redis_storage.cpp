#include <gtest/gtest.h>
#include "redis_storage.hpp"
#include "gate_config.hpp"
#include "reconciliation_engine.hpp"
#include "test_support.hpp"

using namespace llmgate;
using llmgate::testing::FakeSearchClient;
using llmgate::testing::ManualClock;
using llmgate::testing::make_candidate;

class RedisStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.redis_url = "tcp://127.0.0.1:6379?socket_timeout=100ms";
        config.redis_namespace = "llmgate_test";
        redis = std::make_unique<RedisStorage>(config, clock);

        if (redis->is_connected()) {
            for (const auto& key : redis->list("")) {
                redis->remove(key);
            }
        }
    }

    GateConfig config;
    ManualClock clock{42000};
    std::unique_ptr<RedisStorage> redis;
};

TEST_F(RedisStorageTest, ConnectionStatus) {
    if (!redis->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(redis->is_connected());
}

TEST_F(RedisStorageTest, DisconnectedOperationsThrow) {
    GateConfig bad;
    bad.redis_url = "tcp://127.0.0.1:1?socket_timeout=50ms&connect_timeout=50ms";
    RedisStorage offline(bad, clock);
    ASSERT_FALSE(offline.is_connected());
    EXPECT_THROW(offline.get("links/x"), StorageError);
    EXPECT_THROW(offline.put("links/x", "v"), StorageError);
    EXPECT_THROW(offline.list("links/"), StorageError);
}

TEST_F(RedisStorageTest, PutGetGeneration) {
    if (!redis->is_connected()) GTEST_SKIP();

    EXPECT_FALSE(redis->get("links/a").has_value());
    StoredValue first = redis->put("links/a", "{\"id\":\"Q1\"}");
    EXPECT_EQ(first.generation, 1u);

    clock.advance(500);
    StoredValue second = redis->put("links/a", "{\"id\":\"Q2\"}");
    EXPECT_EQ(second.generation, 2u);

    auto read = redis->get("links/a");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->value, "{\"id\":\"Q2\"}");
    EXPECT_EQ(read->generation, 2u);
    EXPECT_EQ(read->updated_at_ms, 42500);
}

TEST_F(RedisStorageTest, OptimisticConflict) {
    if (!redis->is_connected()) GTEST_SKIP();

    StoredValue v = redis->put("queue/t1", "pending");
    redis->put("queue/t1", "approved", v.generation);
    EXPECT_THROW(redis->put("queue/t1", "rejected", v.generation), StorageConflictError);
    EXPECT_THROW(redis->put("queue/absent", "x", 3), StorageConflictError);
    EXPECT_EQ(redis->get("queue/t1")->value, "approved");
}

TEST_F(RedisStorageTest, ListIsLiteralPrefix) {
    if (!redis->is_connected()) GTEST_SKIP();

    redis->put("queue/b", "2");
    redis->put("queue/a", "1");
    redis->put("queue*x", "glob");
    redis->put("links/z", "3");

    std::vector<std::string> expected = {"queue/a", "queue/b"};
    EXPECT_EQ(redis->list("queue/"), expected);
    EXPECT_EQ(redis->list("queue*").size(), 1u);
}

TEST_F(RedisStorageTest, Remove) {
    if (!redis->is_connected()) GTEST_SKIP();

    StoredValue v = redis->put("k", "v");
    EXPECT_THROW(redis->remove("k", v.generation + 1), StorageConflictError);
    EXPECT_TRUE(redis->remove("k", v.generation));
    EXPECT_FALSE(redis->remove("k"));
}

TEST_F(RedisStorageTest, ReviewWorkflowSurvivesEngineRestart) {
    if (!redis->is_connected()) GTEST_SKIP();

    FakeSearchClient search;
    search.results = {make_candidate("Q64", 70, "Berlin")};

    std::string task_id;
    {
        ReconciliationEngine engine(*redis, search, clock);
        task_id = *engine.reconcile_entity("http://example.org/berlin", "Berlin", {}).verification_task_id;
    }

    RedisStorage reopened(config, clock);
    ReconciliationEngine engine(reopened, search, clock);
    auto pending = engine.get_pending_tasks();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, task_id);

    engine.approve_task(task_id, "Q64");
    auto link = engine.get_link("http://example.org/berlin");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->external_id, "Q64");
}

TEST(RedisStorageStaticTest, EscapeGlob) {
    EXPECT_EQ(RedisStorage::escape_glob("queue/"), "queue/");
    EXPECT_EQ(RedisStorage::escape_glob("a*b?c[d]\\"), "a\\*b\\?c\\[d\\]\\\\");
}
