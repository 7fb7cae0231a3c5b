#include <gtest/gtest.h>

#include "cache/redis_client.hpp"
#include "common/config.hpp"

#include <cstdlib>

namespace {

vault::common::RedisConfig ConfigFromEnv() {
    vault::common::RedisConfig cfg;
    cfg.enabled = true;
    cfg.key_prefix = "vault_test:";
    if (const char* host = std::getenv("REDIS_HOST")) cfg.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) cfg.port = std::atoi(port);
    if (const char* pass = std::getenv("REDIS_PASSWORD")) cfg.password = pass;
    return cfg;
}

} // namespace

class RedisClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_unique<vault::cache::RedisClient>(ConfigFromEnv());
        auto connected = client_->Connect();
        if (!connected.IsOk() || !client_->Ping().IsOk()) {
            GTEST_SKIP() << "redis not reachable";
        }
    }

    std::unique_ptr<vault::cache::RedisClient> client_;
};

TEST_F(RedisClientTest, BasicOps) {
    auto st = client_->SetEx("test:key", "value", 30);
    ASSERT_TRUE(st.IsOk()) << st.Message();

    auto get = client_->Get("test:key");
    ASSERT_TRUE(get.IsOk()) << get.GetStatus().Message();
    EXPECT_EQ(get.Value(), "value");

    auto ex = client_->Exists("test:key");
    ASSERT_TRUE(ex.IsOk()) << ex.GetStatus().Message();
    EXPECT_TRUE(ex.Value());

    auto del = client_->Del("test:key");
    ASSERT_TRUE(del.IsOk()) << del.Message();
    EXPECT_EQ(client_->Del("test:key").Code(), vault::common::StatusCode::kNotFound);
    EXPECT_EQ(client_->Get("test:key").GetStatus().Code(), vault::common::StatusCode::kNotFound);
}
