#pragma once

#include "cache/cache_store.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace vault {
namespace cache {

// 基于 Redis 的缓存后端
class RedisClient : public CacheStore {
public:
    explicit RedisClient(const vault::common::RedisConfig& config);
    ~RedisClient() override;

    // 连接到Redis服务器 (redis++ 惰性建连, 这里只创建连接池)
    vault::common::Status Connect();

    // 获取键对应的值
    vault::common::StatusOr<std::string> Get(const std::string& key) override;
    // 设置键值对并设置过期时间
    vault::common::Status SetEx(const std::string& key, const std::string& value,
                                std::int64_t ttl_seconds) override;
    // 删除键
    vault::common::Status Del(const std::string& key) override;
    // 发送 PING, 确认服务端可达
    vault::common::Status Ping() override;

    // 检查键是否存在
    vault::common::StatusOr<bool> Exists(const std::string& key);

private:
    // 加上配置的键前缀
    std::string Prefixed(const std::string& key) const { return config_.key_prefix + key; }

    vault::common::RedisConfig config_; // Redis配置
    std::mutex connect_mutex_; // 保护 redis_ 的初始化
    std::shared_ptr<sw::redis::Redis> redis_; // Redis连接对象
};

} // namespace cache
} // namespace vault
