#include "cache/redis_client.hpp"

#include <chrono>

namespace vault {
namespace cache {

// 构造函数
RedisClient::RedisClient(const vault::common::RedisConfig& config)
    : config_(config) {}

// 析构函数
RedisClient::~RedisClient() = default;

// 连接到Redis服务器
vault::common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return vault::common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (redis_) {
        return vault::common::Status::OK(); // 已经连接
    }

    try {
        sw::redis::ConnectionOptions opts; // Redis连接选项
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        // 创建连接池选项
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return vault::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

// 获取键对应的值
vault::common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto val = redis_->get(Prefixed(key));
        if (!val) {
            return vault::common::Status::NotFound("Key not found in Redis: " + key);
        }
        return vault::common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Failed to get key from Redis: " + std::string(err.what()));
    }
}

// 设置键值对并设置过期时间
vault::common::Status RedisClient::SetEx(const std::string& key, const std::string& value,
                                         std::int64_t ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        bool ok = ttl_seconds > 0
            ? redis_->set(Prefixed(key), value, std::chrono::seconds(ttl_seconds))
            : redis_->set(Prefixed(key), value);
        if (!ok) {
            return vault::common::Status::Unavailable("Redis rejected SET for key: " + key);
        }
        return vault::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Failed to set key with expiration in Redis: " + std::string(err.what()));
    }
}

// 删除键
vault::common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        if (redis_->del(Prefixed(key)) == 0) {
            return vault::common::Status::NotFound("Key not found in Redis: " + key);
        }
        return vault::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Failed to delete key from Redis: " + std::string(err.what()));
    }
}

vault::common::Status RedisClient::Ping() {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->ping();
        return vault::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Redis ping failed: " + std::string(err.what()));
    }
}

// 检查键是否存在
vault::common::StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto count = redis_->exists(Prefixed(key));
        return vault::common::StatusOr<bool>(count > 0);
    } catch (const sw::redis::Error& err) {
        return vault::common::Status::Unavailable("Failed to check key existence in Redis: " + std::string(err.what()));
    }
}

} // namespace cache
} // namespace vault
