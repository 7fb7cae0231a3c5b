#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace vault {
namespace common {

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 1000;
    std::string key_prefix = "vault:"; // 所有键的统一前缀
    bool enabled = false;
};

// 会话存储配置结构体
struct SessionConfig {
    std::int64_t default_ttl_seconds = 3600;
    // provider 名称 -> TTL (秒)
    std::map<std::string, std::int64_t> provider_ttls = {
        {"jwt", 3600},
        {"api_key", 86400},
        {"oauth", 7200},
        {"social", 7200},
    };
    std::int64_t refresh_token_lifetime_seconds = 30 * 24 * 3600;
    std::int64_t revoked_retention_seconds = 30 * 24 * 3600; // 已吊销会话的保留时长
    std::size_t lock_stripes = 64;
    bool journal_enabled = false; // 是否将补偿日志写入缓存
    std::string fingerprint_salt = "";
};

// 定时清理任务配置结构体
struct JanitorConfig {
    int interval_seconds = 300;
    bool run_once = false;
};

// 应用配置结构体
struct AppConfig {
    LoggingConfig logging;
    RedisConfig redis;
    SessionConfig session;
    JanitorConfig janitor;
};

}
}
