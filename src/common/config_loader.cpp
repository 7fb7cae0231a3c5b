#include "common/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace vault {
namespace common {

namespace {

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("SESSION_VAULT_CONFIG")) {
        return env;
    }
    return kDefaultConfigPath;
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    try {
        return nlohmann::json::parse(ifs, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Redis配置
    if (j.contains("redis")) {
        const auto& redis = j["redis"];
        cfg.redis.host = redis.value("host", cfg.redis.host);
        cfg.redis.port = redis.value("port", cfg.redis.port);
        cfg.redis.password = redis.value("password", cfg.redis.password);
        cfg.redis.db = redis.value("db", cfg.redis.db);
        cfg.redis.pool_size = redis.value("pool_size", cfg.redis.pool_size);
        cfg.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.redis.connection_timeout_ms);
        cfg.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.redis.socket_timeout_ms);
        cfg.redis.key_prefix = redis.value("key_prefix", cfg.redis.key_prefix);
        cfg.redis.enabled = redis.value("enabled", cfg.redis.enabled);
    }
    // Session配置
    if (j.contains("session")) {
        const auto& session = j["session"];
        cfg.session.default_ttl_seconds = session.value("default_ttl_seconds", cfg.session.default_ttl_seconds);
        if (session.contains("provider_ttls")) {
            const auto& ttls = session["provider_ttls"];
            if (!ttls.is_object()) {
                throw std::runtime_error("session.provider_ttls must be an object");
            }
            for (auto it = ttls.begin(); it != ttls.end(); ++it) {
                auto ttl = it.value().get<std::int64_t>();
                if (ttl <= 0) {
                    throw std::runtime_error("session.provider_ttls." + it.key() + " must be positive");
                }
                cfg.session.provider_ttls[it.key()] = ttl;
            }
        }
        cfg.session.refresh_token_lifetime_seconds =
            session.value("refresh_token_lifetime_seconds", cfg.session.refresh_token_lifetime_seconds);
        cfg.session.revoked_retention_seconds =
            session.value("revoked_retention_seconds", cfg.session.revoked_retention_seconds);
        cfg.session.lock_stripes = session.value("lock_stripes", cfg.session.lock_stripes);
        cfg.session.journal_enabled = session.value("journal_enabled", cfg.session.journal_enabled);
        cfg.session.fingerprint_salt = session.value("fingerprint_salt", cfg.session.fingerprint_salt);
    }
    // Janitor配置
    if (j.contains("janitor")) {
        const auto& janitor = j["janitor"];
        cfg.janitor.interval_seconds = janitor.value("interval_seconds", cfg.janitor.interval_seconds);
        cfg.janitor.run_once = janitor.value("run_once", cfg.janitor.run_once);
    }
    return cfg;
}

}
}
