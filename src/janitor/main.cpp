#include "cache/redis_client.hpp"
#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/session/session_store.hpp"
#include "core/session/session_transaction.hpp"
#include "core/session/token_storage.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

// 执行一轮维护, 返回是否全部成功
bool RunOnce(vault::core::TokenStorageService& storage) {
    auto report = storage.RunMaintenance();
    for (const auto& error : report.errors) {
        VAULT_LOG_ERROR("Maintenance failed: {}", error);
    }
    VAULT_LOG_INFO("Maintenance round: {} expired, {} index entries compacted, {} revoked sessions purged",
                   report.expired, report.compacted, report.purged);
    return report.Ok();
}

} // namespace

// 用法: vault_janitor [config.json] [--recover <transaction_id>]...
int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> recover_ids;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--recover") == 0 && i + 1 < argc) {
            recover_ids.emplace_back(argv[++i]);
        } else if (config_path.empty()) {
            config_path = argv[i];
        }
    }
    if (config_path.empty()) {
        if (const char* env = std::getenv("SESSION_VAULT_CONFIG")) {
            config_path = env;
        } else {
            config_path = vault::common::kDefaultConfigPath;
        }
    }

    vault::common::AppConfig config;
    try {
        config = vault::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    vault::common::InitLogger(config.logging);
    VAULT_LOG_INFO("Session janitor starting with config {}", config_path);

    if (!config.redis.enabled) {
        VAULT_LOG_ERROR("Redis is disabled in {}, the janitor needs the shared cache", config_path);
        vault::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    auto redis = std::make_shared<vault::cache::RedisClient>(config.redis);
    auto status = redis->Connect();
    if (!status.IsOk()) {
        VAULT_LOG_ERROR("Failed to connect to redis {}:{}: {}", config.redis.host, config.redis.port,
                        status.Message());
        vault::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    auto store = std::make_shared<vault::core::SessionStore>(redis, nullptr, config.session);
    // 本进程不连接持久层, 只处理缓存侧; 嵌入持久层的服务自行调用 RunMaintenance
    vault::core::TokenStorageService storage(store, nullptr);

    int exit_code = EXIT_SUCCESS;
    for (const auto& id : recover_ids) {
        auto replayed = vault::core::SessionTransaction::Recover(store, id);
        if (!replayed.IsOk()) {
            VAULT_LOG_ERROR("Recovery of transaction {} failed: {}", id, replayed.GetStatus().Message());
            exit_code = EXIT_FAILURE;
        } else {
            VAULT_LOG_INFO("Recovered transaction {} ({} compensations)", id, replayed.Value());
        }
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    while (g_stop_signal == 0) {
        const bool ok = RunOnce(storage);
        if (config.janitor.run_once) {
            if (!ok) {
                exit_code = EXIT_FAILURE;
            }
            break;
        }
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.janitor.interval_seconds);
        while (g_stop_signal == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    if (g_stop_signal != 0) {
        VAULT_LOG_WARN("Signal {} received, janitor stopping", g_stop_signal);
    }

    vault::common::ShutdownLogger();
    return exit_code;
}
