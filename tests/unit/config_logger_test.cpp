#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
std::filesystem::path TempPath(const std::string& suffix) {
    auto base = std::filesystem::temp_directory_path();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("session_vault_test_" + suffix + "_" + std::to_string(now));
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file_, ec);
        }
    }

    std::filesystem::path WriteTempConfig(const std::string& content) {
        temp_file_ = TempPath("config.json");
        std::ofstream ofs(temp_file_);
        ofs << content;
        ofs.flush();
        return temp_file_;
    }

private:
    std::filesystem::path temp_file_;
};

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    const std::string config_json = R"({
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/vault.log"
        },
        "redis": {
            "enabled": true,
            "host": "10.0.0.5",
            "port": 6380,
            "key_prefix": "test:"
        },
        "session": {
            "default_ttl_seconds": 900,
            "provider_ttls": {"jwt": 600, "saml": 1200},
            "revoked_retention_seconds": 86400,
            "journal_enabled": true
        },
        "janitor": {
            "interval_seconds": 60,
            "run_once": true
        }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = vault::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/vault.log");

    EXPECT_TRUE(cfg.redis.enabled);
    EXPECT_EQ(cfg.redis.host, "10.0.0.5");
    EXPECT_EQ(cfg.redis.port, 6380);
    EXPECT_EQ(cfg.redis.key_prefix, "test:");

    EXPECT_EQ(cfg.session.default_ttl_seconds, 900);
    EXPECT_EQ(cfg.session.provider_ttls.at("jwt"), 600);
    EXPECT_EQ(cfg.session.provider_ttls.at("saml"), 1200);
    // 未覆盖的 provider 保留默认值
    EXPECT_EQ(cfg.session.provider_ttls.at("api_key"), 86400);
    EXPECT_EQ(cfg.session.revoked_retention_seconds, 86400);
    EXPECT_TRUE(cfg.session.journal_enabled);

    EXPECT_EQ(cfg.janitor.interval_seconds, 60);
    EXPECT_TRUE(cfg.janitor.run_once);
}

TEST_F(ConfigLoaderTest, DefaultsWhenSectionsMissing) {
    auto config_path = WriteTempConfig("{}");
    auto cfg = vault::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_FALSE(cfg.redis.enabled);
    EXPECT_EQ(cfg.session.default_ttl_seconds, 3600);
    EXPECT_EQ(cfg.session.provider_ttls.at("oauth"), 7200);
    EXPECT_FALSE(cfg.session.journal_enabled);
    EXPECT_EQ(cfg.janitor.interval_seconds, 300);
}

TEST_F(ConfigLoaderTest, RejectsNonPositiveProviderTtl) {
    auto config_path = WriteTempConfig(R"({"session": {"provider_ttls": {"jwt": 0}}})");
    EXPECT_THROW(vault::common::ConfigLoader::Load(config_path.string()), std::runtime_error);
}

TEST_F(ConfigLoaderTest, RejectsMalformedFile) {
    auto config_path = WriteTempConfig("{ not json");
    EXPECT_THROW(vault::common::ConfigLoader::Load(config_path.string()), std::runtime_error);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(vault::common::ConfigLoader::Load("/nonexistent/session_vault.json"), std::runtime_error);
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        vault::common::ShutdownLogger();
        if (!temp_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir_, ec);
        }
    }

    std::filesystem::path PrepareLogPath(const std::string& filename) {
        temp_dir_ = TempPath("logs");
        return temp_dir_ / "logs" / filename;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(LoggerInitTest, CreatesDirectories) {
    auto log_file = PrepareLogPath("vault.log");

    vault::common::LoggingConfig config;
    config.console = false;
    config.level = "warn";
    config.pattern = "[test] %v";
    config.file = log_file.string();

    vault::common::InitLogger(config);

    auto logger = vault::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));

    // 触发一次日志写入，确保文件被创建
    VAULT_LOG_WARN("logger integration test");

    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerInitTest, InvalidLevelFallsBackToInfo) {
    vault::common::LoggingConfig config;
    config.console = false;
    config.level = "not-a-level";

    vault::common::InitLogger(config);

    auto logger = vault::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}

TEST_F(LoggerInitTest, UsableAfterShutdown) {
    vault::common::ShutdownLogger();
    auto logger = vault::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    VAULT_LOG_INFO("logging after shutdown");
}
