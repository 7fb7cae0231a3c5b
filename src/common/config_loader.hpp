#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace vault {
namespace common {

// 默认配置文件路径
inline constexpr const char* kDefaultConfigPath = "config/session_vault.json";

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromEnvOrDefault();
    static AppConfig FromJson(const nlohmann::json& j);
private:
    static nlohmann::json ReadFile(const std::string& path);
};

}
}
