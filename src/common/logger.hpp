#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace vault {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define VAULT_LOG_DEBUG(...) ::vault::common::GetLogger()->debug(__VA_ARGS__)
#define VAULT_LOG_INFO(...)  ::vault::common::GetLogger()->info(__VA_ARGS__)
#define VAULT_LOG_WARN(...)  ::vault::common::GetLogger()->warn(__VA_ARGS__)
#define VAULT_LOG_ERROR(...) ::vault::common::GetLogger()->error(__VA_ARGS__)

}
}
