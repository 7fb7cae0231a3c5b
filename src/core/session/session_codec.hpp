#pragma once

#include "common/status_or.hpp"
#include "core/session/session_record.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace vault {
namespace core {

// 会话记录 <-> 缓存值 (JSON) 的编解码
nlohmann::json SessionToJson(const SessionRecord& record);
vault::common::StatusOr<SessionRecord> SessionFromJson(const nlohmann::json& j);

std::string EncodeSession(const SessionRecord& record);
vault::common::StatusOr<SessionRecord> DecodeSession(const std::string& payload);

} // namespace core
} // namespace vault
