#pragma once

#include "common/status_or.hpp"
#include "core/session/session_index.hpp"
#include "core/session/session_record.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace vault {
namespace core {

struct ByProvider {
    Provider provider = Provider::kJwt;
};

// 最近活动时间早于 now - seconds
struct ByIdleOlderThan {
    std::int64_t seconds = 0;
};

// 主角色或附加角色之一匹配
struct ByUserRole {
    std::string role;
};

struct ByUser {
    std::string user_uuid;
};

struct ByStatus {
    SessionStatus status = SessionStatus::kActive;
};

// 按 RecordField 读取的字段做精确匹配
struct ByField {
    std::string field;
    std::string value;
};

struct Custom {
    std::function<bool(const SessionRecord&)> predicate;
    std::string description = "custom";
};

using Criterion = std::variant<ByProvider, ByIdleOlderThan, ByUserRole, ByUser, ByStatus, ByField, Custom>;
// 多个条件之间为 AND 关系
using SessionCriteria = std::vector<Criterion>;

// 解析旧式字符串条件: provider, idle_time (">N" 秒), user_role, user_uuid, status,
// 其他键按记录字段精确匹配
vault::common::StatusOr<SessionCriteria> ParseCriteria(const std::map<std::string, std::string>& raw);

void ApplyCriteria(SessionQuery& query, const SessionCriteria& criteria);

// 用于操作日志
std::string DescribeCriteria(const SessionCriteria& criteria);

} // namespace core
} // namespace vault
