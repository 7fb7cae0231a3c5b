#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vault {
namespace core {

// 签发会话的认证方式, 决定 TTL 策略
enum class Provider {
    kJwt = 0,
    kApiKey,
    kOAuth,
    kSocial,
    kSaml,
    kLdap,
    kAdmin,
};

enum class SessionStatus {
    kActive = 0,
    kRevoked,
};

std::string ProviderToString(Provider provider);
// 支持 "apikey" 作为 "api_key" 的别名
std::optional<Provider> ProviderFromString(std::string_view name);
// 所有已知的 provider, 查询无索引提示时按此顺序扫描
const std::vector<Provider>& AllProviders();

std::string SessionStatusToString(SessionStatus status);
std::optional<SessionStatus> SessionStatusFromString(std::string_view name);

// 会话创建时的用户快照 (不会随用户资料实时更新)
struct UserSnapshot {
    std::string uuid;
    std::string role;                          // 主角色
    std::vector<std::string> roles;            // 附加角色
    std::vector<std::string> permissions;
    std::map<std::string, std::string> attributes;

    bool HasRole(const std::string& name) const;
    bool operator==(const UserSnapshot& other) const;
    bool operator!=(const UserSnapshot& other) const { return !(*this == other); }
};

struct SessionRecord {
    std::string id;               // 由 access token 确定性派生
    std::string access_token;
    std::string refresh_token;
    Provider provider = Provider::kJwt;
    UserSnapshot user;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;  // 最近一次活动时间
    SessionStatus status = SessionStatus::kActive;
    std::int64_t ttl_seconds = 0; // 写入缓存时生效的 TTL
    bool ttl_overridden = false;  // TTL 是否由调用方显式指定
    std::uint64_t version = 0;    // 每次写入递增, 用于检测并发覆盖
    std::string ip_address;
    std::string user_agent;
    std::map<std::string, std::string> metadata;

    bool operator==(const SessionRecord& other) const;
    bool operator!=(const SessionRecord& other) const { return !(*this == other); }
};

// 批量更新时的浅合并字段, 未设置的字段保持不变
// provider 与 user.uuid 不可通过更新修改 (会破坏索引), 迁移请使用事务的 MigrateSessions
struct SessionUpdate {
    std::optional<std::string> role;
    std::optional<std::vector<std::string>> roles;
    std::optional<std::vector<std::string>> permissions;
    std::optional<SessionStatus> status;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    std::map<std::string, std::string> metadata;
    std::optional<std::int64_t> updated_at;

    bool Empty() const;
};

void ApplySessionUpdate(SessionRecord& record, const SessionUpdate& update);

// 按字段名读取记录中的字符串值, 用于精确匹配条件
// 支持 id, access_token, refresh_token, provider, status, ip_address, user_agent,
// user_uuid, user_role, 以及 metadata.<key>; 未知字段返回 std::nullopt
std::optional<std::string> RecordField(const SessionRecord& record, const std::string& field);

} // namespace core
} // namespace vault
