#pragma once

#include "cache/cache_store.hpp"
#include "common/clock.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_lock_table.hpp"
#include "core/session/session_record.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault {
namespace core {

class SessionQuery;

// 会话二级索引 (provider -> ids, user -> ids)
// 每个索引是一个缓存键, 值为 {id: expires_at} 的 JSON 对象;
// 每个条目携带自己的过期时间, 读写时顺带剔除过期条目, 不需要单独的清扫
class SessionIndex {
public:
    SessionIndex(std::shared_ptr<vault::cache::CacheStore> cache,
                 std::shared_ptr<vault::common::Clock> clock,
                 std::size_t lock_stripes = 64);

    // 条目 TTL 与记录 TTL 相同, 两者同时过期
    vault::common::Status IndexByProvider(Provider provider, const std::string& id, std::int64_t ttl_seconds);
    vault::common::Status RemoveFromProviderIndex(Provider provider, const std::string& id);
    vault::common::Status IndexByUser(const std::string& user_uuid, const std::string& id, std::int64_t ttl_seconds);
    vault::common::Status RemoveFromUserIndex(const std::string& user_uuid, const std::string& id);

    // 当前仍有效的成员ID (按ID排序)
    vault::common::StatusOr<std::vector<std::string>> ProviderMembers(Provider provider);
    vault::common::StatusOr<std::vector<std::string>> UserMembers(const std::string& user_uuid);

    // 重写 provider 索引: 剔除过期条目, 主记录已不存在的孤儿条目, 以及 provider 已变更的条目
    // 返回剔除的条目数
    vault::common::StatusOr<std::size_t> Compact(Provider provider);

    // 读取 session:<id> 并解码, 不存在返回 kNotFound
    vault::common::StatusOr<SessionRecord> Hydrate(const std::string& id);

    SessionQuery Query();

    const std::shared_ptr<vault::common::Clock>& GetClock() const { return clock_; }

private:
    using Entries = std::map<std::string, std::int64_t>; // id -> expires_at (0 表示不过期)

    vault::common::StatusOr<Entries> Load(const std::string& key);
    vault::common::Status Save(const std::string& key, const Entries& entries);
    vault::common::Status Upsert(const std::string& key, const std::string& id, std::int64_t ttl_seconds);
    vault::common::Status Remove(const std::string& key, const std::string& id);
    vault::common::StatusOr<std::vector<std::string>> Members(const std::string& key);
    void PruneExpired(Entries& entries) const;

    std::shared_ptr<vault::cache::CacheStore> cache_;
    std::shared_ptr<vault::common::Clock> clock_;
    SessionLockTable locks_; // 串行化同一索引键的读-改-写
};

// 会话查询构造器, 所有条件之间为 AND 关系; OrWhere 组内的条件为 OR 关系
// 候选ID来自用户索引 (若有用户条件) 或 provider 索引; 角色/活动时间等条件在加载后的记录上求值
class SessionQuery {
public:
    using Predicate = std::function<bool(const SessionRecord&)>;

    explicit SessionQuery(SessionIndex* index);

    SessionQuery& WhereProvider(Provider provider);
    SessionQuery& WhereProviderIn(const std::vector<Provider>& providers);
    SessionQuery& WhereUser(const std::string& user_uuid);
    SessionQuery& WhereUserIn(const std::vector<std::string>& user_uuids);
    SessionQuery& WhereUserRole(const std::string& role);
    SessionQuery& WhereUserHasAnyRole(const std::vector<std::string>& roles);
    SessionQuery& WhereUserHasAllRoles(const std::vector<std::string>& roles);
    SessionQuery& WhereUserHasPermission(const std::string& permission);
    SessionQuery& WhereIpAddress(const std::string& ip_address);
    // shell 通配符匹配, 如 "192.168.*"
    SessionQuery& WhereIpAddressLike(const std::string& pattern);
    // 不区分大小写的子串匹配
    SessionQuery& WhereUserAgentLike(const std::string& fragment);
    // updated_at 早于 (now - seconds)
    SessionQuery& WhereLastActivityOlderThan(std::int64_t seconds);
    SessionQuery& WhereLastActivityWithin(std::int64_t seconds);
    SessionQuery& WhereCreatedBetween(std::int64_t from, std::int64_t to);
    SessionQuery& WhereStatus(SessionStatus status);
    SessionQuery& Where(Predicate predicate);
    // build 中添加的条件任一满足即可; 组内条件不参与候选ID的选择
    SessionQuery& OrWhere(const std::function<void(SessionQuery&)>& build);

    SessionQuery& OrderByLastActivity(bool descending = false);
    SessionQuery& Limit(std::size_t limit);
    SessionQuery& Offset(std::size_t offset);

    vault::common::StatusOr<std::vector<SessionRecord>> Get();
    vault::common::StatusOr<std::size_t> Count();
    // 没有匹配记录时返回 kNotFound
    vault::common::StatusOr<SessionRecord> First();
    vault::common::StatusOr<bool> Exists();

private:
    vault::common::StatusOr<std::vector<std::string>> CandidateIds();
    vault::common::StatusOr<std::vector<SessionRecord>> Matching();

    SessionIndex* index_;
    std::vector<Predicate> predicates_;
    std::vector<Provider> provider_hint_;
    std::optional<std::vector<std::string>> user_hint_;
    std::optional<bool> order_desc_;
    std::optional<std::size_t> limit_;
    std::optional<std::size_t> offset_;
};

} // namespace core
} // namespace vault
