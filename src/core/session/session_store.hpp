#pragma once

#include "cache/cache_store.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_index.hpp"
#include "core/session/session_lock_table.hpp"
#include "core/session/session_record.hpp"
#include "core/session/token_issuer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault {
namespace core {

// 写入一个新会话时的可选字段
struct StoreOptions {
    std::optional<std::int64_t> ttl_override;
    std::string refresh_token;
    std::string ip_address;
    std::string user_agent;
    std::map<std::string, std::string> metadata;
};

// 会话主存储: session:<id> 记录 + provider/user 索引
// 写入顺序为先写主记录再写索引; 删除顺序为先删主记录再尽力清理索引,
// 残留的索引条目会随自身 TTL 过期
class SessionStore {
public:
    using Status = vault::common::Status;
    using StatusOrSession = vault::common::StatusOr<SessionRecord>;
    using Mutator = std::function<void(SessionRecord&)>;
    using BeforeWrite = std::function<Status(const SessionRecord&)>;

    SessionStore(std::shared_ptr<vault::cache::CacheStore> cache,
                 std::shared_ptr<TokenIssuer> issuer,
                 vault::common::SessionConfig config = vault::common::SessionConfig(),
                 std::shared_ptr<vault::common::Clock> clock = nullptr);

    // 创建会话; TTL 取 ttl_override, 否则取 provider 策略
    // written 非空时报告失败后缓存中是否仍残留本次写入 (撤销也失败)
    Status StoreSession(const UserSnapshot& user, const std::string& access_token, Provider provider,
                        const StoreOptions& options = StoreOptions(), bool* written = nullptr);
    // 写入一条完整记录 (id 为空时由 access token 推导), 用于从持久层回填
    Status StoreRecord(SessionRecord record, bool* written = nullptr);

    StatusOrSession GetSession(const std::string& id);
    StatusOrSession GetSessionByAccessToken(const std::string& access_token);
    StatusOrSession GetSessionByRefreshToken(const std::string& refresh_token);
    vault::common::StatusOr<std::vector<SessionRecord>> GetSessionsByProvider(Provider provider);

    Status DestroySession(const std::string& access_token);
    // before_destroy 在删除前拿到原记录, 返回非 OK 时放弃删除
    Status DestroySessionById(const std::string& id, const BeforeWrite& before_destroy = nullptr);

    // 在会话锁内执行读-改-写; before_write 在写入前拿到修改前的记录 (用于登记补偿),
    // 返回非 OK 时放弃写入
    // 写入前会再次读取版本号, 若已被其他写入者修改则返回 kAborted
    // provider 变化时同时迁移 provider 索引
    // 写入后索引失败时会写回修改前的记录; written 报告缓存中的记录是否已被改动
    StatusOrSession MutateSession(const std::string& id, const Mutator& mutate,
                                  const BeforeWrite& before_write = nullptr, bool* written = nullptr);

    // 原样写回一条历史记录 (不递增版本), 并重建其索引
    Status RestoreSession(const SessionRecord& record);

    // 刷新最近活动时间
    StatusOrSession TouchSession(const std::string& access_token);

    // 删除 updated_at 早于保留窗口的已吊销会话
    vault::common::StatusOr<std::size_t> PurgeRevoked(std::int64_t retention_seconds);
    // 压缩所有 provider 索引, 返回剔除的条目数
    vault::common::StatusOr<std::size_t> CompactIndexes();

    std::int64_t GetProviderTtl(Provider provider) const;
    // 记录写回时使用的 TTL: 显式指定过的保持不变, 否则按 provider 策略
    std::int64_t ResolveTtl(const SessionRecord& record) const;

    SessionQuery Query() { return index_.Query(); }
    SessionIndex& Index() { return index_; }
    const std::shared_ptr<vault::cache::CacheStore>& Cache() const { return cache_; }
    const std::shared_ptr<TokenIssuer>& Issuer() const { return issuer_; }
    const std::shared_ptr<vault::common::Clock>& GetClock() const { return clock_; }
    const vault::common::SessionConfig& Config() const { return config_; }

private:
    // primary_written 报告 session:<id> 是否已写入
    Status WriteRecord(const SessionRecord& record, bool* primary_written = nullptr);
    // 写回修改前的记录及其索引
    Status RevertLocked(const SessionRecord& before, const SessionRecord& after);
    Status IndexRecord(const SessionRecord& record);
    void UnindexRecord(const SessionRecord& record);
    Status DestroyLocked(const SessionRecord& record);

    std::shared_ptr<vault::cache::CacheStore> cache_;
    std::shared_ptr<TokenIssuer> issuer_;
    vault::common::SessionConfig config_;
    std::shared_ptr<vault::common::Clock> clock_;
    SessionIndex index_;
    SessionLockTable locks_;
};

} // namespace core
} // namespace vault
