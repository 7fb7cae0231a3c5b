#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/persistent_session_store.hpp"
#include "core/session/session_record.hpp"
#include "core/session/session_store.hpp"
#include "core/session/token_issuer.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vault {
namespace core {

// 登录成功后需要保存的会话信息 (令牌另行传入)
struct SessionData {
    UserSnapshot user;
    Provider provider = Provider::kJwt;
    std::string session_id;   // 持久层会话ID, 为空时自动生成
    bool remember_me = false;
    std::string ip_address;
    std::string user_agent;
    std::map<std::string, std::string> metadata;
};

enum class LayerStatus {
    kHealthy = 0,
    kUnhealthy,
    kDisabled,
};

std::string LayerStatusToString(LayerStatus status);

struct LayerHealth {
    LayerStatus status = LayerStatus::kDisabled;
    double response_time_ms = 0.0;
    std::string error;
};

struct StorageHealth {
    LayerHealth cache;
    LayerHealth persistent;
    std::string overall; // "healthy" 或 "degraded"
};

// 两层存储出现部分失败时记录的不一致事件
struct StorageInconsistency {
    std::string session_id;
    std::string operation;
    std::string detail;
    std::int64_t detected_at = 0;
};

// 一轮周期维护的结果
struct MaintenanceReport {
    std::size_t expired = 0;   // 标记为过期的持久层会话
    std::size_t compacted = 0; // 从 provider 索引剔除的条目
    std::size_t purged = 0;    // 删除的已吊销会话 (两层合计)
    std::vector<std::string> errors;

    bool Ok() const { return errors.empty(); }
};

// 双层令牌存储: 持久层保证持久性, SessionStore 作为快速读取路径
// 写入先持久层后缓存; 读取先缓存, 未命中时回源持久层并回填缓存
class TokenStorageService {
public:
    using Status = vault::common::Status;

    // 会话记录 metadata 中保存持久层ID的键
    static constexpr const char* kPersistentIdKey = "persistent_id";

    // persistent 为空时仅使用缓存层
    TokenStorageService(std::shared_ptr<SessionStore> store,
                        std::shared_ptr<PersistentSessionStore> persistent);

    Status StoreSession(const SessionData& data, const TokenPair& tokens);
    // 轮换令牌; 旧令牌在两层中都会失效
    Status UpdateSessionTokens(const std::string& refresh_token, const TokenPair& new_tokens);

    vault::common::StatusOr<SessionRecord> GetSessionByAccessToken(const std::string& access_token);
    vault::common::StatusOr<SessionRecord> GetSessionByRefreshToken(const std::string& refresh_token);

    // identifier 可以是 refresh token 或 access token
    Status RevokeSession(const std::string& identifier);
    Status RevokeAllUserSessions(const std::string& user_uuid);

    // 将持久层中 refresh token 已过期的会话标记为过期, 返回处理数量
    vault::common::StatusOr<std::size_t> CleanupExpiredSessions();
    // 删除超过保留窗口的已吊销会话 (两层合计)
    vault::common::StatusOr<std::size_t> PurgeRevokedSessions();
    // 依次执行过期清理, 索引压缩, 保留期清理; 某一步失败时其余步骤照常执行
    MaintenanceReport RunMaintenance();

    // 比较两层对同一会话的视图, 不一致时返回 kDataLoss
    Status ValidateStorageConsistency(const std::string& identifier);
    StorageHealth GetStorageHealth();

    std::vector<StorageInconsistency> Inconsistencies() const;
    bool PersistentEnabled() const { return persistent_ != nullptr; }

private:
    vault::common::StatusOr<PersistentSession> FindPersistent(const std::string& identifier);
    vault::common::StatusOr<SessionRecord> FindCached(const std::string& identifier);
    // 缓存未命中时由持久层记录回填
    vault::common::StatusOr<SessionRecord> Backfill(const PersistentSession& row);
    SessionRecord RecordFromRow(const PersistentSession& row) const;
    // 使缓存中的旧会话失效: 删除失败时改写为已吊销状态
    Status InvalidateCached(const std::string& id);
    std::string Fingerprint(const std::string& token) const;
    void RecordInconsistency(const std::string& session_id, const std::string& operation,
                             const std::string& detail);

    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<PersistentSessionStore> persistent_;

    mutable std::mutex inconsistency_mutex_;
    std::vector<StorageInconsistency> inconsistencies_;
};

} // namespace core
} // namespace vault
