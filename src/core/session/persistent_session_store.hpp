#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_record.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vault {
namespace core {

enum class PersistentStatus {
    kActive = 0,
    kRevoked,
    kExpired,
};

std::string PersistentStatusToString(PersistentStatus status);

// 持久层中的一行会话数据
struct PersistentSession {
    std::string uuid;             // 持久层会话ID, 令牌轮换后保持不变
    std::string user_uuid;
    UserSnapshot user;
    std::string access_token;
    std::string refresh_token;
    std::int64_t access_expires_at = 0;
    std::int64_t refresh_expires_at = 0;
    Provider provider = Provider::kJwt;
    PersistentStatus status = PersistentStatus::kActive;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;
    std::int64_t last_token_refresh = 0;
    std::int64_t revoked_at = 0;  // 吊销或过期的时间
    std::string token_fingerprint;
    bool remember_me = false;
    std::string ip_address;
    std::string user_agent;
};

// 持久层接口; 具体实现 (数据库等) 由外部提供
class PersistentSessionStore {
public:
    virtual ~PersistentSessionStore() = default;

    virtual vault::common::Status Create(const PersistentSession& session) = 0;
    // 按 uuid 整行更新
    virtual vault::common::Status Update(const PersistentSession& session) = 0;
    virtual vault::common::StatusOr<PersistentSession> FindById(const std::string& uuid) = 0;
    virtual vault::common::StatusOr<PersistentSession> FindByAccessToken(const std::string& access_token) = 0;
    virtual vault::common::StatusOr<PersistentSession> FindByRefreshToken(const std::string& refresh_token) = 0;
    virtual vault::common::StatusOr<std::vector<PersistentSession>> ListActiveByUser(const std::string& user_uuid) = 0;
    // refresh_expires_at 早于 now 的活跃会话
    virtual vault::common::StatusOr<std::vector<PersistentSession>> ListExpired(std::int64_t now) = 0;
    // 删除 revoked_at 早于 cutoff 的已吊销/已过期会话, 返回删除数量
    virtual vault::common::StatusOr<std::size_t> PurgeInactiveBefore(std::int64_t cutoff) = 0;
    virtual vault::common::Status Delete(const std::string& uuid) = 0;
    virtual vault::common::Status Ping() = 0;
};

class InMemoryPersistentSessionStore : public PersistentSessionStore {
public:
    vault::common::Status Create(const PersistentSession& session) override;
    vault::common::Status Update(const PersistentSession& session) override;
    vault::common::StatusOr<PersistentSession> FindById(const std::string& uuid) override;
    vault::common::StatusOr<PersistentSession> FindByAccessToken(const std::string& access_token) override;
    vault::common::StatusOr<PersistentSession> FindByRefreshToken(const std::string& refresh_token) override;
    vault::common::StatusOr<std::vector<PersistentSession>> ListActiveByUser(const std::string& user_uuid) override;
    vault::common::StatusOr<std::vector<PersistentSession>> ListExpired(std::int64_t now) override;
    vault::common::StatusOr<std::size_t> PurgeInactiveBefore(std::int64_t cutoff) override;
    vault::common::Status Delete(const std::string& uuid) override;
    vault::common::Status Ping() override;

    // 故障注入, 仅用于测试
    void FailNextWrites(int n);
    void SetAvailable(bool available);
    std::size_t Size() const;

private:
    vault::common::Status CheckWritableLocked();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, PersistentSession> sessions_;
    int fail_writes_ = 0;
    bool available_ = true;
};

} // namespace core
} // namespace vault
