#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/session/session_criteria.hpp"
#include "core/session/session_record.hpp"
#include "core/session/session_store.hpp"
#include "core/session/token_issuer.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vault {
namespace core {

enum class TransactionState {
    kIdle = 0,
    kActive,
    kCommitted,
    kRolledBack,
    kRolledBackWithErrors, // 回滚完成但部分补偿失败
};

std::string TransactionStateToString(TransactionState state);

// 补偿动作: 恢复会话到修改前的记录
struct RestoreSessionAction {
    SessionRecord record;
};

// 补偿动作: 删除事务中创建的会话
struct DeleteSessionAction {
    std::string session_id;
    std::string access_token;
};

using Compensation = std::variant<RestoreSessionAction, DeleteSessionAction>;

// CreateSessions 的单个输入; tokens 为空时自动签发
struct NewSession {
    UserSnapshot user;
    Provider provider = Provider::kJwt;
    std::optional<TokenPair> tokens;
    std::optional<std::int64_t> ttl_override;
    std::string ip_address;
    std::string user_agent;
    std::map<std::string, std::string> metadata;
};

struct OperationLogEntry {
    std::string type;      // invalidate_sessions / update_sessions / create_sessions / migrate_sessions
    std::string detail;
    std::size_t affected = 0;
    std::size_t failed = 0;
    std::int64_t timestamp = 0;
};

struct TransactionStats {
    std::string transaction_id;
    TransactionState state = TransactionState::kIdle;
    bool is_active = false;
    bool is_committed = false;
    bool is_rolled_back = false;
    std::size_t operation_count = 0;
    std::size_t error_count = 0;
    std::size_t pending_compensations = 0;
    double duration_ms = 0.0;
    std::vector<OperationLogEntry> operations;
    std::vector<std::string> errors;
    std::vector<std::string> rollback_errors;
};

// 会话批量操作事务: 正向执行 + 登记补偿 + 逆序回滚
// 不提供隔离, 只保证本事务自身的部分失败可以撤销
// 单个条目失败不会中断批量操作, 而是减少返回的计数并记录到错误列表
// 状态误用 (重复 Begin, 对已结束的事务 Commit/Rollback) 返回 kFailedPrecondition
class SessionTransaction {
public:
    using Status = vault::common::Status;

    explicit SessionTransaction(std::shared_ptr<SessionStore> store);
    // 仍处于 Active 时自动回滚
    ~SessionTransaction();

    SessionTransaction(const SessionTransaction&) = delete;
    SessionTransaction& operator=(const SessionTransaction&) = delete;

    Status Begin();
    Status Commit();
    // 按 LIFO 顺序执行补偿; 部分补偿失败时状态为 kRolledBackWithErrors 并返回 kAborted
    Status Rollback();

    vault::common::StatusOr<std::size_t> InvalidateSessionsWhere(const SessionCriteria& criteria);
    vault::common::StatusOr<std::size_t> UpdateSessionsWhere(const SessionCriteria& criteria,
                                                             const SessionUpdate& update);
    // 返回实际创建成功的会话ID
    vault::common::StatusOr<std::vector<std::string>> CreateSessions(const std::vector<NewSession>& sessions);
    vault::common::StatusOr<std::size_t> MigrateSessions(Provider from, Provider to);

    TransactionStats GetStats() const;
    TransactionState State() const { return state_; }
    const std::string& Id() const { return id_; }

    // 回放进程崩溃后遗留的补偿日志, 返回成功执行的补偿数
    static vault::common::StatusOr<std::size_t> Recover(const std::shared_ptr<SessionStore>& store,
                                                        const std::string& transaction_id);

private:
    Status RequireActive(const char* operation) const;
    // 先登记补偿 (并写入日志), 再执行正向操作
    Status PushCompensation(Compensation compensation);
    void PopCompensation();
    Status SaveJournal();
    void DropJournal();
    void RecordError(std::string error);
    void LogOperation(const std::string& type, const std::string& detail, std::size_t affected, std::size_t failed);
    void Finalize(TransactionState state);

    static Status ApplyCompensation(SessionStore& store, const Compensation& compensation);

    std::shared_ptr<SessionStore> store_;
    std::string id_;
    bool journal_enabled_ = false;
    TransactionState state_ = TransactionState::kIdle;
    std::vector<Compensation> compensations_;
    std::vector<OperationLogEntry> operations_;
    std::vector<std::string> errors_;
    std::vector<std::string> rollback_errors_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point finished_at_;
};

} // namespace core
} // namespace vault
