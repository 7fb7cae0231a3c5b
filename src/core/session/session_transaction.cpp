#include "core/session/session_transaction.hpp"

#include "common/logger.hpp"
#include "core/session/session_codec.hpp"
#include "core/session/session_keys.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace vault {
namespace core {

using vault::common::StatusCode;
using vault::common::StatusOr;

namespace {

constexpr std::int64_t kJournalTtlSeconds = 7 * 24 * 3600;

nlohmann::json CompensationToJson(const Compensation& compensation) {
    return std::visit(
        [](const auto& action) -> nlohmann::json {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, RestoreSessionAction>) {
                return {{"type", "restore_session"}, {"session", SessionToJson(action.record)}};
            } else {
                return {{"type", "delete_session"}, {"id", action.session_id}, {"token", action.access_token}};
            }
        },
        compensation);
}

StatusOr<Compensation> CompensationFromJson(const nlohmann::json& j) {
    const auto type = j.value("type", std::string());
    if (type == "restore_session" && j.contains("session")) {
        auto record = SessionFromJson(j.at("session"));
        if (!record.IsOk()) {
            return record.GetStatus();
        }
        return StatusOr<Compensation>(Compensation(RestoreSessionAction{std::move(record).Value()}));
    }
    if (type == "delete_session") {
        return StatusOr<Compensation>(
            Compensation(DeleteSessionAction{j.value("id", std::string()), j.value("token", std::string())}));
    }
    return vault::common::Status::Internal("unknown compensation type: " + type);
}

std::string DescribeCompensation(const Compensation& compensation) {
    return std::visit(
        [](const auto& action) -> std::string {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, RestoreSessionAction>) {
                return "restore_session " + action.record.id;
            } else {
                return "delete_session " + action.session_id;
            }
        },
        compensation);
}

std::string NewTransactionId() {
    auto suffix = RandomHex(8);
    if (suffix.IsOk()) {
        return "session_tx_" + suffix.Value();
    }
    return "session_tx_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

} // namespace

std::string TransactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::kIdle:
            return "idle";
        case TransactionState::kActive:
            return "active";
        case TransactionState::kCommitted:
            return "committed";
        case TransactionState::kRolledBack:
            return "rolled_back";
        case TransactionState::kRolledBackWithErrors:
            return "rolled_back_with_errors";
    }
    return "idle";
}

SessionTransaction::SessionTransaction(std::shared_ptr<SessionStore> store)
    : store_(std::move(store)),
      id_(NewTransactionId()),
      journal_enabled_(store_->Config().journal_enabled) {}

SessionTransaction::~SessionTransaction() {
    if (state_ == TransactionState::kActive) {
        VAULT_LOG_WARN("[SessionTransaction] {} destroyed while active, rolling back", id_);
        auto status = Rollback();
        if (!status.IsOk()) {
            VAULT_LOG_ERROR("[SessionTransaction] {} implicit rollback: {}", id_, status.Message());
        }
    }
}

SessionTransaction::Status SessionTransaction::Begin() {
    if (state_ != TransactionState::kIdle) {
        return Status::FailedPrecondition("transaction " + id_ + " already started (state=" +
                                          TransactionStateToString(state_) + ")");
    }
    started_at_ = std::chrono::steady_clock::now();
    state_ = TransactionState::kActive;
    if (journal_enabled_) {
        auto status = SaveJournal();
        if (!status.IsOk()) {
            state_ = TransactionState::kIdle;
            return status;
        }
    }
    VAULT_LOG_DEBUG("[SessionTransaction] {} begin", id_);
    return Status::OK();
}

SessionTransaction::Status SessionTransaction::Commit() {
    auto status = RequireActive("commit");
    if (!status.IsOk()) {
        return status;
    }
    compensations_.clear();
    Finalize(TransactionState::kCommitted);
    VAULT_LOG_INFO("[SessionTransaction] {} committed operations={} errors={}", id_, operations_.size(),
                   errors_.size());
    return Status::OK();
}

SessionTransaction::Status SessionTransaction::Rollback() {
    auto status = RequireActive("rollback");
    if (!status.IsOk()) {
        return status;
    }

    // LIFO: 后发生的修改先撤销, 同一会话最终回到第一次修改之前的状态
    while (!compensations_.empty()) {
        Compensation compensation = std::move(compensations_.back());
        compensations_.pop_back();
        auto applied = ApplyCompensation(*store_, compensation);
        if (!applied.IsOk()) {
            rollback_errors_.push_back(DescribeCompensation(compensation) + ": " + applied.Message());
            VAULT_LOG_ERROR("[SessionTransaction] {} compensation {} failed: {}", id_,
                            DescribeCompensation(compensation), applied.Message());
        }
    }

    if (!rollback_errors_.empty()) {
        Finalize(TransactionState::kRolledBackWithErrors);
        return Status::Aborted("transaction " + id_ + " rolled back with " +
                               std::to_string(rollback_errors_.size()) + " failed compensations");
    }
    Finalize(TransactionState::kRolledBack);
    VAULT_LOG_INFO("[SessionTransaction] {} rolled back", id_);
    return Status::OK();
}

StatusOr<std::size_t> SessionTransaction::InvalidateSessionsWhere(const SessionCriteria& criteria) {
    auto status = RequireActive("invalidate_sessions");
    if (!status.IsOk()) {
        return status;
    }
    auto query = store_->Query();
    ApplyCriteria(query, criteria);
    auto matches = query.Get();
    if (!matches.IsOk()) {
        RecordError("invalidate_sessions: query failed: " + matches.GetStatus().Message());
        return matches.GetStatus();
    }

    std::size_t destroyed = 0;
    std::size_t failed = 0;
    for (const auto& match : matches.Value()) {
        bool pushed = false;
        auto result = store_->DestroySessionById(match.id, [this, &pushed](const SessionRecord& original) {
            auto s = PushCompensation(RestoreSessionAction{original});
            pushed = s.IsOk();
            return s;
        });
        if (result.IsOk()) {
            ++destroyed;
            continue;
        }
        if (pushed) {
            PopCompensation();
        }
        if (result.Code() == StatusCode::kNotFound) {
            continue;
        }
        ++failed;
        RecordError("invalidate_sessions: " + match.id + ": " + result.Message());
    }
    LogOperation("invalidate_sessions", DescribeCriteria(criteria), destroyed, failed);
    return StatusOr<std::size_t>(destroyed);
}

StatusOr<std::size_t> SessionTransaction::UpdateSessionsWhere(const SessionCriteria& criteria,
                                                              const SessionUpdate& update) {
    auto status = RequireActive("update_sessions");
    if (!status.IsOk()) {
        return status;
    }
    if (update.Empty()) {
        return Status::InvalidArgument("session update is empty");
    }
    auto query = store_->Query();
    ApplyCriteria(query, criteria);
    auto matches = query.Get();
    if (!matches.IsOk()) {
        RecordError("update_sessions: query failed: " + matches.GetStatus().Message());
        return matches.GetStatus();
    }

    std::size_t updated = 0;
    std::size_t failed = 0;
    for (const auto& match : matches.Value()) {
        bool pushed = false;
        bool written = false;
        auto result = store_->MutateSession(
            match.id, [&update](SessionRecord& record) { ApplySessionUpdate(record, update); },
            [this, &pushed](const SessionRecord& original) {
                auto s = PushCompensation(RestoreSessionAction{original});
                pushed = s.IsOk();
                return s;
            },
            &written);
        if (result.IsOk()) {
            ++updated;
            continue;
        }
        // 记录已被改动时保留补偿, 由回滚写回原记录
        if (pushed && !written) {
            PopCompensation();
        }
        if (result.GetStatus().Code() == StatusCode::kNotFound) {
            continue;
        }
        ++failed;
        RecordError("update_sessions: " + match.id + ": " + result.GetStatus().Message());
    }
    LogOperation("update_sessions", DescribeCriteria(criteria), updated, failed);
    return StatusOr<std::size_t>(updated);
}

StatusOr<std::vector<std::string>> SessionTransaction::CreateSessions(const std::vector<NewSession>& sessions) {
    auto status = RequireActive("create_sessions");
    if (!status.IsOk()) {
        return status;
    }

    std::vector<std::string> created;
    std::size_t failed = 0;
    for (const auto& entry : sessions) {
        TokenPair tokens;
        if (entry.tokens) {
            tokens = *entry.tokens;
        } else {
            auto generated = store_->Issuer()->GenerateTokenPair(
                entry.user, entry.ttl_override.value_or(store_->GetProviderTtl(entry.provider)));
            if (!generated.IsOk()) {
                ++failed;
                RecordError("create_sessions: token generation failed: " + generated.GetStatus().Message());
                continue;
            }
            tokens = std::move(generated).Value();
        }

        const auto id = store_->Issuer()->SessionIdFromToken(tokens.access_token);
        auto pushed = PushCompensation(DeleteSessionAction{id, tokens.access_token});
        if (!pushed.IsOk()) {
            ++failed;
            RecordError("create_sessions: " + id + ": " + pushed.Message());
            continue;
        }

        StoreOptions options;
        options.ttl_override = entry.ttl_override;
        options.refresh_token = tokens.refresh_token;
        options.ip_address = entry.ip_address;
        options.user_agent = entry.user_agent;
        options.metadata = entry.metadata;
        bool written = false;
        auto stored = store_->StoreSession(entry.user, tokens.access_token, entry.provider, options, &written);
        if (!stored.IsOk()) {
            if (!written) {
                PopCompensation();
            }
            ++failed;
            RecordError("create_sessions: " + id + ": " + stored.Message());
            continue;
        }
        created.push_back(id);
    }
    LogOperation("create_sessions", std::to_string(sessions.size()) + " requested", created.size(), failed);
    return StatusOr<std::vector<std::string>>(std::move(created));
}

StatusOr<std::size_t> SessionTransaction::MigrateSessions(Provider from, Provider to) {
    auto status = RequireActive("migrate_sessions");
    if (!status.IsOk()) {
        return status;
    }
    const auto detail = ProviderToString(from) + " -> " + ProviderToString(to);
    if (from == to) {
        LogOperation("migrate_sessions", detail, 0, 0);
        return StatusOr<std::size_t>(static_cast<std::size_t>(0));
    }

    auto matches = store_->Query().WhereProvider(from).Get();
    if (!matches.IsOk()) {
        RecordError("migrate_sessions: query failed: " + matches.GetStatus().Message());
        return matches.GetStatus();
    }

    std::size_t migrated = 0;
    std::size_t failed = 0;
    for (const auto& match : matches.Value()) {
        bool pushed = false;
        bool written = false;
        auto result = store_->MutateSession(
            match.id,
            [to](SessionRecord& record) {
                // 迁移后按新 provider 的 TTL 策略写回
                record.provider = to;
                record.ttl_overridden = false;
                record.ttl_seconds = 0;
            },
            [this, &pushed](const SessionRecord& original) {
                auto s = PushCompensation(RestoreSessionAction{original});
                pushed = s.IsOk();
                return s;
            },
            &written);
        if (result.IsOk()) {
            ++migrated;
            continue;
        }
        // 记录已被改动时保留补偿, 由回滚写回原记录
        if (pushed && !written) {
            PopCompensation();
        }
        if (result.GetStatus().Code() == StatusCode::kNotFound) {
            continue;
        }
        ++failed;
        RecordError("migrate_sessions: " + match.id + ": " + result.GetStatus().Message());
    }
    LogOperation("migrate_sessions", detail, migrated, failed);
    return StatusOr<std::size_t>(migrated);
}

TransactionStats SessionTransaction::GetStats() const {
    TransactionStats stats;
    stats.transaction_id = id_;
    stats.state = state_;
    stats.is_active = state_ == TransactionState::kActive;
    stats.is_committed = state_ == TransactionState::kCommitted;
    stats.is_rolled_back = state_ == TransactionState::kRolledBack ||
                           state_ == TransactionState::kRolledBackWithErrors;
    stats.operation_count = operations_.size();
    stats.error_count = errors_.size();
    stats.pending_compensations = compensations_.size();
    if (state_ != TransactionState::kIdle) {
        const auto end = stats.is_active ? std::chrono::steady_clock::now() : finished_at_;
        stats.duration_ms = std::chrono::duration<double, std::milli>(end - started_at_).count();
    }
    stats.operations = operations_;
    stats.errors = errors_;
    stats.rollback_errors = rollback_errors_;
    return stats;
}

StatusOr<std::size_t> SessionTransaction::Recover(const std::shared_ptr<SessionStore>& store,
                                                  const std::string& transaction_id) {
    const auto key = JournalKey(transaction_id);
    auto payload = store->Cache()->Get(key);
    if (!payload.IsOk()) {
        return payload.GetStatus();
    }

    std::vector<Compensation> compensations;
    try {
        auto j = nlohmann::json::parse(payload.Value());
        for (const auto& item : j.at("compensations")) {
            auto compensation = CompensationFromJson(item);
            if (!compensation.IsOk()) {
                return compensation.GetStatus();
            }
            compensations.push_back(std::move(compensation).Value());
        }
    } catch (const nlohmann::json::exception& ex) {
        return vault::common::Status::Internal(std::string("invalid transaction journal: ") + ex.what());
    }

    std::size_t applied = 0;
    std::size_t failed = 0;
    for (auto it = compensations.rbegin(); it != compensations.rend(); ++it) {
        auto status = ApplyCompensation(*store, *it);
        if (status.IsOk()) {
            ++applied;
        } else {
            ++failed;
            VAULT_LOG_ERROR("[SessionTransaction] recover {}: {} failed: {}", transaction_id,
                            DescribeCompensation(*it), status.Message());
        }
    }
    if (failed > 0) {
        // 保留日志以便重试
        return vault::common::Status::Aborted("recovery of " + transaction_id + " left " + std::to_string(failed) +
                                              " compensations unapplied");
    }

    auto dropped = store->Cache()->Del(key);
    if (!dropped.IsOk() && dropped.Code() != StatusCode::kNotFound) {
        VAULT_LOG_WARN("[SessionTransaction] recover {}: drop journal failed: {}", transaction_id, dropped.Message());
    }
    VAULT_LOG_INFO("[SessionTransaction] recovered {} with {} compensations", transaction_id, applied);
    return StatusOr<std::size_t>(applied);
}

SessionTransaction::Status SessionTransaction::RequireActive(const char* operation) const {
    if (state_ != TransactionState::kActive) {
        return Status::FailedPrecondition(std::string(operation) + " requires an active transaction (state=" +
                                          TransactionStateToString(state_) + ")");
    }
    return Status::OK();
}

SessionTransaction::Status SessionTransaction::PushCompensation(Compensation compensation) {
    compensations_.push_back(std::move(compensation));
    if (!journal_enabled_) {
        return Status::OK();
    }
    auto status = SaveJournal();
    if (!status.IsOk()) {
        compensations_.pop_back();
        return status;
    }
    return Status::OK();
}

void SessionTransaction::PopCompensation() {
    if (compensations_.empty()) {
        return;
    }
    compensations_.pop_back();
    if (journal_enabled_) {
        auto status = SaveJournal();
        if (!status.IsOk()) {
            // 日志中多出的补偿在恢复时是幂等的
            VAULT_LOG_WARN("[SessionTransaction] {} journal rewrite failed: {}", id_, status.Message());
        }
    }
}

SessionTransaction::Status SessionTransaction::SaveJournal() {
    nlohmann::json journal;
    journal["id"] = id_;
    journal["state"] = TransactionStateToString(state_);
    journal["compensations"] = nlohmann::json::array();
    for (const auto& compensation : compensations_) {
        journal["compensations"].push_back(CompensationToJson(compensation));
    }
    return store_->Cache()->SetEx(JournalKey(id_), journal.dump(), kJournalTtlSeconds);
}

void SessionTransaction::DropJournal() {
    if (!journal_enabled_) {
        return;
    }
    auto status = store_->Cache()->Del(JournalKey(id_));
    if (!status.IsOk() && status.Code() != StatusCode::kNotFound) {
        VAULT_LOG_WARN("[SessionTransaction] {} drop journal failed: {}", id_, status.Message());
    }
}

void SessionTransaction::RecordError(std::string error) {
    VAULT_LOG_WARN("[SessionTransaction] {} {}", id_, error);
    errors_.push_back(std::move(error));
}

void SessionTransaction::LogOperation(const std::string& type, const std::string& detail, std::size_t affected,
                                      std::size_t failed) {
    OperationLogEntry entry;
    entry.type = type;
    entry.detail = detail;
    entry.affected = affected;
    entry.failed = failed;
    entry.timestamp = store_->GetClock()->Now();
    operations_.push_back(std::move(entry));
    VAULT_LOG_DEBUG("[SessionTransaction] {} {} ({}) affected={} failed={}", id_, type, detail, affected, failed);
}

void SessionTransaction::Finalize(TransactionState state) {
    state_ = state;
    finished_at_ = std::chrono::steady_clock::now();
    DropJournal();
}

SessionTransaction::Status SessionTransaction::ApplyCompensation(SessionStore& store, const Compensation& compensation) {
    return std::visit(
        [&store](const auto& action) -> Status {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, RestoreSessionAction>) {
                return store.RestoreSession(action.record);
            } else {
                auto status = store.DestroySessionById(action.session_id);
                if (status.Code() == StatusCode::kNotFound) {
                    return Status::OK();
                }
                return status;
            }
        },
        compensation);
}

} // namespace core
} // namespace vault
