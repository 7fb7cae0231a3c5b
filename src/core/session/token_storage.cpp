#include "core/session/token_storage.hpp"

#include "common/logger.hpp"

#include <chrono>
#include <functional>
#include <set>

namespace vault {
namespace core {

using vault::common::StatusCode;
using vault::common::StatusOr;

namespace {

constexpr std::size_t kMaxInconsistencies = 256;

bool IsNotFound(const vault::common::Status& status) {
    return status.Code() == StatusCode::kNotFound;
}

} // namespace

std::string LayerStatusToString(LayerStatus status) {
    switch (status) {
        case LayerStatus::kHealthy:
            return "healthy";
        case LayerStatus::kUnhealthy:
            return "unhealthy";
        case LayerStatus::kDisabled:
            return "disabled";
    }
    return "disabled";
}

TokenStorageService::TokenStorageService(std::shared_ptr<SessionStore> store,
                                         std::shared_ptr<PersistentSessionStore> persistent)
    : store_(std::move(store)), persistent_(std::move(persistent)) {}

TokenStorageService::Status TokenStorageService::StoreSession(const SessionData& data, const TokenPair& tokens) {
    if (tokens.access_token.empty()) {
        return Status::InvalidArgument("access token must not be empty");
    }
    const auto now = store_->GetClock()->Now();

    std::string persistent_id = data.session_id;
    if (persistent_ && persistent_id.empty()) {
        auto generated = RandomHex(16);
        if (!generated.IsOk()) {
            return generated.GetStatus();
        }
        persistent_id = "ps_" + generated.Value();
    }

    // 先写持久层
    if (persistent_) {
        PersistentSession row;
        row.uuid = persistent_id;
        row.user_uuid = data.user.uuid;
        row.user = data.user;
        row.access_token = tokens.access_token;
        row.refresh_token = tokens.refresh_token;
        row.access_expires_at = now + (tokens.expires_in > 0 ? tokens.expires_in : store_->GetProviderTtl(data.provider));
        row.refresh_expires_at = now + store_->Config().refresh_token_lifetime_seconds;
        row.provider = data.provider;
        row.status = PersistentStatus::kActive;
        row.created_at = now;
        row.updated_at = now;
        row.last_token_refresh = now;
        row.token_fingerprint = Fingerprint(tokens.access_token);
        row.remember_me = data.remember_me;
        row.ip_address = data.ip_address;
        row.user_agent = data.user_agent;

        auto status = persistent_->Create(row);
        if (!status.IsOk()) {
            VAULT_LOG_ERROR("[TokenStorage] persist session for user {} failed: {}", data.user.uuid, status.Message());
            return status;
        }
    }

    StoreOptions options;
    if (tokens.expires_in > 0) {
        options.ttl_override = tokens.expires_in;
    }
    options.refresh_token = tokens.refresh_token;
    options.ip_address = data.ip_address;
    options.user_agent = data.user_agent;
    options.metadata = data.metadata;
    if (!persistent_id.empty()) {
        options.metadata[kPersistentIdKey] = persistent_id;
    }

    auto status = store_->StoreSession(data.user, tokens.access_token, data.provider, options);
    if (!status.IsOk()) {
        VAULT_LOG_ERROR("[TokenStorage] cache session for user {} failed: {}", data.user.uuid, status.Message());
        if (persistent_) {
            // 缓存写入失败时撤销持久层记录, 调用方不得将该会话视为有效
            auto undo = persistent_->Delete(persistent_id);
            if (!undo.IsOk()) {
                RecordInconsistency(persistent_id, "store_session",
                                    "cache write failed and persistent undo failed: " + undo.Message());
            }
        }
        return status;
    }
    VAULT_LOG_INFO("[TokenStorage] stored session for user {} provider={}", data.user.uuid,
                   ProviderToString(data.provider));
    return Status::OK();
}

TokenStorageService::Status TokenStorageService::UpdateSessionTokens(const std::string& refresh_token,
                                                                     const TokenPair& new_tokens) {
    if (new_tokens.access_token.empty()) {
        return Status::InvalidArgument("access token must not be empty");
    }
    const auto now = store_->GetClock()->Now();

    auto cached = store_->GetSessionByRefreshToken(refresh_token);
    if (!cached.IsOk() && !IsNotFound(cached.GetStatus())) {
        VAULT_LOG_WARN("[TokenStorage] cache lookup during rotation failed: {}", cached.GetStatus().Message());
    }
    if (cached.IsOk() && cached.Value().status != SessionStatus::kActive) {
        return Status::NotFound("Session not found for refresh token");
    }

    PersistentSession row;
    std::string old_access_token = cached.IsOk() ? cached.Value().access_token : std::string();
    if (persistent_) {
        auto found = persistent_->FindByRefreshToken(refresh_token);
        if (!found.IsOk()) {
            return found.GetStatus();
        }
        row = std::move(found).Value();
        if (row.status != PersistentStatus::kActive || row.refresh_expires_at <= now) {
            return Status::NotFound("Session not found for refresh token");
        }
        old_access_token = row.access_token;
        row.access_token = new_tokens.access_token;
        row.refresh_token = new_tokens.refresh_token;
        row.access_expires_at = now + (new_tokens.expires_in > 0 ? new_tokens.expires_in
                                                                  : store_->GetProviderTtl(row.provider));
        row.updated_at = now;
        row.last_token_refresh = now;
        row.token_fingerprint = Fingerprint(new_tokens.access_token);
        auto status = persistent_->Update(row);
        if (!status.IsOk()) {
            VAULT_LOG_ERROR("[TokenStorage] rotate tokens of {} failed: {}", row.uuid, status.Message());
            return status;
        }
    } else if (!cached.IsOk()) {
        return cached.GetStatus();
    }

    SessionRecord next = cached.IsOk() ? cached.Value() : RecordFromRow(row);
    // refresh 映射丢失时旧会话仍可能以 access token 缓存着
    const std::string old_id =
        cached.IsOk() ? cached.Value().id : store_->Issuer()->SessionIdFromToken(old_access_token);
    const std::string session_key = persistent_ ? row.uuid : old_id;

    // 旧令牌先失效, 之后才写入新令牌
    {
        auto status = InvalidateCached(old_id);
        if (!status.IsOk()) {
            RecordInconsistency(session_key, "update_tokens", "old cache entry still valid: " + status.Message());
            return status;
        }
    }

    next.id.clear();
    next.access_token = new_tokens.access_token;
    next.refresh_token = new_tokens.refresh_token;
    next.updated_at = now;
    next.status = SessionStatus::kActive;
    next.version = 0;
    if (new_tokens.expires_in > 0) {
        next.ttl_overridden = true;
        next.ttl_seconds = new_tokens.expires_in;
    } else {
        next.ttl_overridden = false;
        next.ttl_seconds = 0;
    }
    auto status = store_->StoreRecord(next);
    if (!status.IsOk()) {
        // 持久层已轮换, 下次读取会回填缓存
        RecordInconsistency(session_key, "update_tokens", "cache write of rotated tokens failed: " + status.Message());
        return status;
    }
    VAULT_LOG_INFO("[TokenStorage] rotated tokens of session {}", session_key);
    return Status::OK();
}

StatusOr<SessionRecord> TokenStorageService::GetSessionByAccessToken(const std::string& access_token) {
    auto cached = store_->GetSessionByAccessToken(access_token);
    if (cached.IsOk()) {
        if (cached.Value().status != SessionStatus::kActive) {
            return Status::NotFound("Session revoked");
        }
        return cached;
    }
    if (!IsNotFound(cached.GetStatus())) {
        VAULT_LOG_WARN("[TokenStorage] cache read failed, falling back: {}", cached.GetStatus().Message());
    }
    if (!persistent_) {
        return cached.GetStatus();
    }

    auto row = persistent_->FindByAccessToken(access_token);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    const auto now = store_->GetClock()->Now();
    if (row.Value().status != PersistentStatus::kActive || row.Value().access_expires_at <= now) {
        return Status::NotFound("Session not found for access token");
    }
    return Backfill(row.Value());
}

StatusOr<SessionRecord> TokenStorageService::GetSessionByRefreshToken(const std::string& refresh_token) {
    auto cached = store_->GetSessionByRefreshToken(refresh_token);
    if (cached.IsOk()) {
        if (cached.Value().status != SessionStatus::kActive) {
            return Status::NotFound("Session revoked");
        }
        return cached;
    }
    if (!IsNotFound(cached.GetStatus())) {
        VAULT_LOG_WARN("[TokenStorage] cache read failed, falling back: {}", cached.GetStatus().Message());
    }
    if (!persistent_) {
        return cached.GetStatus();
    }

    auto row = persistent_->FindByRefreshToken(refresh_token);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    const auto now = store_->GetClock()->Now();
    if (row.Value().status != PersistentStatus::kActive || row.Value().refresh_expires_at <= now) {
        return Status::NotFound("Session not found for refresh token");
    }
    return Backfill(row.Value());
}

TokenStorageService::Status TokenStorageService::RevokeSession(const std::string& identifier) {
    auto cached = FindCached(identifier);
    if (!cached.IsOk() && !IsNotFound(cached.GetStatus())) {
        VAULT_LOG_WARN("[TokenStorage] cache lookup during revoke failed: {}", cached.GetStatus().Message());
    }

    std::string cache_id;
    if (cached.IsOk()) {
        cache_id = cached.Value().id;
    }

    if (persistent_) {
        auto row = FindPersistent(identifier);
        if (!row.IsOk()) {
            if (!IsNotFound(row.GetStatus()) || !cached.IsOk()) {
                return row.GetStatus();
            }
            // 仅存在于缓存中的会话
            RecordInconsistency(cache_id, "revoke_session", "session missing from persistent layer");
        } else {
            auto revoked = std::move(row).Value();
            const auto now = store_->GetClock()->Now();
            revoked.status = PersistentStatus::kRevoked;
            revoked.revoked_at = now;
            revoked.updated_at = now;
            auto status = persistent_->Update(revoked);
            if (!status.IsOk()) {
                VAULT_LOG_ERROR("[TokenStorage] revoke {} in persistent layer failed: {}", revoked.uuid,
                                status.Message());
                return status;
            }
            if (cache_id.empty()) {
                cache_id = store_->Issuer()->SessionIdFromToken(revoked.access_token);
            }
        }
    } else if (!cached.IsOk()) {
        return cached.GetStatus();
    }

    auto status = InvalidateCached(cache_id);
    if (!status.IsOk()) {
        RecordInconsistency(cache_id, "revoke_session", "revoked in persistent layer only: " + status.Message());
        return status;
    }
    VAULT_LOG_INFO("[TokenStorage] revoked session {}", cache_id);
    return Status::OK();
}

TokenStorageService::Status TokenStorageService::RevokeAllUserSessions(const std::string& user_uuid) {
    if (user_uuid.empty()) {
        return Status::InvalidArgument("user uuid must not be empty");
    }
    const auto now = store_->GetClock()->Now();
    Status first_error = Status::OK();
    std::set<std::string> cache_ids;
    std::size_t revoked_count = 0;

    if (persistent_) {
        auto rows = persistent_->ListActiveByUser(user_uuid);
        if (!rows.IsOk()) {
            return rows.GetStatus();
        }
        for (auto row : rows.Value()) {
            row.status = PersistentStatus::kRevoked;
            row.revoked_at = now;
            row.updated_at = now;
            auto status = persistent_->Update(row);
            if (!status.IsOk()) {
                VAULT_LOG_ERROR("[TokenStorage] revoke {} in persistent layer failed: {}", row.uuid, status.Message());
                if (first_error.IsOk()) {
                    first_error = status;
                }
                continue;
            }
            ++revoked_count;
            cache_ids.insert(store_->Issuer()->SessionIdFromToken(row.access_token));
        }
    }

    auto cached = store_->Query().WhereUser(user_uuid).Get();
    if (!cached.IsOk()) {
        RecordInconsistency(user_uuid, "revoke_all_user_sessions", "cache scan failed: " + cached.GetStatus().Message());
        return first_error.IsOk() ? cached.GetStatus() : first_error;
    }
    for (const auto& record : cached.Value()) {
        cache_ids.insert(record.id);
    }

    for (const auto& id : cache_ids) {
        auto status = InvalidateCached(id);
        if (!status.IsOk()) {
            RecordInconsistency(id, "revoke_all_user_sessions", "cache invalidation failed: " + status.Message());
            if (first_error.IsOk()) {
                first_error = status;
            }
        }
    }
    VAULT_LOG_INFO("[TokenStorage] revoked sessions of user {} persistent={} cache={}", user_uuid, revoked_count,
                   cache_ids.size());
    return first_error;
}

StatusOr<std::size_t> TokenStorageService::CleanupExpiredSessions() {
    if (!persistent_) {
        return StatusOr<std::size_t>(static_cast<std::size_t>(0));
    }
    const auto now = store_->GetClock()->Now();
    auto expired = persistent_->ListExpired(now);
    if (!expired.IsOk()) {
        VAULT_LOG_WARN("[TokenStorage] list expired sessions failed: {}", expired.GetStatus().Message());
        return expired.GetStatus();
    }

    std::size_t cleaned = 0;
    for (auto row : expired.Value()) {
        row.status = PersistentStatus::kExpired;
        row.revoked_at = now;
        row.updated_at = now;
        auto status = persistent_->Update(row);
        if (!status.IsOk()) {
            VAULT_LOG_WARN("[TokenStorage] expire session {} failed: {}", row.uuid, status.Message());
            continue;
        }
        ++cleaned;
        auto id = store_->Issuer()->SessionIdFromToken(row.access_token);
        auto cache_status = InvalidateCached(id);
        if (!cache_status.IsOk()) {
            RecordInconsistency(id, "cleanup_expired", "cache invalidation failed: " + cache_status.Message());
        }
    }
    VAULT_LOG_INFO("[TokenStorage] expired sessions cleaned: {}", cleaned);
    return StatusOr<std::size_t>(cleaned);
}

StatusOr<std::size_t> TokenStorageService::PurgeRevokedSessions() {
    const auto retention = store_->Config().revoked_retention_seconds;
    std::size_t purged = 0;
    if (persistent_) {
        auto rows = persistent_->PurgeInactiveBefore(store_->GetClock()->Now() - retention);
        if (!rows.IsOk()) {
            return rows.GetStatus();
        }
        purged += rows.Value();
    }
    auto cached = store_->PurgeRevoked(retention);
    if (!cached.IsOk()) {
        return cached.GetStatus();
    }
    purged += cached.Value();
    return StatusOr<std::size_t>(purged);
}

MaintenanceReport TokenStorageService::RunMaintenance() {
    MaintenanceReport report;
    auto expired = CleanupExpiredSessions();
    if (expired.IsOk()) {
        report.expired = expired.Value();
    } else {
        report.errors.push_back("cleanup_expired: " + expired.GetStatus().Message());
    }

    auto compacted = store_->CompactIndexes();
    if (compacted.IsOk()) {
        report.compacted = compacted.Value();
    } else {
        report.errors.push_back("compact_indexes: " + compacted.GetStatus().Message());
    }

    auto purged = PurgeRevokedSessions();
    if (purged.IsOk()) {
        report.purged = purged.Value();
    } else {
        report.errors.push_back("purge_revoked: " + purged.GetStatus().Message());
    }

    for (const auto& error : report.errors) {
        VAULT_LOG_WARN("[TokenStorage] maintenance step failed: {}", error);
    }
    VAULT_LOG_INFO("[TokenStorage] maintenance: expired={} compacted={} purged={}", report.expired,
                   report.compacted, report.purged);
    return report;
}

TokenStorageService::Status TokenStorageService::ValidateStorageConsistency(const std::string& identifier) {
    if (!persistent_) {
        return Status::OK();
    }

    auto row = FindPersistent(identifier);
    if (!row.IsOk() && !IsNotFound(row.GetStatus())) {
        return row.GetStatus();
    }
    const bool persistent_active = row.IsOk() && row.Value().status == PersistentStatus::kActive;

    auto cached = FindCached(identifier);
    if (!cached.IsOk() && !IsNotFound(cached.GetStatus())) {
        return cached.GetStatus();
    }
    const bool cache_active = cached.IsOk() && cached.Value().status == SessionStatus::kActive;

    if (!persistent_active && !cache_active) {
        return Status::OK();
    }
    if (!persistent_active || !cache_active) {
        return Status::DataLoss(persistent_active ? "session missing from cache layer"
                                                  : "session missing from persistent layer");
    }
    if (row.Value().access_token != cached.Value().access_token ||
        row.Value().refresh_token != cached.Value().refresh_token) {
        return Status::DataLoss("token mismatch between storage layers");
    }
    return Status::OK();
}

StorageHealth TokenStorageService::GetStorageHealth() {
    auto measure = [](const std::function<Status()>& ping) {
        LayerHealth health;
        auto start = std::chrono::steady_clock::now();
        auto status = ping();
        auto elapsed = std::chrono::steady_clock::now() - start;
        health.response_time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
        if (status.IsOk()) {
            health.status = LayerStatus::kHealthy;
        } else {
            health.status = LayerStatus::kUnhealthy;
            health.error = status.Message();
        }
        return health;
    };

    StorageHealth health;
    health.cache = measure([this]() { return store_->Cache()->Ping(); });
    if (persistent_) {
        health.persistent = measure([this]() { return persistent_->Ping(); });
    }
    const bool cache_ok = health.cache.status == LayerStatus::kHealthy;
    const bool persistent_ok = health.persistent.status != LayerStatus::kUnhealthy;
    health.overall = (cache_ok && persistent_ok) ? "healthy" : "degraded";
    return health;
}

std::vector<StorageInconsistency> TokenStorageService::Inconsistencies() const {
    std::lock_guard<std::mutex> lock(inconsistency_mutex_);
    return inconsistencies_;
}

StatusOr<PersistentSession> TokenStorageService::FindPersistent(const std::string& identifier) {
    auto row = persistent_->FindByRefreshToken(identifier);
    if (row.IsOk() || !IsNotFound(row.GetStatus())) {
        return row;
    }
    return persistent_->FindByAccessToken(identifier);
}

StatusOr<SessionRecord> TokenStorageService::FindCached(const std::string& identifier) {
    auto record = store_->GetSessionByRefreshToken(identifier);
    if (record.IsOk() || !IsNotFound(record.GetStatus())) {
        return record;
    }
    return store_->GetSessionByAccessToken(identifier);
}

StatusOr<SessionRecord> TokenStorageService::Backfill(const PersistentSession& row) {
    SessionRecord record = RecordFromRow(row);
    auto status = store_->StoreRecord(record);
    if (!status.IsOk()) {
        VAULT_LOG_WARN("[TokenStorage] backfill of session {} failed: {}", row.uuid, status.Message());
    }
    // StoreRecord 会补全 id 与版本
    record.id = store_->Issuer()->SessionIdFromToken(record.access_token);
    if (record.version == 0) {
        record.version = 1;
    }
    if (record.ttl_seconds <= 0) {
        record.ttl_seconds = store_->ResolveTtl(record);
    }
    VAULT_LOG_DEBUG("[TokenStorage] served session {} from persistent layer", row.uuid);
    return StatusOr<SessionRecord>(std::move(record));
}

SessionRecord TokenStorageService::RecordFromRow(const PersistentSession& row) const {
    const auto now = store_->GetClock()->Now();
    SessionRecord record;
    record.access_token = row.access_token;
    record.refresh_token = row.refresh_token;
    record.provider = row.provider;
    record.user = row.user;
    record.created_at = row.created_at;
    record.updated_at = row.updated_at;
    record.status = SessionStatus::kActive;
    const auto remaining = row.access_expires_at - now;
    if (remaining > 0) {
        record.ttl_overridden = true;
        record.ttl_seconds = remaining;
    }
    record.ip_address = row.ip_address;
    record.user_agent = row.user_agent;
    record.metadata[kPersistentIdKey] = row.uuid;
    return record;
}

TokenStorageService::Status TokenStorageService::InvalidateCached(const std::string& id) {
    if (id.empty()) {
        return Status::OK();
    }
    auto status = store_->DestroySessionById(id);
    if (status.IsOk() || IsNotFound(status)) {
        return Status::OK();
    }
    VAULT_LOG_WARN("[TokenStorage] delete cached session {} failed, marking revoked: {}", id, status.Message());
    auto marked = store_->MutateSession(id, [](SessionRecord& r) { r.status = SessionStatus::kRevoked; });
    if (marked.IsOk() || IsNotFound(marked.GetStatus())) {
        return Status::OK();
    }
    return marked.GetStatus();
}

std::string TokenStorageService::Fingerprint(const std::string& token) const {
    return Sha256Hex(token + store_->Config().fingerprint_salt);
}

void TokenStorageService::RecordInconsistency(const std::string& session_id, const std::string& operation,
                                              const std::string& detail) {
    VAULT_LOG_ERROR("[TokenStorage] storage inconsistency session={} op={}: {}", session_id, operation, detail);
    std::lock_guard<std::mutex> lock(inconsistency_mutex_);
    if (inconsistencies_.size() >= kMaxInconsistencies) {
        inconsistencies_.erase(inconsistencies_.begin());
    }
    inconsistencies_.push_back(StorageInconsistency{session_id, operation, detail, store_->GetClock()->Now()});
}

} // namespace core
} // namespace vault
