#include "core/session/session_store.hpp"

#include "common/logger.hpp"
#include "core/session/session_codec.hpp"
#include "core/session/session_keys.hpp"

namespace vault {
namespace core {

using vault::common::StatusCode;
using vault::common::StatusOr;

SessionStore::SessionStore(std::shared_ptr<vault::cache::CacheStore> cache,
                           std::shared_ptr<TokenIssuer> issuer,
                           vault::common::SessionConfig config,
                           std::shared_ptr<vault::common::Clock> clock)
    : cache_(std::move(cache)),
      issuer_(issuer ? std::move(issuer) : std::make_shared<OpenSslTokenIssuer>(config.fingerprint_salt)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : vault::common::DefaultClock()),
      index_(cache_, clock_, config_.lock_stripes),
      locks_(config_.lock_stripes) {}

// 创建会话 (写逻辑: 先写主记录, 再写索引)
SessionStore::Status SessionStore::StoreSession(const UserSnapshot& user, const std::string& access_token,
                                                Provider provider, const StoreOptions& options,
                                                bool* written) {
    if (access_token.empty()) {
        return Status::InvalidArgument("access token must not be empty");
    }
    if (options.ttl_override && *options.ttl_override <= 0) {
        return Status::InvalidArgument("ttl override must be positive");
    }

    SessionRecord record;
    record.access_token = access_token;
    record.refresh_token = options.refresh_token;
    record.provider = provider;
    record.user = user;
    record.created_at = clock_->Now();
    record.updated_at = record.created_at;
    record.status = SessionStatus::kActive;
    record.ttl_overridden = options.ttl_override.has_value();
    record.ttl_seconds = options.ttl_override.value_or(GetProviderTtl(provider));
    record.ip_address = options.ip_address;
    record.user_agent = options.user_agent;
    record.metadata = options.metadata;
    return StoreRecord(std::move(record), written);
}

SessionStore::Status SessionStore::StoreRecord(SessionRecord record, bool* written) {
    if (written) {
        *written = false;
    }
    if (record.id.empty()) {
        record.id = issuer_->SessionIdFromToken(record.access_token);
    }
    if (record.id.empty()) {
        return Status::Internal("failed to derive session id");
    }
    if (record.ttl_seconds <= 0) {
        record.ttl_seconds = ResolveTtl(record);
    }
    if (record.version == 0) {
        record.version = 1;
    }

    auto lock = locks_.Acquire(record.id);
    bool primary_written = false;
    auto status = WriteRecord(record, &primary_written);
    if (status.IsOk()) {
        status = IndexRecord(record);
    }
    if (!status.IsOk()) {
        VAULT_LOG_WARN("[SessionStore] store session {} failed: {}", record.id, status.Message());
        if (primary_written) {
            // 撤销主记录, 保证记录与索引成对出现
            auto undo = DestroyLocked(record);
            if (!undo.IsOk()) {
                VAULT_LOG_ERROR("[SessionStore] undo of unindexed session {} failed: {}", record.id,
                                undo.Message());
                if (written) {
                    *written = true;
                }
            }
        }
        return status;
    }
    if (written) {
        *written = true;
    }
    VAULT_LOG_DEBUG("[SessionStore] stored session {} provider={} ttl={}", record.id,
                    ProviderToString(record.provider), record.ttl_seconds);
    return Status::OK();
}

SessionStore::StatusOrSession SessionStore::GetSession(const std::string& id) {
    return index_.Hydrate(id);
}

SessionStore::StatusOrSession SessionStore::GetSessionByAccessToken(const std::string& access_token) {
    auto record = GetSession(issuer_->SessionIdFromToken(access_token));
    if (!record.IsOk()) {
        return record;
    }
    if (record.Value().access_token != access_token) {
        return Status::NotFound("Session not found for access token");
    }
    return record;
}

SessionStore::StatusOrSession SessionStore::GetSessionByRefreshToken(const std::string& refresh_token) {
    auto id = cache_->Get(RefreshKey(issuer_->SessionIdFromToken(refresh_token)));
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    auto record = GetSession(id.Value());
    if (!record.IsOk()) {
        return record;
    }
    if (record.Value().refresh_token != refresh_token) {
        return Status::NotFound("Session not found for refresh token");
    }
    return record;
}

StatusOr<std::vector<SessionRecord>> SessionStore::GetSessionsByProvider(Provider provider) {
    return index_.Query().WhereProvider(provider).Get();
}

SessionStore::Status SessionStore::DestroySession(const std::string& access_token) {
    return DestroySessionById(issuer_->SessionIdFromToken(access_token));
}

SessionStore::Status SessionStore::DestroySessionById(const std::string& id, const BeforeWrite& before_destroy) {
    auto lock = locks_.Acquire(id);
    auto record = index_.Hydrate(id);
    if (!record.IsOk()) {
        if (record.GetStatus().Code() == StatusCode::kNotFound || before_destroy) {
            return record.GetStatus();
        }
        // 记录无法解码时仍然删除主键, 索引条目随 TTL 过期
        VAULT_LOG_WARN("[SessionStore] destroying unreadable session {}: {}", id, record.GetStatus().Message());
        return cache_->Del(SessionKey(id));
    }
    if (before_destroy) {
        auto status = before_destroy(record.Value());
        if (!status.IsOk()) {
            return status;
        }
    }
    return DestroyLocked(record.Value());
}

SessionStore::StatusOrSession SessionStore::MutateSession(const std::string& id, const Mutator& mutate,
                                                          const BeforeWrite& before_write, bool* written) {
    if (written) {
        *written = false;
    }
    auto lock = locks_.Acquire(id);
    auto current = index_.Hydrate(id);
    if (!current.IsOk()) {
        return current;
    }

    const SessionRecord before = current.Value();
    SessionRecord after = before;
    if (mutate) {
        mutate(after);
    }
    after.id = before.id;
    after.version = before.version + 1;
    after.ttl_seconds = ResolveTtl(after);

    if (before_write) {
        auto status = before_write(before);
        if (!status.IsOk()) {
            return status;
        }
    }

    // 乐观并发检查: 本进程内已有锁保护, 这里拦截其他进程的并发写入
    auto latest = index_.Hydrate(id);
    if (!latest.IsOk()) {
        return latest.GetStatus();
    }
    if (latest.Value().version != before.version) {
        return Status::Aborted("session " + id + " was modified concurrently");
    }

    bool primary_written = false;
    auto status = WriteRecord(after, &primary_written);
    if (status.IsOk()) {
        if (before.provider != after.provider) {
            auto removed = index_.RemoveFromProviderIndex(before.provider, id);
            if (!removed.IsOk()) {
                VAULT_LOG_WARN("[SessionStore] unindex {} from {} failed: {}", id,
                               ProviderToString(before.provider), removed.Message());
            }
        }
        status = IndexRecord(after);
    }
    if (!status.IsOk()) {
        VAULT_LOG_WARN("[SessionStore] mutate session {} failed: {}", id, status.Message());
        if (primary_written && !RevertLocked(before, after).IsOk() && written) {
            *written = true;
        }
        return status;
    }
    if (written) {
        *written = true;
    }
    return StatusOrSession(std::move(after));
}

SessionStore::Status SessionStore::RestoreSession(const SessionRecord& record) {
    if (record.id.empty()) {
        return Status::InvalidArgument("cannot restore a session without id");
    }
    auto lock = locks_.Acquire(record.id);

    auto current = index_.Hydrate(record.id);
    if (current.IsOk()) {
        const auto& cur = current.Value();
        if (cur.provider != record.provider) {
            auto removed = index_.RemoveFromProviderIndex(cur.provider, record.id);
            if (!removed.IsOk()) {
                VAULT_LOG_WARN("[SessionStore] restore: unindex {} from {} failed: {}", record.id,
                               ProviderToString(cur.provider), removed.Message());
            }
        }
        if (!cur.refresh_token.empty() && cur.refresh_token != record.refresh_token) {
            auto del = cache_->Del(RefreshKey(issuer_->SessionIdFromToken(cur.refresh_token)));
            if (!del.IsOk() && del.Code() != StatusCode::kNotFound) {
                VAULT_LOG_WARN("[SessionStore] restore: drop refresh mapping of {} failed: {}", record.id,
                               del.Message());
            }
        }
    }

    SessionRecord restored = record;
    if (restored.ttl_seconds <= 0) {
        restored.ttl_seconds = ResolveTtl(restored);
    }
    auto status = WriteRecord(restored);
    if (!status.IsOk()) {
        return status;
    }
    return IndexRecord(restored);
}

SessionStore::StatusOrSession SessionStore::TouchSession(const std::string& access_token) {
    auto record = GetSessionByAccessToken(access_token);
    if (!record.IsOk()) {
        return record;
    }
    if (record.Value().status != SessionStatus::kActive) {
        return Status::Unauthenticated("Session revoked");
    }
    const auto now = clock_->Now();
    return MutateSession(record.Value().id, [now](SessionRecord& r) { r.updated_at = now; });
}

StatusOr<std::size_t> SessionStore::PurgeRevoked(std::int64_t retention_seconds) {
    const auto cutoff = clock_->Now() - retention_seconds;
    auto revoked = index_.Query()
                       .WhereStatus(SessionStatus::kRevoked)
                       .Where([cutoff](const SessionRecord& r) { return r.updated_at < cutoff; })
                       .Get();
    if (!revoked.IsOk()) {
        return revoked.GetStatus();
    }

    std::size_t purged = 0;
    for (const auto& record : revoked.Value()) {
        auto status = DestroySessionById(record.id);
        if (status.IsOk()) {
            ++purged;
        } else if (status.Code() != StatusCode::kNotFound) {
            VAULT_LOG_WARN("[SessionStore] purge {} failed: {}", record.id, status.Message());
        }
    }
    return StatusOr<std::size_t>(purged);
}

StatusOr<std::size_t> SessionStore::CompactIndexes() {
    std::size_t dropped = 0;
    for (auto provider : AllProviders()) {
        auto result = index_.Compact(provider);
        if (!result.IsOk()) {
            return result.GetStatus();
        }
        dropped += result.Value();
    }
    return StatusOr<std::size_t>(dropped);
}

std::int64_t SessionStore::GetProviderTtl(Provider provider) const {
    auto it = config_.provider_ttls.find(ProviderToString(provider));
    if (it != config_.provider_ttls.end() && it->second > 0) {
        return it->second;
    }
    return config_.default_ttl_seconds;
}

std::int64_t SessionStore::ResolveTtl(const SessionRecord& record) const {
    if (record.ttl_overridden && record.ttl_seconds > 0) {
        return record.ttl_seconds;
    }
    return GetProviderTtl(record.provider);
}

SessionStore::Status SessionStore::WriteRecord(const SessionRecord& record, bool* primary_written) {
    auto status = cache_->SetEx(SessionKey(record.id), EncodeSession(record), record.ttl_seconds);
    if (!status.IsOk()) {
        return status;
    }
    if (primary_written) {
        *primary_written = true;
    }
    if (!record.refresh_token.empty()) {
        return cache_->SetEx(RefreshKey(issuer_->SessionIdFromToken(record.refresh_token)), record.id,
                             record.ttl_seconds);
    }
    return Status::OK();
}

SessionStore::Status SessionStore::RevertLocked(const SessionRecord& before, const SessionRecord& after) {
    if (before.provider != after.provider) {
        auto removed = index_.RemoveFromProviderIndex(after.provider, after.id);
        if (!removed.IsOk()) {
            VAULT_LOG_WARN("[SessionStore] revert: unindex {} from {} failed: {}", after.id,
                           ProviderToString(after.provider), removed.Message());
        }
    }
    auto status = WriteRecord(before);
    if (status.IsOk()) {
        status = IndexRecord(before);
    }
    if (!status.IsOk()) {
        VAULT_LOG_ERROR("[SessionStore] revert of session {} failed: {}", before.id, status.Message());
    }
    return status;
}

SessionStore::Status SessionStore::IndexRecord(const SessionRecord& record) {
    auto status = index_.IndexByProvider(record.provider, record.id, record.ttl_seconds);
    if (!status.IsOk()) {
        return status;
    }
    return index_.IndexByUser(record.user.uuid, record.id, record.ttl_seconds);
}

void SessionStore::UnindexRecord(const SessionRecord& record) {
    auto status = index_.RemoveFromProviderIndex(record.provider, record.id);
    if (!status.IsOk()) {
        VAULT_LOG_WARN("[SessionStore] remove {} from provider index failed: {}", record.id, status.Message());
    }
    status = index_.RemoveFromUserIndex(record.user.uuid, record.id);
    if (!status.IsOk()) {
        VAULT_LOG_WARN("[SessionStore] remove {} from user index failed: {}", record.id, status.Message());
    }
    if (!record.refresh_token.empty()) {
        status = cache_->Del(RefreshKey(issuer_->SessionIdFromToken(record.refresh_token)));
        if (!status.IsOk() && status.Code() != StatusCode::kNotFound) {
            VAULT_LOG_WARN("[SessionStore] remove refresh mapping of {} failed: {}", record.id, status.Message());
        }
    }
}

// 删除会话 (写逻辑: 先删主记录, 再尽力清理索引)
SessionStore::Status SessionStore::DestroyLocked(const SessionRecord& record) {
    auto status = cache_->Del(SessionKey(record.id));
    if (!status.IsOk() && status.Code() != StatusCode::kNotFound) {
        return status;
    }
    UnindexRecord(record);
    return Status::OK();
}

} // namespace core
} // namespace vault
