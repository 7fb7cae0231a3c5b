#include "core/session/persistent_session_store.hpp"

#include <mutex>

namespace vault {
namespace core {

using vault::common::Status;
using vault::common::StatusOr;

std::string PersistentStatusToString(PersistentStatus status) {
    switch (status) {
        case PersistentStatus::kActive:
            return "active";
        case PersistentStatus::kRevoked:
            return "revoked";
        case PersistentStatus::kExpired:
            return "expired";
    }
    return "active";
}

Status InMemoryPersistentSessionStore::CheckWritableLocked() {
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    if (fail_writes_ > 0) {
        --fail_writes_;
        return Status::Unavailable("injected persistent write failure");
    }
    return Status::OK();
}

Status InMemoryPersistentSessionStore::Create(const PersistentSession& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto status = CheckWritableLocked();
    if (!status.IsOk()) {
        return status;
    }
    if (sessions_.count(session.uuid) > 0) {
        return Status::AlreadyExists("Session already exists");
    }
    sessions_[session.uuid] = session;
    return Status::OK();
}

Status InMemoryPersistentSessionStore::Update(const PersistentSession& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto status = CheckWritableLocked();
    if (!status.IsOk()) {
        return status;
    }
    auto it = sessions_.find(session.uuid);
    if (it == sessions_.end()) {
        return Status::NotFound("Session not found");
    }
    it->second = session;
    return Status::OK();
}

StatusOr<PersistentSession> InMemoryPersistentSessionStore::FindById(const std::string& uuid) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    auto it = sessions_.find(uuid);
    if (it == sessions_.end()) {
        return Status::NotFound("Session not found");
    }
    return StatusOr<PersistentSession>(it->second);
}

StatusOr<PersistentSession> InMemoryPersistentSessionStore::FindByAccessToken(const std::string& access_token) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    for (const auto& kv : sessions_) {
        if (kv.second.access_token == access_token) {
            return StatusOr<PersistentSession>(kv.second);
        }
    }
    return Status::NotFound("Session not found");
}

StatusOr<PersistentSession> InMemoryPersistentSessionStore::FindByRefreshToken(const std::string& refresh_token) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    for (const auto& kv : sessions_) {
        if (kv.second.refresh_token == refresh_token) {
            return StatusOr<PersistentSession>(kv.second);
        }
    }
    return Status::NotFound("Session not found");
}

StatusOr<std::vector<PersistentSession>> InMemoryPersistentSessionStore::ListActiveByUser(const std::string& user_uuid) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    std::vector<PersistentSession> out;
    for (const auto& kv : sessions_) {
        if (kv.second.user_uuid == user_uuid && kv.second.status == PersistentStatus::kActive) {
            out.push_back(kv.second);
        }
    }
    return StatusOr<std::vector<PersistentSession>>(std::move(out));
}

StatusOr<std::vector<PersistentSession>> InMemoryPersistentSessionStore::ListExpired(std::int64_t now) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    std::vector<PersistentSession> out;
    for (const auto& kv : sessions_) {
        if (kv.second.status == PersistentStatus::kActive && kv.second.refresh_expires_at < now) {
            out.push_back(kv.second);
        }
    }
    return StatusOr<std::vector<PersistentSession>>(std::move(out));
}

StatusOr<std::size_t> InMemoryPersistentSessionStore::PurgeInactiveBefore(std::int64_t cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto status = CheckWritableLocked();
    if (!status.IsOk()) {
        return status;
    }
    std::size_t purged = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& s = it->second;
        if (s.status != PersistentStatus::kActive && s.revoked_at < cutoff) {
            it = sessions_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return StatusOr<std::size_t>(purged);
}

Status InMemoryPersistentSessionStore::Delete(const std::string& uuid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto status = CheckWritableLocked();
    if (!status.IsOk()) {
        return status;
    }
    if (sessions_.erase(uuid) == 0) {
        return Status::NotFound("Session not found");
    }
    return Status::OK();
}

Status InMemoryPersistentSessionStore::Ping() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!available_) {
        return Status::Unavailable("persistent store unavailable");
    }
    return Status::OK();
}

void InMemoryPersistentSessionStore::FailNextWrites(int n) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    fail_writes_ = n;
}

void InMemoryPersistentSessionStore::SetAvailable(bool available) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    available_ = available;
}

std::size_t InMemoryPersistentSessionStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace core
} // namespace vault
