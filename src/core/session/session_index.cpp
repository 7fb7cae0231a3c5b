#include "core/session/session_index.hpp"

#include "common/logger.hpp"
#include "core/session/session_codec.hpp"
#include "core/session/session_keys.hpp"

#include <nlohmann/json.hpp>

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace vault {
namespace core {

using vault::common::Status;
using vault::common::StatusCode;
using vault::common::StatusOr;

SessionIndex::SessionIndex(std::shared_ptr<vault::cache::CacheStore> cache,
                           std::shared_ptr<vault::common::Clock> clock,
                           std::size_t lock_stripes)
    : cache_(std::move(cache)),
      clock_(clock ? std::move(clock) : vault::common::DefaultClock()),
      locks_(lock_stripes) {}

Status SessionIndex::IndexByProvider(Provider provider, const std::string& id, std::int64_t ttl_seconds) {
    return Upsert(ProviderIndexKey(provider), id, ttl_seconds);
}

Status SessionIndex::RemoveFromProviderIndex(Provider provider, const std::string& id) {
    return Remove(ProviderIndexKey(provider), id);
}

Status SessionIndex::IndexByUser(const std::string& user_uuid, const std::string& id, std::int64_t ttl_seconds) {
    if (user_uuid.empty()) {
        return Status::OK();
    }
    return Upsert(UserIndexKey(user_uuid), id, ttl_seconds);
}

Status SessionIndex::RemoveFromUserIndex(const std::string& user_uuid, const std::string& id) {
    if (user_uuid.empty()) {
        return Status::OK();
    }
    return Remove(UserIndexKey(user_uuid), id);
}

StatusOr<std::vector<std::string>> SessionIndex::ProviderMembers(Provider provider) {
    return Members(ProviderIndexKey(provider));
}

StatusOr<std::vector<std::string>> SessionIndex::UserMembers(const std::string& user_uuid) {
    return Members(UserIndexKey(user_uuid));
}

StatusOr<std::size_t> SessionIndex::Compact(Provider provider) {
    const auto key = ProviderIndexKey(provider);
    auto lock = locks_.Acquire(key);

    auto loaded = Load(key);
    if (!loaded.IsOk()) {
        return loaded.GetStatus();
    }
    auto entries = std::move(loaded).Value();
    const auto before = entries.size();
    PruneExpired(entries);

    for (auto it = entries.begin(); it != entries.end();) {
        auto record = Hydrate(it->first);
        if (record.IsOk() && record.Value().provider == provider) {
            ++it;
            continue;
        }
        if (!record.IsOk() && record.GetStatus().Code() != StatusCode::kNotFound) {
            // 读失败时保留条目, 下次再处理
            VAULT_LOG_WARN("[SessionIndex] compact {} skipped {}: {}", key, it->first,
                           record.GetStatus().Message());
            ++it;
            continue;
        }
        it = entries.erase(it);
    }

    const auto dropped = before - entries.size();
    if (dropped > 0) {
        auto status = Save(key, entries);
        if (!status.IsOk()) {
            return status;
        }
    }
    return StatusOr<std::size_t>(dropped);
}

StatusOr<SessionRecord> SessionIndex::Hydrate(const std::string& id) {
    auto payload = cache_->Get(SessionKey(id));
    if (!payload.IsOk()) {
        return payload.GetStatus();
    }
    return DecodeSession(payload.Value());
}

SessionQuery SessionIndex::Query() {
    return SessionQuery(this);
}

StatusOr<SessionIndex::Entries> SessionIndex::Load(const std::string& key) {
    auto payload = cache_->Get(key);
    if (!payload.IsOk()) {
        if (payload.GetStatus().Code() == StatusCode::kNotFound) {
            return StatusOr<Entries>(Entries{});
        }
        return payload.GetStatus();
    }

    auto json = nlohmann::json::parse(payload.Value(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        // 损坏的索引按空索引处理, 下一次写入会重建
        VAULT_LOG_WARN("[SessionIndex] discarding malformed index {}", key);
        return StatusOr<Entries>(Entries{});
    }

    Entries entries;
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (it.value().is_number_integer()) {
            entries[it.key()] = it.value().get<std::int64_t>();
        }
    }
    return StatusOr<Entries>(std::move(entries));
}

Status SessionIndex::Save(const std::string& key, const Entries& entries) {
    if (entries.empty()) {
        auto status = cache_->Del(key);
        if (!status.IsOk() && status.Code() != StatusCode::kNotFound) {
            return status;
        }
        return Status::OK();
    }

    // 索引键自身的 TTL 取最晚过期的条目; 只要有一个条目不过期, 索引键也不过期
    const auto now = clock_->Now();
    std::int64_t max_expires = 0;
    bool persistent = false;
    nlohmann::json json = nlohmann::json::object();
    for (const auto& kv : entries) {
        json[kv.first] = kv.second;
        if (kv.second == 0) {
            persistent = true;
        }
        max_expires = std::max(max_expires, kv.second);
    }
    std::int64_t ttl = persistent ? 0 : std::max<std::int64_t>(1, max_expires - now);
    return cache_->SetEx(key, json.dump(), ttl);
}

Status SessionIndex::Upsert(const std::string& key, const std::string& id, std::int64_t ttl_seconds) {
    auto lock = locks_.Acquire(key);
    auto loaded = Load(key);
    if (!loaded.IsOk()) {
        return loaded.GetStatus();
    }
    auto entries = std::move(loaded).Value();
    PruneExpired(entries);
    entries[id] = ttl_seconds > 0 ? clock_->Now() + ttl_seconds : 0;
    return Save(key, entries);
}

Status SessionIndex::Remove(const std::string& key, const std::string& id) {
    auto lock = locks_.Acquire(key);
    auto loaded = Load(key);
    if (!loaded.IsOk()) {
        return loaded.GetStatus();
    }
    auto entries = std::move(loaded).Value();
    const auto before = entries.size();
    PruneExpired(entries);
    const bool existed = entries.erase(id) > 0;
    if (!existed && entries.size() == before) {
        return Status::OK();
    }
    return Save(key, entries);
}

StatusOr<std::vector<std::string>> SessionIndex::Members(const std::string& key) {
    auto loaded = Load(key);
    if (!loaded.IsOk()) {
        return loaded.GetStatus();
    }
    auto entries = std::move(loaded).Value();
    PruneExpired(entries);
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (const auto& kv : entries) {
        ids.push_back(kv.first);
    }
    return StatusOr<std::vector<std::string>>(std::move(ids));
}

void SessionIndex::PruneExpired(Entries& entries) const {
    const auto now = clock_->Now();
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second != 0 && it->second <= now) {
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
}

// ---------------------------------------------------------------------------
// SessionQuery

SessionQuery::SessionQuery(SessionIndex* index) : index_(index) {}

SessionQuery& SessionQuery::WhereProvider(Provider provider) {
    provider_hint_.push_back(provider);
    predicates_.push_back([provider](const SessionRecord& r) { return r.provider == provider; });
    return *this;
}

SessionQuery& SessionQuery::WhereProviderIn(const std::vector<Provider>& providers) {
    provider_hint_.insert(provider_hint_.end(), providers.begin(), providers.end());
    predicates_.push_back([providers](const SessionRecord& r) {
        return std::find(providers.begin(), providers.end(), r.provider) != providers.end();
    });
    return *this;
}

SessionQuery& SessionQuery::WhereUser(const std::string& user_uuid) {
    if (!user_hint_) {
        user_hint_ = std::vector<std::string>{user_uuid};
    }
    predicates_.push_back([user_uuid](const SessionRecord& r) { return r.user.uuid == user_uuid; });
    return *this;
}

SessionQuery& SessionQuery::WhereUserIn(const std::vector<std::string>& user_uuids) {
    if (!user_hint_) {
        user_hint_ = user_uuids;
    }
    predicates_.push_back([user_uuids](const SessionRecord& r) {
        return std::find(user_uuids.begin(), user_uuids.end(), r.user.uuid) != user_uuids.end();
    });
    return *this;
}

SessionQuery& SessionQuery::WhereUserRole(const std::string& role) {
    predicates_.push_back([role](const SessionRecord& r) { return r.user.HasRole(role); });
    return *this;
}

SessionQuery& SessionQuery::WhereUserHasAnyRole(const std::vector<std::string>& roles) {
    predicates_.push_back([roles](const SessionRecord& r) {
        return std::any_of(roles.begin(), roles.end(), [&r](const std::string& role) { return r.user.HasRole(role); });
    });
    return *this;
}

SessionQuery& SessionQuery::WhereUserHasAllRoles(const std::vector<std::string>& roles) {
    predicates_.push_back([roles](const SessionRecord& r) {
        return std::all_of(roles.begin(), roles.end(), [&r](const std::string& role) { return r.user.HasRole(role); });
    });
    return *this;
}

SessionQuery& SessionQuery::WhereUserHasPermission(const std::string& permission) {
    predicates_.push_back([permission](const SessionRecord& r) {
        const auto& permissions = r.user.permissions;
        return std::find(permissions.begin(), permissions.end(), permission) != permissions.end();
    });
    return *this;
}

SessionQuery& SessionQuery::WhereIpAddress(const std::string& ip_address) {
    predicates_.push_back([ip_address](const SessionRecord& r) {
        return !r.ip_address.empty() && r.ip_address == ip_address;
    });
    return *this;
}

SessionQuery& SessionQuery::WhereIpAddressLike(const std::string& pattern) {
    predicates_.push_back([pattern](const SessionRecord& r) {
        return !r.ip_address.empty() && ::fnmatch(pattern.c_str(), r.ip_address.c_str(), 0) == 0;
    });
    return *this;
}

SessionQuery& SessionQuery::WhereUserAgentLike(const std::string& fragment) {
    predicates_.push_back([fragment](const SessionRecord& r) {
        if (r.user_agent.empty()) {
            return false;
        }
        auto it = std::search(r.user_agent.begin(), r.user_agent.end(), fragment.begin(), fragment.end(),
                              [](char a, char b) {
                                  return std::tolower(static_cast<unsigned char>(a)) ==
                                         std::tolower(static_cast<unsigned char>(b));
                              });
        return it != r.user_agent.end();
    });
    return *this;
}

SessionQuery& SessionQuery::WhereLastActivityOlderThan(std::int64_t seconds) {
    auto clock = index_->GetClock();
    predicates_.push_back([clock, seconds](const SessionRecord& r) {
        return r.updated_at < clock->Now() - seconds;
    });
    return *this;
}

SessionQuery& SessionQuery::WhereLastActivityWithin(std::int64_t seconds) {
    auto clock = index_->GetClock();
    predicates_.push_back([clock, seconds](const SessionRecord& r) {
        return r.updated_at >= clock->Now() - seconds;
    });
    return *this;
}

SessionQuery& SessionQuery::WhereCreatedBetween(std::int64_t from, std::int64_t to) {
    predicates_.push_back([from, to](const SessionRecord& r) {
        return r.created_at >= from && r.created_at <= to;
    });
    return *this;
}

SessionQuery& SessionQuery::WhereStatus(SessionStatus status) {
    predicates_.push_back([status](const SessionRecord& r) { return r.status == status; });
    return *this;
}

SessionQuery& SessionQuery::Where(Predicate predicate) {
    if (predicate) {
        predicates_.push_back(std::move(predicate));
    }
    return *this;
}

SessionQuery& SessionQuery::OrWhere(const std::function<void(SessionQuery&)>& build) {
    SessionQuery group(index_);
    if (build) {
        build(group);
    }
    auto alternatives = std::move(group.predicates_);
    predicates_.push_back([alternatives](const SessionRecord& r) {
        if (alternatives.empty()) {
            return true;
        }
        return std::any_of(alternatives.begin(), alternatives.end(),
                           [&r](const Predicate& predicate) { return predicate(r); });
    });
    return *this;
}

SessionQuery& SessionQuery::OrderByLastActivity(bool descending) {
    order_desc_ = descending;
    return *this;
}

SessionQuery& SessionQuery::Limit(std::size_t limit) {
    limit_ = limit;
    return *this;
}

SessionQuery& SessionQuery::Offset(std::size_t offset) {
    offset_ = offset;
    return *this;
}

StatusOr<std::vector<std::string>> SessionQuery::CandidateIds() {
    std::set<std::string> unique;
    if (user_hint_) {
        for (const auto& user_uuid : *user_hint_) {
            auto members = index_->UserMembers(user_uuid);
            if (!members.IsOk()) {
                return members.GetStatus();
            }
            unique.insert(members.Value().begin(), members.Value().end());
        }
        return StatusOr<std::vector<std::string>>(std::vector<std::string>(unique.begin(), unique.end()));
    }

    const auto& providers = provider_hint_.empty() ? AllProviders() : provider_hint_;
    for (auto provider : providers) {
        auto members = index_->ProviderMembers(provider);
        if (!members.IsOk()) {
            return members.GetStatus();
        }
        unique.insert(members.Value().begin(), members.Value().end());
    }
    return StatusOr<std::vector<std::string>>(std::vector<std::string>(unique.begin(), unique.end()));
}

StatusOr<std::vector<SessionRecord>> SessionQuery::Matching() {
    auto ids = CandidateIds();
    if (!ids.IsOk()) {
        return ids.GetStatus();
    }

    std::vector<SessionRecord> matched;
    for (const auto& id : ids.Value()) {
        auto record = index_->Hydrate(id);
        if (!record.IsOk()) {
            if (record.GetStatus().Code() == StatusCode::kNotFound) {
                // 主记录已过期或删除, 索引条目稍后自行过期
                continue;
            }
            return record.GetStatus();
        }
        const auto& rec = record.Value();
        bool ok = std::all_of(predicates_.begin(), predicates_.end(),
                              [&rec](const Predicate& p) { return p(rec); });
        if (ok) {
            matched.push_back(std::move(record).Value());
        }
    }
    return StatusOr<std::vector<SessionRecord>>(std::move(matched));
}

StatusOr<std::vector<SessionRecord>> SessionQuery::Get() {
    auto matched = Matching();
    if (!matched.IsOk()) {
        return matched.GetStatus();
    }
    auto sessions = std::move(matched).Value();

    if (order_desc_) {
        const bool desc = *order_desc_;
        std::stable_sort(sessions.begin(), sessions.end(),
                         [desc](const SessionRecord& a, const SessionRecord& b) {
                             return desc ? a.updated_at > b.updated_at : a.updated_at < b.updated_at;
                         });
    }

    if (offset_) {
        if (*offset_ >= sessions.size()) {
            sessions.clear();
        } else {
            sessions.erase(sessions.begin(), sessions.begin() + static_cast<std::ptrdiff_t>(*offset_));
        }
    }
    if (limit_ && sessions.size() > *limit_) {
        sessions.resize(*limit_);
    }
    return StatusOr<std::vector<SessionRecord>>(std::move(sessions));
}

StatusOr<std::size_t> SessionQuery::Count() {
    auto matched = Matching();
    if (!matched.IsOk()) {
        return matched.GetStatus();
    }
    return StatusOr<std::size_t>(matched.Value().size());
}

StatusOr<SessionRecord> SessionQuery::First() {
    Limit(1);
    auto sessions = Get();
    if (!sessions.IsOk()) {
        return sessions.GetStatus();
    }
    if (sessions.Value().empty()) {
        return Status::NotFound("No session matches the query");
    }
    return StatusOr<SessionRecord>(std::move(sessions.Value().front()));
}

StatusOr<bool> SessionQuery::Exists() {
    auto count = Count();
    if (!count.IsOk()) {
        return count.GetStatus();
    }
    return StatusOr<bool>(count.Value() > 0);
}

} // namespace core
} // namespace vault
