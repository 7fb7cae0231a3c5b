#include "cache/memory_cache_store.hpp"

namespace vault {
namespace cache {

InMemoryCacheStore::InMemoryCacheStore(std::shared_ptr<vault::common::Clock> clock)
    : clock_(clock ? std::move(clock) : vault::common::DefaultClock()) {}

bool InMemoryCacheStore::ExpiredLocked(const Entry& entry) const {
    return entry.expires_at != 0 && entry.expires_at <= clock_->Now();
}

vault::common::StatusOr<std::string> InMemoryCacheStore::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        return vault::common::Status::Unavailable("cache unavailable");
    }
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return vault::common::Status::NotFound("Key not found in cache: " + key);
    }
    if (ExpiredLocked(it->second)) {
        // 惰性过期
        entries_.erase(it);
        return vault::common::Status::NotFound("Key not found in cache: " + key);
    }
    return vault::common::StatusOr<std::string>(it->second.value);
}

vault::common::Status InMemoryCacheStore::SetEx(const std::string& key, const std::string& value,
                                                std::int64_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        return vault::common::Status::Unavailable("cache unavailable");
    }
    if (fail_sets_ > 0) {
        --fail_sets_;
        return vault::common::Status::Unavailable("injected set failure: " + key);
    }
    Entry entry;
    entry.value = value;
    entry.expires_at = ttl_seconds > 0 ? clock_->Now() + ttl_seconds : 0;
    entries_[key] = std::move(entry);
    return vault::common::Status::OK();
}

vault::common::Status InMemoryCacheStore::Del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        return vault::common::Status::Unavailable("cache unavailable");
    }
    if (fail_deletes_ > 0) {
        --fail_deletes_;
        return vault::common::Status::Unavailable("injected delete failure: " + key);
    }
    auto it = entries_.find(key);
    if (it == entries_.end() || ExpiredLocked(it->second)) {
        if (it != entries_.end()) {
            entries_.erase(it);
        }
        return vault::common::Status::NotFound("Key not found in cache: " + key);
    }
    entries_.erase(it);
    return vault::common::Status::OK();
}

vault::common::Status InMemoryCacheStore::Ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        return vault::common::Status::Unavailable("cache unavailable");
    }
    return vault::common::Status::OK();
}

std::optional<std::int64_t> InMemoryCacheStore::Ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || ExpiredLocked(it->second)) {
        return std::nullopt;
    }
    if (it->second.expires_at == 0) {
        return -1;
    }
    return it->second.expires_at - clock_->Now();
}

std::size_t InMemoryCacheStore::Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& kv : entries_) {
        if (!ExpiredLocked(kv.second)) {
            ++count;
        }
    }
    return count;
}

void InMemoryCacheStore::FailNextSets(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_sets_ = n;
}

void InMemoryCacheStore::FailNextDeletes(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_deletes_ = n;
}

void InMemoryCacheStore::SetAvailable(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

} // namespace cache
} // namespace vault
