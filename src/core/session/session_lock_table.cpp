#include "core/session/session_lock_table.hpp"

#include <functional>

namespace vault {
namespace core {

SessionLockTable::SessionLockTable(std::size_t stripes) {
    if (stripes == 0) {
        stripes = 1;
    }
    mutexes_.reserve(stripes);
    for (std::size_t i = 0; i < stripes; ++i) {
        mutexes_.push_back(std::make_unique<std::mutex>());
    }
}

std::unique_lock<std::mutex> SessionLockTable::Acquire(const std::string& key) {
    auto slot = std::hash<std::string>{}(key) % mutexes_.size();
    return std::unique_lock<std::mutex>(*mutexes_[slot]);
}

} // namespace core
} // namespace vault
