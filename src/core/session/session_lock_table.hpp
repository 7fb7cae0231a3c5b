#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vault {
namespace core {

// 分段锁表: 同一个键总是映射到同一把互斥锁
// 只在本进程内提供互斥, 跨进程仍是"最后写入者获胜"
class SessionLockTable {
public:
    explicit SessionLockTable(std::size_t stripes = 64);

    SessionLockTable(const SessionLockTable&) = delete;
    SessionLockTable& operator=(const SessionLockTable&) = delete;

    std::unique_lock<std::mutex> Acquire(const std::string& key);

    std::size_t Stripes() const noexcept { return mutexes_.size(); }

private:
    std::vector<std::unique_ptr<std::mutex>> mutexes_;
};

} // namespace core
} // namespace vault
