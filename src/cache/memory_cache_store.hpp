#pragma once

#include "cache/cache_store.hpp"
#include "common/clock.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vault {
namespace cache {

// 进程内缓存实现, 过期时间基于注入的时钟计算
// 支持故障注入, 用于测试部分失败与回滚路径
class InMemoryCacheStore : public CacheStore {
public:
    explicit InMemoryCacheStore(std::shared_ptr<vault::common::Clock> clock = nullptr);

    vault::common::StatusOr<std::string> Get(const std::string& key) override;
    vault::common::Status SetEx(const std::string& key, const std::string& value,
                                std::int64_t ttl_seconds) override;
    vault::common::Status Del(const std::string& key) override;
    vault::common::Status Ping() override;

    // 剩余存活时间 (秒), 键不存在返回 std::nullopt, 永不过期返回 -1
    std::optional<std::int64_t> Ttl(const std::string& key);
    // 未过期的键数量
    std::size_t Size();

    // 接下来 n 次写入/删除失败
    void FailNextSets(int n);
    void FailNextDeletes(int n);
    // 模拟后端整体不可用
    void SetAvailable(bool available);

private:
    struct Entry {
        std::string value;
        std::int64_t expires_at = 0; // 0 表示不过期
    };

    bool ExpiredLocked(const Entry& entry) const;

    std::shared_ptr<vault::common::Clock> clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    int fail_sets_ = 0;
    int fail_deletes_ = 0;
    bool available_ = true;
};

} // namespace cache
} // namespace vault
