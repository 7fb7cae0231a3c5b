#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <string>

namespace vault {
namespace cache {

// 缓存后端接口: 仅提供单键的 get/set/delete 与 TTL, 不支持多键事务
// 每个单键操作本身是原子的
class CacheStore {
public:
    virtual ~CacheStore() = default;

    // 获取键对应的值, 未命中返回 kNotFound
    virtual vault::common::StatusOr<std::string> Get(const std::string& key) = 0;
    // 设置键值对并设置过期时间 (秒), ttl_seconds <= 0 表示不过期
    virtual vault::common::Status SetEx(const std::string& key, const std::string& value,
                                        std::int64_t ttl_seconds) = 0;
    // 删除键, 键不存在时返回 kNotFound
    virtual vault::common::Status Del(const std::string& key) = 0;
    // 连通性检查
    virtual vault::common::Status Ping() = 0;
};

} // namespace cache
} // namespace vault
