#pragma once

#include "core/session/session_record.hpp"

#include <fmt/format.h>

#include <string>

namespace vault {
namespace core {

// 缓存键布局
// session:<id>                     会话主记录
// session_refresh:<refresh_id>     refresh token -> 会话ID
// session_index:provider:<name>    provider 索引
// session_index:user:<uuid>        用户索引
// session_tx:<tx_id>               事务补偿日志
inline std::string SessionKey(const std::string& id) {
    return fmt::format("session:{}", id);
}

inline std::string RefreshKey(const std::string& refresh_id) {
    return fmt::format("session_refresh:{}", refresh_id);
}

inline std::string ProviderIndexKey(Provider provider) {
    return fmt::format("session_index:provider:{}", ProviderToString(provider));
}

inline std::string UserIndexKey(const std::string& user_uuid) {
    return fmt::format("session_index:user:{}", user_uuid);
}

inline std::string JournalKey(const std::string& transaction_id) {
    return fmt::format("session_tx:{}", transaction_id);
}

} // namespace core
} // namespace vault
