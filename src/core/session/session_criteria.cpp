#include "core/session/session_criteria.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <type_traits>

namespace vault {
namespace core {

using vault::common::Status;
using vault::common::StatusOr;

namespace {

// 解析 ">N" 形式的空闲时长, 允许 "s" / "sec" / "seconds" 后缀
StatusOr<std::int64_t> ParseIdleTime(const std::string& value) {
    const auto invalid = [&value]() {
        return Status::InvalidArgument("idle_time must look like \">Nseconds\": " + value);
    };
    if (value.size() < 2 || value.front() != '>') {
        return invalid();
    }
    std::string digits = value.substr(1);
    for (const char* suffix : {"seconds", "sec", "s"}) {
        const std::string unit(suffix);
        if (digits.size() > unit.size() && digits.compare(digits.size() - unit.size(), unit.size(), unit) == 0) {
            digits.resize(digits.size() - unit.size());
            break;
        }
    }
    try {
        std::size_t consumed = 0;
        const long long seconds = std::stoll(digits, &consumed);
        if (consumed != digits.size() || seconds < 0) {
            return invalid();
        }
        return StatusOr<std::int64_t>(static_cast<std::int64_t>(seconds));
    } catch (const std::exception&) {
        return invalid();
    }
}

} // namespace

StatusOr<SessionCriteria> ParseCriteria(const std::map<std::string, std::string>& raw) {
    SessionCriteria criteria;
    for (const auto& [key, value] : raw) {
        if (key == "provider") {
            auto provider = ProviderFromString(value);
            if (!provider) {
                return Status::InvalidArgument("unknown provider: " + value);
            }
            criteria.emplace_back(ByProvider{*provider});
        } else if (key == "idle_time") {
            auto seconds = ParseIdleTime(value);
            if (!seconds.IsOk()) {
                return seconds.GetStatus();
            }
            criteria.emplace_back(ByIdleOlderThan{seconds.Value()});
        } else if (key == "user_role") {
            criteria.emplace_back(ByUserRole{value});
        } else if (key == "user_uuid") {
            criteria.emplace_back(ByUser{value});
        } else if (key == "status") {
            auto status = SessionStatusFromString(value);
            if (!status) {
                return Status::InvalidArgument("unknown session status: " + value);
            }
            criteria.emplace_back(ByStatus{*status});
        } else {
            criteria.emplace_back(ByField{key, value});
        }
    }
    return StatusOr<SessionCriteria>(std::move(criteria));
}

void ApplyCriteria(SessionQuery& query, const SessionCriteria& criteria) {
    for (const auto& criterion : criteria) {
        std::visit(
            [&query](const auto& c) {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, ByProvider>) {
                    query.WhereProvider(c.provider);
                } else if constexpr (std::is_same_v<T, ByIdleOlderThan>) {
                    query.WhereLastActivityOlderThan(c.seconds);
                } else if constexpr (std::is_same_v<T, ByUserRole>) {
                    query.WhereUserRole(c.role);
                } else if constexpr (std::is_same_v<T, ByUser>) {
                    query.WhereUser(c.user_uuid);
                } else if constexpr (std::is_same_v<T, ByStatus>) {
                    query.WhereStatus(c.status);
                } else if constexpr (std::is_same_v<T, ByField>) {
                    query.Where([field = c.field, value = c.value](const SessionRecord& record) {
                        auto actual = RecordField(record, field);
                        return actual && *actual == value;
                    });
                } else if constexpr (std::is_same_v<T, Custom>) {
                    if (c.predicate) {
                        query.Where(c.predicate);
                    }
                }
            },
            criterion);
    }
}

std::string DescribeCriteria(const SessionCriteria& criteria) {
    std::string out;
    for (const auto& criterion : criteria) {
        if (!out.empty()) {
            out += " AND ";
        }
        out += std::visit(
            [](const auto& c) -> std::string {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, ByProvider>) {
                    return "provider=" + ProviderToString(c.provider);
                } else if constexpr (std::is_same_v<T, ByIdleOlderThan>) {
                    return fmt::format("idle_time>{}", c.seconds);
                } else if constexpr (std::is_same_v<T, ByUserRole>) {
                    return "user_role=" + c.role;
                } else if constexpr (std::is_same_v<T, ByUser>) {
                    return "user_uuid=" + c.user_uuid;
                } else if constexpr (std::is_same_v<T, ByStatus>) {
                    return "status=" + SessionStatusToString(c.status);
                } else if constexpr (std::is_same_v<T, ByField>) {
                    return c.field + "=" + c.value;
                } else {
                    return c.description;
                }
            },
            criterion);
    }
    return out.empty() ? "*" : out;
}

} // namespace core
} // namespace vault
