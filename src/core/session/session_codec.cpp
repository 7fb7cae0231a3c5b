#include "core/session/session_codec.hpp"

namespace vault {
namespace core {

namespace {

nlohmann::json UserToJson(const UserSnapshot& user) {
    return nlohmann::json{
        {"uuid", user.uuid},
        {"role", user.role},
        {"roles", user.roles},
        {"permissions", user.permissions},
        {"attributes", user.attributes},
    };
}

UserSnapshot UserFromJson(const nlohmann::json& j) {
    UserSnapshot user;
    user.uuid = j.value("uuid", "");
    user.role = j.value("role", "");
    user.roles = j.value("roles", std::vector<std::string>{});
    user.permissions = j.value("permissions", std::vector<std::string>{});
    user.attributes = j.value("attributes", std::map<std::string, std::string>{});
    return user;
}

} // namespace

nlohmann::json SessionToJson(const SessionRecord& record) {
    return nlohmann::json{
        {"id", record.id},
        {"access_token", record.access_token},
        {"refresh_token", record.refresh_token},
        {"provider", ProviderToString(record.provider)},
        {"user", UserToJson(record.user)},
        {"created_at", record.created_at},
        {"updated_at", record.updated_at},
        {"status", SessionStatusToString(record.status)},
        {"ttl_seconds", record.ttl_seconds},
        {"ttl_overridden", record.ttl_overridden},
        {"version", record.version},
        {"ip_address", record.ip_address},
        {"user_agent", record.user_agent},
        {"metadata", record.metadata},
    };
}

vault::common::StatusOr<SessionRecord> SessionFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return vault::common::Status::Internal("invalid session payload: not an object");
    }
    try {
        SessionRecord rec;
        rec.id = j.value("id", "");
        if (rec.id.empty()) {
            return vault::common::Status::Internal("invalid session payload: missing id");
        }
        rec.access_token = j.value("access_token", "");
        rec.refresh_token = j.value("refresh_token", "");

        auto provider = ProviderFromString(j.value("provider", "jwt"));
        if (!provider) {
            return vault::common::Status::Internal("invalid session payload: unknown provider");
        }
        rec.provider = *provider;

        if (j.contains("user")) {
            rec.user = UserFromJson(j["user"]);
        }
        rec.created_at = j.value("created_at", 0LL);
        rec.updated_at = j.value("updated_at", rec.created_at);

        auto status = SessionStatusFromString(j.value("status", "active"));
        if (!status) {
            return vault::common::Status::Internal("invalid session payload: unknown status");
        }
        rec.status = *status;
        rec.ttl_seconds = j.value("ttl_seconds", 0LL);
        rec.ttl_overridden = j.value("ttl_overridden", false);
        rec.version = j.value("version", 0ULL);
        rec.ip_address = j.value("ip_address", "");
        rec.user_agent = j.value("user_agent", "");
        rec.metadata = j.value("metadata", std::map<std::string, std::string>{});
        return vault::common::StatusOr<SessionRecord>(std::move(rec));
    } catch (const nlohmann::json::exception& ex) {
        return vault::common::Status::Internal(std::string("invalid session payload: ") + ex.what());
    }
}

std::string EncodeSession(const SessionRecord& record) {
    return SessionToJson(record).dump();
}

vault::common::StatusOr<SessionRecord> DecodeSession(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return vault::common::Status::Internal("invalid session payload");
    }
    return SessionFromJson(json);
}

} // namespace core
} // namespace vault
