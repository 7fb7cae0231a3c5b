#include "core/session/session_record.hpp"

#include <algorithm>

namespace vault {
namespace core {

std::string ProviderToString(Provider provider) {
    switch (provider) {
        case Provider::kJwt:
            return "jwt";
        case Provider::kApiKey:
            return "api_key";
        case Provider::kOAuth:
            return "oauth";
        case Provider::kSocial:
            return "social";
        case Provider::kSaml:
            return "saml";
        case Provider::kLdap:
            return "ldap";
        case Provider::kAdmin:
            return "admin";
    }
    return "jwt";
}

std::optional<Provider> ProviderFromString(std::string_view name) {
    if (name == "jwt") return Provider::kJwt;
    if (name == "api_key" || name == "apikey") return Provider::kApiKey;
    if (name == "oauth") return Provider::kOAuth;
    if (name == "social") return Provider::kSocial;
    if (name == "saml") return Provider::kSaml;
    if (name == "ldap") return Provider::kLdap;
    if (name == "admin") return Provider::kAdmin;
    return std::nullopt;
}

const std::vector<Provider>& AllProviders() {
    static const std::vector<Provider> kProviders{
        Provider::kJwt, Provider::kApiKey, Provider::kOAuth, Provider::kSocial,
        Provider::kSaml, Provider::kLdap, Provider::kAdmin};
    return kProviders;
}

std::string SessionStatusToString(SessionStatus status) {
    return status == SessionStatus::kRevoked ? "revoked" : "active";
}

std::optional<SessionStatus> SessionStatusFromString(std::string_view name) {
    if (name == "active") return SessionStatus::kActive;
    if (name == "revoked") return SessionStatus::kRevoked;
    return std::nullopt;
}

bool UserSnapshot::HasRole(const std::string& name) const {
    if (role == name) {
        return true;
    }
    return std::find(roles.begin(), roles.end(), name) != roles.end();
}

bool UserSnapshot::operator==(const UserSnapshot& other) const {
    return uuid == other.uuid && role == other.role && roles == other.roles &&
           permissions == other.permissions && attributes == other.attributes;
}

bool SessionRecord::operator==(const SessionRecord& other) const {
    return id == other.id && access_token == other.access_token &&
           refresh_token == other.refresh_token && provider == other.provider &&
           user == other.user && created_at == other.created_at &&
           updated_at == other.updated_at && status == other.status &&
           ttl_seconds == other.ttl_seconds && ttl_overridden == other.ttl_overridden &&
           version == other.version && ip_address == other.ip_address &&
           user_agent == other.user_agent && metadata == other.metadata;
}

bool SessionUpdate::Empty() const {
    return !role && !roles && !permissions && !status && !ip_address && !user_agent &&
           metadata.empty() && !updated_at;
}

void ApplySessionUpdate(SessionRecord& record, const SessionUpdate& update) {
    if (update.role) {
        record.user.role = *update.role;
    }
    if (update.roles) {
        record.user.roles = *update.roles;
    }
    if (update.permissions) {
        record.user.permissions = *update.permissions;
    }
    if (update.status) {
        record.status = *update.status;
    }
    if (update.ip_address) {
        record.ip_address = *update.ip_address;
    }
    if (update.user_agent) {
        record.user_agent = *update.user_agent;
    }
    for (const auto& kv : update.metadata) {
        record.metadata[kv.first] = kv.second;
    }
    if (update.updated_at) {
        record.updated_at = *update.updated_at;
    }
}

std::optional<std::string> RecordField(const SessionRecord& record, const std::string& field) {
    if (field == "id") return record.id;
    if (field == "access_token" || field == "token") return record.access_token;
    if (field == "refresh_token") return record.refresh_token;
    if (field == "provider") return ProviderToString(record.provider);
    if (field == "status") return SessionStatusToString(record.status);
    if (field == "ip_address") return record.ip_address;
    if (field == "user_agent") return record.user_agent;
    if (field == "user_uuid") return record.user.uuid;
    if (field == "user_role") return record.user.role;

    constexpr std::string_view kMetadataPrefix = "metadata.";
    if (field.compare(0, kMetadataPrefix.size(), kMetadataPrefix) == 0) {
        auto it = record.metadata.find(field.substr(kMetadataPrefix.size()));
        if (it == record.metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    return std::nullopt;
}

} // namespace core
} // namespace vault
