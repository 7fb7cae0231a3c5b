#include <gtest/gtest.h>

#include "core/session/session_codec.hpp"
#include "core/session/session_record.hpp"

using namespace vault::core;
using vault::common::StatusCode;

namespace {

SessionRecord SampleRecord() {
    SessionRecord record;
    record.id = "0123456789abcdef0123456789abcdef";
    record.access_token = "access-1";
    record.refresh_token = "refresh-1";
    record.provider = Provider::kOAuth;
    record.user.uuid = "user-1";
    record.user.role = "editor";
    record.user.roles = {"editor", "reviewer"};
    record.user.permissions = {"posts.write"};
    record.user.attributes = {{"email", "u1@example.com"}};
    record.created_at = 1700000000;
    record.updated_at = 1700000100;
    record.ttl_seconds = 7200;
    record.version = 3;
    record.ip_address = "10.1.2.3";
    record.user_agent = "curl/8.0";
    record.metadata = {{"device", "laptop"}};
    return record;
}

} // namespace

TEST(SessionCodecTest, RoundTripPreservesEveryField) {
    auto record = SampleRecord();
    auto decoded = DecodeSession(EncodeSession(record));
    ASSERT_TRUE(decoded.IsOk()) << decoded.GetStatus().Message();
    EXPECT_EQ(decoded.Value(), record);
}

TEST(SessionCodecTest, RejectsMalformedPayloads) {
    EXPECT_EQ(DecodeSession("not json").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(DecodeSession("[1,2]").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(DecodeSession(R"({"access_token":"a"})").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(DecodeSession(R"({"id":"x","provider":"carrier-pigeon"})").GetStatus().Code(),
              StatusCode::kInternal);
    EXPECT_EQ(DecodeSession(R"({"id":"x","created_at":"yesterday"})").GetStatus().Code(),
              StatusCode::kInternal);
}

TEST(SessionCodecTest, MissingOptionalFieldsUseDefaults) {
    auto decoded = DecodeSession(R"({"id":"abc","created_at":42})");
    ASSERT_TRUE(decoded.IsOk()) << decoded.GetStatus().Message();
    EXPECT_EQ(decoded.Value().provider, Provider::kJwt);
    EXPECT_EQ(decoded.Value().status, SessionStatus::kActive);
    EXPECT_EQ(decoded.Value().updated_at, 42);
    EXPECT_TRUE(decoded.Value().metadata.empty());
}

TEST(SessionRecordTest, ProviderNames) {
    EXPECT_EQ(ProviderFromString("apikey"), Provider::kApiKey);
    EXPECT_EQ(ProviderFromString("api_key"), Provider::kApiKey);
    EXPECT_EQ(ProviderToString(Provider::kApiKey), "api_key");
    EXPECT_FALSE(ProviderFromString("unknown").has_value());
    for (auto provider : AllProviders()) {
        EXPECT_EQ(ProviderFromString(ProviderToString(provider)), provider);
    }
}

TEST(SessionRecordTest, ApplyUpdateIsShallowMerge) {
    auto record = SampleRecord();
    SessionUpdate update;
    update.role = "admin";
    update.metadata["team"] = "core";
    ASSERT_FALSE(update.Empty());

    ApplySessionUpdate(record, update);
    EXPECT_EQ(record.user.role, "admin");
    EXPECT_EQ(record.user.roles, (std::vector<std::string>{"editor", "reviewer"}));
    EXPECT_EQ(record.metadata.at("device"), "laptop");
    EXPECT_EQ(record.metadata.at("team"), "core");
    EXPECT_TRUE(SessionUpdate().Empty());
}

TEST(SessionRecordTest, RecordFieldLookup) {
    auto record = SampleRecord();
    EXPECT_EQ(RecordField(record, "provider"), std::optional<std::string>("oauth"));
    EXPECT_EQ(RecordField(record, "user_uuid"), std::optional<std::string>("user-1"));
    EXPECT_EQ(RecordField(record, "metadata.device"), std::optional<std::string>("laptop"));
    EXPECT_FALSE(RecordField(record, "metadata.missing").has_value());
    EXPECT_FALSE(RecordField(record, "no_such_field").has_value());
}
