#include <gtest/gtest.h>

#include "cache/memory_cache_store.hpp"
#include "common/clock.hpp"
#include "core/session/persistent_session_store.hpp"
#include "core/session/session_keys.hpp"
#include "core/session/session_store.hpp"
#include "core/session/token_storage.hpp"

#include <memory>
#include <string>

using namespace vault::core;
using vault::cache::InMemoryCacheStore;
using vault::common::ManualClock;
using vault::common::StatusCode;

class TokenStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        cache_ = std::make_shared<InMemoryCacheStore>(clock_);
        store_ = std::make_shared<SessionStore>(cache_, nullptr, vault::common::SessionConfig(), clock_);
        persistent_ = std::make_shared<InMemoryPersistentSessionStore>();
        service_ = std::make_unique<TokenStorageService>(store_, persistent_);
    }

    SessionData Data(const std::string& user, Provider provider = Provider::kJwt) const {
        SessionData data;
        data.user.uuid = user;
        data.user.role = "member";
        data.provider = provider;
        data.ip_address = "10.0.0.1";
        return data;
    }

    static TokenPair Tokens(const std::string& suffix, std::int64_t expires_in = 900) {
        return TokenPair{"access-" + suffix, "refresh-" + suffix, expires_in};
    }

    std::string IdOf(const std::string& token) const {
        return store_->Issuer()->SessionIdFromToken(token);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryCacheStore> cache_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<InMemoryPersistentSessionStore> persistent_;
    std::unique_ptr<TokenStorageService> service_;
};

TEST_F(TokenStorageTest, StoreWritesBothLayers) {
    auto status = service_->StoreSession(Data("u1"), Tokens("1"));
    ASSERT_TRUE(status.IsOk()) << status.Message();
    EXPECT_EQ(persistent_->Size(), 1u);

    auto cached = store_->GetSessionByAccessToken("access-1");
    ASSERT_TRUE(cached.IsOk()) << cached.GetStatus().Message();
    EXPECT_EQ(cache_->Ttl(SessionKey(cached.Value().id)).value_or(0), 900);

    const auto persistent_id = cached.Value().metadata.at(TokenStorageService::kPersistentIdKey);
    auto row = persistent_->FindById(persistent_id);
    ASSERT_TRUE(row.IsOk()) << row.GetStatus().Message();
    EXPECT_EQ(row.Value().user_uuid, "u1");
    EXPECT_EQ(row.Value().refresh_token, "refresh-1");
    EXPECT_EQ(row.Value().access_expires_at, clock_->Now() + 900);
    EXPECT_EQ(row.Value().status, PersistentStatus::kActive);
    EXPECT_FALSE(row.Value().token_fingerprint.empty());
    EXPECT_NE(row.Value().token_fingerprint, "access-1");
}

TEST_F(TokenStorageTest, PersistentFailureStoresNothing) {
    persistent_->FailNextWrites(1);
    EXPECT_FALSE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    EXPECT_EQ(persistent_->Size(), 0u);
    EXPECT_EQ(cache_->Size(), 0u);
}

TEST_F(TokenStorageTest, CacheFailureUndoesPersistentRow) {
    cache_->FailNextSets(1);
    EXPECT_FALSE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    EXPECT_EQ(persistent_->Size(), 0u);
    EXPECT_TRUE(service_->Inconsistencies().empty());
}

TEST_F(TokenStorageTest, ReadThroughRepopulatesCache) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(store_->DestroySession("access-1").IsOk());
    EXPECT_FALSE(store_->GetSessionByAccessToken("access-1").IsOk());

    clock_->Advance(100);
    auto by_access = service_->GetSessionByAccessToken("access-1");
    ASSERT_TRUE(by_access.IsOk()) << by_access.GetStatus().Message();
    EXPECT_EQ(by_access.Value().user.uuid, "u1");
    EXPECT_EQ(by_access.Value().id, IdOf("access-1"));

    auto cached = store_->GetSessionByAccessToken("access-1");
    ASSERT_TRUE(cached.IsOk()) << cached.GetStatus().Message();
    EXPECT_EQ(cache_->Ttl(SessionKey(IdOf("access-1"))).value_or(0), 800);

    ASSERT_TRUE(store_->DestroySession("access-1").IsOk());
    auto by_refresh = service_->GetSessionByRefreshToken("refresh-1");
    ASSERT_TRUE(by_refresh.IsOk()) << by_refresh.GetStatus().Message();
    EXPECT_TRUE(store_->GetSessionByRefreshToken("refresh-1").IsOk());
}

TEST_F(TokenStorageTest, ExpiredAccessTokenIsNotServedFromPersistentLayer) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1", 60)).IsOk());
    clock_->Advance(61);
    EXPECT_EQ(service_->GetSessionByAccessToken("access-1").GetStatus().Code(), StatusCode::kNotFound);
    // refresh token 仍然有效
    EXPECT_TRUE(service_->GetSessionByRefreshToken("refresh-1").IsOk());
}

TEST_F(TokenStorageTest, RotationInvalidatesSupersededTokens) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    const auto persistent_id =
        store_->GetSessionByAccessToken("access-1").Value().metadata.at(TokenStorageService::kPersistentIdKey);

    auto status = service_->UpdateSessionTokens("refresh-1", Tokens("2"));
    ASSERT_TRUE(status.IsOk()) << status.Message();

    EXPECT_EQ(service_->GetSessionByAccessToken("access-1").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(service_->GetSessionByRefreshToken("refresh-1").GetStatus().Code(), StatusCode::kNotFound);

    auto current = service_->GetSessionByAccessToken("access-2");
    ASSERT_TRUE(current.IsOk()) << current.GetStatus().Message();
    EXPECT_EQ(current.Value().metadata.at(TokenStorageService::kPersistentIdKey), persistent_id);
    EXPECT_TRUE(service_->GetSessionByRefreshToken("refresh-2").IsOk());

    auto row = persistent_->FindById(persistent_id);
    ASSERT_TRUE(row.IsOk());
    EXPECT_EQ(row.Value().access_token, "access-2");
    EXPECT_EQ(persistent_->Size(), 1u);

    EXPECT_FALSE(service_->UpdateSessionTokens("refresh-1", Tokens("3")).IsOk());
}

TEST_F(TokenStorageTest, RotationMarksOldRecordRevokedWhenDeleteFails) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    cache_->FailNextDeletes(1);
    ASSERT_TRUE(service_->UpdateSessionTokens("refresh-1", Tokens("2")).IsOk());

    auto stale = store_->GetSessionByAccessToken("access-1");
    ASSERT_TRUE(stale.IsOk());
    EXPECT_EQ(stale.Value().status, SessionStatus::kRevoked);
    EXPECT_EQ(service_->GetSessionByAccessToken("access-1").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_TRUE(service_->GetSessionByAccessToken("access-2").IsOk());
}

TEST_F(TokenStorageTest, RotationDropsOldSessionWhenRefreshMappingIsGone) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(cache_->Del(RefreshKey(IdOf("refresh-1"))).IsOk());
    ASSERT_TRUE(store_->GetSessionByAccessToken("access-1").IsOk());

    ASSERT_TRUE(service_->UpdateSessionTokens("refresh-1", Tokens("2")).IsOk());
    EXPECT_EQ(store_->GetSessionByAccessToken("access-1").GetStatus().Code(), StatusCode::kNotFound);
    auto rotated = store_->GetSessionByAccessToken("access-2");
    ASSERT_TRUE(rotated.IsOk()) << rotated.GetStatus().Message();
    EXPECT_EQ(rotated.Value().refresh_token, "refresh-2");
    EXPECT_TRUE(service_->Inconsistencies().empty());
}

TEST_F(TokenStorageTest, RevokeCascadesToBothLayers) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(service_->RevokeSession("refresh-1").IsOk());

    EXPECT_FALSE(store_->GetSessionByAccessToken("access-1").IsOk());
    auto row = persistent_->FindByAccessToken("access-1");
    ASSERT_TRUE(row.IsOk());
    EXPECT_EQ(row.Value().status, PersistentStatus::kRevoked);
    EXPECT_EQ(row.Value().revoked_at, clock_->Now());

    EXPECT_EQ(service_->GetSessionByAccessToken("access-1").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(service_->RevokeSession("unknown").Code(), StatusCode::kNotFound);
}

TEST_F(TokenStorageTest, PartialRevokeIsReportedAsInconsistency) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    cache_->FailNextDeletes(1);
    cache_->FailNextSets(1);

    EXPECT_FALSE(service_->RevokeSession("access-1").IsOk());
    auto inconsistencies = service_->Inconsistencies();
    ASSERT_EQ(inconsistencies.size(), 1u);
    EXPECT_EQ(inconsistencies[0].operation, "revoke_session");
    EXPECT_EQ(service_->ValidateStorageConsistency("access-1").Code(), StatusCode::kDataLoss);
}

TEST_F(TokenStorageTest, RevokeAllUserSessions) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(service_->StoreSession(Data("u1", Provider::kOAuth), Tokens("2")).IsOk());
    ASSERT_TRUE(service_->StoreSession(Data("u2"), Tokens("3")).IsOk());

    ASSERT_TRUE(service_->RevokeAllUserSessions("u1").IsOk());

    auto rows = persistent_->ListActiveByUser("u1");
    ASSERT_TRUE(rows.IsOk());
    EXPECT_TRUE(rows.Value().empty());
    auto cached = store_->Query().WhereUser("u1").Count();
    ASSERT_TRUE(cached.IsOk());
    EXPECT_EQ(cached.Value(), 0u);
    EXPECT_TRUE(service_->GetSessionByAccessToken("access-3").IsOk());
}

TEST_F(TokenStorageTest, CleanupAndPurge) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(service_->StoreSession(Data("u2"), Tokens("2")).IsOk());
    ASSERT_TRUE(service_->RevokeSession("access-2").IsOk());

    clock_->Advance(store_->Config().refresh_token_lifetime_seconds + 1);
    auto cleaned = service_->CleanupExpiredSessions();
    ASSERT_TRUE(cleaned.IsOk()) << cleaned.GetStatus().Message();
    EXPECT_EQ(cleaned.Value(), 1u);
    auto row = persistent_->FindByAccessToken("access-1");
    ASSERT_TRUE(row.IsOk());
    EXPECT_EQ(row.Value().status, PersistentStatus::kExpired);

    // 吊销记录已超过保留期, 过期记录尚未超过
    auto purged = service_->PurgeRevokedSessions();
    ASSERT_TRUE(purged.IsOk()) << purged.GetStatus().Message();
    EXPECT_EQ(purged.Value(), 1u);
    EXPECT_EQ(persistent_->Size(), 1u);
}

TEST_F(TokenStorageTest, MaintenanceExpiresCompactsAndPurges) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    ASSERT_TRUE(service_->StoreSession(Data("u2"), Tokens("2")).IsOk());
    ASSERT_TRUE(service_->RevokeSession("access-2").IsOk());

    clock_->Advance(store_->Config().refresh_token_lifetime_seconds + 1);
    auto report = service_->RunMaintenance();
    EXPECT_TRUE(report.Ok());
    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(report.purged, 1u);
    auto row = persistent_->FindByAccessToken("access-1");
    ASSERT_TRUE(row.IsOk());
    EXPECT_EQ(row.Value().status, PersistentStatus::kExpired);
    EXPECT_EQ(persistent_->Size(), 1u);
}

TEST_F(TokenStorageTest, MaintenanceContinuesPastFailingSteps) {
    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    persistent_->SetAvailable(false);

    auto report = service_->RunMaintenance();
    EXPECT_FALSE(report.Ok());
    EXPECT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.expired, 0u);
    EXPECT_EQ(report.purged, 0u);
}

TEST_F(TokenStorageTest, ConsistencyValidation) {
    EXPECT_TRUE(service_->ValidateStorageConsistency("nothing").IsOk());

    ASSERT_TRUE(service_->StoreSession(Data("u1"), Tokens("1")).IsOk());
    EXPECT_TRUE(service_->ValidateStorageConsistency("refresh-1").IsOk());
    EXPECT_TRUE(service_->ValidateStorageConsistency("access-1").IsOk());

    ASSERT_TRUE(store_->DestroySession("access-1").IsOk());
    EXPECT_EQ(service_->ValidateStorageConsistency("refresh-1").Code(), StatusCode::kDataLoss);
}

TEST_F(TokenStorageTest, StorageHealth) {
    auto health = service_->GetStorageHealth();
    EXPECT_EQ(health.cache.status, LayerStatus::kHealthy);
    EXPECT_EQ(health.persistent.status, LayerStatus::kHealthy);
    EXPECT_EQ(health.overall, "healthy");
    EXPECT_GE(health.cache.response_time_ms, 0.0);

    persistent_->SetAvailable(false);
    health = service_->GetStorageHealth();
    EXPECT_EQ(health.persistent.status, LayerStatus::kUnhealthy);
    EXPECT_FALSE(health.persistent.error.empty());
    EXPECT_EQ(health.overall, "degraded");
}

TEST_F(TokenStorageTest, CacheOnlyMode) {
    TokenStorageService cache_only(store_, nullptr);
    EXPECT_FALSE(cache_only.PersistentEnabled());

    ASSERT_TRUE(cache_only.StoreSession(Data("u1"), Tokens("1")).IsOk());
    EXPECT_TRUE(cache_only.GetSessionByAccessToken("access-1").IsOk());
    ASSERT_TRUE(cache_only.UpdateSessionTokens("refresh-1", Tokens("2")).IsOk());
    EXPECT_FALSE(cache_only.GetSessionByAccessToken("access-1").IsOk());
    EXPECT_TRUE(cache_only.ValidateStorageConsistency("access-2").IsOk());
    ASSERT_TRUE(cache_only.RevokeSession("access-2").IsOk());
    EXPECT_FALSE(cache_only.GetSessionByAccessToken("access-2").IsOk());

    auto health = cache_only.GetStorageHealth();
    EXPECT_EQ(health.persistent.status, LayerStatus::kDisabled);
    EXPECT_EQ(health.overall, "healthy");
    EXPECT_EQ(persistent_->Size(), 0u);
}
