#include <gtest/gtest.h>

#include "cache/memory_cache_store.hpp"
#include "common/clock.hpp"
#include "core/session/session_keys.hpp"
#include "core/session/session_store.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace vault::core;
using vault::cache::InMemoryCacheStore;
using vault::common::ManualClock;
using vault::common::StatusCode;

class SessionIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        cache_ = std::make_shared<InMemoryCacheStore>(clock_);
        store_ = std::make_shared<SessionStore>(cache_, nullptr, vault::common::SessionConfig(), clock_);
    }

    std::string Store(const std::string& token, Provider provider, const std::string& user,
                      const std::string& role = "member") {
        UserSnapshot snapshot;
        snapshot.uuid = user;
        snapshot.role = role;
        auto status = store_->StoreSession(snapshot, token, provider);
        EXPECT_TRUE(status.IsOk()) << status.Message();
        return store_->Issuer()->SessionIdFromToken(token);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryCacheStore> cache_;
    std::shared_ptr<SessionStore> store_;
};

TEST_F(SessionIndexTest, StoredSessionsAppearInBothIndexes) {
    auto a = Store("tok-a", Provider::kJwt, "u1");
    auto b = Store("tok-b", Provider::kOAuth, "u1");
    auto c = Store("tok-c", Provider::kJwt, "u2");

    auto jwt = store_->Index().ProviderMembers(Provider::kJwt);
    ASSERT_TRUE(jwt.IsOk()) << jwt.GetStatus().Message();
    EXPECT_EQ(jwt.Value().size(), 2u);

    auto u1 = store_->Query().WhereUser("u1").Get();
    ASSERT_TRUE(u1.IsOk()) << u1.GetStatus().Message();
    ASSERT_EQ(u1.Value().size(), 2u);

    auto jwt_u2 = store_->Query().WhereProvider(Provider::kJwt).WhereUser("u2").Get();
    ASSERT_TRUE(jwt_u2.IsOk());
    ASSERT_EQ(jwt_u2.Value().size(), 1u);
    EXPECT_EQ(jwt_u2.Value().front().id, c);
    (void)a;
    (void)b;
}

TEST_F(SessionIndexTest, EntriesExpireWithTheirRecords) {
    Store("tok-a", Provider::kJwt, "u1");
    clock_->Advance(3600);

    auto members = store_->Index().ProviderMembers(Provider::kJwt);
    ASSERT_TRUE(members.IsOk());
    EXPECT_TRUE(members.Value().empty());
    EXPECT_FALSE(cache_->Get(ProviderIndexKey(Provider::kJwt)).IsOk());
}

TEST_F(SessionIndexTest, QueryFiltersOrdersAndPages) {
    Store("tok-1", Provider::kJwt, "u1", "admin");
    clock_->Advance(10);
    Store("tok-2", Provider::kJwt, "u2", "member");
    clock_->Advance(10);
    Store("tok-3", Provider::kApiKey, "u3", "admin");

    auto admins = store_->Query().WhereUserRole("admin").Count();
    ASSERT_TRUE(admins.IsOk());
    EXPECT_EQ(admins.Value(), 2u);

    auto newest = store_->Query().OrderByLastActivity(true).First();
    ASSERT_TRUE(newest.IsOk()) << newest.GetStatus().Message();
    EXPECT_EQ(newest.Value().access_token, "tok-3");

    auto paged = store_->Query().OrderByLastActivity().Offset(1).Limit(1).Get();
    ASSERT_TRUE(paged.IsOk());
    ASSERT_EQ(paged.Value().size(), 1u);
    EXPECT_EQ(paged.Value().front().access_token, "tok-2");

    auto idle = store_->Query().WhereLastActivityOlderThan(15).Get();
    ASSERT_TRUE(idle.IsOk());
    ASSERT_EQ(idle.Value().size(), 1u);
    EXPECT_EQ(idle.Value().front().access_token, "tok-1");

    auto both = store_->Query().WhereProviderIn({Provider::kJwt, Provider::kApiKey}).Count();
    ASSERT_TRUE(both.IsOk());
    EXPECT_EQ(both.Value(), 3u);
}

class SessionQueryPredicateTest : public SessionIndexTest {
protected:
    std::string StoreDetailed(const std::string& token, const std::string& user, const std::string& role,
                              std::vector<std::string> roles, std::vector<std::string> permissions,
                              const std::string& ip, const std::string& agent) {
        UserSnapshot snapshot;
        snapshot.uuid = user;
        snapshot.role = role;
        snapshot.roles = std::move(roles);
        snapshot.permissions = std::move(permissions);
        StoreOptions options;
        options.ip_address = ip;
        options.user_agent = agent;
        auto status = store_->StoreSession(snapshot, token, Provider::kJwt, options);
        EXPECT_TRUE(status.IsOk()) << status.Message();
        return store_->Issuer()->SessionIdFromToken(token);
    }

    std::vector<std::string> Ids(SessionQuery query) {
        auto result = query.Get();
        EXPECT_TRUE(result.IsOk()) << result.GetStatus().Message();
        std::vector<std::string> ids;
        if (result.IsOk()) {
            for (const auto& record : result.Value()) {
                ids.push_back(record.id);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    static std::vector<std::string> Sorted(std::vector<std::string> ids) {
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    void SetUp() override {
        SessionIndexTest::SetUp();
        alice_ = StoreDetailed("tok-alice", "u1", "admin", {"editor"}, {"sessions.revoke", "users.read"},
                               "192.168.1.10", "Mozilla/5.0 (X11; Linux) Firefox/120");
        bob_ = StoreDetailed("tok-bob", "u2", "member", {"editor", "auditor"}, {"users.read"},
                             "10.0.0.7", "curl/8.4.0");
        carol_ = StoreDetailed("tok-carol", "u3", "member", {}, {}, "", "");
    }

    std::string alice_;
    std::string bob_;
    std::string carol_;
};

TEST_F(SessionQueryPredicateTest, MatchesPermissionsAndRoleSets) {
    EXPECT_EQ(Ids(store_->Query().WhereUserHasPermission("sessions.revoke")), std::vector<std::string>{alice_});
    EXPECT_EQ(Ids(store_->Query().WhereUserHasPermission("users.read")), Sorted({alice_, bob_}));
    EXPECT_EQ(Ids(store_->Query().WhereUserHasAnyRole({"auditor", "admin"})), Sorted({alice_, bob_}));
    EXPECT_TRUE(Ids(store_->Query().WhereUserHasAnyRole({})).empty());
    EXPECT_EQ(Ids(store_->Query().WhereUserHasAllRoles({"editor", "auditor"})), std::vector<std::string>{bob_});
    EXPECT_EQ(Ids(store_->Query().WhereUserHasAllRoles({"member", "editor"})), std::vector<std::string>{bob_});
}

TEST_F(SessionQueryPredicateTest, MatchesUserSets) {
    EXPECT_EQ(Ids(store_->Query().WhereUserIn({"u1", "u3", "nobody"})), Sorted({alice_, carol_}));
    EXPECT_TRUE(Ids(store_->Query().WhereUserIn({})).empty());
}

TEST_F(SessionQueryPredicateTest, MatchesIpAddressAndUserAgent) {
    EXPECT_EQ(Ids(store_->Query().WhereIpAddress("10.0.0.7")), std::vector<std::string>{bob_});
    EXPECT_EQ(Ids(store_->Query().WhereIpAddressLike("192.168.*")), std::vector<std::string>{alice_});
    EXPECT_EQ(Ids(store_->Query().WhereIpAddressLike("*")), Sorted({alice_, bob_}));
    EXPECT_EQ(Ids(store_->Query().WhereUserAgentLike("firefox")), std::vector<std::string>{alice_});
    EXPECT_EQ(Ids(store_->Query().WhereUserAgentLike("CURL")), std::vector<std::string>{bob_});
}

TEST_F(SessionQueryPredicateTest, OrGroupIsCombinedWithOtherConditions) {
    auto either = store_->Query().OrWhere([](SessionQuery& q) {
        q.WhereUserRole("admin").WhereIpAddress("10.0.0.7");
    });
    EXPECT_EQ(Ids(either), Sorted({alice_, bob_}));

    auto narrowed = store_->Query().WhereUserHasPermission("users.read").OrWhere([](SessionQuery& q) {
        q.WhereUser("u2").WhereUser("u3");
    });
    EXPECT_EQ(Ids(narrowed), std::vector<std::string>{bob_});

    auto empty_group = store_->Query().OrWhere([](SessionQuery&) {});
    EXPECT_EQ(Ids(empty_group), Sorted({alice_, bob_, carol_}));
}

TEST_F(SessionIndexTest, FirstOnEmptyResultIsNotFound) {
    auto first = store_->Query().WhereProvider(Provider::kSaml).First();
    EXPECT_EQ(first.GetStatus().Code(), StatusCode::kNotFound);
    auto exists = store_->Query().WhereProvider(Provider::kSaml).Exists();
    ASSERT_TRUE(exists.IsOk());
    EXPECT_FALSE(exists.Value());
}

TEST_F(SessionIndexTest, OrphanEntriesAreSkippedAndCompacted) {
    auto a = Store("tok-a", Provider::kJwt, "u1");
    Store("tok-b", Provider::kJwt, "u1");
    ASSERT_TRUE(cache_->Del(SessionKey(a)).IsOk());

    auto live = store_->Query().WhereProvider(Provider::kJwt).Count();
    ASSERT_TRUE(live.IsOk());
    EXPECT_EQ(live.Value(), 1u);

    auto dropped = store_->Index().Compact(Provider::kJwt);
    ASSERT_TRUE(dropped.IsOk()) << dropped.GetStatus().Message();
    EXPECT_EQ(dropped.Value(), 1u);

    auto members = store_->Index().ProviderMembers(Provider::kJwt);
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value().size(), 1u);
}

TEST_F(SessionIndexTest, MalformedIndexIsTreatedAsEmpty) {
    ASSERT_TRUE(cache_->SetEx(ProviderIndexKey(Provider::kJwt), "{broken", 0).IsOk());
    auto members = store_->Index().ProviderMembers(Provider::kJwt);
    ASSERT_TRUE(members.IsOk());
    EXPECT_TRUE(members.Value().empty());

    Store("tok-a", Provider::kJwt, "u1");
    members = store_->Index().ProviderMembers(Provider::kJwt);
    ASSERT_TRUE(members.IsOk());
    EXPECT_EQ(members.Value().size(), 1u);
}
