#include <gtest/gtest.h>
#include "cache/projection_cache_manager.h"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace prism::cache;
using prism::config::ProjectionConfig;
using json = nlohmann::ordered_json;

class ProjectionCacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.default_ttl_seconds = 60;
        config_.collection_ttl_seconds = 10;
        config_.max_entries = 100;
    }

    ProjectionConfig::CacheConfig config_;
    json doc_ = {{"id", 1}, {"name", "Ada"}};
};

// ============================================================================
// Lookup / store
// ============================================================================

TEST_F(ProjectionCacheManagerTest, PutThenGet) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");

    EXPECT_EQ(cache.get(key), nullptr);
    auto stored = cache.put(key, doc_);
    ASSERT_NE(stored, nullptr);

    auto hit = cache.get(key);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->getFullResponse(), doc_);
    EXPECT_EQ(hit, stored);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ProjectionCacheManagerTest, RewriteReplacesEntry) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    cache.put(key, doc_);
    cache.put(key, json{{"id", 2}});
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(key)->getFullResponse()["id"], 2);
}

TEST_F(ProjectionCacheManagerTest, ExpiresAfterTtl) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/short");
    cache.put(key, doc_, 1);
    EXPECT_NE(cache.get(key), nullptr);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_EQ(cache.get(key), nullptr);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.getStats().expirations, 1u);
}

TEST_F(ProjectionCacheManagerTest, EffectiveTtl) {
    ProjectionCacheManager cache(config_);
    EXPECT_EQ(cache.effectiveTtlSeconds(-1, false), 60);
    EXPECT_EQ(cache.effectiveTtlSeconds(0, true), 10);
    EXPECT_EQ(cache.effectiveTtlSeconds(30, true), 30);
    // Hard cap is 2 x default
    EXPECT_EQ(cache.effectiveTtlSeconds(1000, false), 120);

    config_.hard_ttl_seconds = 45;
    ProjectionCacheManager capped(config_);
    EXPECT_EQ(capped.effectiveTtlSeconds(-1, false), 45);
}

TEST_F(ProjectionCacheManagerTest, EntryExpiryReflectsTtl) {
    ProjectionCacheManager cache(config_);
    auto entry = cache.put(CacheKey::of("GET", "/list"), json::array(), -1, true);
    ASSERT_NE(entry, nullptr);
    auto ttl = std::chrono::duration_cast<std::chrono::seconds>(entry->getExpiresAt() - entry->getCachedAt());
    EXPECT_EQ(ttl.count(), 10);
}

TEST_F(ProjectionCacheManagerTest, DisabledCacheIsNoOp) {
    config_.enabled = false;
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    EXPECT_EQ(cache.put(key, doc_), nullptr);
    EXPECT_EQ(cache.get(key), nullptr);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.evict(key));
    EXPECT_EQ(cache.evictByPathPattern("/users/{id}"), 0u);
}

TEST_F(ProjectionCacheManagerTest, CapacityDropsEarliestExpiry) {
    config_.max_entries = 2;
    ProjectionCacheManager cache(config_);
    auto a = CacheKey::of("GET", "/a");
    auto b = CacheKey::of("GET", "/b");
    auto c = CacheKey::of("GET", "/c");

    cache.put(a, doc_, 50);
    cache.put(b, doc_, 5);
    cache.put(c, doc_, 50);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_NE(cache.get(a), nullptr);
    EXPECT_EQ(cache.get(b), nullptr);
    EXPECT_NE(cache.get(c), nullptr);
}

TEST_F(ProjectionCacheManagerTest, ConcurrentPutAndGet) {
    ProjectionCacheManager cache(config_);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = CacheKey::of("GET", "/items/" + std::to_string(i % 20), "t=" + std::to_string(t));
                cache.put(key, json{{"i", i}});
                auto entry = cache.get(key);
                EXPECT_NE(entry, nullptr);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(cache.size(), 80u);
}

// ============================================================================
// Conditional validators
// ============================================================================

TEST_F(ProjectionCacheManagerTest, EtagForms) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    auto entry = cache.put(key, doc_);
    ASSERT_TRUE(entry->getEtag().has_value());
    const std::string tag = *entry->getEtag();
    EXPECT_EQ(tag.size(), 64u);

    EXPECT_TRUE(cache.validateEtag(key, tag));
    EXPECT_TRUE(cache.validateEtag(key, "\"" + tag + "\""));
    EXPECT_TRUE(cache.validateEtag(key, "W/\"" + tag + "\""));
    EXPECT_TRUE(cache.validateEtag(key, "\"other\", \"" + tag + "\""));
    EXPECT_TRUE(cache.validateEtag(key, "*"));
    EXPECT_FALSE(cache.validateEtag(key, "\"other\""));
    EXPECT_FALSE(cache.validateEtag(key, ""));
    EXPECT_FALSE(cache.validateEtag(CacheKey::of("GET", "/absent"), tag));
}

TEST_F(ProjectionCacheManagerTest, EtagIsContentHash) {
    EXPECT_EQ(ProjectionCacheManager::generateEtag(doc_), ProjectionCacheManager::generateEtag(doc_));
    EXPECT_NE(ProjectionCacheManager::generateEtag(doc_), ProjectionCacheManager::generateEtag(json{{"id", 2}}));
    // SHA-256 of "{}"
    EXPECT_EQ(ProjectionCacheManager::generateEtag(json::object()),
              "44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a");
}

TEST_F(ProjectionCacheManagerTest, EtagToleratesInvalidUtf8) {
    ProjectionCacheManager cache(config_);
    json latin1 = {{"name", std::string("caf\xE9")}};
    EXPECT_NO_THROW(ProjectionCacheManager::generateEtag(latin1));
    EXPECT_EQ(ProjectionCacheManager::generateEtag(latin1).size(), 64u);

    auto entry = cache.put(CacheKey::of("GET", "/users/9"), latin1);
    ASSERT_NE(entry, nullptr);
    ASSERT_TRUE(entry->getEtag().has_value());
    EXPECT_EQ(entry->getEtag()->size(), 64u);
}

TEST_F(ProjectionCacheManagerTest, ValidatorsLeaveHitStatsAlone) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    auto entry = cache.put(key, doc_);

    EXPECT_TRUE(cache.validateEtag(key, *entry->getEtag()));
    EXPECT_TRUE(cache.validateLastModified(key, *entry->getLastModified()));
    EXPECT_FALSE(cache.validateEtag(CacheKey::of("GET", "/absent"), "*"));

    auto stats = cache.getStats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
}

TEST_F(ProjectionCacheManagerTest, StoresContentType) {
    ProjectionCacheManager cache(config_);
    auto plain = cache.put(CacheKey::of("GET", "/a"), doc_);
    auto problem = cache.put(CacheKey::of("GET", "/b"), doc_, -1, false, "application/problem+json");
    EXPECT_EQ(plain->getContentType(), "application/json");
    EXPECT_EQ(cache.get(CacheKey::of("GET", "/b"))->getContentType(), "application/problem+json");
    EXPECT_EQ(problem->getContentType(), "application/problem+json");
}

TEST_F(ProjectionCacheManagerTest, NormalizeEtag) {
    EXPECT_EQ(ProjectionCacheManager::normalizeEtag(" W/\"abc\" "), "abc");
    EXPECT_EQ(ProjectionCacheManager::normalizeEtag("\"abc\""), "abc");
    EXPECT_EQ(ProjectionCacheManager::normalizeEtag("abc"), "abc");
    EXPECT_FALSE(ProjectionCacheManager::normalizeEtag("   ").has_value());
}

TEST_F(ProjectionCacheManagerTest, LastModified) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    auto entry = cache.put(key, doc_);
    ASSERT_TRUE(entry->getLastModified().has_value());
    auto lm = *entry->getLastModified();

    EXPECT_TRUE(cache.validateLastModified(key, lm));
    EXPECT_TRUE(cache.validateLastModified(key, lm + std::chrono::seconds(5)));
    EXPECT_FALSE(cache.validateLastModified(key, lm - std::chrono::seconds(1)));
}

TEST_F(ProjectionCacheManagerTest, ConditionalDisabled) {
    config_.conditional.enabled = false;
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/users/1");
    auto entry = cache.put(key, doc_);
    EXPECT_FALSE(entry->hasConditionalHeaders());
    EXPECT_FALSE(cache.validateEtag(key, "*"));
}

// ============================================================================
// Eviction
// ============================================================================

TEST_F(ProjectionCacheManagerTest, ExactPathEviction) {
    ProjectionCacheManager cache(config_);
    cache.put(CacheKey::of("GET", "/users/1"), doc_);
    cache.put(CacheKey::of("HEAD", "/users/1"), doc_);
    cache.put(CacheKey::of("GET", "/users/2"), doc_);
    cache.put(CacheKey::of("GET", "/users/1", "", std::string("alice")), doc_);

    EXPECT_EQ(cache.evictByPathPattern("/users/1"), 2u);
    EXPECT_EQ(cache.get(CacheKey::of("GET", "/users/1")), nullptr);
    EXPECT_NE(cache.get(CacheKey::of("GET", "/users/2")), nullptr);
    EXPECT_NE(cache.get(CacheKey::of("GET", "/users/1", "", std::string("alice"))), nullptr);
}

TEST_F(ProjectionCacheManagerTest, PlaceholderEviction) {
    ProjectionCacheManager cache(config_);
    cache.put(CacheKey::of("GET", "/users/1"), doc_);
    cache.put(CacheKey::of("GET", "/users/2", "fields=x"), doc_);
    cache.put(CacheKey::of("GET", "/users/3", "", std::string("bob")), doc_);
    cache.put(CacheKey::of("GET", "/users"), doc_);
    cache.put(CacheKey::of("GET", "/users/1/orders"), doc_);

    EXPECT_EQ(cache.evictByPathPattern("/users/{id}"), 3u);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_NE(cache.get(CacheKey::of("GET", "/users")), nullptr);
    EXPECT_NE(cache.get(CacheKey::of("GET", "/users/1/orders")), nullptr);
}

TEST_F(ProjectionCacheManagerTest, PatternLiteralsAreEscaped) {
    ProjectionCacheManager cache(config_);
    cache.put(CacheKey::of("GET", "/v1.0/items/9"), doc_);
    cache.put(CacheKey::of("GET", "/v1x0/items/9"), doc_);
    EXPECT_EQ(cache.evictByPathPattern("/v1.0/items/{id}"), 1u);
    EXPECT_NE(cache.get(CacheKey::of("GET", "/v1x0/items/9")), nullptr);
}

TEST_F(ProjectionCacheManagerTest, ManualEvictionDisabled) {
    config_.manual_eviction.enabled = false;
    ProjectionCacheManager cache(config_);
    cache.put(CacheKey::of("GET", "/users/1"), doc_);
    EXPECT_EQ(cache.evictByPathPattern("/users/{id}"), 0u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ProjectionCacheManagerTest, EvictSingleAndAll) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/a");
    cache.put(key, doc_);
    cache.put(CacheKey::of("GET", "/b"), doc_);

    EXPECT_TRUE(cache.evict(key));
    EXPECT_FALSE(cache.evict(key));
    cache.evictAll();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.getStats().evictions, 2u);
}

TEST_F(ProjectionCacheManagerTest, BuildPathRegex) {
    EXPECT_EQ(ProjectionCacheManager::buildPathRegex("/users/{id}"), "^/users/(?<id>[^/]+)$");
    EXPECT_EQ(ProjectionCacheManager::buildPathRegex("/a/{id}/b/{id}"),
              "^/a/(?<id>[^/]+)/b/(?<id2>[^/]+)$");
    EXPECT_EQ(ProjectionCacheManager::buildPathRegex("/x/{-}"), "^/x/([^/]+)$");
    EXPECT_EQ(ProjectionCacheManager::buildPathRegex("/v1.0"), "^/v1\\.0$");
}

TEST_F(ProjectionCacheManagerTest, SanitizeGroupName) {
    EXPECT_EQ(ProjectionCacheManager::sanitizeGroupName("user_id"), "userid");
    EXPECT_EQ(ProjectionCacheManager::sanitizeGroupName("1st"), "p1st");
    EXPECT_FALSE(ProjectionCacheManager::sanitizeGroupName("--").has_value());
}

// ============================================================================
// Stats
// ============================================================================

TEST_F(ProjectionCacheManagerTest, Stats) {
    ProjectionCacheManager cache(config_);
    auto key = CacheKey::of("GET", "/a");
    cache.get(key);
    cache.put(key, doc_);
    cache.get(key);
    cache.get(key);

    auto stats = cache.getStats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.puts, 1u);
    EXPECT_EQ(stats.entries, 1u);

    auto j = stats.toJson();
    EXPECT_NEAR(j["hit_rate"].get<double>(), 2.0 / 3.0, 1e-9);
}
