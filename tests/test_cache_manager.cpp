#include <gtest/gtest.h>
#include "cache_manager.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <thread>

using namespace MediaOrganizer;
using namespace MediaOrganizer::testing;

namespace {

CacheGenerator bytes(size_t size, uint8_t fill = 0xAB, int* calls = nullptr) {
    return [size, fill, calls]() {
        if (calls) ++*calls;
        return std::vector<uint8_t>(size, fill);
    };
}

} // namespace

class CacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.open(dir / "library.db"));
    }

    TempDir dir;
    Database db;
};

TEST_F(CacheManagerTest, MissGeneratesHitReuses) {
    CacheManager cache(db, 1000, 0.8, 4);
    int calls = 0;

    auto first = cache.getOrCreate("thumb:a", bytes(100, 1, &calls));
    auto second = cache.getOrCreate("thumb:a", bytes(100, 2, &calls));

    EXPECT_EQ(calls, 1);
    ASSERT_EQ(second->size(), 100u);
    EXPECT_EQ((*second)[0], 1);
    EXPECT_EQ(cache.stats().entryCount, 1u);
    EXPECT_EQ(cache.stats().totalBytes, 100u);
}

TEST_F(CacheManagerTest, EvictsLeastRecentlyUsedDownToWatermark) {
    CacheManager cache(db, 1000, 0.7, 64);
    cache.getOrCreate("a", bytes(300));
    cache.getOrCreate("b", bytes(300));
    cache.getOrCreate("c", bytes(300));

    // Touch "a" so "b" becomes the oldest
    cache.getOrCreate("a", bytes(300));

    // 1200 > 1000: evict until total <= 700
    cache.getOrCreate("d", bytes(300));

    EXPECT_TRUE(cache.contains("d"));
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_FALSE(cache.contains("c"));
    EXPECT_EQ(cache.stats().totalBytes, 600u);
}

TEST_F(CacheManagerTest, TotalNeverExceedsMaxAfterInserts) {
    CacheManager cache(db, 2048, 0.8, 8);
    for (int i = 0; i < 50; ++i) {
        cache.getOrCreate("k" + std::to_string(i), bytes(100 + (i * 37) % 400));
        if (i % 3 == 0) cache.getOrCreate("k" + std::to_string(i / 2), bytes(100));
        EXPECT_LE(cache.stats().totalBytes, 2048u);
    }
}

TEST_F(CacheManagerTest, OversizedPayloadReturnedButNotCached) {
    CacheManager cache(db, 100, 0.8, 4);
    auto payload = cache.getOrCreate("huge", bytes(500));

    EXPECT_EQ(payload->size(), 500u);
    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_EQ(cache.stats().totalBytes, 0u);
}

TEST_F(CacheManagerTest, GeneratorFailureStoresNothing) {
    CacheManager cache(db, 1000, 0.8, 4);
    try {
        cache.getOrCreate("thumb:broken", []() -> std::vector<uint8_t> {
            throw std::runtime_error("ffmpeg exited with 1");
        });
        FAIL() << "expected CacheGeneration";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CacheGeneration);
    }
    EXPECT_FALSE(cache.contains("thumb:broken"));
    EXPECT_FALSE(db.getCachePayload("thumb:broken").has_value());
}

TEST_F(CacheManagerTest, ReadHandleSurvivesEviction) {
    CacheManager cache(db, 200, 0.5, 4);
    CachePayload held = cache.getOrCreate("a", bytes(150, 7));
    cache.getOrCreate("b", bytes(150));

    EXPECT_FALSE(cache.contains("a"));
    ASSERT_EQ(held->size(), 150u);
    EXPECT_EQ((*held)[149], 7);
}

TEST_F(CacheManagerTest, PruneReachesTargetRatio) {
    CacheManager cache(db, 1000, 0.8, 4);
    for (int i = 0; i < 9; ++i) {
        cache.getOrCreate("k" + std::to_string(i), bytes(100));
    }
    cache.prune(0.3);
    EXPECT_LE(cache.stats().totalBytes, 300u);
    EXPECT_TRUE(cache.contains("k8"));
    EXPECT_FALSE(cache.contains("k0"));
}

TEST_F(CacheManagerTest, RecencySurvivesReload) {
    {
        CacheManager cache(db, 1000, 0.7, 64);
        cache.getOrCreate("a", bytes(300));
        cache.getOrCreate("b", bytes(300));
        cache.getOrCreate("c", bytes(300));
        cache.getOrCreate("a", bytes(300));
        // Destructor flushes the buffered touch of "a"
    }

    CacheManager reloaded(db, 1000, 0.7, 64);
    reloaded.load();
    EXPECT_EQ(reloaded.stats().entryCount, 3u);
    EXPECT_EQ(reloaded.stats().totalBytes, 900u);

    reloaded.getOrCreate("d", bytes(300));
    EXPECT_TRUE(reloaded.contains("a"));
    EXPECT_TRUE(reloaded.contains("d"));
    EXPECT_FALSE(reloaded.contains("b"));
}

TEST_F(CacheManagerTest, HitAfterReloadReadsPayloadFromStore) {
    {
        CacheManager cache(db, 1000, 0.8, 4);
        cache.getOrCreate("meta:x", bytes(40, 9));
    }

    CacheManager reloaded(db, 1000, 0.8, 4);
    reloaded.load();
    int calls = 0;
    auto payload = reloaded.getOrCreate("meta:x", bytes(40, 1, &calls));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ((*payload)[0], 9);
}

TEST_F(CacheManagerTest, LoadPrunesWhenBudgetShrank) {
    {
        CacheManager cache(db, 1000, 0.8, 4);
        for (int i = 0; i < 5; ++i) cache.getOrCreate("k" + std::to_string(i), bytes(100));
    }

    CacheManager smaller(db, 200, 0.5, 4);
    smaller.load();
    EXPECT_LE(smaller.stats().totalBytes, 100u);
}

TEST_F(CacheManagerTest, ConcurrentCallersKeepInvariant) {
    CacheManager cache(db, 4096, 0.8, 16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 40; ++i) {
                cache.getOrCreate("k" + std::to_string((i * 7 + t) % 60), bytes(200));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_LE(cache.stats().totalBytes, 4096u);
}

TEST_F(CacheManagerTest, LoadRemovesLeftoverTempFiles) {
    fs::path work = dir / "work";
    writeFile(work / "a.tmp", "partial");
    writeFile(work / "sub" / "b.tmp", "partial");
    writeFile(work / "keep.png", "frame");

    CacheManager cache(db, 1000, 0.8, 4, work);
    cache.load();

    EXPECT_FALSE(fs::exists(work / "a.tmp"));
    EXPECT_FALSE(fs::exists(work / "sub" / "b.tmp"));
    EXPECT_TRUE(fs::exists(work / "keep.png"));
    EXPECT_EQ(cache.purgeTempFiles(), 0);
}
