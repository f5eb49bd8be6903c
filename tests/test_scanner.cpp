#include <gtest/gtest.h>
#include "cache_manager.hpp"
#include "database.hpp"
#include "scanner.hpp"
#include "test_support.hpp"

#include <chrono>
#include <map>
#include <thread>

using namespace MediaOrganizer;
using namespace MediaOrganizer::testing;

namespace {

/// Answers every read after a short delay, recording how many overlap.
class SlowMetadataProvider : public MetadataProvider {
public:
    MediaMetadata read(const std::filesystem::path&) override {
        int running = ++inFlight;
        int seen = maxInFlight.load();
        while (running > seen && !maxInFlight.compare_exchange_weak(seen, running)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --inFlight;
        return sampleMetadata();
    }

    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
};

} // namespace

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.open(dir / "library.db"));
        cache = std::make_unique<CacheManager>(db, 1 << 20, 0.8, 4);

        media = dir / "share";
        writeFile(media / "movie.mp4", 128);
        writeFile(media / "show" / "pilot.MKV", 64);
        writeFile(media / "broken.avi", 32);
        writeFile(media / "notes.txt", "not media");

        provider.answer("movie.mp4", sampleMetadata(1080, "h264", 5400.0));
        provider.answer("pilot.MKV", sampleMetadata(720, "hevc", 2700.0));
    }

    ScanConfig config() const {
        ScanConfig cfg;
        cfg.workers = 2;
        return cfg;
    }

    /// Every record published by the scanner, in publication order.
    std::vector<FileRecord> drain(Scanner& scanner) {
        std::vector<FileRecord> records;
        while (auto record = scanner.next()) {
            records.push_back(std::move(*record));
        }
        return records;
    }

    TempDir dir;
    Database db;
    std::unique_ptr<CacheManager> cache;
    FakeMetadataProvider provider;
    std::filesystem::path media;
};

TEST_F(ScannerTest, PublishesPendingThenFinalState) {
    Scanner scanner(db, *cache, provider, config());
    scanner.startScan(media);
    auto records = drain(scanner);

    std::map<std::string, std::vector<ScanState>> history;
    for (const auto& record : records) {
        history[record.path.filename().string()].push_back(record.scanState);
    }

    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.count("notes.txt"), 0u);
    for (const auto& [name, states] : history) {
        ASSERT_EQ(states.size(), 2u) << name;
        EXPECT_EQ(states.front(), ScanState::Pending) << name;
    }
    EXPECT_EQ(history["movie.mp4"].back(), ScanState::Enriched);
    EXPECT_EQ(history["pilot.MKV"].back(), ScanState::Enriched);
    EXPECT_EQ(history["broken.avi"].back(), ScanState::Failed);
}

TEST_F(ScannerTest, FailedReadDoesNotAbortScan) {
    Scanner scanner(db, *cache, provider, config());
    scanner.startScan(media);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.listed, 3);
    EXPECT_EQ(summary.enriched, 2);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_FALSE(summary.stopped);

    auto movie = db.getFileByPath(media / "movie.mp4");
    ASSERT_TRUE(movie.has_value());
    EXPECT_EQ(movie->scanState, ScanState::Enriched);
    ASSERT_TRUE(movie->metadata.has_value());
    EXPECT_EQ(movie->metadata->resolutionLabel(), "1080p");

    auto broken = db.getFileByPath(media / "broken.avi");
    ASSERT_TRUE(broken.has_value());
    EXPECT_EQ(broken->scanState, ScanState::Failed);
    EXPECT_FALSE(broken->metadata.has_value());
}

TEST_F(ScannerTest, RescanUpdatesInPlaceWithoutReprobing) {
    Scanner scanner(db, *cache, provider, config());
    scanner.startScan(media);
    scanner.wait();
    int readsAfterFirst = provider.readCount.load();

    scanner.startScan(media);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(db.getTotalFileCount(), 3);
    EXPECT_EQ(summary.enriched, 2);
    // Only the failed file is read again
    EXPECT_EQ(provider.readCount.load(), readsAfterFirst + 1);
}

TEST_F(ScannerTest, MissingFilesBecomeStale) {
    Scanner scanner(db, *cache, provider, config());
    scanner.startScan(media);
    scanner.wait();

    std::filesystem::remove(media / "movie.mp4");
    scanner.startScan(media);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.stale, 1);
    EXPECT_EQ(db.getFileByPath(media / "movie.mp4")->scanState, ScanState::Stale);
    EXPECT_EQ(db.getTotalFileCount(), 3);
}

TEST_F(ScannerTest, NonRecursiveScanSkipsSubdirectories) {
    Scanner scanner(db, *cache, provider, config());
    scanner.startScan(media, false);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.listed, 2);
    EXPECT_FALSE(db.getFileByPath(media / "show" / "pilot.MKV").has_value());
}

TEST_F(ScannerTest, ResumeEnrichesPendingRecords) {
    auto pending = statFileRecord(media / "movie.mp4");
    ASSERT_TRUE(pending.has_value());
    ASSERT_TRUE(db.upsertFile(*pending));

    Scanner scanner(db, *cache, provider, config());
    scanner.resumePending();
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.enriched, 1);
    EXPECT_EQ(db.getFileByPath(media / "movie.mp4")->scanState, ScanState::Enriched);
    EXPECT_TRUE(db.getFilesByState(ScanState::Pending).empty());
}

TEST_F(ScannerTest, ProgressReachesTotal) {
    Scanner scanner(db, *cache, provider, config());
    std::atomic<int> calls{0};
    scanner.setProgressCallback([&calls](int, int) {
        ++calls;
    });
    scanner.startScan(media);
    scanner.wait();

    auto [done, total] = scanner.getProgress();
    EXPECT_EQ(total, 3);
    EXPECT_EQ(done, 3);
    EXPECT_EQ(calls.load(), 3);
    EXPECT_TRUE(scanner.isComplete());
}

TEST_F(ScannerTest, ExtensionMatchIsCaseInsensitive) {
    ScanConfig cfg = config();
    cfg.extensions = {"MKV", ".mp4"};
    Scanner scanner(db, *cache, provider, cfg);

    EXPECT_TRUE(scanner.isMediaFile("/a/b.mkv"));
    EXPECT_TRUE(scanner.isMediaFile("/a/b.Mp4"));
    EXPECT_FALSE(scanner.isMediaFile("/a/b.avi"));
    EXPECT_FALSE(scanner.isMediaFile("/a/mkv"));
}

TEST_F(ScannerTest, HoldingAreaIsNotScanned) {
    writeFile(media / ".media-organizer-trash" / "1" / "held.mp4", 16);
    writeFile(media / "show" / ".media-organizer-trash" / "2" / "old-pilot.mkv", 16);

    Scanner scanner(db, *cache, provider, config(), ".media-organizer-trash");
    scanner.startScan(media);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.listed, 3);
    EXPECT_EQ(db.getTotalFileCount(), 3);
    EXPECT_FALSE(db.getFileByPath(media / ".media-organizer-trash" / "1" / "held.mp4").has_value());
    EXPECT_TRUE(db.getFilesUnder(media / "show" / ".media-organizer-trash").empty());
}

TEST_F(ScannerTest, WorkerPoolBoundsConcurrentReads) {
    for (int i = 0; i < 6; ++i) {
        writeFile(media / ("episode" + std::to_string(i) + ".mkv"), 16);
    }

    SlowMetadataProvider slow;
    ScanConfig cfg = config();
    cfg.workers = 2;
    Scanner scanner(db, *cache, slow, cfg);
    scanner.startScan(media);
    ScanSummary summary = scanner.wait();

    EXPECT_EQ(summary.enriched, 9);
    EXPECT_GE(slow.maxInFlight.load(), 1);
    EXPECT_LE(slow.maxInFlight.load(), 2);
}
