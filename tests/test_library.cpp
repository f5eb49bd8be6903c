#include <gtest/gtest.h>
#include "library.hpp"
#include "scanner.hpp"
#include "thumbnail_generator.hpp"
#include "test_support.hpp"

#include <sqlite3.h>

using namespace MediaOrganizer;
using namespace MediaOrganizer::testing;

class LibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        share = dir / "share";
        writeFile(share / "movie.mp4", "frames");
        writeFile(share / "trailer.mkv", "short");
    }

    Config makeConfig() const {
        Config cfg = Config::defaults();
        cfg.databasePath = dir / "data" / "library.db";
        cfg.cache.workDir = dir / "cache";
        cfg.cache.maxSizeBytes = 1 << 20;
        cfg.logging.level = "warn";
        return cfg;
    }

    std::unique_ptr<Library> openLibrary() {
        auto provider = std::make_unique<FakeMetadataProvider>();
        provider->answer("movie.mp4", sampleMetadata(1080, "h264", 5400.0));
        provider->answer("trailer.mkv", sampleMetadata(2160, "hevc", 150.0));

        auto library = std::make_unique<Library>(makeConfig(), std::make_unique<FakeFilesystem>(),
                                                 std::move(provider));
        EXPECT_TRUE(library->open());
        return library;
    }

    TempDir dir;
    std::filesystem::path share;
};

TEST_F(LibraryTest, StagePreviewCommitUndo) {
    auto library = openLibrary();
    library->scan(share).wait();

    StageOutcome outcome = library->stage(share / "movie.mp4", OperationKind::Rename,
                                          "{filename}_{resolution}", true);
    EXPECT_EQ(outcome.preview.name, "movie_1080p.mp4");
    EXPECT_FALSE(outcome.operation.has_value());

    library->stage(share / "movie.mp4", OperationKind::Rename, "{filename}_{resolution}");
    auto open = library->activeDraft();
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->operations().size(), 1u);

    BatchResult committed = library->commit();
    ASSERT_EQ(committed.succeeded.size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(share / "movie_1080p.mp4"));
    EXPECT_FALSE(library->activeDraft().has_value());
    EXPECT_EQ(library->undoableBatch(), committed.batchId);

    BatchResult undone = library->undo();
    EXPECT_EQ(undone.batchId, committed.batchId);
    EXPECT_EQ(readFile(share / "movie.mp4"), "frames");
    EXPECT_FALSE(std::filesystem::exists(share / "movie_1080p.mp4"));
    EXPECT_THROW(library->undo(), MediaError);
}

TEST_F(LibraryTest, RenamedRecordKeepsMetadata) {
    auto library = openLibrary();
    library->scan(share).wait();

    library->stage(share / "trailer.mkv", OperationKind::Rename, "{filename} [{codec}]");
    library->commit();

    auto renamed = library->record(share / "trailer [hevc].mkv");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed->scanState, ScanState::Enriched);
    ASSERT_TRUE(renamed->metadata.has_value());
    EXPECT_EQ(renamed->metadata->resolutionLabel(), "2160p");
    EXPECT_FALSE(library->record(share / "trailer.mkv").has_value());
}

TEST_F(LibraryTest, OpeningDraftRevokesUndo) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Rename, "renamed");
    BatchResult committed = library->commit();
    ASSERT_EQ(library->undoableBatch(), committed.batchId);

    library->stage(share / "trailer.mkv", OperationKind::Rename, "other");
    EXPECT_FALSE(library->undoableBatch().has_value());

    try {
        library->undo(committed.batchId);
        FAIL() << "expected StaleBatch";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StaleBatch);
    }
}

TEST_F(LibraryTest, DiscardLeavesDiskUntouched) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Delete, "");
    ASSERT_TRUE(library->activeDraft().has_value());

    EXPECT_TRUE(library->discardDraft());
    EXPECT_FALSE(library->activeDraft().has_value());
    EXPECT_TRUE(std::filesystem::exists(share / "movie.mp4"));

    try {
        library->commit();
        FAIL() << "expected InvalidBatchState";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidBatchState);
    }
}

TEST_F(LibraryTest, DraftSurvivesRestart) {
    {
        auto library = openLibrary();
        library->stage(share / "movie.mp4", OperationKind::Rename, "later");
    }

    auto library = openLibrary();
    auto open = library->activeDraft();
    ASSERT_TRUE(open.has_value());
    ASSERT_EQ(open->operations().size(), 1u);

    library->commit();
    EXPECT_TRUE(std::filesystem::exists(share / "later.mp4"));
}

TEST_F(LibraryTest, UnknownPathIsNotFound) {
    auto library = openLibrary();
    try {
        library->stage(share / "missing.mp4", OperationKind::Rename, "x");
        FAIL() << "expected NotFound";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(LibraryTest, CorruptStoreRefusesMutations) {
    writeFile(dir / "data" / "library.db", std::string(4096, 'Z'));

    auto library = openLibrary();
    EXPECT_TRUE(library->isCorrupt());

    try {
        library->stage(share / "movie.mp4", OperationKind::Rename, "x");
        FAIL() << "expected StoreCorrupted";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StoreCorrupted);
    }
    EXPECT_THROW(library->commit(), MediaError);
    EXPECT_THROW(library->undo(), MediaError);
    EXPECT_TRUE(std::filesystem::exists(share / "movie.mp4"));
}

TEST_F(LibraryTest, ThumbnailIsRenderedOnceThenCached) {
    auto library = openLibrary();
    int renders = 0;
    library->setThumbnailRenderer([&renders](const FileRecord& record) {
        ++renders;
        EXPECT_EQ(record.path.filename(), "movie.mp4");
        return std::vector<uint8_t>(64, 0x7F);
    });

    auto first = library->thumbnail(share / "movie.mp4");
    auto second = library->thumbnail(share / "movie.mp4");

    EXPECT_EQ(renders, 1);
    EXPECT_EQ(second->size(), 64u);
    EXPECT_EQ(library->cacheStats().entryCount, 1u);
    EXPECT_EQ(library->cacheStats().totalBytes, 64u);
}

TEST_F(LibraryTest, ThumbnailFailureIsCacheGeneration) {
    auto library = openLibrary();

    try {
        library->thumbnail(share / "movie.mp4");
        FAIL() << "expected CacheGeneration";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CacheGeneration);
    }

    library->setThumbnailRenderer([](const FileRecord&) -> std::vector<uint8_t> {
        throw MediaError(ErrorKind::CacheGeneration, "ffmpeg could not decode a frame");
    });
    EXPECT_THROW(library->thumbnail(share / "movie.mp4"), MediaError);
    EXPECT_EQ(library->cacheStats().entryCount, 0u);
}

TEST_F(LibraryTest, PruneStaleRemovesVanishedRecords) {
    auto library = openLibrary();
    library->scan(share).wait();

    std::filesystem::remove(share / "trailer.mkv");
    library->scan(share).wait();
    ASSERT_EQ(library->record(share / "trailer.mkv")->scanState, ScanState::Stale);

    EXPECT_EQ(library->pruneStale(share), 1);
    EXPECT_FALSE(library->record(share / "trailer.mkv").has_value());
    EXPECT_TRUE(library->record(share / "movie.mp4").has_value());
}

TEST_F(LibraryTest, PreviewAfterCommitKeepsUndo) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Rename, "renamed");
    BatchResult committed = library->commit();
    ASSERT_EQ(library->undoableBatch(), committed.batchId);

    StageOutcome preview = library->stage(share / "trailer.mkv", OperationKind::Delete, "", true);
    EXPECT_FALSE(preview.operation.has_value());
    EXPECT_EQ(preview.preview.destination.parent_path().filename(), std::to_string(committed.batchId + 1));
    EXPECT_FALSE(library->activeDraft().has_value());
    EXPECT_EQ(library->undoableBatch(), committed.batchId);

    library->undo();
    EXPECT_TRUE(std::filesystem::exists(share / "movie.mp4"));
}

TEST_F(LibraryTest, RejectedStageAfterCommitKeepsUndo) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Rename, "renamed");
    BatchResult committed = library->commit();
    writeFile(share / "taken.mkv", "occupied");

    EXPECT_THROW(library->stage(share / "trailer.mkv", OperationKind::Rename, "taken"), MediaError);
    StageOutcome unchanged = library->stage(share / "trailer.mkv", OperationKind::Rename, "{filename}");
    EXPECT_TRUE(unchanged.preview.noOp);

    EXPECT_FALSE(library->activeDraft().has_value());
    EXPECT_EQ(library->undoableBatch(), committed.batchId);
    try {
        library->commit();
        FAIL() << "expected InvalidBatchState";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidBatchState);
    }
}

TEST_F(LibraryTest, FailedCommitLeavesDraftCommittable) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Rename, "later");

    // A second writer holds the store, so recording Committing times out
    sqlite3* writer = nullptr;
    ASSERT_EQ(sqlite3_open((dir / "data" / "library.db").c_str(), &writer), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(writer, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), SQLITE_OK);

    try {
        library->commit();
        FAIL() << "expected IOError";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOError);
    }
    EXPECT_TRUE(std::filesystem::exists(share / "movie.mp4"));

    sqlite3_exec(writer, "ROLLBACK", nullptr, nullptr, nullptr);
    sqlite3_close(writer);

    auto open = library->activeDraft();
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->state(), BatchState::Draft);

    BatchResult committed = library->commit();
    EXPECT_EQ(committed.succeeded.size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(share / "later.mp4"));
}

TEST_F(LibraryTest, DeletedFileIsNotRescannedFromHoldingArea) {
    auto library = openLibrary();
    library->scan(share).wait();

    library->stage(share / "trailer.mkv", OperationKind::Delete, "");
    BatchResult committed = library->commit();
    auto held = share / ".media-organizer-trash" / std::to_string(committed.batchId) / "trailer.mkv";
    ASSERT_TRUE(std::filesystem::exists(held));

    library->scan(share).wait();
    EXPECT_FALSE(library->record(held).has_value());
    EXPECT_TRUE(library->record(share / "movie.mp4").has_value());

    library->undo();
    EXPECT_TRUE(std::filesystem::exists(share / "trailer.mkv"));
    EXPECT_FALSE(std::filesystem::exists(share / ".media-organizer-trash"));
}

TEST_F(LibraryTest, SummaryReportsDraft) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Rename, "first");
    library->stage(share / "trailer.mkv", OperationKind::Rename, "second");
    int64_t id = library->activeDraft()->id();

    BatchSummary summary = library->summary(id);
    EXPECT_EQ(summary.state, BatchState::Draft);
    EXPECT_EQ(summary.totalOperations, 2u);
    EXPECT_EQ(summary.staged, 2u);
    EXPECT_EQ(summary.totalBytes, 0u);
    EXPECT_DOUBLE_EQ(summary.estimatedSeconds, 2.0);
    EXPECT_DOUBLE_EQ(summary.progress(), 0.0);

    try {
        library->summary(id + 100);
        FAIL() << "expected NotFound";
    } catch (const MediaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(LibraryTest, PurgeHoldingAreaSparesUndoableBatch) {
    auto library = openLibrary();
    library->stage(share / "movie.mp4", OperationKind::Delete, "");
    BatchResult first = library->commit();
    library->stage(share / "trailer.mkv", OperationKind::Delete, "");
    BatchResult second = library->commit();

    auto trash = share / ".media-organizer-trash";
    EXPECT_EQ(library->purgeHoldingArea(share), 1);
    EXPECT_FALSE(std::filesystem::exists(trash / std::to_string(first.batchId)));
    EXPECT_TRUE(std::filesystem::exists(trash / std::to_string(second.batchId) / "trailer.mkv"));

    library->undo();
    EXPECT_EQ(readFile(share / "trailer.mkv"), "short");
}

TEST(ThumbnailPayloadTest, DownscaleAveragesBoxes) {
    // 4x2 image: left half black, right half grey
    std::vector<uint8_t> rgba;
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 4; ++x) {
            uint8_t v = x < 2 ? 0 : 200;
            rgba.insert(rgba.end(), {v, v, v, 255});
        }
    }

    ThumbnailImage image = ThumbnailGenerator::downscale(rgba.data(), 4, 2, 2);
    ASSERT_EQ(image.width, 2u);
    ASSERT_EQ(image.height, 1u);
    EXPECT_EQ(image.pixels[0], 0);
    EXPECT_EQ(image.pixels[4], 200);
    EXPECT_EQ(image.pixels[7], 255);

    auto decoded = ThumbnailGenerator::decode(ThumbnailGenerator::encode(image));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->pixels, image.pixels);
}

TEST(ThumbnailPayloadTest, TruncatedPayloadIsRejected) {
    ThumbnailImage image;
    image.width = 2;
    image.height = 2;
    image.pixels.assign(16, 1);
    auto payload = ThumbnailGenerator::encode(image);
    payload.pop_back();

    EXPECT_FALSE(ThumbnailGenerator::decode(payload).has_value());
    EXPECT_FALSE(ThumbnailGenerator::decode({1, 2, 3}).has_value());
}
