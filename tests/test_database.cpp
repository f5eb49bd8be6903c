#include <gtest/gtest.h>
#include "database.hpp"
#include "test_support.hpp"

using namespace MediaOrganizer;
using namespace MediaOrganizer::testing;

namespace {

FileRecord makeRecord(const std::string& path, ScanState state = ScanState::Pending) {
    FileRecord record;
    record.path = path;
    record.size = 1000;
    record.modifiedTime = 1700000000;
    record.fingerprint = computeFingerprint(record.path, record.size, record.modifiedTime);
    record.scanState = state;
    return record;
}

} // namespace

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.open(dir / "library.db"));
        ASSERT_FALSE(db.isCorrupt());
    }

    TempDir dir;
    Database db;
};

TEST_F(DatabaseTest, UpsertIsKeyedByPath) {
    FileRecord record = makeRecord("/share/movies/a.mkv");
    ASSERT_TRUE(db.upsertFile(record));

    record.scanState = ScanState::Enriched;
    record.metadata = sampleMetadata(720, "hevc", 600.0);
    ASSERT_TRUE(db.upsertFile(record));

    EXPECT_EQ(db.getTotalFileCount(), 1);
    auto stored = db.getFileByPath("/share/movies/a.mkv");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->scanState, ScanState::Enriched);
    ASSERT_TRUE(stored->metadata.has_value());
    EXPECT_EQ(stored->metadata->codec, "hevc");
    EXPECT_EQ(stored->metadata->height, 720);
}

TEST_F(DatabaseTest, NextBatchIdPredictsCreateBatch) {
    EXPECT_EQ(db.nextBatchId(), 1);
    int64_t first = db.createBatch();
    EXPECT_EQ(first, 1);

    EXPECT_EQ(db.nextBatchId(), 2);
    ASSERT_TRUE(db.deleteDraftBatch(first));
    // Ids of discarded drafts are not reused
    EXPECT_EQ(db.nextBatchId(), 2);
    EXPECT_EQ(db.createBatch(), 2);
}

TEST_F(DatabaseTest, FilesUnderRespectsRecursion) {
    db.upsertFile(makeRecord("/share/movies/a.mkv"));
    db.upsertFile(makeRecord("/share/movies/extras/b.mkv"));
    db.upsertFile(makeRecord("/share/movies-old/c.mkv"));

    EXPECT_EQ(db.getFilesUnder("/share/movies", true).size(), 2u);
    EXPECT_EQ(db.getFilesUnder("/share/movies", false).size(), 1u);
}

TEST_F(DatabaseTest, UnseenRecordsBecomeStaleAndPruneOnlyOnRequest) {
    db.upsertFile(makeRecord("/share/tv/s01e01.mkv", ScanState::Enriched));
    db.upsertFile(makeRecord("/share/tv/s01e02.mkv", ScanState::Enriched));

    int marked = db.markUnseenStale("/share/tv", true, {"/share/tv/s01e01.mkv"});
    EXPECT_EQ(marked, 1);
    EXPECT_EQ(db.getFileByPath("/share/tv/s01e02.mkv")->scanState, ScanState::Stale);
    EXPECT_EQ(db.getFileByPath("/share/tv/s01e01.mkv")->scanState, ScanState::Enriched);
    EXPECT_EQ(db.getTotalFileCount(), 2);

    EXPECT_EQ(db.pruneStale("/share/tv"), 1);
    EXPECT_EQ(db.getTotalFileCount(), 1);
    EXPECT_FALSE(db.getFileByPath("/share/tv/s01e02.mkv").has_value());
}

TEST_F(DatabaseTest, MoveRecordRecomputesFingerprint) {
    FileRecord record = makeRecord("/share/a.mkv", ScanState::Enriched);
    db.upsertFile(record);

    ASSERT_TRUE(db.moveFileRecord("/share/a.mkv", "/share/b.mkv"));
    EXPECT_FALSE(db.getFileByPath("/share/a.mkv").has_value());

    auto moved = db.getFileByPath("/share/b.mkv");
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->scanState, ScanState::Enriched);
    EXPECT_NE(moved->fingerprint, record.fingerprint);
    EXPECT_EQ(moved->fingerprint, computeFingerprint("/share/b.mkv", record.size, record.modifiedTime));
}

TEST_F(DatabaseTest, CacheEntriesPersistWithStamps) {
    ASSERT_TRUE(db.putCacheEntry("thumb:1", std::vector<uint8_t>(16, 3), 10, 1));
    ASSERT_TRUE(db.putCacheEntry("meta:1", std::vector<uint8_t>(4, 1), 11, 2));
    ASSERT_TRUE(db.touchCacheEntries({{"thumb:1", 42}}));

    auto index = db.loadCacheIndex();
    ASSERT_EQ(index.size(), 2u);
    for (const auto& row : index) {
        if (row.key == "thumb:1") {
            EXPECT_EQ(row.lastAccess, 42);
            EXPECT_EQ(row.sizeBytes, 16u);
        }
    }

    ASSERT_TRUE(db.deleteCacheEntries({"thumb:1"}));
    EXPECT_FALSE(db.getCachePayload("thumb:1").has_value());
    EXPECT_EQ(db.getCachePayload("meta:1")->size(), 4u);
}

TEST_F(DatabaseTest, BatchOperationsRoundTrip) {
    int64_t id = db.createBatch();
    ASSERT_GT(id, 0);
    EXPECT_EQ(db.findActiveBatch(), id);

    StagedOperation op;
    op.batchId = id;
    op.kind = OperationKind::Move;
    op.source = "/share/a.mkv";
    op.destination = "/archive/a.mkv";
    op.id = db.insertOperation(op, 0);
    ASSERT_GT(op.id, 0);

    op.status = OperationStatus::Failed;
    op.error = OperationError{ErrorKind::PermissionDenied, "access denied"};
    ASSERT_TRUE(db.updateOperation(op));

    auto batch = db.loadBatch(id);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->state(), BatchState::Draft);
    ASSERT_EQ(batch->operations().size(), 1u);
    const auto& stored = batch->operations().front();
    EXPECT_EQ(stored.kind, OperationKind::Move);
    EXPECT_EQ(stored.destination, "/archive/a.mkv");
    EXPECT_EQ(stored.status, OperationStatus::Failed);
    ASSERT_TRUE(stored.error.has_value());
    EXPECT_EQ(stored.error->kind, ErrorKind::PermissionDenied);
}

TEST_F(DatabaseTest, DiscardDeletesOnlyDrafts) {
    int64_t id = db.createBatch();
    ASSERT_TRUE(db.updateBatchState(id, BatchState::Committing));
    EXPECT_FALSE(db.deleteDraftBatch(id));

    int64_t draft = db.createBatch();
    EXPECT_TRUE(db.deleteDraftBatch(draft));
    EXPECT_FALSE(db.loadBatch(draft).has_value());
}

TEST_F(DatabaseTest, FinishCommitMakesOnlyLatestUndoable) {
    auto commitBatch = [this]() {
        int64_t id = db.createBatch();
        db.updateBatchState(id, BatchState::Committing);

        UndoEntry entry;
        entry.applied.kind = OperationKind::Rename;
        entry.applied.source = "/share/a.mkv";
        entry.applied.destination = "/share/b.mkv";
        entry.inverse.kind = OperationKind::Rename;
        entry.inverse.source = "/share/b.mkv";
        entry.inverse.destination = "/share/a.mkv";

        UndoRecord record;
        record.batchId = id;
        record.entries.push_back(entry);
        EXPECT_TRUE(db.finishCommit(record));
        return id;
    };

    int64_t first = commitBatch();
    EXPECT_EQ(db.undoableBatchId(), first);

    int64_t second = commitBatch();
    EXPECT_EQ(db.undoableBatchId(), second);

    auto older = db.loadUndoRecord(first);
    ASSERT_TRUE(older.has_value());
    EXPECT_FALSE(older->undoable);
    ASSERT_EQ(older->entries.size(), 1u);
    EXPECT_EQ(older->entries[0].inverse.destination, "/share/a.mkv");

    ASSERT_TRUE(db.revokeUndo());
    EXPECT_FALSE(db.undoableBatchId().has_value());
}

TEST(DatabaseCorruptionTest, GarbageFileIsFlaggedNotReplaced) {
    TempDir dir;
    auto path = dir / "library.db";
    const std::string garbage(4096, 'Z');
    writeFile(path, garbage);

    Database db;
    ASSERT_TRUE(db.open(path));
    EXPECT_TRUE(db.isCorrupt());
    EXPECT_FALSE(db.corruptionDetail().empty());
    db.close();

    EXPECT_EQ(readFile(path), garbage);
}
