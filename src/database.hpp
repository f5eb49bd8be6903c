/**
 * @file database.hpp
 * @brief SQLite store for file records, cache entries, batches and undo records.
 */

#pragma once

#include "batch.hpp"
#include "media_file.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

namespace MediaOrganizer {

/**
 * @brief Index row of a cache entry (payload loaded separately).
 */
struct CacheEntryRow {
    std::string key;            ///< Cache key ("thumb:<fp>", "meta:<fp>")
    uint64_t sizeBytes = 0;     ///< Payload size
    int64_t lastAccess = 0;     ///< Monotonic access stamp
    int64_t insertSeq = 0;      ///< Insertion order, breaks lastAccess ties
};

/**
 * @brief SQLite-backed persistent store.
 *
 * Owns all durable data: FileRecords, CacheEntries, Batches with their
 * StagedOperations, and UndoRecords. The database is stored at
 * ~/.local/share/MediaOrganizer/library.db unless configured otherwise.
 *
 * Every public method takes the same mutex, so all writers are serialized
 * through one connection; the journal runs in WAL mode so a crash leaves
 * the last committed transaction intact.
 *
 * A file that fails to open as a database, or fails `PRAGMA quick_check`,
 * is flagged corrupt. Nothing is deleted or recreated in that case; callers
 * must check isCorrupt() and refuse to mutate user data.
 */
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open or create the database at the specified path.
     * @param dbPath Path to the SQLite database file
     * @return false if the file could not be opened at all; a corrupt file
     *         still returns true with isCorrupt() set
     */
    bool open(const std::filesystem::path& dbPath);

    /**
     * @brief Close the database connection.
     */
    void close();

    bool isOpen() const { return m_db != nullptr; }
    bool isCorrupt() const { return m_corrupt; }
    const std::string& corruptionDetail() const { return m_corruptionDetail; }
    std::filesystem::path getDatabasePath() const { return m_dbPath; }

    /// @name File Records
    /// @{

    /**
     * @brief Insert a record or update the existing row with the same path.
     * @return true on success
     */
    bool upsertFile(const FileRecord& file);

    std::optional<FileRecord> getFileByPath(const std::filesystem::path& path);
    std::vector<FileRecord> getFilesByState(ScanState state);

    /**
     * @brief Records whose path lies under a directory.
     * @param directory Directory prefix
     * @param recursive If false, only direct children are returned
     */
    std::vector<FileRecord> getFilesUnder(const std::filesystem::path& directory, bool recursive = true);

    /**
     * @brief Mark records under a directory that were not seen as Stale.
     * @return Number of records newly marked Stale
     */
    int markUnseenStale(const std::filesystem::path& directory, bool recursive,
                        const std::set<std::string>& seenPaths);

    /**
     * @brief Remove Stale records under a directory. Never called implicitly.
     * @return Number of records removed
     */
    int pruneStale(const std::filesystem::path& directory);

    bool setScanState(const std::filesystem::path& path, ScanState state);

    /// Re-key a record after a committed rename/move; recomputes its fingerprint.
    bool moveFileRecord(const std::filesystem::path& from, const std::filesystem::path& to);

    /// Duplicate a record after a committed copy.
    bool copyFileRecord(const std::filesystem::path& from, const std::filesystem::path& to);

    int getTotalFileCount();

    /// @}

    /// @name Cache Entries
    /// @{

    std::vector<CacheEntryRow> loadCacheIndex();
    std::optional<std::vector<uint8_t>> getCachePayload(const std::string& key);
    bool putCacheEntry(const std::string& key, const std::vector<uint8_t>& payload,
                       int64_t lastAccess, int64_t insertSeq);
    bool deleteCacheEntries(const std::vector<std::string>& keys);
    bool touchCacheEntries(const std::vector<std::pair<std::string, int64_t>>& stamps);

    /// @}

    /// @name Batches
    /// @{

    /**
     * @brief Create a new Draft batch.
     * @return ID of the new batch, or -1 on failure
     */
    int64_t createBatch();

    /// ID the next createBatch() will assign.
    int64_t nextBatchId();

    bool updateBatchState(int64_t batchId, BatchState state);
    std::optional<Batch> loadBatch(int64_t batchId);

    /// The batch currently in Draft or Committing state, if any.
    std::optional<int64_t> findActiveBatch();

    std::vector<int64_t> findBatchesInState(BatchState state);

    /// Delete a Draft batch and its operations.
    bool deleteDraftBatch(int64_t batchId);

    /**
     * @brief Persist a new staged operation.
     * @return Row ID, or -1 on failure
     */
    int64_t insertOperation(const StagedOperation& op, int seq);

    bool updateOperation(const StagedOperation& op);

    /// @}

    /// @name Undo Records
    /// @{

    /**
     * @brief Mark a batch Committed and store its undo record atomically.
     *
     * The batch becomes the only undoable one; every other batch loses
     * eligibility but keeps its record.
     */
    bool finishCommit(const UndoRecord& record);

    std::optional<UndoRecord> loadUndoRecord(int64_t batchId);
    std::optional<int64_t> undoableBatchId();

    /// Revoke undo eligibility from every batch.
    bool revokeUndo();

    bool updateUndoEntry(int64_t batchId, const UndoEntry& entry);

    /// @}

private:
    void createTables();
    bool checkIntegrity();
    bool beginTransaction();
    bool commitTransaction();
    void rollbackTransaction();
    bool execute(const std::string& sql);

    bool updateBatchStateLocked(int64_t batchId, BatchState state);
    bool revokeUndoLocked();
    bool insertUndoEntryLocked(int64_t batchId, const UndoEntry& entry);
    std::vector<FileRecord> queryFiles(const char* sql, const std::string& bindText);

    std::mutex m_mutex;                 ///< Serializes every statement
    sqlite3* m_db = nullptr;            ///< SQLite database handle
    std::filesystem::path m_dbPath;     ///< Path to database file
    bool m_corrupt = false;
    std::string m_corruptionDetail;
};

} // namespace MediaOrganizer
