/**
 * @file committer.hpp
 * @brief Applies staged batches to the filesystem.
 */

#pragma once

#include "batch.hpp"
#include "config.hpp"
#include "filesystem_provider.hpp"
#include <chrono>
#include <filesystem>
#include <optional>

namespace MediaOrganizer {

class Database;

/**
 * @brief Applies operations one at a time, in submission order.
 *
 * Each operation's outcome is independent: a failure never rolls back an
 * earlier success, and every outcome is persisted before the next operation
 * starts, so a crash mid-batch leaves an exact record of what happened.
 *
 * Rename, same-volume Move and holding-area Delete are atomic renames that
 * never replace an existing file. A Move across shares and every Copy
 * stream the source in chunks into `.<name>.partial` next to the
 * destination, verify the byte count, then rename the temp file into place;
 * a cross-share Move deletes the source only after that. Any failure or
 * cancellation removes the temp file and leaves the source untouched.
 *
 * Applied operations also update the FileRecords in the store: renames and
 * moves re-key the record, copies duplicate it, deletes mark it Stale.
 *
 * Streamed copies are throttled to `bandwidthLimitBytesPerSec` when it is
 * set. A paused CancellationToken holds the batch before the next operation
 * or chunk until it is resumed or cancelled.
 */
class Committer {
public:
    Committer(FilesystemProvider& fs, Database& db, CommitConfig config);

    /**
     * @brief Commit a Draft batch.
     *
     * The batch goes Draft -> Committing -> Committed. Its applied
     * operations and their inverses become the undo record, and it becomes
     * the only undoable batch.
     *
     * @param cancel Checked before each operation and between chunks; once it
     *        fires, every remaining operation fails with Cancelled
     * @param progress Invoked at chunk boundaries of streamed copies
     * @throws MediaError(StoreCorrupted) if the store failed its integrity check
     * @throws MediaError(InvalidBatchState) if the batch is not a Draft
     */
    BatchResult commit(Batch& batch, const CancellationToken& cancel = {},
                       const ProgressCallback& progress = {});

    /**
     * @brief Apply a single operation and update the store's file records.
     * @return std::nullopt on success
     */
    std::optional<OperationError> apply(const StagedOperation& op, const CancellationToken& cancel,
                                        const ProgressCallback& progress);

    /**
     * @brief Finish batches a crash left in Committing.
     *
     * Operations whose effect is visible on disk are marked Applied, the
     * rest Failed(IOError) with their temp files removed, and the batch
     * becomes Committed with an undo record of the Applied ones.
     *
     * @return Number of batches recovered
     */
    int recover();

    /// Temp name a streamed copy writes to before its final rename.
    static std::filesystem::path tempPathFor(const std::filesystem::path& destination);

    /**
     * @brief Counts, streamed bytes and remaining-time estimate of a batch.
     *
     * Atomic renames count as one second each; streamed copies are estimated
     * from their size at the bandwidth limit, or 100 MiB/s without one.
     */
    BatchSummary summarize(const Batch& batch) const;

    /// Estimated duration of one operation in seconds.
    double estimateSeconds(const StagedOperation& op) const;

    /// Bytes a Move/Copy streams (0 for other kinds).
    uint64_t operationBytes(const StagedOperation& op) const;

    /// Total bytes written by streamed copies since construction.
    uint64_t bytesCopied() const { return m_bytesCopied; }

    /// Remove the batch and holding directories around `held` once they are empty.
    void releaseHoldingSlot(const std::filesystem::path& held);

    /**
     * @brief Permanently remove held files of every batch under `directory`
     *        except `keepBatch`.
     * @return Number of files removed
     */
    int purgeHoldingArea(const std::filesystem::path& directory, std::optional<int64_t> keepBatch);

private:
    std::optional<OperationError> applyFilesystem(const StagedOperation& op, const CancellationToken& cancel,
                                                  const ProgressCallback& progress);
    std::optional<OperationError> streamCopy(const std::filesystem::path& source,
                                             const std::filesystem::path& destination,
                                             const CancellationToken& cancel,
                                             const ProgressCallback& progress);
    void throttle(std::chrono::steady_clock::time_point started, uint64_t copied,
                  const CancellationToken& cancel) const;
    bool streams(const StagedOperation& op) const;
    std::optional<OperationError> ensureParent(const std::filesystem::path& destination);
    void discardTemp(const std::filesystem::path& temp);
    void updateRecords(const StagedOperation& applied);
    bool looksApplied(const StagedOperation& op) const;

    FilesystemProvider& m_fs;
    Database& m_db;
    CommitConfig m_config;
    uint64_t m_bytesCopied = 0;
};

} // namespace MediaOrganizer
