/**
 * @file library.hpp
 * @brief Facade tying the store, scanner, cache and batch engine together.
 */

#pragma once

#include "batch.hpp"
#include "cache_manager.hpp"
#include "config.hpp"
#include "filesystem_provider.hpp"
#include "operation_stager.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace MediaOrganizer {

class Committer;
class Database;
class MetadataProvider;
class Scanner;
class UndoLog;

/// Renders a thumbnail payload for a record; throwing means generation failed.
using ThumbnailRenderer = std::function<std::vector<uint8_t>(const FileRecord&)>;

/**
 * @brief Main controller of a media library.
 *
 * Owns every subsystem and exposes the operations the command line tool
 * (or any other front end) drives: scanning, staging into the current
 * Draft batch, committing, undoing and cache maintenance.
 *
 * At most one batch is open (Draft or Committing) at a time. Opening a
 * new Draft revokes undo eligibility of the last committed batch.
 *
 * @par Lifecycle:
 * @code
 * Library library(loadConfig(Config::defaultPath()));
 * if (!library.open()) return 1;
 * library.stage("/mnt/share/movie.mp4", OperationKind::Rename, "{filename}_{resolution}");
 * BatchResult result = library.commit();
 * library.undo();
 * @endcode
 */
class Library {
public:
    /// Library over the local filesystem and ffprobe.
    explicit Library(Config config);

    /// Library over caller-supplied providers.
    Library(Config config, std::unique_ptr<FilesystemProvider> fs, std::unique_ptr<MetadataProvider> metadata);

    ~Library();

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    /**
     * @brief Open the store and recover from an interrupted run.
     *
     * Batches left in Committing or Undoing are finished and the cache
     * index is loaded. A corrupted store still opens (for inspection) but
     * every mutating call then throws StoreCorrupted.
     *
     * @return false if the store could not be opened at all
     */
    bool open();

    /// Stop background work and close the store.
    void shutdown();

    bool isCorrupt() const;

    /// @name Batches
    /// @{

    /// The open Draft, if any, without creating one.
    std::optional<Batch> activeDraft();

    /// Drop the open Draft and its operations. Nothing was applied, so nothing changes on disk.
    bool discardDraft();

    /**
     * @brief Stage an operation in the open Draft.
     *
     * Files not yet known to the store are recorded as Pending first. The
     * Draft is opened (revoking undo of the last committed batch) only when
     * an operation is appended; dry runs, no-ops and rejected requests leave
     * the batches untouched.
     *
     * @throws MediaError as OperationStager::stage(), and NotFound for a
     *         path that is neither in the store nor on disk
     */
    StageOutcome stage(StageRequest request);

    StageOutcome stage(const std::filesystem::path& path, OperationKind kind, const std::string& nameTemplate,
                       bool dryRun = false, const std::filesystem::path& destinationDir = {});

    /**
     * @brief Commit the open Draft.
     *
     * Pausing `cancel` holds the commit before its next operation or chunk.
     *
     * @throws MediaError(InvalidBatchState) when nothing is staged
     */
    BatchResult commit(const CancellationToken& cancel = {}, const ProgressCallback& progress = {});

    /**
     * @brief Undo the latest committed batch.
     * @throws MediaError(StaleBatch) when no batch is undoable
     */
    BatchResult undo(const CancellationToken& cancel = {}, const ProgressCallback& progress = {});

    /// Undo a specific batch; fails with StaleBatch unless it is the latest.
    BatchResult undo(int64_t batchId, const CancellationToken& cancel = {},
                     const ProgressCallback& progress = {});

    std::optional<UndoRecord> undoRecord(int64_t batchId) const;
    std::optional<int64_t> undoableBatch() const;

    /**
     * @brief Counts, sizes and remaining-time estimate of a batch.
     * @throws MediaError(NotFound) if there is no such batch
     */
    BatchSummary summary(int64_t batchId) const;

    /**
     * @brief Permanently delete files held for batches that can no longer be undone.
     * @return Number of files removed
     */
    int purgeHoldingArea(const std::filesystem::path& directory);

    /// @}

    /// @name Scanning
    /// @{

    /**
     * @brief Start scanning a directory; consume records with Scanner::next().
     * @throws MediaError(StoreCorrupted) if the store is corrupted
     */
    Scanner& scan(const std::filesystem::path& directory);

    /// Resume enrichment of records a previous run left Pending.
    Scanner& resumePending();

    /// Remove Stale records under a directory. @return Records removed
    int pruneStale(const std::filesystem::path& directory);

    std::optional<FileRecord> record(const std::filesystem::path& path) const;

    /// @}

    /// @name Cache
    /// @{

    CacheStats cacheStats() const;

    /// Evict down to the low watermark. @return Entries evicted
    size_t pruneCache();

    /**
     * @brief Thumbnail payload for a file, rendered on a cache miss.
     * @throws MediaError(CacheGeneration) if rendering fails or no renderer is set
     */
    CachePayload thumbnail(const std::filesystem::path& path);

    void setThumbnailRenderer(ThumbnailRenderer renderer) { m_thumbnailRenderer = std::move(renderer); }

    /// @}

    const Config& config() const { return m_config; }
    Database& database() { return *m_database; }
    Scanner& scanner() { return *m_scanner; }

private:
    /// The open Draft, loaded from the store if needed; nullptr when there is none.
    Batch* openDraft();

    /// The open Draft, created (revoking undo) when there is none.
    Batch& draft();

    void requireWritable(const char* action) const;
    FileRecord resolveRecord(const std::filesystem::path& path);

    Config m_config;

    /// @name Subsystems
    /// @{
    std::unique_ptr<Database> m_database;
    std::unique_ptr<FilesystemProvider> m_filesystem;
    std::unique_ptr<MetadataProvider> m_metadata;
    std::unique_ptr<CacheManager> m_cache;
    std::unique_ptr<Scanner> m_scanner;
    std::unique_ptr<OperationStager> m_stager;
    std::unique_ptr<Committer> m_committer;
    std::unique_ptr<UndoLog> m_undoLog;
    /// @}

    std::optional<Batch> m_draft;               ///< Cached open Draft
    ThumbnailRenderer m_thumbnailRenderer;
};

} // namespace MediaOrganizer
