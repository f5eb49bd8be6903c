/**
 * @file scanner.hpp
 * @brief Background directory scanner with asynchronous metadata enrichment.
 */

#pragma once

#include "config.hpp"
#include "media_file.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace MediaOrganizer {

class CacheManager;
class Database;
class MetadataProvider;

/**
 * @brief Totals reported when a scan finishes.
 */
struct ScanSummary {
    int listed = 0;     ///< Media files seen on disk
    int enriched = 0;   ///< Records that ended Enriched (including unchanged ones)
    int failed = 0;     ///< Metadata reads that failed
    int stale = 0;      ///< Known records not seen on disk this time
    bool stopped = false;
};

/**
 * @brief Asynchronous directory scanner for media files.
 *
 * A scan lists the directory first and publishes a bare Pending record for
 * every media file as soon as it is seen, so callers can show a file list
 * before any metadata is known. A fixed pool of workers then reads the
 * Pending records through the MetadataProvider and publishes each record
 * again once it is Enriched or Failed. A failing read never aborts the scan.
 *
 * Directories named like the committer's holding area are not descended
 * into, so files held for undo never come back as live records.
 *
 * Every state change is written to the Database immediately, so a killed
 * process resumes with resumePending(). Extracted metadata is cached under
 * `meta:<fingerprint>`; a file whose fingerprint is unchanged and already
 * Enriched is published without being read again.
 *
 * @par Usage Example:
 * @code
 * Scanner scanner(db, cache, provider, config.scan);
 * scanner.startScan("/mnt/share/movies");
 * while (auto record = scanner.next()) {
 *     show(*record);   // Pending first, then Enriched/Failed
 * }
 * @endcode
 *
 * @note Only one scan runs at a time. Starting a new scan stops the
 *       current one first.
 */
class Scanner {
public:
    /**
     * @brief Callback type for progress updates. Invoked from worker threads.
     * @param done Records whose enrichment has finished
     * @param total Records listed so far
     */
    using ProgressCallback = std::function<void(int done, int total)>;

    /// Callback type for scan completion.
    using CompleteCallback = std::function<void(const ScanSummary& summary)>;

    Scanner(Database& db, CacheManager& cache, MetadataProvider& provider, ScanConfig config,
            std::string holdingDirName = {});
    ~Scanner();

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /**
     * @brief Start scanning a directory in the background.
     *
     * Re-scanning a known directory updates existing records in place.
     * Known records under the directory that are no longer on disk are
     * marked Stale once listing completes.
     */
    void startScan(const std::filesystem::path& directory, bool recursive);

    void startScan(const std::filesystem::path& directory) { startScan(directory, m_config.recursive); }

    /// Re-queue every Pending record in the store for enrichment.
    void resumePending();

    /**
     * @brief Request the current scan to stop and wait for it.
     *
     * Records already published remain available via pollResults().
     */
    void stopScan();

    bool isScanning() const { return m_isScanning.load(); }
    bool isComplete() const { return m_isComplete.load(); }

    /// @return Pair of (enrichment finished, records listed)
    std::pair<int, int> getProgress() const;

    /// Drain every record published since the last call.
    std::vector<FileRecord> pollResults();

    /**
     * @brief Block until the next record is published.
     * @return std::nullopt once the scan has completed and everything was consumed
     */
    std::optional<FileRecord> next();

    /// Block until the current scan has completed.
    ScanSummary wait();

    void setProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }
    void setCompleteCallback(CompleteCallback callback) { m_completeCallback = std::move(callback); }

    bool isMediaFile(const std::filesystem::path& path) const;

private:
    void reset();
    void scanThread(std::optional<std::filesystem::path> directory, bool recursive);
    void listDirectory(const std::filesystem::path& directory, bool recursive, std::set<std::string>& seen);
    bool isHoldingArea(const std::filesystem::directory_entry& entry) const;
    void admit(FileRecord record);
    void workerLoop();
    void enrich(FileRecord record);
    void publish(const FileRecord& record);
    void finishOne(bool enriched);

    Database& m_db;
    CacheManager& m_cache;
    MetadataProvider& m_provider;
    ScanConfig m_config;
    std::string m_holdingDirName;               ///< Skipped while listing

    std::jthread m_scanThread;                  ///< Listing thread, owns the workers
    std::atomic<bool> m_isScanning{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_isComplete{true};

    std::atomic<int> m_filesDone{0};
    std::atomic<int> m_filesTotal{0};

    /// @name Work Queue
    /// @{
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::queue<FileRecord> m_pending;
    bool m_listingDone = false;
    /// @}

    /// @name Published Records
    /// @{
    std::mutex m_resultsMutex;
    std::condition_variable m_resultsCv;
    std::deque<FileRecord> m_results;
    ScanSummary m_summary;
    /// @}

    ProgressCallback m_progressCallback;
    CompleteCallback m_completeCallback;
};

} // namespace MediaOrganizer
