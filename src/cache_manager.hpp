/**
 * @file cache_manager.hpp
 * @brief Size-bounded LRU cache of thumbnails and extracted metadata.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace MediaOrganizer {

class Database;

/// Read handle to a cached payload. Stays valid after the entry is evicted.
using CachePayload = std::shared_ptr<const std::vector<uint8_t>>;

/// Produces a payload on a cache miss. Throwing means generation failed.
using CacheGenerator = std::function<std::vector<uint8_t>()>;

struct CacheStats {
    uint64_t totalBytes = 0;
    size_t entryCount = 0;
};

/**
 * @brief LRU cache of derived artifacts, persisted in the Database.
 *
 * The in-memory index mirrors the `cache_entries` table. Payload bytes live
 * in the store; a hit returns a shared handle that is kept resident only as
 * long as some caller holds it.
 *
 * Eviction removes the entry with the oldest access stamp first; stamps are
 * strictly increasing, and entries loaded with equal stamps fall back to
 * insertion order. When an insert pushes the total over the maximum, entries
 * are evicted until the total is at or below `max * lowWatermark`.
 *
 * All index mutations, hits included, are serialized by one mutex. The
 * generator runs outside the lock so a slow render doesn't stall other
 * lookups. Access stamps are written back to the store in batches of
 * `recencyFlushInterval` touches, on prune() and on destruction.
 *
 * Generators write scratch files ending in `.tmp` into the work directory;
 * whatever a crashed render left behind is removed by load().
 *
 * @par Usage Example:
 * @code
 * CacheManager cache(db, 512 * 1024 * 1024, 0.8, 64);
 * cache.load();
 * CachePayload thumb = cache.getOrCreate(CacheManager::thumbnailKey(fp),
 *                                        [&] { return generator.generate(record); });
 * @endcode
 */
class CacheManager {
public:
    CacheManager(Database& db, uint64_t maxSizeBytes, double lowWatermark, int recencyFlushInterval,
                 std::filesystem::path workDir = {});
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * @brief Rebuild the in-memory index from the store.
     *
     * Prunes immediately if the persisted total exceeds the current maximum
     * (the limit may have been lowered in the configuration), and purges
     * leftover scratch files.
     */
    void load();

    /**
     * @brief Remove `.tmp` scratch files under the work directory.
     * @return Number of files removed
     */
    int purgeTempFiles();

    const std::filesystem::path& workDir() const { return m_workDir; }

    /**
     * @brief Return the cached payload for `key`, generating it on a miss.
     *
     * A payload larger than the whole budget is returned but not stored.
     *
     * @throws MediaError(CacheGeneration) if the generator fails; nothing is stored
     */
    CachePayload getOrCreate(const std::string& key, const CacheGenerator& generator);

    /**
     * @brief Evict least recently used entries until total <= max * targetRatio.
     * @return Number of entries evicted
     */
    size_t prune(double targetRatio);

    /// prune() down to the configured low watermark.
    size_t prune() { return prune(m_lowWatermark); }

    CacheStats stats() const;

    bool contains(const std::string& key) const;

    uint64_t maxSizeBytes() const { return m_maxSizeBytes; }

    /// Persist buffered access stamps.
    void flushRecency();

    static std::string thumbnailKey(const std::string& fingerprint) { return "thumb:" + fingerprint; }
    static std::string metadataKey(const std::string& fingerprint) { return "meta:" + fingerprint; }

private:
    struct Entry {
        std::string key;
        uint64_t sizeBytes = 0;
        int64_t lastAccess = 0;
        int64_t insertSeq = 0;
        std::weak_ptr<const std::vector<uint8_t>> resident;  ///< Set while a reader holds the bytes
    };

    int64_t nextStamp();
    void touchLocked(std::list<Entry>::iterator it);
    void flushRecencyLocked();
    size_t evictLocked(uint64_t targetBytes);

    Database& m_db;
    uint64_t m_maxSizeBytes;
    double m_lowWatermark;
    int m_recencyFlushInterval;
    std::filesystem::path m_workDir;

    mutable std::mutex m_mutex;

    /// @name LRU Index
    /// List maintains access order (front = most recent)
    /// @{
    std::list<Entry> m_lru;
    std::unordered_map<std::string, std::list<Entry>::iterator> m_index;
    uint64_t m_totalBytes = 0;
    /// @}

    int64_t m_lastStamp = 0;
    int64_t m_nextInsertSeq = 1;

    std::unordered_map<std::string, int64_t> m_pendingTouches;  ///< key -> unflushed stamp
    int m_touchesSinceFlush = 0;
};

} // namespace MediaOrganizer
