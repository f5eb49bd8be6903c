#include "cache_manager.hpp"
#include "database.hpp"
#include "debug.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>

namespace MediaOrganizer {

CacheManager::CacheManager(Database& db, uint64_t maxSizeBytes, double lowWatermark, int recencyFlushInterval,
                           std::filesystem::path workDir)
    : m_db(db)
    , m_maxSizeBytes(maxSizeBytes)
    , m_lowWatermark(lowWatermark)
    , m_recencyFlushInterval(std::max(1, recencyFlushInterval))
    , m_workDir(std::move(workDir)) {
    DEBUG_LOG("CacheManager constructor, maxSize=" << maxSizeBytes << " watermark=" << lowWatermark);
}

CacheManager::~CacheManager() {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushRecencyLocked();
}

int CacheManager::purgeTempFiles() {
    if (m_workDir.empty()) return 0;

    std::error_code ec;
    if (!std::filesystem::exists(m_workDir, ec)) return 0;

    std::vector<std::filesystem::path> leftovers;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(m_workDir, options, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && it->path().extension() == ".tmp") {
            leftovers.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("Error while listing cache work dir " << m_workDir << ": " << ec.message());
    }

    int removed = 0;
    for (const auto& path : leftovers) {
        std::error_code removeEc;
        if (std::filesystem::remove(path, removeEc)) {
            ++removed;
        } else if (removeEc) {
            LOG_WARN("Could not remove cache temp file " << path << ": " << removeEc.message());
        }
    }
    if (removed > 0) {
        LOG_INFO("Removed " << removed << " leftover temp files from " << m_workDir);
    }
    return removed;
}

void CacheManager::load() {
    purgeTempFiles();

    std::lock_guard<std::mutex> lock(m_mutex);

    m_lru.clear();
    m_index.clear();
    m_pendingTouches.clear();
    m_touchesSinceFlush = 0;
    m_totalBytes = 0;

    // Rows arrive oldest first; pushing each to the front leaves the newest at the front
    for (const auto& row : m_db.loadCacheIndex()) {
        Entry entry;
        entry.key = row.key;
        entry.sizeBytes = row.sizeBytes;
        entry.lastAccess = row.lastAccess;
        entry.insertSeq = row.insertSeq;
        m_lru.push_front(std::move(entry));
        m_index[row.key] = m_lru.begin();

        m_totalBytes += row.sizeBytes;
        m_lastStamp = std::max(m_lastStamp, row.lastAccess);
        m_nextInsertSeq = std::max(m_nextInsertSeq, row.insertSeq + 1);
    }

    LOG_INFO("Cache index loaded: " << m_lru.size() << " entries, " << m_totalBytes << " bytes");

    if (m_totalBytes > m_maxSizeBytes) {
        size_t evicted = evictLocked(static_cast<uint64_t>(m_maxSizeBytes * m_lowWatermark));
        LOG_INFO("Cache over budget after load, evicted " << evicted << " entries");
    }
}

int64_t CacheManager::nextStamp() {
    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    m_lastStamp = std::max(now, m_lastStamp + 1);
    return m_lastStamp;
}

void CacheManager::touchLocked(std::list<Entry>::iterator it) {
    it->lastAccess = nextStamp();
    m_lru.splice(m_lru.begin(), m_lru, it);

    m_pendingTouches[it->key] = it->lastAccess;
    if (++m_touchesSinceFlush >= m_recencyFlushInterval) {
        flushRecencyLocked();
    }
}

void CacheManager::flushRecencyLocked() {
    if (m_pendingTouches.empty()) {
        m_touchesSinceFlush = 0;
        return;
    }

    std::vector<std::pair<std::string, int64_t>> stamps(m_pendingTouches.begin(), m_pendingTouches.end());
    if (!m_db.touchCacheEntries(stamps)) {
        LOG_WARN("Failed to persist " << stamps.size() << " cache access stamps");
    }
    m_pendingTouches.clear();
    m_touchesSinceFlush = 0;
}

void CacheManager::flushRecency() {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushRecencyLocked();
}

size_t CacheManager::evictLocked(uint64_t targetBytes) {
    std::vector<std::string> evicted;
    while (m_totalBytes > targetBytes && !m_lru.empty()) {
        Entry& oldest = m_lru.back();
        m_totalBytes -= oldest.sizeBytes;
        m_pendingTouches.erase(oldest.key);
        m_index.erase(oldest.key);
        evicted.push_back(oldest.key);
        // Readers holding the payload keep their own reference; only the index entry goes
        m_lru.pop_back();
    }

    if (!evicted.empty()) {
        if (!m_db.deleteCacheEntries(evicted)) {
            LOG_WARN("Failed to delete " << evicted.size() << " evicted cache rows");
        }
        DEBUG_LOG("Evicted " << evicted.size() << " cache entries, total now " << m_totalBytes);
    }
    return evicted.size();
}

CachePayload CacheManager::getOrCreate(const std::string& key, const CacheGenerator& generator) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto found = m_index.find(key);
        if (found != m_index.end()) {
            touchLocked(found->second);
            if (auto resident = found->second->resident.lock()) {
                return resident;
            }
            lock.unlock();

            // Read the bytes without holding the index lock
            auto bytes = m_db.getCachePayload(key);
            if (bytes) {
                auto payload = std::make_shared<const std::vector<uint8_t>>(std::move(*bytes));
                lock.lock();
                auto again = m_index.find(key);
                if (again != m_index.end()) {
                    again->second->resident = payload;
                }
                return payload;
            }

            // Row disappeared underneath the index; drop it and regenerate
            LOG_WARN("Cache row missing for indexed key " << key << ", regenerating");
            lock.lock();
            auto stale = m_index.find(key);
            if (stale != m_index.end()) {
                m_totalBytes -= stale->second->sizeBytes;
                m_pendingTouches.erase(key);
                m_lru.erase(stale->second);
                m_index.erase(stale);
            }
        }
    }

    std::vector<uint8_t> generated;
    try {
        generated = generator();
    } catch (const MediaError& e) {
        if (e.kind() == ErrorKind::CacheGeneration) throw;
        throw MediaError(ErrorKind::CacheGeneration, key + ": " + e.what());
    } catch (const std::exception& e) {
        throw MediaError(ErrorKind::CacheGeneration, key + ": " + e.what());
    }

    auto payload = std::make_shared<const std::vector<uint8_t>>(std::move(generated));
    uint64_t size = payload->size();

    std::lock_guard<std::mutex> lock(m_mutex);

    // Another caller may have generated the same key while we were unlocked
    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        touchLocked(existing->second);
        if (existing->second->resident.expired()) {
            existing->second->resident = payload;
        }
        return payload;
    }

    if (size > m_maxSizeBytes) {
        LOG_WARN("Payload for " << key << " (" << size << " bytes) exceeds the cache budget, not cached");
        return payload;
    }

    Entry entry;
    entry.key = key;
    entry.sizeBytes = size;
    entry.lastAccess = nextStamp();
    entry.insertSeq = m_nextInsertSeq++;
    entry.resident = payload;

    if (!m_db.putCacheEntry(key, *payload, entry.lastAccess, entry.insertSeq)) {
        LOG_WARN("Failed to persist cache entry " << key << ", returning uncached payload");
        return payload;
    }

    m_lru.push_front(std::move(entry));
    m_index[key] = m_lru.begin();
    m_totalBytes += size;

    if (m_totalBytes > m_maxSizeBytes) {
        evictLocked(static_cast<uint64_t>(m_maxSizeBytes * m_lowWatermark));
    }
    return payload;
}

size_t CacheManager::prune(double targetRatio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushRecencyLocked();
    double ratio = std::clamp(targetRatio, 0.0, 1.0);
    size_t evicted = evictLocked(static_cast<uint64_t>(m_maxSizeBytes * ratio));
    LOG_INFO("Cache pruned to " << m_totalBytes << " bytes (" << evicted << " entries evicted)");
    return evicted;
}

CacheStats CacheManager::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return CacheStats{m_totalBytes, m_lru.size()};
}

bool CacheManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(key) > 0;
}

} // namespace MediaOrganizer
