#include "scanner.hpp"
#include "cache_manager.hpp"
#include "database.hpp"
#include "debug.hpp"
#include "errors.hpp"
#include "metadata_provider.hpp"
#include <algorithm>

namespace MediaOrganizer {

Scanner::Scanner(Database& db, CacheManager& cache, MetadataProvider& provider, ScanConfig config,
                 std::string holdingDirName)
    : m_db(db)
    , m_cache(cache)
    , m_provider(provider)
    , m_config(std::move(config))
    , m_holdingDirName(std::move(holdingDirName)) {
    for (auto& ext : m_config.extensions) {
        ext = toLower(ext);
        if (!ext.empty() && ext[0] != '.') ext.insert(ext.begin(), '.');
    }
}

Scanner::~Scanner() {
    stopScan();
}

void Scanner::reset() {
    stopScan();

    m_isScanning = true;
    m_stopRequested = false;
    m_isComplete = false;
    m_filesDone = 0;
    m_filesTotal = 0;

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_pending = {};
        m_listingDone = false;
    }
    {
        std::lock_guard<std::mutex> lock(m_resultsMutex);
        m_results.clear();
        m_summary = ScanSummary{};
    }
}

void Scanner::startScan(const std::filesystem::path& directory, bool recursive) {
    reset();
    m_scanThread = std::jthread([this, directory, recursive]() {
        scanThread(directory, recursive);
    });
}

void Scanner::resumePending() {
    reset();
    m_scanThread = std::jthread([this]() {
        scanThread(std::nullopt, false);
    });
}

void Scanner::stopScan() {
    m_stopRequested = true;
    m_queueCv.notify_all();
    if (m_scanThread.joinable()) {
        m_scanThread.join();
    }
    m_isScanning = false;
}

std::pair<int, int> Scanner::getProgress() const {
    return {m_filesDone.load(), m_filesTotal.load()};
}

std::vector<FileRecord> Scanner::pollResults() {
    std::lock_guard<std::mutex> lock(m_resultsMutex);
    std::vector<FileRecord> drained(std::make_move_iterator(m_results.begin()),
                                    std::make_move_iterator(m_results.end()));
    m_results.clear();
    return drained;
}

std::optional<FileRecord> Scanner::next() {
    std::unique_lock<std::mutex> lock(m_resultsMutex);
    m_resultsCv.wait(lock, [this] { return !m_results.empty() || m_isComplete.load(); });
    if (m_results.empty()) {
        return std::nullopt;
    }
    FileRecord record = std::move(m_results.front());
    m_results.pop_front();
    return record;
}

ScanSummary Scanner::wait() {
    std::unique_lock<std::mutex> lock(m_resultsMutex);
    m_resultsCv.wait(lock, [this] { return m_isComplete.load(); });
    return m_summary;
}

bool Scanner::isMediaFile(const std::filesystem::path& path) const {
    std::string ext = toLower(path.extension().string());
    return std::find(m_config.extensions.begin(), m_config.extensions.end(), ext) != m_config.extensions.end();
}

bool Scanner::isHoldingArea(const std::filesystem::directory_entry& entry) const {
    std::error_code ec;
    return !m_holdingDirName.empty() && entry.path().filename() == m_holdingDirName && entry.is_directory(ec);
}

void Scanner::publish(const FileRecord& record) {
    {
        std::lock_guard<std::mutex> lock(m_resultsMutex);
        m_results.push_back(record);
    }
    m_resultsCv.notify_all();
}

void Scanner::finishOne(bool enriched) {
    {
        std::lock_guard<std::mutex> lock(m_resultsMutex);
        if (enriched) {
            ++m_summary.enriched;
        } else {
            ++m_summary.failed;
        }
    }
    ++m_filesDone;
    if (m_progressCallback) {
        m_progressCallback(m_filesDone.load(), m_filesTotal.load());
    }
}

void Scanner::admit(FileRecord record) {
    ++m_filesTotal;

    auto known = m_db.getFileByPath(record.path);
    if (known && known->fingerprint == record.fingerprint && known->scanState == ScanState::Enriched) {
        // Unchanged since the last scan
        publish(*known);
        finishOne(true);
        return;
    }

    record.scanState = ScanState::Pending;
    record.metadata.reset();
    if (!m_db.upsertFile(record)) {
        LOG_WARN("Failed to store record for " << record.path);
    }
    publish(record);

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_pending.push(std::move(record));
    }
    m_queueCv.notify_one();
}

void Scanner::listDirectory(const std::filesystem::path& directory, bool recursive,
                            std::set<std::string>& seen) {
    SCOPED_TIMER_THRESHOLD("listDirectory", 1000);

    auto visit = [&](const std::filesystem::directory_entry& entry) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || !isMediaFile(entry.path())) return;

        auto record = statFileRecord(entry.path());
        if (!record) {
            DEBUG_LOG("Cannot stat " << entry.path() << ", skipping");
            return;
        }
        seen.insert(record->path.string());
        {
            std::lock_guard<std::mutex> lock(m_resultsMutex);
            ++m_summary.listed;
        }
        admit(std::move(*record));
    };

    try {
        auto options = std::filesystem::directory_options::skip_permission_denied;

        if (recursive) {
            for (auto it = std::filesystem::recursive_directory_iterator(directory, options);
                 it != std::filesystem::recursive_directory_iterator(); ++it) {
                if (m_stopRequested) return;
                if (isHoldingArea(*it)) {
                    it.disable_recursion_pending();
                    continue;
                }
                visit(*it);
            }
        } else {
            for (const auto& entry : std::filesystem::directory_iterator(directory, options)) {
                if (m_stopRequested) return;
                visit(entry);
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_WARN("Filesystem error while listing " << directory << ": " << e.what());
    }
}

void Scanner::enrich(FileRecord record) {
    try {
        CachePayload payload = m_cache.getOrCreate(CacheManager::metadataKey(record.fingerprint), [&]() {
            std::string text = serializeMetadata(m_provider.read(record.path));
            return std::vector<uint8_t>(text.begin(), text.end());
        });

        auto metadata = deserializeMetadata(std::string(payload->begin(), payload->end()));
        if (!metadata) {
            throw MediaError(ErrorKind::CacheGeneration, "cached metadata is unreadable");
        }
        record.metadata = std::move(*metadata);
        record.scanState = ScanState::Enriched;
    } catch (const MediaError& e) {
        LOG_WARN("Metadata extraction failed for " << record.path << ": " << e.what());
        record.metadata.reset();
        record.scanState = ScanState::Failed;
    }

    if (!m_db.upsertFile(record)) {
        LOG_WARN("Failed to store record for " << record.path);
    }
    bool enriched = record.scanState == ScanState::Enriched;
    publish(record);
    finishOne(enriched);
}

void Scanner::workerLoop() {
    while (true) {
        FileRecord record;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this] {
                return m_stopRequested.load() || !m_pending.empty() || m_listingDone;
            });
            if (m_stopRequested || m_pending.empty()) {
                return;
            }
            record = std::move(m_pending.front());
            m_pending.pop();
        }
        enrich(std::move(record));
    }
}

void Scanner::scanThread(std::optional<std::filesystem::path> directory, bool recursive) {
    DEBUG_LOG("scanThread starting: " << (directory ? directory->string() : "<pending>")
              << " recursive=" << recursive);

    std::vector<std::jthread> workers;
    int workerCount = std::max(1, m_config.workers);
    for (int i = 0; i < workerCount; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }

    if (directory) {
        std::set<std::string> seen;
        listDirectory(*directory, recursive, seen);

        // A partial listing must not mark the unlisted remainder Stale
        if (!m_stopRequested) {
            int stale = m_db.markUnseenStale(*directory, recursive, seen);
            {
                std::lock_guard<std::mutex> lock(m_resultsMutex);
                m_summary.stale = stale;
            }
            if (stale > 0) {
                LOG_INFO(stale << " known files under " << *directory << " are no longer present");
            }
        }
    } else {
        for (auto& record : m_db.getFilesByState(ScanState::Pending)) {
            if (m_stopRequested) break;
            admit(std::move(record));
        }
    }

    DEBUG_LOG("Listing finished: " << m_filesTotal.load() << " media files");

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_listingDone = true;
    }
    m_queueCv.notify_all();
    workers.clear();

    ScanSummary summary;
    {
        std::lock_guard<std::mutex> lock(m_resultsMutex);
        m_summary.stopped = m_stopRequested.load();
        summary = m_summary;
        m_isComplete = true;
    }
    m_isScanning = false;
    m_resultsCv.notify_all();

    LOG_INFO("Scan complete: " << summary.listed << " listed, " << summary.enriched << " enriched, "
             << summary.failed << " failed" << (summary.stopped ? " (stopped)" : ""));

    if (m_completeCallback) {
        m_completeCallback(summary);
    }
}

} // namespace MediaOrganizer
