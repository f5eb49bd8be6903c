#include "library.hpp"
#include "committer.hpp"
#include "database.hpp"
#include "debug.hpp"
#include "metadata_provider.hpp"
#include "scanner.hpp"
#include "undo_log.hpp"

namespace MediaOrganizer {

Library::Library(Config config)
    : Library(config, std::make_unique<LocalFilesystem>(),
              std::make_unique<FfprobeMetadataProvider>(config.commit.networkTimeoutSeconds)) {}

Library::Library(Config config, std::unique_ptr<FilesystemProvider> fs, std::unique_ptr<MetadataProvider> metadata)
    : m_config(std::move(config))
    , m_database(std::make_unique<Database>())
    , m_filesystem(std::move(fs))
    , m_metadata(std::move(metadata)) {
    m_config.validate();
    setLogLevel(parseLogLevel(m_config.logging.level));
}

Library::~Library() {
    shutdown();
}

bool Library::open() {
    DEBUG_LOG("Opening library at " << m_config.databasePath);

    if (!m_database->open(m_config.databasePath)) {
        LOG_ERROR("Failed to open database at " << m_config.databasePath);
        return false;
    }

    m_cache = std::make_unique<CacheManager>(*m_database, m_config.cache.maxSizeBytes,
                                             m_config.cache.lowWatermark, m_config.cache.recencyFlushInterval,
                                             m_config.cache.workDir);
    m_scanner = std::make_unique<Scanner>(*m_database, *m_cache, *m_metadata, m_config.scan,
                                          m_config.commit.holdingDirName);
    m_stager = std::make_unique<OperationStager>(*m_filesystem, *m_database, m_config.commit);
    m_committer = std::make_unique<Committer>(*m_filesystem, *m_database, m_config.commit);
    m_undoLog = std::make_unique<UndoLog>(*m_database);

    if (m_database->isCorrupt()) {
        LOG_ERROR("Library store is corrupted (" << m_database->corruptionDetail()
                  << "); commits and undo are disabled until it is repaired");
        return true;
    }

    int committed = m_committer->recover();
    int undone = m_undoLog->recover();
    if (committed + undone > 0) {
        LOG_WARN("Recovered " << committed << " interrupted commits and " << undone << " interrupted undos");
    }

    m_cache->load();

    auto pending = m_database->getFilesByState(ScanState::Pending);
    if (!pending.empty()) {
        LOG_INFO(pending.size() << " records still await metadata; resumePending() enriches them");
    }

    LOG_INFO("Library opened: " << m_database->getTotalFileCount() << " files known");
    return true;
}

void Library::shutdown() {
    if (m_scanner) {
        m_scanner->stopScan();
    }
    if (m_cache) {
        m_cache->flushRecency();
    }
    m_draft.reset();
    m_undoLog.reset();
    m_committer.reset();
    m_stager.reset();
    m_scanner.reset();
    m_cache.reset();
    if (m_database) {
        m_database->close();
    }
}

bool Library::isCorrupt() const {
    return m_database->isCorrupt();
}

void Library::requireWritable(const char* action) const {
    if (!m_database->isOpen()) {
        throw MediaError(ErrorKind::InvalidBatchState, std::string("library is not open, cannot ") + action);
    }
    if (m_database->isCorrupt()) {
        throw MediaError(ErrorKind::StoreCorrupted, std::string("store is corrupted, refusing to ") + action +
                         ": " + m_database->corruptionDetail());
    }
}

Batch* Library::openDraft() {
    if (m_draft && m_draft->state() == BatchState::Draft) {
        return &*m_draft;
    }
    m_draft.reset();

    if (auto active = m_database->findActiveBatch()) {
        auto batch = m_database->loadBatch(*active);
        if (batch && batch->state() == BatchState::Draft) {
            m_draft = std::move(batch);
            return &*m_draft;
        }
    }
    return nullptr;
}

Batch& Library::draft() {
    if (Batch* open = openDraft()) {
        return *open;
    }

    int64_t id = m_database->createBatch();
    if (id < 0) {
        throw MediaError(ErrorKind::IOError, "failed to create a new batch");
    }
    if (!m_database->revokeUndo()) {
        LOG_WARN("Failed to revoke undo eligibility for earlier batches");
    }
    m_draft = Batch(id, BatchState::Draft);
    DEBUG_LOG("Opened draft batch " << id);
    return *m_draft;
}

std::optional<Batch> Library::activeDraft() {
    if (Batch* open = openDraft()) {
        return *open;
    }
    return std::nullopt;
}

bool Library::discardDraft() {
    requireWritable("discard");

    auto open = activeDraft();
    m_draft.reset();
    if (!open) return false;

    if (!m_database->deleteDraftBatch(open->id())) {
        LOG_WARN("Failed to discard draft batch " << open->id());
        return false;
    }
    LOG_INFO("Discarded draft batch " << open->id());
    return true;
}

FileRecord Library::resolveRecord(const std::filesystem::path& path) {
    auto normalized = path.lexically_normal();
    if (auto known = m_database->getFileByPath(normalized)) {
        return *known;
    }

    auto fresh = statFileRecord(normalized);
    if (!fresh) {
        throw MediaError(ErrorKind::NotFound, "no such file: " + normalized.string());
    }
    if (!m_database->upsertFile(*fresh)) {
        LOG_WARN("Failed to record " << normalized);
    }
    return *fresh;
}

StageOutcome Library::stage(StageRequest request) {
    requireWritable("stage");
    request.record = resolveRecord(request.record.path);

    if (Batch* open = openDraft()) {
        return m_stager->stage(*open, request);
    }

    // No draft is opened (and undo stays available) until an operation is actually staged
    Batch upcoming(m_database->nextBatchId(), BatchState::Draft);
    StageOutcome outcome;
    outcome.preview = m_stager->preview(upcoming, request);
    if (request.dryRun || outcome.preview.noOp) {
        return outcome;
    }
    if (outcome.preview.conflict) {
        throw MediaError(outcome.preview.conflict->kind, outcome.preview.conflict->message);
    }
    return m_stager->stage(draft(), request);
}

StageOutcome Library::stage(const std::filesystem::path& path, OperationKind kind, const std::string& nameTemplate,
                            bool dryRun, const std::filesystem::path& destinationDir) {
    StageRequest request;
    request.kind = kind;
    request.record.path = path;
    request.nameTemplate = nameTemplate;
    request.destinationDir = destinationDir;
    request.dryRun = dryRun;
    return stage(std::move(request));
}

BatchResult Library::commit(const CancellationToken& cancel, const ProgressCallback& progress) {
    requireWritable("commit");

    Batch* open = openDraft();
    if (!open) {
        throw MediaError(ErrorKind::InvalidBatchState, "no draft batch to commit");
    }
    if (open->operations().empty()) {
        throw MediaError(ErrorKind::InvalidBatchState,
                         "draft batch " + std::to_string(open->id()) + " has no staged operations");
    }

    BatchResult result;
    try {
        result = m_committer->commit(*open, cancel, progress);
    } catch (const std::exception&) {
        // The store decides what state the batch is in; reload it on next use
        m_draft.reset();
        throw;
    }
    m_draft.reset();
    return result;
}

BatchResult Library::undo(const CancellationToken& cancel, const ProgressCallback& progress) {
    requireWritable("undo");

    auto id = m_undoLog->undoableBatch();
    if (!id) {
        throw MediaError(ErrorKind::StaleBatch, "no committed batch is eligible for undo");
    }
    return m_undoLog->undo(*id, *m_committer, cancel, progress);
}

BatchResult Library::undo(int64_t batchId, const CancellationToken& cancel, const ProgressCallback& progress) {
    requireWritable("undo");
    return m_undoLog->undo(batchId, *m_committer, cancel, progress);
}

BatchSummary Library::summary(int64_t batchId) const {
    auto batch = m_database->loadBatch(batchId);
    if (!batch) {
        throw MediaError(ErrorKind::NotFound, "no batch with id " + std::to_string(batchId));
    }
    return m_committer->summarize(*batch);
}

int Library::purgeHoldingArea(const std::filesystem::path& directory) {
    requireWritable("purge");
    return m_committer->purgeHoldingArea(directory.lexically_normal(), m_undoLog->undoableBatch());
}

std::optional<UndoRecord> Library::undoRecord(int64_t batchId) const {
    if (!m_undoLog) return std::nullopt;
    return m_undoLog->record(batchId);
}

std::optional<int64_t> Library::undoableBatch() const {
    if (!m_undoLog) return std::nullopt;
    return m_undoLog->undoableBatch();
}

Scanner& Library::scan(const std::filesystem::path& directory) {
    requireWritable("scan");
    m_scanner->startScan(directory.lexically_normal());
    return *m_scanner;
}

Scanner& Library::resumePending() {
    requireWritable("scan");
    m_scanner->resumePending();
    return *m_scanner;
}

int Library::pruneStale(const std::filesystem::path& directory) {
    requireWritable("prune");
    int removed = m_database->pruneStale(directory.lexically_normal());
    LOG_INFO("Pruned " << removed << " stale records under " << directory);
    return removed;
}

std::optional<FileRecord> Library::record(const std::filesystem::path& path) const {
    return m_database->getFileByPath(path.lexically_normal());
}

CacheStats Library::cacheStats() const {
    return m_cache ? m_cache->stats() : CacheStats{};
}

size_t Library::pruneCache() {
    return m_cache ? m_cache->prune() : 0;
}

CachePayload Library::thumbnail(const std::filesystem::path& path) {
    requireWritable("render thumbnails");
    if (!m_thumbnailRenderer) {
        throw MediaError(ErrorKind::CacheGeneration, "thumbnail rendering is not available in this build");
    }

    FileRecord record = resolveRecord(path);
    return m_cache->getOrCreate(CacheManager::thumbnailKey(record.fingerprint), [this, &record]() {
        return m_thumbnailRenderer(record);
    });
}

} // namespace MediaOrganizer
