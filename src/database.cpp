#include "database.hpp"
#include "debug.hpp"

namespace MediaOrganizer {

// Helper to safely get text from SQLite column (returns empty string if NULL)
static inline std::string safeColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

static inline void bindPath(sqlite3_stmt* stmt, int index, const std::filesystem::path& path) {
    std::string pathStr = path.string();
    sqlite3_bind_text(stmt, index, pathStr.c_str(), -1, SQLITE_TRANSIENT);
}

static inline void bindText(sqlite3_stmt* stmt, int index, const std::string& text) {
    sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT);
}

static inline void bindOptionalError(sqlite3_stmt* stmt, int kindIndex, int messageIndex,
                                     const std::optional<OperationError>& error) {
    if (error) {
        bindText(stmt, kindIndex, errorKindName(error->kind));
        bindText(stmt, messageIndex, error->message);
    } else {
        sqlite3_bind_null(stmt, kindIndex);
        sqlite3_bind_null(stmt, messageIndex);
    }
}

static std::optional<OperationError> readOptionalError(sqlite3_stmt* stmt, int kindCol, int messageCol) {
    if (sqlite3_column_type(stmt, kindCol) == SQLITE_NULL) {
        return std::nullopt;
    }
    return OperationError{errorKindFromName(safeColumnText(stmt, kindCol)), safeColumnText(stmt, messageCol)};
}

static std::string directoryPrefix(const std::filesystem::path& directory) {
    std::string prefix = directory.lexically_normal().string();
    if (prefix.empty() || prefix.back() != '/') prefix += '/';
    return prefix;
}

// Columns: path, fingerprint, file_size, modified_time, scan_state, metadata
static FileRecord readFileRow(sqlite3_stmt* stmt) {
    FileRecord file;
    file.path = safeColumnText(stmt, 0);
    file.fingerprint = safeColumnText(stmt, 1);
    file.size = static_cast<uintmax_t>(sqlite3_column_int64(stmt, 2));
    file.modifiedTime = sqlite3_column_int64(stmt, 3);
    file.scanState = scanStateFromName(safeColumnText(stmt, 4));
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        file.metadata = deserializeMetadata(safeColumnText(stmt, 5));
    }
    return file;
}

Database::Database() = default;

Database::~Database() {
    close();
}

bool Database::open(const std::filesystem::path& dbPath) {
    if (m_db) {
        close();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_dbPath = dbPath;
    m_corrupt = false;
    m_corruptionDetail.clear();

    // Create parent directory if it doesn't exist
    std::error_code ec;
    if (dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path(), ec);
    }

    int rc = sqlite3_open(dbPath.string().c_str(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to open database: " << sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!checkIntegrity()) {
        LOG_ERROR("Database " << dbPath << " is corrupt: " << m_corruptionDetail
                  << " (left untouched; commits are refused until it is repaired)");
        return true;
    }

    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = NORMAL;");
    execute("PRAGMA foreign_keys = ON;");

    createTables();

    DEBUG_LOG("Database opened: " << dbPath);
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        DEBUG_LOG("Database closed");
    }
}

bool Database::checkIntegrity() {
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA quick_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_corrupt = true;
        m_corruptionDetail = sqlite3_errmsg(m_db);
        return false;
    }

    std::string firstRow;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        firstRow = safeColumnText(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        m_corruptionDetail = sqlite3_errmsg(m_db);
    }
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW && firstRow == "ok") {
        return true;
    }

    m_corrupt = true;
    if (m_corruptionDetail.empty()) {
        m_corruptionDetail = firstRow.empty() ? "integrity check returned no result" : firstRow;
    }
    return false;
}

void Database::createTables() {
    // Files table
    execute(R"(
        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT UNIQUE NOT NULL,
            fingerprint TEXT NOT NULL,
            file_size INTEGER,
            modified_time INTEGER,
            scan_state TEXT NOT NULL DEFAULT 'Pending',
            metadata TEXT,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )");

    // Cache entries table
    execute(R"(
        CREATE TABLE IF NOT EXISTS cache_entries (
            cache_key TEXT PRIMARY KEY,
            payload BLOB NOT NULL,
            size_bytes INTEGER NOT NULL,
            last_access INTEGER NOT NULL,
            insert_seq INTEGER NOT NULL
        );
    )");

    // Batches table
    execute(R"(
        CREATE TABLE IF NOT EXISTS batches (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            state TEXT NOT NULL DEFAULT 'Draft',
            undoable INTEGER NOT NULL DEFAULT 0,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )");

    // Staged operations table
    execute(R"(
        CREATE TABLE IF NOT EXISTS staged_operations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            batch_id INTEGER NOT NULL,
            seq INTEGER NOT NULL,
            kind TEXT NOT NULL,
            source_path TEXT NOT NULL,
            dest_path TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'Staged',
            error_kind TEXT,
            error_message TEXT,
            FOREIGN KEY (batch_id) REFERENCES batches(id) ON DELETE CASCADE
        );
    )");

    // Undo entries table: (applied, inverse) pairs of a committed batch
    execute(R"(
        CREATE TABLE IF NOT EXISTS undo_entries (
            batch_id INTEGER NOT NULL,
            seq INTEGER NOT NULL,
            operation_id INTEGER NOT NULL,
            applied_kind TEXT NOT NULL,
            applied_source TEXT NOT NULL,
            applied_dest TEXT NOT NULL,
            inverse_kind TEXT NOT NULL,
            inverse_source TEXT NOT NULL,
            inverse_dest TEXT NOT NULL,
            undo_status TEXT NOT NULL DEFAULT 'Staged',
            error_kind TEXT,
            error_message TEXT,
            PRIMARY KEY (batch_id, seq),
            FOREIGN KEY (batch_id) REFERENCES batches(id) ON DELETE CASCADE
        );
    )");

    // Create indexes for performance
    execute("CREATE INDEX IF NOT EXISTS idx_files_state ON files(scan_state);");
    execute("CREATE INDEX IF NOT EXISTS idx_files_fingerprint ON files(fingerprint);");
    execute("CREATE INDEX IF NOT EXISTS idx_cache_recency ON cache_entries(last_access, insert_seq);");
    execute("CREATE INDEX IF NOT EXISTS idx_ops_batch ON staged_operations(batch_id, seq);");
}

bool Database::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SQL error: " << (errMsg ? errMsg : sqlite3_errmsg(m_db)));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool Database::beginTransaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

bool Database::commitTransaction() {
    return execute("COMMIT;");
}

void Database::rollbackTransaction() {
    execute("ROLLBACK;");
}

// === File Records ===

bool Database::upsertFile(const FileRecord& file) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        INSERT INTO files (path, fingerprint, file_size, modified_time, scan_state, metadata)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(path) DO UPDATE SET
            fingerprint = excluded.fingerprint,
            file_size = excluded.file_size,
            modified_time = excluded.modified_time,
            scan_state = excluded.scan_state,
            metadata = excluded.metadata,
            updated_at = CURRENT_TIMESTAMP;
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("upsertFile prepare failed: " << sqlite3_errmsg(m_db));
        return false;
    }

    bindPath(stmt, 1, file.path);
    bindText(stmt, 2, file.fingerprint);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(file.size));
    sqlite3_bind_int64(stmt, 4, file.modifiedTime);
    bindText(stmt, 5, scanStateName(file.scanState));
    if (file.metadata) {
        bindText(stmt, 6, serializeMetadata(*file.metadata));
    } else {
        sqlite3_bind_null(stmt, 6);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("upsertFile failed for " << file.path << ": " << sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<FileRecord> Database::getFileByPath(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        SELECT path, fingerprint, file_size, modified_time, scan_state, metadata
        FROM files WHERE path = ?;
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        bindPath(stmt, 1, path);

        if (sqlite3_step(stmt) == SQLITE_ROW) {
            FileRecord file = readFileRow(stmt);
            sqlite3_finalize(stmt);
            return file;
        }
        sqlite3_finalize(stmt);
    }

    return std::nullopt;
}

std::vector<FileRecord> Database::queryFiles(const char* sql, const std::string& bindValue) {
    std::vector<FileRecord> result;
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        bindText(stmt, 1, bindValue);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            result.push_back(readFileRow(stmt));
        }
        sqlite3_finalize(stmt);
    } else {
        LOG_ERROR("queryFiles prepare failed: " << sqlite3_errmsg(m_db));
    }

    return result;
}

std::vector<FileRecord> Database::getFilesByState(ScanState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return queryFiles(R"(
        SELECT path, fingerprint, file_size, modified_time, scan_state, metadata
        FROM files WHERE scan_state = ? ORDER BY path;
    )", scanStateName(state));
}

std::vector<FileRecord> Database::getFilesUnder(const std::filesystem::path& directory, bool recursive) {
    std::string prefix = directoryPrefix(directory);

    std::vector<FileRecord> files;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        files = queryFiles(R"(
            SELECT path, fingerprint, file_size, modified_time, scan_state, metadata
            FROM files WHERE substr(path, 1, length(?1)) = ?1 ORDER BY path;
        )", prefix);
    }

    if (!recursive) {
        auto dir = directory.lexically_normal();
        std::erase_if(files, [&dir](const FileRecord& f) {
            return f.path.parent_path().lexically_normal() != dir;
        });
    }
    return files;
}

int Database::markUnseenStale(const std::filesystem::path& directory, bool recursive,
                              const std::set<std::string>& seenPaths) {
    auto known = getFilesUnder(directory, recursive);

    std::lock_guard<std::mutex> lock(m_mutex);
    int marked = 0;
    if (!beginTransaction()) return 0;

    sqlite3_stmt* stmt;
    const char* sql = "UPDATE files SET scan_state = 'Stale', updated_at = CURRENT_TIMESTAMP WHERE path = ?;";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        rollbackTransaction();
        return 0;
    }

    for (const auto& file : known) {
        if (file.scanState == ScanState::Stale || seenPaths.count(file.path.string())) {
            continue;
        }
        sqlite3_reset(stmt);
        bindPath(stmt, 1, file.path);
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            ++marked;
        }
    }
    sqlite3_finalize(stmt);

    if (!commitTransaction()) {
        rollbackTransaction();
        return 0;
    }
    return marked;
}

int Database::pruneStale(const std::filesystem::path& directory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = "DELETE FROM files WHERE scan_state = 'Stale' AND substr(path, 1, length(?1)) = ?1;";

    int removed = 0;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        bindText(stmt, 1, directoryPrefix(directory));
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            removed = sqlite3_changes(m_db);
        }
        sqlite3_finalize(stmt);
    }

    DEBUG_LOG("Pruned " << removed << " stale records under " << directory);
    return removed;
}

bool Database::setScanState(const std::filesystem::path& path, ScanState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = "UPDATE files SET scan_state = ?, updated_at = CURRENT_TIMESTAMP WHERE path = ?;";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, scanStateName(state));
    bindPath(stmt, 2, path);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool Database::moveFileRecord(const std::filesystem::path& from, const std::filesystem::path& to) {
    auto existing = getFileByPath(from);
    if (!existing) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        UPDATE files SET path = ?, fingerprint = ?, updated_at = CURRENT_TIMESTAMP
        WHERE path = ?;
    )";

    if (!beginTransaction()) return false;

    // A record left behind at the destination (e.g. marked Stale) gives way
    sqlite3_stmt* clear;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM files WHERE path = ?;", -1, &clear, nullptr) == SQLITE_OK) {
        bindPath(clear, 1, to);
        sqlite3_step(clear);
        sqlite3_finalize(clear);
    }

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        rollbackTransaction();
        return false;
    }
    bindPath(stmt, 1, to);
    bindText(stmt, 2, computeFingerprint(to, existing->size, existing->modifiedTime));
    bindPath(stmt, 3, from);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE || !commitTransaction()) {
        rollbackTransaction();
        return false;
    }
    return true;
}

bool Database::copyFileRecord(const std::filesystem::path& from, const std::filesystem::path& to) {
    auto existing = getFileByPath(from);
    if (!existing) {
        return false;
    }

    FileRecord copy = *existing;
    copy.path = to;
    copy.fingerprint = computeFingerprint(to, copy.size, copy.modifiedTime);
    return upsertFile(copy);
}

int Database::getTotalFileCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    int count = 0;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM files;", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return count;
}

// === Cache Entries ===

std::vector<CacheEntryRow> Database::loadCacheIndex() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CacheEntryRow> result;
    sqlite3_stmt* stmt;
    const char* sql = R"(
        SELECT cache_key, size_bytes, last_access, insert_seq
        FROM cache_entries ORDER BY last_access, insert_seq;
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            CacheEntryRow row;
            row.key = safeColumnText(stmt, 0);
            row.sizeBytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
            row.lastAccess = sqlite3_column_int64(stmt, 2);
            row.insertSeq = sqlite3_column_int64(stmt, 3);
            result.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);
    }
    return result;
}

std::optional<std::vector<uint8_t>> Database::getCachePayload(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = "SELECT payload FROM cache_entries WHERE cache_key = ?;";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, key);

    std::optional<std::vector<uint8_t>> payload;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
        int size = sqlite3_column_bytes(stmt, 0);
        payload.emplace(data, data + size);
    }
    sqlite3_finalize(stmt);
    return payload;
}

bool Database::putCacheEntry(const std::string& key, const std::vector<uint8_t>& payload,
                             int64_t lastAccess, int64_t insertSeq) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        INSERT OR REPLACE INTO cache_entries (cache_key, payload, size_bytes, last_access, insert_seq)
        VALUES (?, ?, ?, ?, ?);
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, key);
    sqlite3_bind_blob(stmt, 2, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<int64_t>(payload.size()));
    sqlite3_bind_int64(stmt, 4, lastAccess);
    sqlite3_bind_int64(stmt, 5, insertSeq);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool Database::deleteCacheEntries(const std::vector<std::string>& keys) {
    if (keys.empty()) return true;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM cache_entries WHERE cache_key = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        rollbackTransaction();
        return false;
    }
    for (const auto& key : keys) {
        sqlite3_reset(stmt);
        bindText(stmt, 1, key);
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (!commitTransaction()) {
        rollbackTransaction();
        return false;
    }
    return true;
}

bool Database::touchCacheEntries(const std::vector<std::pair<std::string, int64_t>>& stamps) {
    if (stamps.empty()) return true;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) return false;

    sqlite3_stmt* stmt;
    const char* sql = "UPDATE cache_entries SET last_access = ? WHERE cache_key = ?;";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        rollbackTransaction();
        return false;
    }
    for (const auto& [key, stamp] : stamps) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, stamp);
        bindText(stmt, 2, key);
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (!commitTransaction()) {
        rollbackTransaction();
        return false;
    }
    return true;
}

// === Batches ===

int64_t Database::createBatch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!execute("INSERT INTO batches (state) VALUES ('Draft');")) {
        return -1;
    }
    return sqlite3_last_insert_rowid(m_db);
}

int64_t Database::nextBatchId() {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;

    // sqlite_sequence only exists once an AUTOINCREMENT row was inserted
    int64_t last = 0;
    if (sqlite3_prepare_v2(m_db, "SELECT seq FROM sqlite_sequence WHERE name = 'batches';", -1, &stmt,
                           nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            last = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return last + 1;
}

bool Database::updateBatchStateLocked(int64_t batchId, BatchState state) {
    sqlite3_stmt* stmt;
    const char* sql = "UPDATE batches SET state = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?;";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, batchStateName(state));
    sqlite3_bind_int64(stmt, 2, batchId);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

bool Database::updateBatchState(int64_t batchId, BatchState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return updateBatchStateLocked(batchId, state);
}

std::optional<Batch> Database::loadBatch(int64_t batchId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;

    std::optional<Batch> batch;
    if (sqlite3_prepare_v2(m_db, "SELECT state FROM batches WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, batchId);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            batch.emplace(batchId, batchStateFromName(safeColumnText(stmt, 0)));
        }
        sqlite3_finalize(stmt);
    }
    if (!batch) {
        return std::nullopt;
    }

    const char* sql = R"(
        SELECT id, kind, source_path, dest_path, status, error_kind, error_message
        FROM staged_operations WHERE batch_id = ? ORDER BY seq;
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, batchId);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            StagedOperation op;
            op.id = sqlite3_column_int64(stmt, 0);
            op.batchId = batchId;
            op.kind = operationKindFromName(safeColumnText(stmt, 1));
            op.source = safeColumnText(stmt, 2);
            op.destination = safeColumnText(stmt, 3);
            op.status = operationStatusFromName(safeColumnText(stmt, 4));
            op.error = readOptionalError(stmt, 5, 6);
            batch->operations().push_back(std::move(op));
        }
        sqlite3_finalize(stmt);
    }

    return batch;
}

std::optional<int64_t> Database::findActiveBatch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = "SELECT id FROM batches WHERE state IN ('Draft', 'Committing') ORDER BY id DESC LIMIT 1;";

    std::optional<int64_t> id;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            id = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return id;
}

std::vector<int64_t> Database::findBatchesInState(BatchState state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<int64_t> ids;
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(m_db, "SELECT id FROM batches WHERE state = ? ORDER BY id;", -1, &stmt, nullptr) == SQLITE_OK) {
        bindText(stmt, 1, batchStateName(state));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ids.push_back(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }
    return ids;
}

bool Database::deleteDraftBatch(int64_t batchId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(m_db, "DELETE FROM batches WHERE id = ? AND state = 'Draft';", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, batchId);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

int64_t Database::insertOperation(const StagedOperation& op, int seq) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        INSERT INTO staged_operations (batch_id, seq, kind, source_path, dest_path, status, error_kind, error_message)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, op.batchId);
    sqlite3_bind_int(stmt, 2, seq);
    bindText(stmt, 3, operationKindName(op.kind));
    bindPath(stmt, 4, op.source);
    bindPath(stmt, 5, op.destination);
    bindText(stmt, 6, operationStatusName(op.status));
    bindOptionalError(stmt, 7, 8, op.error);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("insertOperation failed: " << sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool Database::updateOperation(const StagedOperation& op) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        UPDATE staged_operations SET dest_path = ?, status = ?, error_kind = ?, error_message = ?
        WHERE id = ?;
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindPath(stmt, 1, op.destination);
    bindText(stmt, 2, operationStatusName(op.status));
    bindOptionalError(stmt, 3, 4, op.error);
    sqlite3_bind_int64(stmt, 5, op.id);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("updateOperation failed for op " << op.id << ": " << sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

// === Undo Records ===

bool Database::revokeUndoLocked() {
    return execute("UPDATE batches SET undoable = 0 WHERE undoable = 1;");
}

bool Database::revokeUndo() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return revokeUndoLocked();
}

bool Database::insertUndoEntryLocked(int64_t batchId, const UndoEntry& entry) {
    sqlite3_stmt* stmt;
    const char* sql = R"(
        INSERT OR REPLACE INTO undo_entries (batch_id, seq, operation_id,
            applied_kind, applied_source, applied_dest,
            inverse_kind, inverse_source, inverse_dest,
            undo_status, error_kind, error_message)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, batchId);
    sqlite3_bind_int(stmt, 2, entry.seq);
    sqlite3_bind_int64(stmt, 3, entry.applied.id);
    bindText(stmt, 4, operationKindName(entry.applied.kind));
    bindPath(stmt, 5, entry.applied.source);
    bindPath(stmt, 6, entry.applied.destination);
    bindText(stmt, 7, operationKindName(entry.inverse.kind));
    bindPath(stmt, 8, entry.inverse.source);
    bindPath(stmt, 9, entry.inverse.destination);
    bindText(stmt, 10, operationStatusName(entry.undoStatus));
    bindOptionalError(stmt, 11, 12, entry.undoError);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool Database::finishCommit(const UndoRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!beginTransaction()) return false;

    bool ok = revokeUndoLocked();
    for (const auto& entry : record.entries) {
        ok = ok && insertUndoEntryLocked(record.batchId, entry);
    }
    ok = ok && updateBatchStateLocked(record.batchId, BatchState::Committed);

    if (ok) {
        sqlite3_stmt* stmt;
        ok = sqlite3_prepare_v2(m_db, "UPDATE batches SET undoable = 1 WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_int64(stmt, 1, record.batchId);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_finalize(stmt);
        }
    }

    if (!ok || !commitTransaction()) {
        LOG_ERROR("finishCommit failed for batch " << record.batchId << ": " << sqlite3_errmsg(m_db));
        rollbackTransaction();
        return false;
    }
    return true;
}

std::optional<UndoRecord> Database::loadUndoRecord(int64_t batchId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;

    UndoRecord record;
    record.batchId = batchId;
    bool found = false;

    if (sqlite3_prepare_v2(m_db, "SELECT undoable, state FROM batches WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, batchId);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            BatchState state = batchStateFromName(safeColumnText(stmt, 1));
            found = state == BatchState::Committed || state == BatchState::Undoing || state == BatchState::Undone;
            record.undoable = sqlite3_column_int(stmt, 0) != 0;
        }
        sqlite3_finalize(stmt);
    }
    if (!found) {
        return std::nullopt;
    }

    const char* sql = R"(
        SELECT seq, operation_id, applied_kind, applied_source, applied_dest,
               inverse_kind, inverse_source, inverse_dest, undo_status, error_kind, error_message
        FROM undo_entries WHERE batch_id = ? ORDER BY seq;
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, batchId);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            UndoEntry entry;
            entry.seq = sqlite3_column_int(stmt, 0);
            entry.applied.id = sqlite3_column_int64(stmt, 1);
            entry.applied.batchId = batchId;
            entry.applied.kind = operationKindFromName(safeColumnText(stmt, 2));
            entry.applied.source = safeColumnText(stmt, 3);
            entry.applied.destination = safeColumnText(stmt, 4);
            entry.applied.status = OperationStatus::Applied;
            entry.inverse.batchId = batchId;
            entry.inverse.kind = operationKindFromName(safeColumnText(stmt, 5));
            entry.inverse.source = safeColumnText(stmt, 6);
            entry.inverse.destination = safeColumnText(stmt, 7);
            entry.undoStatus = operationStatusFromName(safeColumnText(stmt, 8));
            entry.inverse.status = entry.undoStatus;
            entry.undoError = readOptionalError(stmt, 9, 10);
            entry.inverse.error = entry.undoError;
            record.entries.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);
    }

    return record;
}

std::optional<int64_t> Database::undoableBatchId() {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = "SELECT id FROM batches WHERE undoable = 1 AND state = 'Committed' ORDER BY id DESC LIMIT 1;";

    std::optional<int64_t> id;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            id = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    return id;
}

bool Database::updateUndoEntry(int64_t batchId, const UndoEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt;
    const char* sql = R"(
        UPDATE undo_entries SET undo_status = ?, error_kind = ?, error_message = ?
        WHERE batch_id = ? AND seq = ?;
    )";

    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, operationStatusName(entry.undoStatus));
    bindOptionalError(stmt, 2, 3, entry.undoError);
    sqlite3_bind_int64(stmt, 4, batchId);
    sqlite3_bind_int(stmt, 5, entry.seq);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

} // namespace MediaOrganizer
