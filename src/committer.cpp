#include "committer.hpp"
#include "database.hpp"
#include "debug.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace MediaOrganizer {

namespace {

// Assumed share throughput when no bandwidth limit is configured
constexpr double kAssumedBytesPerSecond = 100.0 * 1024 * 1024;
constexpr double kRenameSeconds = 1.0;

} // namespace

Committer::Committer(FilesystemProvider& fs, Database& db, CommitConfig config)
    : m_fs(fs), m_db(db), m_config(std::move(config)) {
    if (m_config.chunkSizeBytes == 0) {
        m_config.chunkSizeBytes = 64ull * 1024 * 1024;
    }
}

std::filesystem::path Committer::tempPathFor(const std::filesystem::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".partial");
}

void Committer::discardTemp(const std::filesystem::path& temp) {
    if (!m_fs.exists(temp)) return;
    if (auto err = m_fs.remove(temp)) {
        LOG_ERROR("Could not remove partial file " << temp << ": " << err->message);
    }
}

std::optional<OperationError> Committer::ensureParent(const std::filesystem::path& destination) {
    auto parent = destination.parent_path();
    if (parent.empty() || m_fs.exists(parent)) {
        return std::nullopt;
    }
    return m_fs.createDirectories(parent);
}

std::optional<OperationError> Committer::streamCopy(const std::filesystem::path& source,
                                                    const std::filesystem::path& destination,
                                                    const CancellationToken& cancel,
                                                    const ProgressCallback& progress) {
    SCOPED_TIMER_THRESHOLD("streamCopy", 5000);

    auto total = m_fs.fileSize(source);
    if (!total) {
        return OperationError{ErrorKind::NotFound, "cannot read size of " + source.string()};
    }

    auto temp = tempPathFor(destination);
    discardTemp(temp);

    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(m_config.chunkSizeBytes,
                                                                    std::max<uint64_t>(*total, 1))));
    auto started = std::chrono::steady_clock::now();
    uint64_t copied = 0;
    do {
        throttle(started, copied, cancel);
        if (!cancel.waitWhilePaused()) {
            discardTemp(temp);
            return OperationError{ErrorKind::Cancelled,
                                  "cancelled after " + std::to_string(copied) + " of " +
                                  std::to_string(*total) + " bytes"};
        }

        ChunkResult chunk = m_fs.copyChunk(source, copied, temp, buffer);
        if (chunk.error) {
            discardTemp(temp);
            return chunk.error;
        }
        if (chunk.bytesWritten == 0) {
            break;
        }
        copied += chunk.bytesWritten;
        if (progress) {
            progress(copied, *total);
        }
    } while (copied < *total);

    auto written = m_fs.fileSize(temp);
    if (copied != *total || !written || *written != *total) {
        discardTemp(temp);
        return OperationError{ErrorKind::IOError,
                              "copied " + std::to_string(written.value_or(copied)) + " of " +
                              std::to_string(*total) + " bytes from " + source.string()};
    }

    if (auto err = m_fs.rename(temp, destination)) {
        discardTemp(temp);
        return err;
    }
    m_bytesCopied += copied;
    return std::nullopt;
}

void Committer::throttle(std::chrono::steady_clock::time_point started, uint64_t copied,
                         const CancellationToken& cancel) const {
    if (m_config.bandwidthLimitBytesPerSec == 0 || copied == 0) return;

    auto allowed = std::chrono::duration<double>(static_cast<double>(copied) / m_config.bandwidthLimitBytesPerSec);
    auto due = started + std::chrono::duration_cast<std::chrono::steady_clock::duration>(allowed);

    // Sleep in slices so cancellation stays responsive
    while (!cancel.isCancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= due) break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(due - now,
                                                                                   std::chrono::milliseconds(100)));
    }
}

std::optional<OperationError> Committer::applyFilesystem(const StagedOperation& op,
                                                         const CancellationToken& cancel,
                                                         const ProgressCallback& progress) {
    if (!cancel.waitWhilePaused()) {
        return OperationError{ErrorKind::Cancelled, "cancelled before start"};
    }
    if (!m_fs.exists(op.source)) {
        return OperationError{ErrorKind::NotFound, "source no longer exists: " + op.source.string()};
    }
    if (!op.destination.empty() && m_fs.exists(op.destination)) {
        return OperationError{ErrorKind::Collision, "destination exists: " + op.destination.string()};
    }

    switch (op.kind) {
        case OperationKind::Rename:
            return m_fs.rename(op.source, op.destination);

        case OperationKind::Move: {
            if (auto err = ensureParent(op.destination)) return err;
            if (m_fs.sameVolume(op.source, op.destination)) {
                return m_fs.rename(op.source, op.destination);
            }
            if (auto err = streamCopy(op.source, op.destination, cancel, progress)) return err;
            if (auto err = m_fs.remove(op.source)) {
                // Leave the source as the single copy rather than duplicating the file
                if (auto undoErr = m_fs.remove(op.destination)) {
                    LOG_ERROR("Could not remove copied " << op.destination << ": " << undoErr->message);
                }
                return err;
            }
            return std::nullopt;
        }

        case OperationKind::Copy:
            if (auto err = ensureParent(op.destination)) return err;
            return streamCopy(op.source, op.destination, cancel, progress);

        case OperationKind::Delete:
            if (op.destination.empty()) {
                return m_fs.remove(op.source);
            }
            if (auto err = ensureParent(op.destination)) return err;
            return m_fs.rename(op.source, op.destination);
    }
    return OperationError{ErrorKind::IOError, "unknown operation kind"};
}

void Committer::updateRecords(const StagedOperation& applied) {
    switch (applied.kind) {
        case OperationKind::Rename:
        case OperationKind::Move:
            if (m_db.getFileByPath(applied.source)) {
                if (!m_db.moveFileRecord(applied.source, applied.destination)) {
                    LOG_WARN("Failed to re-key record " << applied.source << " -> " << applied.destination);
                }
            } else if (auto restored = m_db.getFileByPath(applied.destination)) {
                // Back from the holding area
                if (restored->scanState == ScanState::Stale &&
                    !m_db.setScanState(applied.destination,
                                       restored->metadata ? ScanState::Enriched : ScanState::Pending)) {
                    LOG_WARN("Failed to restore record " << applied.destination);
                }
            }
            break;
        case OperationKind::Copy:
            if (m_db.getFileByPath(applied.source) && !m_db.copyFileRecord(applied.source, applied.destination)) {
                LOG_WARN("Failed to add record for copy " << applied.destination);
            }
            break;
        case OperationKind::Delete:
            if (m_db.getFileByPath(applied.source) && !m_db.setScanState(applied.source, ScanState::Stale)) {
                LOG_WARN("Failed to mark " << applied.source << " Stale");
            }
            break;
    }
}

std::optional<OperationError> Committer::apply(const StagedOperation& op, const CancellationToken& cancel,
                                               const ProgressCallback& progress) {
    auto err = applyFilesystem(op, cancel, progress);
    if (err) {
        LOG_WARN(operationKindName(op.kind) << " " << op.source << " failed: "
                 << errorKindName(err->kind) << ": " << err->message);
        return err;
    }
    DEBUG_LOG("Applied " << operationKindName(op.kind) << " " << op.source << " -> " << op.destination);
    updateRecords(op);
    return std::nullopt;
}

BatchResult Committer::commit(Batch& batch, const CancellationToken& cancel, const ProgressCallback& progress) {
    if (m_db.isCorrupt()) {
        throw MediaError(ErrorKind::StoreCorrupted, "store failed its integrity check, refusing to commit: " +
                         m_db.corruptionDetail());
    }

    batch.transitionTo(BatchState::Committing);
    if (!m_db.updateBatchState(batch.id(), BatchState::Committing)) {
        throw MediaError(ErrorKind::IOError, "failed to record Committing state for batch " + std::to_string(batch.id()));
    }

    LOG_INFO("Committing batch " << batch.id() << " (" << batch.operations().size() << " operations)");

    auto started = std::chrono::steady_clock::now();
    uint64_t bytesBefore = m_bytesCopied;

    BatchResult result;
    result.batchId = batch.id();
    UndoRecord record;
    record.batchId = batch.id();
    record.undoable = true;

    int seq = 0;
    for (auto& op : batch.operations()) {
        int index = seq++;
        if (op.status != OperationStatus::Staged) continue;

        auto err = apply(op, cancel, progress);
        if (err) {
            op.status = OperationStatus::Failed;
            op.error = err;
            result.failed.emplace_back(op, *err);
        } else {
            op.status = OperationStatus::Applied;
            op.error.reset();
            result.succeeded.push_back(op);
            if (auto inverse = inverseOf(op)) {
                UndoEntry entry;
                entry.seq = index;
                entry.applied = op;
                entry.inverse = *inverse;
                record.entries.push_back(std::move(entry));
            }
        }

        if (!m_db.updateOperation(op)) {
            LOG_ERROR("Failed to persist outcome of operation " << op.id);
        }
    }

    batch.transitionTo(BatchState::Committed);
    if (!m_db.finishCommit(record)) {
        // Recovery on the next start finishes a batch left in Committing
        LOG_ERROR("Batch " << batch.id() << " applied but its undo record was not stored");
    }

    result.bytesCopied = m_bytesCopied - bytesBefore;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    LOG_INFO("Batch " << batch.id() << " committed: " << result.succeeded.size() << " succeeded, "
             << result.failed.size() << " failed, " << result.bytesCopied << " bytes copied in "
             << result.duration.count() << " ms");
    return result;
}

bool Committer::looksApplied(const StagedOperation& op) const {
    switch (op.kind) {
        case OperationKind::Rename:
        case OperationKind::Move:
            return !m_fs.exists(op.source) && m_fs.exists(op.destination);
        case OperationKind::Copy:
            return m_fs.exists(op.destination);
        case OperationKind::Delete:
            if (op.destination.empty()) return !m_fs.exists(op.source);
            return !m_fs.exists(op.source) && m_fs.exists(op.destination);
    }
    return false;
}

int Committer::recover() {
    int recovered = 0;
    for (int64_t batchId : m_db.findBatchesInState(BatchState::Committing)) {
        auto batch = m_db.loadBatch(batchId);
        if (!batch) continue;

        LOG_WARN("Recovering batch " << batchId << " interrupted while committing");

        UndoRecord record;
        record.batchId = batchId;
        record.undoable = true;

        int seq = 0;
        for (auto& op : batch->operations()) {
            int index = seq++;
            if (op.status == OperationStatus::Staged) {
                if (looksApplied(op)) {
                    op.status = OperationStatus::Applied;
                    updateRecords(op);
                } else {
                    op.status = OperationStatus::Failed;
                    op.error = OperationError{ErrorKind::IOError, "interrupted"};
                    if ((op.kind == OperationKind::Move || op.kind == OperationKind::Copy) &&
                        !op.destination.empty()) {
                        discardTemp(tempPathFor(op.destination));
                    }
                }
                if (!m_db.updateOperation(op)) {
                    LOG_ERROR("Failed to persist recovered operation " << op.id);
                }
            }

            if (op.status == OperationStatus::Applied) {
                if (auto inverse = inverseOf(op)) {
                    UndoEntry entry;
                    entry.seq = index;
                    entry.applied = op;
                    entry.inverse = *inverse;
                    record.entries.push_back(std::move(entry));
                }
            }
        }

        if (m_db.finishCommit(record)) {
            ++recovered;
        }
    }
    return recovered;
}

bool Committer::streams(const StagedOperation& op) const {
    switch (op.kind) {
        case OperationKind::Copy:
            return true;
        case OperationKind::Move:
            return !m_fs.sameVolume(op.source, op.destination);
        default:
            return false;
    }
}

uint64_t Committer::operationBytes(const StagedOperation& op) const {
    if (op.kind != OperationKind::Move && op.kind != OperationKind::Copy) return 0;
    if (auto size = m_fs.fileSize(op.source)) return *size;
    // An applied Move leaves only the destination
    return m_fs.fileSize(op.destination).value_or(0);
}

double Committer::estimateSeconds(const StagedOperation& op) const {
    if (!streams(op)) return kRenameSeconds;
    double rate = m_config.bandwidthLimitBytesPerSec > 0 ? static_cast<double>(m_config.bandwidthLimitBytesPerSec)
                                                         : kAssumedBytesPerSecond;
    return static_cast<double>(operationBytes(op)) / rate;
}

BatchSummary Committer::summarize(const Batch& batch) const {
    BatchSummary summary;
    summary.batchId = batch.id();
    summary.state = batch.state();
    summary.totalOperations = batch.operations().size();

    for (const auto& op : batch.operations()) {
        summary.totalBytes += operationBytes(op);
        switch (op.status) {
            case OperationStatus::Staged:
                ++summary.staged;
                summary.estimatedSeconds += estimateSeconds(op);
                break;
            case OperationStatus::Applied:
                ++summary.applied;
                break;
            case OperationStatus::Failed:
                ++summary.failed;
                break;
        }
    }
    return summary;
}

void Committer::releaseHoldingSlot(const std::filesystem::path& held) {
    // <dir>/<holding>/<batch id>/<name>: drop the batch dir, then the holding dir, once empty
    auto slot = held.parent_path();
    auto holding = slot.parent_path();
    if (holding.filename() != m_config.holdingDirName) return;

    for (const auto& dir : {slot, holding}) {
        std::error_code ec;
        if (!std::filesystem::is_empty(dir, ec) || ec) return;
        if (auto err = m_fs.remove(dir)) {
            LOG_WARN("Could not remove empty holding directory " << dir << ": " << err->message);
            return;
        }
    }
}

int Committer::purgeHoldingArea(const std::filesystem::path& directory, std::optional<int64_t> keepBatch) {
    int removed = 0;
    std::vector<std::filesystem::path> holdingDirs;

    std::error_code ec;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(directory, options, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->path().filename() == m_config.holdingDirName && it->is_directory(typeEc)) {
            holdingDirs.push_back(it->path());
            it.disable_recursion_pending();
        }
    }
    if (ec) {
        LOG_WARN("Error while looking for holding areas under " << directory << ": " << ec.message());
    }

    for (const auto& holding : holdingDirs) {
        std::vector<std::filesystem::path> slots;
        std::error_code listEc;
        for (const auto& slot : std::filesystem::directory_iterator(holding, listEc)) {
            if (keepBatch && slot.path().filename() == std::to_string(*keepBatch)) continue;
            slots.push_back(slot.path());
        }

        for (const auto& slot : slots) {
            std::error_code removeEc;
            auto count = std::filesystem::remove_all(slot, removeEc);
            if (removeEc) {
                LOG_WARN("Could not purge " << slot << ": " << removeEc.message());
                continue;
            }
            // remove_all counts the slot directory itself
            removed += static_cast<int>(count > 0 ? count - 1 : 0);
        }

        std::error_code emptyEc;
        if (std::filesystem::is_empty(holding, emptyEc) && !emptyEc) {
            if (auto err = m_fs.remove(holding)) {
                LOG_WARN("Could not remove " << holding << ": " << err->message);
            }
        }
    }

    LOG_INFO("Purged " << removed << " held files under " << directory);
    return removed;
}

} // namespace MediaOrganizer
