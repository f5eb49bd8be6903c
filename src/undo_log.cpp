#include "undo_log.hpp"
#include "committer.hpp"
#include "database.hpp"
#include "debug.hpp"
#include <algorithm>
#include <chrono>

namespace MediaOrganizer {

UndoLog::UndoLog(Database& db) : m_db(db) {}

std::optional<int64_t> UndoLog::undoableBatch() const {
    return m_db.undoableBatchId();
}

std::optional<UndoRecord> UndoLog::record(int64_t batchId) const {
    return m_db.loadUndoRecord(batchId);
}

BatchResult UndoLog::undo(int64_t batchId, Committer& committer, const CancellationToken& cancel,
                          const ProgressCallback& progress) {
    if (m_db.isCorrupt()) {
        throw MediaError(ErrorKind::StoreCorrupted, "store failed its integrity check, refusing to undo: " +
                         m_db.corruptionDetail());
    }

    auto batch = m_db.loadBatch(batchId);
    if (!batch) {
        throw MediaError(ErrorKind::NotFound, "no batch with id " + std::to_string(batchId));
    }

    switch (batch->state()) {
        case BatchState::Committed:
            break;
        case BatchState::Undoing:
        case BatchState::Undone:
            throw MediaError(ErrorKind::StaleBatch, "batch " + std::to_string(batchId) + " was already undone");
        default:
            throw MediaError(ErrorKind::InvalidBatchState,
                             "batch " + std::to_string(batchId) + " is " + batchStateName(batch->state()) +
                             " and has nothing to undo");
    }

    auto undoable = m_db.undoableBatchId();
    if (!undoable || *undoable != batchId) {
        throw MediaError(ErrorKind::StaleBatch,
                         "batch " + std::to_string(batchId) + " was superseded by a later batch");
    }

    auto undoRecord = m_db.loadUndoRecord(batchId);
    if (!undoRecord) {
        throw MediaError(ErrorKind::NotFound, "no undo record for batch " + std::to_string(batchId));
    }

    batch->transitionTo(BatchState::Undoing);
    if (!m_db.updateBatchState(batchId, BatchState::Undoing) || !m_db.revokeUndo()) {
        throw MediaError(ErrorKind::IOError, "failed to record Undoing state for batch " + std::to_string(batchId));
    }

    LOG_INFO("Undoing batch " << batchId << " (" << undoRecord->entries.size() << " operations)");

    auto started = std::chrono::steady_clock::now();
    uint64_t bytesBefore = committer.bytesCopied();

    BatchResult result;
    result.batchId = batchId;

    auto& entries = undoRecord->entries;
    std::sort(entries.begin(), entries.end(),
              [](const UndoEntry& a, const UndoEntry& b) { return a.seq > b.seq; });

    for (auto& entry : entries) {
        if (entry.undoStatus != OperationStatus::Staged) continue;

        StagedOperation inverse = entry.inverse;
        auto err = committer.apply(inverse, cancel, progress);
        if (err) {
            entry.undoStatus = OperationStatus::Failed;
            entry.undoError = err;
            inverse.status = OperationStatus::Failed;
            inverse.error = err;
            result.failed.emplace_back(inverse, *err);
        } else {
            entry.undoStatus = OperationStatus::Applied;
            inverse.status = OperationStatus::Applied;
            result.succeeded.push_back(inverse);
            if (entry.applied.kind == OperationKind::Delete) {
                committer.releaseHoldingSlot(entry.applied.destination);
            }
        }

        if (!m_db.updateUndoEntry(batchId, entry)) {
            LOG_ERROR("Failed to persist undo outcome for batch " << batchId << " entry " << entry.seq);
        }
    }

    batch->transitionTo(BatchState::Undone);
    if (!m_db.updateBatchState(batchId, BatchState::Undone)) {
        LOG_ERROR("Batch " << batchId << " undone but its state was not stored");
    }

    result.bytesCopied = committer.bytesCopied() - bytesBefore;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    LOG_INFO("Batch " << batchId << " undone: " << result.succeeded.size() << " succeeded, "
             << result.failed.size() << " failed");
    return result;
}

int UndoLog::recover() {
    int recovered = 0;
    for (int64_t batchId : m_db.findBatchesInState(BatchState::Undoing)) {
        LOG_WARN("Recovering batch " << batchId << " interrupted while undoing");

        if (auto undoRecord = m_db.loadUndoRecord(batchId)) {
            for (auto& entry : undoRecord->entries) {
                if (entry.undoStatus != OperationStatus::Staged) continue;
                entry.undoStatus = OperationStatus::Failed;
                entry.undoError = OperationError{ErrorKind::IOError, "interrupted"};
                if (!m_db.updateUndoEntry(batchId, entry)) {
                    LOG_ERROR("Failed to persist recovered undo entry " << entry.seq);
                }
            }
        }

        if (m_db.updateBatchState(batchId, BatchState::Undone)) {
            ++recovered;
        }
    }
    return recovered;
}

} // namespace MediaOrganizer
