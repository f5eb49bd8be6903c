/**
 * @file undo_log.hpp
 * @brief Reverses the most recently committed batch.
 */

#pragma once

#include "batch.hpp"
#include "filesystem_provider.hpp"
#include <optional>

namespace MediaOrganizer {

class Committer;
class Database;

/**
 * @brief Durable inverse operations of committed batches, consumed by undo().
 *
 * Only the latest committed batch is undoable. Opening a new Draft or
 * committing another batch revokes it; its record stays in the store for
 * inspection. Undo replays the inverses through the Committer in reverse
 * order of application, and a batch can be undone only once.
 */
class UndoLog {
public:
    explicit UndoLog(Database& db);

    /// The batch undo() would currently accept, if any.
    std::optional<int64_t> undoableBatch() const;

    std::optional<UndoRecord> record(int64_t batchId) const;

    /**
     * @brief Apply the inverses of a committed batch.
     *
     * Each inverse succeeds or fails independently. The batch ends Undone
     * even when some inverses fail; failures are recorded, not retried.
     *
     * @throws MediaError(StaleBatch) if the batch was superseded or already undone
     * @throws MediaError(InvalidBatchState) if the batch was never committed
     * @throws MediaError(NotFound) if there is no such batch
     * @throws MediaError(StoreCorrupted) if the store failed its integrity check
     */
    BatchResult undo(int64_t batchId, Committer& committer, const CancellationToken& cancel = {},
                     const ProgressCallback& progress = {});

    /**
     * @brief Finish batches a crash left in Undoing.
     *
     * Inverses that never ran are marked Failed(IOError) and the batch
     * becomes Undone.
     *
     * @return Number of batches recovered
     */
    int recover();

private:
    Database& m_db;
};

} // namespace MediaOrganizer
