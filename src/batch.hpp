/**
 * @file batch.hpp
 * @brief Staged operations, batches and their state machine.
 */

#pragma once

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MediaOrganizer {

enum class OperationKind { Rename, Move, Copy, Delete };

enum class OperationStatus { Staged, Applied, Failed };

/**
 * @brief Lifecycle of a batch.
 *
 * Draft -> Committing -> Committed -> Undoing -> Undone. No state is
 * re-entered and Draft is the only state that accepts new operations.
 */
enum class BatchState { Draft, Committing, Committed, Undoing, Undone };

const char* operationKindName(OperationKind kind);
OperationKind operationKindFromName(const std::string& name);
const char* operationStatusName(OperationStatus status);
OperationStatus operationStatusFromName(const std::string& name);
const char* batchStateName(BatchState state);
BatchState batchStateFromName(const std::string& name);

/**
 * @brief A planned filesystem mutation.
 *
 * For Delete the destination is the holding-area path the file is moved to,
 * or empty when deletes are permanent.
 */
struct StagedOperation {
    int64_t id = 0;                         ///< Store row id (0 until persisted)
    int64_t batchId = 0;                    ///< Owning batch
    OperationKind kind = OperationKind::Rename;
    std::filesystem::path source;
    std::filesystem::path destination;
    OperationStatus status = OperationStatus::Staged;
    std::optional<OperationError> error;    ///< Set when status is Failed
};

/**
 * @brief An ordered group of staged operations.
 */
class Batch {
public:
    Batch() = default;
    Batch(int64_t id, BatchState state) : m_id(id), m_state(state) {}

    int64_t id() const { return m_id; }
    BatchState state() const { return m_state; }

    std::vector<StagedOperation>& operations() { return m_operations; }
    const std::vector<StagedOperation>& operations() const { return m_operations; }

    /**
     * @brief Move to the next lifecycle state.
     * @throws MediaError(InvalidBatchState) if the transition is not allowed
     */
    void transitionTo(BatchState next);

    /// Whether `from -> to` is an edge of the batch state machine.
    static bool canTransition(BatchState from, BatchState to);

    /// Staged operation targeting `destination`, if any.
    const StagedOperation* findStagedDestination(const std::filesystem::path& destination) const;

    /// Staged operation reading from `source`, if any.
    const StagedOperation* findStagedSource(const std::filesystem::path& source) const;

private:
    int64_t m_id = 0;
    BatchState m_state = BatchState::Draft;
    std::vector<StagedOperation> m_operations;
};

/**
 * @brief Partitioned outcome of a commit or undo.
 */
struct BatchResult {
    int64_t batchId = 0;
    std::vector<StagedOperation> succeeded;
    std::vector<std::pair<StagedOperation, OperationError>> failed;
    uint64_t bytesCopied = 0;               ///< Bytes streamed by Move/Copy
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Counts, sizes and remaining-time estimate of a batch.
 */
struct BatchSummary {
    int64_t batchId = 0;
    BatchState state = BatchState::Draft;
    size_t totalOperations = 0;
    size_t staged = 0;
    size_t applied = 0;
    size_t failed = 0;
    uint64_t totalBytes = 0;                ///< Size of the files Move/Copy stream
    double estimatedSeconds = 0.0;          ///< For the operations still Staged

    /// Fraction of operations with an outcome, 0 for an empty batch.
    double progress() const {
        return totalOperations ? static_cast<double>(applied + failed) / totalOperations : 0.0;
    }
};

/**
 * @brief One applied operation and the operation that reverses it.
 */
struct UndoEntry {
    int seq = 0;                            ///< Position in original application order
    StagedOperation applied;
    StagedOperation inverse;
    OperationStatus undoStatus = OperationStatus::Staged;
    std::optional<OperationError> undoError;
};

/**
 * @brief Inverses of a committed batch's applied operations.
 */
struct UndoRecord {
    int64_t batchId = 0;
    std::vector<UndoEntry> entries;
    bool undoable = false;                  ///< Only the latest committed batch
};

/**
 * @brief Inverse of an applied operation.
 * @return std::nullopt for permanent deletes, which cannot be reversed
 */
std::optional<StagedOperation> inverseOf(const StagedOperation& applied);

} // namespace MediaOrganizer
