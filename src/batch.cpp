#include "batch.hpp"

namespace MediaOrganizer {

const char* operationKindName(OperationKind kind) {
    switch (kind) {
        case OperationKind::Rename: return "Rename";
        case OperationKind::Move:   return "Move";
        case OperationKind::Copy:   return "Copy";
        case OperationKind::Delete: return "Delete";
    }
    return "Rename";
}

OperationKind operationKindFromName(const std::string& name) {
    if (name == "Move") return OperationKind::Move;
    if (name == "Copy") return OperationKind::Copy;
    if (name == "Delete") return OperationKind::Delete;
    return OperationKind::Rename;
}

const char* operationStatusName(OperationStatus status) {
    switch (status) {
        case OperationStatus::Staged:  return "Staged";
        case OperationStatus::Applied: return "Applied";
        case OperationStatus::Failed:  return "Failed";
    }
    return "Staged";
}

OperationStatus operationStatusFromName(const std::string& name) {
    if (name == "Applied") return OperationStatus::Applied;
    if (name == "Failed") return OperationStatus::Failed;
    return OperationStatus::Staged;
}

const char* batchStateName(BatchState state) {
    switch (state) {
        case BatchState::Draft:      return "Draft";
        case BatchState::Committing: return "Committing";
        case BatchState::Committed:  return "Committed";
        case BatchState::Undoing:    return "Undoing";
        case BatchState::Undone:     return "Undone";
    }
    return "Draft";
}

BatchState batchStateFromName(const std::string& name) {
    if (name == "Committing") return BatchState::Committing;
    if (name == "Committed") return BatchState::Committed;
    if (name == "Undoing") return BatchState::Undoing;
    if (name == "Undone") return BatchState::Undone;
    return BatchState::Draft;
}

bool Batch::canTransition(BatchState from, BatchState to) {
    switch (from) {
        case BatchState::Draft:      return to == BatchState::Committing;
        case BatchState::Committing: return to == BatchState::Committed;
        case BatchState::Committed:  return to == BatchState::Undoing;
        case BatchState::Undoing:    return to == BatchState::Undone;
        case BatchState::Undone:     return false;
    }
    return false;
}

void Batch::transitionTo(BatchState next) {
    if (!canTransition(m_state, next)) {
        throw MediaError(ErrorKind::InvalidBatchState,
                         std::string("batch ") + std::to_string(m_id) + " cannot go from " +
                         batchStateName(m_state) + " to " + batchStateName(next));
    }
    m_state = next;
}

const StagedOperation* Batch::findStagedDestination(const std::filesystem::path& destination) const {
    for (const auto& op : m_operations) {
        if (op.status == OperationStatus::Staged && !op.destination.empty() && op.destination == destination) {
            return &op;
        }
    }
    return nullptr;
}

const StagedOperation* Batch::findStagedSource(const std::filesystem::path& source) const {
    for (const auto& op : m_operations) {
        if (op.status == OperationStatus::Staged && op.source == source) {
            return &op;
        }
    }
    return nullptr;
}

std::optional<StagedOperation> inverseOf(const StagedOperation& applied) {
    StagedOperation inverse;
    inverse.batchId = applied.batchId;

    switch (applied.kind) {
        case OperationKind::Rename:
            inverse.kind = OperationKind::Rename;
            inverse.source = applied.destination;
            inverse.destination = applied.source;
            return inverse;
        case OperationKind::Move:
            inverse.kind = OperationKind::Move;
            inverse.source = applied.destination;
            inverse.destination = applied.source;
            return inverse;
        case OperationKind::Copy:
            // Undoing a copy removes the copy for good; the source was never touched
            inverse.kind = OperationKind::Delete;
            inverse.source = applied.destination;
            return inverse;
        case OperationKind::Delete:
            if (applied.destination.empty()) {
                return std::nullopt;
            }
            inverse.kind = OperationKind::Move;
            inverse.source = applied.destination;
            inverse.destination = applied.source;
            return inverse;
    }
    return std::nullopt;
}

} // namespace MediaOrganizer
