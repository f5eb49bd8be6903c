#include "operation_stager.hpp"
#include "database.hpp"
#include "debug.hpp"
#include "filesystem_provider.hpp"
#include "name_template.hpp"

namespace MediaOrganizer {

OperationStager::OperationStager(FilesystemProvider& fs, Database& db, CommitConfig config)
    : m_fs(fs), m_db(db), m_config(std::move(config)) {}

std::filesystem::path OperationStager::holdingPath(const Batch& batch, const std::filesystem::path& source) const {
    return source.parent_path() / m_config.holdingDirName / std::to_string(batch.id()) / source.filename();
}

StagePreview OperationStager::preview(const Batch& batch, const StageRequest& request) const {
    StagePreview preview;
    preview.kind = request.kind;
    preview.source = request.record.path.lexically_normal();

    try {
        switch (request.kind) {
            case OperationKind::Delete:
                preview.name = preview.source.filename().string();
                if (!m_config.permanentDelete) {
                    preview.destination = holdingPath(batch, preview.source);
                }
                break;
            case OperationKind::Rename:
                preview.name = expandTemplate(request.nameTemplate, request.record);
                preview.destination = preview.source.parent_path() / preview.name;
                break;
            case OperationKind::Move:
            case OperationKind::Copy:
                if (request.destinationDir.empty()) {
                    throw MediaError(ErrorKind::InvalidTemplate, std::string(operationKindName(request.kind)) +
                                     " requires a destination directory");
                }
                preview.name = expandTemplate(request.nameTemplate, request.record);
                preview.destination = (request.destinationDir / preview.name).lexically_normal();
                break;
        }
    } catch (const MediaError& e) {
        if (e.kind() != ErrorKind::InvalidTemplate) throw;
        preview.conflict = OperationError{e.kind(), e.what()};
        return preview;
    }

    if (request.kind != OperationKind::Delete && preview.destination == preview.source) {
        if (request.kind == OperationKind::Copy) {
            preview.conflict = OperationError{ErrorKind::Collision, "cannot copy a file onto itself"};
        } else {
            preview.noOp = true;
        }
        return preview;
    }

    if (!m_fs.exists(preview.source)) {
        preview.conflict = OperationError{ErrorKind::NotFound, "source does not exist: " + preview.source.string()};
    } else if (batch.findStagedSource(preview.source)) {
        preview.conflict = OperationError{ErrorKind::Collision,
                                          preview.source.string() + " is already staged in this batch"};
    } else if (!preview.destination.empty() && m_fs.exists(preview.destination)) {
        preview.conflict = OperationError{ErrorKind::Collision,
                                          "destination exists: " + preview.destination.string()};
    } else if (!preview.destination.empty() && batch.findStagedDestination(preview.destination)) {
        preview.conflict = OperationError{ErrorKind::Collision,
                                          "destination already targeted in this batch: " + preview.destination.string()};
    }
    return preview;
}

StageOutcome OperationStager::stage(Batch& batch, const StageRequest& request) {
    if (batch.state() != BatchState::Draft) {
        throw MediaError(ErrorKind::InvalidBatchState,
                         "batch " + std::to_string(batch.id()) + " is " + batchStateName(batch.state()) +
                         ", only a Draft accepts new operations");
    }

    StageOutcome outcome;
    outcome.preview = preview(batch, request);

    if (request.dryRun || outcome.preview.noOp) {
        return outcome;
    }
    if (outcome.preview.conflict) {
        throw MediaError(outcome.preview.conflict->kind, outcome.preview.conflict->message);
    }

    StagedOperation op;
    op.batchId = batch.id();
    op.kind = request.kind;
    op.source = outcome.preview.source;
    op.destination = outcome.preview.destination;
    op.status = OperationStatus::Staged;

    int seq = static_cast<int>(batch.operations().size());
    op.id = m_db.insertOperation(op, seq);
    if (op.id < 0) {
        throw MediaError(ErrorKind::IOError, "failed to persist staged operation for " + op.source.string());
    }

    batch.operations().push_back(op);
    DEBUG_LOG("Staged " << operationKindName(op.kind) << " " << op.source << " -> " << op.destination);

    outcome.operation = std::move(op);
    return outcome;
}

} // namespace MediaOrganizer
