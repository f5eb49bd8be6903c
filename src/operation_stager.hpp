/**
 * @file operation_stager.hpp
 * @brief Turns rename/move/copy/delete intents into validated staged operations.
 */

#pragma once

#include "batch.hpp"
#include "config.hpp"
#include "media_file.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace MediaOrganizer {

class Database;
class FilesystemProvider;

/**
 * @brief What the user wants to do with one file.
 */
struct StageRequest {
    OperationKind kind = OperationKind::Rename;
    FileRecord record;                          ///< Source file
    std::string nameTemplate;                   ///< Empty keeps the original name
    std::filesystem::path destinationDir;       ///< Target directory for Move/Copy
    bool dryRun = false;
};

/**
 * @brief Proposed outcome of a stage request.
 */
struct StagePreview {
    OperationKind kind = OperationKind::Rename;
    std::filesystem::path source;
    std::filesystem::path destination;          ///< Empty for a permanent delete
    std::string name;                           ///< New file name
    bool noOp = false;                          ///< Destination equals source
    std::optional<OperationError> conflict;     ///< Why staging would fail
};

/**
 * @brief Result of stage(): the preview, plus the operation when one was appended.
 */
struct StageOutcome {
    StagePreview preview;
    std::optional<StagedOperation> operation;
};

/**
 * @brief Plans filesystem mutations without applying them.
 *
 * Staging is a pure planning step. The stager computes the destination from
 * the naming template, checks it against the filesystem and against every
 * other operation in the Draft batch, and appends the operation to the batch
 * (and the store). Nothing on disk changes until the batch is committed.
 *
 * Rename keeps the file in its directory, Move and Copy place it in
 * `destinationDir`, and Delete targets the holding area
 * `<source dir>/<holdingDirName>/<batch id>/<name>` unless deletes are
 * permanent.
 */
class OperationStager {
public:
    OperationStager(FilesystemProvider& fs, Database& db, CommitConfig config);

    /**
     * @brief Compute the proposed destination without touching the batch.
     *
     * Collisions, a template that yields an invalid name and other problems
     * are reported in StagePreview::conflict instead of being thrown.
     */
    StagePreview preview(const Batch& batch, const StageRequest& request) const;

    /**
     * @brief Stage an operation, or only preview it when `request.dryRun` is set.
     *
     * A request whose destination equals its source is a no-op: the preview
     * is returned with `noOp` set and nothing is appended. A dry run returns
     * the preview, conflict included, without throwing.
     *
     * @throws MediaError(InvalidBatchState) if the batch is not a Draft
     * @throws MediaError(Collision) if the destination exists on disk, is
     *         already targeted in the batch, or the source is already staged
     * @throws MediaError(NotFound) if the source file is gone
     * @throws MediaError(InvalidTemplate) if the template yields an invalid name
     */
    StageOutcome stage(Batch& batch, const StageRequest& request);

private:
    std::filesystem::path holdingPath(const Batch& batch, const std::filesystem::path& source) const;

    FilesystemProvider& m_fs;
    Database& m_db;
    CommitConfig m_config;
};

} // namespace MediaOrganizer
