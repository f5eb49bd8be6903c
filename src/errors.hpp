/**
 * @file errors.hpp
 * @brief Error kinds shared by staging, committing, caching and the store.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace MediaOrganizer {

/**
 * @brief Classification of every failure the engine reports.
 *
 * The name of each kind (see errorKindName()) is what gets persisted in the
 * store and printed by the command line tool, so it must stay stable.
 */
enum class ErrorKind {
    None,
    NotFound,           ///< Source vanished between stage and commit
    Collision,          ///< Destination occupied on disk or within the batch
    PermissionDenied,   ///< Share access denied
    IOError,            ///< Interrupted copy, byte-count mismatch, other I/O
    Cancelled,          ///< Cancellation token or deadline fired
    CacheGeneration,    ///< Thumbnail/metadata generator failed
    StaleBatch,         ///< Undo attempted on a superseded or consumed batch
    InvalidTemplate,    ///< Template expanded to an unusable file name
    InvalidBatchState,  ///< Operation not allowed in the batch's current state
    StoreCorrupted      ///< Persistent store failed its integrity check
};

const char* errorKindName(ErrorKind kind);
ErrorKind errorKindFromName(const std::string& name);

/**
 * @brief Per-operation failure value.
 */
struct OperationError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/**
 * @brief Exception for API calls that fail as a whole.
 */
class MediaError : public std::runtime_error {
public:
    MediaError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/// Maps an errno-style error code from std::filesystem onto an ErrorKind.
ErrorKind classifyErrorCode(const std::error_code& ec);

/// Builds an OperationError from a failed filesystem call.
OperationError makeFsError(const std::error_code& ec, const std::string& context);

} // namespace MediaOrganizer
