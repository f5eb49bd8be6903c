#include "errors.hpp"

#include <cerrno>

namespace MediaOrganizer {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::Collision:         return "CollisionError";
        case ErrorKind::PermissionDenied:  return "PermissionError";
        case ErrorKind::IOError:           return "IOError";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::CacheGeneration:   return "CacheGenerationError";
        case ErrorKind::StaleBatch:        return "StaleBatchError";
        case ErrorKind::InvalidTemplate:   return "InvalidTemplate";
        case ErrorKind::InvalidBatchState: return "InvalidBatchState";
        case ErrorKind::StoreCorrupted:    return "StoreCorrupted";
    }
    return "IOError";
}

ErrorKind errorKindFromName(const std::string& name) {
    static const ErrorKind kinds[] = {
        ErrorKind::None, ErrorKind::NotFound, ErrorKind::Collision,
        ErrorKind::PermissionDenied, ErrorKind::IOError, ErrorKind::Cancelled,
        ErrorKind::CacheGeneration, ErrorKind::StaleBatch, ErrorKind::InvalidTemplate,
        ErrorKind::InvalidBatchState, ErrorKind::StoreCorrupted
    };
    for (ErrorKind kind : kinds) {
        if (name == errorKindName(kind)) return kind;
    }
    return ErrorKind::IOError;
}

ErrorKind classifyErrorCode(const std::error_code& ec) {
    if (!ec) return ErrorKind::None;
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorKind::IOError;
    }

    switch (ec.value()) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PermissionDenied;
        case EEXIST:
        case ENOTEMPTY:
            return ErrorKind::Collision;
        default:
            return ErrorKind::IOError;
    }
}

OperationError makeFsError(const std::error_code& ec, const std::string& context) {
    return OperationError{classifyErrorCode(ec), context + ": " + ec.message()};
}

} // namespace MediaOrganizer
