/**
 * @file media_file.hpp
 * @brief File records and extracted media metadata.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace MediaOrganizer {

/**
 * @brief One subtitle stream found inside a media container.
 */
struct SubtitleStream {
    int index = 0;                      ///< Stream index within the container
    std::optional<std::string> language; ///< ISO language tag, if tagged
    std::optional<std::string> title;    ///< Stream title, if tagged
    std::string codec;                   ///< Subtitle codec (e.g. "subrip")
};

/**
 * @brief Metadata returned by MetadataProvider::read().
 */
struct MediaMetadata {
    int width = 0;                      ///< Video width in pixels
    int height = 0;                     ///< Video height in pixels
    double durationSeconds = 0.0;       ///< Container duration
    std::string codec;                  ///< Primary video codec name
    std::vector<SubtitleStream> subtitles;

    /// Resolution label such as "1080p", empty when the height is unknown.
    std::string resolutionLabel() const;

    /// Compact duration label: "1h32m", "45m" or "42s".
    std::string durationLabel() const;
};

/**
 * @brief Enrichment progress of a FileRecord.
 */
enum class ScanState {
    Pending,    ///< Listed, metadata not yet read
    Enriched,   ///< Metadata read successfully
    Failed,     ///< Extraction failed, metadata left empty
    Stale       ///< Not seen on the last scan of its directory
};

const char* scanStateName(ScanState state);
ScanState scanStateFromName(const std::string& name);

/**
 * @brief A media file known to the store. The path is the natural key.
 */
struct FileRecord {
    std::filesystem::path path;                 ///< Full path (unique per store)
    uintmax_t size = 0;                         ///< File size in bytes
    int64_t modifiedTime = 0;                   ///< Seconds since the Unix epoch
    std::string fingerprint;                    ///< See computeFingerprint()
    std::optional<MediaMetadata> metadata;      ///< Present once Enriched
    ScanState scanState = ScanState::Pending;
};

/**
 * @brief Derive the cache key for a file from its path, size and mtime.
 *
 * The value is a 16-digit hex FNV-1a hash, stable across runs and builds.
 * It is not a content hash: renaming a file changes its fingerprint.
 */
std::string computeFingerprint(const std::filesystem::path& path, uintmax_t size, int64_t modifiedTime);

/**
 * @brief Build a bare Pending record from the filesystem.
 * @return std::nullopt if the file cannot be stat'ed
 */
std::optional<FileRecord> statFileRecord(const std::filesystem::path& path);

/// ASCII lowercase; bytes of multi-byte UTF-8 sequences pass through unchanged.
std::string toLower(std::string text);

/// Converts a filesystem timestamp to seconds since the Unix epoch.
int64_t toUnixSeconds(std::filesystem::file_time_type time);

/// @name Metadata serialization
/// Line-oriented "key=value" text used for cache payloads and the store.
/// @{
std::string serializeMetadata(const MediaMetadata& metadata);
std::optional<MediaMetadata> deserializeMetadata(const std::string& text);
/// @}

} // namespace MediaOrganizer
