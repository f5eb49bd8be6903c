/**
 * @file config.hpp
 * @brief YAML configuration for the store, cache, scanner and committer.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace MediaOrganizer {

struct CacheConfig {
    uint64_t maxSizeBytes = 5ull * 1024 * 1024 * 1024;  ///< Hard byte budget
    double lowWatermark = 0.8;                          ///< Prune target as a fraction of max
    int recencyFlushInterval = 64;                      ///< Touches buffered before writing last_access
    int thumbnailWidth = 320;                           ///< Thumbnail width in pixels
    std::filesystem::path workDir;                      ///< Scratch dir for frame extraction
};

struct ScanConfig {
    int workers = 3;                                    ///< Metadata extraction concurrency
    bool recursive = true;
    std::vector<std::string> extensions = {
        ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".m4v", ".mpg", ".mpeg",
        ".ts", ".m2ts", ".webm", ".flv", ".vob", ".3gp"
    };
};

struct CommitConfig {
    uint64_t chunkSizeBytes = 64ull * 1024 * 1024;      ///< Streamed copy chunk
    uint64_t bandwidthLimitBytesPerSec = 0;             ///< Streamed copy throttle, 0 = unlimited
    int networkTimeoutSeconds = 30;                     ///< Upper bound for ffprobe and other subprocesses
    std::string holdingDirName = ".media-organizer-trash";
    bool permanentDelete = false;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Application configuration.
 *
 * Loaded from ~/.config/MediaOrganizer/config.yaml, or the file named by
 * the MEDIA_ORGANIZER_CONFIG environment variable.
 */
struct Config {
    std::filesystem::path databasePath;
    CacheConfig cache;
    ScanConfig scan;
    CommitConfig commit;
    LoggingConfig logging;

    /// Defaults with paths rooted at $HOME (or /tmp when HOME is unset).
    static Config defaults();

    /// Default config file location, honoring MEDIA_ORGANIZER_CONFIG.
    static std::filesystem::path defaultPath();

    /**
     * @brief Write the configuration as YAML.
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::filesystem::path& path) const;

    /// Clamp out-of-range values, logging each correction.
    void validate();
};

/**
 * @brief Load configuration from a YAML file.
 *
 * A missing file yields defaults. A malformed file is logged and defaults
 * are used; nothing is overwritten.
 */
Config loadConfig(const std::filesystem::path& path);

} // namespace MediaOrganizer
