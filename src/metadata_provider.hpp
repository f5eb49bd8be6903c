/**
 * @file metadata_provider.hpp
 * @brief Media probing interface and the ffprobe-backed implementation.
 */

#pragma once

#include "media_file.hpp"
#include <filesystem>
#include <string>

namespace MediaOrganizer {

/**
 * @brief Extracts resolution, duration, codec and subtitle streams.
 *
 * Implementations are called concurrently from scanner workers.
 */
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    /**
     * @brief Read the metadata of a media file.
     * @throws MediaError(CacheGeneration) when the file cannot be read
     */
    virtual MediaMetadata read(const std::filesystem::path& path) = 0;
};

/**
 * @brief Runs `ffprobe` in a subprocess and parses its compact output.
 *
 * The ffprobe call is wrapped in coreutils `timeout` so a hung network share
 * cannot stall a scanner worker past the configured network timeout.
 */
class FfprobeMetadataProvider : public MetadataProvider {
public:
    explicit FfprobeMetadataProvider(int timeoutSeconds = 30) : m_timeoutSeconds(timeoutSeconds) {}

    MediaMetadata read(const std::filesystem::path& path) override;

    /**
     * @brief Parse `ffprobe -of compact` output.
     *
     * Lines look like `stream|index=0|codec_name=h264|codec_type=video|...`
     * and `format|duration=5400.000000`.
     */
    static MediaMetadata parseCompactOutput(const std::string& output);

private:
    int m_timeoutSeconds;
};

/// Quote an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

} // namespace MediaOrganizer
