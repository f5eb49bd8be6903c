/**
 * @file thumbnail_generator.hpp
 * @brief Renders a thumbnail payload for a video file.
 */

#pragma once

#include "media_file.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace MediaOrganizer {

/**
 * @brief Decoded thumbnail, the inverse of ThumbnailGenerator::encode().
 */
struct ThumbnailImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;    ///< RGBA, row-major
};

/**
 * @brief Extracts one frame with ffmpeg and turns it into a cache payload.
 *
 * The frame is taken at 10% of the duration, written as a PNG scratch file
 * (`.tmp`, see CacheManager::purgeTempFiles()) into the work directory,
 * decoded with stb_image and box-downscaled to the configured width.
 *
 * Payload layout: `[u32 width][u32 height][width*height*4 RGBA bytes]`,
 * integers little-endian.
 */
class ThumbnailGenerator {
public:
    ThumbnailGenerator(std::filesystem::path workDir, int targetWidth, int timeoutSeconds);

    /**
     * @brief Render a thumbnail payload.
     * @param record File to render; its metadata supplies the seek position
     * @throws MediaError(CacheGeneration) on any failure
     */
    std::vector<uint8_t> generate(const FileRecord& record) const;

    /// Downscale RGBA pixels so the width becomes at most `targetWidth`.
    static ThumbnailImage downscale(const uint8_t* rgba, int width, int height, int targetWidth);

    static std::vector<uint8_t> encode(const ThumbnailImage& image);
    static std::optional<ThumbnailImage> decode(const std::vector<uint8_t>& payload);

private:
    std::filesystem::path m_workDir;
    int m_targetWidth;
    int m_timeoutSeconds;
};

} // namespace MediaOrganizer
