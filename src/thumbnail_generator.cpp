#include "thumbnail_generator.hpp"
#include "debug.hpp"
#include "errors.hpp"
#include "metadata_provider.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace MediaOrganizer {

ThumbnailGenerator::ThumbnailGenerator(std::filesystem::path workDir, int targetWidth, int timeoutSeconds)
    : m_workDir(std::move(workDir)), m_targetWidth(targetWidth), m_timeoutSeconds(timeoutSeconds) {
    std::error_code ec;
    std::filesystem::create_directories(m_workDir, ec);
    if (ec) {
        LOG_WARN("Cannot create thumbnail work dir " << m_workDir << ": " << ec.message());
    }
    DEBUG_LOG("ThumbnailGenerator initialized, work dir: " << m_workDir);
}

std::vector<uint8_t> ThumbnailGenerator::generate(const FileRecord& record) const {
    SCOPED_TIMER_THRESHOLD("thumbnail", 2000);

    if (!std::filesystem::exists(record.path)) {
        throw MediaError(ErrorKind::CacheGeneration, "no such file: " + record.path.string());
    }

    double seekSeconds = 0.0;
    if (record.metadata && record.metadata->durationSeconds > 0.0) {
        seekSeconds = record.metadata->durationSeconds * 0.1;
    }

    // One scratch frame per process and fingerprint, so concurrent renders don't collide
    auto framePath = m_workDir / ("frame_" + std::to_string(::getpid()) + "_" + record.fingerprint + ".png.tmp");
    auto logFile = m_workDir / "ffmpeg.log";

    std::stringstream cmd;
    cmd << "timeout " << m_timeoutSeconds
        << " ffmpeg -y -v error -ss " << std::fixed << std::setprecision(3) << seekSeconds
        << " -i " << shellQuote(record.path.string())
        << " -frames:v 1 -f image2 -c:v png -update 1 " << shellQuote(framePath.string())
        << " > " << shellQuote(logFile.string()) << " 2>&1";

    DEBUG_LOG("Running: " << cmd.str());
    int result = std::system(cmd.str().c_str());

    if (result != 0 || !std::filesystem::exists(framePath)) {
        std::string firstLine;
        std::ifstream log(logFile);
        std::getline(log, firstLine);
        std::error_code ec;
        std::filesystem::remove(framePath, ec);
        throw MediaError(ErrorKind::CacheGeneration,
                         "ffmpeg could not extract a frame from " + record.path.string() +
                         (firstLine.empty() ? "" : ": " + firstLine));
    }

    int width = 0, height = 0, channels = 0;
    std::unique_ptr<unsigned char, void (*)(void*)> data(
        stbi_load(framePath.string().c_str(), &width, &height, &channels, 4), stbi_image_free);

    std::error_code ec;
    std::filesystem::remove(framePath, ec);

    if (!data) {
        throw MediaError(ErrorKind::CacheGeneration,
                         std::string("cannot decode extracted frame: ") + stbi_failure_reason());
    }

    ThumbnailImage image = downscale(data.get(), width, height, m_targetWidth);
    DEBUG_LOG("Thumbnail " << record.path.filename() << ": " << width << "x" << height
              << " -> " << image.width << "x" << image.height);
    return encode(image);
}

} // namespace MediaOrganizer
