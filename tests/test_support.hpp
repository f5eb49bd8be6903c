#pragma once

#include "errors.hpp"
#include "filesystem_provider.hpp"
#include "metadata_provider.hpp"

#include <atomic>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <gtest/gtest.h>

namespace MediaOrganizer::testing {

namespace fs = std::filesystem;

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        m_path = fs::temp_directory_path() / ("media-organizer-test-" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    fs::path operator/(const std::string& name) const { return m_path / name; }

private:
    fs::path m_path;
};

inline void writeFile(const fs::path& path, const std::string& contents) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

inline void writeFile(const fs::path& path, size_t size, char fill = 'x') {
    writeFile(path, std::string(size, fill));
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline MediaMetadata sampleMetadata(int height = 1080, const std::string& codec = "h264", double duration = 5400.0) {
    MediaMetadata m;
    m.width = height * 16 / 9;
    m.height = height;
    m.codec = codec;
    m.durationSeconds = duration;
    return m;
}

/**
 * @brief Metadata provider answering from a table, failing for unknown files.
 */
class FakeMetadataProvider : public MetadataProvider {
public:
    MediaMetadata read(const fs::path& path) override {
        ++readCount;
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_answers.find(path.filename().string());
        if (it == m_answers.end()) {
            throw MediaError(ErrorKind::CacheGeneration, "cannot read " + path.string());
        }
        return it->second;
    }

    void answer(const std::string& filename, const MediaMetadata& metadata) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_answers[filename] = metadata;
    }

    std::atomic<int> readCount{0};

private:
    std::mutex m_mutex;
    std::map<std::string, MediaMetadata> m_answers;
};

/**
 * @brief Local filesystem with injectable failures.
 *
 * Directories listed in `foreignShares` count as a different volume, so
 * moves into them take the streamed-copy path. Paths in `deniedDestinations`
 * refuse renames and copies into them with PermissionDenied.
 */
class FakeFilesystem : public LocalFilesystem {
public:
    bool sameVolume(const fs::path& source, const fs::path& destination) const override {
        for (const auto& share : foreignShares) {
            if (isUnder(destination, share) != isUnder(source, share)) return false;
        }
        return LocalFilesystem::sameVolume(source, destination);
    }

    std::optional<OperationError> rename(const fs::path& source, const fs::path& destination) override {
        if (deniedDestinations.count(destination)) {
            return OperationError{ErrorKind::PermissionDenied, "access denied: " + destination.string()};
        }
        return LocalFilesystem::rename(source, destination);
    }

    ChunkResult copyChunk(const fs::path& source, uint64_t sourceOffset, const fs::path& destination,
                          std::vector<char>& buffer) override {
        ++chunkCalls;
        if (failChunkAt && chunkCalls == *failChunkAt) {
            ChunkResult result;
            result.error = OperationError{ErrorKind::IOError, "share went away"};
            return result;
        }
        return LocalFilesystem::copyChunk(source, sourceOffset, destination, buffer);
    }

    std::set<fs::path> foreignShares;
    std::set<fs::path> deniedDestinations;
    std::optional<int> failChunkAt;
    int chunkCalls = 0;

private:
    static bool isUnder(const fs::path& path, const fs::path& dir) {
        auto rel = path.lexically_relative(dir);
        return !rel.empty() && *rel.begin() != "..";
    }
};

} // namespace MediaOrganizer::testing
