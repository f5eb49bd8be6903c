/**
 * @file filesystem_provider.hpp
 * @brief Filesystem access used by the committer, and a local implementation.
 */

#pragma once

#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace MediaOrganizer {

/**
 * @brief Cooperative cancellation and pause flags with an optional deadline.
 *
 * Copies share the same flags, so a token handed to a long-running commit
 * can be paused, resumed or cancelled from another thread. A passed
 * deadline counts as cancelled.
 */
class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    void cancel() { m_state->cancelled.store(true); }

    void pause() { m_state->paused.store(true); }
    void resume() { m_state->paused.store(false); }
    bool isPaused() const { return m_state->paused.load(); }

    void setDeadline(std::chrono::steady_clock::time_point deadline) { m_deadline = deadline; }

    bool isCancelled() const {
        if (m_state->cancelled.load()) return true;
        return m_deadline && std::chrono::steady_clock::now() >= *m_deadline;
    }

    /**
     * @brief Block while paused.
     * @return false if the token was cancelled, before or during the pause
     */
    bool waitWhilePaused() const {
        while (isPaused() && !isCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return !isCancelled();
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> paused{false};
    };

    std::shared_ptr<State> m_state;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
};

/**
 * @brief Progress callback invoked at chunk boundaries of a streamed copy.
 * @param copied Bytes copied so far
 * @param total Size of the source file
 */
using ProgressCallback = std::function<void(uint64_t copied, uint64_t total)>;

/**
 * @brief Result of writing one chunk.
 */
struct ChunkResult {
    size_t bytesWritten = 0;                ///< 0 with no error means end of source
    std::optional<OperationError> error;
};

/**
 * @brief Filesystem operations needed to apply staged batches.
 *
 * Implementations must never overwrite an existing destination on rename.
 */
class FilesystemProvider {
public:
    virtual ~FilesystemProvider() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    virtual std::optional<uint64_t> fileSize(const std::filesystem::path& path) const = 0;

    /// Whether a rename between the two locations stays on one volume/share.
    virtual bool sameVolume(const std::filesystem::path& source,
                            const std::filesystem::path& destination) const = 0;

    /**
     * @brief Atomically rename `source` to `destination`.
     * @return std::nullopt on success
     */
    virtual std::optional<OperationError> rename(const std::filesystem::path& source,
                                                 const std::filesystem::path& destination) = 0;

    /**
     * @brief Copy one chunk of `source`, starting at `sourceOffset`, to the
     *        same offset of `destination` (created when the offset is 0).
     * @param buffer Scratch buffer; its size is the chunk size
     */
    virtual ChunkResult copyChunk(const std::filesystem::path& source, uint64_t sourceOffset,
                                  const std::filesystem::path& destination,
                                  std::vector<char>& buffer) = 0;

    /// @return std::nullopt on success
    virtual std::optional<OperationError> remove(const std::filesystem::path& path) = 0;

    /// Create `directory` and its parents. @return std::nullopt on success
    virtual std::optional<OperationError> createDirectories(const std::filesystem::path& directory) = 0;
};

/**
 * @brief FilesystemProvider over the local VFS (mounted shares included).
 */
class LocalFilesystem : public FilesystemProvider {
public:
    bool exists(const std::filesystem::path& path) const override;
    std::optional<uint64_t> fileSize(const std::filesystem::path& path) const override;
    bool sameVolume(const std::filesystem::path& source,
                    const std::filesystem::path& destination) const override;
    std::optional<OperationError> rename(const std::filesystem::path& source,
                                         const std::filesystem::path& destination) override;
    ChunkResult copyChunk(const std::filesystem::path& source, uint64_t sourceOffset,
                          const std::filesystem::path& destination,
                          std::vector<char>& buffer) override;
    std::optional<OperationError> remove(const std::filesystem::path& path) override;
    std::optional<OperationError> createDirectories(const std::filesystem::path& directory) override;
};

} // namespace MediaOrganizer
