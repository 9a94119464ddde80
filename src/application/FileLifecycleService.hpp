/**
 * @file FileLifecycleService.hpp
 * @brief Owns the queued -> processing -> completed|failed transitions.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "domain/CheckpointStore.hpp"
#include "domain/FileRecord.hpp"

namespace distill::application {

/**
 * @class FileLifecycleService
 * @brief Derives a file's coarse status from chunk outcomes and persists it.
 *
 * There is no way out of Completed or Failed. Chunk progress rows are
 * scaffolding and are cleared once a record turns terminal.
 */
class FileLifecycleService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit FileLifecycleService(std::shared_ptr<domain::CheckpointStore> store, Clock clock = nullptr);

    /**
     * @brief Creates the Queued record if absent.
     * @return The stored record, possibly pre-existing with another status.
     */
    domain::FileRecord admit(const domain::ContentIdentity& identity, const std::string& filename,
                             long long sizeBytes, int totalChunks, std::size_t chunkTargetSize);

    /**
     * @brief Moves a Queued record to Processing. A Processing record is being resumed.
     * @return false for terminal records.
     */
    bool begin(const domain::FileRecord& record);

    /**
     * @brief Writes the terminal status derived from the stored chunk outcomes, then clears chunk progress.
     *
     * Failures recorded by earlier passes over the same record count as well.
     * @param succeededChunks Receives the number of chunks that succeeded.
     * @return The status written.
     */
    domain::FileStatus finalize(const domain::ContentIdentity& identity, int totalChunks, int& succeededChunks);

    /** @brief Fails the record because its stored chunk count cannot be trusted. */
    void markCorrupted(const domain::ContentIdentity& identity, const std::string& detail);

    /** @brief Removes leftover progress rows of a terminal record. Best effort. */
    void cleanupProgress(const domain::ContentIdentity& identity);

    /**
     * @brief Prunes terminal records older than the retention window.
     * @param retentionDays 0 disables pruning.
     */
    int applyRetention(int retentionDays);

private:
    std::shared_ptr<domain::CheckpointStore> m_store;
    Clock m_clock;
};

} // namespace distill::application
