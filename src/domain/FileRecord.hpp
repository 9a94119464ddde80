/**
 * @file FileRecord.hpp
 * @brief Durable per-identity record and its coarse status.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "domain/ContentIdentity.hpp"

namespace distill::domain {

/**
 * @enum FileStatus
 * @brief The only statuses visible to callers.
 */
enum class FileStatus {
    Queued,      ///< Known, not yet picked up by the dispatch loop.
    Processing,  ///< Chunks are being dispatched (or will be resumed).
    Completed,   ///< Every chunk succeeded. Terminal.
    Failed       ///< At least one chunk failed, or the record is corrupt. Terminal.
};

inline std::string StatusToString(FileStatus status) {
    switch (status) {
        case FileStatus::Queued: return "queued";
        case FileStatus::Processing: return "processing";
        case FileStatus::Completed: return "completed";
        case FileStatus::Failed: return "failed";
    }
    return "queued";
}

inline std::optional<FileStatus> StatusFromString(const std::string& value) {
    if (value == "queued") return FileStatus::Queued;
    if (value == "processing") return FileStatus::Processing;
    if (value == "completed") return FileStatus::Completed;
    if (value == "failed") return FileStatus::Failed;
    return std::nullopt;
}

inline bool IsTerminal(FileStatus status) {
    return status == FileStatus::Completed || status == FileStatus::Failed;
}

/** @brief Failure reason stored when recomputed and stored chunk counts disagree. */
inline constexpr const char* kChunkCountMismatch = "chunk_count_mismatch";

/** @brief Failure reason stored when one or more chunk extractions failed. */
inline constexpr const char* kChunkFailures = "chunk_failures";

/**
 * @class FileRecord
 * @brief At most one per content identity. Kept after completion for history.
 */
class FileRecord {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    ContentIdentity identity;
    std::string filename;        ///< Display only.
    long long sizeBytes = 0;
    int totalChunks = 0;
    std::size_t chunkTargetSize = 0; ///< Target the chunk boundaries were computed with.
    int completedChunks = 0;     ///< Final count, written when the record turns terminal.
    FileStatus status = FileStatus::Queued;
    std::string failureReason;   ///< Empty unless status is Failed.
    TimePoint createdAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;

    bool isTerminal() const { return IsTerminal(status); }
};

/**
 * @struct FileProgress
 * @brief A record joined with its live completed-chunk count.
 */
struct FileProgress {
    FileRecord record;
    int completedChunks = 0;
};

} // namespace distill::domain
