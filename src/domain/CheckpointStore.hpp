/**
 * @file CheckpointStore.hpp
 * @brief Interface for the durable chunk progress and file record store.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/ContentIdentity.hpp"
#include "domain/FileRecord.hpp"

namespace distill::domain {

/**
 * @struct StatusDetail
 * @brief Extra facts persisted together with a status transition.
 */
struct StatusDetail {
    std::optional<int> completedChunks;
    std::string failureReason;
};

/**
 * @class CheckpointStore
 * @brief Abstract interface for the two durable relations of the pipeline.
 *
 * Writes return only after they are durable; any failure raises StorageError.
 * A write that threw must be treated as never having happened.
 */
class CheckpointStore {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~CheckpointStore() = default;

    /**
     * @brief Marks (identity, index) as done. Recording twice is a no-op.
     * @param filename Display name, kept on the progress row for diagnostics.
     */
    virtual void recordChunkDone(const ContentIdentity& identity, int index, int totalChunks,
                                 const std::string& filename, TimePoint completedAt) = 0;

    /**
     * @brief Marks (identity, index) as permanently failed for this submission.
     *
     * A failed chunk is resolved: it is not pending any more and is never
     * dispatched again for the same record. Never overwrites a done row.
     */
    virtual void recordChunkFailed(const ContentIdentity& identity, int index, int totalChunks,
                                   const std::string& filename, TimePoint failedAt) = 0;

    /** @brief True if (identity, index) was recorded as succeeded. */
    virtual bool isChunkDone(const ContentIdentity& identity, int index) = 0;

    /**
     * @brief Creates a Queued record if none exists; otherwise leaves it untouched.
     * @param chunkTargetSize Stored so that a resume re-chunks with the same boundaries.
     * @return The stored record after the call.
     */
    virtual FileRecord upsertFileRecord(const ContentIdentity& identity, const std::string& filename,
                                        long long sizeBytes, int totalChunks, std::size_t chunkTargetSize,
                                        TimePoint now) = 0;

    /**
     * @brief Transitions the record's status.
     * @return false if no record exists or the record is already terminal.
     */
    virtual bool setFileStatus(const ContentIdentity& identity, FileStatus status, TimePoint timestamp,
                               const StatusDetail& detail = {}) = 0;

    /** @brief Removes every progress row of an identity. Idempotent. */
    virtual void clearChunkProgress(const ContentIdentity& identity) = 0;

    /** @brief Indices in [0, totalChunks) with neither a done nor a failed row, ascending. */
    virtual std::vector<int> listPendingChunks(const ContentIdentity& identity, int totalChunks) = 0;

    /** @brief Number of chunks recorded as succeeded. */
    virtual int countCompletedChunks(const ContentIdentity& identity) = 0;

    /** @brief Number of chunks recorded as failed. */
    virtual int countFailedChunks(const ContentIdentity& identity) = 0;

    virtual std::optional<FileRecord> findFileRecord(const ContentIdentity& identity) = 0;

    /**
     * @brief Identities of records whose hash starts with @p prefix.
     * @param limit Stops after this many matches.
     */
    virtual std::vector<ContentIdentity> findIdentitiesByPrefix(const std::string& prefix, int limit) = 0;

    /** @brief All records, newest first, with live progress counts. */
    virtual std::vector<FileProgress> listFileRecords() = 0;

    /** @brief Removes the record and any progress rows. @return false if absent. */
    virtual bool deleteFileRecord(const ContentIdentity& identity) = 0;

    /**
     * @brief Deletes terminal records completed before the cutoff.
     * @return Number of records removed.
     */
    virtual int pruneTerminalRecords(TimePoint completedBefore) = 0;
};

} // namespace distill::domain
