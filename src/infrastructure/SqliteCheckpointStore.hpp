/**
 * @file SqliteCheckpointStore.hpp
 * @brief SQLite-backed implementation of the checkpoint store.
 */

#pragma once
#include <mutex>
#include <string>
#include "domain/CheckpointStore.hpp"

struct sqlite3;

namespace distill::infrastructure {

/**
 * @class SqliteCheckpointStore
 * @brief Persists chunk progress and file records in a single SQLite file.
 *
 * Runs in WAL mode with synchronous=FULL so that a statement that returned
 * SQLITE_DONE survives a crash. One connection, serialized by a mutex.
 */
class SqliteCheckpointStore : public domain::CheckpointStore {
public:
    /**
     * @brief Opens (or creates) the database and applies the schema.
     * @throws domain::StorageError if the file cannot be opened.
     */
    explicit SqliteCheckpointStore(const std::string& databasePath);
    ~SqliteCheckpointStore() override;

    SqliteCheckpointStore(const SqliteCheckpointStore&) = delete;
    SqliteCheckpointStore& operator=(const SqliteCheckpointStore&) = delete;

    void recordChunkDone(const domain::ContentIdentity& identity, int index, int totalChunks,
                         const std::string& filename, TimePoint completedAt) override;
    void recordChunkFailed(const domain::ContentIdentity& identity, int index, int totalChunks,
                           const std::string& filename, TimePoint failedAt) override;
    bool isChunkDone(const domain::ContentIdentity& identity, int index) override;
    domain::FileRecord upsertFileRecord(const domain::ContentIdentity& identity, const std::string& filename,
                                        long long sizeBytes, int totalChunks, std::size_t chunkTargetSize,
                                        TimePoint now) override;
    bool setFileStatus(const domain::ContentIdentity& identity, domain::FileStatus status, TimePoint timestamp,
                       const domain::StatusDetail& detail = {}) override;
    void clearChunkProgress(const domain::ContentIdentity& identity) override;
    std::vector<int> listPendingChunks(const domain::ContentIdentity& identity, int totalChunks) override;
    int countCompletedChunks(const domain::ContentIdentity& identity) override;
    int countFailedChunks(const domain::ContentIdentity& identity) override;
    std::optional<domain::FileRecord> findFileRecord(const domain::ContentIdentity& identity) override;
    std::vector<domain::ContentIdentity> findIdentitiesByPrefix(const std::string& prefix, int limit) override;
    std::vector<domain::FileProgress> listFileRecords() override;
    bool deleteFileRecord(const domain::ContentIdentity& identity) override;
    int pruneTerminalRecords(TimePoint completedBefore) override;

private:
    void applySchema();
    void insertProgress(const domain::ContentIdentity& identity, int index, int totalChunks,
                        const std::string& filename, TimePoint at, const char* outcome);
    int countProgress(const domain::ContentIdentity& identity, const char* outcome);
    void exec(const char* sql);
    std::optional<domain::FileRecord> findLocked(const domain::ContentIdentity& identity);

    std::string m_path;
    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

} // namespace distill::infrastructure
