/**
 * @file FileLifecycleService.cpp
 * @brief Implementation of FileLifecycleService.
 */

#include "application/FileLifecycleService.hpp"
#include "domain/IngestionErrors.hpp"
#include <iostream>

namespace distill::application {

FileLifecycleService::FileLifecycleService(std::shared_ptr<domain::CheckpointStore> store, Clock clock)
    : m_store(std::move(store)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::system_clock::now(); };
    }
}

domain::FileRecord FileLifecycleService::admit(const domain::ContentIdentity& identity, const std::string& filename,
                                               long long sizeBytes, int totalChunks, std::size_t chunkTargetSize) {
    return m_store->upsertFileRecord(identity, filename, sizeBytes, totalChunks, chunkTargetSize, m_clock());
}

bool FileLifecycleService::begin(const domain::FileRecord& record) {
    switch (record.status) {
        case domain::FileStatus::Queued:
            return m_store->setFileStatus(record.identity, domain::FileStatus::Processing, m_clock());
        case domain::FileStatus::Processing:
            std::cout << "[FileLifecycle] Resuming " << record.filename << " (" << record.identity.shortForm()
                      << ")" << std::endl;
            return true;
        case domain::FileStatus::Completed:
        case domain::FileStatus::Failed:
            return false;
    }
    return false;
}

domain::FileStatus FileLifecycleService::finalize(const domain::ContentIdentity& identity, int totalChunks,
                                                  int& succeededChunks) {
    int failedChunks = m_store->countFailedChunks(identity);
    succeededChunks = totalChunks - failedChunks;
    domain::FileStatus status = failedChunks == 0 ? domain::FileStatus::Completed : domain::FileStatus::Failed;

    domain::StatusDetail detail;
    detail.completedChunks = succeededChunks;
    if (failedChunks > 0) {
        detail.failureReason = domain::kChunkFailures;
    }

    if (!m_store->setFileStatus(identity, status, m_clock(), detail)) {
        auto current = m_store->findFileRecord(identity);
        if (!current) {
            throw domain::StorageError("file record vanished before finalization: " + identity.hex());
        }
        status = current->status;
    }

    cleanupProgress(identity);
    return status;
}

void FileLifecycleService::markCorrupted(const domain::ContentIdentity& identity, const std::string& detail) {
    std::cerr << "[FileLifecycle] Corrupt record " << identity.shortForm() << ": " << detail << std::endl;

    domain::StatusDetail statusDetail;
    statusDetail.failureReason = domain::kChunkCountMismatch;
    if (m_store->setFileStatus(identity, domain::FileStatus::Failed, m_clock(), statusDetail)) {
        cleanupProgress(identity);
    }
}

void FileLifecycleService::cleanupProgress(const domain::ContentIdentity& identity) {
    try {
        m_store->clearChunkProgress(identity);
    } catch (const domain::StorageError& e) {
        std::cerr << "[FileLifecycle] Progress cleanup for " << identity.shortForm()
                  << " postponed: " << e.what() << std::endl;
    }
}

int FileLifecycleService::applyRetention(int retentionDays) {
    if (retentionDays <= 0) {
        return 0;
    }
    auto cutoff = m_clock() - std::chrono::hours(24) * retentionDays;
    int removed = m_store->pruneTerminalRecords(cutoff);
    if (removed > 0) {
        std::cout << "[FileLifecycle] Pruned " << removed << " record(s) older than " << retentionDays
                  << " day(s)" << std::endl;
    }
    return removed;
}

} // namespace distill::application
