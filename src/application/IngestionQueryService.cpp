/**
 * @file IngestionQueryService.cpp
 * @brief Implementation of IngestionQueryService.
 */

#include "application/IngestionQueryService.hpp"
#include "domain/TextChunker.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/InboxScanner.hpp"
#include <cctype>
#include <chrono>
#include <iostream>

namespace distill::application {

IngestionQueryService::IngestionQueryService(std::shared_ptr<domain::CheckpointStore> store,
                                             std::shared_ptr<domain::InputSource> source,
                                             std::shared_ptr<InFlightRegistry> registry,
                                             std::shared_ptr<SettingsHolder> settings)
    : m_store(std::move(store)),
      m_source(std::move(source)),
      m_registry(std::move(registry)),
      m_settings(std::move(settings)) {}

std::vector<domain::FileProgress> IngestionQueryService::listFiles() {
    return m_store->listFileRecords();
}

std::optional<domain::FileProgress> IngestionQueryService::findFile(const domain::ContentIdentity& identity) {
    auto record = m_store->findFileRecord(identity);
    if (!record) {
        return std::nullopt;
    }
    domain::FileProgress progress;
    progress.record = *record;
    progress.completedChunks = record->isTerminal() ? record->completedChunks
                                                    : m_store->countCompletedChunks(identity);
    return progress;
}

DeleteResult IngestionQueryService::deleteFile(const domain::ContentIdentity& identity) {
    // Holding the claim keeps the dispatch loop away while the record goes.
    InFlightRegistry::Claim claim(*m_registry, identity);
    if (!claim.owned()) {
        return DeleteResult::InFlight;
    }

    auto record = m_store->findFileRecord(identity);
    if (!record) {
        return DeleteResult::NotFound;
    }
    if (!record->isTerminal()) {
        return DeleteResult::NotTerminal;
    }
    if (!m_store->deleteFileRecord(identity)) {
        return DeleteResult::NotFound;
    }
    std::cout << "[IngestionQuery] Deleted record " << identity.shortForm() << " (" << record->filename << ")"
              << std::endl;
    return DeleteResult::Deleted;
}

DeleteResult IngestionQueryService::deleteByHash(const std::string& hashOrPrefix) {
    std::string prefix;
    for (char c : hashOrPrefix) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return DeleteResult::NotFound;
        }
        prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto matches = m_store->findIdentitiesByPrefix(prefix, 2);
    if (matches.empty()) {
        return DeleteResult::NotFound;
    }
    if (matches.size() > 1) {
        return DeleteResult::Ambiguous;
    }
    return deleteFile(matches.front());
}

SubmitResult IngestionQueryService::submit(const std::string& displayName, const std::string& bytes) {
    SubmitResult result;
    if (!infrastructure::InboxScanner::isAcceptedName(displayName)) {
        result.message = "unsupported file type: " + displayName;
        return result;
    }
    if (!domain::TextChunker::looksLikeText(bytes)) {
        result.message = "not a plain-text file: " + displayName;
        return result;
    }

    domain::ContentIdentity identity = infrastructure::ContentHasher::identify(bytes);
    if (auto existing = m_store->findFileRecord(identity)) {
        result.kind = SubmitResult::Kind::AlreadyKnown;
        result.record = existing;
        result.message = "already known as " + existing->filename + " (" +
                         domain::StatusToString(existing->status) + ")";
        return result;
    }

    // The input goes in first: a record without an input could never finish.
    auto storedName = m_source->accept(displayName, bytes);
    if (!storedName) {
        result.message = "could not store " + displayName + " in the inbox";
        return result;
    }

    auto settings = m_settings->get();
    int totalChunks = domain::TextChunker::countChunks(bytes, settings->chunkTargetSize);
    result.record = m_store->upsertFileRecord(identity, *storedName, static_cast<long long>(bytes.size()),
                                              totalChunks, settings->chunkTargetSize,
                                              std::chrono::system_clock::now());
    result.kind = SubmitResult::Kind::Accepted;
    result.message = "queued as " + *storedName;
    return result;
}

} // namespace distill::application
