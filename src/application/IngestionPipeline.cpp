/**
 * @file IngestionPipeline.cpp
 * @brief Implementation of IngestionPipeline.
 */

#include "application/IngestionPipeline.hpp"
#include "application/DispatchPool.hpp"
#include "domain/IngestionErrors.hpp"
#include "domain/TextChunker.hpp"
#include "infrastructure/ContentHasher.hpp"
#include <iostream>
#include <thread>

namespace distill::application {

namespace {

constexpr std::chrono::milliseconds kWriteRetryBackoff{200};

std::string Describe(const domain::DiscoveredInput& input, const domain::ContentIdentity& identity) {
    return input.displayName + " (" + identity.shortForm() + ")";
}

} // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<domain::InputSource> source,
                                     std::shared_ptr<domain::CheckpointStore> store,
                                     std::shared_ptr<domain::Extractor> extractor,
                                     std::shared_ptr<InFlightRegistry> registry,
                                     FileLifecycleService::Clock clock)
    : m_source(std::move(source)),
      m_store(std::move(store)),
      m_extractor(std::move(extractor)),
      m_registry(std::move(registry)),
      m_clock(clock ? clock : [] { return std::chrono::system_clock::now(); }),
      m_lifecycle(m_store, m_clock) {}

std::chrono::system_clock::time_point IngestionPipeline::now() const {
    return m_clock();
}

TickReport IngestionPipeline::runTick(const domain::PipelineSettings& settings) {
    TickReport report;

    try {
        m_lifecycle.applyRetention(settings.historyRetentionDays);
    } catch (const domain::StorageError& e) {
        std::cerr << "[IngestionPipeline] Retention pass skipped: " << e.what() << std::endl;
    }

    domain::ScanResult scan = m_source->scan();
    report.discovered = static_cast<int>(scan.inputs.size());
    report.skipped = static_cast<int>(scan.diagnostics.size());
    for (const auto& d : scan.diagnostics) {
        std::cerr << "[IngestionPipeline] " << d << std::endl;
    }
    report.diagnostics = std::move(scan.diagnostics);

    std::mutex reportMutex;
    DispatchPool pool(settings.maxParallelFiles);
    pool.run(scan.inputs.size(), [&](std::size_t i) {
        int calls = 0;
        FileOutcome outcome = processInput(scan.inputs[i], settings, calls);

        std::lock_guard<std::mutex> lock(reportMutex);
        report.extractorCalls += calls;
        switch (outcome) {
            case FileOutcome::Completed: ++report.completed; break;
            case FileOutcome::Failed: ++report.failed; break;
            case FileOutcome::Corrupted: ++report.corrupted; break;
            case FileOutcome::Deduplicated: ++report.deduplicated; break;
            case FileOutcome::Rejected:
                ++report.rejected;
                report.diagnostics.push_back("Rejected non-text input: " + scan.inputs[i].displayName);
                break;
            case FileOutcome::Deferred: ++report.deferred; break;
        }
    });

    if (report.discovered > 0) {
        std::cout << "[IngestionPipeline] Tick: " << report.discovered << " discovered, " << report.completed
                  << " completed, " << report.failed << " failed, " << report.corrupted << " corrupted, "
                  << report.deduplicated << " deduplicated, " << report.deferred << " deferred, "
                  << report.extractorCalls << " extractor call(s)" << std::endl;
    }
    return report;
}

FileOutcome IngestionPipeline::processInput(const domain::DiscoveredInput& input,
                                            const domain::PipelineSettings& settings, int& extractorCalls) {
    if (stopRequested()) {
        return FileOutcome::Deferred;
    }

    auto bytes = m_source->read(input);
    if (!bytes) {
        std::cerr << "[IngestionPipeline] Cannot read " << input.displayName << ", retrying next tick" << std::endl;
        return FileOutcome::Deferred;
    }
    if (!domain::TextChunker::looksLikeText(*bytes)) {
        std::cerr << "[IngestionPipeline] " << input.displayName << " is not plain text, skipped" << std::endl;
        return FileOutcome::Rejected;
    }

    domain::ContentIdentity identity;
    try {
        identity = infrastructure::ContentHasher::identify(*bytes);
    } catch (const domain::IdentityError& e) {
        std::cerr << "[IngestionPipeline] Cannot identify " << input.displayName << ": " << e.what() << std::endl;
        return FileOutcome::Deferred;
    }

    InFlightRegistry::Claim claim(*m_registry, identity);
    if (!claim.owned()) {
        std::cout << "[IngestionPipeline] " << Describe(input, identity)
                  << " is already being dispatched, deferring" << std::endl;
        return FileOutcome::Deferred;
    }

    try {
        auto existing = m_store->findFileRecord(identity);
        if (existing && existing->isTerminal()) {
            std::cout << "[IngestionPipeline] " << Describe(input, identity) << " already "
                      << domain::StatusToString(existing->status) << " as " << existing->filename
                      << ", removing input" << std::endl;
            m_lifecycle.cleanupProgress(identity);
            deleteInput(input);
            return FileOutcome::Deduplicated;
        }

        // A record that already exists keeps the boundaries it was created with.
        std::size_t targetSize = settings.chunkTargetSize;
        if (existing && existing->chunkTargetSize > 0) {
            targetSize = existing->chunkTargetSize;
        }
        int totalChunks = domain::TextChunker::countChunks(*bytes, targetSize);

        domain::FileRecord record = m_lifecycle.admit(identity, input.displayName,
                                                      static_cast<long long>(bytes->size()), totalChunks, targetSize);
        if (record.isTerminal()) {
            deleteInput(input);
            return FileOutcome::Deduplicated;
        }
        if (record.totalChunks != totalChunks) {
            throw domain::ChunkCountMismatchError(identity.hex(), record.totalChunks, totalChunks);
        }
        record.chunkTargetSize = targetSize;

        if (!m_lifecycle.begin(record)) {
            return FileOutcome::Deduplicated;
        }
        return dispatchChunks(input, record, *bytes, settings, extractorCalls);
    } catch (const domain::ChunkCountMismatchError& e) {
        try {
            m_lifecycle.markCorrupted(identity, e.what());
        } catch (const domain::StorageError& se) {
            std::cerr << "[IngestionPipeline] Could not mark " << Describe(input, identity)
                      << " corrupt: " << se.what() << std::endl;
            return FileOutcome::Deferred;
        }
        deleteInput(input);
        return FileOutcome::Corrupted;
    } catch (const domain::StorageError& e) {
        std::cerr << "[IngestionPipeline] Storage unavailable for " << Describe(input, identity) << ": "
                  << e.what() << ", retrying next tick" << std::endl;
        return FileOutcome::Deferred;
    }
}

FileOutcome IngestionPipeline::dispatchChunks(const domain::DiscoveredInput& input, const domain::FileRecord& record,
                                              const std::string& bytes, const domain::PipelineSettings& settings,
                                              int& extractorCalls) {
    const domain::ContentIdentity& identity = record.identity;
    const std::string label = Describe(input, identity);

    std::vector<domain::Chunk> chunks = domain::TextChunker::chunk(identity, bytes, record.chunkTargetSize);
    std::vector<int> pending = m_store->listPendingChunks(identity, record.totalChunks);

    if (!pending.empty()) {
        std::cout << "[IngestionPipeline] " << label << ": " << pending.size() << " of " << record.totalChunks
                  << " chunk(s) pending" << std::endl;
    }

    for (int index : pending) {
        if (stopRequested()) {
            std::cout << "[IngestionPipeline] Shutdown requested, " << label << " stops before chunk " << index
                      << std::endl;
            return FileOutcome::Deferred;
        }

        const domain::Chunk& chunk = chunks[static_cast<std::size_t>(index)];
        domain::ExtractionRequest request{identity, chunk.index, chunk.totalChunks, record.filename, chunk.text};

        domain::ExtractionOutcome outcome = invokeExtractor(request);
        ++extractorCalls;

        if (!outcome.succeeded) {
            std::cerr << "[IngestionPipeline] " << label << " chunk " << index + 1 << "/" << record.totalChunks
                      << " failed: " << outcome.message << std::endl;
        }

        if (!recordWithRetry(record, index, outcome.succeeded, settings.checkpointWriteRetries)) {
            std::cerr << "[IngestionPipeline] " << label << " abandoned for this tick: checkpoint for chunk "
                      << index << " not durable" << std::endl;
            return FileOutcome::Deferred;
        }
    }

    int succeeded = 0;
    domain::FileStatus status = m_lifecycle.finalize(identity, record.totalChunks, succeeded);
    std::cout << "[IngestionPipeline] " << label << " " << domain::StatusToString(status) << " ("
              << succeeded << "/" << record.totalChunks << " chunks)" << std::endl;

    // Only after the terminal status is durable.
    deleteInput(input);
    return status == domain::FileStatus::Completed ? FileOutcome::Completed : FileOutcome::Failed;
}

domain::ExtractionOutcome IngestionPipeline::invokeExtractor(const domain::ExtractionRequest& request) {
    try {
        return m_extractor->extract(request);
    } catch (const std::exception& e) {
        return domain::ExtractionOutcome::Failure(std::string("extractor threw: ") + e.what());
    }
}

bool IngestionPipeline::recordWithRetry(const domain::FileRecord& record, int index, bool succeeded,
                                        int retries) {
    for (int attempt = 0; attempt <= retries; ++attempt) {
        try {
            if (succeeded) {
                m_store->recordChunkDone(record.identity, index, record.totalChunks, record.filename, now());
            } else {
                m_store->recordChunkFailed(record.identity, index, record.totalChunks, record.filename, now());
            }
            return true;
        } catch (const domain::StorageError& e) {
            std::cerr << "[IngestionPipeline] Checkpoint write " << attempt + 1 << "/" << retries + 1
                      << " failed: " << e.what() << std::endl;
            if (attempt < retries) {
                std::this_thread::sleep_for(kWriteRetryBackoff * (attempt + 1));
            }
        }
    }
    return false;
}

void IngestionPipeline::deleteInput(const domain::DiscoveredInput& input) {
    if (!m_source->remove(input)) {
        std::cerr << "[IngestionPipeline] Input " << input.displayName
                  << " could not be deleted; it will be recognised as processed next tick" << std::endl;
    }
}

} // namespace distill::application
