/**
 * @file IngestionPipeline.hpp
 * @brief The dispatch loop: one scan of the inbox per tick.
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/FileLifecycleService.hpp"
#include "application/InFlightRegistry.hpp"
#include "domain/CheckpointStore.hpp"
#include "domain/Extractor.hpp"
#include "domain/InputSource.hpp"
#include "domain/PipelineSettings.hpp"

namespace distill::application {

/**
 * @enum FileOutcome
 * @brief What one tick did with one discovered input.
 */
enum class FileOutcome {
    Completed,     ///< All chunks succeeded; input deleted.
    Failed,        ///< At least one chunk failed; input deleted.
    Corrupted,     ///< Stored chunk count disagreed with the recomputed one.
    Deduplicated,  ///< Identity already terminal; nothing dispatched, input deleted.
    Rejected,      ///< Not text; no record created.
    Deferred       ///< Left for a later tick (in flight, storage error, shutdown, unreadable).
};

/**
 * @struct TickReport
 * @brief Summary of one tick, for logs and tests.
 */
struct TickReport {
    int discovered = 0;
    int skipped = 0;
    int completed = 0;
    int failed = 0;
    int corrupted = 0;
    int deduplicated = 0;
    int rejected = 0;
    int deferred = 0;
    int extractorCalls = 0;
    std::vector<std::string> diagnostics;
};

/**
 * @class IngestionPipeline
 * @brief Cross-references discovered inputs with the checkpoint store and
 *        dispatches pending chunks to the extractor.
 *
 * Holds no state between ticks apart from the in-flight registry: every tick
 * rebuilds its work list from the input source and the durable store.
 * Chunks of one file go out strictly in ascending index order; different
 * files run on up to max_parallel_files workers.
 */
class IngestionPipeline {
public:
    IngestionPipeline(std::shared_ptr<domain::InputSource> source,
                      std::shared_ptr<domain::CheckpointStore> store,
                      std::shared_ptr<domain::Extractor> extractor,
                      std::shared_ptr<InFlightRegistry> registry,
                      FileLifecycleService::Clock clock = nullptr);

    /** @brief Scans once and processes everything found. */
    TickReport runTick(const domain::PipelineSettings& settings);

    /**
     * @brief Runs the per-file state machine for one input.
     * @param extractorCalls Incremented for every extractor invocation.
     */
    FileOutcome processInput(const domain::DiscoveredInput& input, const domain::PipelineSettings& settings,
                             int& extractorCalls);

    /** @brief Stops dispatching new chunks; an in-flight chunk is allowed to finish. */
    void requestStop() { m_stopRequested = true; }
    void clearStop() { m_stopRequested = false; }
    bool stopRequested() const { return m_stopRequested.load(); }

private:
    FileOutcome dispatchChunks(const domain::DiscoveredInput& input, const domain::FileRecord& record,
                               const std::string& bytes, const domain::PipelineSettings& settings,
                               int& extractorCalls);
    domain::ExtractionOutcome invokeExtractor(const domain::ExtractionRequest& request);
    /** @brief Persists the chunk's outcome. @return false if no attempt was durable. */
    bool recordWithRetry(const domain::FileRecord& record, int index, bool succeeded, int retries);
    void deleteInput(const domain::DiscoveredInput& input);
    std::chrono::system_clock::time_point now() const;

    std::shared_ptr<domain::InputSource> m_source;
    std::shared_ptr<domain::CheckpointStore> m_store;
    std::shared_ptr<domain::Extractor> m_extractor;
    std::shared_ptr<InFlightRegistry> m_registry;
    FileLifecycleService::Clock m_clock;
    FileLifecycleService m_lifecycle;
    std::atomic<bool> m_stopRequested{false};
};

} // namespace distill::application
