/**
 * @file PipelineSettings.hpp
 * @brief Immutable snapshot of the pipeline configuration.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace distill::domain {

/**
 * @struct ExtractorSettings
 * @brief Connection and effort budget for the Ollama-backed extractor.
 */
struct ExtractorSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int maxTurns = 3;          ///< Attempts to obtain a well-formed answer per chunk.
    int timeoutSeconds = 600;
};

/**
 * @struct PipelineSettings
 * @brief Values read fresh by the scheduler before every tick.
 *
 * Paths are only honoured at start-up; everything else takes effect on the
 * next tick after a reload.
 */
struct PipelineSettings {
    bool enabled = true;
    std::chrono::seconds pollInterval{30};
    std::size_t chunkTargetSize = 4000;  ///< In characters.
    int maxParallelFiles = 2;
    int checkpointWriteRetries = 3;
    int historyRetentionDays = 0;        ///< 0 keeps terminal records forever.

    std::string inboxDir = "inbox";
    std::string databasePath = "distill.db";
    std::string knowledgeDir = "knowledge";

    ExtractorSettings extractor;
};

} // namespace distill::domain
