/**
 * @file OllamaExtractor.hpp
 * @brief Extractor that distills chunks with a local Ollama model.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Extractor.hpp"
#include "domain/KnowledgeRecord.hpp"
#include "domain/PipelineSettings.hpp"
#include "infrastructure/KnowledgeStore.hpp"

namespace distill::infrastructure {

/**
 * @class OllamaExtractor
 * @brief Implements domain::Extractor using the Ollama REST API.
 *
 * The model must answer with {"records": [{"title", "summary", "tags"}]}.
 * Malformed answers are retried within the turn budget; the parsed records
 * are handed to the KnowledgeStore.
 */
class OllamaExtractor : public domain::Extractor {
public:
    OllamaExtractor(domain::ExtractorSettings settings, std::shared_ptr<KnowledgeStore> store);

    domain::ExtractionOutcome extract(const domain::ExtractionRequest& request) override;

    /** @brief Parses a model answer. @return nullopt if it does not match the expected shape. */
    static std::optional<std::vector<domain::KnowledgeRecord>> ParseRecords(const std::string& answer);

private:
    std::string buildPrompt(const domain::ExtractionRequest& request) const;

    domain::ExtractorSettings m_settings;
    std::shared_ptr<KnowledgeStore> m_store;
};

} // namespace distill::infrastructure
