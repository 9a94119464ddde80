/**
 * @file OllamaExtractor.cpp
 * @brief Implementation of the OllamaExtractor class.
 */
#include "infrastructure/OllamaExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace distill::infrastructure {

namespace {

const char* kSystemPrompt =
    "You distill knowledge from fragments of larger documents.\n"
    "Read the fragment and extract the facts, decisions and definitions it states.\n\n"
    "RULES:\n"
    "1. Describe only what is in the text. Do not invent authors, titles or dates.\n"
    "2. The fragment may start or end mid-thought; do not guess what is missing.\n"
    "3. If the fragment holds nothing worth keeping, return an empty list.\n\n"
    "Answer with JSON only, in this exact shape:\n"
    "{\"records\": [{\"title\": \"...\", \"summary\": \"...\", \"tags\": [\"...\"]}]}";

const char* kRetryNotice =
    "\n\nYour previous answer was not valid JSON of the required shape. "
    "Answer again with the JSON object only.";

} // namespace

OllamaExtractor::OllamaExtractor(domain::ExtractorSettings settings, std::shared_ptr<KnowledgeStore> store)
    : m_settings(std::move(settings)), m_store(std::move(store)) {}

std::optional<std::vector<domain::KnowledgeRecord>> OllamaExtractor::ParseRecords(const std::string& answer) {
    json body = json::parse(answer, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("records") || !body["records"].is_array()) {
        return std::nullopt;
    }

    std::vector<domain::KnowledgeRecord> records;
    for (const auto& item : body["records"]) {
        if (!item.is_object() || !item.contains("title") || !item["title"].is_string()) {
            return std::nullopt;
        }
        domain::KnowledgeRecord r;
        r.title = item["title"].get<std::string>();
        if (item.contains("summary") && item["summary"].is_string()) {
            r.summary = item["summary"].get<std::string>();
        }
        if (item.contains("tags") && item["tags"].is_array()) {
            for (const auto& tag : item["tags"]) {
                if (tag.is_string()) r.tags.push_back(tag.get<std::string>());
            }
        }
        records.push_back(std::move(r));
    }
    return records;
}

std::string OllamaExtractor::buildPrompt(const domain::ExtractionRequest& request) const {
    std::stringstream ss;
    ss << "DOCUMENT: " << request.filename << "\n"
       << "FRAGMENT " << (request.chunkIndex + 1) << " OF " << request.totalChunks << "\n"
       << "------------------------\n"
       << request.text << "\n"
       << "------------------------\n";
    return ss.str();
}

domain::ExtractionOutcome OllamaExtractor::extract(const domain::ExtractionRequest& request) {
    OllamaClient client(m_settings.host, m_settings.port, m_settings.timeoutSeconds);
    std::string prompt = buildPrompt(request);
    std::string lastProblem = "no attempts made";

    for (int turn = 1; turn <= m_settings.maxTurns; ++turn) {
        auto answer = client.generate(m_settings.model, kSystemPrompt, prompt, true);
        if (!answer) {
            // Transport errors are not retried here; the chunk fails for this pass.
            return domain::ExtractionOutcome::Failure("ollama: " + client.lastError());
        }

        auto records = ParseRecords(*answer);
        if (!records) {
            lastProblem = "malformed answer on turn " + std::to_string(turn);
            std::cerr << "[OllamaExtractor] " << request.identity.shortForm() << " chunk " << request.chunkIndex
                      << ": " << lastProblem << std::endl;
            if (turn == 1) prompt += kRetryNotice;
            continue;
        }

        if (!m_store->write(request.identity, request.chunkIndex, request.filename, *records)) {
            return domain::ExtractionOutcome::Failure("knowledge store write failed");
        }
        return domain::ExtractionOutcome::Success();
    }
    return domain::ExtractionOutcome::Failure(lastProblem);
}

} // namespace distill::infrastructure
