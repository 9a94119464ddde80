/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace distill::infrastructure {

namespace {

constexpr const char* kSettingsFile = "settings.json";

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

template <typename T>
void ReadPositive(const json& j, const char* key, T& target) {
    T value = target;
    ReadKey(j, key, value);
    if (value > 0) {
        target = value;
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': must be positive" << std::endl;
    }
}

template <typename T>
void ReadNonNegative(const json& j, const char* key, T& target) {
    T value = target;
    ReadKey(j, key, value);
    if (value >= 0) {
        target = value;
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': must not be negative" << std::endl;
    }
}

json ToJson(const domain::PipelineSettings& s) {
    return {
        {"enabled", s.enabled},
        {"poll_interval_seconds", s.pollInterval.count()},
        {"chunk_target_size", s.chunkTargetSize},
        {"max_parallel_files", s.maxParallelFiles},
        {"checkpoint_write_retries", s.checkpointWriteRetries},
        {"history_retention_days", s.historyRetentionDays},
        {"inbox_dir", s.inboxDir},
        {"database_path", s.databasePath},
        {"knowledge_dir", s.knowledgeDir},
        {"extractor", {
            {"host", s.extractor.host},
            {"port", s.extractor.port},
            {"model", s.extractor.model},
            {"max_turns", s.extractor.maxTurns},
            {"timeout_seconds", s.extractor.timeoutSeconds}
        }}
    };
}

} // namespace

ConfigLoader::ConfigLoader(const std::string& projectRoot)
    : m_configPath(fs::path(projectRoot) / kSettingsFile) {}

std::optional<domain::PipelineSettings> ConfigLoader::Parse(const std::string& jsonText,
                                                            const domain::PipelineSettings& base) {
    json j = json::parse(jsonText, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    domain::PipelineSettings s = base;
    ReadKey(j, "enabled", s.enabled);

    long long intervalSeconds = s.pollInterval.count();
    ReadPositive(j, "poll_interval_seconds", intervalSeconds);
    s.pollInterval = std::chrono::seconds(intervalSeconds);

    long long targetSize = static_cast<long long>(s.chunkTargetSize);
    ReadPositive(j, "chunk_target_size", targetSize);
    s.chunkTargetSize = static_cast<std::size_t>(targetSize);

    ReadPositive(j, "max_parallel_files", s.maxParallelFiles);
    ReadNonNegative(j, "checkpoint_write_retries", s.checkpointWriteRetries);
    ReadNonNegative(j, "history_retention_days", s.historyRetentionDays);
    ReadKey(j, "inbox_dir", s.inboxDir);
    ReadKey(j, "database_path", s.databasePath);
    ReadKey(j, "knowledge_dir", s.knowledgeDir);

    if (j.contains("extractor") && j["extractor"].is_object()) {
        const json& e = j["extractor"];
        ReadKey(e, "host", s.extractor.host);
        ReadPositive(e, "port", s.extractor.port);
        ReadKey(e, "model", s.extractor.model);
        ReadPositive(e, "max_turns", s.extractor.maxTurns);
        ReadPositive(e, "timeout_seconds", s.extractor.timeoutSeconds);
    }
    return s;
}

std::optional<domain::PipelineSettings> ConfigLoader::LoadFromFile(const fs::path& configPath,
                                                                   const domain::PipelineSettings& base) {
    if (!fs::exists(configPath)) {
        return base;
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    auto parsed = Parse(buffer.str(), base);
    if (!parsed) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a valid JSON object" << std::endl;
    }
    return parsed;
}

void ConfigLoader::SaveDefaultsIfMissing(const std::string& projectRoot) {
    fs::path configPath = fs::path(projectRoot) / kSettingsFile;
    if (fs::exists(configPath)) {
        return;
    }
    try {
        std::ofstream f(configPath);
        f << ToJson(domain::PipelineSettings{}).dump(4) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

domain::PipelineSettings ConfigLoader::load() {
    m_lastWriteTime = currentWriteTime();
    auto settings = LoadFromFile(m_configPath, domain::PipelineSettings{});
    if (!settings) {
        std::cerr << "[ConfigLoader] Falling back to defaults" << std::endl;
        return domain::PipelineSettings{};
    }
    return *settings;
}

std::optional<domain::PipelineSettings> ConfigLoader::reloadIfChanged() {
    auto writeTime = currentWriteTime();
    if (!writeTime || writeTime == m_lastWriteTime) {
        return std::nullopt;
    }
    m_lastWriteTime = writeTime;

    auto settings = LoadFromFile(m_configPath, domain::PipelineSettings{});
    if (settings) {
        std::cout << "[ConfigLoader] Reloaded " << m_configPath.string() << std::endl;
    }
    return settings;
}

std::optional<fs::file_time_type> ConfigLoader::currentWriteTime() const {
    std::error_code ec;
    auto t = fs::last_write_time(m_configPath, ec);
    if (ec) {
        return std::nullopt;
    }
    return t;
}

} // namespace distill::infrastructure
