/**
 * @file ConfigLoader.hpp
 * @brief Loads the pipeline configuration (settings.json) and detects edits.
 *
 * Keeps JSON parsing in one place. Each key is validated on its own; an
 * invalid value is reported and the previous value is kept.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "domain/PipelineSettings.hpp"

namespace distill::infrastructure {

class ConfigLoader {
public:
    /** @param projectRoot Directory holding settings.json. */
    explicit ConfigLoader(const std::string& projectRoot);

    /**
     * @brief Reads settings.json on top of @p base.
     * @return base unchanged if the file does not exist, nullopt if it is malformed.
     */
    static std::optional<domain::PipelineSettings> LoadFromFile(const std::filesystem::path& configPath,
                                                                const domain::PipelineSettings& base);

    /**
     * @brief Parses a JSON document on top of @p base.
     * @return nullopt if the text is not a JSON object.
     */
    static std::optional<domain::PipelineSettings> Parse(const std::string& jsonText,
                                                         const domain::PipelineSettings& base);

    /** @brief Writes a settings.json with default values unless one already exists. */
    static void SaveDefaultsIfMissing(const std::string& projectRoot);

    /** @brief Initial load. Falls back to defaults on a malformed file. */
    domain::PipelineSettings load();

    /**
     * @brief Re-reads the file if its modification time changed since the last read.
     *
     * Keys are applied on top of the defaults, so a reload yields what a
     * restart would load.
     * @return New settings, or nullopt if unchanged, missing or malformed.
     */
    std::optional<domain::PipelineSettings> reloadIfChanged();

    const std::filesystem::path& configPath() const { return m_configPath; }

private:
    std::optional<std::filesystem::file_time_type> currentWriteTime() const;

    std::filesystem::path m_configPath;
    std::optional<std::filesystem::file_time_type> m_lastWriteTime;
};

} // namespace distill::infrastructure
