/**
 * @file DistillDaemon.hpp
 * @brief Wires the services together and runs the chosen command.
 */
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include "application/IngestionPipeline.hpp"
#include "application/IngestionQueryService.hpp"
#include "application/PollScheduler.hpp"
#include "application/SettingsHolder.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace distill::app {

/**
 * @class DistillDaemon
 * @brief Owns the object graph for one project root.
 */
class DistillDaemon {
public:
    explicit DistillDaemon(const std::string& projectRoot);
    ~DistillDaemon();

    /** @brief Loads settings and opens the store. @return false if the store cannot be opened. */
    bool initialize();

    /** @brief Polls until SIGINT or SIGTERM. */
    int run();

    /** @brief A single tick. */
    int runOnce();

    int printStatus(std::ostream& out);
    int deleteRecord(const std::string& contentHash);
    int submitFile(const std::string& path);

private:
    std::filesystem::path resolve(const std::string& path) const;
    /** @brief Warns when the configured model is not available. Never fatal. */
    void checkExtractor() const;

    std::filesystem::path m_projectRoot;
    std::unique_ptr<infrastructure::ConfigLoader> m_configLoader;
    std::shared_ptr<application::SettingsHolder> m_settings;
    std::shared_ptr<application::InFlightRegistry> m_registry;
    std::shared_ptr<application::IngestionPipeline> m_pipeline;
    std::unique_ptr<application::IngestionQueryService> m_queryService;
    std::unique_ptr<application::PollScheduler> m_scheduler;
};

} // namespace distill::app
