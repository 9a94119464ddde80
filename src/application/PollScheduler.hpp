/**
 * @file PollScheduler.hpp
 * @brief Timer-driven task that runs one pipeline tick per poll interval.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "application/IngestionPipeline.hpp"
#include "application/SettingsHolder.hpp"

namespace distill::application {

/**
 * @class PollScheduler
 * @brief Reloads settings, runs a tick if enabled, then sleeps.
 *
 * The sleep is interruptible, so stop() returns as soon as the current chunk
 * (if any) has been recorded.
 */
class PollScheduler {
public:
    /** @brief Returns new settings when the configuration changed, nullopt otherwise. */
    using Reloader = std::function<std::optional<domain::PipelineSettings>()>;

    PollScheduler(std::shared_ptr<IngestionPipeline> pipeline,
                  std::shared_ptr<SettingsHolder> settings,
                  Reloader reloader = nullptr);
    ~PollScheduler();

    /** @brief Runs the loop on a background thread. */
    void start();

    /** @brief Runs the loop on the calling thread until stop() is called. */
    void runLoop();

    /** @brief Requests shutdown and joins the background thread if there is one. */
    void stop();

    /** @brief Reload + one tick, ignoring the interval. */
    std::optional<TickReport> tickOnce();

    int ticksCompleted() const { return m_ticks.load(); }

private:
    void loop();
    void refreshSettings();

    std::shared_ptr<IngestionPipeline> m_pipeline;
    std::shared_ptr<SettingsHolder> m_settings;
    Reloader m_reloader;

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};
    std::atomic<int> m_ticks{0};
    bool m_loggedDisabled = false;
};

} // namespace distill::application
