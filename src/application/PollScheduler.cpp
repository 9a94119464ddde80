/**
 * @file PollScheduler.cpp
 * @brief Implementation of PollScheduler.
 */

#include "application/PollScheduler.hpp"
#include <iostream>

namespace distill::application {

PollScheduler::PollScheduler(std::shared_ptr<IngestionPipeline> pipeline,
                             std::shared_ptr<SettingsHolder> settings,
                             Reloader reloader)
    : m_pipeline(std::move(pipeline)), m_settings(std::move(settings)), m_reloader(std::move(reloader)) {}

PollScheduler::~PollScheduler() {
    stop();
}

void PollScheduler::start() {
    m_running = true;
    m_pipeline->clearStop();
    m_thread = std::thread([this] { loop(); });
}

void PollScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_pipeline->requestStop();
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void PollScheduler::refreshSettings() {
    if (!m_reloader) return;
    auto next = m_reloader();
    if (next) {
        m_settings->replace(std::move(*next));
    }
}

std::optional<TickReport> PollScheduler::tickOnce() {
    refreshSettings();
    auto snapshot = m_settings->get();
    if (!snapshot->enabled) {
        if (!m_loggedDisabled) {
            std::cout << "[PollScheduler] Ingestion disabled by configuration" << std::endl;
            m_loggedDisabled = true;
        }
        return std::nullopt;
    }
    m_loggedDisabled = false;

    TickReport report = m_pipeline->runTick(*snapshot);
    ++m_ticks;
    return report;
}

void PollScheduler::runLoop() {
    m_running = true;
    loop();
}

void PollScheduler::loop() {
    std::cout << "[PollScheduler] Started" << std::endl;

    while (m_running) {
        tickOnce();

        // Interval of the snapshot current after the tick; edits apply from the next wait on.
        auto interval = m_settings->get()->pollInterval;
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, interval, [this] { return !m_running; });
    }
    std::cout << "[PollScheduler] Stopped" << std::endl;
}

} // namespace distill::application
