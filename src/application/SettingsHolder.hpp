/**
 * @file SettingsHolder.hpp
 * @brief Atomically swappable configuration snapshot.
 */

#pragma once

#include <memory>
#include <mutex>
#include "domain/PipelineSettings.hpp"

namespace distill::application {

/**
 * @class SettingsHolder
 * @brief Readers take an immutable snapshot; a reload swaps in a new one.
 *
 * A tick keeps the snapshot it started with even if a reload happens
 * meanwhile.
 */
class SettingsHolder {
public:
    explicit SettingsHolder(domain::PipelineSettings initial)
        : m_current(std::make_shared<const domain::PipelineSettings>(std::move(initial))) {}

    std::shared_ptr<const domain::PipelineSettings> get() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    void replace(domain::PipelineSettings next) {
        auto snapshot = std::make_shared<const domain::PipelineSettings>(std::move(next));
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current = std::move(snapshot);
    }

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<const domain::PipelineSettings> m_current;
};

} // namespace distill::application
