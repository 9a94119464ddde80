/**
 * @file InFlightRegistry.hpp
 * @brief Tracks identities currently being dispatched in this process.
 */

#pragma once

#include <mutex>
#include <set>
#include <string>
#include "domain/ContentIdentity.hpp"

namespace distill::application {

/**
 * @class InFlightRegistry
 * @brief Guarantees that one identity is never dispatched by two workers.
 */
class InFlightRegistry {
public:
    /** @return false if the identity is already claimed. */
    bool tryClaim(const domain::ContentIdentity& identity) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_claimed.insert(identity.hex()).second;
    }

    void release(const domain::ContentIdentity& identity) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_claimed.erase(identity.hex());
    }

    bool isClaimed(const domain::ContentIdentity& identity) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_claimed.count(identity.hex()) > 0;
    }

    /**
     * @class Claim
     * @brief Scoped claim, released on destruction.
     */
    class Claim {
    public:
        Claim(InFlightRegistry& registry, domain::ContentIdentity identity)
            : m_registry(registry), m_identity(std::move(identity)), m_owned(registry.tryClaim(m_identity)) {}
        ~Claim() {
            if (m_owned) m_registry.release(m_identity);
        }
        Claim(const Claim&) = delete;
        Claim& operator=(const Claim&) = delete;

        bool owned() const { return m_owned; }

    private:
        InFlightRegistry& m_registry;
        domain::ContentIdentity m_identity;
        bool m_owned;
    };

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_claimed;
};

} // namespace distill::application
