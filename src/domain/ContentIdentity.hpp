/**
 * @file ContentIdentity.hpp
 * @brief Value object for the filename-independent identity of an input.
 */

#pragma once
#include <string>

namespace distill::domain {

/**
 * @class ContentIdentity
 * @brief Hex-encoded digest of the complete byte content of an input.
 *
 * Sole key for deduplication and checkpoint lookup. Filenames are display
 * metadata only.
 */
class ContentIdentity {
public:
    ContentIdentity() = default;
    explicit ContentIdentity(std::string hex) : m_hex(std::move(hex)) {}

    const std::string& hex() const { return m_hex; }
    bool empty() const { return m_hex.empty(); }

    /** @brief First 12 hex characters, for logs and derived file names. */
    std::string shortForm() const { return m_hex.substr(0, 12); }

    bool operator==(const ContentIdentity& other) const { return m_hex == other.m_hex; }
    bool operator!=(const ContentIdentity& other) const { return m_hex != other.m_hex; }
    bool operator<(const ContentIdentity& other) const { return m_hex < other.m_hex; }

private:
    std::string m_hex;
};

} // namespace distill::domain
