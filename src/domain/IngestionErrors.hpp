/**
 * @file IngestionErrors.hpp
 * @brief Exception types raised by the ingestion core.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace distill::domain {

/** @brief A checkpoint store read or write did not succeed durably. */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief The content digest could not be computed. */
class IdentityError : public std::runtime_error {
public:
    explicit IdentityError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ChunkCountMismatchError
 * @brief A stored total_chunks disagrees with the recomputed chunk count.
 */
class ChunkCountMismatchError : public std::runtime_error {
public:
    ChunkCountMismatchError(const std::string& identityHex, int stored, int recomputed)
        : std::runtime_error("chunk count mismatch for " + identityHex + ": stored " +
                             std::to_string(stored) + ", recomputed " + std::to_string(recomputed)),
          m_stored(stored),
          m_recomputed(recomputed) {}

    int stored() const { return m_stored; }
    int recomputed() const { return m_recomputed; }

private:
    int m_stored;
    int m_recomputed;
};

} // namespace distill::domain
