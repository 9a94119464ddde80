/**
 * @file ContentHasher.hpp
 * @brief SHA-256 content identity derivation.
 */

#pragma once
#include <string>
#include "domain/ContentIdentity.hpp"

namespace distill::infrastructure {

class ContentHasher {
public:
    /**
     * @brief Digest of the complete byte content, as lowercase hex.
     * @throws domain::IdentityError if OpenSSL reports a failure.
     */
    static domain::ContentIdentity identify(const std::string& bytes);
};

} // namespace distill::infrastructure
