/**
 * @file Extractor.hpp
 * @brief Interface for the external process that distills one chunk.
 */

#pragma once
#include <string>
#include "domain/ContentIdentity.hpp"

namespace distill::domain {

struct ExtractionRequest {
    ContentIdentity identity;
    int chunkIndex = 0;
    int totalChunks = 0;
    std::string filename;
    std::string text;
};

struct ExtractionOutcome {
    bool succeeded = false;
    std::string message;

    static ExtractionOutcome Success() { return {true, {}}; }
    static ExtractionOutcome Failure(std::string why) { return {false, std::move(why)}; }
};

/**
 * @class Extractor
 * @brief Opaque, bounded-effort call that stores knowledge as a side effect.
 *
 * Implementations may be invoked more than once for the same chunk after a
 * crash, so their side effects should tolerate repetition.
 */
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual ExtractionOutcome extract(const ExtractionRequest& request) = 0;
};

} // namespace distill::domain
