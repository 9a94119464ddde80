/**
 * @file Chunk.hpp
 * @brief Domain entity for one line-aligned slice of an input.
 */

#pragma once
#include <cstddef>
#include <string>
#include "domain/ContentIdentity.hpp"

namespace distill::domain {

/**
 * @struct Chunk
 * @brief Addressed by (identity, index) within a fixed total.
 */
struct Chunk {
    ContentIdentity identity;
    int index = 0;              ///< Zero-based position in the input.
    int totalChunks = 0;        ///< Fixed once computed for an identity.
    std::size_t byteStart = 0;  ///< Inclusive.
    std::size_t byteEnd = 0;    ///< Exclusive.
    std::string text;
};

} // namespace distill::domain
