/**
 * @file TextChunker.hpp
 * @brief Deterministic, line-aligned chunking of input text.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "domain/Chunk.hpp"
#include "domain/ContentIdentity.hpp"

namespace distill::domain {

/**
 * @class TextChunker
 * @brief Splits text at line boundaries near a target size.
 *
 * Lines keep their terminator, so the chunk texts concatenated in index order
 * reproduce the input exactly. Sizes are counted in UTF-8 code points.
 * A chunk is closed before a line that would push it over the target; a line
 * that alone exceeds the target forms a chunk of its own.
 */
class TextChunker {
public:
    /**
     * @brief Computes the full chunk sequence.
     * @throws std::invalid_argument if targetSize is zero.
     */
    static std::vector<Chunk> chunk(const ContentIdentity& identity, const std::string& text,
                                    std::size_t targetSize);

    /** @brief Same boundaries as chunk(), without copying chunk texts. */
    static int countChunks(const std::string& text, std::size_t targetSize);

    /** @brief False for content with NUL bytes, which is treated as binary. */
    static bool looksLikeText(const std::string& bytes);

    /** @brief Number of UTF-8 code points in [begin, end). */
    static std::size_t characterCount(const std::string& text, std::size_t begin, std::size_t end);

private:
    struct Range {
        std::size_t begin;
        std::size_t end;
    };

    static std::vector<Range> computeBoundaries(const std::string& text, std::size_t targetSize);
};

} // namespace distill::domain
