/**
 * @file TextChunker.cpp
 * @brief Implementation of TextChunker.
 */

#include "domain/TextChunker.hpp"
#include <stdexcept>

namespace distill::domain {

std::vector<Chunk> TextChunker::chunk(const ContentIdentity& identity, const std::string& text,
                                      std::size_t targetSize) {
    auto ranges = computeBoundaries(text, targetSize);
    const int total = static_cast<int>(ranges.size());

    std::vector<Chunk> chunks;
    chunks.reserve(ranges.size());
    for (int i = 0; i < total; ++i) {
        Chunk c;
        c.identity = identity;
        c.index = i;
        c.totalChunks = total;
        c.byteStart = ranges[i].begin;
        c.byteEnd = ranges[i].end;
        c.text = text.substr(c.byteStart, c.byteEnd - c.byteStart);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

int TextChunker::countChunks(const std::string& text, std::size_t targetSize) {
    return static_cast<int>(computeBoundaries(text, targetSize).size());
}

bool TextChunker::looksLikeText(const std::string& bytes) {
    return bytes.find('\0') == std::string::npos;
}

std::size_t TextChunker::characterCount(const std::string& text, std::size_t begin, std::size_t end) {
    std::size_t count = 0;
    for (std::size_t i = begin; i < end; ++i) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::vector<TextChunker::Range> TextChunker::computeBoundaries(const std::string& text, std::size_t targetSize) {
    if (targetSize == 0) {
        throw std::invalid_argument("chunk target size must be positive");
    }

    std::vector<Range> ranges;
    std::size_t chunkBegin = 0;
    std::size_t chunkChars = 0;
    std::size_t pos = 0;

    while (pos < text.size()) {
        std::size_t newline = text.find('\n', pos);
        std::size_t lineEnd = (newline == std::string::npos) ? text.size() : newline + 1;
        std::size_t lineChars = characterCount(text, pos, lineEnd);

        if (pos > chunkBegin && chunkChars + lineChars > targetSize) {
            ranges.push_back({chunkBegin, pos});
            chunkBegin = pos;
            chunkChars = 0;
        }
        chunkChars += lineChars;
        pos = lineEnd;
    }

    if (pos > chunkBegin) {
        ranges.push_back({chunkBegin, pos});
    }
    return ranges;
}

} // namespace distill::domain
