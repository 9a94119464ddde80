/**
 * @file KnowledgeStore.hpp
 * @brief File-based sink for records produced by the extractor.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/ContentIdentity.hpp"
#include "domain/KnowledgeRecord.hpp"

namespace distill::infrastructure {

/**
 * @class KnowledgeStore
 * @brief Writes one JSON document per (identity, chunk) with temp -> rename.
 *
 * The file name is derived from the chunk address, so a repeated extraction
 * of the same chunk replaces its earlier output instead of adding to it.
 */
class KnowledgeStore {
public:
    explicit KnowledgeStore(const std::string& knowledgeDir);

    /** @return false if the document could not be written and renamed into place. */
    bool write(const domain::ContentIdentity& identity, int chunkIndex, const std::string& sourceName,
               const std::vector<domain::KnowledgeRecord>& records);

    std::filesystem::path pathFor(const domain::ContentIdentity& identity, int chunkIndex) const;

private:
    bool performAtomicWrite(const std::filesystem::path& finalPath, const std::string& content);

    std::filesystem::path m_dir;
};

} // namespace distill::infrastructure
