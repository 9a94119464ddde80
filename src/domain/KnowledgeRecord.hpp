/**
 * @file KnowledgeRecord.hpp
 * @brief A structured unit of knowledge distilled from one chunk.
 */

#pragma once
#include <string>
#include <vector>

namespace distill::domain {

struct KnowledgeRecord {
    std::string title;
    std::string summary;
    std::vector<std::string> tags;
};

} // namespace distill::domain
