/**
 * @file KnowledgeStore.cpp
 * @brief Implementation of KnowledgeStore.
 */

#include "infrastructure/KnowledgeStore.hpp"
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace distill::infrastructure {

KnowledgeStore::KnowledgeStore(const std::string& knowledgeDir) : m_dir(knowledgeDir) {}

fs::path KnowledgeStore::pathFor(const domain::ContentIdentity& identity, int chunkIndex) const {
    return m_dir / (identity.shortForm() + "_" + std::to_string(chunkIndex) + ".json");
}

bool KnowledgeStore::write(const domain::ContentIdentity& identity, int chunkIndex, const std::string& sourceName,
                           const std::vector<domain::KnowledgeRecord>& records) {
    json doc = {
        {"content_hash", identity.hex()},
        {"chunk_index", chunkIndex},
        {"source", sourceName},
        {"records", json::array()}
    };
    for (const auto& r : records) {
        doc["records"].push_back({{"title", r.title}, {"summary", r.summary}, {"tags", r.tags}});
    }
    return performAtomicWrite(pathFor(identity, chunkIndex), doc.dump(2));
}

bool KnowledgeStore::performAtomicWrite(const fs::path& finalPath, const std::string& content) {
    // Unique per writer: several files may be extracted at once.
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(stamp) + "_" + std::to_string(tid) + ".tmp";

    std::error_code ec;
    fs::create_directories(finalPath.parent_path(), ec);
    if (ec) {
        std::cerr << "[KnowledgeStore] Error creating directories: " << ec.message() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[KnowledgeStore] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[KnowledgeStore] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[KnowledgeStore] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        return false;
    }
    return true;
}

} // namespace distill::infrastructure
