/**
 * @file InboxScanner.cpp
 * @brief Implementation of InboxScanner.
 */

#include "infrastructure/InboxScanner.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace distill::infrastructure {

namespace {

constexpr std::array<const char*, 20> kTextExtensions = {
    ".txt", ".text", ".md", ".markdown", ".rst", ".org", ".tex", ".log", ".csv", ".tsv",
    ".json", ".jsonl", ".yaml", ".yml", ".toml", ".xml", ".html", ".htm", ".ini", ".cfg"};

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

InboxScanner::InboxScanner(const std::string& inboxPath) : m_inboxPath(inboxPath) {}

bool InboxScanner::isAcceptedName(const std::string& filename) {
    std::string ext = ToLower(fs::path(filename).extension().string());
    if (ext.empty()) {
        return true;
    }
    return std::find(kTextExtensions.begin(), kTextExtensions.end(), ext) != kTextExtensions.end();
}

domain::ScanResult InboxScanner::scan() {
    domain::ScanResult result;

    std::error_code ec;
    if (!fs::exists(m_inboxPath, ec)) {
        return result;
    }

    for (const auto& entry : fs::directory_iterator(m_inboxPath, ec)) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }

        std::string filename = entry.path().filename().string();
        if (filename.empty() || filename[0] == '.' || ToLower(entry.path().extension().string()) == ".part") {
            continue;
        }
        if (!isAcceptedName(filename)) {
            result.diagnostics.push_back("Skipping unsupported file type: " + filename);
            continue;
        }

        domain::DiscoveredInput input;
        input.location = entry.path().string();
        input.displayName = filename;

        auto ftime = fs::last_write_time(entry, entryEc);
        if (entryEc) {
            result.diagnostics.push_back("Cannot stat " + filename + ": " + entryEc.message());
            continue;
        }
        input.discoveredAt = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        input.sizeBytes = static_cast<long long>(fs::file_size(entry, entryEc));

        result.inputs.push_back(std::move(input));
    }
    if (ec) {
        result.diagnostics.push_back("Inbox listing interrupted: " + ec.message());
    }

    std::stable_sort(result.inputs.begin(), result.inputs.end(),
                     [](const domain::DiscoveredInput& a, const domain::DiscoveredInput& b) {
                         if (a.discoveredAt != b.discoveredAt) return a.discoveredAt < b.discoveredAt;
                         return a.displayName < b.displayName;
                     });
    return result;
}

std::optional<std::string> InboxScanner::read(const domain::DiscoveredInput& input) {
    std::ifstream file(input.location, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool InboxScanner::remove(const domain::DiscoveredInput& input) {
    std::error_code ec;
    fs::remove(input.location, ec);
    if (ec) {
        std::cerr << "[InboxScanner] Failed to delete " << input.location << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::optional<std::string> InboxScanner::accept(const std::string& displayName, const std::string& bytes) {
    std::error_code ec;
    fs::create_directories(m_inboxPath, ec);
    if (ec) {
        std::cerr << "[InboxScanner] Cannot create inbox " << m_inboxPath << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    std::string name = fs::path(displayName).filename().string();
    fs::path finalPath = fs::path(m_inboxPath) / name;
    for (int n = 1; fs::exists(finalPath); ++n) {
        name = fs::path(displayName).stem().string() + "-" + std::to_string(n) +
               fs::path(displayName).extension().string();
        finalPath = fs::path(m_inboxPath) / name;
    }

    // Written under a ".part" name that scan() ignores, then renamed into place.
    fs::path tempPath = finalPath;
    tempPath += ".part";
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[InboxScanner] Failed to open " << tempPath << std::endl;
            return std::nullopt;
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[InboxScanner] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return std::nullopt;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[InboxScanner] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanupEc;
        fs::remove(tempPath, cleanupEc);
        return std::nullopt;
    }
    return name;
}

} // namespace distill::infrastructure
