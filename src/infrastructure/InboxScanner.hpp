/**
 * @file InboxScanner.hpp
 * @brief Input source backed by a watched inbox directory.
 */

#pragma once
#include <string>
#include "domain/InputSource.hpp"

namespace distill::infrastructure {

/**
 * @class InboxScanner
 * @brief Lists plain-text files in the inbox, oldest first.
 *
 * Files with an unsupported extension are reported as diagnostics and never
 * enter the pipeline. Hidden files and in-progress uploads (".part") are
 * ignored silently.
 */
class InboxScanner : public domain::InputSource {
public:
    explicit InboxScanner(const std::string& inboxPath);

    domain::ScanResult scan() override;
    std::optional<std::string> read(const domain::DiscoveredInput& input) override;
    bool remove(const domain::DiscoveredInput& input) override;
    std::optional<std::string> accept(const std::string& displayName, const std::string& bytes) override;

    const std::string& inboxPath() const { return m_inboxPath; }

    /** @brief True for accepted plain-text extensions or no extension (case-insensitive). */
    static bool isAcceptedName(const std::string& filename);

private:
    std::string m_inboxPath;
};

} // namespace distill::infrastructure
