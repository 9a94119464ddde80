/**
 * @file InputSource.hpp
 * @brief Interface for the location watched for new inputs.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace distill::domain {

/**
 * @struct DiscoveredInput
 * @brief An accepted input whose bytes have not been read yet.
 */
struct DiscoveredInput {
    std::string location;     ///< Source-specific handle (a path for the inbox).
    std::string displayName;
    long long sizeBytes = 0;
    std::chrono::system_clock::time_point discoveredAt{};
};

/**
 * @struct ScanResult
 * @brief Accepted inputs, oldest first, plus diagnostics for skipped entries.
 */
struct ScanResult {
    std::vector<DiscoveredInput> inputs;
    std::vector<std::string> diagnostics;
};

/**
 * @class InputSource
 * @brief Yields readable text inputs and deletes them once processed.
 */
class InputSource {
public:
    virtual ~InputSource() = default;

    virtual ScanResult scan() = 0;

    /** @brief Reads the raw bytes. @return nullopt if the input vanished or is unreadable. */
    virtual std::optional<std::string> read(const DiscoveredInput& input) = 0;

    /** @brief Deletes the input from its location. @return false on failure. */
    virtual bool remove(const DiscoveredInput& input) = 0;

    /**
     * @brief Places a submitted input where the next scan will find it.
     * @return The display name it was stored under, or nullopt on failure.
     */
    virtual std::optional<std::string> accept(const std::string& displayName, const std::string& bytes) = 0;
};

} // namespace distill::domain
