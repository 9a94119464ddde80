/**
 * @file IngestionQueryService.hpp
 * @brief Query and administration surface over the file records.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/InFlightRegistry.hpp"
#include "application/SettingsHolder.hpp"
#include "domain/CheckpointStore.hpp"
#include "domain/InputSource.hpp"

namespace distill::application {

enum class DeleteResult {
    Deleted,
    NotFound,
    NotTerminal,  ///< Queued or processing records cannot be deleted.
    InFlight,     ///< The identity is being dispatched right now.
    Ambiguous     ///< The hash prefix matches more than one record.
};

inline std::string DeleteResultToString(DeleteResult r) {
    switch (r) {
        case DeleteResult::Deleted: return "deleted";
        case DeleteResult::NotFound: return "not found";
        case DeleteResult::NotTerminal: return "not in a terminal status";
        case DeleteResult::InFlight: return "currently being processed";
        case DeleteResult::Ambiguous: return "ambiguous hash prefix";
    }
    return "unknown";
}

/**
 * @struct SubmitResult
 * @brief Outcome of an eager submission.
 */
struct SubmitResult {
    enum class Kind { Accepted, AlreadyKnown, Rejected };
    Kind kind = Kind::Rejected;
    std::optional<domain::FileRecord> record;
    std::string message;
};

/**
 * @class IngestionQueryService
 * @brief Lists records with progress, deletes terminal ones, accepts uploads.
 */
class IngestionQueryService {
public:
    IngestionQueryService(std::shared_ptr<domain::CheckpointStore> store,
                          std::shared_ptr<domain::InputSource> source,
                          std::shared_ptr<InFlightRegistry> registry,
                          std::shared_ptr<SettingsHolder> settings);

    /** @brief Every record with completed_chunks / total_chunks, newest first. */
    std::vector<domain::FileProgress> listFiles();

    std::optional<domain::FileProgress> findFile(const domain::ContentIdentity& identity);

    /** @brief Removes a terminal record. Non-terminal and in-flight ones are refused. */
    DeleteResult deleteFile(const domain::ContentIdentity& identity);

    /**
     * @brief Deletes by full hash or by a prefix of it, such as the short form `status` prints.
     *
     * Case-insensitive. A prefix matching several records is refused.
     */
    DeleteResult deleteByHash(const std::string& hashOrPrefix);

    /**
     * @brief Stores the bytes in the inbox and pre-inserts a Queued record.
     *
     * Byte-identical content that is already known resolves to the existing
     * record and writes nothing.
     */
    SubmitResult submit(const std::string& displayName, const std::string& bytes);

private:
    std::shared_ptr<domain::CheckpointStore> m_store;
    std::shared_ptr<domain::InputSource> m_source;
    std::shared_ptr<InFlightRegistry> m_registry;
    std::shared_ptr<SettingsHolder> m_settings;
};

} // namespace distill::application
