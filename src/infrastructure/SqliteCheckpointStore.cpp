/**
 * @file SqliteCheckpointStore.cpp
 * @brief Implementation of SqliteCheckpointStore.
 */

#include "infrastructure/SqliteCheckpointStore.hpp"
#include "domain/IngestionErrors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <iostream>
#include <set>

namespace distill::infrastructure {

using domain::StorageError;

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchemaSQL = R"SQL(
    CREATE TABLE IF NOT EXISTS ingestion_progress (
        content_hash TEXT NOT NULL,
        chunk_index  INTEGER NOT NULL,
        total_chunks INTEGER NOT NULL,
        filename     TEXT NOT NULL,
        completed_at INTEGER NOT NULL,
        outcome      TEXT NOT NULL DEFAULT 'done' CHECK (outcome IN ('done', 'failed')),
        PRIMARY KEY (content_hash, chunk_index)
    );
    CREATE INDEX IF NOT EXISTS idx_ingestion_progress_hash ON ingestion_progress(content_hash);

    CREATE TABLE IF NOT EXISTS ingestion_files (
        content_hash     TEXT PRIMARY KEY,
        filename         TEXT NOT NULL,
        size_bytes       INTEGER NOT NULL,
        total_chunks     INTEGER NOT NULL,
        chunk_target     INTEGER NOT NULL DEFAULT 0,
        completed_chunks INTEGER NOT NULL DEFAULT 0,
        status           TEXT NOT NULL
                         CHECK (status IN ('queued', 'processing', 'completed', 'failed')),
        failure_reason   TEXT NOT NULL DEFAULT '',
        created_at       INTEGER NOT NULL,
        started_at       INTEGER,
        completed_at     INTEGER
    );
    CREATE INDEX IF NOT EXISTS idx_ingestion_files_status ON ingestion_files(status);
)SQL";

constexpr const char* kSelectFileColumns =
    "SELECT content_hash, filename, size_bytes, total_chunks, completed_chunks, status, "
    "failure_reason, created_at, started_at, completed_at, chunk_target FROM ingestion_files";

sqlite3_int64 ToEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpoch(sqlite3_int64 secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

/**
 * @brief RAII wrapper for a prepared statement. Errors raise StorageError.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int pos, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, pos, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int pos, sqlite3_int64 value) { check(sqlite3_bind_int64(m_stmt, pos, value)); }
    void bindNull(int pos) { check(sqlite3_bind_null(m_stmt, pos)); }

    /** @brief Steps once. @return true if a row is available. */
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("sqlite step failed: ") + sqlite3_errmsg(m_db));
    }

    /** @brief Runs a statement that returns no rows. */
    void run() {
        while (step()) {
        }
    }

    sqlite3_int64 columnInt(int col) const { return sqlite3_column_int64(m_stmt, col); }
    bool columnIsNull(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }
    std::string columnText(int col) const {
        const unsigned char* text = sqlite3_column_text(m_stmt, col);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("sqlite bind failed: ") + sqlite3_errmsg(m_db));
        }
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

domain::FileRecord ReadFileRow(const Statement& st) {
    domain::FileRecord r;
    r.identity = domain::ContentIdentity(st.columnText(0));
    r.filename = st.columnText(1);
    r.sizeBytes = st.columnInt(2);
    r.totalChunks = static_cast<int>(st.columnInt(3));
    r.completedChunks = static_cast<int>(st.columnInt(4));
    auto status = domain::StatusFromString(st.columnText(5));
    if (!status) {
        throw StorageError("unknown status '" + st.columnText(5) + "' for " + r.identity.hex());
    }
    r.status = *status;
    r.failureReason = st.columnText(6);
    r.createdAt = FromEpoch(st.columnInt(7));
    if (!st.columnIsNull(8)) r.startedAt = FromEpoch(st.columnInt(8));
    if (!st.columnIsNull(9)) r.completedAt = FromEpoch(st.columnInt(9));
    r.chunkTargetSize = static_cast<std::size_t>(st.columnInt(10));
    return r;
}

} // namespace

SqliteCheckpointStore::SqliteCheckpointStore(const std::string& databasePath) : m_path(databasePath) {
    if (sqlite3_open(databasePath.c_str(), &m_db) != SQLITE_OK) {
        std::string err = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("sqlite open failed for " + databasePath + ": " + err);
    }
    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=FULL;");
        applySchema();
    } catch (const StorageError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

SqliteCheckpointStore::~SqliteCheckpointStore() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteCheckpointStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError("sqlite exec failed: " + e);
    }
}

void SqliteCheckpointStore::applySchema() {
    exec(kSchemaSQL);

    // Databases created before chunk failures were persisted lack the outcome column.
    bool hasOutcome = false;
    {
        Statement columns(m_db, "PRAGMA table_info(ingestion_progress);");
        while (columns.step()) {
            if (columns.columnText(1) == "outcome") {
                hasOutcome = true;
            }
        }
    }
    if (!hasOutcome) {
        exec("ALTER TABLE ingestion_progress ADD COLUMN outcome TEXT NOT NULL DEFAULT 'done';");
    }
}

void SqliteCheckpointStore::insertProgress(const domain::ContentIdentity& identity, int index, int totalChunks,
                                           const std::string& filename, TimePoint at, const char* outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db,
                 "INSERT INTO ingestion_progress "
                 "(content_hash, chunk_index, total_chunks, filename, completed_at, outcome) "
                 "VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT(content_hash, chunk_index) DO NOTHING;");
    st.bind(1, identity.hex());
    st.bind(2, static_cast<sqlite3_int64>(index));
    st.bind(3, static_cast<sqlite3_int64>(totalChunks));
    st.bind(4, filename);
    st.bind(5, ToEpoch(at));
    st.bind(6, std::string(outcome));
    st.run();
}

void SqliteCheckpointStore::recordChunkDone(const domain::ContentIdentity& identity, int index, int totalChunks,
                                            const std::string& filename, TimePoint completedAt) {
    insertProgress(identity, index, totalChunks, filename, completedAt, "done");
}

void SqliteCheckpointStore::recordChunkFailed(const domain::ContentIdentity& identity, int index, int totalChunks,
                                              const std::string& filename, TimePoint failedAt) {
    insertProgress(identity, index, totalChunks, filename, failedAt, "failed");
}

bool SqliteCheckpointStore::isChunkDone(const domain::ContentIdentity& identity, int index) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db,
                 "SELECT 1 FROM ingestion_progress WHERE content_hash = ? AND chunk_index = ? AND outcome = 'done';");
    st.bind(1, identity.hex());
    st.bind(2, static_cast<sqlite3_int64>(index));
    return st.step();
}

domain::FileRecord SqliteCheckpointStore::upsertFileRecord(const domain::ContentIdentity& identity,
                                                           const std::string& filename, long long sizeBytes,
                                                           int totalChunks, std::size_t chunkTargetSize,
                                                           TimePoint now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    {
        Statement st(m_db,
                     "INSERT INTO ingestion_files "
                     "(content_hash, filename, size_bytes, total_chunks, chunk_target, status, created_at) "
                     "VALUES (?, ?, ?, ?, ?, 'queued', ?) ON CONFLICT(content_hash) DO NOTHING;");
        st.bind(1, identity.hex());
        st.bind(2, filename);
        st.bind(3, static_cast<sqlite3_int64>(sizeBytes));
        st.bind(4, static_cast<sqlite3_int64>(totalChunks));
        st.bind(5, static_cast<sqlite3_int64>(chunkTargetSize));
        st.bind(6, ToEpoch(now));
        st.run();
    }
    auto record = findLocked(identity);
    if (!record) {
        throw StorageError("file record missing after upsert: " + identity.hex());
    }
    return *record;
}

bool SqliteCheckpointStore::setFileStatus(const domain::ContentIdentity& identity, domain::FileStatus status,
                                          TimePoint timestamp, const domain::StatusDetail& detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto current = findLocked(identity);
    if (!current) {
        return false;
    }
    if (current->isTerminal()) {
        std::cerr << "[SqliteCheckpointStore] Refusing to move " << identity.shortForm() << " out of "
                  << domain::StatusToString(current->status) << std::endl;
        return false;
    }

    const char* sql = nullptr;
    switch (status) {
        case domain::FileStatus::Queued:
            sql = "UPDATE ingestion_files SET status = 'queued' WHERE content_hash = ?1;";
            break;
        case domain::FileStatus::Processing:
            sql = "UPDATE ingestion_files SET status = 'processing', "
                  "started_at = COALESCE(started_at, ?2) WHERE content_hash = ?1;";
            break;
        case domain::FileStatus::Completed:
        case domain::FileStatus::Failed:
            sql = "UPDATE ingestion_files SET status = ?3, completed_at = ?2, "
                  "completed_chunks = COALESCE(?4, completed_chunks), failure_reason = ?5 "
                  "WHERE content_hash = ?1;";
            break;
    }

    Statement st(m_db, sql);
    st.bind(1, identity.hex());
    if (status != domain::FileStatus::Queued) {
        st.bind(2, ToEpoch(timestamp));
    }
    if (domain::IsTerminal(status)) {
        st.bind(3, domain::StatusToString(status));
        if (detail.completedChunks) {
            st.bind(4, static_cast<sqlite3_int64>(*detail.completedChunks));
        } else {
            st.bindNull(4);
        }
        st.bind(5, detail.failureReason);
    }
    st.run();
    return sqlite3_changes(m_db) > 0;
}

void SqliteCheckpointStore::clearChunkProgress(const domain::ContentIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db, "DELETE FROM ingestion_progress WHERE content_hash = ?;");
    st.bind(1, identity.hex());
    st.run();
}

std::vector<int> SqliteCheckpointStore::listPendingChunks(const domain::ContentIdentity& identity, int totalChunks) {
    // Done and failed rows both resolve a chunk.
    std::set<int> resolved;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement st(m_db, "SELECT chunk_index FROM ingestion_progress WHERE content_hash = ?;");
        st.bind(1, identity.hex());
        while (st.step()) {
            resolved.insert(static_cast<int>(st.columnInt(0)));
        }
    }

    std::vector<int> pending;
    for (int i = 0; i < totalChunks; ++i) {
        if (resolved.count(i) == 0) {
            pending.push_back(i);
        }
    }
    return pending;
}

int SqliteCheckpointStore::countProgress(const domain::ContentIdentity& identity, const char* outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db, "SELECT COUNT(*) FROM ingestion_progress WHERE content_hash = ? AND outcome = ?;");
    st.bind(1, identity.hex());
    st.bind(2, std::string(outcome));
    return st.step() ? static_cast<int>(st.columnInt(0)) : 0;
}

int SqliteCheckpointStore::countCompletedChunks(const domain::ContentIdentity& identity) {
    return countProgress(identity, "done");
}

int SqliteCheckpointStore::countFailedChunks(const domain::ContentIdentity& identity) {
    return countProgress(identity, "failed");
}

std::optional<domain::FileRecord> SqliteCheckpointStore::findFileRecord(const domain::ContentIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return findLocked(identity);
}

std::optional<domain::FileRecord> SqliteCheckpointStore::findLocked(const domain::ContentIdentity& identity) {
    std::string sql = std::string(kSelectFileColumns) + " WHERE content_hash = ?;";
    Statement st(m_db, sql.c_str());
    st.bind(1, identity.hex());
    if (!st.step()) {
        return std::nullopt;
    }
    return ReadFileRow(st);
}

std::vector<domain::ContentIdentity> SqliteCheckpointStore::findIdentitiesByPrefix(const std::string& prefix,
                                                                                  int limit) {
    std::vector<domain::ContentIdentity> out;
    if (prefix.empty() || limit <= 0) {
        return out;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db,
                 "SELECT content_hash FROM ingestion_files WHERE substr(content_hash, 1, length(?1)) = ?1 "
                 "ORDER BY content_hash LIMIT ?2;");
    st.bind(1, prefix);
    st.bind(2, static_cast<sqlite3_int64>(limit));
    while (st.step()) {
        out.emplace_back(st.columnText(0));
    }
    return out;
}

std::vector<domain::FileProgress> SqliteCheckpointStore::listFileRecords() {
    std::vector<domain::FileProgress> out;
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string sql = std::string(kSelectFileColumns) + " ORDER BY created_at DESC, content_hash;";
    Statement st(m_db, sql.c_str());
    while (st.step()) {
        domain::FileProgress p;
        p.record = ReadFileRow(st);
        out.push_back(std::move(p));
    }

    for (auto& p : out) {
        if (p.record.isTerminal()) {
            p.completedChunks = p.record.completedChunks;
            continue;
        }
        Statement live(m_db,
                       "SELECT COUNT(*) FROM ingestion_progress WHERE content_hash = ? AND outcome = 'done';");
        live.bind(1, p.record.identity.hex());
        p.completedChunks = live.step() ? static_cast<int>(live.columnInt(0)) : 0;
    }
    return out;
}

bool SqliteCheckpointStore::deleteFileRecord(const domain::ContentIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    exec("BEGIN IMMEDIATE;");
    try {
        Statement progress(m_db, "DELETE FROM ingestion_progress WHERE content_hash = ?;");
        progress.bind(1, identity.hex());
        progress.run();

        Statement file(m_db, "DELETE FROM ingestion_files WHERE content_hash = ?;");
        file.bind(1, identity.hex());
        file.run();
        bool removed = sqlite3_changes(m_db) > 0;

        exec("COMMIT;");
        return removed;
    } catch (const StorageError&) {
        sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

int SqliteCheckpointStore::pruneTerminalRecords(TimePoint completedBefore) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement st(m_db,
                 "DELETE FROM ingestion_files WHERE status IN ('completed', 'failed') "
                 "AND completed_at IS NOT NULL AND completed_at < ?;");
    st.bind(1, ToEpoch(completedBefore));
    st.run();
    return sqlite3_changes(m_db);
}

} // namespace distill::infrastructure
