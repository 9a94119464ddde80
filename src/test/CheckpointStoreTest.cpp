#include <cassert>
#include <chrono>
#include <iostream>
#include <sqlite3.h>

#include "domain/IngestionErrors.hpp"
#include "infrastructure/SqliteCheckpointStore.hpp"
#include "test/TestSupport.hpp"

using namespace distill::domain;
using distill::infrastructure::SqliteCheckpointStore;

namespace {

const auto kT0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

void testChunkProgressIsIdempotent(const std::string& dbPath) {
    SqliteCheckpointStore store(dbPath);
    ContentIdentity id("aaaa");

    assert(!store.isChunkDone(id, 0));
    store.recordChunkDone(id, 0, 5, "a.txt", kT0);
    store.recordChunkDone(id, 0, 5, "a.txt", kT0 + std::chrono::seconds(5));
    store.recordChunkDone(id, 3, 5, "a.txt", kT0);

    assert(store.isChunkDone(id, 0));
    assert(store.isChunkDone(id, 3));
    assert(!store.isChunkDone(id, 1));
    assert(store.countCompletedChunks(id) == 2);

    auto pending = store.listPendingChunks(id, 5);
    assert((pending == std::vector<int>{1, 2, 4}));
    assert(store.listPendingChunks(ContentIdentity("other"), 3) == (std::vector<int>{0, 1, 2}));
    assert(store.listPendingChunks(id, 0).empty());

    store.clearChunkProgress(id);
    store.clearChunkProgress(id);
    assert(store.countCompletedChunks(id) == 0);
    std::cout << "[PASS] Chunk progress writes are idempotent; pending is the complement" << std::endl;
}

void testFailedChunksAreResolved(const std::string& dbPath) {
    SqliteCheckpointStore store(dbPath);
    ContentIdentity id("abab");

    store.recordChunkDone(id, 0, 4, "f.txt", kT0);
    store.recordChunkFailed(id, 1, 4, "f.txt", kT0);
    // A later failure never overwrites a success, and vice versa.
    store.recordChunkFailed(id, 0, 4, "f.txt", kT0);
    store.recordChunkDone(id, 1, 4, "f.txt", kT0);

    assert(store.isChunkDone(id, 0));
    assert(!store.isChunkDone(id, 1));
    assert(store.countCompletedChunks(id) == 1);
    assert(store.countFailedChunks(id) == 1);
    assert((store.listPendingChunks(id, 4) == std::vector<int>{2, 3}));

    store.clearChunkProgress(id);
    assert(store.countFailedChunks(id) == 0);
    assert(store.listPendingChunks(id, 4).size() == 4);
    std::cout << "[PASS] Failed chunks are neither done nor pending" << std::endl;
}

void testUpsertDoesNotClobber(const std::string& dbPath) {
    SqliteCheckpointStore store(dbPath);
    ContentIdentity id("bbbb");

    FileRecord first = store.upsertFileRecord(id, "first.md", 120, 3, 4000, kT0);
    assert(first.status == FileStatus::Queued);
    assert(first.filename == "first.md");
    assert(first.totalChunks == 3);
    assert(first.chunkTargetSize == 4000);
    assert(!first.startedAt);

    assert(store.setFileStatus(id, FileStatus::Processing, kT0 + std::chrono::seconds(1)));
    FileRecord again = store.upsertFileRecord(id, "renamed.md", 120, 3, 4000, kT0 + std::chrono::seconds(2));
    assert(again.status == FileStatus::Processing);
    assert(again.filename == "first.md");
    assert(again.startedAt && *again.startedAt == kT0 + std::chrono::seconds(1));

    StatusDetail detail;
    detail.completedChunks = 3;
    assert(store.setFileStatus(id, FileStatus::Completed, kT0 + std::chrono::seconds(9), detail));

    // Terminal records cannot move again.
    assert(!store.setFileStatus(id, FileStatus::Processing, kT0 + std::chrono::seconds(10)));
    assert(!store.setFileStatus(id, FileStatus::Failed, kT0 + std::chrono::seconds(10)));

    auto stored = store.findFileRecord(id);
    assert(stored);
    assert(stored->status == FileStatus::Completed);
    assert(stored->completedChunks == 3);
    assert(stored->completedAt && *stored->completedAt == kT0 + std::chrono::seconds(9));
    assert(stored->createdAt == kT0);

    assert(!store.setFileStatus(ContentIdentity("missing"), FileStatus::Processing, kT0));
    assert(!store.findFileRecord(ContentIdentity("missing")));
    std::cout << "[PASS] Upsert keeps the existing record; terminal status is final" << std::endl;
}

void testSurvivesReopen(const std::string& dbPath) {
    ContentIdentity id("cccc");
    {
        SqliteCheckpointStore store(dbPath);
        store.upsertFileRecord(id, "c.txt", 10, 4, 100, kT0);
        store.setFileStatus(id, FileStatus::Processing, kT0);
        store.recordChunkDone(id, 0, 4, "c.txt", kT0);
        store.recordChunkDone(id, 1, 4, "c.txt", kT0);
    }
    {
        SqliteCheckpointStore store(dbPath);
        auto record = store.findFileRecord(id);
        assert(record && record->status == FileStatus::Processing);
        assert((store.listPendingChunks(id, 4) == std::vector<int>{2, 3}));
    }
    std::cout << "[PASS] Progress and records survive reopening the database" << std::endl;
}

void testListDeleteAndPrune(const std::string& dbPath) {
    SqliteCheckpointStore store(dbPath);
    ContentIdentity live("dddd");
    ContentIdentity done("eeee");
    ContentIdentity old("ffff");

    store.upsertFileRecord(live, "live.txt", 10, 4, 100, kT0 + std::chrono::seconds(30));
    store.setFileStatus(live, FileStatus::Processing, kT0);
    store.recordChunkDone(live, 2, 4, "live.txt", kT0);

    store.upsertFileRecord(done, "done.txt", 10, 2, 100, kT0 + std::chrono::seconds(20));
    store.setFileStatus(done, FileStatus::Processing, kT0);
    StatusDetail partial;
    partial.completedChunks = 1;
    partial.failureReason = kChunkFailures;
    store.setFileStatus(done, FileStatus::Failed, kT0 + std::chrono::hours(24 * 10), partial);

    store.upsertFileRecord(old, "old.txt", 10, 1, 100, kT0 + std::chrono::seconds(10));
    store.setFileStatus(old, FileStatus::Processing, kT0);
    store.setFileStatus(old, FileStatus::Completed, kT0 + std::chrono::hours(1));

    bool sawLive = false;
    bool sawDone = false;
    for (const auto& p : store.listFileRecords()) {
        if (p.record.identity == live) {
            sawLive = true;
            assert(p.completedChunks == 1);
            assert(p.record.totalChunks == 4);
        }
        if (p.record.identity == done) {
            sawDone = true;
            assert(p.completedChunks == 1);
            assert(p.record.status == FileStatus::Failed);
            assert(p.record.failureReason == kChunkFailures);
        }
    }
    assert(sawLive && sawDone);

    // Only terminal records older than the cutoff go.
    int pruned = store.pruneTerminalRecords(kT0 + std::chrono::hours(24 * 5));
    assert(pruned == 1);
    assert(!store.findFileRecord(old));
    assert(store.findFileRecord(done));
    assert(store.findFileRecord(live));

    assert(store.deleteFileRecord(live));
    assert(!store.findFileRecord(live));
    assert(store.countCompletedChunks(live) == 0);
    assert(!store.deleteFileRecord(live));
    std::cout << "[PASS] Listing, deletion and retention pruning" << std::endl;
}

void testUpgradesProgressTableWithoutOutcome(const std::string& dbPath) {
    sqlite3* raw = nullptr;
    assert(sqlite3_open(dbPath.c_str(), &raw) == SQLITE_OK);
    const char* legacy =
        "CREATE TABLE ingestion_progress (content_hash TEXT NOT NULL, chunk_index INTEGER NOT NULL, "
        "total_chunks INTEGER NOT NULL, filename TEXT NOT NULL, completed_at INTEGER NOT NULL, "
        "PRIMARY KEY (content_hash, chunk_index));"
        "INSERT INTO ingestion_progress VALUES ('1234', 0, 2, 'old.txt', 1700000000);";
    assert(sqlite3_exec(raw, legacy, nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    SqliteCheckpointStore store(dbPath);
    ContentIdentity id("1234");
    assert(store.isChunkDone(id, 0));
    store.recordChunkFailed(id, 1, 2, "old.txt", kT0);
    assert(store.countFailedChunks(id) == 1);
    assert(store.listPendingChunks(id, 2).empty());
    std::cout << "[PASS] Older progress tables gain the outcome column on open" << std::endl;
}

void testOpenFailure(const distill::test::TempDir& dir) {
    bool threw = false;
    try {
        SqliteCheckpointStore store(dir.file("no/such/dir/x.db"));
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unopenable database raises StorageError" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CheckpointStore Test..." << std::endl;
    distill::test::TempDir dir("test_checkpoint_store");

    testChunkProgressIsIdempotent(dir.file("progress.db"));
    testFailedChunksAreResolved(dir.file("failed.db"));
    testUpsertDoesNotClobber(dir.file("upsert.db"));
    testSurvivesReopen(dir.file("reopen.db"));
    testListDeleteAndPrune(dir.file("list.db"));
    testUpgradesProgressTableWithoutOutcome(dir.file("legacy.db"));
    testOpenFailure(dir);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
