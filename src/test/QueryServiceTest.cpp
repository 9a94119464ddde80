#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "application/IngestionPipeline.hpp"
#include "application/IngestionQueryService.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/InboxScanner.hpp"
#include "infrastructure/SqliteCheckpointStore.hpp"
#include "test/TestSupport.hpp"

using namespace distill;
using application::DeleteResult;
using application::IngestionQueryService;
using application::InFlightRegistry;
using application::SubmitResult;
using domain::FileStatus;
using infrastructure::ContentHasher;
using infrastructure::InboxScanner;
namespace fs = std::filesystem;

namespace {

void touch(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

void testInboxScannerFilters(const test::TempDir& dir) {
    fs::path inbox = dir.path() / "inbox_scan";
    fs::create_directories(inbox);
    touch(inbox / "a.md", "alpha\n");
    touch(inbox / "README", "no extension\n");
    touch(inbox / "photo.PNG", "binary");
    touch(inbox / ".hidden.txt", "hidden\n");
    touch(inbox / "upload.txt.part", "half written");
    fs::create_directories(inbox / "nested.txt");

    // Explicit modification times pin the discovery order.
    auto base = fs::last_write_time(inbox / "a.md");
    fs::last_write_time(inbox / "README", base - std::chrono::seconds(60));
    fs::last_write_time(inbox / "a.md", base);

    InboxScanner scanner(inbox.string());
    auto result = scanner.scan();
    assert(result.inputs.size() == 2);
    assert(result.inputs[0].displayName == "README");
    assert(result.inputs[1].displayName == "a.md");
    assert(result.inputs[1].sizeBytes == 6);
    assert(result.diagnostics.size() == 1);
    assert(result.diagnostics[0].find("photo.PNG") != std::string::npos);

    assert(*scanner.read(result.inputs[1]) == "alpha\n");
    assert(scanner.remove(result.inputs[1]));
    assert(!fs::exists(inbox / "a.md"));

    assert(InboxScanner::isAcceptedName("Notes.MD"));
    assert(!InboxScanner::isAcceptedName("archive.zip"));

    InboxScanner missing((dir.path() / "does_not_exist").string());
    assert(missing.scan().inputs.empty());
    std::cout << "[PASS] Inbox scan keeps text files, oldest first, and reports the rest" << std::endl;
}

void testInboxAcceptUniquifies(const test::TempDir& dir) {
    fs::path inbox = dir.path() / "inbox_accept";
    InboxScanner scanner(inbox.string());

    auto first = scanner.accept("report.txt", "one\n");
    auto second = scanner.accept("report.txt", "two\n");
    assert(first && *first == "report.txt");
    assert(second && *second == "report-1.txt");
    assert(!fs::exists(inbox / "report.txt.part"));
    assert(scanner.scan().inputs.size() == 2);
    std::cout << "[PASS] Accepted uploads land atomically under a free name" << std::endl;
}

struct Fixture {
    explicit Fixture(const std::string& dbPath)
        : source(std::make_shared<test::MemoryInputSource>()),
          store(std::make_shared<infrastructure::SqliteCheckpointStore>(dbPath)),
          extractor(std::make_shared<test::ScriptedExtractor>()),
          registry(std::make_shared<InFlightRegistry>()),
          settings(std::make_shared<application::SettingsHolder>(SmallChunks())),
          pipeline(source, store, extractor, registry),
          query(store, source, registry, settings) {}

    static domain::PipelineSettings SmallChunks() {
        domain::PipelineSettings s;
        s.chunkTargetSize = 40;
        s.maxParallelFiles = 1;
        return s;
    }

    std::shared_ptr<test::MemoryInputSource> source;
    std::shared_ptr<infrastructure::SqliteCheckpointStore> store;
    std::shared_ptr<test::ScriptedExtractor> extractor;
    std::shared_ptr<InFlightRegistry> registry;
    std::shared_ptr<application::SettingsHolder> settings;
    application::IngestionPipeline pipeline;
    IngestionQueryService query;
};

void testListShowsLiveProgress(const test::TempDir& dir) {
    Fixture f(dir.file("list.db"));
    const std::string text = test::NumberedLines(30);
    auto id = ContentHasher::identify(text);
    f.source->add("progress.txt", text);

    int totalSeen = 0;
    f.extractor->onCall = [&](const domain::ExtractionRequest& r) {
        if (r.chunkIndex != 2) return;
        auto listed = f.query.listFiles();
        assert(listed.size() == 1);
        assert(listed[0].record.status == FileStatus::Processing);
        assert(listed[0].completedChunks == 2);
        totalSeen = listed[0].record.totalChunks;
    };
    f.pipeline.runTick(*f.settings->get());
    assert(totalSeen > 2);

    auto done = f.query.findFile(id);
    assert(done && done->record.status == FileStatus::Completed);
    assert(done->completedChunks == totalSeen);
    assert(!f.query.findFile(ContentHasher::identify("unknown")));
    std::cout << "[PASS] Listing reports completed/total while a file is processing" << std::endl;
}

void testDeleteRules(const test::TempDir& dir) {
    Fixture f(dir.file("delete.db"));
    auto unknown = ContentHasher::identify("never seen");
    assert(f.query.deleteFile(unknown) == DeleteResult::NotFound);

    auto submitted = f.query.submit("queued.txt", test::NumberedLines(4));
    assert(submitted.kind == SubmitResult::Kind::Accepted);
    auto queuedId = submitted.record->identity;
    assert(f.query.deleteFile(queuedId) == DeleteResult::NotTerminal);

    f.pipeline.runTick(*f.settings->get());
    assert(f.store->findFileRecord(queuedId)->status == FileStatus::Completed);

    {
        InFlightRegistry::Claim busy(*f.registry, queuedId);
        assert(f.query.deleteFile(queuedId) == DeleteResult::InFlight);
    }
    assert(f.query.deleteFile(queuedId) == DeleteResult::Deleted);
    assert(!f.store->findFileRecord(queuedId));
    assert(f.query.deleteFile(queuedId) == DeleteResult::NotFound);

    // Deleted content is treated as new when it shows up again.
    f.source->add("again.txt", test::NumberedLines(4));
    auto report = f.pipeline.runTick(*f.settings->get());
    assert(report.completed == 1);
    std::cout << "[PASS] Only terminal, idle records can be deleted" << std::endl;
}

void testDeleteByShortHash(const test::TempDir& dir) {
    Fixture f(dir.file("short_hash.db"));
    f.source->add("short.txt", test::NumberedLines(6));
    f.pipeline.runTick(*f.settings->get());
    auto id = ContentHasher::identify(test::NumberedLines(6));
    assert(f.store->findFileRecord(id)->status == FileStatus::Completed);

    // Two terminal records sharing a prefix.
    const auto now = std::chrono::system_clock::now();
    domain::ContentIdentity twinA(std::string("fedcba01") + std::string(56, '1'));
    domain::ContentIdentity twinB(std::string("fedcba02") + std::string(56, '2'));
    for (const auto& twin : {twinA, twinB}) {
        f.store->upsertFileRecord(twin, "twin.txt", 1, 0, 40, now);
        f.store->setFileStatus(twin, FileStatus::Processing, now);
        f.store->setFileStatus(twin, FileStatus::Completed, now);
    }
    assert(f.query.deleteByHash("fedcba") == DeleteResult::Ambiguous);
    assert(f.store->findFileRecord(twinA) && f.store->findFileRecord(twinB));
    assert(f.query.deleteByHash("FEDCBA02") == DeleteResult::Deleted);
    assert(!f.store->findFileRecord(twinB));

    assert(f.query.deleteByHash("not-hex") == DeleteResult::NotFound);
    assert(f.query.deleteByHash("") == DeleteResult::NotFound);

    // The 12-character form shown by `distill status` is enough.
    assert(f.query.deleteByHash(id.shortForm()) == DeleteResult::Deleted);
    assert(!f.store->findFileRecord(id));
    assert(f.query.deleteByHash(twinA.hex()) == DeleteResult::Deleted);
    std::cout << "[PASS] Records can be deleted by the short hash that status prints" << std::endl;
}

void testSubmit(const test::TempDir& dir) {
    Fixture f(dir.file("submit.db"));
    const std::string text = test::NumberedLines(12);

    auto accepted = f.query.submit("paper.md", text);
    assert(accepted.kind == SubmitResult::Kind::Accepted);
    assert(accepted.record->status == FileStatus::Queued);
    assert(accepted.record->chunkTargetSize == 40);
    assert(f.source->contains("paper.md"));

    auto again = f.query.submit("copy-of-paper.md", text);
    assert(again.kind == SubmitResult::Kind::AlreadyKnown);
    assert(again.record->filename == "paper.md");
    assert(!f.source->contains("copy-of-paper.md"));

    auto binary = f.query.submit("data.txt", std::string("a\0b", 3));
    assert(binary.kind == SubmitResult::Kind::Rejected);
    auto wrongType = f.query.submit("image.png", "not really");
    assert(wrongType.kind == SubmitResult::Kind::Rejected);
    assert(f.source->size() == 1);

    f.pipeline.runTick(*f.settings->get());
    assert(f.store->findFileRecord(accepted.record->identity)->status == FileStatus::Completed);
    std::cout << "[PASS] Submit queues new content and resolves duplicates" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting QueryService Test..." << std::endl;
    test::TempDir dir("test_query_service");

    testInboxScannerFilters(dir);
    testInboxAcceptUniquifies(dir);
    testListShowsLiveProgress(dir);
    testDeleteRules(dir);
    testDeleteByShortHash(dir);
    testSubmit(dir);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
