#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

#include "application/PollScheduler.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/SqliteCheckpointStore.hpp"
#include "test/TestSupport.hpp"

using namespace distill;
using infrastructure::ConfigLoader;
namespace fs = std::filesystem;

namespace {

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

void testParseOverridesDefaults() {
    auto parsed = ConfigLoader::Parse(R"({
        "enabled": false,
        "poll_interval_seconds": 5,
        "chunk_target_size": 1200,
        "max_parallel_files": 4,
        "history_retention_days": 30,
        "extractor": { "model": "llama3", "port": 8080 }
    })", domain::PipelineSettings{});
    assert(parsed);
    assert(!parsed->enabled);
    assert(parsed->pollInterval == std::chrono::seconds(5));
    assert(parsed->chunkTargetSize == 1200);
    assert(parsed->maxParallelFiles == 4);
    assert(parsed->historyRetentionDays == 30);
    assert(parsed->extractor.model == "llama3");
    assert(parsed->extractor.port == 8080);
    assert(parsed->extractor.host == "localhost");
    assert(parsed->checkpointWriteRetries == 3);
    std::cout << "[PASS] Keys present override defaults, absent keys keep them" << std::endl;
}

void testInvalidValuesKeepPrevious() {
    domain::PipelineSettings base;
    base.chunkTargetSize = 777;

    auto parsed = ConfigLoader::Parse(R"({
        "chunk_target_size": 0,
        "poll_interval_seconds": -3,
        "max_parallel_files": "many",
        "checkpoint_write_retries": 0
    })", base);
    assert(parsed);
    assert(parsed->chunkTargetSize == 777);
    assert(parsed->pollInterval == std::chrono::seconds(30));
    assert(parsed->maxParallelFiles == 2);
    assert(parsed->checkpointWriteRetries == 0);

    assert(!ConfigLoader::Parse("not json", base));
    assert(!ConfigLoader::Parse("[1, 2, 3]", base));
    std::cout << "[PASS] Invalid values are ignored one key at a time" << std::endl;
}

void testDefaultsFileAndReload(const test::TempDir& dir) {
    const std::string root = dir.path().string();
    ConfigLoader::SaveDefaultsIfMissing(root);
    const std::string path = dir.file("settings.json");
    assert(fs::exists(path));

    ConfigLoader loader(root);
    auto initial = loader.load();
    assert(initial.chunkTargetSize == domain::PipelineSettings{}.chunkTargetSize);
    assert(!loader.reloadIfChanged());

    writeFile(path, R"({"chunk_target_size": 250, "enabled": false})");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
    auto reloaded = loader.reloadIfChanged();
    assert(reloaded);
    assert(reloaded->chunkTargetSize == 250);
    assert(!reloaded->enabled);
    assert(!loader.reloadIfChanged());

    // Removing a key brings back its default, exactly as a restart would.
    writeFile(path, R"({"chunk_target_size": 250})");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(10));
    auto withoutFlag = loader.reloadIfChanged();
    assert(withoutFlag);
    assert(withoutFlag->enabled);
    assert(withoutFlag->chunkTargetSize == 250);
    auto restarted = ConfigLoader(root).load();
    assert(restarted.enabled == withoutFlag->enabled);
    assert(restarted.chunkTargetSize == withoutFlag->chunkTargetSize);

    // A broken edit is reported but leaves the running settings alone.
    writeFile(path, "{ broken");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(15));
    assert(!loader.reloadIfChanged());

    // SaveDefaultsIfMissing never overwrites.
    ConfigLoader::SaveDefaultsIfMissing(root);
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(content == "{ broken");
    std::cout << "[PASS] Edits are picked up once per modification" << std::endl;
}

void testSchedulerHonoursEnabledFlag(const test::TempDir& dir) {
    auto source = std::make_shared<test::MemoryInputSource>();
    auto store = std::make_shared<infrastructure::SqliteCheckpointStore>(dir.file("scheduler.db"));
    auto extractor = std::make_shared<test::ScriptedExtractor>();
    auto pipeline = std::make_shared<application::IngestionPipeline>(
        source, store, extractor, std::make_shared<application::InFlightRegistry>());

    domain::PipelineSettings disabled;
    disabled.enabled = false;
    auto holder = std::make_shared<application::SettingsHolder>(disabled);

    std::optional<domain::PipelineSettings> pending;
    application::PollScheduler scheduler(pipeline, holder, [&]() {
        auto next = pending;
        pending.reset();
        return next;
    });

    source->add("waiting.txt", test::NumberedLines(3));
    assert(!scheduler.tickOnce());
    assert(scheduler.ticksCompleted() == 0);
    assert(source->contains("waiting.txt"));

    domain::PipelineSettings enabled;
    enabled.chunkTargetSize = 500;
    pending = enabled;
    auto report = scheduler.tickOnce();
    assert(report && report->completed == 1);
    assert(holder->get()->chunkTargetSize == 500);
    assert(scheduler.ticksCompleted() == 1);
    assert(!source->contains("waiting.txt"));
    std::cout << "[PASS] Disabled configuration skips ticks until re-enabled" << std::endl;
}

void testSchedulerStopsPromptly(const test::TempDir& dir) {
    auto source = std::make_shared<test::MemoryInputSource>();
    auto store = std::make_shared<infrastructure::SqliteCheckpointStore>(dir.file("loop.db"));
    auto pipeline = std::make_shared<application::IngestionPipeline>(
        source, store, std::make_shared<test::ScriptedExtractor>(), std::make_shared<application::InFlightRegistry>());

    domain::PipelineSettings settings;
    settings.pollInterval = std::chrono::seconds(3600);
    application::PollScheduler scheduler(pipeline, std::make_shared<application::SettingsHolder>(settings));

    auto started = std::chrono::steady_clock::now();
    scheduler.start();
    while (scheduler.ticksCompleted() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    scheduler.stop();
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(30));
    assert(pipeline->stopRequested());
    std::cout << "[PASS] Stop interrupts the poll interval wait" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    test::TempDir dir("test_config_loader");

    testParseOverridesDefaults();
    testInvalidValuesKeepPrevious();
    testDefaultsFileAndReload(dir);
    testSchedulerHonoursEnabledFlag(dir);
    testSchedulerStopsPromptly(dir);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
