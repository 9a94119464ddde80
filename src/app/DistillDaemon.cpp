/**
 * @file DistillDaemon.cpp
 * @brief Implementation of the DistillDaemon class.
 */
#include "app/DistillDaemon.hpp"

#include <algorithm>
#include <csignal>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <pthread.h>
#include <sstream>

#include "domain/IngestionErrors.hpp"
#include "infrastructure/InboxScanner.hpp"
#include "infrastructure/KnowledgeStore.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaExtractor.hpp"
#include "infrastructure/SqliteCheckpointStore.hpp"

namespace fs = std::filesystem;

namespace distill::app {

namespace {

std::string FormatTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return "-";
    std::time_t tt = std::chrono::system_clock::to_time_t(*tp);
    std::tm tm = {};
    localtime_r(&tt, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

DistillDaemon::DistillDaemon(const std::string& projectRoot) : m_projectRoot(projectRoot) {}

DistillDaemon::~DistillDaemon() {
    if (m_scheduler) {
        m_scheduler->stop();
    }
}

fs::path DistillDaemon::resolve(const std::string& path) const {
    fs::path p(path);
    return p.is_absolute() ? p : m_projectRoot / p;
}

bool DistillDaemon::initialize() {
    std::error_code ec;
    fs::create_directories(m_projectRoot, ec);
    infrastructure::ConfigLoader::SaveDefaultsIfMissing(m_projectRoot.string());

    m_configLoader = std::make_unique<infrastructure::ConfigLoader>(m_projectRoot.string());
    domain::PipelineSettings initial = m_configLoader->load();
    m_settings = std::make_shared<application::SettingsHolder>(initial);

    fs::path inbox = resolve(initial.inboxDir);
    fs::path knowledge = resolve(initial.knowledgeDir);
    fs::create_directories(inbox, ec);
    fs::create_directories(knowledge, ec);

    std::shared_ptr<domain::CheckpointStore> store;
    try {
        store = std::make_shared<infrastructure::SqliteCheckpointStore>(resolve(initial.databasePath).string());
    } catch (const domain::StorageError& e) {
        std::cerr << "[DistillDaemon] " << e.what() << std::endl;
        return false;
    }

    auto source = std::make_shared<infrastructure::InboxScanner>(inbox.string());
    auto knowledgeStore = std::make_shared<infrastructure::KnowledgeStore>(knowledge.string());
    auto extractor = std::make_shared<infrastructure::OllamaExtractor>(initial.extractor, knowledgeStore);
    m_registry = std::make_shared<application::InFlightRegistry>();

    m_pipeline = std::make_shared<application::IngestionPipeline>(source, store, extractor, m_registry);
    m_queryService = std::make_unique<application::IngestionQueryService>(store, source, m_registry, m_settings);

    infrastructure::ConfigLoader* loader = m_configLoader.get();
    m_scheduler = std::make_unique<application::PollScheduler>(
        m_pipeline, m_settings,
        [loader] { return loader->reloadIfChanged(); });

    std::cout << "[DistillDaemon] Project root: " << m_projectRoot.string() << ", inbox: " << inbox.string()
              << std::endl;
    return true;
}

int DistillDaemon::run() {
    // Signals are taken synchronously on this thread; workers never see them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    checkExtractor();
    m_scheduler->start();

    int received = 0;
    sigwait(&signals, &received);
    std::cout << "[DistillDaemon] Signal " << received << " received, finishing in-flight chunk..." << std::endl;

    m_scheduler->stop();
    return 0;
}

void DistillDaemon::checkExtractor() const {
    const domain::ExtractorSettings& e = m_settings->get()->extractor;
    infrastructure::OllamaClient client(e.host, e.port, e.timeoutSeconds);
    auto models = client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[DistillDaemon] Ollama not reachable at " << e.host << ":" << e.port
                  << "; chunks will fail until it is" << std::endl;
        return;
    }
    if (std::find(models.begin(), models.end(), e.model) == models.end()) {
        std::cerr << "[DistillDaemon] Model " << e.model << " is not installed in Ollama" << std::endl;
    }
}

int DistillDaemon::runOnce() {
    auto report = m_scheduler->tickOnce();
    if (!report) {
        return 0;
    }
    for (const auto& d : report->diagnostics) {
        std::cout << "  " << d << std::endl;
    }
    return (report->failed + report->corrupted) > 0 ? 2 : 0;
}

int DistillDaemon::printStatus(std::ostream& out) {
    std::vector<domain::FileProgress> files;
    try {
        files = m_queryService->listFiles();
    } catch (const domain::StorageError& e) {
        std::cerr << "[DistillDaemon] " << e.what() << std::endl;
        return 1;
    }

    out << std::left << std::setw(14) << "HASH" << std::setw(12) << "STATUS" << std::setw(10) << "CHUNKS"
        << std::setw(21) << "COMPLETED AT" << "FILE" << "\n";
    for (const auto& f : files) {
        std::string chunks = std::to_string(f.completedChunks) + "/" + std::to_string(f.record.totalChunks);
        std::string status = domain::StatusToString(f.record.status);
        if (!f.record.failureReason.empty()) {
            status += "*";
        }
        out << std::setw(14) << f.record.identity.shortForm() << std::setw(12) << status << std::setw(10)
            << chunks << std::setw(21) << FormatTime(f.record.completedAt) << f.record.filename << "\n";
    }
    out << files.size() << " file(s)" << std::endl;
    return 0;
}

int DistillDaemon::deleteRecord(const std::string& contentHash) {
    try {
        auto result = m_queryService->deleteByHash(contentHash);
        std::cout << contentHash << ": " << application::DeleteResultToString(result) << std::endl;
        return result == application::DeleteResult::Deleted ? 0 : 1;
    } catch (const domain::StorageError& e) {
        std::cerr << "[DistillDaemon] " << e.what() << std::endl;
        return 1;
    }
}

int DistillDaemon::submitFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[DistillDaemon] Cannot open " << path << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto result = m_queryService->submit(fs::path(path).filename().string(), buffer.str());
        std::cout << fs::path(path).filename().string() << ": " << result.message << std::endl;
        return result.kind == application::SubmitResult::Kind::Rejected ? 1 : 0;
    } catch (const std::runtime_error& e) {
        std::cerr << "[DistillDaemon] " << e.what() << std::endl;
        return 1;
    }
}

} // namespace distill::app
