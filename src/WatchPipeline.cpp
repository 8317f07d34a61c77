#include "WatchPipeline.hpp"

#include "FolderOrganizer.hpp"

#include <iostream>
#include <utility>

namespace fs = std::filesystem;

const char* toString(WatchOutcomeKind kind) {
    switch (kind) {
    case WatchOutcomeKind::Moved:
        return "moved";
    case WatchOutcomeKind::Error:
        return "error";
    }
    return "error";
}

WatchPipeline::WatchPipeline(const Classifier& classifier, WatchOptions options)
    : m_classifier(classifier), m_options(options) {}

WatchPipeline::~WatchPipeline() {
    stop();
}

std::error_code WatchPipeline::start(const fs::path& targetDir, WatchCallback onEvent) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (auto invalid = validateTargetDirectory(targetDir)) {
        std::cerr << "Cannot watch `" << targetDir.string() << "`: " << invalid.message() << std::endl;
        return invalid;
    }

    if (m_running) {
        std::error_code ec;
        if (fs::equivalent(targetDir, m_targetDir, ec) && !ec) {
            return {};
        }
        stopLocked();
    }

    m_queue.reopen();
    m_targetDir = targetDir;
    m_callback = std::move(onEvent);

    const std::size_t workers = m_options.workerThreads == 0 ? 1 : m_options.workerThreads;
    try {
        for (std::size_t i = 0; i < workers; ++i) {
            m_workers.emplace_back(&WatchPipeline::workerLoop, this);
        }
    } catch (const std::system_error& e) {
        std::cerr << "Failed to start watch workers for `" << targetDir.string() << "`: " << e.what() << std::endl;
        abandonStart();
        return OrganizerErrc::WatchStart;
    }

    const std::error_code cause = m_watcher.start(targetDir, [this](const fs::path& created) { enqueue(created); });
    if (cause) {
        std::cerr << "Failed to start watching `" << targetDir.string() << "`: " << cause.message() << std::endl;
        abandonStart();
        return OrganizerErrc::WatchStart;
    }

    m_running = true;
    std::cout << "Watching `" << targetDir.string() << "` for new files (settle delay "
              << m_options.settleDelay.count() << " ms)." << std::endl;
    return {};
}

void WatchPipeline::abandonStart() {
    m_queue.close();
    for (auto& worker : m_workers) {
        worker.join();
    }
    m_workers.clear();
    m_callback = nullptr;
}

void WatchPipeline::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    stopLocked();
}

void WatchPipeline::stopLocked() {
    if (!m_running) {
        return;
    }

    // Order matters: silence the source, then drain the workers, then settle the leftovers.
    m_watcher.stop();
    std::vector<WatchEvent> pending = m_queue.close();
    for (auto& worker : m_workers) {
        worker.join();
    }
    m_workers.clear();

    for (const auto& event : pending) {
        deliver({WatchOutcomeKind::Error, event.path, "watch stopped before the file settled"});
    }

    m_callback = nullptr;
    m_running = false;
    std::cout << "Stopped watching `" << m_targetDir.string() << "`." << std::endl;
}

bool WatchPipeline::isRunning() const {
    return m_running;
}

fs::path WatchPipeline::targetDirectory() const {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    return m_running ? m_targetDir : fs::path{};
}

void WatchPipeline::enqueue(const fs::path& created) {
    m_queue.push({created, std::chrono::steady_clock::now() + m_options.settleDelay});
}

void WatchPipeline::workerLoop() {
    while (auto event = m_queue.popDue()) {
        process(*event);
    }
}

void WatchPipeline::process(const WatchEvent& event) {
    std::error_code ec;
    const fs::file_status status = fs::symlink_status(event.path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        deliver({WatchOutcomeKind::Error, event.path, "cannot inspect file: " + ec.message()});
        return;
    }
    if (!fs::exists(status)) {
        deliver({WatchOutcomeKind::Error, event.path, "file disappeared before it could be moved"});
        return;
    }
    if (fs::is_directory(status)) {
        deliver({WatchOutcomeKind::Error, event.path, "path was replaced by a directory"});
        return;
    }

    const std::string category = m_classifier.categoryForPath(event.path);
    const MoveResult result = m_mover.move(event.path, m_targetDir / category);
    if (!result.succeeded()) {
        deliver({WatchOutcomeKind::Error, event.path, result.failure(event.path).describe()});
        return;
    }

    deliver({WatchOutcomeKind::Moved, event.path, category});
}

void WatchPipeline::deliver(WatchOutcome outcome) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    if (m_callback) {
        m_callback(outcome);
    }
}
