#ifndef WATCH_PIPELINE_HPP
#define WATCH_PIPELINE_HPP

#include "Classifier.hpp"
#include "DirectoryWatcher.hpp"
#include "EventQueue.hpp"
#include "FileMover.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

enum class WatchOutcomeKind {
    Moved,
    Error
};

// "moved" or "error".
const char* toString(WatchOutcomeKind kind);

// Result for one created file. `detail` is the category label when moved, the failure otherwise.
struct WatchOutcome {
    WatchOutcomeKind kind;
    std::filesystem::path file;
    std::string detail;
};

using WatchCallback = std::function<void(const WatchOutcome&)>;

struct WatchOptions {
    // Time a new file is left alone before it is moved, so its writer can finish.
    std::chrono::milliseconds settleDelay{1000};
    std::size_t workerThreads = 2;
};

// Keeps a folder organized as files appear in it. The inotify thread only enqueues events;
// workers wait out each event's settle delay and move the file, so delays for different files overlap.
// Outcomes reach the callback one at a time from a worker thread, exactly once per reported file.
// The callback must not call start() or stop().
class WatchPipeline {
public:
    explicit WatchPipeline(const Classifier& classifier, WatchOptions options = {});
    ~WatchPipeline();

    WatchPipeline(const WatchPipeline&) = delete;
    WatchPipeline& operator=(const WatchPipeline&) = delete;

    // No-op when already watching the same folder; a different folder restarts the watch.
    std::error_code start(const std::filesystem::path& targetDir, WatchCallback onEvent);
    // Idempotent. Files still settling are reported as errors; returns once no further callback can run.
    void stop();

    bool isRunning() const;
    std::filesystem::path targetDirectory() const;

private:
    void stopLocked();
    // Close the queue, join every worker and drop the callback after a failed start.
    void abandonStart();
    void enqueue(const std::filesystem::path& created);
    void workerLoop();
    void process(const WatchEvent& event);
    void deliver(WatchOutcome outcome);

    const Classifier& m_classifier;
    const WatchOptions m_options;
    FileMover m_mover;
    DirectoryWatcher m_watcher;
    EventQueue m_queue;
    std::vector<std::thread> m_workers;

    std::filesystem::path m_targetDir;
    WatchCallback m_callback;
    std::mutex m_callbackMutex;

    mutable std::mutex m_lifecycleMutex;
    std::atomic<bool> m_running{false};
};

#endif
