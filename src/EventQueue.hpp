#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

// A file creation reported by the notification source, held until its settle delay has passed.
struct WatchEvent {
    std::filesystem::path path;
    std::chrono::steady_clock::time_point due;
};

// Channel between the notification thread and the pipeline workers, ordered by due time.
class EventQueue {
public:
    void push(WatchEvent event);

    // Blocks until the earliest event is due and hands it out, or returns nullopt once closed.
    std::optional<WatchEvent> popDue();

    // Wakes every consumer and returns the events that never became due.
    std::vector<WatchEvent> close();

    // Accept events again after close().
    void reopen();

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<WatchEvent> m_events;
    bool m_closed = false;
};

#endif
