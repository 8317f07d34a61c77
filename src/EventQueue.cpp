#include "EventQueue.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

void EventQueue::push(WatchEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }

        auto pos = std::upper_bound(m_events.begin(), m_events.end(), event.due,
                                    [](const auto& due, const WatchEvent& queued) { return due < queued.due; });
        m_events.insert(pos, std::move(event));
    }
    m_cv.notify_all();
}

std::optional<WatchEvent> EventQueue::popDue() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_closed) {
        if (m_events.empty()) {
            m_cv.wait(lock);
            continue;
        }

        const auto due = m_events.front().due;
        if (std::chrono::steady_clock::now() >= due) {
            WatchEvent event = std::move(m_events.front());
            m_events.pop_front();
            return event;
        }

        m_cv.wait_until(lock, due);
    }
    return std::nullopt;
}

std::vector<WatchEvent> EventQueue::close() {
    std::vector<WatchEvent> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        pending.assign(std::make_move_iterator(m_events.begin()), std::make_move_iterator(m_events.end()));
        m_events.clear();
    }
    m_cv.notify_all();
    return pending;
}

void EventQueue::reopen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = false;
}
