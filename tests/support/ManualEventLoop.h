#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <utility>

#include "utils/EventLoop.h"

// Single-threaded EventLoop whose clock only moves when the test says so
class ManualEventLoop : public EventLoop {
  public:
    void post(Task task) override { m_queue.push_back(std::move(task)); }

    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        const TimerId id = ++m_nextId;
        m_timers.emplace(id, Timer{m_now + delay, std::move(task)});
        return id;
    }

    void cancel(TimerId id) override { m_timers.erase(id); }

    Clock::time_point now() const override { return m_now; }

    size_t timerCount() const { return m_timers.size(); }

    void runPending() {
        while (!m_queue.empty()) {
            Task task = std::move(m_queue.front());
            m_queue.pop_front();
            task();
        }
    }

    // Moves the clock forward, firing due timers in order
    void advance(std::chrono::milliseconds delta) {
        const Clock::time_point target = m_now + delta;
        runPending();
        while (true) {
            auto next = m_timers.end();
            for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
                if (it->second.due <= target && (next == m_timers.end() || it->second.due < next->second.due)) {
                    next = it;
                }
            }
            if (next == m_timers.end()) {
                break;
            }
            m_now = next->second.due;
            Task task = std::move(next->second.task);
            m_timers.erase(next);
            task();
            runPending();
        }
        m_now = target;
        runPending();
    }

  private:
    struct Timer {
        Clock::time_point due;
        Task task;
    };

    std::deque<Task> m_queue;
    std::map<TimerId, Timer> m_timers;
    TimerId m_nextId = 0;
    Clock::time_point m_now{};
};
