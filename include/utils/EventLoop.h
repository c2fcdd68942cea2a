#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

/**
 * @brief The single logical execution context all chat logic runs on
 *
 * post() is the only member that may be called from another thread; everything
 * else (timers, the tasks themselves) runs on the loop's own thread.
 */
class EventLoop {
  public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    virtual ~EventLoop() = default;

    virtual void post(Task task) = 0;
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancel(TimerId id) = 0;
    virtual Clock::time_point now() const = 0;
};

void fltkTimeoutCallback(void *userData);

/**
 * @brief EventLoop driven by FLTK (Fl::awake for hand-off, Fl::add_timeout for timers)
 * Fl::lock() must have been called once before any background thread posts.
 */
class FltkEventLoop : public EventLoop {
    friend void fltkTimeoutCallback(void *userData);

  public:
    FltkEventLoop() = default;
    ~FltkEventLoop() override;

    FltkEventLoop(const FltkEventLoop &) = delete;
    FltkEventLoop &operator=(const FltkEventLoop &) = delete;

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return Clock::now(); }

  private:
    struct Timer {
        FltkEventLoop *loop = nullptr;
        TimerId id = 0;
        Task task;
    };

    void fire(Timer *timer);

    std::unordered_map<TimerId, std::unique_ptr<Timer>> m_timers;
    TimerId m_nextTimerId = 0;
};
