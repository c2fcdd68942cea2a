#include "utils/EventLoop.h"

#include <FL/Fl.H>

#include "utils/Logger.h"

void fltkTimeoutCallback(void *userData) {
    auto *timer = static_cast<FltkEventLoop::Timer *>(userData);
    if (timer && timer->loop) {
        timer->loop->fire(timer);
    }
}

FltkEventLoop::~FltkEventLoop() {
    for (auto &kv : m_timers) {
        Fl::remove_timeout(fltkTimeoutCallback, kv.second.get());
    }
    m_timers.clear();
}

void FltkEventLoop::post(Task task) {
    auto *heapFn = new std::function<void()>(std::move(task));
    int rc = Fl::awake(
        [](void *p) {
            std::unique_ptr<std::function<void()>> fnPtr(static_cast<std::function<void()> *>(p));
            (*fnPtr)();
        },
        heapFn);

    if (rc != 0) {
        // FLTK's awake queue is full; the callback will never run
        Logger::error("EventLoop: Fl::awake queue full, dropping task");
        delete heapFn;
    }
}

EventLoop::TimerId FltkEventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    const TimerId id = ++m_nextTimerId;
    auto timer = std::make_unique<Timer>();
    timer->loop = this;
    timer->id = id;
    timer->task = std::move(task);

    Fl::add_timeout(static_cast<double>(delay.count()) / 1000.0, fltkTimeoutCallback, timer.get());
    m_timers.emplace(id, std::move(timer));
    return id;
}

void FltkEventLoop::cancel(TimerId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return;
    }
    Fl::remove_timeout(fltkTimeoutCallback, it->second.get());
    m_timers.erase(it);
}

void FltkEventLoop::fire(Timer *timer) {
    auto it = m_timers.find(timer->id);
    if (it == m_timers.end()) {
        return;
    }

    // Detach before running so the task may schedule or cancel freely
    Task task = std::move(it->second->task);
    m_timers.erase(it);
    if (task) {
        task();
    }
}
