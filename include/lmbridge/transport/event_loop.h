#pragma once

#include "lmbridge/transport/task_queue.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace lmbridge {

// Single-threaded execution context
// Runs posted tasks one at a time, in order, on its own thread
class EventLoop {
public:
    using Task = std::function<void()>;

    explicit EventLoop(std::string name);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Start the loop thread (tasks posted earlier run first)
    void start();

    // Stop the loop; pending tasks are dropped. Joins the loop thread unless
    // called from it.
    void stop();

    // Queue a task (returns false once the loop is stopped)
    bool post(Task task);

    // Queue a task to run after `delay`
    bool postDelayed(std::chrono::milliseconds delay, Task task);

    bool isRunning() const { return state_->running; }
    bool inLoopThread() const;
    const std::string& name() const { return name_; }

private:
    // Co-owned by the loop thread, which outlives the EventLoop when its last
    // owner is released from inside a task
    struct State {
        TaskQueue queue;
        std::atomic<bool> running{false};
    };

    static void run(std::shared_ptr<State> state, std::string name);

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread thread_;
    std::atomic<bool> started_;
};

} // namespace lmbridge
