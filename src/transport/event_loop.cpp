#include "lmbridge/transport/event_loop.h"
#include "lmbridge/common/utils.h"

namespace lmbridge {

EventLoop::EventLoop(std::string name)
    : name_(std::move(name))
    , state_(std::make_shared<State>())
    , started_(false) {
}

EventLoop::~EventLoop() {
    stop();
    if (thread_.joinable()) {
        // Last owner released from inside a task; the thread keeps the state
        thread_.detach();
    }
}

void EventLoop::start() {
    if (started_.exchange(true)) {
        utils::Logger::getInstance().warning(
            utils::format("Event loop '%s' already started", name_.c_str())
        );
        return;
    }

    state_->running = true;
    thread_ = std::thread(&EventLoop::run, state_, name_);
}

void EventLoop::stop() {
    state_->queue.close();
    if (thread_.joinable() && !inLoopThread()) {
        thread_.join();
    }
}

bool EventLoop::post(Task task) {
    return state_->queue.enqueue(std::move(task));
}

bool EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
    return state_->queue.enqueue(std::move(task), Clock::now() + delay);
}

bool EventLoop::inLoopThread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

void EventLoop::run(std::shared_ptr<State> state, std::string name) {
    utils::setContextName(name);
    utils::Logger::getInstance().debug("Event loop started");

    ScheduledTask task;
    while (state->queue.dequeue(task)) {
        try {
            task.fn();
        } catch (const std::exception& e) {
            utils::Logger::getInstance().error(
                utils::format("Uncaught exception in task: %s", e.what())
            );
        } catch (...) {
            utils::Logger::getInstance().error("Uncaught non-standard exception in task");
        }
        task.fn = nullptr;
    }

    state->running = false;
    utils::Logger::getInstance().debug("Event loop stopped");
}

} // namespace lmbridge
