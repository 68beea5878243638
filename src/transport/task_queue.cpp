#include "lmbridge/transport/task_queue.h"

namespace lmbridge {

TaskQueue::TaskQueue()
    : next_seq_(0)
    , closed_(false) {
}

TaskQueue::~TaskQueue() {
    close();
    clear();
}

bool TaskQueue::enqueue(std::function<void()> fn, Timestamp due) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    queue_.push(ScheduledTask(next_seq_++, due, std::move(fn)));
    cv_.notify_one();
    return true;
}

bool TaskQueue::dequeue(ScheduledTask& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (closed_) {
            return false;
        }
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }
        Timestamp due = queue_.top().due;
        if (due <= Clock::now()) {
            out = queue_.top();
            queue_.pop();
            return true;
        }
        // An earlier task may arrive while waiting; re-check after every wakeup
        cv_.wait_until(lock, due);
    }
}

bool TaskQueue::tryDequeue(ScheduledTask& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty() || queue_.top().due > Clock::now()) {
        return false;
    }

    out = queue_.top();
    queue_.pop();
    return true;
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        queue_.pop();
    }
}

void TaskQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool TaskQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace lmbridge
