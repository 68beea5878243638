#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace lmbridge {

using Clock = std::chrono::steady_clock;
using Timestamp = std::chrono::time_point<Clock>;

// Unit of work executed by an EventLoop
struct ScheduledTask {
    uint64_t seq;                           // Enqueue order, breaks ties between equal due times
    Timestamp due;                          // Earliest time the task may run
    std::function<void()> fn;

    ScheduledTask() : seq(0) {}
    ScheduledTask(uint64_t s, Timestamp d, std::function<void()> f)
        : seq(s)
        , due(d)
        , fn(std::move(f))
    {}
};

// Thread-safe task queue
// Orders by due time, then FIFO by enqueue order
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    // Add a task runnable from `due` on (returns false once closed)
    bool enqueue(std::function<void()> fn, Timestamp due = Clock::now());

    // Remove the next due task, blocking until one is due or the queue closes.
    // Returns false when the queue has been closed.
    bool dequeue(ScheduledTask& out);

    // Remove the next task if it is already due (non-blocking)
    bool tryDequeue(ScheduledTask& out);

    // Check if queue is empty
    bool empty() const;

    // Get queue size (due and not yet due)
    size_t size() const;

    // Drop every queued task
    void clear();

    // Wake blocked consumers and reject further tasks
    void close();

    bool closed() const;

private:
    struct TaskComparator {
        bool operator()(const ScheduledTask& a, const ScheduledTask& b) const {
            if (a.due != b.due) {
                return a.due > b.due;   // Earlier due time first
            }
            return a.seq > b.seq;       // Then earlier enqueue first
        }
    };

    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>, TaskComparator> queue_;
    uint64_t next_seq_;
    bool closed_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace lmbridge
