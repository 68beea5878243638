#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lmbridge {

template <typename T> class Stream;
template <typename T> class StreamController;

namespace detail {

// Buffer and terminal state of one finite, single-subscription stream.
// Elements are buffered until consumed either by pulling (next) or by a
// listener; the terminal event (done or error) is delivered after every
// buffered element.
template <typename T>
class StreamState {
public:
    using DataFn = std::function<void(const T&)>;
    using DoneFn = std::function<void()>;
    using ErrorFn = std::function<void(std::exception_ptr)>;

    bool add(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || cancelled_) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        cv_.notify_all();
        drain();
        return true;
    }

    bool addError(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || cancelled_) {
                return false;
            }
            error_ = error;
            closed_ = true;
            on_cancel_ = nullptr;
        }
        cv_.notify_all();
        drain();
        return true;
    }

    bool close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || cancelled_) {
                return false;
            }
            closed_ = true;
            on_cancel_ = nullptr;
        }
        cv_.notify_all();
        drain();
        return true;
    }

    // Ignored once the stream is closed
    void setOnCancel(std::function<void()> on_cancel) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            on_cancel_ = std::move(on_cancel);
        }
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool next(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (mode_ == Mode::Push) {
            throw std::logic_error("stream already has a listener");
        }
        mode_ = Mode::Pull;
        cv_.wait(lock, [this] { return !items_.empty() || closed_ || cancelled_; });
        if (!items_.empty()) {
            out = std::move(items_.front());
            items_.pop_front();
            return true;
        }
        if (error_ && !cancelled_) {
            std::rethrow_exception(error_);
        }
        return false;
    }

    void listen(DataFn on_data, DoneFn on_done, ErrorFn on_error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (mode_ != Mode::None) {
                throw std::logic_error("stream has already been listened to");
            }
            mode_ = Mode::Push;
            on_data_ = std::move(on_data);
            on_done_ = std::move(on_done);
            on_error_ = std::move(on_error);
        }
        drain();
    }

    void cancel() {
        std::function<void()> on_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminal_delivered_) {
                return;
            }
            cancelled_ = true;
            items_.clear();
            on_cancel.swap(on_cancel_);
        }
        cv_.notify_all();
        if (on_cancel) {
            on_cancel();
        }
    }

private:
    enum class Mode { None, Pull, Push };

    // Delivers buffered events to the listener in order; only one thread
    // delivers at a time.
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (mode_ != Mode::Push || delivering_) {
            return;
        }
        delivering_ = true;
        while (!cancelled_) {
            if (!items_.empty()) {
                T item = std::move(items_.front());
                items_.pop_front();
                DataFn on_data = on_data_;
                lock.unlock();
                if (on_data) on_data(item);
                lock.lock();
                continue;
            }
            if (closed_ && !terminal_delivered_) {
                terminal_delivered_ = true;
                std::exception_ptr error = error_;
                DoneFn on_done = on_done_;
                ErrorFn on_error = on_error_;
                lock.unlock();
                if (error) {
                    if (on_error) on_error(error);
                } else {
                    if (on_done) on_done();
                }
                lock.lock();
                // Listeners may own the producer; release them once finished
                on_data_ = nullptr;
                on_done_ = nullptr;
                on_error_ = nullptr;
            }
            break;
        }
        delivering_ = false;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::exception_ptr error_;
    bool closed_ = false;
    bool cancelled_ = false;
    bool delivering_ = false;
    bool terminal_delivered_ = false;
    Mode mode_ = Mode::None;
    DataFn on_data_;
    DoneFn on_done_;
    ErrorFn on_error_;
    std::function<void()> on_cancel_;
};

} // namespace detail

// Consumer handle of a finite sequence produced elsewhere. A stream can be
// consumed once, either by pulling with next() or by registering a listener.
template <typename T>
class Stream {
public:
    Stream() = default;

    bool valid() const { return state_ != nullptr; }

    // Blocks for the next element. Returns false once the stream has ended
    // normally (or was cancelled); rethrows the failure of a failed stream.
    bool next(T& out) {
        checkValid();
        return state_->next(out);
    }

    // Pull every remaining element
    std::vector<T> collect() {
        std::vector<T> items;
        T item;
        while (next(item)) {
            items.push_back(std::move(item));
        }
        return items;
    }

    // Callbacks run on the producing thread
    void listen(std::function<void(const T&)> on_data,
                std::function<void()> on_done,
                std::function<void(std::exception_ptr)> on_error) {
        checkValid();
        state_->listen(std::move(on_data), std::move(on_done), std::move(on_error));
    }

    // Stop consuming; the producer's cancel hook runs once
    void cancel() {
        if (state_) {
            state_->cancel();
        }
    }

    bool isCancelled() const { return state_ && state_->isCancelled(); }

private:
    friend class StreamController<T>;

    explicit Stream(std::shared_ptr<detail::StreamState<T>> state)
        : state_(std::move(state)) {}

    void checkValid() const {
        if (!state_) {
            throw std::logic_error("operation on an empty stream");
        }
    }

    std::shared_ptr<detail::StreamState<T>> state_;
};

// Producer side of a Stream
template <typename T>
class StreamController {
public:
    StreamController() : state_(std::make_shared<detail::StreamState<T>>()) {}

    Stream<T> stream() const { return Stream<T>(state_); }

    // Producer calls return false once the stream is closed or cancelled
    bool add(T value) { return state_->add(std::move(value)); }
    bool addError(std::exception_ptr error) { return state_->addError(error); }
    bool close() { return state_->close(); }

    void setOnCancel(std::function<void()> on_cancel) {
        state_->setOnCancel(std::move(on_cancel));
    }

    bool isCancelled() const { return state_->isCancelled(); }
    bool isClosed() const { return state_->isClosed(); }

private:
    std::shared_ptr<detail::StreamState<T>> state_;
};

template <typename T>
Stream<T> makeFailedStream(std::exception_ptr error) {
    StreamController<T> controller;
    controller.addError(error);
    return controller.stream();
}

} // namespace lmbridge
