#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lmbridge {

template <typename T> class Future;
template <typename T> class Promise;

namespace detail {

template <typename T>
using StoredValue = std::conditional_t<std::is_void<T>::value, std::monostate, T>;

// Shared state between one Promise and any number of Future copies.
// Settles exactly once; callbacks registered before settlement run on the
// settling thread, later ones run immediately on the registering thread.
template <typename T>
class FutureState {
public:
    using Callback = std::function<void()>;

    bool settle(std::optional<StoredValue<T>> value, std::exception_ptr error) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (settled_) {
                return false;
            }
            value_ = std::move(value);
            error_ = error;
            settled_ = true;
            callbacks.swap(callbacks_);
        }
        cv_.notify_all();
        for (auto& callback : callbacks) {
            callback();
        }
        return true;
    }

    void addCallback(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!settled_) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

    bool isSettled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_;
    }

    bool isFailed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_ && error_ != nullptr;
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return settled_; });
    }

    bool waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return settled_; });
    }

    void rethrowIfFailed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

    StoredValue<T> value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return *value_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool settled_ = false;
    std::optional<StoredValue<T>> value_;
    std::exception_ptr error_;
    std::vector<Callback> callbacks_;
};

} // namespace detail

// Read side of a single asynchronous result. Copies share the same result.
template <typename T>
class Future {
public:
    Future() = default;

    bool valid() const { return state_ != nullptr; }

    // Settled with either a value or an error
    bool isReady() const { return state_ && state_->isSettled(); }

    // Settled with an error
    bool hasError() const { return state_ && state_->isFailed(); }

    // Block until settled; returns the value or rethrows the failure
    T get() const {
        checkValid();
        state_->wait();
        state_->rethrowIfFailed();
        if constexpr (std::is_void<T>::value) {
            return;
        } else {
            return state_->value();
        }
    }

    void wait() const {
        checkValid();
        state_->wait();
    }

    // Returns false if the future is still pending after the timeout
    bool waitFor(std::chrono::milliseconds timeout) const {
        checkValid();
        return state_->waitFor(timeout);
    }

    // Run callback once settled. get() inside the callback never blocks.
    void onSettled(std::function<void()> callback) const {
        checkValid();
        state_->addCallback(std::move(callback));
    }

private:
    friend class Promise<T>;

    explicit Future(std::shared_ptr<detail::FutureState<T>> state)
        : state_(std::move(state)) {}

    void checkValid() const {
        if (!state_) {
            throw std::logic_error("operation on an empty future");
        }
    }

    std::shared_ptr<detail::FutureState<T>> state_;
};

// Write side of a single asynchronous result
template <typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

    Future<T> getFuture() const { return Future<T>(state_); }

    // Each setter returns false if the promise was already settled
    template <typename U = T>
    std::enable_if_t<!std::is_void<U>::value, bool> setValue(U value) {
        return state_->settle(detail::StoredValue<T>(std::move(value)), nullptr);
    }

    template <typename U = T>
    std::enable_if_t<std::is_void<U>::value, bool> setValue() {
        return state_->settle(std::monostate{}, nullptr);
    }

    bool setException(std::exception_ptr error) {
        return state_->settle(std::nullopt, error);
    }

    bool isSettled() const { return state_->isSettled(); }

private:
    std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T>
Future<T> makeReadyFuture(T value) {
    Promise<T> promise;
    promise.setValue(std::move(value));
    return promise.getFuture();
}

inline Future<void> makeReadyFuture() {
    Promise<void> promise;
    promise.setValue();
    return promise.getFuture();
}

template <typename T>
Future<T> makeFailedFuture(std::exception_ptr error) {
    Promise<T> promise;
    promise.setException(error);
    return promise.getFuture();
}

} // namespace lmbridge
