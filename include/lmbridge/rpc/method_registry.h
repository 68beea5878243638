#pragma once

#include "lmbridge/async/future.h"
#include "lmbridge/async/stream.h"
#include "lmbridge/rpc/method.h"
#include "lmbridge/rpc/payload.h"

#include <functional>
#include <optional>
#include <unordered_map>

namespace lmbridge {

class InferenceService;

// What a bound handler hands back to the worker loop
struct CallResult {
    enum class Shape {
        Immediate,      // Reply right away with `value`
        Async,          // Reply once `future` settles
        Streaming       // Reply once per element of `stream`, then done/error
    };

    Shape shape = Shape::Immediate;
    Payload value;
    Future<Payload> future;
    Stream<Payload> stream;

    static CallResult immediate(Payload value);
    static CallResult async(Future<Payload> future);
    static CallResult streaming(Stream<Payload> stream);
};

// Bound handler of one contract operation. May throw; the worker turns the
// exception into an error reply.
using MethodHandler = std::function<CallResult(const Payload& argument)>;

// Method identifier -> handler table used by the worker.
// Immutable once built.
class MethodRegistry {
public:
    struct Entry {
        CallKind kind;
        MethodHandler handler;
    };

    class Builder {
    public:
        // Throws std::logic_error when `method` is already bound
        Builder& add(Method method, CallKind kind, MethodHandler handler);

        MethodRegistry build();

    private:
        std::unordered_map<Method, Entry> entries_;
    };

    MethodRegistry() = default;

    // Bind every contract operation to `service`. The service must outlive
    // the registry.
    static MethodRegistry forService(InferenceService& service);

    // nullptr when the method is not bound
    const Entry* find(Method method) const;

    bool contains(Method method) const { return find(method) != nullptr; }
    size_t size() const { return entries_.size(); }
    std::optional<CallKind> kindOf(Method method) const;

private:
    explicit MethodRegistry(std::unordered_map<Method, Entry> entries)
        : entries_(std::move(entries)) {}

    std::unordered_map<Method, Entry> entries_;
};

// Argument of `method` as T. A payload of another shape throws ProtocolError
// "MethodInvocationError: method:<name>, param:<payload type>".
template <typename T>
T argumentAs(Method method, const Payload& argument) {
    if constexpr (std::is_void<T>::value) {
        return;
    } else {
        const T* value = std::get_if<T>(&argument);
        if (value == nullptr) {
            throw ProtocolError("MethodInvocationError: method:" + methodName(method) +
                                ", param:" + payloadTypeName(argument));
        }
        return *value;
    }
}

// Adapt a typed future to the payload form. An already settled future
// becomes an immediate result (a failed one rethrows here).
template <typename R>
CallResult fromFuture(Future<R> future) {
    if (future.isReady()) {
        if constexpr (std::is_void<R>::value) {
            future.get();
            return CallResult::immediate(Payload());
        } else {
            return CallResult::immediate(toPayload(future.get()));
        }
    }
    Promise<Payload> promise;
    future.onSettled([future, promise]() mutable {
        try {
            if constexpr (std::is_void<R>::value) {
                future.get();
                promise.setValue(Payload());
            } else {
                promise.setValue(toPayload(future.get()));
            }
        } catch (...) {
            promise.setException(std::current_exception());
        }
    });
    return CallResult::async(promise.getFuture());
}

// Adapt a typed stream to the payload form. Cancelling the adapted stream
// cancels the source.
template <typename T>
CallResult fromStream(Stream<T> source) {
    StreamController<Payload> controller;
    controller.setOnCancel([source]() mutable { source.cancel(); });
    source.listen(
        [controller](const T& item) mutable { controller.add(toPayload(item)); },
        [controller]() mutable { controller.close(); },
        [controller](std::exception_ptr error) mutable { controller.addError(error); });
    return CallResult::streaming(controller.stream());
}

} // namespace lmbridge
