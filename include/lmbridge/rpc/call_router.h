#pragma once

#include "lmbridge/rpc/envelope.h"

#include <exception>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace lmbridge {

// Correlation id -> pending call table on the proxy side.
// Replies are handed to the route registered for their id; a route is
// dropped once it reports that its call is finished.
class CallRouter {
public:
    struct Route {
        // Returns true when the call needs no further replies
        std::function<bool(const Envelope&)> on_reply;
        // The call will never get a reply (proxy disposed, ...)
        std::function<void(std::exception_ptr)> on_abort;
    };

    // Returns false if `id` already has a route
    bool add(CorrelationId id, Route route);

    // Returns false if there was no route for `id`
    bool remove(CorrelationId id);

    // Hand a reply to its route. Returns false for ids without a route.
    bool dispatch(const Envelope& envelope);

    // Abort and drop every route
    void failAll(std::exception_ptr error);

    bool contains(CorrelationId id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<CorrelationId, Route> routes_;
};

} // namespace lmbridge
