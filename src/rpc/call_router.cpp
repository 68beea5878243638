#include "lmbridge/rpc/call_router.h"

namespace lmbridge {

bool CallRouter::add(CorrelationId id, Route route) {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.emplace(id, std::move(route)).second;
}

bool CallRouter::remove(CorrelationId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.erase(id) > 0;
}

bool CallRouter::dispatch(const Envelope& envelope) {
    std::function<bool(const Envelope&)> on_reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(envelope.id);
        if (it == routes_.end()) {
            return false;
        }
        on_reply = it->second.on_reply;
    }

    bool finished = on_reply ? on_reply(envelope) : true;
    if (finished || envelope.isTerminal()) {
        remove(envelope.id);
    }
    return true;
}

void CallRouter::failAll(std::exception_ptr error) {
    std::unordered_map<CorrelationId, Route> routes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        routes.swap(routes_);
    }
    for (auto& entry : routes) {
        if (entry.second.on_abort) {
            entry.second.on_abort(error);
        }
    }
}

bool CallRouter::contains(CorrelationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.count(id) > 0;
}

size_t CallRouter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

} // namespace lmbridge
