#pragma once

#include "lmbridge/rpc/envelope.h"
#include "lmbridge/transport/event_loop.h"
#include "lmbridge/transport/send_port.h"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lmbridge {

namespace detail {

// Receiving end shared by a ReceivePort and every SendPort copied from it
class PortState : public std::enable_shared_from_this<PortState> {
public:
    using Handler = std::function<void(Envelope)>;

    PortState(std::weak_ptr<EventLoop> loop, std::string name);

    // Queue delivery on the owning loop (any thread)
    bool post(Envelope envelope);

    void setHandler(Handler handler);
    void close();
    bool isClosed() const;
    const std::string& name() const { return name_; }

private:
    // Runs on the owning loop
    void deliver(Envelope envelope);
    void flushPending();

    std::weak_ptr<EventLoop> loop_;
    std::string name_;
    mutable std::mutex mutex_;
    Handler handler_;
    std::deque<Envelope> pending_;          // Delivered before a handler was set
    bool closed_;
};

} // namespace detail

// Receiving end of a channel, bound to one event loop. Envelopes sent to its
// SendPort are handed to the single listener on that loop, in send order.
class ReceivePort {
public:
    using Handler = detail::PortState::Handler;

    ReceivePort(std::shared_ptr<EventLoop> loop, std::string name);
    ~ReceivePort();

    ReceivePort(const ReceivePort&) = delete;
    ReceivePort& operator=(const ReceivePort&) = delete;

    // Install the listener; envelopes that arrived earlier are replayed
    void listen(Handler handler);

    SendPort sendPort() const;

    // Further sends fail; undelivered envelopes are dropped
    void close();

    bool isClosed() const;
    const std::string& name() const { return state_->name(); }

private:
    std::shared_ptr<detail::PortState> state_;
};

} // namespace lmbridge
