#pragma once

#include <memory>
#include <string>
#include <utility>

namespace lmbridge {

struct Envelope;

namespace detail {
class PortState;
}

// Send capability of a ReceivePort. Copyable; sending never blocks and
// delivers the envelope as a task on the receiving port's event loop.
class SendPort {
public:
    SendPort() = default;

    // Fire-and-forget. Returns false if the port is closed or its loop stopped.
    bool send(Envelope envelope) const;

    bool valid() const { return state_ != nullptr; }
    bool isClosed() const;
    std::string name() const;

    bool operator==(const SendPort& other) const { return state_ == other.state_; }
    bool operator!=(const SendPort& other) const { return state_ != other.state_; }

private:
    friend class ReceivePort;

    explicit SendPort(std::shared_ptr<detail::PortState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::PortState> state_;
};

} // namespace lmbridge
