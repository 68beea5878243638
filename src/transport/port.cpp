#include "lmbridge/transport/receive_port.h"
#include "lmbridge/common/utils.h"

namespace lmbridge {

namespace detail {

PortState::PortState(std::weak_ptr<EventLoop> loop, std::string name)
    : loop_(std::move(loop))
    , name_(std::move(name))
    , closed_(false) {
}

bool PortState::post(Envelope envelope) {
    std::shared_ptr<EventLoop> loop = loop_.lock();
    if (!loop || isClosed()) {
        return false;
    }
    auto self = shared_from_this();
    return loop->post([self, envelope]() mutable {
        self->deliver(std::move(envelope));
    });
}

void PortState::setHandler(Handler handler) {
    bool has_pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
        has_pending = !pending_.empty();
    }
    if (has_pending) {
        std::shared_ptr<EventLoop> loop = loop_.lock();
        if (loop) {
            auto self = shared_from_this();
            loop->post([self] { self->flushPending(); });
        }
    }
}

void PortState::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    handler_ = nullptr;
    pending_.clear();
}

bool PortState::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void PortState::deliver(Envelope envelope) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (!handler_ || !pending_.empty()) {
            pending_.push_back(std::move(envelope));
            if (!handler_) {
                return;
            }
        } else {
            handler = handler_;
        }
    }
    if (handler) {
        handler(std::move(envelope));
    } else {
        flushPending();
    }
}

void PortState::flushPending() {
    while (true) {
        Handler handler;
        Envelope envelope;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !handler_ || pending_.empty()) {
                return;
            }
            envelope = std::move(pending_.front());
            pending_.pop_front();
            handler = handler_;
        }
        handler(std::move(envelope));
    }
}

} // namespace detail

bool SendPort::send(Envelope envelope) const {
    if (!state_) {
        return false;
    }
    return state_->post(std::move(envelope));
}

bool SendPort::isClosed() const {
    return !state_ || state_->isClosed();
}

std::string SendPort::name() const {
    return state_ ? state_->name() : std::string();
}

ReceivePort::ReceivePort(std::shared_ptr<EventLoop> loop, std::string name)
    : state_(std::make_shared<detail::PortState>(loop, std::move(name))) {
}

ReceivePort::~ReceivePort() {
    close();
}

void ReceivePort::listen(Handler handler) {
    state_->setHandler(std::move(handler));
}

SendPort ReceivePort::sendPort() const {
    return SendPort(state_);
}

void ReceivePort::close() {
    if (!state_->isClosed()) {
        utils::Logger::getInstance().debug(
            utils::format("Receive port '%s' closed", state_->name().c_str())
        );
    }
    state_->close();
}

bool ReceivePort::isClosed() const {
    return state_->isClosed();
}

} // namespace lmbridge
