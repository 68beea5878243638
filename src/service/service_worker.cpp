#include "lmbridge/service/service_worker.h"
#include "lmbridge/common/errors.h"
#include "lmbridge/common/utils.h"

#include <stdexcept>

namespace lmbridge {

namespace {

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace

ServiceWorker::ServiceWorker(ServiceFactory factory,
                             const BridgeConfig& config,
                             RegistryFactory registry_factory)
    : factory_(std::move(factory))
    , config_(config)
    , registry_factory_(std::move(registry_factory))
    , loop_(std::make_shared<EventLoop>(config.worker_name))
    , port_(new ReceivePort(loop_, config.worker_name + ".port"))
    , in_flight_count_(0)
    , spawned_(false) {
    if (!registry_factory_) {
        registry_factory_ = &MethodRegistry::forService;
    }
}

ServiceWorker::~ServiceWorker() {
    shutdown();
}

void ServiceWorker::spawn(SendPort proxy) {
    if (spawned_) {
        utils::Logger::getInstance().warning(
            utils::format("Worker '%s' already spawned", config_.worker_name.c_str())
        );
        return;
    }
    spawned_ = true;
    loop_->start();
    loop_->post([this, proxy] { setUp(proxy); });
}

void ServiceWorker::shutdown() {
    if (!spawned_) {
        return;
    }
    spawned_ = false;

    if (loop_->inLoopThread()) {
        tearDown();
    } else if (loop_->isRunning()) {
        Promise<void> done;
        Future<void> finished = done.getFuture();
        bool posted = loop_->post([this, done]() mutable {
            tearDown();
            done.setValue();
        });
        if (posted) {
            finished.wait();
        }
    }
    loop_->stop();
    port_->close();

    // Nothing runs on the worker loop anymore
    service_.reset();
    utils::Logger::getInstance().debug(
        utils::format("Worker '%s' shut down", config_.worker_name.c_str())
    );
}

void ServiceWorker::setUp(SendPort proxy) {
    auto start = std::chrono::steady_clock::now();
    try {
        service_ = factory_();
        if (!service_) {
            throw BridgeError("service factory returned no instance");
        }
        registry_ = registry_factory_(*service_);
    } catch (const std::exception& e) {
        utils::Logger::getInstance().error(
            utils::format("Worker '%s' failed to create the service: %s",
                         config_.worker_name.c_str(), e.what())
        );
        service_.reset();
        return;
    }

    port_->listen([this](Envelope envelope) { handleEnvelope(std::move(envelope)); });
    proxy_ = proxy;
    reply(Envelope::bootstrap(port_->sendPort()));

    auto end = std::chrono::steady_clock::now();
    utils::Logger::getInstance().info(
        utils::format("Worker '%s' ready: %zu methods (%.2f ms)",
                     config_.worker_name.c_str(), registry_.size(),
                     utils::getElapsedMs(start, end))
    );
}

void ServiceWorker::tearDown() {
    // Stop producers first; their replies are no longer wanted
    std::unordered_map<CorrelationId, InFlightCall> calls;
    calls.swap(in_flight_);
    in_flight_count_ = 0;
    for (auto& entry : calls) {
        entry.second.stream.cancel();
    }
    if (!calls.empty()) {
        utils::Logger::getInstance().info(
            utils::format("Worker '%s' dropped %zu in-flight calls",
                         config_.worker_name.c_str(), calls.size())
        );
    }

    registry_ = MethodRegistry();
    service_.reset();
}

void ServiceWorker::handleEnvelope(Envelope envelope) {
    utils::Logger::getInstance().debug("recv " + envelope.toString());

    if (envelope.isBootstrap()) {
        handleBootstrap(envelope);
    } else if (envelope.cancel) {
        handleCancel(envelope);
    } else {
        handleRequest(envelope);
    }
}

void ServiceWorker::handleBootstrap(const Envelope& envelope) {
    const SendPort* port = std::get_if<SendPort>(&envelope.payload);
    if (port == nullptr || !port->valid()) {
        utils::Logger::getInstance().warning(
            "Ignoring bootstrap without a send port: " + envelope.toString()
        );
        return;
    }
    proxy_ = *port;
    reply(Envelope::bootstrap(port_->sendPort()));
    utils::Logger::getInstance().info(
        utils::format("Worker '%s' re-bound to '%s'",
                     config_.worker_name.c_str(), proxy_.name().c_str())
    );
}

void ServiceWorker::handleCancel(const Envelope& envelope) {
    auto it = in_flight_.find(envelope.id);
    if (it == in_flight_.end()) {
        return;
    }
    Stream<Payload> stream = it->second.stream;
    untrack(envelope.id);
    stream.cancel();

    utils::Logger::getInstance().debug(
        utils::format("Cancelled call %llu (%s)",
                     static_cast<unsigned long long>(envelope.id),
                     methodName(envelope.method).c_str())
    );
}

void ServiceWorker::handleRequest(const Envelope& request) {
    const MethodRegistry::Entry* entry = registry_.find(request.method);
    if (entry == nullptr) {
        reply(request.withError("Unknown method: " + methodName(request.method)));
        return;
    }

    if (config_.max_in_flight > 0 &&
        in_flight_.size() >= static_cast<size_t>(config_.max_in_flight)) {
        reply(request.withError(
            utils::format("worker busy: %zu calls in flight", in_flight_.size())));
        return;
    }

    CallResult result;
    try {
        result = entry->handler(request.payload);
    } catch (const std::exception& e) {
        reply(request.withError(e.what()));
        return;
    } catch (...) {
        reply(request.withError("unknown exception"));
        return;
    }

    switch (result.shape) {
        case CallResult::Shape::Immediate:
            reply(request.withPayload(std::move(result.value)));
            break;
        case CallResult::Shape::Async:
            watchFuture(request, result.future);
            break;
        case CallResult::Shape::Streaming:
            watchStream(request, result.stream);
            break;
    }
}

void ServiceWorker::watchFuture(const Envelope& request, Future<Payload> future) {
    Envelope stub = request.withPayload(Payload());
    in_flight_[request.id] = InFlightCall{request.method, Stream<Payload>()};
    in_flight_count_ = in_flight_.size();

    // Settlement may happen on any thread; the reply is sent from the loop
    std::shared_ptr<EventLoop> loop = loop_;
    future.onSettled([this, loop, stub, future] {
        loop->post([this, stub, future] { finishAsync(stub, future); });
    });
}

void ServiceWorker::watchStream(const Envelope& request, Stream<Payload> stream) {
    Envelope stub = request.withPayload(Payload());
    in_flight_[request.id] = InFlightCall{request.method, stream};
    in_flight_count_ = in_flight_.size();

    std::shared_ptr<EventLoop> loop = loop_;
    try {
        stream.listen(
            [this, loop, stub](const Payload& element) {
                loop->post([this, stub, element] { forwardElement(stub, element); });
            },
            [this, loop, stub] {
                loop->post([this, stub] { finishStream(stub, nullptr); });
            },
            [this, loop, stub](std::exception_ptr error) {
                loop->post([this, stub, error] { finishStream(stub, error); });
            });
    } catch (const std::logic_error& e) {
        // Stream handed out twice by the service
        untrack(stub.id);
        reply(stub.withError(e.what()));
    }
}

void ServiceWorker::finishAsync(const Envelope& stub, const Future<Payload>& future) {
    if (!untrack(stub.id)) {
        return;
    }
    try {
        reply(stub.withPayload(future.get()));
    } catch (const std::exception& e) {
        reply(stub.withError(e.what()));
    } catch (...) {
        reply(stub.withError("unknown exception"));
    }
}

void ServiceWorker::forwardElement(const Envelope& stub, const Payload& element) {
    if (in_flight_.count(stub.id) == 0) {
        return;
    }
    reply(stub.withPayload(element));
}

void ServiceWorker::finishStream(const Envelope& stub, std::exception_ptr error) {
    if (!untrack(stub.id)) {
        return;
    }
    if (error) {
        reply(stub.withError(describe(error)));
    } else {
        reply(stub.finished());
    }
}

bool ServiceWorker::untrack(CorrelationId id) {
    bool erased = in_flight_.erase(id) > 0;
    in_flight_count_ = in_flight_.size();
    return erased;
}

void ServiceWorker::reply(const Envelope& envelope) {
    if (!proxy_.send(envelope)) {
        utils::Logger::getInstance().warning(
            "Proxy port closed, dropping " + envelope.toString()
        );
    }
}

} // namespace lmbridge
