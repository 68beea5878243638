#pragma once

#include "lmbridge/common/config.h"
#include "lmbridge/rpc/envelope.h"
#include "lmbridge/rpc/method_registry.h"
#include "lmbridge/service/inference_service.h"
#include "lmbridge/transport/event_loop.h"
#include "lmbridge/transport/receive_port.h"

#include <atomic>
#include <functional>
#include <memory>
#include <unordered_map>

namespace lmbridge {

// Worker endpoint
// Owns the real service on its own event loop and answers the envelopes a
// proxy sends it: bootstrap, cancellations and contract calls.
class ServiceWorker {
public:
    // Builds the method table for the service (defaults to forService)
    using RegistryFactory = std::function<MethodRegistry(InferenceService&)>;

    ServiceWorker(ServiceFactory factory,
                  const BridgeConfig& config = BridgeConfig(),
                  RegistryFactory registry_factory = nullptr);
    ~ServiceWorker();

    ServiceWorker(const ServiceWorker&) = delete;
    ServiceWorker& operator=(const ServiceWorker&) = delete;

    // Start the worker loop, build the service on it and send the bootstrap
    // envelope to `proxy`. A failing factory is logged and no bootstrap is sent.
    void spawn(SendPort proxy);

    // Cancel in-flight calls, destroy the service on the worker thread and
    // stop the loop
    void shutdown();

    // Calls accepted but not yet finished (updated on the worker loop)
    size_t inFlightCalls() const { return in_flight_count_; }

    bool isRunning() const { return loop_->isRunning(); }

private:
    struct InFlightCall {
        Method method;
        Stream<Payload> stream;             // Valid for streaming calls only
    };

    // All of the following run on the worker loop
    void setUp(SendPort proxy);
    void tearDown();
    void handleEnvelope(Envelope envelope);
    void handleBootstrap(const Envelope& envelope);
    void handleCancel(const Envelope& envelope);
    void handleRequest(const Envelope& request);
    void watchFuture(const Envelope& request, Future<Payload> future);
    void watchStream(const Envelope& request, Stream<Payload> stream);
    void finishAsync(const Envelope& stub, const Future<Payload>& future);
    void forwardElement(const Envelope& stub, const Payload& element);
    void finishStream(const Envelope& stub, std::exception_ptr error);
    bool untrack(CorrelationId id);
    void reply(const Envelope& envelope);

    ServiceFactory factory_;
    BridgeConfig config_;
    RegistryFactory registry_factory_;

    std::shared_ptr<EventLoop> loop_;
    std::unique_ptr<ReceivePort> port_;

    // Worker loop state
    std::unique_ptr<InferenceService> service_;
    MethodRegistry registry_;
    SendPort proxy_;
    std::unordered_map<CorrelationId, InFlightCall> in_flight_;
    std::atomic<size_t> in_flight_count_;
    bool spawned_;
};

} // namespace lmbridge
