#include "lmbridge/service/service_proxy.h"
#include "lmbridge/common/errors.h"
#include "lmbridge/common/utils.h"
#include "lmbridge/rpc/call_router.h"
#include "lmbridge/rpc/envelope.h"
#include "lmbridge/service/service_worker.h"
#include "lmbridge/transport/event_loop.h"
#include "lmbridge/transport/receive_port.h"

#include <chrono>
#include <mutex>

namespace lmbridge {

namespace {

std::exception_ptr disposedError() {
    return std::make_exception_ptr(BridgeError("service proxy disposed"));
}

} // namespace

// State shared between the proxy object and the callbacks it hands out.
// Callbacks hold it weakly so they never keep a disposed proxy alive.
struct ServiceProxy::Core : public std::enable_shared_from_this<ServiceProxy::Core> {
    enum class State {
        Idle,           // init not called yet
        Handshaking,    // Waiting for the worker's bootstrap envelope
        Ready,
        Failed,         // Handshake timed out
        Disposed
    };

    Core(ServiceFactory f, const BridgeConfig& c)
        : factory(std::move(f))
        , config(c)
        , loop(std::make_shared<EventLoop>(c.proxy_name))
        , port(new ReceivePort(loop, c.proxy_name + ".port"))
        , state(State::Idle)
        , generation(0) {
    }

    void start();
    void beginHandshake();
    Future<void> handshakeFor(Method method);
    void onEnvelope(Envelope envelope);
    void onBootstrap(const Envelope& envelope);
    void onHandshakeTimeout(uint64_t attempt);
    void sendSingle(Method method, Payload argument, Promise<Payload> promise);
    void sendStreaming(Method method, Payload argument, StreamController<std::string> controller);
    void sendCancel(CorrelationId id, Method method);
    bool send(const Envelope& envelope);
    void dispose();

    ServiceFactory factory;
    BridgeConfig config;
    std::shared_ptr<EventLoop> loop;
    std::unique_ptr<ReceivePort> port;
    CallRouter router;
    CorrelationCounter counter;

    // Guarded by mutex
    mutable std::mutex mutex;
    State state;
    uint64_t generation;                    // Handshake attempt
    std::unique_ptr<ServiceWorker> worker;
    SendPort worker_port;
    Promise<void> handshake_promise;
    Future<void> handshake_future;
    std::chrono::steady_clock::time_point handshake_start;
};

void ServiceProxy::Core::start() {
    std::weak_ptr<Core> weak = shared_from_this();
    port->listen([weak](Envelope envelope) {
        if (auto core = weak.lock()) {
            core->onEnvelope(std::move(envelope));
        }
    });
    loop->start();
}

void ServiceProxy::Core::beginHandshake() {
    std::unique_lock<std::mutex> lock(mutex);
    if (state == State::Disposed || state == State::Handshaking) {
        // Calls fail, or queue behind the running handshake
        return;
    }

    // A connected worker is re-bootstrapped; otherwise a new one is spawned
    bool respawn = state != State::Ready;
    uint64_t attempt = ++generation;
    handshake_promise = Promise<void>();
    handshake_future = handshake_promise.getFuture();
    handshake_start = std::chrono::steady_clock::now();
    state = State::Handshaking;

    std::unique_ptr<ServiceWorker> previous;
    if (respawn) {
        previous = std::move(worker);
        worker.reset(new ServiceWorker(factory, config));
        worker_port = SendPort();
    }
    ServiceWorker* target = worker.get();
    SendPort connected = worker_port;
    lock.unlock();

    if (previous) {
        previous->shutdown();
    }

    std::weak_ptr<Core> weak = shared_from_this();
    loop->postDelayed(std::chrono::milliseconds(config.handshake_timeout_ms), [weak, attempt] {
        if (auto core = weak.lock()) {
            core->onHandshakeTimeout(attempt);
        }
    });

    if (respawn) {
        utils::Logger::getInstance().info(
            utils::format("Spawning worker '%s'", config.worker_name.c_str())
        );
        target->spawn(port->sendPort());
    } else if (!connected.send(Envelope::bootstrap(port->sendPort()))) {
        utils::Logger::getInstance().warning(
            utils::format("Worker '%s' unreachable, waiting for handshake timeout",
                         config.worker_name.c_str())
        );
    }
}

Future<void> ServiceProxy::Core::handshakeFor(Method method) {
    std::lock_guard<std::mutex> lock(mutex);
    switch (state) {
        case State::Idle:
            return makeFailedFuture<void>(std::make_exception_ptr(BridgeError(
                "service proxy not initialized: call init before " + methodName(method))));
        case State::Disposed:
            return makeFailedFuture<void>(disposedError());
        default:
            return handshake_future;
    }
}

void ServiceProxy::Core::onEnvelope(Envelope envelope) {
    if (envelope.isBootstrap()) {
        onBootstrap(envelope);
        return;
    }
    if (!router.dispatch(envelope)) {
        utils::Logger::getInstance().warning("No pending call for " + envelope.toString());
    }
}

void ServiceProxy::Core::onBootstrap(const Envelope& envelope) {
    const SendPort* reply_port = std::get_if<SendPort>(&envelope.payload);
    if (reply_port == nullptr || !reply_port->valid()) {
        utils::Logger::getInstance().warning(
            "Bootstrap without a send port: " + envelope.toString()
        );
        return;
    }

    Promise<void> promise;
    double elapsed_ms = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Handshaking) {
            utils::Logger::getInstance().warning("Ignoring late bootstrap envelope");
            return;
        }
        worker_port = *reply_port;
        state = State::Ready;
        promise = handshake_promise;
        elapsed_ms = utils::getElapsedMs(handshake_start, std::chrono::steady_clock::now());
    }

    utils::Logger::getInstance().info(
        utils::format("Worker '%s' connected (handshake %.2f ms)",
                     config.worker_name.c_str(), elapsed_ms)
    );
    promise.setValue();
}

void ServiceProxy::Core::onHandshakeTimeout(uint64_t attempt) {
    Promise<void> promise;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (attempt != generation || state != State::Handshaking) {
            return;
        }
        state = State::Failed;
        promise = handshake_promise;
    }

    std::string message = utils::format(
        "worker '%s' did not complete the handshake within %d ms",
        config.worker_name.c_str(), config.handshake_timeout_ms);
    utils::Logger::getInstance().error(message);
    promise.setException(std::make_exception_ptr(HandshakeError(message)));
}

void ServiceProxy::Core::sendSingle(Method method, Payload argument, Promise<Payload> promise) {
    Envelope request = Envelope::request(counter, method, std::move(argument));
    CorrelationId id = request.id;

    CallRouter::Route route;
    route.on_reply = [promise](const Envelope& reply) mutable {
        if (reply.hasError()) {
            promise.setException(std::make_exception_ptr(RemoteError(reply.error)));
        } else {
            promise.setValue(reply.payload);
        }
        return true;
    };
    route.on_abort = [promise](std::exception_ptr error) mutable {
        promise.setException(error);
    };

    // Registered before sending so the reply always finds its route
    router.add(id, std::move(route));
    if (!send(request) && router.remove(id)) {
        promise.setException(std::make_exception_ptr(BridgeError("worker channel closed")));
    }
}

void ServiceProxy::Core::sendStreaming(Method method, Payload argument,
                                       StreamController<std::string> controller) {
    if (controller.isCancelled()) {
        return;
    }

    Envelope request = Envelope::request(counter, method, std::move(argument));
    CorrelationId id = request.id;
    std::weak_ptr<Core> weak = shared_from_this();

    CallRouter::Route route;
    route.on_reply = [controller, weak, id, method](const Envelope& reply) mutable {
        if (reply.hasError()) {
            controller.addError(std::make_exception_ptr(RemoteError(reply.error)));
            return true;
        }
        if (reply.done) {
            controller.close();
            return true;
        }
        try {
            controller.add(payloadAs<std::string>(reply.payload));
        } catch (const ProtocolError&) {
            controller.addError(std::current_exception());
            if (auto core = weak.lock()) {
                core->sendCancel(id, method);
            }
            return true;
        }
        return false;
    };
    route.on_abort = [controller](std::exception_ptr error) mutable {
        controller.addError(error);
    };

    router.add(id, std::move(route));
    controller.setOnCancel([weak, id, method] {
        auto core = weak.lock();
        if (core && core->router.remove(id)) {
            core->sendCancel(id, method);
        }
    });
    if (!router.contains(id)) {
        // Cancelled while registering
        return;
    }
    if (!send(request) && router.remove(id)) {
        controller.addError(std::make_exception_ptr(BridgeError("worker channel closed")));
    }
}

void ServiceProxy::Core::sendCancel(CorrelationId id, Method method) {
    send(Envelope::cancellation(id, method));
}

bool ServiceProxy::Core::send(const Envelope& envelope) {
    SendPort target;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == State::Disposed) {
            return false;
        }
        target = worker_port;
    }
    utils::Logger::getInstance().debug("send " + envelope.toString());
    return target.send(envelope);
}

void ServiceProxy::Core::dispose() {
    std::unique_ptr<ServiceWorker> stopped;
    Promise<void> handshake;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == State::Disposed) {
            return;
        }
        state = State::Disposed;
        stopped = std::move(worker);
        worker_port = SendPort();
        handshake = handshake_promise;
    }

    std::exception_ptr error = disposedError();
    handshake.setException(error);
    size_t outstanding = router.size();
    router.failAll(error);

    if (stopped) {
        stopped->shutdown();
    }
    port->close();
    loop->stop();

    utils::Logger::getInstance().info(
        utils::format("Service proxy '%s' disposed (%zu calls aborted)",
                     config.proxy_name.c_str(), outstanding)
    );
}

ServiceProxy::ServiceProxy(ServiceFactory factory, const BridgeConfig& config)
    : core_(std::make_shared<Core>(std::move(factory), config)) {
    core_->start();
}

ServiceProxy::~ServiceProxy() {
    core_->dispose();
}

Future<void> ServiceProxy::init(const InitParam& param) {
    core_->beginHandshake();
    return call<void>(Method::Init, toPayload(param));
}

Future<void> ServiceProxy::initRuntime(const InitRuntimeParam& param) {
    return call<void>(Method::InitRuntime, toPayload(param));
}

Future<void> ServiceProxy::loadEmbedding(const std::string& path) {
    return call<void>(Method::LoadEmbedding, toPayload(path));
}

Future<std::vector<float>> ServiceProxy::embed(const std::string& text) {
    return call<std::vector<float>>(Method::Embed, toPayload(text));
}

Future<float> ServiceProxy::similarity(const SimilarityParam& param) {
    return call<float>(Method::Similarity, toPayload(param));
}

Future<void> ServiceProxy::setSamplerParam(const SamplerParam& param) {
    return call<void>(Method::SetSamplerParam, toPayload(param));
}

Future<void> ServiceProxy::setPenaltyParam(const PenaltyParam& param) {
    return call<void>(Method::SetPenaltyParam, toPayload(param));
}

Stream<std::string> ServiceProxy::completion(const std::string& prompt) {
    return callStream(Method::Completion, toPayload(prompt));
}

Stream<std::string> ServiceProxy::chat(const std::vector<std::string>& history) {
    return callStream(Method::Chat, toPayload(history));
}

Future<TextGenerationState> ServiceProxy::getGenerationState() {
    return call<TextGenerationState>(Method::GetGenerationState);
}

Future<void> ServiceProxy::setGenerationParam(const GenerationParam& param) {
    return call<void>(Method::SetGenerationParam, toPayload(param));
}

Future<void> ServiceProxy::setImage(const std::string& path) {
    return call<void>(Method::SetImage, toPayload(path));
}

Future<void> ServiceProxy::setAudio(const std::string& path) {
    return call<void>(Method::SetAudio, toPayload(path));
}

Future<void> ServiceProxy::clearState() {
    return call<void>(Method::ClearState);
}

Future<void> ServiceProxy::stop() {
    return call<void>(Method::Stop);
}

Future<Payload> ServiceProxy::callRaw(Method method, Payload argument) {
    Future<void> handshake = core_->handshakeFor(method);
    std::weak_ptr<Core> weak = core_;
    Promise<Payload> promise;

    // Sent once the handshake succeeds; fails with it otherwise
    handshake.onSettled([weak, handshake, promise, method, argument]() mutable {
        try {
            handshake.get();
        } catch (...) {
            promise.setException(std::current_exception());
            return;
        }
        std::shared_ptr<Core> core = weak.lock();
        if (!core) {
            promise.setException(disposedError());
            return;
        }
        core->sendSingle(method, std::move(argument), promise);
    });
    return promise.getFuture();
}

Stream<std::string> ServiceProxy::callStream(Method method, Payload argument) {
    Future<void> handshake = core_->handshakeFor(method);
    std::weak_ptr<Core> weak = core_;
    StreamController<std::string> controller;

    handshake.onSettled([weak, handshake, controller, method, argument]() mutable {
        try {
            handshake.get();
        } catch (...) {
            controller.addError(std::current_exception());
            return;
        }
        std::shared_ptr<Core> core = weak.lock();
        if (!core) {
            controller.addError(disposedError());
            return;
        }
        core->sendStreaming(method, std::move(argument), controller);
    });
    return controller.stream();
}

bool ServiceProxy::isConnected() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->state == Core::State::Ready;
}

size_t ServiceProxy::pendingCalls() const {
    return core_->router.size();
}

} // namespace lmbridge
