#pragma once

#include "lmbridge/common/config.h"
#include "lmbridge/rpc/method.h"
#include "lmbridge/rpc/payload.h"
#include "lmbridge/service/inference_service.h"

#include <memory>
#include <string>
#include <vector>

namespace lmbridge {

// Proxy endpoint
// Implements the service contract by forwarding every call to a ServiceWorker
// running the real service on its own thread. init() spawns the worker and
// performs the bootstrap handshake; calls made while the handshake is running
// are sent once it completes. Results are delivered on the proxy's event loop.
class ServiceProxy : public InferenceService {
public:
    explicit ServiceProxy(ServiceFactory factory, const BridgeConfig& config = BridgeConfig());

    // Fails every outstanding call with BridgeError("service proxy disposed"),
    // then destroys the real service on the worker thread
    ~ServiceProxy() override;

    ServiceProxy(const ServiceProxy&) = delete;
    ServiceProxy& operator=(const ServiceProxy&) = delete;

    Future<void> init(const InitParam& param) override;
    Future<void> initRuntime(const InitRuntimeParam& param) override;
    Future<void> loadEmbedding(const std::string& path) override;
    Future<std::vector<float>> embed(const std::string& text) override;
    Future<float> similarity(const SimilarityParam& param) override;
    Future<void> setSamplerParam(const SamplerParam& param) override;
    Future<void> setPenaltyParam(const PenaltyParam& param) override;
    Stream<std::string> completion(const std::string& prompt) override;
    Stream<std::string> chat(const std::vector<std::string>& history) override;
    Future<TextGenerationState> getGenerationState() override;
    Future<void> setGenerationParam(const GenerationParam& param) override;
    Future<void> setImage(const std::string& path) override;
    Future<void> setAudio(const std::string& path) override;
    Future<void> clearState() override;
    Future<void> stop() override;

    // Invoke `method` by identifier and convert the single reply to R.
    // A reply of another shape fails the call with ProtocolError.
    template <typename R>
    Future<R> call(Method method, Payload argument = Payload());

    // Invoke a streaming method by identifier
    Stream<std::string> callStream(Method method, Payload argument);

    // Handshake completed and not disposed
    bool isConnected() const;

    // Calls waiting for a reply
    size_t pendingCalls() const;

private:
    struct Core;

    Future<Payload> callRaw(Method method, Payload argument);

    std::shared_ptr<Core> core_;
};

template <typename R>
Future<R> ServiceProxy::call(Method method, Payload argument) {
    Future<Payload> raw = callRaw(method, std::move(argument));
    Promise<R> promise;
    raw.onSettled([raw, promise]() mutable {
        try {
            if constexpr (std::is_void<R>::value) {
                raw.get();
                promise.setValue();
            } else {
                promise.setValue(payloadAs<R>(raw.get()));
            }
        } catch (...) {
            promise.setException(std::current_exception());
        }
    });
    return promise.getFuture();
}

} // namespace lmbridge
