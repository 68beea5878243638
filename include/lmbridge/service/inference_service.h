#pragma once

#include "lmbridge/async/future.h"
#include "lmbridge/async/stream.h"
#include "lmbridge/common/config.h"
#include "lmbridge/common/types.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lmbridge {

// Inference engine contract
// Implemented identically by engines running in the caller's context and by
// ServiceProxy, which forwards every call to an engine on a worker thread.
class InferenceService {
public:
    virtual ~InferenceService() = default;

    // Must be called before any other method
    virtual Future<void> init(const InitParam& param) = 0;

    // Initialize the backend runtime, load and initialize the model
    virtual Future<void> initRuntime(const InitRuntimeParam& param) = 0;

    virtual Future<void> loadEmbedding(const std::string& path) = 0;

    virtual Future<std::vector<float>> embed(const std::string& text) = 0;

    virtual Future<float> similarity(const SimilarityParam& param) = 0;

    virtual Future<void> setSamplerParam(const SamplerParam& param) = 0;

    virtual Future<void> setPenaltyParam(const PenaltyParam& param) = 0;

    virtual Stream<std::string> completion(const std::string& prompt) = 0;

    virtual Stream<std::string> chat(const std::vector<std::string>& history) = 0;

    virtual Future<TextGenerationState> getGenerationState() = 0;

    virtual Future<void> setGenerationParam(const GenerationParam& param) = 0;

    virtual Future<void> setImage(const std::string& path) = 0;

    virtual Future<void> setAudio(const std::string& path) = 0;

    // Clear the backend runtime state
    virtual Future<void> clearState() = 0;

    // Interrupt the running generation
    virtual Future<void> stop() = 0;
};

// Builds the engine instance; the isolated variant calls it on the worker thread
using ServiceFactory = std::function<std::unique_ptr<InferenceService>()>;

// Engine running in the caller's context
std::unique_ptr<InferenceService> createLocalService(const ServiceFactory& factory);

// Engine running on its own worker thread behind a ServiceProxy
std::unique_ptr<InferenceService> createIsolatedService(ServiceFactory factory,
                                                        const BridgeConfig& config = BridgeConfig());

} // namespace lmbridge
