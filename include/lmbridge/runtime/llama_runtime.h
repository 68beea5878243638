#pragma once

#include "lmbridge/common/config.h"
#include "lmbridge/service/inference_service.h"
#include "lmbridge/transport/event_loop.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations
struct llama_model;
struct llama_context;
struct llama_vocab;
struct llama_sampler;

namespace lmbridge {

// Inference engine on llama.cpp
// Model loading, embedding and generation run on the runtime's own job
// thread, one job at a time; the calling thread is never blocked by them.
class LlamaRuntime : public InferenceService {
public:
    explicit LlamaRuntime(const RuntimeConfig& config = RuntimeConfig());
    ~LlamaRuntime() override;

    LlamaRuntime(const LlamaRuntime&) = delete;
    LlamaRuntime& operator=(const LlamaRuntime&) = delete;

    // Sets the log level and loads the ggml backends
    Future<void> init(const InitParam& param) override;

    // Only Backend::LlamaCpp is accepted; the GGUF file carries the tokenizer
    Future<void> initRuntime(const InitRuntimeParam& param) override;

    Future<void> loadEmbedding(const std::string& path) override;
    Future<std::vector<float>> embed(const std::string& text) override;

    // Cosine similarity of two embeddings of equal size
    Future<float> similarity(const SimilarityParam& param) override;

    Future<void> setSamplerParam(const SamplerParam& param) override;
    Future<void> setPenaltyParam(const PenaltyParam& param) override;
    Future<void> setGenerationParam(const GenerationParam& param) override;

    // Stream decoded pieces until max_tokens, an end-of-generation token,
    // stop() or cancellation of the stream
    Stream<std::string> completion(const std::string& prompt) override;
    Stream<std::string> chat(const std::vector<std::string>& history) override;

    Future<TextGenerationState> getGenerationState() override;

    // Text-only runtime: both fail
    Future<void> setImage(const std::string& path) override;
    Future<void> setAudio(const std::string& path) override;

    // Clear the KV memory of the generation context
    Future<void> clearState() override;

    Future<void> stop() override;

    // Prompt sent to the model for a chat history
    static std::string formatChat(const std::vector<std::string>& history,
                                  const GenerationParam& param);

private:
    template <typename R>
    Future<R> submit(std::function<R()> job);

    Stream<std::string> startGeneration(std::string prompt, bool is_chat);

    // Job thread only
    void loadModel(const std::string& path);
    void loadEmbeddingModel(const std::string& path);
    std::vector<float> computeEmbedding(const std::string& text);
    void generate(const std::string& prompt, bool is_chat, StreamController<std::string> out);
    llama_sampler* buildSampler(const SamplerParam& sampler, const PenaltyParam& penalty) const;
    std::string tokenToPiece(const llama_vocab* vocab, int token) const;
    void releaseModels();

    void publishState(const TextGenerationState& state);

    RuntimeConfig config_;
    std::shared_ptr<EventLoop> jobs_;

    // Owned by the job thread
    llama_model* model_;
    llama_context* ctx_;
    llama_model* embd_model_;
    llama_context* embd_ctx_;

    // Parameters, read by the job thread at the start of each generation
    mutable std::mutex params_mutex_;
    SamplerParam sampler_;
    PenaltyParam penalty_;
    GenerationParam generation_;
    TextGenerationState state_;

    std::atomic<bool> stop_requested_;
    bool backend_initialized_;
};

} // namespace lmbridge
