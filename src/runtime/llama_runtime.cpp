#include "lmbridge/runtime/llama_runtime.h"
#include "lmbridge/common/errors.h"
#include "lmbridge/common/utils.h"

#include "ggml-backend.h"
#include "llama.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace lmbridge {

namespace {

utils::LogLevel toLogLevel(RuntimeLogLevel level) {
    switch (level) {
        case RuntimeLogLevel::Debug:   return utils::LogLevel::DEBUG;
        case RuntimeLogLevel::Info:    return utils::LogLevel::INFO;
        case RuntimeLogLevel::Warning: return utils::LogLevel::WARNING;
        case RuntimeLogLevel::Error:   return utils::LogLevel::ERROR;
    }
    return utils::LogLevel::INFO;
}

// llama.cpp / ggml messages go through the project logger
void forwardLlamaLog(ggml_log_level level, const char* text, void* /*user_data*/) {
    std::string message(text == nullptr ? "" : text);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    if (message.empty()) {
        return;
    }
    switch (level) {
        case GGML_LOG_LEVEL_ERROR:
            utils::Logger::getInstance().error("llama: " + message);
            break;
        case GGML_LOG_LEVEL_WARN:
            utils::Logger::getInstance().warning("llama: " + message);
            break;
        default:
            utils::Logger::getInstance().debug("llama: " + message);
            break;
    }
}

std::vector<llama_token> tokenize(const llama_vocab* vocab, const std::string& text) {
    int n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                           nullptr, 0, true, true);
    if (n < 0) n = -n;
    std::vector<llama_token> tokens(n);
    int written = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()),
                                 tokens.data(), static_cast<int32_t>(tokens.size()), true, true);
    if (written < 0) {
        throw BridgeError("tokenization failed");
    }
    tokens.resize(written);
    return tokens;
}

double perSecond(size_t count, std::chrono::steady_clock::time_point start) {
    double seconds = utils::getElapsedSeconds(start, std::chrono::steady_clock::now());
    return seconds > 0.0 ? count / seconds : 0.0;
}

} // namespace

LlamaRuntime::LlamaRuntime(const RuntimeConfig& config)
    : config_(config)
    , jobs_(std::make_shared<EventLoop>("llama.jobs"))
    , model_(nullptr)
    , ctx_(nullptr)
    , embd_model_(nullptr)
    , embd_ctx_(nullptr)
    , sampler_(SamplerParam::initial())
    , penalty_(PenaltyParam::initial())
    , generation_(GenerationParam::initial())
    , stop_requested_(false)
    , backend_initialized_(false) {
    jobs_->start();
}

LlamaRuntime::~LlamaRuntime() {
    stop_requested_ = true;
    jobs_->stop();
    releaseModels();
    if (backend_initialized_) {
        llama_backend_free();
    }
}

template <typename R>
Future<R> LlamaRuntime::submit(std::function<R()> job) {
    Promise<R> promise;
    bool posted = jobs_->post([promise, job]() mutable {
        try {
            if constexpr (std::is_void<R>::value) {
                job();
                promise.setValue();
            } else {
                promise.setValue(job());
            }
        } catch (...) {
            promise.setException(std::current_exception());
        }
    });
    if (!posted) {
        promise.setException(std::make_exception_ptr(BridgeError("llama runtime stopped")));
    }
    return promise.getFuture();
}

Future<void> LlamaRuntime::init(const InitParam& param) {
    utils::Logger::getInstance().setLogLevel(toLogLevel(param.log_level));
    llama_log_set(forwardLlamaLog, nullptr);

    if (!backend_initialized_) {
        if (param.dynamic_lib_dir.empty()) {
            ggml_backend_load_all();
        } else {
            ggml_backend_load_all_from_path(param.dynamic_lib_dir.c_str());
        }
        llama_backend_init();
        backend_initialized_ = true;
    }

    utils::Logger::getInstance().info(
        utils::format("llama.cpp runtime initialized (%zu backend devices)",
                     ggml_backend_dev_count())
    );
    return makeReadyFuture();
}

Future<void> LlamaRuntime::initRuntime(const InitRuntimeParam& param) {
    if (param.backend != Backend::LlamaCpp) {
        return makeFailedFuture<void>(std::make_exception_ptr(ConfigError(
            "backend not supported by the llama runtime: " + backendArgument(param.backend))));
    }
    if (!param.tokenizer_path.empty()) {
        utils::Logger::getInstance().debug(
            "Ignoring tokenizer path, the GGUF model carries its vocabulary: " + param.tokenizer_path
        );
    }
    std::string path = param.model_path;
    return submit<void>([this, path] { loadModel(path); });
}

Future<void> LlamaRuntime::loadEmbedding(const std::string& path) {
    return submit<void>([this, path] { loadEmbeddingModel(path); });
}

Future<std::vector<float>> LlamaRuntime::embed(const std::string& text) {
    return submit<std::vector<float>>([this, text] { return computeEmbedding(text); });
}

Future<float> LlamaRuntime::similarity(const SimilarityParam& param) {
    if (param.a.empty() || param.a.size() != param.b.size()) {
        return makeFailedFuture<float>(std::make_exception_ptr(BridgeError(
            utils::format("similarity needs two vectors of equal size (got %zu and %zu)",
                         param.a.size(), param.b.size()))));
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < param.a.size(); ++i) {
        dot += static_cast<double>(param.a[i]) * param.b[i];
        norm_a += static_cast<double>(param.a[i]) * param.a[i];
        norm_b += static_cast<double>(param.b[i]) * param.b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return makeReadyFuture(0.0f);
    }
    return makeReadyFuture(static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b))));
}

Future<void> LlamaRuntime::setSamplerParam(const SamplerParam& param) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    sampler_ = param;
    return makeReadyFuture();
}

Future<void> LlamaRuntime::setPenaltyParam(const PenaltyParam& param) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    penalty_ = param;
    return makeReadyFuture();
}

Future<void> LlamaRuntime::setGenerationParam(const GenerationParam& param) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    generation_ = param;
    return makeReadyFuture();
}

Stream<std::string> LlamaRuntime::completion(const std::string& prompt) {
    return startGeneration(prompt, false);
}

Stream<std::string> LlamaRuntime::chat(const std::vector<std::string>& history) {
    GenerationParam param = GenerationParam::initial();
    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        param = generation_;
    }
    return startGeneration(formatChat(history, param), true);
}

std::string LlamaRuntime::formatChat(const std::vector<std::string>& history,
                                     const GenerationParam& param) {
    std::string prompt = param.prompt;
    for (size_t i = 0; i < history.size(); ++i) {
        prompt += (i % 2 == 0) ? "User: " : "Assistant: ";
        prompt += history[i];
        prompt += "\n\n";
    }
    prompt += "Assistant:";
    if (param.chat_reasoning) {
        prompt += param.thinking_token;
    }
    return prompt;
}

Future<TextGenerationState> LlamaRuntime::getGenerationState() {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return makeReadyFuture(state_.copyWith(std::nullopt, std::nullopt, std::nullopt,
                                           std::nullopt, utils::nowMs()));
}

Future<void> LlamaRuntime::setImage(const std::string& path) {
    return makeFailedFuture<void>(std::make_exception_ptr(BridgeError(
        "setImage is not supported by the text-only llama runtime: " + path)));
}

Future<void> LlamaRuntime::setAudio(const std::string& path) {
    return makeFailedFuture<void>(std::make_exception_ptr(BridgeError(
        "setAudio is not supported by the text-only llama runtime: " + path)));
}

Future<void> LlamaRuntime::clearState() {
    return submit<void>([this] {
        if (ctx_ != nullptr) {
            llama_memory_clear(llama_get_memory(ctx_), true);
        }
    });
}

Future<void> LlamaRuntime::stop() {
    stop_requested_ = true;
    return makeReadyFuture();
}

Stream<std::string> LlamaRuntime::startGeneration(std::string prompt, bool is_chat) {
    // A stop() from here on applies to this generation
    stop_requested_ = false;
    StreamController<std::string> out;
    bool posted = jobs_->post([this, prompt, is_chat, out] {
        generate(prompt, is_chat, out);
    });
    if (!posted) {
        out.addError(std::make_exception_ptr(BridgeError("llama runtime stopped")));
    }
    return out.stream();
}

void LlamaRuntime::loadModel(const std::string& path) {
    auto start = std::chrono::steady_clock::now();
    utils::Logger::getInstance().info("Loading model " + path);

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;
    model_params.use_mmap = config_.use_mmap;
    model_params.use_mlock = config_.use_mlock;

    llama_model* model = llama_model_load_from_file(path.c_str(), model_params);
    if (model == nullptr) {
        throw BridgeError("failed to load model: " + path);
    }

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_batch = config_.n_batch;
    ctx_params.n_threads = config_.num_threads;
    ctx_params.n_threads_batch = config_.num_threads;

    llama_context* ctx = llama_init_from_model(model, ctx_params);
    if (ctx == nullptr) {
        llama_model_free(model);
        throw BridgeError("failed to create context for model: " + path);
    }

    if (ctx_ != nullptr) llama_free(ctx_);
    if (model_ != nullptr) llama_model_free(model_);
    model_ = model;
    ctx_ = ctx;

    auto end = std::chrono::steady_clock::now();
    utils::Logger::getInstance().info(
        utils::format("Model loaded in %.2f ms (n_ctx=%u, vocab=%d)",
                     utils::getElapsedMs(start, end), llama_n_ctx(ctx_),
                     llama_vocab_n_tokens(llama_model_get_vocab(model_)))
    );
}

void LlamaRuntime::loadEmbeddingModel(const std::string& path) {
    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;
    model_params.use_mmap = config_.use_mmap;

    llama_model* model = llama_model_load_from_file(path.c_str(), model_params);
    if (model == nullptr) {
        throw BridgeError("failed to load embedding model: " + path);
    }

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.embedding_n_ctx;
    ctx_params.n_batch = config_.embedding_n_ctx;
    ctx_params.n_ubatch = config_.embedding_n_ctx;
    ctx_params.n_threads = config_.num_threads;
    ctx_params.embeddings = true;
    ctx_params.pooling_type = LLAMA_POOLING_TYPE_MEAN;

    llama_context* ctx = llama_init_from_model(model, ctx_params);
    if (ctx == nullptr) {
        llama_model_free(model);
        throw BridgeError("failed to create embedding context: " + path);
    }

    if (embd_ctx_ != nullptr) llama_free(embd_ctx_);
    if (embd_model_ != nullptr) llama_model_free(embd_model_);
    embd_model_ = model;
    embd_ctx_ = ctx;

    utils::Logger::getInstance().info(
        utils::format("Embedding model loaded: %s (n_embd=%d)",
                     path.c_str(), llama_model_n_embd(embd_model_))
    );
}

std::vector<float> LlamaRuntime::computeEmbedding(const std::string& text) {
    if (embd_ctx_ == nullptr) {
        throw BridgeError("embedding model not loaded: call loadEmbedding first");
    }

    std::vector<llama_token> tokens = tokenize(llama_model_get_vocab(embd_model_), text);
    int limit = static_cast<int>(llama_n_ctx(embd_ctx_));
    if (static_cast<int>(tokens.size()) > limit) {
        utils::Logger::getInstance().warning(
            utils::format("Embedding input truncated from %zu to %d tokens", tokens.size(), limit)
        );
        tokens.resize(limit);
    }
    if (tokens.empty()) {
        throw BridgeError("nothing to embed");
    }

    llama_memory_clear(llama_get_memory(embd_ctx_), true);
    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    int rc = (llama_model_has_encoder(embd_model_) && !llama_model_has_decoder(embd_model_))
        ? llama_encode(embd_ctx_, batch)
        : llama_decode(embd_ctx_, batch);
    if (rc != 0) {
        throw BridgeError(utils::format("embedding evaluation failed (%d)", rc));
    }

    const float* pooled = llama_get_embeddings_seq(embd_ctx_, 0);
    if (pooled == nullptr) {
        throw BridgeError("embedding model produced no pooled embedding");
    }
    int n_embd = llama_model_n_embd(embd_model_);
    return std::vector<float>(pooled, pooled + n_embd);
}

llama_sampler* LlamaRuntime::buildSampler(const SamplerParam& sampler,
                                          const PenaltyParam& penalty) const {
    llama_sampler_chain_params chain_params = llama_sampler_chain_default_params();
    llama_sampler* chain = llama_sampler_chain_init(chain_params);

    // The decay factor sets the window of tokens the penalties look at
    int window = 64;
    if (penalty.penalty_decay > 0.0f && penalty.penalty_decay < 1.0f) {
        window = static_cast<int>(std::lround(1.0 / (1.0 - penalty.penalty_decay)));
    }
    llama_sampler_chain_add(chain, llama_sampler_init_penalties(
        window, 1.0f, penalty.frequency_penalty, penalty.presence_penalty));

    if (sampler.temperature <= 0.0f) {
        llama_sampler_chain_add(chain, llama_sampler_init_greedy());
        return chain;
    }
    if (sampler.top_k > 0) {
        llama_sampler_chain_add(chain, llama_sampler_init_top_k(sampler.top_k));
    }
    llama_sampler_chain_add(chain, llama_sampler_init_top_p(sampler.top_p, 1));
    llama_sampler_chain_add(chain, llama_sampler_init_temp(sampler.temperature));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(config_.seed));
    return chain;
}

std::string LlamaRuntime::tokenToPiece(const llama_vocab* vocab, int token) const {
    char buf[256];
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, true);
    if (n >= 0) {
        return std::string(buf, n);
    }
    std::string piece(-n, '\0');
    n = llama_token_to_piece(vocab, token, &piece[0], static_cast<int32_t>(piece.size()), 0, true);
    if (n < 0) {
        return std::string();
    }
    piece.resize(n);
    return piece;
}

void LlamaRuntime::generate(const std::string& prompt, bool is_chat,
                            StreamController<std::string> out) {
    if (out.isCancelled()) {
        return;
    }
    if (ctx_ == nullptr) {
        out.addError(std::make_exception_ptr(
            BridgeError("runtime not initialized: call initRuntime first")));
        return;
    }

    SamplerParam sampler_param = SamplerParam::initial();
    PenaltyParam penalty_param = PenaltyParam::initial();
    GenerationParam generation = GenerationParam::initial();
    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        sampler_param = sampler_;
        penalty_param = penalty_;
        generation = generation_;
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_);
    const int n_ctx = static_cast<int>(llama_n_ctx(ctx_));

    try {
        std::vector<llama_token> tokens = tokenize(vocab, prompt);
        if (tokens.empty()) {
            throw BridgeError("empty prompt");
        }
        if (static_cast<int>(tokens.size()) >= n_ctx) {
            throw BridgeError(utils::format("prompt of %zu tokens does not fit the context (%d)",
                                            tokens.size(), n_ctx));
        }

        llama_memory_clear(llama_get_memory(ctx_), true);
        publishState(TextGenerationState().copyWith(true, 0.0));

        // Prefill in chunks of n_batch tokens
        auto prefill_start = std::chrono::steady_clock::now();
        const size_t chunk = static_cast<size_t>(std::max(1, config_.n_batch));
        for (size_t pos = 0; pos < tokens.size(); pos += chunk) {
            if (stop_requested_ || out.isCancelled()) {
                break;
            }
            size_t n = std::min(chunk, tokens.size() - pos);
            llama_batch batch = llama_batch_get_one(tokens.data() + pos, static_cast<int32_t>(n));
            if (llama_decode(ctx_, batch) != 0) {
                throw BridgeError("llama_decode failed during prefill");
            }
            publishState(TextGenerationState().copyWith(
                true, static_cast<double>(pos + n) / tokens.size(),
                perSecond(pos + n, prefill_start)));
        }
        double prefill_speed = perSecond(tokens.size(), prefill_start);

        std::unique_ptr<llama_sampler, void (*)(llama_sampler*)> sampler(
            buildSampler(sampler_param, penalty_param), llama_sampler_free);

        auto decode_start = std::chrono::steady_clock::now();
        int n_past = static_cast<int>(tokens.size());
        int generated = 0;
        while (generated < generation.max_tokens && !stop_requested_ && !out.isCancelled()) {
            llama_token token = llama_sampler_sample(sampler.get(), ctx_, -1);
            if (llama_vocab_is_eog(vocab, token)) {
                break;
            }
            if (!is_chat && generation.completion_stop_token != 0 &&
                token == generation.completion_stop_token) {
                break;
            }

            ++generated;
            std::string piece = tokenToPiece(vocab, token);
            if (!piece.empty()) {
                out.add(piece);
            }

            if (n_past + 1 >= n_ctx) {
                utils::Logger::getInstance().warning("Context full, generation truncated");
                break;
            }
            llama_batch batch = llama_batch_get_one(&token, 1);
            if (llama_decode(ctx_, batch) != 0) {
                throw BridgeError("llama_decode failed during generation");
            }
            ++n_past;

            publishState(TextGenerationState().copyWith(
                true, 1.0, prefill_speed, perSecond(generated, decode_start)));
        }

        double decode_speed = perSecond(generated, decode_start);
        publishState(TextGenerationState().copyWith(false, 1.0, prefill_speed, decode_speed));
        utils::Logger::getInstance().info(
            utils::format("Generated %d tokens (prefill %.2f tok/s, decode %.2f tok/s)%s",
                         generated, prefill_speed, decode_speed,
                         stop_requested_ ? " [stopped]" : "")
        );
        out.close();
    } catch (const std::exception& e) {
        publishState(TextGenerationState());
        utils::Logger::getInstance().error(utils::format("Generation failed: %s", e.what()));
        out.addError(std::current_exception());
    }
}

void LlamaRuntime::publishState(const TextGenerationState& state) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    state_ = state.copyWith(std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                            utils::nowMs());
}

void LlamaRuntime::releaseModels() {
    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_ != nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
    }
    if (embd_ctx_ != nullptr) {
        llama_free(embd_ctx_);
        embd_ctx_ = nullptr;
    }
    if (embd_model_ != nullptr) {
        llama_model_free(embd_model_);
        embd_model_ = nullptr;
    }
}

} // namespace lmbridge
