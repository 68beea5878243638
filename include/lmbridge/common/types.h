#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lmbridge {

// Log level requested by the caller of InferenceService::init
enum class RuntimeLogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Inference backends an engine can be built on
enum class Backend {
    Ncnn,       // Small puzzle models on Android, Windows and Linux
    LlamaCpp,   // Android, Windows, Linux and macOS
    WebRwkv,    // WebGPU runtime, iOS and macOS
    Qnn,        // Qualcomm Neural Network
    Mnn,        // Alternate generic runtime
    CoreMl      // Apple CoreML
};

// Command-line spelling of a backend ("llama.cpp", "web-rwkv", ...)
std::string backendArgument(Backend backend);

// Case-insensitive substring match; throws ConfigError on unknown values
Backend parseBackend(const std::string& value);

struct InitParam {
    std::string dynamic_lib_dir;            // Where backend libraries live (empty = default search)
    RuntimeLogLevel log_level;

    InitParam()
        : dynamic_lib_dir("")
        , log_level(RuntimeLogLevel::Debug)
    {}
};

struct InitRuntimeParam {
    std::string model_path;
    std::string tokenizer_path;
    Backend backend;

    InitRuntimeParam()
        : backend(Backend::LlamaCpp)
    {}

    InitRuntimeParam(std::string model, std::string tokenizer, Backend b)
        : model_path(std::move(model))
        , tokenizer_path(std::move(tokenizer))
        , backend(b)
    {}
};

struct SamplerParam {
    float temperature;                      // 0.0 ~ 3.0
    int top_k;                              // 0 ~ 128
    float top_p;                            // 0.0 ~ 1.0

    SamplerParam(float temp, int topk, float topp)
        : temperature(temp)
        , top_k(topk)
        , top_p(topp)
    {}

    static SamplerParam initial() { return SamplerParam(1.0f, 1, 0.5f); }
};

struct PenaltyParam {
    float presence_penalty;                 // 0.0 ~ 2.0
    float frequency_penalty;                // 0.0 ~ 2.0
    float penalty_decay;                    // 0.990 ~ 0.999

    PenaltyParam(float presence, float frequency, float decay)
        : presence_penalty(presence)
        , frequency_penalty(frequency)
        , penalty_decay(decay)
    {}

    static PenaltyParam initial() { return PenaltyParam(0.5f, 0.5f, 0.996f); }
};

struct GenerationParam {
    static const char* const kPromptThinking;
    static const char* const kPromptNoThinkingEN;
    static const char* const kPromptNoThinkingCN;

    static const char* const kThinkingTokenNone;
    static const char* const kThinkingTokenLight;
    static const char* const kThinkingTokenFree;
    static const char* const kThinkingTokenZh;

    int max_tokens;                         // Upper bound of generated tokens per call
    bool chat_reasoning;                    // Append thinking_token after the assistant tag
    int completion_stop_token;              // Token id that ends a completion (0 = none)
    std::string thinking_token;
    std::string prompt;                     // Prefix placed before the chat history

    GenerationParam(int max_tok, std::string thinking, bool reasoning,
                    int stop_token, std::string prefix)
        : max_tokens(max_tok)
        , chat_reasoning(reasoning)
        , completion_stop_token(stop_token)
        , thinking_token(std::move(thinking))
        , prompt(std::move(prefix))
    {}

    static GenerationParam initial();

    GenerationParam copyWith(std::optional<int> max_tok = std::nullopt,
                             std::optional<bool> reasoning = std::nullopt,
                             std::optional<std::string> thinking = std::nullopt,
                             std::optional<int> stop_token = std::nullopt,
                             std::optional<std::string> prefix = std::nullopt) const;
};

// Snapshot of the engine's text generation progress
struct TextGenerationState {
    bool is_generating;
    double prefill_progress;                // 0.0 ~ 1.0
    double prefill_speed;                   // Prompt tokens per second
    double decode_speed;                    // Generated tokens per second
    int64_t timestamp;                      // Milliseconds since epoch of the snapshot

    TextGenerationState()
        : is_generating(false)
        , prefill_progress(0.0)
        , prefill_speed(0.0)
        , decode_speed(0.0)
        , timestamp(0)
    {}

    static TextGenerationState initial() { return TextGenerationState(); }

    TextGenerationState copyWith(std::optional<bool> generating = std::nullopt,
                                 std::optional<double> progress = std::nullopt,
                                 std::optional<double> prefill = std::nullopt,
                                 std::optional<double> decode = std::nullopt,
                                 std::optional<int64_t> ts = std::nullopt) const;
};

struct SimilarityParam {
    std::vector<float> a;
    std::vector<float> b;

    SimilarityParam() {}
    SimilarityParam(std::vector<float> lhs, std::vector<float> rhs)
        : a(std::move(lhs))
        , b(std::move(rhs))
    {}
};

} // namespace lmbridge
