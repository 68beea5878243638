#include "lmbridge/common/types.h"
#include "lmbridge/common/errors.h"

#include <algorithm>
#include <cctype>

namespace lmbridge {

const char* const GenerationParam::kPromptThinking = "<EOD>";

const char* const GenerationParam::kPromptNoThinkingEN =
    "<EOD>User: hi\n\n"
    "Assistant: Hi. I am your assistant and I will provide expert full response in full details. "
    "Please feel free to ask any question and I will always answer it.\n\n";

const char* const GenerationParam::kPromptNoThinkingCN =
    "<EOD>User: \xe4\xbd\xa0\xe5\xa5\xbd\n\n"
    "Assistant: \xe4\xbd\xa0\xe5\xa5\xbd\xef\xbc\x8c\xe6\x88\x91\xe6\x98\xaf\xe4\xbd\xa0\xe7\x9a\x84"
    "\xe5\x8a\xa9\xe6\x89\x8b\xef\xbc\x8c\xe6\x88\x91\xe4\xbc\x9a\xe6\x8f\x90\xe4\xbe\x9b\xe4\xb8\x93"
    "\xe5\xae\xb6\xe7\xba\xa7\xe7\x9a\x84\xe5\xae\x8c\xe6\x95\xb4\xe5\x9b\x9e\xe7\xad\x94\xe3\x80\x82"
    "\xe8\xaf\xb7\xe9\x9a\x8f\xe6\x97\xb6\xe6\x8f\x90\xe9\x97\xae\xef\xbc\x8c\xe6\x88\x91\xe4\xbc\x9a"
    "\xe4\xb8\x80\xe7\x9b\xb4\xe5\x9b\x9e\xe7\xad\x94\xe3\x80\x82\n\n";

const char* const GenerationParam::kThinkingTokenNone = "";
const char* const GenerationParam::kThinkingTokenLight = "<think>\\n</think>";
const char* const GenerationParam::kThinkingTokenFree = "<think>";
const char* const GenerationParam::kThinkingTokenZh = "<think>\xe5\x97\xaf";

std::string backendArgument(Backend backend) {
    switch (backend) {
        case Backend::Ncnn:     return "ncnn";
        case Backend::LlamaCpp: return "llama.cpp";
        case Backend::WebRwkv:  return "web-rwkv";
        case Backend::Qnn:      return "qnn";
        case Backend::Mnn:      return "mnn";
        case Backend::CoreMl:   return "coreml";
    }
    return "unknown";
}

Backend parseBackend(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto has = [&lower](const char* needle) {
        return lower.find(needle) != std::string::npos;
    };

    // First match wins
    if (has("ncnn")) return Backend::Ncnn;
    if (has("web") && has("rwkv")) return Backend::WebRwkv;
    if (has("llama")) return Backend::LlamaCpp;
    if (has("qnn")) return Backend::Qnn;
    if (has("mnn")) return Backend::Mnn;
    if (has("coreml")) return Backend::CoreMl;
    throw ConfigError("Unknown backend: " + value);
}

GenerationParam GenerationParam::initial() {
    return GenerationParam(2000, kThinkingTokenNone, false, 0, kPromptThinking);
}

GenerationParam GenerationParam::copyWith(std::optional<int> max_tok,
                                          std::optional<bool> reasoning,
                                          std::optional<std::string> thinking,
                                          std::optional<int> stop_token,
                                          std::optional<std::string> prefix) const {
    return GenerationParam(max_tok.value_or(max_tokens),
                           thinking.value_or(thinking_token),
                           reasoning.value_or(chat_reasoning),
                           stop_token.value_or(completion_stop_token),
                           prefix.value_or(prompt));
}

TextGenerationState TextGenerationState::copyWith(std::optional<bool> generating,
                                                  std::optional<double> progress,
                                                  std::optional<double> prefill,
                                                  std::optional<double> decode,
                                                  std::optional<int64_t> ts) const {
    TextGenerationState state;
    state.is_generating = generating.value_or(is_generating);
    state.prefill_progress = progress.value_or(prefill_progress);
    state.prefill_speed = prefill.value_or(prefill_speed);
    state.decode_speed = decode.value_or(decode_speed);
    state.timestamp = ts.value_or(timestamp);
    return state;
}

} // namespace lmbridge
