#include "lmbridge/rpc/payload.h"

namespace lmbridge {

std::string payloadTypeName(const Payload& payload) {
    if (payload.valueless_by_exception()) {
        return "valueless";
    }
    return std::visit([](const auto& value) -> std::string {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same<V, std::monostate>::value) return "none";
        else if constexpr (std::is_same<V, std::string>::value) return "string";
        else if constexpr (std::is_same<V, std::vector<std::string>>::value) return "string list";
        else if constexpr (std::is_same<V, std::vector<float>>::value) return "float list";
        else if constexpr (std::is_same<V, float>::value) return "float";
        else if constexpr (std::is_same<V, InitParam>::value) return "InitParam";
        else if constexpr (std::is_same<V, InitRuntimeParam>::value) return "InitRuntimeParam";
        else if constexpr (std::is_same<V, SimilarityParam>::value) return "SimilarityParam";
        else if constexpr (std::is_same<V, SamplerParam>::value) return "SamplerParam";
        else if constexpr (std::is_same<V, PenaltyParam>::value) return "PenaltyParam";
        else if constexpr (std::is_same<V, GenerationParam>::value) return "GenerationParam";
        else if constexpr (std::is_same<V, TextGenerationState>::value) return "TextGenerationState";
        else return "SendPort";
    }, payload);
}

} // namespace lmbridge
