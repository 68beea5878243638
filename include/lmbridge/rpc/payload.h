#pragma once

#include "lmbridge/common/errors.h"
#include "lmbridge/common/types.h"
#include "lmbridge/transport/send_port.h"

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace lmbridge {

// Every argument and result shape the contract moves across the channel
using Payload = std::variant<
    std::monostate,                         // No argument / no result
    std::string,                            // Text, file paths, generated fragments
    std::vector<std::string>,               // Chat history
    std::vector<float>,                     // Embeddings
    float,                                  // Similarity score
    InitParam,
    InitRuntimeParam,
    SimilarityParam,
    SamplerParam,
    PenaltyParam,
    GenerationParam,
    TextGenerationState,
    SendPort                                // Bootstrap handshake only
>;

// Human-readable name of the alternative held by a payload
std::string payloadTypeName(const Payload& payload);

inline bool isEmptyPayload(const Payload& payload) {
    return std::holds_alternative<std::monostate>(payload);
}

// Extract a T from a payload. `void` accepts any payload.
// Throws ProtocolError when the payload holds another alternative.
template <typename T>
T payloadAs(const Payload& payload) {
    if constexpr (std::is_void<T>::value) {
        return;
    } else {
        const T* value = std::get_if<T>(&payload);
        if (value == nullptr) {
            throw ProtocolError("unexpected payload type " + payloadTypeName(payload));
        }
        return *value;
    }
}

template <typename T>
Payload toPayload(T value) {
    return Payload(std::move(value));
}

} // namespace lmbridge
