#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lmbridge {

// Whether an operation answers with one value or with a sequence of values
enum class CallKind : uint8_t {
    Single,
    Streaming
};

// The service contract: one row per operation.
//   X(enumerator, wire name, call kind)
// Both the proxy's request encoder and the worker's registry builder are
// generated from this table.
#define LMBRIDGE_CONTRACT(X)                                   \
    X(Init,               "init",               Single)        \
    X(InitRuntime,        "initRuntime",        Single)        \
    X(LoadEmbedding,      "loadEmbedding",      Single)        \
    X(Embed,              "embed",              Single)        \
    X(Similarity,         "similarity",         Single)        \
    X(Completion,         "completion",         Streaming)     \
    X(Chat,               "chat",               Streaming)     \
    X(SetSamplerParam,    "setSamplerParam",    Single)        \
    X(SetPenaltyParam,    "setPenaltyParam",    Single)        \
    X(SetGenerationParam, "setGenerationParam", Single)        \
    X(GetGenerationState, "getGenerationState", Single)        \
    X(SetImage,           "setImage",           Single)        \
    X(SetAudio,           "setAudio",           Single)        \
    X(ClearState,         "clearState",         Single)        \
    X(Stop,               "stop",               Single)

enum class Method : uint16_t {
#define LMBRIDGE_METHOD_ENUM(name, wire, kind) name,
    LMBRIDGE_CONTRACT(LMBRIDGE_METHOD_ENUM)
#undef LMBRIDGE_METHOD_ENUM
};

#define LMBRIDGE_METHOD_COUNT(name, wire, kind) +1
constexpr size_t kMethodCount = 0 LMBRIDGE_CONTRACT(LMBRIDGE_METHOD_COUNT);
#undef LMBRIDGE_METHOD_COUNT

// Every contract operation, in table order
extern const std::array<Method, kMethodCount> kAllMethods;

// Stable wire name ("embed", "completion", ...); "method#<n>" for values
// outside the contract
std::string methodName(Method method);

// Kind declared by the contract; nullopt for values outside the contract
std::optional<CallKind> methodKind(Method method);

// Reverse lookup of methodName
std::optional<Method> methodFromName(const std::string& name);

bool isContractMethod(Method method);

} // namespace lmbridge
