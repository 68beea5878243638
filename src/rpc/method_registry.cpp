#include "lmbridge/rpc/method_registry.h"
#include "lmbridge/service/inference_service.h"

#include <stdexcept>

namespace lmbridge {

CallResult CallResult::immediate(Payload value) {
    CallResult result;
    result.shape = Shape::Immediate;
    result.value = std::move(value);
    return result;
}

CallResult CallResult::async(Future<Payload> future) {
    CallResult result;
    result.shape = Shape::Async;
    result.future = std::move(future);
    return result;
}

CallResult CallResult::streaming(Stream<Payload> stream) {
    CallResult result;
    result.shape = Shape::Streaming;
    result.stream = std::move(stream);
    return result;
}

MethodRegistry::Builder& MethodRegistry::Builder::add(Method method, CallKind kind,
                                                      MethodHandler handler) {
    if (entries_.count(method) > 0) {
        throw std::logic_error("method bound twice: " + methodName(method));
    }
    entries_.emplace(method, Entry{kind, std::move(handler)});
    return *this;
}

MethodRegistry MethodRegistry::Builder::build() {
    return MethodRegistry(std::move(entries_));
}

namespace {

template <typename R>
MethodHandler bindCall(InferenceService& service, Method,
                       Future<R> (InferenceService::*fn)()) {
    return [&service, fn](const Payload&) {
        return fromFuture((service.*fn)());
    };
}

template <typename A, typename R>
MethodHandler bindCall(InferenceService& service, Method method,
                       Future<R> (InferenceService::*fn)(const A&)) {
    return [&service, method, fn](const Payload& argument) {
        return fromFuture((service.*fn)(argumentAs<A>(method, argument)));
    };
}

template <typename A, typename T>
MethodHandler bindStream(InferenceService& service, Method method,
                         Stream<T> (InferenceService::*fn)(const A&)) {
    return [&service, method, fn](const Payload& argument) {
        return fromStream((service.*fn)(argumentAs<A>(method, argument)));
    };
}

} // namespace

MethodRegistry MethodRegistry::forService(InferenceService& service) {
    using S = InferenceService;
    Builder builder;
    builder
        .add(Method::Init, CallKind::Single, bindCall(service, Method::Init, &S::init))
        .add(Method::InitRuntime, CallKind::Single,
             bindCall(service, Method::InitRuntime, &S::initRuntime))
        .add(Method::LoadEmbedding, CallKind::Single,
             bindCall(service, Method::LoadEmbedding, &S::loadEmbedding))
        .add(Method::Embed, CallKind::Single, bindCall(service, Method::Embed, &S::embed))
        .add(Method::Similarity, CallKind::Single,
             bindCall(service, Method::Similarity, &S::similarity))
        .add(Method::Completion, CallKind::Streaming,
             bindStream(service, Method::Completion, &S::completion))
        .add(Method::Chat, CallKind::Streaming, bindStream(service, Method::Chat, &S::chat))
        .add(Method::SetSamplerParam, CallKind::Single,
             bindCall(service, Method::SetSamplerParam, &S::setSamplerParam))
        .add(Method::SetPenaltyParam, CallKind::Single,
             bindCall(service, Method::SetPenaltyParam, &S::setPenaltyParam))
        .add(Method::SetGenerationParam, CallKind::Single,
             bindCall(service, Method::SetGenerationParam, &S::setGenerationParam))
        .add(Method::GetGenerationState, CallKind::Single,
             bindCall(service, Method::GetGenerationState, &S::getGenerationState))
        .add(Method::SetImage, CallKind::Single,
             bindCall(service, Method::SetImage, &S::setImage))
        .add(Method::SetAudio, CallKind::Single,
             bindCall(service, Method::SetAudio, &S::setAudio))
        .add(Method::ClearState, CallKind::Single,
             bindCall(service, Method::ClearState, &S::clearState))
        .add(Method::Stop, CallKind::Single, bindCall(service, Method::Stop, &S::stop));

    MethodRegistry registry = builder.build();

    // Every row of the contract table must be bound with its declared kind
    for (Method method : kAllMethods) {
        if (registry.kindOf(method) != methodKind(method)) {
            throw std::logic_error("contract method not bound correctly: " + methodName(method));
        }
    }
    return registry;
}

const MethodRegistry::Entry* MethodRegistry::find(Method method) const {
    auto it = entries_.find(method);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<CallKind> MethodRegistry::kindOf(Method method) const {
    const Entry* entry = find(method);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->kind;
}

} // namespace lmbridge
