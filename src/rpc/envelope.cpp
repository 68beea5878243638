#include "lmbridge/rpc/envelope.h"

#include <sstream>

namespace lmbridge {

Envelope Envelope::request(CorrelationCounter& counter, Method method, Payload payload) {
    return Envelope(counter.next(), method, std::move(payload));
}

Envelope Envelope::bootstrap(SendPort port) {
    // The method field is not interpreted for the handshake
    return Envelope(kBootstrapId, Method::Init, Payload(std::move(port)));
}

Envelope Envelope::cancellation(CorrelationId id, Method method) {
    Envelope envelope(id, method, Payload());
    envelope.cancel = true;
    return envelope;
}

Envelope Envelope::withPayload(Payload value) const {
    Envelope copy(id, method, std::move(value));
    return copy;
}

Envelope Envelope::withError(std::string description) const {
    Envelope copy(id, method, Payload());
    // An empty error would read as success
    copy.error = description.empty() ? std::string(kUnknownError) : std::move(description);
    return copy;
}

Envelope Envelope::finished() const {
    Envelope copy(id, method, Payload());
    copy.done = true;
    return copy;
}

std::string Envelope::toString() const {
    std::ostringstream out;
    out << "Envelope{id: " << id
        << ", method: " << methodName(method)
        << ", payload: " << payloadTypeName(payload)
        << ", done: " << (done ? "true" : "false");
    if (cancel) {
        out << ", cancel: true";
    }
    if (hasError()) {
        out << ", error: " << error;
    }
    out << "}";
    return out.str();
}

} // namespace lmbridge
