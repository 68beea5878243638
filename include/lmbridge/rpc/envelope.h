#pragma once

#include "lmbridge/rpc/method.h"
#include "lmbridge/rpc/payload.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace lmbridge {

// Correlation ID type
using CorrelationId = uint64_t;

// Reserved id of the bootstrap handshake envelope
constexpr CorrelationId kBootstrapId = 0;

// Error text of a failure that carried no description
constexpr const char* kUnknownError = "unknown error";

// Per-proxy source of correlation ids (1, 2, 3, ...)
class CorrelationCounter {
public:
    CorrelationCounter() : next_(kBootstrapId + 1) {}

    CorrelationId next() { return next_.fetch_add(1); }

private:
    std::atomic<CorrelationId> next_;
};

// One message on the channel: a request, one reply of a reply stream, the
// bootstrap handshake, or a cancellation.
struct Envelope {
    CorrelationId id;                       // Shared by a request and all of its replies
    Method method;                          // Operation invoked or answered
    Payload payload;                        // Argument (request) or result (reply)
    std::string error;                      // Non-empty: the call failed, terminal
    bool done;                              // Final envelope of a reply stream
    bool cancel;                            // Control: stop the call with this id

    Envelope()
        : id(kBootstrapId)
        , method(Method::Init)
        , done(false)
        , cancel(false)
    {}

    Envelope(CorrelationId cid, Method m, Payload p)
        : id(cid)
        , method(m)
        , payload(std::move(p))
        , done(false)
        , cancel(false)
    {}

    // New request with a fresh correlation id
    static Envelope request(CorrelationCounter& counter, Method method,
                            Payload payload = Payload());

    // Handshake envelope carrying the sender's own send capability
    static Envelope bootstrap(SendPort port);

    // Ask the worker to stop producing replies for `id`
    static Envelope cancellation(CorrelationId id, Method method);

    bool isBootstrap() const { return id == kBootstrapId; }
    bool hasError() const { return !error.empty(); }
    bool isTerminal() const { return done || hasError(); }

    // Copies keep id and method; used to stamp replies.
    // withError never produces an empty error (falls back to kUnknownError).
    Envelope withPayload(Payload value) const;
    Envelope withError(std::string description) const;
    Envelope finished() const;

    std::string toString() const;
};

} // namespace lmbridge
