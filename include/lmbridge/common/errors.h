#pragma once

#include <stdexcept>
#include <string>

namespace lmbridge {

// Base class of every failure raised by the bridge
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& what) : std::runtime_error(what) {}
};

// The worker context did not complete the bootstrap handshake
class HandshakeError : public BridgeError {
public:
    explicit HandshakeError(const std::string& what) : BridgeError(what) {}
};

// The real service failed; carries the flattened remote description
class RemoteError : public BridgeError {
public:
    explicit RemoteError(const std::string& what) : BridgeError(what) {}
};

// An envelope could not be interpreted (payload of the wrong shape, ...)
class ProtocolError : public BridgeError {
public:
    explicit ProtocolError(const std::string& what) : BridgeError(what) {}
};

// Invalid configuration value (unknown backend, unsupported option, ...)
class ConfigError : public BridgeError {
public:
    explicit ConfigError(const std::string& what) : BridgeError(what) {}
};

} // namespace lmbridge
