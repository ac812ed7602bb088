#pragma once

#include <stdexcept>
#include <string>

namespace ptzgw {

/// Root of every error raised by the gateway.
class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed JSON text, or a JSON value of the wrong type.
class JsonError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Missing or invalid configuration. Fatal at startup.
class ConfigError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// A controller command line that could not be parsed.
class ProtocolError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Raised by device clients when a request to the camera fails.
class DeviceError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// --- CameraSession errors ---

/// Base for every failure reported by CameraSession.
class SessionError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// A command was issued before a successful initialization.
/// Transient: retry once the camera is ready.
class NotReadyError : public SessionError {
public:
    using SessionError::SessionError;
};

/// A command was issued against a camera without PTZ support.
/// Permanent for that camera.
class UnsupportedError : public SessionError {
public:
    using SessionError::SessionError;
};

/// A preset index or token could not be resolved. Never sent to the device.
class InvalidPresetError : public SessionError {
public:
    using SessionError::SessionError;
};

/// The device rejected or failed an in-flight command.
class DeviceCommandError : public SessionError {
public:
    using SessionError::SessionError;
};

/// An initialization finished after a newer one had started.
class SupersededError : public SessionError {
public:
    using SessionError::SessionError;
};

} // namespace ptzgw
