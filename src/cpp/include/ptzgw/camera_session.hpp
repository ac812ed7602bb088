#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "camera_model.hpp"
#include "device_client.hpp"
#include "errors.hpp"
#include "speed.hpp"

namespace ptzgw {

/// Device connection or initialization failed. The session stays not-ready.
class DeviceConnectionError : public SessionError {
public:
    DeviceConnectionError(CameraDescriptor descriptor, std::string cause);

    const CameraDescriptor& descriptor() const { return descriptor_; }
    const std::string& cause() const { return cause_; }

private:
    CameraDescriptor descriptor_;
    std::string cause_;
};

enum class SessionState {
    Uninitialized,
    Initializing,
    ReadyPtz,
    ReadyNoPtz,
    Failed,
};

const char* to_string(SessionState state);

/// Notifications raised by CameraSession.
struct CameraEvent {
    enum class Kind {
        Uninitialized,   // descriptor
        Initialized,     // state
        Stop,
        Home,
        Preset,          // token
        Pan,             // pan
        Tilt,            // tilt
        Zoom,            // zoom
        Ptz,             // pan, tilt, zoom
        Error,           // message
    };

    Kind kind;
    std::string token;
    double pan  = 0.0;
    double tilt = 0.0;
    double zoom = 0.0;
    std::string message;
    std::shared_ptr<const CameraState> state;
    const CameraDescriptor* descriptor = nullptr;
};

const char* to_string(CameraEvent::Kind kind);

using CameraEventHandler = std::function<void(const CameraEvent&)>;

/// Owns "the currently controlled camera".
///
/// initialize() connects to a camera and negotiates PTZ support and
/// presets; the command methods translate discrete controller intents
/// into device operations. Every command checks readiness per call and
/// is serialized by a mutex for its whole device round-trip. Failures
/// throw a SessionError subclass and raise an Error event.
///
/// Methods block on device I/O; callers run them off the network thread.
/// Listeners are invoked on the calling thread after the lock is released.
class CameraSession {
public:
    /// Construct with a device client factory and optional fallback
    /// credentials for descriptors that carry none.
    explicit CameraSession(DeviceClientFactory factory,
                           std::string default_username = "",
                           std::string default_password = "",
                           SpeedQuantizer quantizer = SpeedQuantizer());

    ~CameraSession() = default;

    // Non-copyable
    CameraSession(const CameraSession&) = delete;
    CameraSession& operator=(const CameraSession&) = delete;

    /// Register a notification listener. Not thread-safe against emission;
    /// register everything before the first call.
    void add_listener(CameraEventHandler handler);

    // --- Lifecycle ---

    /// Connect to the camera described by `descriptor`, replacing any
    /// current one. Throws DeviceConnectionError on failure and
    /// SupersededError if another initialize() started meanwhile.
    CameraState initialize(const CameraDescriptor& descriptor);

    // --- Commands (READY_PTZ only) ---

    void stop();
    void goto_home();

    /// Recall a preset by token, or by `#<index>` into the cached list.
    void goto_preset(const std::string& token);

    void pan(int level);
    void tilt(int level);
    void zoom(int level);
    void ptz(int pan_level, int tilt_level, int zoom_level);

    // --- Info ---

    SessionState state() const;
    bool is_initialized() const;
    bool is_ptz_supported() const;

    /// Active snapshot, or nullptr when not initialized.
    std::shared_ptr<const CameraState> active_state() const;

private:
    DeviceClientFactory factory_;
    std::string default_username_;
    std::string default_password_;
    SpeedQuantizer quantizer_;
    std::vector<CameraEventHandler> listeners_;

    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    bool initialized_ = false;
    SessionState state_ = SessionState::Uninitialized;
    std::unique_ptr<IDeviceClient> device_;
    std::shared_ptr<const CameraState> active_;

    void emit(const CameraEvent& event) const;
    void emit_error(const std::string& message) const;

    /// Run a device command under the lock after readiness checks.
    /// `action` completes the sentence "Unable to <action>".
    void execute(const std::string& action,
                 const std::function<void(IDeviceClient&)>& command);

    /// Requires mutex_ held.
    IDeviceClient& ready_device(const std::string& action);

    /// Requires mutex_ held.
    std::string resolve_preset(const std::string& token) const;

    void move(const std::string& action, const Velocity& velocity);
};

} // namespace ptzgw
