#include "ptzgw/camera_session.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace ptzgw {

DeviceConnectionError::DeviceConnectionError(CameraDescriptor descriptor,
                                             std::string cause)
    : SessionError("Unable to initialize camera '" + descriptor.label() +
                   "': " + cause)
    , descriptor_(std::move(descriptor))
    , cause_(std::move(cause)) {
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::ReadyPtz:      return "ready_ptz";
        case SessionState::ReadyNoPtz:    return "ready_no_ptz";
        case SessionState::Failed:        return "failed";
    }
    return "unknown";
}

const char* to_string(CameraEvent::Kind kind) {
    switch (kind) {
        case CameraEvent::Kind::Uninitialized: return "uninitialized";
        case CameraEvent::Kind::Initialized:   return "initialized";
        case CameraEvent::Kind::Stop:          return "stop";
        case CameraEvent::Kind::Home:          return "home";
        case CameraEvent::Kind::Preset:        return "preset";
        case CameraEvent::Kind::Pan:           return "pan";
        case CameraEvent::Kind::Tilt:          return "tilt";
        case CameraEvent::Kind::Zoom:          return "zoom";
        case CameraEvent::Kind::Ptz:           return "ptz";
        case CameraEvent::Kind::Error:         return "error";
    }
    return "unknown";
}

CameraSession::CameraSession(DeviceClientFactory factory,
                             std::string default_username,
                             std::string default_password,
                             SpeedQuantizer quantizer)
    : factory_(std::move(factory))
    , default_username_(std::move(default_username))
    , default_password_(std::move(default_password))
    , quantizer_(quantizer) {
}

void CameraSession::add_listener(CameraEventHandler handler) {
    listeners_.push_back(std::move(handler));
}

void CameraSession::emit(const CameraEvent& event) const {
    for (const auto& listener : listeners_) {
        listener(event);
    }
}

void CameraSession::emit_error(const std::string& message) const {
    CameraEvent event{CameraEvent::Kind::Error};
    event.message = message;
    emit(event);
}

// --- Lifecycle ---

CameraState CameraSession::initialize(const CameraDescriptor& descriptor) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation   = ++generation_;
        device_.reset();
        active_.reset();
        initialized_ = false;
        state_       = SessionState::Initializing;
    }

    CameraEvent uninitialized{CameraEvent::Kind::Uninitialized};
    uninitialized.descriptor = &descriptor;
    emit(uninitialized);

    const std::string superseded_message =
        "Initialization of camera '" + descriptor.label() +
        "' was superseded by a newer one";

    // Connect outside the lock so a newer initialize() can take over.
    std::unique_ptr<IDeviceClient> device;
    DeviceInfo info;
    bool ptz = false;
    std::vector<Preset> presets;
    try {
        DeviceEndpoint endpoint = DeviceEndpoint::from_descriptor(
            descriptor, default_username_, default_password_);
        device = factory_(endpoint);
        if (!device) {
            throw DeviceError("no device client available for " + endpoint.address);
        }
        info = device->init();
        ptz  = device->has_ptz();
        if (ptz) {
            presets = device->get_presets();
        }
    } catch (const DeviceError& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                throw SupersededError(superseded_message);
            }
            state_ = SessionState::Failed;
        }
        DeviceConnectionError error(descriptor, e.what());
        emit_error(error.what());
        throw error;
    }

    auto state = std::make_shared<const CameraState>(
        descriptor, std::move(info), ptz, std::move(presets));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            throw SupersededError(superseded_message);
        }
        device_      = std::move(device);
        active_      = state;
        initialized_ = true;
        state_       = ptz ? SessionState::ReadyPtz : SessionState::ReadyNoPtz;
    }

    CameraEvent initialized{CameraEvent::Kind::Initialized};
    initialized.state = state;
    emit(initialized);
    return *state;
}

// --- Commands ---

IDeviceClient& CameraSession::ready_device(const std::string& action) {
    if (!initialized_ || !device_ || !active_) {
        throw NotReadyError("Unable to " + action +
                            "; the camera is not initialized.");
    }
    if (!active_->ptz()) {
        throw UnsupportedError("Unable to " + action +
                               "; the camera does not support PTZ.");
    }
    return *device_;
}

void CameraSession::execute(const std::string& action,
                            const std::function<void(IDeviceClient&)>& command) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        IDeviceClient& device = ready_device(action);
        try {
            command(device);
        } catch (const DeviceError& e) {
            throw DeviceCommandError("Unable to " + action + ": " + e.what());
        }
    } catch (const SessionError& e) {
        emit_error(e.what());
        throw;
    }
}

std::string CameraSession::resolve_preset(const std::string& token) const {
    if (token.empty()) {
        throw InvalidPresetError("Unable to recall camera preset; empty preset token.");
    }
    if (token.front() != '#') {
        return token;
    }

    const std::string digits = token.substr(1);
    const bool numeric = !digits.empty() &&
        std::all_of(digits.begin(), digits.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
        throw InvalidPresetError(
            "Unable to recall camera preset; invalid preset index: " + token);
    }

    std::size_t index = 0;
    try {
        index = std::stoul(digits);
    } catch (const std::out_of_range&) {
        throw InvalidPresetError(
            "Unable to recall camera preset; invalid preset index: " + token);
    }

    const auto& presets = active_->presets();
    if (index >= presets.size()) {
        throw InvalidPresetError(
            "Unable to recall camera preset; invalid preset index: " + token);
    }
    return presets[index].token;
}

void CameraSession::stop() {
    execute("stop camera movement", [](IDeviceClient& device) {
        device.stop();
    });
    emit(CameraEvent{CameraEvent::Kind::Stop});
}

void CameraSession::goto_home() {
    execute("recall camera home", [](IDeviceClient& device) {
        device.goto_home();
    });
    emit(CameraEvent{CameraEvent::Kind::Home});
}

void CameraSession::goto_preset(const std::string& token) {
    std::string resolved;
    execute("recall camera preset", [&](IDeviceClient& device) {
        resolved = resolve_preset(token);
        device.goto_preset(resolved, Velocity{PRESET_SPEED, PRESET_SPEED, PRESET_SPEED});
    });

    CameraEvent event{CameraEvent::Kind::Preset};
    event.token = resolved;
    emit(event);
}

void CameraSession::move(const std::string& action, const Velocity& velocity) {
    execute(action, [&velocity](IDeviceClient& device) {
        device.continuous_move(velocity, CONTINUOUS_MOVE_TIMEOUT);
    });
}

void CameraSession::pan(int level) {
    double value = quantizer_.quantize(Axis::Pan, level);
    move("pan camera", Velocity{value, 0.0, 0.0});

    CameraEvent event{CameraEvent::Kind::Pan};
    event.pan = value;
    emit(event);
}

void CameraSession::tilt(int level) {
    double value = quantizer_.quantize(Axis::Tilt, level);
    move("tilt camera", Velocity{0.0, value, 0.0});

    CameraEvent event{CameraEvent::Kind::Tilt};
    event.tilt = value;
    emit(event);
}

void CameraSession::zoom(int level) {
    double value = quantizer_.quantize(Axis::Zoom, level);
    move("zoom camera", Velocity{0.0, 0.0, value});

    CameraEvent event{CameraEvent::Kind::Zoom};
    event.zoom = value;
    emit(event);
}

void CameraSession::ptz(int pan_level, int tilt_level, int zoom_level) {
    Velocity velocity{
        quantizer_.quantize(Axis::Pan, pan_level),
        quantizer_.quantize(Axis::Tilt, tilt_level),
        quantizer_.quantize(Axis::Zoom, zoom_level),
    };
    move("move camera", velocity);

    CameraEvent event{CameraEvent::Kind::Ptz};
    event.pan  = velocity.x;
    event.tilt = velocity.y;
    event.zoom = velocity.z;
    emit(event);
}

// --- Info ---

SessionState CameraSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CameraSession::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool CameraSession::is_ptz_supported() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && active_->ptz();
}

std::shared_ptr<const CameraState> CameraSession::active_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace ptzgw
