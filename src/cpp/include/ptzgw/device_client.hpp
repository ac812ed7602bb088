#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "camera_model.hpp"
#include "constants.hpp"
#include "errors.hpp"

namespace ptzgw {

/// Per-axis velocity in the device range -1.0..1.0.
struct Velocity {
    double x = 0.0;   // pan
    double y = 0.0;   // tilt
    double z = 0.0;   // zoom
};

/// Where and how to reach a camera's device service.
struct DeviceEndpoint {
    std::string address;    // e.g. http://10.0.0.5/onvif/device_service
    std::string username;
    std::string password;
    std::chrono::milliseconds timeout = DEFAULT_DEVICE_TIMEOUT;

    /// Derive the endpoint from a descriptor's URI host. Descriptor
    /// credentials win; the given defaults fill in when they are empty.
    /// Throws DeviceError if the URI has no host.
    static DeviceEndpoint from_descriptor(const CameraDescriptor& descriptor,
                                          const std::string& default_username = "",
                                          const std::string& default_password = "");
};

/// Abstract interface for device-protocol operations.
/// Enables dependency injection and test mocking.
///
/// Every method may block on network I/O and throws DeviceError on failure.
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    /// Connect and query device information and capabilities.
    virtual DeviceInfo init() = 0;

    /// True once init() found a PTZ service and a media profile.
    virtual bool has_ptz() const = 0;

    /// Presets stored on the device, in device order.
    virtual std::vector<Preset> get_presets() = 0;

    /// Start moving; the device stops on its own after `timeout_seconds`.
    virtual void continuous_move(const Velocity& velocity, int timeout_seconds) = 0;

    virtual void goto_preset(const std::string& token, const Velocity& speed) = 0;

    virtual void goto_home() = 0;

    /// Stop pan, tilt and zoom.
    virtual void stop() = 0;
};

/// Creates an uninitialized device client for an endpoint.
using DeviceClientFactory =
    std::function<std::unique_ptr<IDeviceClient>(const DeviceEndpoint&)>;

} // namespace ptzgw
