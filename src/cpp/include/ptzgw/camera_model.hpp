#pragma once

#include <optional>
#include <string>
#include <vector>

#include "json.hpp"

namespace ptzgw {

struct Resolution {
    int width  = 0;
    int height = 0;
};

/// Identity and connection facts for a camera as known by the control
/// plane. Decoded from the `alexa.source` payload; never mutated.
struct CameraDescriptor {
    std::string uuid;
    std::string name;
    std::string description;
    std::string manufacturer;
    std::string model;
    std::string protocol;
    std::string video_codec;
    std::string audio_codec;
    std::optional<Resolution> resolution;
    std::string uri;
    std::string authentication_type;
    std::string username;
    std::string password;
    int timeout_ms = 0;   // 0 = not supplied

    /// Decode from a JSON object. Unknown keys are ignored.
    /// `id` is accepted when `uuid` is absent.
    static CameraDescriptor from_json(const Json& json);

    /// Human-readable label for logs: name, else uuid, else uri.
    std::string label() const;
};

/// Facts reported by the device when the connection is initialized.
struct DeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string firmware_version;
    std::string serial_number;
    std::string hardware_id;

    /// Accepts both lowerCamel (`serialNumber`) and Pascal
    /// (`SerialNumber`) field names; lowerCamel wins when non-empty.
    static DeviceInfo from_json(const Json& json);
};

struct Preset {
    std::string token;
    std::string name;

    bool operator==(const Preset& other) const {
        return token == other.token && name == other.name;
    }
};

/// Read-only snapshot of the controlled camera.
///
/// Descriptor values take precedence over device values for
/// name/manufacturer/model. A new initialization produces a new
/// CameraState; instances are never modified after construction.
class CameraState {
public:
    /// Snapshot of a successful initialization.
    CameraState(CameraDescriptor source, DeviceInfo info, bool ptz,
                std::vector<Preset> presets);

    /// Degraded snapshot describing a failed initialization.
    static CameraState from_failure(CameraDescriptor source, std::string error);

    const std::string& uuid() const { return uuid_; }
    const std::string& name() const { return name_; }
    const std::string& manufacturer() const { return manufacturer_; }
    const std::string& model() const { return model_; }
    const std::string& firmware_version() const { return firmware_version_; }
    const std::string& serial_number() const { return serial_number_; }
    bool ptz() const { return ptz_; }
    const std::vector<Preset>& presets() const { return presets_; }
    const std::optional<std::string>& error() const { return error_; }

    /// Underlying control-plane descriptor (internal, not serialized).
    const CameraDescriptor& source() const { return source_; }

    /// Underlying device info (internal, not serialized).
    const DeviceInfo& info() const { return info_; }

    /// Public fields only, as a flat JSON object. Empty strings omitted.
    Json to_dto() const;

    std::string to_json() const { return to_dto().dump(); }

private:
    CameraDescriptor source_;
    DeviceInfo info_;

    std::string uuid_;
    std::string name_;
    std::string manufacturer_;
    std::string model_;
    std::string firmware_version_;
    std::string serial_number_;
    bool ptz_ = false;
    std::vector<Preset> presets_;
    std::optional<std::string> error_;
};

} // namespace ptzgw
