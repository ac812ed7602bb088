#include "ptzgw/camera_model.hpp"

#include <initializer_list>
#include <utility>

namespace ptzgw {

namespace {

/// First non-empty string member among the given keys.
std::string first_of(const Json& json, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        std::string value = json.get_string(key);
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

/// Integer member, or 0 when missing, fractional or outside int range.
int int_member(const Json& json, const std::string& key) {
    const Json* value = json.find(key);
    if (!value || !value->is_number()) {
        return 0;
    }
    try {
        return value->as_int();
    } catch (const JsonError&) {
        return 0;
    }
}

const std::string& prefer(const std::string& primary, const std::string& fallback) {
    return primary.empty() ? fallback : primary;
}

} // anonymous namespace

// --- CameraDescriptor ---

CameraDescriptor CameraDescriptor::from_json(const Json& json) {
    if (!json.is_object()) {
        throw JsonError("camera descriptor must be a JSON object");
    }

    CameraDescriptor d;
    d.uuid                = first_of(json, {"uuid", "id"});
    d.name                = json.get_string("name");
    d.description         = json.get_string("description");
    d.manufacturer        = json.get_string("manufacturer");
    d.model               = json.get_string("model");
    d.protocol            = json.get_string("protocol");
    d.video_codec         = json.get_string("videoCodec");
    d.audio_codec         = json.get_string("audioCodec");
    d.uri                 = json.get_string("uri");
    d.authentication_type = json.get_string("authenticationType");
    d.username            = json.get_string("username");
    d.password            = json.get_string("password");
    d.timeout_ms          = int_member(json, "timeout");

    if (const Json* res = json.find("resolution"); res != nullptr && res->is_object()) {
        Resolution r;
        r.width  = int_member(*res, "width");
        r.height = int_member(*res, "height");
        d.resolution = r;
    }
    return d;
}

std::string CameraDescriptor::label() const {
    if (!name.empty()) return name;
    if (!uuid.empty()) return uuid;
    return uri;
}

// --- DeviceInfo ---

DeviceInfo DeviceInfo::from_json(const Json& json) {
    DeviceInfo info;
    if (!json.is_object()) {
        return info;
    }
    info.manufacturer     = first_of(json, {"manufacturer", "Manufacturer"});
    info.model            = first_of(json, {"model", "Model"});
    info.firmware_version = first_of(json, {"firmwareVersion", "FirmwareVersion"});
    info.serial_number    = first_of(json, {"serialNumber", "SerialNumber"});
    info.hardware_id      = first_of(json, {"hardwareId", "HardwareId"});
    return info;
}

// --- CameraState ---

CameraState::CameraState(CameraDescriptor source, DeviceInfo info, bool ptz,
                         std::vector<Preset> presets)
    : source_(std::move(source))
    , info_(std::move(info))
    , ptz_(ptz)
    , presets_(std::move(presets)) {
    uuid_             = source_.uuid;
    serial_number_    = info_.serial_number;
    firmware_version_ = info_.firmware_version;
    name_             = prefer(source_.name, info_.model);
    manufacturer_     = prefer(source_.manufacturer, info_.manufacturer);
    model_            = prefer(source_.model, info_.model);
}

CameraState CameraState::from_failure(CameraDescriptor source, std::string error) {
    CameraState state(std::move(source), DeviceInfo{}, false, {});
    state.error_ = std::move(error);
    return state;
}

Json CameraState::to_dto() const {
    Json dto = Json::Object{};
    auto put = [&dto](const char* key, const std::string& value) {
        if (!value.empty()) {
            dto[key] = value;
        }
    };

    put("uuid", uuid_);
    put("name", name_);
    put("manufacturer", manufacturer_);
    put("model", model_);
    put("firmwareVersion", firmware_version_);
    put("serialNumber", serial_number_);
    dto["ptz"] = ptz_;

    Json::Array presets;
    for (const auto& preset : presets_) {
        Json item = Json::Object{};
        item["token"] = preset.token;
        item["name"]  = preset.name;
        presets.push_back(std::move(item));
    }
    dto["presets"] = std::move(presets);

    if (error_) {
        dto["error"] = *error_;
    }
    return dto;
}

} // namespace ptzgw
