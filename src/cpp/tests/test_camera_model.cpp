#include <gtest/gtest.h>

#include "ptzgw/camera_model.hpp"
#include "ptzgw/device_client.hpp"
#include "ptzgw/errors.hpp"

namespace ptzgw {
namespace {

const char* const SOURCE_JSON = R"({
    "uuid": "cam-1",
    "name": "Front Door",
    "description": "Porch",
    "manufacturer": "",
    "model": "",
    "protocol": "rtsp",
    "videoCodec": "h264",
    "resolution": {"width": 1920, "height": 1080},
    "uri": "rtsp://192.168.1.20:554/stream1",
    "authenticationType": "digest",
    "username": "viewer",
    "password": "pw",
    "timeout": 5000,
    "somethingNew": 1
})";

// ---- CameraDescriptor ----

TEST(CameraModelTest, DescriptorFromJson) {
    CameraDescriptor d = CameraDescriptor::from_json(Json::parse(SOURCE_JSON));

    EXPECT_EQ(d.uuid, "cam-1");
    EXPECT_EQ(d.name, "Front Door");
    EXPECT_EQ(d.video_codec, "h264");
    ASSERT_TRUE(d.resolution.has_value());
    EXPECT_EQ(d.resolution->width, 1920);
    EXPECT_EQ(d.resolution->height, 1080);
    EXPECT_EQ(d.uri, "rtsp://192.168.1.20:554/stream1");
    EXPECT_EQ(d.username, "viewer");
    EXPECT_EQ(d.timeout_ms, 5000);
    EXPECT_EQ(d.label(), "Front Door");
}

TEST(CameraModelTest, DescriptorAcceptsIdAlias) {
    CameraDescriptor d = CameraDescriptor::from_json(
        Json::parse(R"({"id": "abc", "uri": "rtsp://h/s"})"));
    EXPECT_EQ(d.uuid, "abc");
    EXPECT_FALSE(d.resolution.has_value());
    EXPECT_EQ(d.label(), "abc");
}

TEST(CameraModelTest, DescriptorRejectsNonObject) {
    EXPECT_THROW(CameraDescriptor::from_json(Json::parse("[1]")), JsonError);
}

// ---- DeviceInfo ----

TEST(CameraModelTest, DeviceInfoNormalizesFieldCase) {
    DeviceInfo pascal = DeviceInfo::from_json(Json::parse(
        R"({"Manufacturer": "Acme", "Model": "X1", "FirmwareVersion": "2.0",
            "SerialNumber": "S1", "HardwareId": "H1"})"));
    EXPECT_EQ(pascal.manufacturer, "Acme");
    EXPECT_EQ(pascal.firmware_version, "2.0");
    EXPECT_EQ(pascal.serial_number, "S1");

    DeviceInfo mixed = DeviceInfo::from_json(Json::parse(
        R"({"serialNumber": "lower", "SerialNumber": "upper", "model": ""})"));
    EXPECT_EQ(mixed.serial_number, "lower");
    EXPECT_EQ(mixed.model, "");
}

// ---- CameraState ----

TEST(CameraModelTest, DescriptorValuesTakePrecedence) {
    CameraDescriptor d;
    d.uuid = "cam-1";
    d.name = "Stage";
    d.model = "Configured";
    DeviceInfo info{"Acme", "PTZ-100", "1.0", "SN", ""};

    CameraState state(d, info, true, {});
    EXPECT_EQ(state.name(), "Stage");
    EXPECT_EQ(state.model(), "Configured");
    EXPECT_EQ(state.manufacturer(), "Acme");
    EXPECT_EQ(state.firmware_version(), "1.0");
}

TEST(CameraModelTest, NameFallsBackToDeviceModel) {
    CameraDescriptor d;
    d.uuid = "cam-1";
    CameraState state(d, DeviceInfo{"Acme", "PTZ-100", "", "", ""}, false, {});
    EXPECT_EQ(state.name(), "PTZ-100");
}

TEST(CameraModelTest, DtoOmitsEmptyStringsAndInternalFields) {
    CameraDescriptor d = CameraDescriptor::from_json(Json::parse(SOURCE_JSON));
    DeviceInfo info{"Acme", "PTZ-100", "", "SN-42", "HW-1"};
    CameraState state(d, info, true, {{"p1", "Door"}});

    Json dto = state.to_dto();
    EXPECT_EQ(dto.get_string("uuid"), "cam-1");
    EXPECT_EQ(dto.get_string("name"), "Front Door");
    EXPECT_EQ(dto.get_string("manufacturer"), "Acme");
    EXPECT_EQ(dto.get_string("serialNumber"), "SN-42");
    EXPECT_FALSE(dto.contains("firmwareVersion"));
    EXPECT_FALSE(dto.contains("error"));
    EXPECT_TRUE(dto.find("ptz")->as_bool());

    const auto& presets = dto.find("presets")->as_array();
    ASSERT_EQ(presets.size(), 1u);
    EXPECT_EQ(presets[0].get_string("token"), "p1");
    EXPECT_EQ(presets[0].get_string("name"), "Door");

    // Descriptor and device internals never leak.
    for (const char* key : {"source", "info", "uri", "username", "password", "hardwareId"}) {
        EXPECT_FALSE(dto.contains(key)) << key;
    }
}

TEST(CameraModelTest, FailureStateCarriesError) {
    CameraDescriptor d;
    d.uuid = "cam-9";
    d.name = "Broken";
    CameraState state = CameraState::from_failure(d, "connection refused");

    EXPECT_FALSE(state.ptz());
    EXPECT_TRUE(state.presets().empty());
    ASSERT_TRUE(state.error().has_value());
    EXPECT_EQ(*state.error(), "connection refused");
    EXPECT_EQ(state.to_json(),
              R"({"error":"connection refused","name":"Broken","presets":[],"ptz":false,"uuid":"cam-9"})");
}

TEST(CameraModelTest, UnrepresentableNumbersReadAsMissing) {
    CameraDescriptor d = CameraDescriptor::from_json(Json::parse(R"({
        "uri": "rtsp://10.0.0.5/stream1",
        "timeout": 1e999,
        "resolution": {"width": 5e9, "height": -1e999}
    })"));
    EXPECT_EQ(d.timeout_ms, 0);
    ASSERT_TRUE(d.resolution.has_value());
    EXPECT_EQ(d.resolution->width, 0);
    EXPECT_EQ(d.resolution->height, 0);
    EXPECT_EQ(DeviceEndpoint::from_descriptor(d).timeout, DEFAULT_DEVICE_TIMEOUT);

    EXPECT_EQ(CameraDescriptor::from_json(Json::parse(R"({"timeout": 5e9})")).timeout_ms, 0);
    EXPECT_EQ(CameraDescriptor::from_json(Json::parse(R"({"timeout": 2.5})")).timeout_ms, 0);
}

// ---- DeviceEndpoint ----

TEST(CameraModelTest, EndpointUsesUriHostAndDescriptorCredentials) {
    CameraDescriptor d = CameraDescriptor::from_json(Json::parse(SOURCE_JSON));
    DeviceEndpoint ep = DeviceEndpoint::from_descriptor(d, "admin", "password");

    EXPECT_EQ(ep.address, "http://192.168.1.20/onvif/device_service");
    EXPECT_EQ(ep.username, "viewer");
    EXPECT_EQ(ep.password, "pw");
    EXPECT_EQ(ep.timeout.count(), 5000);
}

TEST(CameraModelTest, EndpointFallsBackToDefaultCredentials) {
    CameraDescriptor d;
    d.uri = "rtsp://[fe80::2]:554/live";
    DeviceEndpoint ep = DeviceEndpoint::from_descriptor(d, "admin", "password");

    EXPECT_EQ(ep.address, "http://[fe80::2]/onvif/device_service");
    EXPECT_EQ(ep.username, "admin");
    EXPECT_EQ(ep.password, "password");
    EXPECT_EQ(ep.timeout, DEFAULT_DEVICE_TIMEOUT);
}

TEST(CameraModelTest, EndpointRequiresUri) {
    CameraDescriptor d;
    d.name = "No URI";
    EXPECT_THROW(DeviceEndpoint::from_descriptor(d), DeviceError);

    d.uri = "not a url";
    EXPECT_THROW(DeviceEndpoint::from_descriptor(d), DeviceError);
}

} // namespace
} // namespace ptzgw
