#include "ptzgw/device_client.hpp"

#include "ptzgw/url.hpp"

namespace ptzgw {

DeviceEndpoint DeviceEndpoint::from_descriptor(const CameraDescriptor& descriptor,
                                               const std::string& default_username,
                                               const std::string& default_password) {
    if (descriptor.uri.empty()) {
        throw DeviceError("Camera '" + descriptor.label() + "' has no URI");
    }

    Url uri;
    try {
        uri = parse_url(descriptor.uri);
    } catch (const GatewayError& e) {
        throw DeviceError("Camera '" + descriptor.label() + "' has an invalid URI: " +
                          e.what());
    }

    DeviceEndpoint endpoint;
    // The stream URI port belongs to RTSP, not the device service.
    std::string host = uri.host.find(':') != std::string::npos
                           ? "[" + uri.host + "]" : uri.host;
    endpoint.address = "http://" + host + ONVIF_DEVICE_SERVICE_PATH;

    if (!descriptor.username.empty()) {
        endpoint.username = descriptor.username;
        endpoint.password = descriptor.password;
    } else {
        endpoint.username = default_username;
        endpoint.password = default_password;
    }

    if (descriptor.timeout_ms > 0) {
        endpoint.timeout = std::chrono::milliseconds(descriptor.timeout_ms);
    }
    return endpoint;
}

} // namespace ptzgw
