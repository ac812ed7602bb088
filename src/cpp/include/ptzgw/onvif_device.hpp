#pragma once

#include <string>
#include <vector>

#include "device_client.hpp"

namespace ptzgw {

/// IDeviceClient speaking ONVIF (SOAP 1.2 over HTTP).
///
/// init() queries device information and capabilities, then picks the
/// first media profile for PTZ requests. Requests carry a WS-Security
/// UsernameToken digest when the endpoint has a username. Each request
/// is bounded by the endpoint timeout.
class OnvifDevice : public IDeviceClient {
public:
    explicit OnvifDevice(DeviceEndpoint endpoint);

    DeviceInfo init() override;
    bool has_ptz() const override;
    std::vector<Preset> get_presets() override;
    void continuous_move(const Velocity& velocity, int timeout_seconds) override;
    void goto_preset(const std::string& token, const Velocity& speed) override;
    void goto_home() override;
    void stop() override;

    const DeviceEndpoint& endpoint() const { return endpoint_; }
    const std::string& ptz_address() const { return ptz_address_; }
    const std::string& profile_token() const { return profile_token_; }

    /// Factory producing OnvifDevice instances.
    static DeviceClientFactory factory();

private:
    DeviceEndpoint endpoint_;
    std::string media_address_;
    std::string ptz_address_;
    std::string profile_token_;

    /// POST `body` wrapped in a SOAP envelope; returns the response XML.
    std::string call(const std::string& address, const std::string& body) const;

    void require_ptz(const char* operation) const;
};

namespace onvif {

struct Capabilities {
    std::string media_address;
    std::string ptz_address;
};

// --- Response parsing (throw DeviceError on malformed XML) ---

DeviceInfo parse_device_information(const std::string& xml);

Capabilities parse_capabilities(const std::string& xml);

/// Media profile tokens, in document order.
std::vector<std::string> parse_profiles(const std::string& xml);

std::vector<Preset> parse_presets(const std::string& xml);

/// Throw DeviceError carrying the fault reason if `xml` is a SOAP fault.
void check_fault(const std::string& xml);

// --- Request building ---

/// base64(SHA1(nonce + created + password)) per the UsernameToken profile.
std::string password_digest(const std::string& nonce, const std::string& created,
                            const std::string& password);

/// Complete SOAP 1.2 envelope. The security header is omitted when
/// `username` is empty.
std::string envelope(const std::string& body, const std::string& username,
                     const std::string& password);

std::string xml_escape(const std::string& text);

} // namespace onvif

} // namespace ptzgw
