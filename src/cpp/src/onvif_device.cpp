#include "ptzgw/onvif_device.hpp"

#include <array>
#include <ctime>
#include <initializer_list>
#include <sstream>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <spdlog/spdlog.h>

#include "ptzgw/url.hpp"

namespace ptzgw {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace pt    = boost::property_tree;
using tcp       = net::ip::tcp;

namespace {

const char* const NS_SOAP   = "http://www.w3.org/2003/05/soap-envelope";
const char* const NS_DEVICE = "http://www.onvif.org/ver10/device/wsdl";
const char* const NS_MEDIA  = "http://www.onvif.org/ver10/media/wsdl";
const char* const NS_PTZ    = "http://www.onvif.org/ver20/ptz/wsdl";
const char* const NS_SCHEMA = "http://www.onvif.org/ver10/schema";
const char* const NS_WSSE   =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd";
const char* const NS_WSU    =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd";
const char* const PASSWORD_DIGEST_TYPE =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest";
const char* const BASE64_ENCODING_TYPE =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary";

constexpr std::size_t NONCE_SIZE = 16;

// --- XML helpers ---

/// Element name without its namespace prefix.
std::string local_name(const std::string& name) {
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

const pt::ptree* find_child(const pt::ptree& node, const std::string& name) {
    for (const auto& [key, child] : node) {
        if (local_name(key) == name) {
            return &child;
        }
    }
    return nullptr;
}

/// Depth-first search for the first element called `name`.
const pt::ptree* find_descendant(const pt::ptree& node, const std::string& name) {
    for (const auto& [key, child] : node) {
        if (key == "<xmlattr>") continue;
        if (local_name(key) == name) {
            return &child;
        }
        if (const pt::ptree* found = find_descendant(child, name)) {
            return found;
        }
    }
    return nullptr;
}

std::string child_text(const pt::ptree& node, const std::string& name) {
    const pt::ptree* child = find_child(node, name);
    return child ? child->data() : std::string();
}

std::string attribute(const pt::ptree& node, const std::string& name) {
    return node.get<std::string>("<xmlattr>." + name, "");
}

pt::ptree read_document(const std::string& xml) {
    pt::ptree tree;
    std::istringstream in(xml);
    try {
        pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        throw DeviceError(std::string("Malformed response from device: ") + e.what());
    }
    return tree;
}

const pt::ptree& require_element(const pt::ptree& tree, const std::string& name) {
    const pt::ptree* node = find_descendant(tree, name);
    if (!node) {
        throw DeviceError("Device response is missing " + name);
    }
    return *node;
}

// --- Encoding ---

std::string base64_encode(const unsigned char* data, std::size_t size) {
    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string random_nonce() {
    std::array<unsigned char, NONCE_SIZE> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw DeviceError("Unable to generate WS-Security nonce");
    }
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string vector_xml(const char* element, const Velocity& v) {
    std::ostringstream ss;
    ss << "<tptz:" << element << ">"
       << "<tt:PanTilt x=\"" << v.x << "\" y=\"" << v.y << "\"/>"
       << "<tt:Zoom x=\"" << v.z << "\"/>"
       << "</tptz:" << element << ">";
    return ss.str();
}

std::string profile_xml(const std::string& token) {
    return "<tptz:ProfileToken>" + onvif::xml_escape(token) + "</tptz:ProfileToken>";
}

// --- Transport ---

/// POST `body` to `address`, bounded by `timeout` overall.
std::string http_post(const std::string& address, const std::string& body,
                      std::chrono::milliseconds timeout) {
    Url url;
    try {
        url = parse_url(address);
    } catch (const GatewayError& e) {
        throw DeviceError(std::string("Invalid device address: ") + e.what());
    }
    if (url.scheme != "http") {
        throw DeviceError("Unsupported device address scheme: " + address);
    }

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.authority());
    req.set(http::field::user_agent, std::string("ptz-gateway ") + BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/soap+xml; charset=utf-8");
    req.body() = body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result;
    std::string stage = "resolve";

    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { result = ec; return; }
            stage = "connect";
            stream.async_connect(results,
                [&](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                    if (ec) { result = ec; return; }
                    stage = "write";
                    http::async_write(stream, req,
                        [&](beast::error_code ec, std::size_t) {
                            if (ec) { result = ec; return; }
                            stage = "read";
                            http::async_read(stream, buffer, res,
                                [&](beast::error_code ec, std::size_t) {
                                    result = ec;
                                });
                        });
                });
        });

    ioc.run_for(timeout);
    if (!ioc.stopped()) {
        throw DeviceError("Request to " + address + " timed out during " + stage);
    }
    if (result) {
        throw DeviceError("Request to " + address + " failed during " + stage + ": " +
                          result.message());
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (res.result() != http::status::ok) {
        // Faults arrive as HTTP 4xx/5xx; report the device's reason when present.
        if (res.body().find("Fault") != std::string::npos) {
            onvif::check_fault(res.body());
        }
        throw DeviceError("Request to " + address + " returned HTTP " +
                          std::to_string(res.result_int()));
    }
    return res.body();
}

} // anonymous namespace

// --- onvif ---

namespace onvif {

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

std::string password_digest(const std::string& nonce, const std::string& created,
                            const std::string& password) {
    std::string input = nonce + created + password;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha1(), nullptr) != 1) {
        throw DeviceError("Unable to compute WS-Security password digest");
    }
    return base64_encode(digest, length);
}

std::string envelope(const std::string& body, const std::string& username,
                     const std::string& password) {
    std::ostringstream ss;
    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
       << "<s:Envelope xmlns:s=\"" << NS_SOAP << "\""
       << " xmlns:tds=\"" << NS_DEVICE << "\""
       << " xmlns:trt=\"" << NS_MEDIA << "\""
       << " xmlns:tptz=\"" << NS_PTZ << "\""
       << " xmlns:tt=\"" << NS_SCHEMA << "\">";

    if (!username.empty()) {
        std::string nonce   = random_nonce();
        std::string created = utc_timestamp();
        const auto* raw = reinterpret_cast<const unsigned char*>(nonce.data());

        ss << "<s:Header>"
           << "<wsse:Security s:mustUnderstand=\"1\" xmlns:wsse=\"" << NS_WSSE << "\""
           << " xmlns:wsu=\"" << NS_WSU << "\">"
           << "<wsse:UsernameToken>"
           << "<wsse:Username>" << xml_escape(username) << "</wsse:Username>"
           << "<wsse:Password Type=\"" << PASSWORD_DIGEST_TYPE << "\">"
           << password_digest(nonce, created, password) << "</wsse:Password>"
           << "<wsse:Nonce EncodingType=\"" << BASE64_ENCODING_TYPE << "\">"
           << base64_encode(raw, nonce.size()) << "</wsse:Nonce>"
           << "<wsu:Created>" << created << "</wsu:Created>"
           << "</wsse:UsernameToken>"
           << "</wsse:Security>"
           << "</s:Header>";
    }

    ss << "<s:Body>" << body << "</s:Body></s:Envelope>";
    return ss.str();
}

void check_fault(const std::string& xml) {
    pt::ptree tree = read_document(xml);
    const pt::ptree* fault = find_descendant(tree, "Fault");
    if (!fault) {
        return;
    }

    std::string reason;
    if (const pt::ptree* node = find_child(*fault, "Reason")) {
        reason = child_text(*node, "Text");
    }
    if (reason.empty()) {
        reason = child_text(*fault, "faultstring");   // SOAP 1.1
    }
    if (reason.empty()) {
        reason = "unknown fault";
    }
    throw DeviceError("Device returned SOAP fault: " + reason);
}

DeviceInfo parse_device_information(const std::string& xml) {
    pt::ptree tree = read_document(xml);
    const pt::ptree& response = require_element(tree, "GetDeviceInformationResponse");

    Json fields = Json::Object{};
    for (const char* name : {"Manufacturer", "Model", "FirmwareVersion",
                             "SerialNumber", "HardwareId"}) {
        fields[name] = child_text(response, name);
    }
    return DeviceInfo::from_json(fields);
}

Capabilities parse_capabilities(const std::string& xml) {
    pt::ptree tree = read_document(xml);
    const pt::ptree& capabilities = require_element(tree, "Capabilities");

    Capabilities result;
    if (const pt::ptree* media = find_child(capabilities, "Media")) {
        result.media_address = child_text(*media, "XAddr");
    }
    if (const pt::ptree* ptz = find_child(capabilities, "PTZ")) {
        result.ptz_address = child_text(*ptz, "XAddr");
    }
    return result;
}

std::vector<std::string> parse_profiles(const std::string& xml) {
    pt::ptree tree = read_document(xml);
    const pt::ptree& response = require_element(tree, "GetProfilesResponse");

    std::vector<std::string> tokens;
    for (const auto& [key, child] : response) {
        if (local_name(key) != "Profiles") continue;
        std::string token = attribute(child, "token");
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::vector<Preset> parse_presets(const std::string& xml) {
    pt::ptree tree = read_document(xml);
    const pt::ptree& response = require_element(tree, "GetPresetsResponse");

    std::vector<Preset> presets;
    for (const auto& [key, child] : response) {
        if (local_name(key) != "Preset") continue;
        std::string token = attribute(child, "token");
        if (token.empty()) continue;   // cannot be recalled
        presets.push_back(Preset{token, child_text(child, "Name")});
    }
    return presets;
}

} // namespace onvif

// --- OnvifDevice ---

OnvifDevice::OnvifDevice(DeviceEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

DeviceClientFactory OnvifDevice::factory() {
    return [](const DeviceEndpoint& endpoint) -> std::unique_ptr<IDeviceClient> {
        return std::make_unique<OnvifDevice>(endpoint);
    };
}

std::string OnvifDevice::call(const std::string& address, const std::string& body) const {
    return http_post(address,
                     onvif::envelope(body, endpoint_.username, endpoint_.password),
                     endpoint_.timeout);
}

void OnvifDevice::require_ptz(const char* operation) const {
    if (!has_ptz()) {
        throw DeviceError(std::string("Device at ") + endpoint_.address +
                          " has no PTZ service for " + operation);
    }
}

DeviceInfo OnvifDevice::init() {
    spdlog::debug("Connecting to ONVIF device at {}", endpoint_.address);

    DeviceInfo info = onvif::parse_device_information(
        call(endpoint_.address, "<tds:GetDeviceInformation/>"));

    onvif::Capabilities caps = onvif::parse_capabilities(
        call(endpoint_.address,
             "<tds:GetCapabilities><tds:Category>All</tds:Category></tds:GetCapabilities>"));
    media_address_ = caps.media_address;
    ptz_address_   = caps.ptz_address;

    profile_token_.clear();
    if (!media_address_.empty()) {
        auto tokens = onvif::parse_profiles(call(media_address_, "<trt:GetProfiles/>"));
        if (!tokens.empty()) {
            profile_token_ = tokens.front();
        }
    }

    spdlog::debug("ONVIF device {} {}: ptz={} profile={}", info.manufacturer, info.model,
                  ptz_address_.empty() ? "none" : ptz_address_,
                  profile_token_.empty() ? "none" : profile_token_);
    return info;
}

bool OnvifDevice::has_ptz() const {
    return !ptz_address_.empty() && !profile_token_.empty();
}

std::vector<Preset> OnvifDevice::get_presets() {
    if (!has_ptz()) {
        return {};
    }
    return onvif::parse_presets(
        call(ptz_address_,
             "<tptz:GetPresets>" + profile_xml(profile_token_) + "</tptz:GetPresets>"));
}

void OnvifDevice::continuous_move(const Velocity& velocity, int timeout_seconds) {
    require_ptz("ContinuousMove");
    call(ptz_address_,
         "<tptz:ContinuousMove>" + profile_xml(profile_token_) +
         vector_xml("Velocity", velocity) +
         "<tptz:Timeout>PT" + std::to_string(timeout_seconds) + "S</tptz:Timeout>"
         "</tptz:ContinuousMove>");
}

void OnvifDevice::goto_preset(const std::string& token, const Velocity& speed) {
    require_ptz("GotoPreset");
    call(ptz_address_,
         "<tptz:GotoPreset>" + profile_xml(profile_token_) +
         "<tptz:PresetToken>" + onvif::xml_escape(token) + "</tptz:PresetToken>" +
         vector_xml("Speed", speed) +
         "</tptz:GotoPreset>");
}

void OnvifDevice::goto_home() {
    require_ptz("GotoHomePosition");
    call(ptz_address_,
         "<tptz:GotoHomePosition>" + profile_xml(profile_token_) +
         "</tptz:GotoHomePosition>");
}

void OnvifDevice::stop() {
    require_ptz("Stop");
    call(ptz_address_,
         "<tptz:Stop>" + profile_xml(profile_token_) +
         "<tptz:PanTilt>true</tptz:PanTilt><tptz:Zoom>true</tptz:Zoom>"
         "</tptz:Stop>");
}

} // namespace ptzgw
