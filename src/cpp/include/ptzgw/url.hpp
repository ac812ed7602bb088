#pragma once

#include <string>

namespace ptzgw {

/// Components of an absolute URL such as `wss://host:443/v1`.
struct Url {
    std::string scheme;   // lower-cased, e.g. "wss"
    std::string host;
    std::string port;     // explicit port, or the scheme default
    std::string target;   // path + query, at least "/"

    /// host[:port], omitting the port when it is the scheme default.
    std::string authority() const;
};

/// Parse an absolute URL. Throws GatewayError if there is no scheme or host.
Url parse_url(const std::string& text);

/// Default port for http/ws (80) and https/wss (443); empty otherwise.
std::string default_port(const std::string& scheme);

} // namespace ptzgw
