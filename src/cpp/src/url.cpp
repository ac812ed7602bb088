#include "ptzgw/url.hpp"

#include <algorithm>
#include <cctype>

#include "ptzgw/errors.hpp"

namespace ptzgw {

std::string default_port(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return "80";
    if (scheme == "https" || scheme == "wss") return "443";
    return "";
}

std::string Url::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port.empty() || port == default_port(scheme)) {
        return h;
    }
    return h + ":" + port;
}

Url parse_url(const std::string& text) {
    auto sep = text.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw GatewayError("URL has no scheme: '" + text + "'");
    }

    Url url;
    url.scheme = text.substr(0, sep);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string rest = text.substr(sep + 3);
    auto path_pos = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_pos);
    url.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    if (url.target.front() != '/') {
        url.target.insert(url.target.begin(), '/');
    }
    auto fragment = url.target.find('#');
    if (fragment != std::string::npos) {
        url.target.erase(fragment);
    }

    // Drop user:password@
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw GatewayError("URL has malformed IPv6 host: '" + text + "'");
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            url.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            url.port = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        throw GatewayError("URL has no host: '" + text + "'");
    }
    if (!std::all_of(url.port.begin(), url.port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw GatewayError("URL has invalid port: '" + text + "'");
    }
    if (url.port.empty()) {
        url.port = default_port(url.scheme);
    }
    return url;
}

} // namespace ptzgw
