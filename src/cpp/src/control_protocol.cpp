#include "ptzgw/control_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>

namespace ptzgw {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

/// Require `arity` non-empty arguments after the keyword.
void require_args(const std::vector<std::string>& parts, std::size_t arity,
                  const std::string& keyword, const std::string& line) {
    bool ok = parts.size() >= arity + 1;
    for (std::size_t i = 1; ok && i <= arity; ++i) {
        ok = !trim(parts[i]).empty();
    }
    if (!ok) {
        throw ProtocolError("Invalid '" + keyword +
                            "' command received from PTZ controller: " + line);
    }
}

int parse_level(const std::string& text, const std::string& keyword,
                const std::string& line) {
    std::string value = trim(text);
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE ||
        parsed < INT_MIN || parsed > INT_MAX) {
        throw ProtocolError("Invalid '" + keyword + "' speed value '" + value +
                            "' received from PTZ controller: " + line);
    }
    return static_cast<int>(parsed);
}

} // anonymous namespace

const char* to_string(ControlCommand::Kind kind) {
    switch (kind) {
        case ControlCommand::Kind::Stop:   return "stop";
        case ControlCommand::Kind::Home:   return "home";
        case ControlCommand::Kind::Preset: return "preset";
        case ControlCommand::Kind::Ptz:    return "ptz";
        case ControlCommand::Kind::Pan:    return "pan";
        case ControlCommand::Kind::Tilt:   return "tilt";
        case ControlCommand::Kind::Zoom:   return "zoom";
    }
    return "unknown";
}

ControlCommand parse_command(const std::string& line) {
    const std::string text = trim(line);
    const std::vector<std::string> parts = split(text, ':');
    const std::string keyword = to_lower(trim(parts.front()));

    ControlCommand command;

    if (keyword == "stop" && parts.size() == 1) {
        command.kind = ControlCommand::Kind::Stop;
        return command;
    }

    if (keyword == "home" && parts.size() == 1) {
        command.kind = ControlCommand::Kind::Home;
        return command;
    }

    if (keyword == "preset" && parts.size() > 1) {
        require_args(parts, 1, keyword, line);
        command.kind  = ControlCommand::Kind::Preset;
        command.token = trim(parts[1]);
        return command;
    }

    if (keyword == "ptz" && parts.size() > 1) {
        require_args(parts, 3, keyword, line);
        command.kind = ControlCommand::Kind::Ptz;
        command.pan  = parse_level(parts[1], keyword, line);
        command.tilt = parse_level(parts[2], keyword, line);
        command.zoom = parse_level(parts[3], keyword, line);
        return command;
    }

    if (keyword == "pan" && parts.size() > 1) {
        require_args(parts, 1, keyword, line);
        command.kind = ControlCommand::Kind::Pan;
        command.pan  = parse_level(parts[1], keyword, line);
        return command;
    }

    if (keyword == "tilt" && parts.size() > 1) {
        require_args(parts, 1, keyword, line);
        command.kind = ControlCommand::Kind::Tilt;
        command.tilt = parse_level(parts[1], keyword, line);
        return command;
    }

    if (keyword == "zoom" && parts.size() > 1) {
        require_args(parts, 1, keyword, line);
        command.kind = ControlCommand::Kind::Zoom;
        command.zoom = parse_level(parts[1], keyword, line);
        return command;
    }

    if (keyword == "preset" || keyword == "ptz" || keyword == "pan" ||
        keyword == "tilt" || keyword == "zoom") {
        throw ProtocolError("Invalid '" + keyword +
                            "' command received from PTZ controller: " + line);
    }

    throw ProtocolError("Unknown command received from PTZ controller: " + line);
}

} // namespace ptzgw
