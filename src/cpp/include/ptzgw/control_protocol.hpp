#pragma once

#include <string>

#include "errors.hpp"

namespace ptzgw {

/// A semantic intent decoded from one controller command line.
struct ControlCommand {
    enum class Kind {
        Stop,
        Home,
        Preset,   // token
        Ptz,      // pan, tilt, zoom
        Pan,      // pan
        Tilt,     // tilt
        Zoom,     // zoom
    };

    Kind kind = Kind::Stop;
    std::string token;
    int pan  = 0;
    int tilt = 0;
    int zoom = 0;

    bool operator==(const ControlCommand& other) const {
        return kind == other.kind && token == other.token &&
               pan == other.pan && tilt == other.tilt && zoom == other.zoom;
    }
};

const char* to_string(ControlCommand::Kind kind);

/// Parse a colon-delimited controller command:
///
///   stop | home | preset:<token> | ptz:<p>:<t>:<z> |
///   pan:<p> | tilt:<t> | zoom:<z>
///
/// The keyword is case-insensitive and surrounding whitespace is ignored;
/// argument text keeps its case. Throws ProtocolError for unknown
/// commands, missing or empty arguments and non-integer speed levels.
ControlCommand parse_command(const std::string& line);

} // namespace ptzgw
