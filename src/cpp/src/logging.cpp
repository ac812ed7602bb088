#include "ptzgw/logging.hpp"

#include <spdlog/spdlog.h>

#include "ptzgw/errors.hpp"

namespace ptzgw {

void init_logging(const std::string& level) {
    // from_str maps unknown names to off; only accept "off" when asked for.
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Invalid log level '" + level +
                          "'; expected trace, debug, info, warn, error, critical or off");
    }

    spdlog::set_pattern(LOG_PATTERN);
    spdlog::set_level(parsed);
}

} // namespace ptzgw
