#pragma once

#include <string>

namespace ptzgw {

/// Console log line format.
inline const std::string LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

/// Configure the default spdlog logger with the gateway pattern and the
/// named level (trace, debug, info, warn, error, critical, off).
/// Throws ConfigError for an unknown level name.
void init_logging(const std::string& level);

} // namespace ptzgw
