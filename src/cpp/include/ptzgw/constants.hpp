#pragma once

#include <chrono>
#include <string>

namespace ptzgw {

// Discrete speed levels accepted from controllers (-3..+3)
constexpr int HIGH_SPEED   = 3;
constexpr int MEDIUM_SPEED = 2;
constexpr int LOW_SPEED    = 1;

// Fractional device velocities per axis
constexpr double PAN_HIGH_SPEED   = 1.0;
constexpr double PAN_MEDIUM_SPEED = 0.5;
constexpr double PAN_LOW_SPEED    = 0.2;

constexpr double TILT_HIGH_SPEED   = 1.0;
constexpr double TILT_MEDIUM_SPEED = 0.5;
constexpr double TILT_LOW_SPEED    = 0.2;

constexpr double ZOOM_HIGH_SPEED   = 1.0;
constexpr double ZOOM_MEDIUM_SPEED = 0.5;
constexpr double ZOOM_LOW_SPEED    = 0.2;

// Speed used for every axis when recalling a preset
constexpr double PRESET_SPEED = 1.0;

// Device-side idle timeout for continuous moves (seconds)
constexpr int CONTINUOUS_MOVE_TIMEOUT = 10;

// Device HTTP timeout when the descriptor does not supply one
constexpr std::chrono::milliseconds DEFAULT_DEVICE_TIMEOUT{10000};

// Remote session
constexpr int CLOSED_BY_CONSUMER = 4000;
constexpr std::chrono::milliseconds DEFAULT_RECONNECT_INTERVAL{60000};
inline const std::string DEFAULT_API_URI = "wss://api.monoclecam.com/v1";
inline const std::string SOURCE_TOPIC    = "alexa.source";

// Local controller server
constexpr int DEFAULT_CONTROL_PORT = 8080;

// Config file lookup
inline const std::string DEFAULT_CONFIG_DIRNAME  = ".monocle";
inline const std::string DEFAULT_CONFIG_FILENAME = "config.json";
inline const std::string DEFAULT_LOG_LEVEL       = "info";

// Config keys
inline const std::string CFG_API_TOKEN          = "monocle-api-token";
inline const std::string CFG_API_URI            = "api-uri";
inline const std::string CFG_PORT               = "port";
inline const std::string CFG_RECONNECT_INTERVAL = "reconnectInterval";
inline const std::string CFG_LOG_LEVEL          = "log-level";
inline const std::string CFG_DEVICE_USERNAME    = "device-username";
inline const std::string CFG_DEVICE_PASSWORD    = "device-password";

// ONVIF device service path appended to the camera host
inline const std::string ONVIF_DEVICE_SERVICE_PATH = "/onvif/device_service";

} // namespace ptzgw
