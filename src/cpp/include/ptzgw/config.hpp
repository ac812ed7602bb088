#pragma once

#include <chrono>
#include <string>

#include "constants.hpp"
#include "json.hpp"
#include "remote_session.hpp"

namespace ptzgw {

/// Gateway configuration, loaded from a JSON object file.
///
/// Without an explicit path the first existing file of
/// ~/.monocle/config.json and ./config.json is used.
class Config {
public:
    /// Construct with optional custom config file path.
    explicit Config(const std::string& config_path = "");

    /// Load config from file. Throws ConfigError if the file is missing,
    /// unreadable, or not a JSON object.
    void load();

    /// Throws ConfigError if the API token is missing or a value is out of range.
    void validate() const;

    /// Get a value as text, or a default if missing or null.
    std::string get(const std::string& key, const std::string& default_val = "") const;

    /// Set a config value.
    void set(const std::string& key, Json value);

    // --- Typed accessors ---

    std::string api_token() const;
    std::string api_uri() const;
    int port() const;
    std::chrono::milliseconds reconnect_interval() const;
    std::string log_level() const;
    std::string device_username() const;
    std::string device_password() const;

    /// Options for RemoteSessionClient.
    RemoteSessionOptions remote_options() const;

    /// Return the config file path.
    const std::string& path() const { return path_; }

    /// First existing default location, or the home location if none exists.
    static std::string default_path();

private:
    std::string path_;
    Json data_;

    void set_defaults();
    int get_int(const std::string& key, int default_val) const;
};

} // namespace ptzgw
