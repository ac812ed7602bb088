#include "ptzgw/config.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <sys/stat.h>

#include "ptzgw/errors.hpp"

namespace ptzgw {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home);
    }
    return ".";
}

bool file_exists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // anonymous namespace

std::string Config::default_path() {
    std::string home_path = get_home_dir() + "/" + DEFAULT_CONFIG_DIRNAME + "/" +
                            DEFAULT_CONFIG_FILENAME;
    if (file_exists(home_path)) {
        return home_path;
    }
    std::string local_path = "./" + DEFAULT_CONFIG_FILENAME;
    if (file_exists(local_path)) {
        return local_path;
    }
    return home_path;
}

Config::Config(const std::string& config_path)
    : path_(config_path.empty() ? default_path() : config_path) {
    set_defaults();
}

void Config::set_defaults() {
    data_ = Json::Object{};
    data_[CFG_API_URI]            = DEFAULT_API_URI;
    data_[CFG_PORT]               = DEFAULT_CONTROL_PORT;
    data_[CFG_RECONNECT_INTERVAL] = static_cast<double>(DEFAULT_RECONNECT_INTERVAL.count());
    data_[CFG_LOG_LEVEL]          = DEFAULT_LOG_LEVEL;
}

void Config::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw ConfigError("Config file not found: " + path_);
    }

    std::stringstream ss;
    ss << file.rdbuf();

    Json parsed;
    try {
        parsed = Json::parse(ss.str());
    } catch (const JsonError& e) {
        throw ConfigError("Invalid config file " + path_ + ": " + e.what());
    }
    if (!parsed.is_object()) {
        throw ConfigError("Invalid config file " + path_ + ": expected a JSON object");
    }

    // File values override defaults; unknown keys are kept for get().
    for (const auto& [key, value] : parsed.as_object()) {
        data_[key] = value;
    }
}

void Config::validate() const {
    if (api_token().empty()) {
        throw ConfigError("Missing required '" + CFG_API_TOKEN + "' in " + path_);
    }
    int p = port();
    if (p < 1 || p > 65535) {
        throw ConfigError("Invalid '" + CFG_PORT + "' value " + std::to_string(p));
    }
    if (reconnect_interval().count() <= 0) {
        throw ConfigError("Invalid '" + CFG_RECONNECT_INTERVAL + "' value " +
                          std::to_string(reconnect_interval().count()));
    }
}

std::string Config::get(const std::string& key,
                        const std::string& default_val) const {
    const Json* value = data_.find(key);
    if (!value || value->is_null()) {
        return default_val;
    }
    if (value->is_string()) {
        return value->as_string();
    }
    return value->dump();
}

void Config::set(const std::string& key, Json value) {
    data_[key] = std::move(value);
}

int Config::get_int(const std::string& key, int default_val) const {
    const Json* value = data_.find(key);
    if (!value || value->is_null()) {
        return default_val;
    }
    if (value->is_number()) {
        double n = value->as_number();
        if (std::floor(n) != n || n < INT_MIN || n > INT_MAX) {
            throw ConfigError("Config value '" + key + "' must be an integer");
        }
        return static_cast<int>(n);
    }
    if (value->is_string()) {
        const std::string& text = value->as_string();
        errno = 0;
        char* end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (!text.empty() && *end == '\0' && errno != ERANGE &&
            parsed >= INT_MIN && parsed <= INT_MAX) {
            return static_cast<int>(parsed);
        }
    }
    throw ConfigError("Config value '" + key + "' must be an integer");
}

// --- Typed accessors ---

std::string Config::api_token() const {
    return get(CFG_API_TOKEN);
}

std::string Config::api_uri() const {
    return get(CFG_API_URI, DEFAULT_API_URI);
}

int Config::port() const {
    return get_int(CFG_PORT, DEFAULT_CONTROL_PORT);
}

std::chrono::milliseconds Config::reconnect_interval() const {
    return std::chrono::milliseconds(
        get_int(CFG_RECONNECT_INTERVAL, static_cast<int>(DEFAULT_RECONNECT_INTERVAL.count())));
}

std::string Config::log_level() const {
    return get(CFG_LOG_LEVEL, DEFAULT_LOG_LEVEL);
}

std::string Config::device_username() const {
    return get(CFG_DEVICE_USERNAME);
}

std::string Config::device_password() const {
    return get(CFG_DEVICE_PASSWORD);
}

RemoteSessionOptions Config::remote_options() const {
    RemoteSessionOptions options;
    options.url                = api_uri();
    options.api_token          = api_token();
    options.reconnect_interval = reconnect_interval();
    return options;
}

} // namespace ptzgw
