#include "ptzgw/remote_session.hpp"

#include <exception>
#include <utility>

#include "ptzgw/errors.hpp"

namespace ptzgw {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

void RemoteSessionOptions::validate() const {
    if (api_token.empty()) {
        throw ConfigError("remote session requires an API token");
    }
    if (url.empty()) {
        throw ConfigError("remote session requires a URL");
    }
    if (reconnect_interval.count() <= 0) {
        throw ConfigError("reconnect interval must be positive, got " +
                          std::to_string(reconnect_interval.count()) + " ms");
    }
}

const char* to_string(RemoteEvent::Kind kind) {
    switch (kind) {
        case RemoteEvent::Kind::Starting:     return "starting";
        case RemoteEvent::Kind::Connecting:   return "connecting";
        case RemoteEvent::Kind::Connected:    return "connected";
        case RemoteEvent::Kind::Data:         return "data";
        case RemoteEvent::Kind::Error:        return "error";
        case RemoteEvent::Kind::Closed:       return "closed";
        case RemoteEvent::Kind::Reconnecting: return "reconnecting";
        case RemoteEvent::Kind::Stopping:     return "stopping";
    }
    return "unknown";
}

RemoteSessionClient::RemoteSessionClient(boost::asio::io_context& ioc,
                                         IRemoteTransport& transport,
                                         RemoteSessionOptions options)
    : ioc_(ioc)
    , transport_(transport)
    , options_(std::move(options))
    , reconnect_timer_(ioc) {
    options_.validate();
}

void RemoteSessionClient::add_listener(RemoteEventHandler handler) {
    listeners_.push_back(std::move(handler));
}

void RemoteSessionClient::on_message(const std::string& key, MessageHandler handler) {
    handlers_[key] = std::move(handler);
}

void RemoteSessionClient::on_unhandled_message(MessageHandler handler) {
    unhandled_ = std::move(handler);
}

void RemoteSessionClient::emit(const RemoteEvent& event) const {
    for (const auto& listener : listeners_) {
        listener(event);
    }
}

void RemoteSessionClient::emit_error(const std::string& message, bool auth_failure) const {
    RemoteEvent event{RemoteEvent::Kind::Error};
    event.message      = message;
    event.auth_failure = auth_failure;
    emit(event);
}

// --- Session lifecycle ---

void RemoteSessionClient::start() {
    stopped_ = false;
    reconnect_timer_.cancel();

    emit(RemoteEvent{RemoteEvent::Kind::Starting});
    emit(RemoteEvent{RemoteEvent::Kind::Connecting});

    RemoteTransportHandlers handlers;
    handlers.on_open = [this]() {
        emit(RemoteEvent{RemoteEvent::Kind::Connected});
    };
    handlers.on_message = [this](const std::string& text) {
        handle_message(text);
    };
    handlers.on_error = [this](const TransportError& error) {
        handle_error(error);
    };
    handlers.on_close = [this](int code) {
        handle_close(code);
    };

    try {
        transport_.open(options_.url, options_.api_token, std::move(handlers));
    } catch (const std::exception& e) {
        emit_error(std::string("Unable to open remote session: ") + e.what());
        reconnect();
    }
}

void RemoteSessionClient::stop() {
    stopped_ = true;
    emit(RemoteEvent{RemoteEvent::Kind::Stopping});
    reconnect_timer_.cancel();
    transport_.close(CLOSED_BY_CONSUMER);
}

void RemoteSessionClient::reconnect() {
    RemoteEvent event{RemoteEvent::Kind::Reconnecting};
    event.interval = options_.reconnect_interval;
    emit(event);

    reconnect_timer_.expires_after(options_.reconnect_interval);
    reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_) {
            return;
        }
        start();
    });
}

// --- Transport callbacks ---

void RemoteSessionClient::handle_message(const std::string& text) {
    Json message;
    try {
        message = Json::parse(text);
    } catch (const JsonError& e) {
        emit_error(std::string("Invalid message received from control plane: ") + e.what());
        return;
    }

    RemoteEvent data{RemoteEvent::Kind::Data};
    data.payload = message;
    emit(data);

    if (!message.is_object()) {
        return;
    }
    for (const auto& [key, value] : message.as_object()) {
        auto it = handlers_.find(key);
        if (it != handlers_.end()) {
            it->second(key, value);
        } else if (unhandled_) {
            unhandled_(key, value);
        }
    }
}

void RemoteSessionClient::handle_error(const TransportError& error) {
    bool auth_failure = error.status == 401 || ends_with(error.message, "401");
    emit_error(error.message, auth_failure);
}

void RemoteSessionClient::handle_close(int code) {
    RemoteEvent event{RemoteEvent::Kind::Closed};
    event.close_code = code;
    emit(event);

    if (code != CLOSED_BY_CONSUMER && !stopped_) {
        reconnect();
    }
}

// --- Outbound ---

bool RemoteSessionClient::send(const Json& request) {
    if (!transport_.is_open()) {
        return false;
    }
    transport_.send(request.dump());
    return true;
}

bool RemoteSessionClient::subscribe(const std::string& id) {
    Json request = Json::Object{};
    request["sub"] = id;
    return send(request);
}

bool RemoteSessionClient::subscribe(const std::vector<std::string>& ids) {
    Json::Array list;
    for (const auto& id : ids) {
        list.emplace_back(id);
    }
    Json request = Json::Object{};
    request["sub"] = std::move(list);
    return send(request);
}

} // namespace ptzgw
