#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "constants.hpp"
#include "json.hpp"

namespace ptzgw {

/// Error reported by a remote transport. `status` carries the HTTP
/// status of a rejected upgrade (e.g. 401), or 0.
struct TransportError {
    std::string message;
    int status = 0;
};

struct RemoteTransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string& text)> on_message;
    std::function<void(const TransportError& error)> on_error;
    std::function<void(int code)> on_close;
};

/// Abstract authenticated, message-framed duplex connection to the
/// control plane. Every open() ends with exactly one on_close.
class IRemoteTransport {
public:
    virtual ~IRemoteTransport() = default;

    /// Begin connecting. May throw GatewayError for an unusable URL.
    virtual void open(const std::string& url, const std::string& bearer_token,
                      RemoteTransportHandlers handlers) = 0;

    virtual bool is_open() const = 0;

    virtual void send(const std::string& text) = 0;

    /// Close with a WebSocket close code; on_close reports that code.
    virtual void close(int code) = 0;
};

struct RemoteSessionOptions {
    std::string url = DEFAULT_API_URI;
    std::string api_token;
    std::chrono::milliseconds reconnect_interval = DEFAULT_RECONNECT_INTERVAL;

    /// Throws ConfigError if the token is empty or the interval is not positive.
    void validate() const;
};

/// Lifecycle notifications raised by RemoteSessionClient.
struct RemoteEvent {
    enum class Kind {
        Starting,
        Connecting,
        Connected,
        Data,           // payload: the whole decoded message
        Error,          // message, auth_failure
        Closed,         // close_code
        Reconnecting,   // interval
        Stopping,
    };

    Kind kind;
    Json payload;
    std::string message;
    bool auth_failure = false;
    int close_code = 0;
    std::chrono::milliseconds interval{0};
};

const char* to_string(RemoteEvent::Kind kind);

using RemoteEventHandler = std::function<void(const RemoteEvent&)>;

/// Receives one demultiplexed top-level member of an inbound message.
using MessageHandler = std::function<void(const std::string& key, const Json& value)>;

/// Maintains the outbound session to the control plane.
///
/// Each inbound JSON object raises a Data event, then every top-level key
/// is dispatched through the message registry (unregistered keys go to
/// the catch-all handler). Any close other than one requested by stop()
/// schedules start() again after the fixed reconnect interval.
///
/// Single-threaded: use from the io_context thread only.
class RemoteSessionClient {
public:
    RemoteSessionClient(boost::asio::io_context& ioc,
                        IRemoteTransport& transport,
                        RemoteSessionOptions options);

    // Non-copyable
    RemoteSessionClient(const RemoteSessionClient&) = delete;
    RemoteSessionClient& operator=(const RemoteSessionClient&) = delete;

    void add_listener(RemoteEventHandler handler);

    /// Register the handler for messages carrying `key`.
    void on_message(const std::string& key, MessageHandler handler);

    /// Handler for keys with no registered handler.
    void on_unhandled_message(MessageHandler handler);

    /// Open the session. Also invoked by the reconnect timer.
    void start();

    /// Close with the deliberate-shutdown code; no reconnect follows.
    void stop();

    /// Transmit `request` if the session is open. Never queued or retried.
    bool send(const Json& request);

    /// Sends `{"sub": id}`.
    bool subscribe(const std::string& id);

    /// Sends `{"sub": [ids...]}`.
    bool subscribe(const std::vector<std::string>& ids);

    bool is_connected() const { return transport_.is_open(); }

    const RemoteSessionOptions& options() const { return options_; }

private:
    boost::asio::io_context& ioc_;
    IRemoteTransport& transport_;
    RemoteSessionOptions options_;
    boost::asio::steady_timer reconnect_timer_;
    bool stopped_ = false;

    std::vector<RemoteEventHandler> listeners_;
    std::map<std::string, MessageHandler> handlers_;
    MessageHandler unhandled_;

    void emit(const RemoteEvent& event) const;
    void emit_error(const std::string& message, bool auth_failure = false) const;

    void handle_message(const std::string& text);
    void handle_error(const TransportError& error);
    void handle_close(int code);
    void reconnect();
};

} // namespace ptzgw
