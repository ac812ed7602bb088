#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "camera_model.hpp"
#include "constants.hpp"
#include "control_protocol.hpp"

namespace ptzgw {

/// Receives connection events from an IControlTransport.
class ControlConnectionHandler {
public:
    virtual ~ControlConnectionHandler() = default;

    virtual void on_connected(const std::string& client_id) = 0;
    virtual void on_message(const std::string& client_id, const std::string& text) = 0;
    virtual void on_closed(const std::string& client_id) = 0;
    virtual void on_transport_error(const std::string& message) = 0;
};

/// Abstract local socket server used by LocalControlServer.
/// Client ids are the remote endpoint address of each connection.
class IControlTransport {
public:
    virtual ~IControlTransport() = default;

    /// Start accepting connections; events go to `handler`.
    virtual void listen(int port, ControlConnectionHandler& handler) = 0;

    virtual void send(const std::string& client_id, const std::string& text) = 0;

    virtual void broadcast(const std::string& text) = 0;

    /// Stop accepting and close every connection.
    virtual void close() = 0;
};

/// Events raised by LocalControlServer.
struct ControlEvent {
    enum class Kind {
        Connected,
        Disconnected,
        Intent,   // command
        Error,    // message
    };

    Kind kind;
    std::string client_id;
    ControlCommand command;
    std::string message;
};

using ControlEventHandler = std::function<void(const ControlEvent&)>;

/// Serves physical PTZ controllers: parses their command lines into
/// intents and keeps every controller updated with the active camera.
///
/// Single-threaded: call from the transport's thread only.
class LocalControlServer : public ControlConnectionHandler {
public:
    LocalControlServer(IControlTransport& transport,
                       int port = DEFAULT_CONTROL_PORT);

    void add_listener(ControlEventHandler handler);

    /// Begin listening on the configured port.
    void start();

    void stop();

    /// Store `state` and broadcast `{"source": <dto>}` to all controllers.
    void publish(const CameraState& state);

    /// Currently published snapshot, or nullptr.
    std::shared_ptr<const CameraState> published() const { return published_; }

    /// Connected controller ids.
    const std::set<std::string>& clients() const { return clients_; }

    int port() const { return port_; }

    // --- ControlConnectionHandler ---

    void on_connected(const std::string& client_id) override;
    void on_message(const std::string& client_id, const std::string& text) override;
    void on_closed(const std::string& client_id) override;
    void on_transport_error(const std::string& message) override;

    /// Wire frame for a published state.
    static std::string source_message(const CameraState& state);

private:
    IControlTransport& transport_;
    int port_;
    std::set<std::string> clients_;
    std::shared_ptr<const CameraState> published_;
    std::vector<ControlEventHandler> listeners_;

    void emit(const ControlEvent& event) const;
};

} // namespace ptzgw
