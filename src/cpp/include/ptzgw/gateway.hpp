#pragma once

#include <boost/asio/any_io_executor.hpp>

#include "camera_session.hpp"
#include "control_server.hpp"
#include "remote_session.hpp"

namespace ptzgw {

/// Wires the remote session, the local controller server and the camera
/// session together.
///
/// - On every remote (re)connect, subscribes to the active-source topic.
/// - An `alexa.source` message re-initializes the camera session on the
///   device executor; the resulting state (or a degraded state carrying
///   the failure) is published to controllers on the io executor.
/// - Controller intents run the matching CameraSession command on the
///   device executor.
///
/// `io` must be the executor the remote session and control server run
/// on. `device` may be any executor that serializes work; blocking device
/// I/O runs there.
class Gateway {
public:
    Gateway(boost::asio::any_io_executor io,
            boost::asio::any_io_executor device,
            RemoteSessionClient& remote,
            LocalControlServer& server,
            CameraSession& session);

    // Non-copyable
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// Start listening for controllers and open the remote session.
    /// Throws GatewayError if the control port cannot be bound.
    void start();

    void stop();

    /// Handle an active-source payload as if it came from the remote session.
    void handle_source(const Json& payload);

    /// Run a controller intent against the camera session.
    void dispatch(const std::string& client_id, const ControlCommand& command);

private:
    boost::asio::any_io_executor io_;
    boost::asio::any_io_executor device_;
    RemoteSessionClient& remote_;
    LocalControlServer& server_;
    CameraSession& session_;

    void on_remote_event(const RemoteEvent& event);
    void on_control_event(const ControlEvent& event);
    void on_camera_event(const CameraEvent& event);

    void publish(std::shared_ptr<const CameraState> state);
};

} // namespace ptzgw
