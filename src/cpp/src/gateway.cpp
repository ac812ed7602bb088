#include "ptzgw/gateway.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace ptzgw {

Gateway::Gateway(boost::asio::any_io_executor io,
                 boost::asio::any_io_executor device,
                 RemoteSessionClient& remote,
                 LocalControlServer& server,
                 CameraSession& session)
    : io_(std::move(io))
    , device_(std::move(device))
    , remote_(remote)
    , server_(server)
    , session_(session) {
    remote_.add_listener([this](const RemoteEvent& event) { on_remote_event(event); });
    remote_.on_message(SOURCE_TOPIC, [this](const std::string&, const Json& value) {
        handle_source(value);
    });
    remote_.on_unhandled_message([](const std::string& key, const Json& value) {
        spdlog::debug("Ignoring remote message '{}': {}", key, value.dump());
    });

    server_.add_listener([this](const ControlEvent& event) { on_control_event(event); });
    session_.add_listener([this](const CameraEvent& event) { on_camera_event(event); });
}

void Gateway::start() {
    server_.start();
    spdlog::info("Listening for PTZ controllers on port {}", server_.port());
    remote_.start();
}

void Gateway::stop() {
    remote_.stop();
    server_.stop();
}

// --- Active source ---

void Gateway::handle_source(const Json& payload) {
    CameraDescriptor descriptor;
    try {
        descriptor = CameraDescriptor::from_json(payload);
    } catch (const JsonError& e) {
        spdlog::error("Invalid active camera source received: {}", e.what());
        return;
    }

    spdlog::info("-------------------------------------------------");
    spdlog::info("Active camera: {}", descriptor.label());
    spdlog::info("-------------------------------------------------");

    boost::asio::post(device_, [this, descriptor]() {
        try {
            auto state = std::make_shared<const CameraState>(session_.initialize(descriptor));
            spdlog::info("Camera '{}' ready for control (ptz: {}, presets: {})",
                         state->name(), state->ptz() ? "yes" : "no", state->presets().size());
            publish(std::move(state));
        } catch (const SupersededError& e) {
            spdlog::debug("Discarding initialization of '{}': {}", descriptor.label(), e.what());
        } catch (const DeviceConnectionError& e) {
            spdlog::error("Camera '{}' failed to initialize: {}", descriptor.label(), e.cause());
            publish(std::make_shared<const CameraState>(
                CameraState::from_failure(e.descriptor(), e.what())));
        } catch (const GatewayError& e) {
            spdlog::error("Camera '{}' failed to initialize: {}", descriptor.label(), e.what());
        }
    });
}

void Gateway::publish(std::shared_ptr<const CameraState> state) {
    boost::asio::post(io_, [this, state = std::move(state)]() {
        server_.publish(*state);
    });
}

// --- Controller intents ---

void Gateway::dispatch(const std::string& client_id, const ControlCommand& command) {
    switch (command.kind) {
        case ControlCommand::Kind::Stop:
        case ControlCommand::Kind::Home:
            spdlog::info("Controller {}: {}", client_id, to_string(command.kind));
            break;
        case ControlCommand::Kind::Preset:
            spdlog::info("Controller {}: preset {}", client_id, command.token);
            break;
        case ControlCommand::Kind::Ptz:
            spdlog::info("Controller {}: ptz {} {} {}", client_id,
                         command.pan, command.tilt, command.zoom);
            break;
        case ControlCommand::Kind::Pan:
            spdlog::info("Controller {}: pan {}", client_id, command.pan);
            break;
        case ControlCommand::Kind::Tilt:
            spdlog::info("Controller {}: tilt {}", client_id, command.tilt);
            break;
        case ControlCommand::Kind::Zoom:
            spdlog::info("Controller {}: zoom {}", client_id, command.zoom);
            break;
    }

    boost::asio::post(device_, [this, command]() {
        try {
            switch (command.kind) {
                case ControlCommand::Kind::Stop:   session_.stop(); break;
                case ControlCommand::Kind::Home:   session_.goto_home(); break;
                case ControlCommand::Kind::Preset: session_.goto_preset(command.token); break;
                case ControlCommand::Kind::Ptz:
                    session_.ptz(command.pan, command.tilt, command.zoom);
                    break;
                case ControlCommand::Kind::Pan:    session_.pan(command.pan); break;
                case ControlCommand::Kind::Tilt:   session_.tilt(command.tilt); break;
                case ControlCommand::Kind::Zoom:   session_.zoom(command.zoom); break;
            }
        } catch (const SessionError& e) {
            // Already reported through the session's error event.
            spdlog::debug("'{}' command not applied: {}", to_string(command.kind), e.what());
        }
    });
}

// --- Event logging ---

void Gateway::on_remote_event(const RemoteEvent& event) {
    switch (event.kind) {
        case RemoteEvent::Kind::Starting:
            spdlog::debug("Remote session starting");
            break;
        case RemoteEvent::Kind::Connecting:
            spdlog::info("Connecting to {}", remote_.options().url);
            break;
        case RemoteEvent::Kind::Connected:
            spdlog::info("Remote session connected");
            remote_.subscribe(SOURCE_TOPIC);
            break;
        case RemoteEvent::Kind::Data:
            spdlog::trace("Remote message: {}", event.payload.dump());
            break;
        case RemoteEvent::Kind::Error:
            if (event.auth_failure) {
                spdlog::error("Monocle API authentication error; invalid or missing token ({})",
                              event.message);
            } else {
                spdlog::error("Remote session error: {}", event.message);
            }
            break;
        case RemoteEvent::Kind::Closed:
            spdlog::info("Remote session disconnected (code {})", event.close_code);
            break;
        case RemoteEvent::Kind::Reconnecting:
            spdlog::info("Reconnecting to remote session in {} seconds",
                         event.interval.count() / 1000);
            break;
        case RemoteEvent::Kind::Stopping:
            spdlog::info("Remote session stopping");
            break;
    }
}

void Gateway::on_control_event(const ControlEvent& event) {
    switch (event.kind) {
        case ControlEvent::Kind::Connected:
            spdlog::info("PTZ controller connected: {}", event.client_id);
            break;
        case ControlEvent::Kind::Disconnected:
            spdlog::info("PTZ controller disconnected: {}", event.client_id);
            break;
        case ControlEvent::Kind::Intent:
            dispatch(event.client_id, event.command);
            break;
        case ControlEvent::Kind::Error:
            spdlog::error("PTZ controller error: {}", event.message);
            break;
    }
}

void Gateway::on_camera_event(const CameraEvent& event) {
    switch (event.kind) {
        case CameraEvent::Kind::Uninitialized:
            spdlog::debug("Camera session reset");
            break;
        case CameraEvent::Kind::Initialized:
            spdlog::debug("Camera session initialized: {}", event.state ? event.state->name() : "");
            break;
        case CameraEvent::Kind::Stop:
            spdlog::info("Camera stopped");
            break;
        case CameraEvent::Kind::Home:
            spdlog::info("Camera moved home");
            break;
        case CameraEvent::Kind::Preset:
            spdlog::info("Camera recalled preset {}", event.token);
            break;
        case CameraEvent::Kind::Pan:
            spdlog::info("Camera pan {}", event.pan);
            break;
        case CameraEvent::Kind::Tilt:
            spdlog::info("Camera tilt {}", event.tilt);
            break;
        case CameraEvent::Kind::Zoom:
            spdlog::info("Camera zoom {}", event.zoom);
            break;
        case CameraEvent::Kind::Ptz:
            spdlog::info("Camera ptz {} {} {}", event.pan, event.tilt, event.zoom);
            break;
        case CameraEvent::Kind::Error:
            spdlog::error("Camera error: {}", event.message);
            break;
    }
}

} // namespace ptzgw
