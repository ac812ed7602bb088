#include "ptzgw/control_server.hpp"

#include <utility>

namespace ptzgw {

LocalControlServer::LocalControlServer(IControlTransport& transport, int port)
    : transport_(transport)
    , port_(port) {
}

void LocalControlServer::add_listener(ControlEventHandler handler) {
    listeners_.push_back(std::move(handler));
}

void LocalControlServer::emit(const ControlEvent& event) const {
    for (const auto& listener : listeners_) {
        listener(event);
    }
}

void LocalControlServer::start() {
    transport_.listen(port_, *this);
}

void LocalControlServer::stop() {
    transport_.close();
    clients_.clear();
}

std::string LocalControlServer::source_message(const CameraState& state) {
    Json message = Json::Object{};
    message["source"] = state.to_dto();
    return message.dump();
}

void LocalControlServer::publish(const CameraState& state) {
    published_ = std::make_shared<const CameraState>(state);
    transport_.broadcast(source_message(*published_));
}

void LocalControlServer::on_connected(const std::string& client_id) {
    clients_.insert(client_id);
    emit(ControlEvent{ControlEvent::Kind::Connected, client_id});

    // Late joiners get the current camera right away.
    if (published_) {
        transport_.send(client_id, source_message(*published_));
    }
}

void LocalControlServer::on_message(const std::string& client_id,
                                    const std::string& text) {
    ControlCommand command;
    try {
        command = parse_command(text);
    } catch (const ProtocolError& e) {
        ControlEvent event{ControlEvent::Kind::Error, client_id};
        event.message = e.what();
        emit(event);
        return;
    }

    ControlEvent event{ControlEvent::Kind::Intent, client_id};
    event.command = command;
    emit(event);
}

void LocalControlServer::on_closed(const std::string& client_id) {
    clients_.erase(client_id);
    emit(ControlEvent{ControlEvent::Kind::Disconnected, client_id});
}

void LocalControlServer::on_transport_error(const std::string& message) {
    ControlEvent event{ControlEvent::Kind::Error};
    event.message = message;
    emit(event);
}

} // namespace ptzgw
