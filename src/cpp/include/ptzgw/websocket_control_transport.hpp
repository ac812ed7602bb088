#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "control_server.hpp"

namespace ptzgw {

/// IControlTransport serving plain WebSocket connections (Boost.Beast).
///
/// Listens on all IPv4 interfaces. Each accepted connection is identified
/// by its remote "address:port". Text frames are delivered whole to the
/// handler; outbound frames are queued per connection.
class WebSocketControlTransport : public IControlTransport {
public:
    explicit WebSocketControlTransport(boost::asio::io_context& ioc);
    ~WebSocketControlTransport() override;

    // Non-copyable
    WebSocketControlTransport(const WebSocketControlTransport&) = delete;
    WebSocketControlTransport& operator=(const WebSocketControlTransport&) = delete;

    /// Throws GatewayError if the port cannot be bound.
    void listen(int port, ControlConnectionHandler& handler) override;

    void send(const std::string& client_id, const std::string& text) override;

    void broadcast(const std::string& text) override;

    void close() override;

    /// Bound port while listening (useful after listen(0, ...)), else 0.
    unsigned short local_port() const;

    class Session;

private:
    boost::asio::io_context& ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    ControlConnectionHandler* handler_ = nullptr;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::set<std::shared_ptr<Session>> pending_;   // still handshaking

    void do_accept();
    void on_session_open(const std::shared_ptr<Session>& session);
    void on_session_closed(const std::string& id);
    void on_session_failed(const std::shared_ptr<Session>& session,
                           const std::string& message);
    void on_session_error(const std::string& message);
};

} // namespace ptzgw
