#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "remote_session.hpp"

namespace ptzgw {

/// IRemoteTransport over a TLS WebSocket (Boost.Beast).
///
/// Connects to `wss://` URLs (an `https://` URL is treated as `wss://`)
/// and sends the API token as an `Authorization: Bearer` header during
/// the upgrade. A declined upgrade is reported with its HTTP status.
/// Runs entirely on the given io_context.
class WebSocketRemoteTransport : public IRemoteTransport {
public:
    explicit WebSocketRemoteTransport(boost::asio::io_context& ioc);
    ~WebSocketRemoteTransport() override;

    // Non-copyable
    WebSocketRemoteTransport(const WebSocketRemoteTransport&) = delete;
    WebSocketRemoteTransport& operator=(const WebSocketRemoteTransport&) = delete;

    void open(const std::string& url, const std::string& bearer_token,
              RemoteTransportHandlers handlers) override;

    bool is_open() const override;

    void send(const std::string& text) override;

    void close(int code) override;

    class Connection;

private:
    boost::asio::io_context& ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::shared_ptr<Connection> connection_;
};

} // namespace ptzgw
