#include "ptzgw/websocket_remote_transport.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "ptzgw/errors.hpp"
#include "ptzgw/url.hpp"

namespace ptzgw {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);

// RFC 6455 "abnormal closure": no close frame was received.
constexpr int CLOSE_ABNORMAL = 1006;

} // anonymous namespace

// --- Connection ---

/// One connection attempt and, if it succeeds, the open session.
/// Reports exactly one on_close unless detached.
class WebSocketRemoteTransport::Connection
    : public std::enable_shared_from_this<Connection> {
public:
    Connection(net::io_context& ioc, ssl::context& ctx, Url url,
               std::string bearer_token, RemoteTransportHandlers handlers)
        : resolver_(ioc)
        , ws_(ioc, ctx)
        , url_(std::move(url))
        , bearer_token_(std::move(bearer_token))
        , handlers_(std::move(handlers)) {
    }

    void run() {
        resolver_.async_resolve(
            url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec,
                                        tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    bool is_open() const { return open_ && !closing_; }

    void send(const std::string& text) {
        if (!is_open()) {
            return;
        }
        queue_.push_back(text);
        if (queue_.size() == 1) {
            do_write();
        }
    }

    void close(int code) {
        if (finished_ || closing_) {
            return;
        }
        closing_    = true;
        close_code_ = code;

        if (!open_) {
            // Still connecting: abort whatever is pending.
            resolver_.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
            return;
        }
        if (queue_.empty()) {
            start_close();
        }
        // Otherwise on_write starts the close once the current frame is out.
    }

    /// Silence a superseded connection and tear it down.
    void detach() {
        handlers_ = RemoteTransportHandlers{};
        finished_ = true;
        open_     = false;
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

private:
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    websocket::response_type response_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;

    Url url_;
    std::string bearer_token_;
    RemoteTransportHandlers handlers_;

    bool open_     = false;
    bool closing_  = false;
    bool finished_ = false;
    int close_code_ = 0;

    // --- Handshake chain ---

    /// True once close() or detach() ended the attempt; the chain stops.
    bool aborted() {
        if (finished_) return true;
        if (closing_ && !open_) {
            finish(close_code_);
            return true;
        }
        return false;
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (aborted()) return;
        if (ec) return fail(ec, "resolve");

        beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        beast::get_lowest_layer(ws_).async_connect(
            results,
            [self = shared_from_this()](beast::error_code ec,
                                        tcp::resolver::results_type::endpoint_type) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (aborted()) return;
        if (ec) return fail(ec, "connect");

        // SNI
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                   net::error::get_ssl_category());
            return fail(ec, "tls");
        }
        ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));

        beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        ws_.next_layer().async_handshake(
            ssl::stream_base::client,
            [self = shared_from_this()](beast::error_code ec) {
                self->on_ssl_handshake(ec);
            });
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (aborted()) return;
        if (ec) return fail(ec, "tls handshake");

        // The websocket stream keeps its own timeouts from here on.
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator(
            [token = bearer_token_](websocket::request_type& req) {
                req.set(http::field::authorization, "Bearer " + token);
                req.set(http::field::user_agent,
                        std::string("ptz-gateway ") + BOOST_BEAST_VERSION_STRING);
            }));

        ws_.async_handshake(
            response_, url_.authority(), url_.target,
            [self = shared_from_this()](beast::error_code ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(beast::error_code ec) {
        if (aborted()) return;
        if (ec) {
            int status = 0;
            if (ec == websocket::error::upgrade_declined) {
                status = static_cast<int>(response_.result_int());
            }
            return fail(ec, "websocket handshake", status);
        }

        open_ = true;
        if (handlers_.on_open) handlers_.on_open();
        do_read();
    }

    // --- Reading ---

    void do_read() {
        ws_.async_read(
            buffer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (finished_) return;

        if (ec == websocket::error::closed) {
            return finish(closing_ ? close_code_ : static_cast<int>(ws_.reason().code));
        }
        if (ec) {
            if (closing_) return;   // the pending close reports completion
            return fail(ec, "read");
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message) handlers_.on_message(text);

        if (!closing_ && !finished_) {
            do_read();
        }
    }

    // --- Writing ---

    void do_write() {
        ws_.text(true);
        ws_.async_write(
            net::buffer(queue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        if (finished_) return;
        if (ec) return fail(ec, "write");

        queue_.pop_front();
        if (closing_) {
            queue_.clear();
            return start_close();
        }
        if (!queue_.empty()) {
            do_write();
        }
    }

    // --- Teardown ---

    void start_close() {
        ws_.async_close(
            websocket::close_reason(static_cast<std::uint16_t>(close_code_)),
            [self = shared_from_this()](beast::error_code) {
                self->finish(self->close_code_);
            });
    }

    void fail(beast::error_code ec, const std::string& what, int status = 0) {
        if (finished_) return;
        if (!closing_ && handlers_.on_error) {
            handlers_.on_error(TransportError{what + ": " + ec.message(), status});
        }
        finish(closing_ ? close_code_ : CLOSE_ABNORMAL);
    }

    void finish(int code) {
        if (finished_) return;
        finished_ = true;
        open_     = false;
        queue_.clear();

        auto on_close = std::move(handlers_.on_close);
        handlers_ = RemoteTransportHandlers{};
        if (on_close) on_close(code);
    }
};

// --- WebSocketRemoteTransport ---

WebSocketRemoteTransport::WebSocketRemoteTransport(net::io_context& ioc)
    : ioc_(ioc)
    , ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

WebSocketRemoteTransport::~WebSocketRemoteTransport() {
    if (connection_) {
        connection_->detach();
    }
}

void WebSocketRemoteTransport::open(const std::string& url,
                                    const std::string& bearer_token,
                                    RemoteTransportHandlers handlers) {
    Url parsed = parse_url(url);
    if (parsed.scheme == "https") {
        parsed.scheme = "wss";
    }
    if (parsed.scheme != "wss") {
        throw GatewayError("Unsupported remote session scheme '" + parsed.scheme +
                           "' in " + url + "; expected wss");
    }

    if (connection_) {
        connection_->detach();
    }
    connection_ = std::make_shared<Connection>(ioc_, ssl_ctx_, std::move(parsed),
                                               bearer_token, std::move(handlers));
    connection_->run();
}

bool WebSocketRemoteTransport::is_open() const {
    return connection_ && connection_->is_open();
}

void WebSocketRemoteTransport::send(const std::string& text) {
    if (connection_) {
        connection_->send(text);
    }
}

void WebSocketRemoteTransport::close(int code) {
    if (connection_) {
        connection_->close(code);
    }
}

} // namespace ptzgw
