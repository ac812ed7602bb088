#include "ptzgw/websocket_control_transport.hpp"

#include <deque>
#include <utility>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include "ptzgw/errors.hpp"

namespace ptzgw {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

namespace {

std::string endpoint_id(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

/// Errors that just mean the peer went away.
bool is_disconnect(const beast::error_code& ec) {
    return ec == websocket::error::closed ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::operation_aborted ||
           ec == beast::error::timeout;
}

} // anonymous namespace

// --- Session ---

class WebSocketControlTransport::Session
    : public std::enable_shared_from_this<Session> {
public:
    Session(WebSocketControlTransport& owner, tcp::socket socket)
        : owner_(&owner)
        , ws_(std::move(socket)) {
        beast::error_code ec;
        auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
        id_ = ec ? std::string("unknown") : endpoint_id(ep);
    }

    const std::string& id() const { return id_; }

    void run() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server,
                        std::string("ptz-gateway ") + BOOST_BEAST_VERSION_STRING);
            }));
        ws_.async_accept([self = shared_from_this()](beast::error_code ec) {
            self->on_accept(ec);
        });
    }

    void send(const std::string& text) {
        if (!accepted_ || closing_) {
            return;
        }
        queue_.push_back(text);
        if (queue_.size() == 1) {
            do_write();
        }
    }

    /// Close without reporting back to the owner.
    void detach() {
        owner_   = nullptr;
        closing_ = true;
        if (accepted_ && queue_.empty()) {
            ws_.async_close(websocket::close_code::going_away,
                            [self = shared_from_this()](beast::error_code) {});
        } else {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }
    }

private:
    WebSocketControlTransport* owner_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    std::string id_;
    bool accepted_ = false;
    bool closing_  = false;
    bool finished_ = false;

    void on_accept(beast::error_code ec) {
        if (!owner_) return;   // detached while handshaking
        if (ec) {
            auto owner = owner_;
            owner_ = nullptr;
            owner->on_session_failed(shared_from_this(), "Controller handshake from " + id_ +
                                                         " failed: " + ec.message());
            return;
        }
        accepted_ = true;
        owner_->on_session_open(shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_,
                       [self = shared_from_this()](beast::error_code ec, std::size_t) {
                           self->on_read(ec);
                       });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            if (!is_disconnect(ec) && owner_) {
                owner_->on_session_error("Controller " + id_ + ": " + ec.message());
            }
            return finish();
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (owner_ && owner_->handler_) {
            owner_->handler_->on_message(id_, text);
        }
        if (!closing_) {
            do_read();
        }
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(net::buffer(queue_.front()),
                        [self = shared_from_this()](beast::error_code ec, std::size_t) {
                            self->on_write(ec);
                        });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            queue_.clear();
            if (!is_disconnect(ec) && owner_) {
                owner_->on_session_error("Controller " + id_ + ": " + ec.message());
            }
            return;   // the pending read reports the close
        }
        queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        }
    }

    void finish() {
        if (finished_) return;
        finished_ = true;
        if (owner_) {
            auto owner = owner_;
            owner_ = nullptr;
            owner->on_session_closed(id_);
        }
    }
};

// --- WebSocketControlTransport ---

WebSocketControlTransport::WebSocketControlTransport(net::io_context& ioc)
    : ioc_(ioc) {
}

WebSocketControlTransport::~WebSocketControlTransport() {
    close();
}

void WebSocketControlTransport::listen(int port, ControlConnectionHandler& handler) {
    handler_ = &handler;

    tcp::endpoint endpoint(tcp::v4(), static_cast<unsigned short>(port));
    auto acceptor = std::make_unique<tcp::acceptor>(ioc_);

    beast::error_code ec;
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor->bind(endpoint, ec);
    if (!ec) acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw GatewayError("Unable to listen for PTZ controllers on port " +
                           std::to_string(port) + ": " + ec.message());
    }

    acceptor_ = std::move(acceptor);
    do_accept();
}

void WebSocketControlTransport::do_accept() {
    acceptor_->async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_ || !acceptor_->is_open()) {
            return;
        }
        if (ec) {
            on_session_error("Unable to accept PTZ controller: " + ec.message());
        } else {
            auto session = std::make_shared<Session>(*this, std::move(socket));
            pending_.insert(session);
            session->run();
        }
        do_accept();
    });
}

void WebSocketControlTransport::send(const std::string& client_id, const std::string& text) {
    auto it = sessions_.find(client_id);
    if (it != sessions_.end()) {
        it->second->send(text);
    }
}

void WebSocketControlTransport::broadcast(const std::string& text) {
    for (auto& [id, session] : sessions_) {
        session->send(text);
    }
}

void WebSocketControlTransport::close() {
    if (acceptor_) {
        beast::error_code ignored;
        acceptor_->close(ignored);
        acceptor_.reset();
    }

    for (auto& session : pending_) {
        session->detach();
    }
    pending_.clear();

    for (auto& [id, session] : sessions_) {
        session->detach();
    }
    sessions_.clear();
}

unsigned short WebSocketControlTransport::local_port() const {
    if (!acceptor_) {
        return 0;
    }
    beast::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void WebSocketControlTransport::on_session_open(const std::shared_ptr<Session>& session) {
    pending_.erase(session);
    sessions_[session->id()] = session;
    if (handler_) handler_->on_connected(session->id());
}

void WebSocketControlTransport::on_session_closed(const std::string& id) {
    sessions_.erase(id);
    if (handler_) handler_->on_closed(id);
}

void WebSocketControlTransport::on_session_failed(const std::shared_ptr<Session>& session,
                                                  const std::string& message) {
    pending_.erase(session);
    on_session_error(message);
}

void WebSocketControlTransport::on_session_error(const std::string& message) {
    if (handler_) handler_->on_transport_error(message);
}

} // namespace ptzgw
