#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "ptzgw/errors.hpp"
#include "ptzgw/remote_session.hpp"
#include "fake_transports.hpp"

namespace ptzgw {
namespace {

using namespace std::chrono_literals;
using Kind = RemoteEvent::Kind;

RemoteSessionOptions make_options() {
    RemoteSessionOptions options;
    options.url = "wss://api.example.test/v1";
    options.api_token = "token-123";
    options.reconnect_interval = 20ms;
    return options;
}

/// Fixture with a RemoteSessionClient over a FakeRemoteTransport and a
/// real io_context for the reconnect timer.
class RemoteSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_.add_listener([this](const RemoteEvent& e) { events_.push_back(e); });
    }

    void run_for(std::chrono::milliseconds duration) {
        ioc_.restart();
        ioc_.run_for(duration);
    }

    std::vector<Kind> kinds() const {
        std::vector<Kind> result;
        for (const auto& e : events_) result.push_back(e.kind);
        return result;
    }

    const RemoteEvent* last(Kind kind) const {
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->kind == kind) return &*it;
        }
        return nullptr;
    }

    boost::asio::io_context ioc_;
    testing::FakeRemoteTransport transport_;
    RemoteSessionClient client_{ioc_, transport_, make_options()};
    std::vector<RemoteEvent> events_;
};

// ---- Options ----

TEST(RemoteSessionOptionsTest, ValidateRejectsBadOptions) {
    RemoteSessionOptions options = make_options();
    EXPECT_NO_THROW(options.validate());

    options.api_token.clear();
    EXPECT_THROW(options.validate(), ConfigError);

    options = make_options();
    options.url.clear();
    EXPECT_THROW(options.validate(), ConfigError);

    options = make_options();
    options.reconnect_interval = 0ms;
    EXPECT_THROW(options.validate(), ConfigError);
}

TEST(RemoteSessionOptionsTest, ConstructorValidates) {
    boost::asio::io_context ioc;
    testing::FakeRemoteTransport transport;
    RemoteSessionOptions options = make_options();
    options.api_token.clear();
    EXPECT_THROW((RemoteSessionClient{ioc, transport, options}), ConfigError);
}

// ---- Lifecycle ----

TEST_F(RemoteSessionTest, StartOpensWithUrlAndToken) {
    client_.start();

    ASSERT_EQ(transport_.opens.size(), 1u);
    EXPECT_EQ(transport_.opens[0].url, "wss://api.example.test/v1");
    EXPECT_EQ(transport_.opens[0].bearer_token, "token-123");
    EXPECT_EQ(kinds(), (std::vector<Kind>{Kind::Starting, Kind::Connecting}));

    transport_.fire_open();
    EXPECT_EQ(events_.back().kind, Kind::Connected);
    EXPECT_TRUE(client_.is_connected());
}

TEST_F(RemoteSessionTest, UnexpectedCloseReconnectsAfterInterval) {
    client_.start();
    transport_.fire_open();
    transport_.fire_close(1006);

    const RemoteEvent* closed = last(Kind::Closed);
    ASSERT_NE(closed, nullptr);
    EXPECT_EQ(closed->close_code, 1006);
    const RemoteEvent* reconnecting = last(Kind::Reconnecting);
    ASSERT_NE(reconnecting, nullptr);
    EXPECT_EQ(reconnecting->interval, 20ms);
    EXPECT_EQ(transport_.opens.size(), 1u);

    run_for(500ms);

    ASSERT_EQ(transport_.opens.size(), 2u);
    EXPECT_GE(transport_.opens[1].at - transport_.opens[0].at, 20ms);
}

TEST_F(RemoteSessionTest, ReconnectsRepeatedlyWithoutBackoff) {
    client_.start();
    transport_.fire_close(1006);
    run_for(500ms);
    transport_.fire_close(1011);
    run_for(500ms);

    EXPECT_EQ(transport_.opens.size(), 3u);
    for (const auto& e : events_) {
        if (e.kind == Kind::Reconnecting) {
            EXPECT_EQ(e.interval, 20ms);
        }
    }
}

TEST_F(RemoteSessionTest, StopClosesWithConsumerCodeAndStaysClosed) {
    client_.start();
    transport_.fire_open();
    client_.stop();

    ASSERT_EQ(transport_.closes.size(), 1u);
    EXPECT_EQ(transport_.closes[0], CLOSED_BY_CONSUMER);
    EXPECT_EQ(last(Kind::Closed)->close_code, CLOSED_BY_CONSUMER);
    EXPECT_EQ(last(Kind::Reconnecting), nullptr);

    run_for(100ms);
    EXPECT_EQ(transport_.opens.size(), 1u);
}

TEST_F(RemoteSessionTest, StopCancelsPendingReconnect) {
    client_.start();
    transport_.fire_close(1006);
    client_.stop();

    run_for(100ms);
    EXPECT_EQ(transport_.opens.size(), 1u);
    EXPECT_EQ(events_.back().kind, Kind::Stopping);
}

TEST_F(RemoteSessionTest, ConsumerCloseCodeFromPeerDoesNotReconnect) {
    client_.start();
    transport_.fire_close(CLOSED_BY_CONSUMER);

    run_for(100ms);
    EXPECT_EQ(transport_.opens.size(), 1u);
    EXPECT_EQ(last(Kind::Reconnecting), nullptr);
}

TEST_F(RemoteSessionTest, OpenFailureReportsErrorAndRetries) {
    transport_.throw_on_open = true;
    client_.start();

    const RemoteEvent* error = last(Kind::Error);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->message,
              "Unable to open remote session: unusable URL: wss://api.example.test/v1");
    ASSERT_NE(last(Kind::Reconnecting), nullptr);

    transport_.throw_on_open = false;
    run_for(500ms);
    EXPECT_EQ(transport_.opens.size(), 1u);
}

// ---- Errors ----

TEST_F(RemoteSessionTest, UnauthorizedIsFlaggedAsAuthFailure) {
    client_.start();
    transport_.fire_error("Unexpected server response: 401", 401);

    const RemoteEvent* error = last(Kind::Error);
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(error->auth_failure);

    transport_.fire_error("Unexpected server response: 401");
    EXPECT_TRUE(last(Kind::Error)->auth_failure);

    transport_.fire_error("connection reset");
    EXPECT_FALSE(last(Kind::Error)->auth_failure);
}

// ---- Inbound messages ----

TEST_F(RemoteSessionTest, DataEventThenPerKeyDispatch) {
    std::vector<std::pair<std::string, std::string>> handled;
    std::vector<std::string> unhandled;
    client_.on_message("alexa.source", [&](const std::string& key, const Json& value) {
        handled.emplace_back(key, value.get_string("uuid"));
    });
    client_.on_unhandled_message([&](const std::string& key, const Json&) {
        unhandled.push_back(key);
    });

    client_.start();
    transport_.fire_open();
    transport_.fire_message(R"({"alexa.source": {"uuid": "cam-1"}, "hello": 1})");

    const RemoteEvent* data = last(Kind::Data);
    ASSERT_NE(data, nullptr);
    EXPECT_TRUE(data->payload.contains("hello"));

    ASSERT_EQ(handled.size(), 1u);
    EXPECT_EQ(handled[0].first, "alexa.source");
    EXPECT_EQ(handled[0].second, "cam-1");
    EXPECT_EQ(unhandled, (std::vector<std::string>{"hello"}));
}

TEST_F(RemoteSessionTest, NonObjectMessageOnlyRaisesData) {
    int calls = 0;
    client_.on_unhandled_message([&](const std::string&, const Json&) { ++calls; });

    client_.start();
    transport_.fire_message("[1, 2]");

    ASSERT_NE(last(Kind::Data), nullptr);
    EXPECT_EQ(calls, 0);
}

TEST_F(RemoteSessionTest, InvalidJsonRaisesErrorAndKeepsSession) {
    client_.start();
    transport_.fire_open();
    transport_.fire_message("{not json");

    const RemoteEvent* error = last(Kind::Error);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->message.rfind("Invalid message received from control plane: ", 0), 0u);
    EXPECT_EQ(last(Kind::Data), nullptr);
    EXPECT_TRUE(client_.is_connected());
    EXPECT_TRUE(transport_.closes.empty());
}

// ---- Outbound ----

TEST_F(RemoteSessionTest, SendRequiresOpenSession) {
    EXPECT_FALSE(client_.subscribe("alexa.source"));
    EXPECT_TRUE(transport_.sent.empty());

    client_.start();
    transport_.fire_open();
    EXPECT_TRUE(client_.subscribe("alexa.source"));
    EXPECT_TRUE(client_.subscribe(std::vector<std::string>{"a", "b"}));

    ASSERT_EQ(transport_.sent.size(), 2u);
    EXPECT_EQ(transport_.sent[0], R"({"sub":"alexa.source"})");
    EXPECT_EQ(transport_.sent[1], R"({"sub":["a","b"]})");

    transport_.fire_close(1006);
    EXPECT_FALSE(client_.subscribe("alexa.source"));
    EXPECT_EQ(transport_.sent.size(), 2u);
}

} // namespace
} // namespace ptzgw
