#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ptzgw/camera_session.hpp"
#include "ptzgw/constants.hpp"
#include "mock_device_client.hpp"

namespace ptzgw {
namespace {

CameraDescriptor make_descriptor(const std::string& uuid, const std::string& host) {
    CameraDescriptor d;
    d.uuid = uuid;
    d.name = "Camera " + uuid;
    d.uri  = "rtsp://" + host + ":554/stream";
    return d;
}

/// Fixture providing a CameraSession backed by one MockDevice and
/// recording every emitted event.
class CameraSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_  = std::make_shared<testing::MockDevice>();
        session_ = std::make_unique<CameraSession>(
            testing::MockDevice::factory(device_), "admin", "password");
        session_->add_listener([this](const CameraEvent& e) { events_.push_back(e); });
    }

    void initialize() {
        session_->initialize(make_descriptor("cam-1", "10.0.0.5"));
        device_->clear_calls();
        events_.clear();
    }

    std::vector<CameraEvent::Kind> kinds() const {
        std::vector<CameraEvent::Kind> result;
        for (const auto& e : events_) result.push_back(e.kind);
        return result;
    }

    std::shared_ptr<testing::MockDevice> device_;
    std::unique_ptr<CameraSession> session_;
    std::vector<CameraEvent> events_;
};

// ---- Initialization ----

TEST_F(CameraSessionTest, StartsUninitialized) {
    EXPECT_EQ(session_->state(), SessionState::Uninitialized);
    EXPECT_FALSE(session_->is_initialized());
    EXPECT_FALSE(session_->is_ptz_supported());
    EXPECT_EQ(session_->active_state(), nullptr);
}

TEST_F(CameraSessionTest, InitializeBuildsStateAndEmits) {
    CameraState state = session_->initialize(make_descriptor("cam-1", "10.0.0.5"));

    EXPECT_EQ(state.uuid(), "cam-1");
    EXPECT_EQ(state.name(), "Camera cam-1");
    EXPECT_EQ(state.manufacturer(), "Acme");
    EXPECT_TRUE(state.ptz());
    ASSERT_EQ(state.presets().size(), 2u);
    EXPECT_EQ(state.presets()[1].token, "p2");

    EXPECT_EQ(session_->state(), SessionState::ReadyPtz);
    EXPECT_TRUE(session_->is_initialized());
    EXPECT_TRUE(session_->is_ptz_supported());
    ASSERT_NE(session_->active_state(), nullptr);
    EXPECT_EQ(session_->active_state()->uuid(), "cam-1");

    auto k = kinds();
    ASSERT_EQ(k.size(), 2u);
    EXPECT_EQ(k[0], CameraEvent::Kind::Uninitialized);
    EXPECT_EQ(k[1], CameraEvent::Kind::Initialized);
    ASSERT_NE(events_[1].state, nullptr);
    EXPECT_EQ(events_[1].state->uuid(), "cam-1");
}

TEST_F(CameraSessionTest, InitializeUsesEndpointFromDescriptor) {
    session_->initialize(make_descriptor("cam-1", "10.0.0.5"));

    auto endpoints = device_->endpoints();
    ASSERT_EQ(endpoints.size(), 1u);
    EXPECT_EQ(endpoints[0].address, "http://10.0.0.5/onvif/device_service");
    EXPECT_EQ(endpoints[0].username, "admin");
    EXPECT_EQ(endpoints[0].password, "password");
}

TEST_F(CameraSessionTest, InitializeWithoutPtzSkipsPresets) {
    device_->ptz = false;
    CameraState state = session_->initialize(make_descriptor("cam-1", "10.0.0.5"));

    EXPECT_FALSE(state.ptz());
    EXPECT_TRUE(state.presets().empty());
    EXPECT_EQ(session_->state(), SessionState::ReadyNoPtz);
    for (const auto& call : device_->calls()) {
        EXPECT_NE(call.name, "presets");
    }
}

TEST_F(CameraSessionTest, InitializeFailureThrowsAndLeavesNotReady) {
    device_->init_error = "connection refused";

    try {
        session_->initialize(make_descriptor("cam-1", "10.0.0.5"));
        FAIL() << "Expected DeviceConnectionError";
    } catch (const DeviceConnectionError& e) {
        EXPECT_EQ(e.cause(), "connection refused");
        EXPECT_EQ(e.descriptor().uuid, "cam-1");
        EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
    }

    EXPECT_EQ(session_->state(), SessionState::Failed);
    EXPECT_FALSE(session_->is_initialized());
    EXPECT_EQ(session_->active_state(), nullptr);
    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Error);
}

TEST_F(CameraSessionTest, PresetFetchFailureFailsInitialization) {
    device_->presets_error = "GetPresets fault";
    EXPECT_THROW(session_->initialize(make_descriptor("cam-1", "10.0.0.5")),
                 DeviceConnectionError);
    EXPECT_FALSE(session_->is_initialized());
}

TEST_F(CameraSessionTest, MissingUriFailsInitialization) {
    CameraDescriptor d;
    d.uuid = "cam-x";
    EXPECT_THROW(session_->initialize(d), DeviceConnectionError);
    EXPECT_TRUE(device_->endpoints().empty());
}

TEST_F(CameraSessionTest, ReinitializeReplacesPreviousCamera) {
    initialize();
    device_->ptz = false;

    session_->initialize(make_descriptor("cam-2", "10.0.0.6"));
    EXPECT_EQ(session_->active_state()->uuid(), "cam-2");
    EXPECT_FALSE(session_->is_ptz_supported());
    EXPECT_THROW(session_->stop(), UnsupportedError);
}

TEST_F(CameraSessionTest, FailedReinitializeClearsPreviousCamera) {
    initialize();
    device_->init_error = "timeout";

    EXPECT_THROW(session_->initialize(make_descriptor("cam-2", "10.0.0.6")),
                 DeviceConnectionError);
    EXPECT_THROW(session_->stop(), NotReadyError);
}

TEST_F(CameraSessionTest, SupersededInitializeIsDiscarded) {
    auto slow = std::make_shared<testing::MockDevice>();
    slow->info.model = "Slow";
    slow->block_init();
    auto fast = std::make_shared<testing::MockDevice>();
    fast->info.model = "Fast";

    CameraSession session([slow, fast](const DeviceEndpoint& ep)
                              -> std::unique_ptr<IDeviceClient> {
        if (ep.address.find("10.0.0.1") != std::string::npos) {
            return std::make_unique<testing::MockDeviceClient>(slow);
        }
        return std::make_unique<testing::MockDeviceClient>(fast);
    });

    bool superseded = false;
    std::thread first([&]() {
        try {
            session.initialize(make_descriptor("old", "10.0.0.1"));
        } catch (const SupersededError&) {
            superseded = true;
        }
    });

    ASSERT_TRUE(slow->wait_init_entered());
    CameraState newer = session.initialize(make_descriptor("new", "10.0.0.2"));
    slow->release_init();
    first.join();

    EXPECT_TRUE(superseded);
    EXPECT_EQ(newer.uuid(), "new");
    ASSERT_NE(session.active_state(), nullptr);
    EXPECT_EQ(session.active_state()->uuid(), "new");
    EXPECT_EQ(session.state(), SessionState::ReadyPtz);
}

// ---- Readiness guards ----

TEST_F(CameraSessionTest, CommandsBeforeInitializeAreNotReady) {
    EXPECT_THROW(session_->stop(), NotReadyError);
    EXPECT_THROW(session_->goto_home(), NotReadyError);
    EXPECT_THROW(session_->goto_preset("p1"), NotReadyError);
    EXPECT_THROW(session_->pan(1), NotReadyError);
    EXPECT_THROW(session_->ptz(1, 1, 1), NotReadyError);
    EXPECT_TRUE(device_->commands().empty());
}

TEST_F(CameraSessionTest, NotReadyMessageNamesTheAction) {
    try {
        session_->stop();
        FAIL() << "Expected NotReadyError";
    } catch (const NotReadyError& e) {
        EXPECT_STREQ(e.what(),
                     "Unable to stop camera movement; the camera is not initialized.");
    }
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].kind, CameraEvent::Kind::Error);
    EXPECT_EQ(events_[0].message,
              "Unable to stop camera movement; the camera is not initialized.");
}

TEST_F(CameraSessionTest, CommandsWithoutPtzAreUnsupported) {
    device_->ptz = false;
    initialize();

    EXPECT_THROW(session_->goto_home(), UnsupportedError);
    EXPECT_THROW(session_->tilt(-2), UnsupportedError);
    EXPECT_TRUE(device_->commands().empty());
}

// ---- Commands ----

TEST_F(CameraSessionTest, StopEmitsStop) {
    initialize();
    session_->stop();

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].name, "stop");
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].kind, CameraEvent::Kind::Stop);
}

TEST_F(CameraSessionTest, GotoHome) {
    initialize();
    session_->goto_home();

    ASSERT_EQ(device_->commands().size(), 1u);
    EXPECT_EQ(device_->commands()[0].name, "home");
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Home);
}

TEST_F(CameraSessionTest, PanQuantizesAndUsesDeviceTimeout) {
    initialize();
    session_->pan(-2);

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].name, "move");
    EXPECT_DOUBLE_EQ(commands[0].velocity.x, -PAN_MEDIUM_SPEED);
    EXPECT_DOUBLE_EQ(commands[0].velocity.y, 0.0);
    EXPECT_DOUBLE_EQ(commands[0].velocity.z, 0.0);
    EXPECT_EQ(commands[0].timeout, CONTINUOUS_MOVE_TIMEOUT);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].kind, CameraEvent::Kind::Pan);
    EXPECT_DOUBLE_EQ(events_[0].pan, -0.5);
}

TEST_F(CameraSessionTest, TiltAndZoomMoveOneAxis) {
    initialize();
    session_->tilt(3);
    session_->zoom(-1);

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_DOUBLE_EQ(commands[0].velocity.y, TILT_HIGH_SPEED);
    EXPECT_DOUBLE_EQ(commands[0].velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(commands[1].velocity.z, -ZOOM_LOW_SPEED);
    EXPECT_EQ(events_[0].kind, CameraEvent::Kind::Tilt);
    EXPECT_EQ(events_[1].kind, CameraEvent::Kind::Zoom);
}

TEST_F(CameraSessionTest, PtzMovesAllAxes) {
    initialize();
    session_->ptz(1, -3, 2);

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_DOUBLE_EQ(commands[0].velocity.x, 0.2);
    EXPECT_DOUBLE_EQ(commands[0].velocity.y, -1.0);
    EXPECT_DOUBLE_EQ(commands[0].velocity.z, 0.5);
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Ptz);
    EXPECT_DOUBLE_EQ(events_.back().tilt, -1.0);
}

TEST_F(CameraSessionTest, ZeroLevelSendsZeroVelocity) {
    initialize();
    session_->pan(0);

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_DOUBLE_EQ(commands[0].velocity.x, 0.0);
}

// ---- Presets ----

TEST_F(CameraSessionTest, PresetByTokenPassesThrough) {
    initialize();
    session_->goto_preset("vendor-token");

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].name, "preset");
    EXPECT_EQ(commands[0].token, "vendor-token");
    EXPECT_DOUBLE_EQ(commands[0].velocity.x, PRESET_SPEED);
    EXPECT_DOUBLE_EQ(commands[0].velocity.z, PRESET_SPEED);
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Preset);
    EXPECT_EQ(events_.back().token, "vendor-token");
}

TEST_F(CameraSessionTest, PresetByIndexResolvesCachedToken) {
    initialize();
    session_->goto_preset("#1");

    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].token, "p2");
    EXPECT_EQ(events_.back().token, "p2");
}

TEST_F(CameraSessionTest, InvalidPresetIndexNeverReachesDevice) {
    initialize();
    EXPECT_THROW(session_->goto_preset("#2"), InvalidPresetError);
    EXPECT_THROW(session_->goto_preset("#-1"), InvalidPresetError);
    EXPECT_THROW(session_->goto_preset("#abc"), InvalidPresetError);
    EXPECT_THROW(session_->goto_preset("#"), InvalidPresetError);
    EXPECT_THROW(session_->goto_preset(""), InvalidPresetError);
    EXPECT_TRUE(device_->commands().empty());
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Error);
}

TEST_F(CameraSessionTest, SinglePresetCacheBoundsIndex) {
    device_->presets = {{"only", "Solo"}};
    initialize();

    session_->goto_preset("#0");
    auto commands = device_->commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].token, "only");

    device_->clear_calls();
    EXPECT_THROW(session_->goto_preset("#1"), InvalidPresetError);
    EXPECT_TRUE(device_->commands().empty());
    EXPECT_EQ(events_.back().kind, CameraEvent::Kind::Error);
}

// ---- Device failures ----

TEST_F(CameraSessionTest, DeviceFailureBecomesCommandError) {
    initialize();
    device_->command_error = "SOAP fault";

    try {
        session_->goto_home();
        FAIL() << "Expected DeviceCommandError";
    } catch (const DeviceCommandError& e) {
        EXPECT_NE(std::string(e.what()).find("SOAP fault"), std::string::npos);
    }
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].kind, CameraEvent::Kind::Error);

    // The session stays usable.
    device_->command_error.clear();
    EXPECT_NO_THROW(session_->stop());
}

} // namespace
} // namespace ptzgw
