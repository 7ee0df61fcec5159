#include <gtest/gtest.h>
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/SqliteRecordStore.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/domain/TrackingSession.hpp"
#include "../core/sim/ManualExecutor.hpp"
#include "../core/sim/ManualTimerService.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../platform/desktop/DesktopSources.hpp"
#include "../platform/desktop/TraceReplay.hpp"
#include <memory>

using namespace geotrack;

class TraceReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        connectivity_ = std::make_shared<desktop::ReplayConnectivity>();
        store_ = std::make_shared<adapters::SqliteRecordStore>(":memory:");

        domain::SessionPorts ports;
        auto executor = std::make_shared<sim::InlineExecutor>();
        ports.locationProvider = std::make_shared<desktop::ReplayLocationProvider>();
        ports.motionSensors = std::make_shared<desktop::ReplayMotionSensors>();
        ports.geofenceRegistrar = std::make_shared<desktop::ReplayGeofenceRegistrar>(20);
        ports.timers = std::make_shared<sim::ManualTimerService>(clock_);
        ports.transport = std::make_shared<sim::MockTransport>();
        ports.connectivity = connectivity_;
        ports.store = store_;
        ports.sessionExecutor = executor;
        ports.storageExecutor = executor;
        ports.networkExecutor = executor;
        ports.clock = clock_;
        ports.eventBus = std::make_shared<domain::EventBus>();
        ports.policyFactory = [](const SyncConfig& sync) {
            return std::make_shared<adapters::DefaultPolicyEngine>(sync);
        };
        session_ = std::make_unique<domain::TrackingSession>(ports);

        TrackingConfig config;
        config.sync.autoSync = false;
        session_->configure(config);
        ASSERT_TRUE(session_->start());
    }

    bool replay(const std::string& line) {
        return desktop::replayTraceLine(line, *session_, *connectivity_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<desktop::ReplayConnectivity> connectivity_;
    std::shared_ptr<adapters::SqliteRecordStore> store_;
    std::unique_ptr<domain::TrackingSession> session_;
};

TEST_F(TraceReplayTest, LocationEntryReachesTheSession) {
    EXPECT_TRUE(replay(R"({"type":"location","ts":1704067200000,)"
                       R"("coords":{"latitude":52.1,"longitude":4.3,"accuracy":8}})"));

    auto snapshot = session_->snapshot();
    ASSERT_TRUE(snapshot.lastLocation.has_value());
    EXPECT_DOUBLE_EQ(snapshot.lastLocation->lat, 52.1);
    EXPECT_EQ(session_->count(), 1u);
}

TEST_F(TraceReplayTest, ConnectivityEntryUpdatesTransport) {
    EXPECT_TRUE(replay(R"({"type":"connectivity","transport":"cellular"})"));
    EXPECT_EQ(connectivity_->currentTransport(), TransportType::Cellular);
}

TEST_F(TraceReplayTest, WronglyTypedFieldsSkipTheLine) {
    bool accepted = true;
    EXPECT_NO_THROW(accepted = replay(R"({"type":"location","coords":{"latitude":"x","longitude":4.3}})"));
    EXPECT_FALSE(accepted);
    EXPECT_NO_THROW(accepted = replay(R"({"type":"activity","activity":"walking","confidence":"high"})"));
    EXPECT_FALSE(accepted);
    EXPECT_NO_THROW(accepted = replay(R"({"type":"geofence","identifier":"home","radius":"big"})"));
    EXPECT_FALSE(accepted);
    EXPECT_NO_THROW(accepted = replay(R"({"type":"wait","ms":"soon"})"));
    EXPECT_FALSE(accepted);

    EXPECT_FALSE(session_->snapshot().lastLocation.has_value());
    EXPECT_EQ(session_->count(), 0u);
    EXPECT_TRUE(session_->geofences().empty());
}

TEST_F(TraceReplayTest, UnusableLinesAreRejected) {
    EXPECT_FALSE(replay("not json"));
    EXPECT_FALSE(replay("[1, 2]"));
    EXPECT_FALSE(replay(R"({"type":"teleport"})"));
    EXPECT_FALSE(replay(R"({"type":"geofence","identifier":"home","latitude":52.1,"longitude":4.3,"radius":-5})"));

    // Replay continues after a bad line.
    EXPECT_TRUE(replay(R"({"type":"geofence","identifier":"home","latitude":52.1,"longitude":4.3,"radius":150})"));
    EXPECT_TRUE(session_->geofenceExists("home"));
}
