#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/Geo.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/SqliteRecordStore.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/domain/TrackingSession.hpp"
#include "../core/sim/ManualExecutor.hpp"
#include "../core/sim/ManualTimerService.hpp"
#include "../core/sim/MockPlatform.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <vector>

using namespace geotrack;
using domain::SessionState;
using domain::TrackingSession;

class TrackingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        timers_ = std::make_shared<sim::ManualTimerService>(clock_);
        provider_ = std::make_shared<sim::MockLocationProvider>();
        sensors_ = std::make_shared<sim::MockMotionSensors>();
        registrar_ = std::make_shared<sim::MockGeofenceRegistrar>(20);
        transport_ = std::make_shared<sim::MockTransport>();
        connectivity_ = std::make_shared<sim::MockConnectivity>();
        store_ = std::make_shared<adapters::SqliteRecordStore>(":memory:");
        eventBus_ = std::make_shared<domain::EventBus>();
        eventBus_->subscribe([this](const Event& event) { events_.push_back(event); });

        config_.elasticity.distanceFilter = 10.0;
        config_.elasticity.stationaryRadius = 25.0;
        config_.sync.autoSync = false;
    }

    std::unique_ptr<TrackingSession> makeSession() {
        domain::SessionPorts ports;
        auto executor = std::make_shared<sim::InlineExecutor>();
        ports.locationProvider = provider_;
        ports.motionSensors = sensors_;
        ports.geofenceRegistrar = registrar_;
        ports.timers = timers_;
        ports.transport = transport_;
        ports.connectivity = connectivity_;
        ports.store = store_;
        ports.sessionExecutor = executor;
        ports.storageExecutor = executor;
        ports.networkExecutor = executor;
        ports.clock = clock_;
        ports.eventBus = eventBus_;
        ports.policyFactory = [](const SyncConfig& sync) {
            return std::make_shared<adapters::DefaultPolicyEngine>(sync);
        };
        return std::make_unique<TrackingSession>(ports);
    }

    void startSession() {
        session_ = makeSession();
        session_->configure(config_);
        ASSERT_TRUE(session_->start());
    }

    LocationSample fixAt(double lat, double lon, double accuracy = 5.0, double speed = -1.0) {
        LocationSample fix;
        fix.lat = lat;
        fix.lon = lon;
        fix.accuracy = accuracy;
        fix.speed = speed;
        fix.timestamp = clock_->now();
        return fix;
    }

    std::vector<Event> collect(EventType type) {
        eventBus_->processEvents();
        std::vector<Event> matching;
        for (const auto& event : events_) {
            if (event.eventType == type) matching.push_back(event);
        }
        return matching;
    }

    void clearEvents() {
        eventBus_->processEvents();
        events_.clear();
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::ManualTimerService> timers_;
    std::shared_ptr<sim::MockLocationProvider> provider_;
    std::shared_ptr<sim::MockMotionSensors> sensors_;
    std::shared_ptr<sim::MockGeofenceRegistrar> registrar_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<sim::MockConnectivity> connectivity_;
    std::shared_ptr<adapters::SqliteRecordStore> store_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::unique_ptr<TrackingSession> session_;
    TrackingConfig config_;
    std::vector<Event> events_;
};

TEST_F(TrackingSessionTest, LifecycleFollowsConfigureStartStop) {
    session_ = makeSession();
    EXPECT_EQ(session_->state(), SessionState::Idle);

    EXPECT_FALSE(session_->start());
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::ConfigInvalid);

    session_->configure(config_);
    EXPECT_EQ(session_->state(), SessionState::Ready);

    ASSERT_TRUE(session_->start());
    EXPECT_EQ(session_->state(), SessionState::Tracking);
    EXPECT_TRUE(provider_->isActive());
    EXPECT_TRUE(sensors_->activityActive());

    session_->stop();
    EXPECT_EQ(session_->state(), SessionState::Idle);
    EXPECT_FALSE(provider_->isActive());
    EXPECT_FALSE(sensors_->activityActive());
    EXPECT_FALSE(sensors_->accelerometerActive());

    // The accepted configuration survives stop().
    EXPECT_TRUE(session_->start());
    EXPECT_EQ(session_->state(), SessionState::Tracking);
}

TEST_F(TrackingSessionTest, StartRequiresPermission) {
    provider_->setPermission(false);
    session_ = makeSession();
    session_->configure(config_);

    EXPECT_FALSE(session_->start());
    EXPECT_EQ(session_->state(), SessionState::Ready);
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::PermissionDenied);
}

TEST_F(TrackingSessionTest, InvalidConfigurationIsRejected) {
    session_ = makeSession();
    TrackingConfig bad = config_;
    bad.elasticity.distanceFilter = -1.0;

    EXPECT_THROW(session_->configure(bad), TrackingError);
    EXPECT_EQ(session_->state(), SessionState::Idle);
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::ConfigInvalid);
}

TEST_F(TrackingSessionTest, ProviderFollowsMotionState) {
    startSession();
    ASSERT_FALSE(provider_->startCalls().empty());
    EXPECT_EQ(provider_->lastStart().mode, ports::ProviderMode::LowPower);
    EXPECT_DOUBLE_EQ(provider_->lastStart().minDistance, 25.0);
    EXPECT_TRUE(sensors_->accelerometerActive());

    session_->changePace(true);
    EXPECT_EQ(provider_->lastStart().mode, ports::ProviderMode::HighAccuracy);
    EXPECT_DOUBLE_EQ(provider_->lastStart().minDistance, 10.0);
    EXPECT_FALSE(sensors_->accelerometerActive());

    // 20 m/s rounds to four elasticity steps.
    session_->onLocation(fixAt(52.0, 4.0, 5.0, 20.0));
    EXPECT_DOUBLE_EQ(provider_->lastStart().minDistance, 50.0);
    EXPECT_DOUBLE_EQ(session_->snapshot().effectiveDistanceFilter, 50.0);

    clearEvents();
    session_->changePace(false);
    EXPECT_EQ(provider_->lastStart().mode, ports::ProviderMode::LowPower);
    EXPECT_DOUBLE_EQ(provider_->lastStart().minDistance, 25.0);
    auto motion = collect(EventType::MotionChange);
    ASSERT_EQ(motion.size(), 1u);
    EXPECT_FALSE(motion[0].isMoving);
}

TEST_F(TrackingSessionTest, ActivityTransitionsDriveMotion) {
    startSession();
    clearEvents();

    ActivityTransition driving;
    driving.activity = ActivityType::InVehicle;
    driving.confidence = 90;
    driving.timestamp = clock_->now();
    session_->onActivity(driving);

    EXPECT_TRUE(session_->snapshot().isMoving);
    auto motion = collect(EventType::MotionChange);
    ASSERT_EQ(motion.size(), 1u);
    EXPECT_TRUE(motion[0].isMoving);
    EXPECT_EQ(collect(EventType::ActivityChange).size(), 1u);

    ActivityTransition still;
    still.activity = ActivityType::Still;
    still.confidence = 90;
    session_->onActivity(still);
    EXPECT_EQ(session_->snapshot().motionState, MotionState::PendingStop);

    timers_->advance(std::chrono::minutes(5));
    EXPECT_FALSE(session_->snapshot().isMoving);
    EXPECT_EQ(provider_->lastStart().mode, ports::ProviderMode::LowPower);
}

TEST_F(TrackingSessionTest, OdometerAccumulatesOnlyWhileMoving) {
    startSession();

    session_->onLocation(fixAt(52.0, 4.0));
    clock_->advance(std::chrono::seconds(30));
    auto second = Geo::moveLocation(fixAt(52.0, 4.0), 90.0, 100.0);
    second.accuracy = 5.0;
    second.timestamp = clock_->now();
    session_->onLocation(second);
    EXPECT_DOUBLE_EQ(session_->odometer(), 0.0);

    session_->changePace(true);
    clock_->advance(std::chrono::seconds(30));
    auto third = Geo::moveLocation(second, 90.0, 200.0);
    third.timestamp = clock_->now();
    session_->onLocation(third);
    EXPECT_NEAR(session_->odometer(), 200.0, 1.0);

    session_->setOdometer(0.0);
    EXPECT_DOUBLE_EQ(session_->odometer(), 0.0);
    session_->setOdometer(-5.0);
    EXPECT_DOUBLE_EQ(session_->odometer(), 0.0);
}

TEST_F(TrackingSessionTest, AcceptedFixesArePersistedAndAnnounced) {
    startSession();
    clearEvents();

    session_->onLocation(fixAt(52.0, 4.0));
    session_->onLocation(fixAt(52.001, 4.0));

    EXPECT_EQ(session_->count(), 2u);
    auto locations = collect(EventType::Location);
    ASSERT_EQ(locations.size(), 2u);
    ASSERT_TRUE(locations[0].record.has_value());
    EXPECT_EQ(locations[0].record->id, 1);

    ports::RecordQuery query;
    auto records = session_->records(query);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[1].body["coords"]["latitude"].get<double>(), 52.001);
}

TEST_F(TrackingSessionTest, DiscardPolicyReportsEachRejection) {
    config_.filter.policy = FilterPolicy::Discard;
    config_.filter.trackingAccuracyThreshold = 50.0;
    startSession();
    clearEvents();

    session_->onLocation(fixAt(52.0, 4.0, 120.0));

    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::FilterRejected);
    EXPECT_TRUE(collect(EventType::Location).empty());
    EXPECT_EQ(session_->count(), 0u);
    EXPECT_EQ(session_->snapshot().rejectedFixes, 1u);
}

TEST_F(TrackingSessionTest, GeofencesModeRecordsTransitionsOnly) {
    session_ = makeSession();
    session_->configure(config_);

    GeofenceRegion home;
    home.identifier = "home";
    home.lat = 52.0;
    home.lon = 4.0;
    home.radius = 200.0;
    ASSERT_TRUE(session_->addGeofence(home));
    ASSERT_TRUE(session_->startGeofences());
    EXPECT_EQ(session_->snapshot().trackingMode, TrackingMode::Geofences);
    clearEvents();

    session_->onLocation(fixAt(52.0, 4.0));

    EXPECT_TRUE(collect(EventType::Location).empty());
    auto geofenceEvents = collect(EventType::Geofence);
    ASSERT_EQ(geofenceEvents.size(), 1u);
    EXPECT_EQ(geofenceEvents[0].geofence->identifier, "home");
    EXPECT_EQ(geofenceEvents[0].geofence->action, GeofenceAction::Enter);

    ASSERT_EQ(session_->count(), 1u);
    auto records = session_->records(ports::RecordQuery{});
    EXPECT_EQ(records[0].kind, RecordKind::Geofence);
    EXPECT_TRUE(registrar_->isRegistered("home"));
}

TEST_F(TrackingSessionTest, GeofenceValidation) {
    session_ = makeSession();
    session_->configure(config_);

    GeofenceRegion noName;
    EXPECT_FALSE(session_->addGeofence(noName));

    GeofenceRegion badRadius;
    badRadius.identifier = "flat";
    badRadius.radius = 0.0;
    EXPECT_FALSE(session_->addGeofence(badRadius));

    GeofenceRegion offPlanet;
    offPlanet.identifier = "nowhere";
    offPlanet.lat = 91.0;
    EXPECT_FALSE(session_->addGeofence(offPlanet));

    EXPECT_EQ(collect(EventType::Error).size(), 3u);
    EXPECT_TRUE(session_->geofences().empty());

    GeofenceRegion office;
    office.identifier = "office";
    office.lat = 52.1;
    office.lon = 4.3;
    ASSERT_TRUE(session_->addGeofence(office));
    EXPECT_TRUE(session_->geofenceExists("office"));
    ASSERT_TRUE(session_->getGeofence("office").has_value());
    EXPECT_DOUBLE_EQ(session_->getGeofence("office")->lat, 52.1);
    EXPECT_EQ(store_->loadGeofences().size(), 1u);

    EXPECT_TRUE(session_->removeGeofence("office"));
    EXPECT_FALSE(session_->removeGeofence("office"));
    EXPECT_TRUE(store_->loadGeofences().empty());
}

TEST_F(TrackingSessionTest, StopOnStationaryEndsTracking) {
    config_.motion.stopOnStationary = true;
    startSession();

    session_->changePace(true);
    EXPECT_EQ(session_->state(), SessionState::Tracking);
    session_->changePace(false);
    EXPECT_EQ(session_->state(), SessionState::Idle);
    EXPECT_FALSE(provider_->isActive());
}

TEST_F(TrackingSessionTest, AutoStopAfterElapsedMinutes) {
    config_.app.stopAfterElapsedMinutes = 10;
    startSession();

    timers_->advance(std::chrono::minutes(9));
    EXPECT_EQ(session_->state(), SessionState::Tracking);
    timers_->advance(std::chrono::minutes(1));
    EXPECT_EQ(session_->state(), SessionState::Idle);
}

TEST_F(TrackingSessionTest, ScheduleOpensAndClosesSources) {
    // The simulated clock starts on a Monday at midnight UTC.
    config_.schedule.entries = {"1-5 09:00-17:00"};
    config_.schedule.useUtc = true;
    startSession();

    auto snapshot = session_->snapshot();
    EXPECT_EQ(snapshot.state, SessionState::Tracking);
    EXPECT_TRUE(snapshot.schedulerEnabled);
    EXPECT_FALSE(snapshot.enabled);
    EXPECT_FALSE(provider_->isActive());
    auto initial = collect(EventType::Schedule);
    ASSERT_EQ(initial.size(), 1u);
    EXPECT_FALSE(initial[0].enabled);

    // Fixes outside the window are dropped.
    session_->onLocation(fixAt(52.0, 4.0));
    EXPECT_EQ(session_->count(), 0u);
    clearEvents();

    timers_->advance(std::chrono::hours(9));
    EXPECT_TRUE(session_->snapshot().enabled);
    EXPECT_TRUE(provider_->isActive());
    auto opened = collect(EventType::Schedule);
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_TRUE(opened[0].enabled);
    clearEvents();

    timers_->advance(std::chrono::hours(8));
    EXPECT_FALSE(session_->snapshot().enabled);
    EXPECT_FALSE(provider_->isActive());
    EXPECT_EQ(session_->state(), SessionState::Tracking);
    auto closed = collect(EventType::Schedule);
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_FALSE(closed[0].enabled);
}

TEST_F(TrackingSessionTest, HeartbeatWhileActive) {
    config_.app.heartbeatInterval = std::chrono::seconds(60);
    startSession();
    session_->onLocation(fixAt(52.0, 4.0));
    clearEvents();

    timers_->advance(std::chrono::minutes(3));
    auto beats = collect(EventType::Heartbeat);
    ASSERT_EQ(beats.size(), 3u);
    ASSERT_TRUE(beats[0].location.has_value());
    EXPECT_DOUBLE_EQ(beats[0].location->lat, 52.0);

    session_->stop();
    clearEvents();
    timers_->advance(std::chrono::minutes(3));
    EXPECT_TRUE(collect(EventType::Heartbeat).empty());
}

TEST_F(TrackingSessionTest, HeartbeatFiresDwell) {
    config_.app.heartbeatInterval = std::chrono::seconds(60);
    config_.geofence.dwellDelay = std::chrono::minutes(2);
    startSession();

    GeofenceRegion cafe;
    cafe.identifier = "cafe";
    cafe.lat = 52.0;
    cafe.lon = 4.0;
    cafe.radius = 100.0;
    cafe.notifyOnDwell = true;
    ASSERT_TRUE(session_->addGeofence(cafe));
    session_->onLocation(fixAt(52.0, 4.0));
    clearEvents();

    timers_->advance(std::chrono::minutes(2));
    auto geofenceEvents = collect(EventType::Geofence);
    ASSERT_EQ(geofenceEvents.size(), 1u);
    EXPECT_EQ(geofenceEvents[0].geofence->action, GeofenceAction::Dwell);
}

TEST_F(TrackingSessionTest, StateIsRestoredFromStore) {
    startSession();
    GeofenceRegion depot;
    depot.identifier = "depot";
    depot.lat = 51.9;
    depot.lon = 4.4;
    ASSERT_TRUE(session_->addGeofence(depot));
    session_->setOdometer(1234.0);
    session_->onLocation(fixAt(52.0, 4.0));
    session_->stop();
    session_.reset();

    session_ = makeSession();
    EXPECT_DOUBLE_EQ(session_->odometer(), 1234.0);
    EXPECT_TRUE(session_->geofenceExists("depot"));
    EXPECT_EQ(session_->count(), 1u);
}

TEST_F(TrackingSessionTest, SyncNowUploadsRecords) {
    config_.sync.url = "http://localhost/locations";
    config_.sync.batchSync = true;
    startSession();
    session_->onLocation(fixAt(52.0, 4.0));
    session_->onLocation(fixAt(52.001, 4.0));
    EXPECT_EQ(transport_->requestCount(), 0u);

    session_->syncNow();
    EXPECT_EQ(transport_->requestCount(), 1u);
    EXPECT_EQ(session_->count(false), 0u);
    EXPECT_EQ(session_->count(true), 2u);
}

TEST_F(TrackingSessionTest, AutoSyncAfterEachInsert) {
    config_.sync.url = "http://localhost/locations";
    config_.sync.autoSync = true;
    startSession();

    session_->onLocation(fixAt(52.0, 4.0));
    EXPECT_EQ(transport_->requestCount(), 1u);
}

TEST_F(TrackingSessionTest, ConnectivityRestoresPendingSync) {
    config_.sync.url = "http://localhost/locations";
    startSession();
    connectivity_->setTransport(TransportType::None);
    session_->onLocation(fixAt(52.0, 4.0));
    session_->syncNow();
    EXPECT_EQ(transport_->requestCount(), 0u);
    clearEvents();

    connectivity_->setTransport(TransportType::Wifi);
    session_->onConnectivityChanged(TransportType::Wifi);
    EXPECT_EQ(transport_->requestCount(), 1u);
    auto changes = collect(EventType::ConnectivityChange);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].transport, TransportType::Wifi);
}

TEST_F(TrackingSessionTest, SourceErrorsAreReported) {
    startSession();
    clearEvents();

    session_->onSourceError(domain::SourceKind::Location, "gps off");
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::ProviderUnavailable);
    EXPECT_FALSE(session_->snapshot().providerActive);
}

TEST_F(TrackingSessionTest, ClearAndPruneRecords) {
    config_.retention.maxRecordsToPersist = 2;
    startSession();
    for (int i = 0; i < 3; ++i) {
        session_->onLocation(fixAt(52.0 + i * 0.001, 4.0));
    }
    session_->pruneNow();
    EXPECT_LE(session_->count(), 2u);

    session_->clearRecords();
    EXPECT_EQ(session_->count(), 0u);
}

TEST_F(TrackingSessionTest, InsertedLocationsBypassTheFilter) {
    config_.filter.policy = FilterPolicy::Discard;
    config_.filter.trackingAccuracyThreshold = 50.0;
    session_ = makeSession();
    session_->configure(config_);
    clearEvents();

    auto id = session_->insertLocation(fixAt(52.0, 4.0, 500.0));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(session_->count(), 1u);
    EXPECT_TRUE(collect(EventType::Error).empty());

    ports::RecordQuery query;
    auto stored = session_->records(query);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].id, *id);
    EXPECT_DOUBLE_EQ(stored[0].body["coords"]["accuracy"].get<double>(), 500.0);

    EXPECT_FALSE(session_->insertLocation(fixAt(95.0, 4.0)).has_value());
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::ConfigInvalid);

    EXPECT_TRUE(session_->destroyLocation(*id));
    EXPECT_EQ(session_->count(), 0u);
    EXPECT_FALSE(session_->destroyLocation(*id));
}

TEST_F(TrackingSessionTest, DestroyLocationRemovesOnlyThatRecord) {
    startSession();
    auto first = session_->insertLocation(fixAt(52.0, 4.0));
    auto second = session_->insertLocation(fixAt(52.001, 4.0));
    ASSERT_TRUE(first && second);

    EXPECT_TRUE(session_->destroyLocation(*first));
    ports::RecordQuery query;
    auto remaining = session_->records(query);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, *second);
}

TEST_F(TrackingSessionTest, ScheduleCanBeStartedAndStoppedOnItsOwn) {
    session_ = makeSession();
    session_->configure(config_);
    EXPECT_FALSE(session_->startSchedule());
    auto errors = collect(EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error->kind, ErrorKind::ConfigInvalid);

    // The simulated clock starts on a Monday at midnight UTC.
    config_.schedule.entries = {"1-5 09:00-17:00"};
    config_.schedule.useUtc = true;
    session_->configure(config_);
    ASSERT_TRUE(session_->startSchedule());
    EXPECT_EQ(session_->state(), SessionState::Tracking);
    EXPECT_TRUE(session_->snapshot().schedulerEnabled);
    EXPECT_FALSE(provider_->isActive());

    timers_->advance(std::chrono::hours(9));
    EXPECT_TRUE(provider_->isActive());

    session_->stopSchedule();
    EXPECT_FALSE(session_->snapshot().schedulerEnabled);
    EXPECT_EQ(session_->state(), SessionState::Tracking);

    // No window edge closes the sources once the scheduler is off.
    timers_->advance(std::chrono::hours(9));
    EXPECT_TRUE(provider_->isActive());
    EXPECT_TRUE(session_->snapshot().enabled);

    session_->stop();
    EXPECT_EQ(session_->state(), SessionState::Idle);
    EXPECT_FALSE(provider_->isActive());
}

TEST_F(TrackingSessionTest, ProviderChangesAreAnnounced) {
    startSession();
    auto started = collect(EventType::ProviderChange);
    ASSERT_EQ(started.size(), 1u);
    ASSERT_TRUE(started[0].provider.has_value());
    EXPECT_TRUE(started[0].provider->active);
    EXPECT_TRUE(started[0].provider->permissionGranted);
    EXPECT_FALSE(started[0].provider->highAccuracy);
    EXPECT_DOUBLE_EQ(started[0].provider->distanceFilter, 25.0);
    clearEvents();

    session_->changePace(true);
    auto moving = collect(EventType::ProviderChange);
    ASSERT_EQ(moving.size(), 1u);
    EXPECT_TRUE(moving[0].provider->highAccuracy);
    clearEvents();

    session_->onSourceError(domain::SourceKind::Location, "gps off");
    auto lost = collect(EventType::ProviderChange);
    ASSERT_EQ(lost.size(), 1u);
    EXPECT_FALSE(lost[0].provider->active);
    EXPECT_FALSE(lost[0].enabled);

    auto json = JsonCodec::eventToJson(lost[0]);
    EXPECT_EQ(json["event"], "providerchange");
    EXPECT_EQ(json["enabled"], false);
    EXPECT_EQ(json["mode"], "high_accuracy");

    session_->stop();
    clearEvents();
    provider_->setPermission(false);
    EXPECT_FALSE(session_->start());
    auto denied = collect(EventType::ProviderChange);
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_FALSE(denied[0].provider->permissionGranted);
}
