#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/Log.hpp"
#include "../core/Schedule.hpp"
#include "../core/TrackingConfig.hpp"
#include "../core/sim/SimulatedClock.hpp"

using namespace geotrack;

namespace {

TimePoint at(int dayOffset, int hour, int minute) {
    // SimulatedClock::defaultStart() is Monday 2024-01-01 00:00 UTC.
    return sim::SimulatedClock::defaultStart() + std::chrono::hours(24 * dayOffset + hour) +
           std::chrono::minutes(minute);
}

} // namespace

TEST(TrackingConfigTest, DefaultsAreValid) {
    TrackingConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.elasticity.distanceFilter, 10.0);
    EXPECT_FALSE(config.sync.enabled());
    EXPECT_EQ(config.motion.stopTimeout, std::chrono::minutes(5));
}

TEST(TrackingConfigTest, ParsesSections) {
    auto json = nlohmann::json::parse(R"({
        "geo": {"distanceFilter": 20, "stationaryRadius": 50, "elasticityMultiplier": 2},
        "filter": {"policy": "discard", "trackingAccuracyThreshold": 100},
        "motion": {"stopTimeout": 3, "minimumActivityRecognitionConfidence": 60},
        "geofence": {"maxMonitoredGeofences": 5, "geofenceModeKnockOut": true},
        "persistence": {"persistMode": "location", "maxRecordsToPersist": 100, "extras": {"fleet": "north"}},
        "http": {"url": "http://localhost:8080/locations", "method": "PUT", "batchSync": true,
                 "maxBatchSize": 50, "locationsOrderDirection": "DESC", "headers": {"X-Api-Key": "k"}},
        "app": {"schedule": ["1-5 09:00-17:00"], "scheduleUseUtc": true, "heartbeatInterval": 60},
        "logger": {"logLevel": "debug"}
    })");

    auto config = TrackingConfig::fromJson(json);
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.elasticity.distanceFilter, 20.0);
    EXPECT_DOUBLE_EQ(config.elasticity.elasticityMultiplier, 2.0);
    EXPECT_EQ(config.filter.policy, FilterPolicy::Discard);
    EXPECT_EQ(config.motion.stopTimeout, std::chrono::minutes(3));
    EXPECT_EQ(config.motion.minimumActivityConfidence, 60);
    EXPECT_EQ(config.geofence.maxMonitored, 5);
    EXPECT_TRUE(config.geofence.knockOut);
    EXPECT_EQ(config.retention.persistMode, PersistMode::LocationOnly);
    EXPECT_EQ(config.retention.extras["fleet"], "north");
    EXPECT_EQ(config.sync.method, HttpMethod::Put);
    EXPECT_EQ(config.sync.order, SortOrder::Descending);
    EXPECT_EQ(config.sync.batchLimit(), 50u);
    EXPECT_EQ(config.sync.headers.at("X-Api-Key"), "k");
    EXPECT_EQ(config.schedule.entries.size(), 1u);
    EXPECT_EQ(config.app.heartbeatInterval, std::chrono::seconds(60));
    EXPECT_EQ(config.logger.level, LogLevel::Debug);
}

TEST(TrackingConfigTest, RejectsWrongTypesAndUnknownEnums) {
    EXPECT_THROW(TrackingConfig::fromJson(nlohmann::json::array()), TrackingError);
    EXPECT_THROW(TrackingConfig::fromJson(nlohmann::json::parse(R"({"geo": {"distanceFilter": "far"}})")),
                 TrackingError);
    EXPECT_THROW(TrackingConfig::fromJson(nlohmann::json::parse(R"({"filter": {"policy": "maybe"}})")),
                 TrackingError);
    EXPECT_THROW(TrackingConfig::fromJson(nlohmann::json::parse(R"({"http": {"method": "GET"}})")),
                 TrackingError);
}

TEST(TrackingConfigTest, ValidateNamesTheInvalidField) {
    TrackingConfig config;
    config.elasticity.distanceFilter = -1.0;
    try {
        config.validate();
        FAIL() << "negative distance filter accepted";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
        EXPECT_NE(e.detail().find("distanceFilter"), std::string::npos);
    }

    TrackingConfig badSchedule;
    badSchedule.schedule.entries = {"monday 9-5"};
    EXPECT_THROW(badSchedule.validate(), TrackingError);

    TrackingConfig badTemplate;
    badTemplate.retention.locationTemplate = "{\"lat\": <%= latitude %>";
    EXPECT_THROW(badTemplate.validate(), TrackingError);
}

TEST(TrackingConfigTest, BatchLimit) {
    SyncConfig sync;
    sync.batchSync = false;
    sync.maxBatchSize = 500;
    EXPECT_EQ(sync.batchLimit(), 1u);

    sync.batchSync = true;
    sync.maxBatchSize = -1;
    EXPECT_EQ(sync.batchLimit(), 1000u);
}

TEST(ScheduleTest, ParsesWindows) {
    auto window = ScheduleWindow::parse("1-5 09:00-17:30");
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->dayStart, 1);
    EXPECT_EQ(window->dayEnd, 5);
    EXPECT_EQ(window->startMinute, 9 * 60);
    EXPECT_EQ(window->endMinute, 17 * 60 + 30);

    EXPECT_FALSE(ScheduleWindow::parse("5-1 09:00-17:00").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("1-5 17:00-09:00").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("0-5 09:00-17:00").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("1-5 09:00-17:00 extra").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("1-5 9h-17h").has_value());
}

TEST(ScheduleTest, OversizedNumbersAreInvalid) {
    EXPECT_FALSE(ScheduleWindow::parse("1-7 99999999999:00-10:00").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("1-7 09:00-10:99999999999").has_value());
    EXPECT_FALSE(ScheduleWindow::parse("00000000001-7 09:00-10:00").has_value());

    try {
        Schedule::fromEntries({"1-7 99999999999:00-10:00"}, true);
        FAIL() << "expected TrackingError";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
    }
}

TEST(ScheduleTest, ActiveInsideWindowOnly) {
    auto schedule = Schedule::fromEntries({"1-5 09:00-17:00"}, true);
    EXPECT_FALSE(schedule.isActive(at(0, 8, 59)));
    EXPECT_TRUE(schedule.isActive(at(0, 9, 0)));
    EXPECT_TRUE(schedule.isActive(at(4, 16, 59)));
    EXPECT_FALSE(schedule.isActive(at(4, 17, 0)));
    EXPECT_FALSE(schedule.isActive(at(5, 12, 0)));   // Saturday
}

TEST(ScheduleTest, NextTransitionFindsTheNearestEdge) {
    auto schedule = Schedule::fromEntries({"1-5 09:00-17:00"}, true);

    EXPECT_EQ(schedule.nextTransition(at(0, 8, 0)), at(0, 9, 0));
    EXPECT_EQ(schedule.nextTransition(at(0, 10, 0)), at(0, 17, 0));
    // Friday evening skips the weekend.
    EXPECT_EQ(schedule.nextTransition(at(4, 17, 0)), at(7, 9, 0));

    EXPECT_FALSE(Schedule().nextTransition(at(0, 0, 0)).has_value());
}

TEST(ScheduleTest, AdjacentWindowsDoNotProduceAnEdge) {
    auto schedule = Schedule::fromEntries({"1-7 08:00-12:00", "1-7 12:00-18:00"}, true);
    EXPECT_EQ(schedule.nextTransition(at(0, 9, 0)), at(0, 18, 0));
}

TEST(JsonCodecTest, TemplateRendersRecordFields) {
    Record record;
    record.id = 42;
    record.kind = RecordKind::Location;
    LocationSample fix;
    fix.lat = 52.5;
    fix.lon = 13.4;
    fix.speed = 3.0;
    record.body = JsonCodec::locationBody(fix, LocationContext{true, 120.0, ActivityType::Walking, 80});
    record.body["extras"] = {{"driver", "ana"}};

    auto rendered = JsonCodec::renderTemplate(
        R"({"lat":<%= latitude %>,"lon":<%= longitude %>,"speed":<%= coords.speed %>,)"
        R"("id":<%= id %>,"driver":"<%= driver %>","missing":<%= nothing %>})", record);

    EXPECT_DOUBLE_EQ(rendered["lat"].get<double>(), 52.5);
    EXPECT_DOUBLE_EQ(rendered["lon"].get<double>(), 13.4);
    EXPECT_DOUBLE_EQ(rendered["speed"].get<double>(), 3.0);
    EXPECT_EQ(rendered["id"], 42);
    EXPECT_EQ(rendered["driver"], "ana");
    EXPECT_TRUE(rendered["missing"].is_null());
}

TEST(JsonCodecTest, TemplateEscapesStringValues) {
    GeofenceEvent geofence;
    geofence.identifier = "Bob's \"home\"";
    geofence.extras = {{"path", "a\\b"}, {"memo", "line1\nline2\t"}};

    Record record;
    record.id = 7;
    record.kind = RecordKind::Geofence;
    record.body = JsonCodec::geofenceBody(geofence);

    auto rendered = JsonCodec::renderTemplate(
        R"({"id":"<%= identifier %>","path":"<%= path %>","memo":"<%= memo %>","n":<%= id %>})", record);

    EXPECT_EQ(rendered["id"], "Bob's \"home\"");
    EXPECT_EQ(rendered["path"], "a\\b");
    EXPECT_EQ(rendered["memo"], "line1\nline2\t");
    EXPECT_EQ(rendered["n"], 7);
}

TEST(JsonCodecTest, TemplateErrors) {
    Record record;
    EXPECT_THROW(JsonCodec::renderTemplate("{\"a\": <%= id }", record), TrackingError);
    EXPECT_THROW(JsonCodec::renderTemplate("not json <%= id %>", record), TrackingError);
}

TEST(JsonCodecTest, LocationJsonRoundTrip) {
    LocationSample fix;
    fix.lat = -26.2041;
    fix.lon = 28.0473;
    fix.accuracy = 12.0;
    fix.timestamp = at(0, 12, 0);
    fix.providerTag = "gps";

    auto parsed = JsonCodec::jsonToLocation(JsonCodec::locationToJson(fix));
    EXPECT_DOUBLE_EQ(parsed.lat, fix.lat);
    EXPECT_DOUBLE_EQ(parsed.lon, fix.lon);
    EXPECT_DOUBLE_EQ(parsed.accuracy, 12.0);
    EXPECT_EQ(parsed.timestamp, fix.timestamp);
    EXPECT_EQ(parsed.providerTag, "gps");
}

TEST(JsonCodecTest, WronglyTypedTraceFieldsAreConfigErrors) {
    auto location = nlohmann::json::parse(R"({"coords":{"latitude":"x","longitude":4.3}})");
    try {
        JsonCodec::jsonToLocation(location);
        FAIL() << "expected TrackingError";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
    }

    EXPECT_THROW(JsonCodec::jsonToActivity(nlohmann::json::parse(R"({"confidence":"high"})")), TrackingError);
    EXPECT_THROW(JsonCodec::jsonToAccelerometer(nlohmann::json::parse(R"({"x":[1]})")), TrackingError);
    EXPECT_THROW(JsonCodec::jsonToGeofence(nlohmann::json::parse(R"({"radius":"big"})")), TrackingError);
}

TEST(LogTest, OneLoggerPerTagFollowsTheConfiguredLevel) {
    auto config = TrackingConfig::fromJson(nlohmann::json::parse(R"({"logger":{"logLevel":"warning"}})"));
    Log::setLevel(config.logger.level);

    auto sync = Log::get("Sync");
    EXPECT_EQ(sync, Log::get("Sync"));
    EXPECT_EQ(sync->name(), "Sync");
    EXPECT_EQ(sync->level(), spdlog::level::warn);
    EXPECT_FALSE(sync->should_log(spdlog::level::info));

    Log::setLevel(LogLevel::Verbose);
    EXPECT_EQ(sync->level(), spdlog::level::trace);
    EXPECT_EQ(Log::get("Geofence")->level(), spdlog::level::trace);

    Log::setLevel(LogLevel::Info);
    EXPECT_EQ(Log::level(), LogLevel::Info);
}
