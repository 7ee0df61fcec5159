#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace geotrack {

using TimePoint = std::chrono::system_clock::time_point;

struct LocationSample {
    double lat = 0.0;
    double lon = 0.0;
    double altitude = 0.0;
    double accuracy = 0.0;
    double speed = -1.0;    // m/s, negative when the provider has no estimate
    double heading = -1.0;
    TimePoint timestamp;
    std::string providerTag;
};

enum class ActivityType {
    Still,
    Walking,
    Running,
    OnFoot,
    OnBicycle,
    InVehicle,
    Tilting,
    Unknown
};

struct ActivityTransition {
    ActivityType activity = ActivityType::Unknown;
    bool entering = true;
    int confidence = 100;
    TimePoint timestamp;
};

struct AccelerometerSample {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    TimePoint timestamp;
};

enum class MotionState {
    Moving,
    Stationary,
    PendingStop
};

struct GeofenceRegion {
    std::string identifier;
    double lat = 0.0;
    double lon = 0.0;
    double radius = 100.0;
    bool notifyOnEntry = true;
    bool notifyOnExit = true;
    bool notifyOnDwell = false;
    std::chrono::milliseconds loiteringDelay{0};   // 0 falls back to the configured dwell delay
    nlohmann::json extras = nlohmann::json::object();
};

enum class MembershipState {
    Outside,
    Inside,
    Dwelling
};

enum class GeofenceAction {
    Enter,
    Exit,
    Dwell
};

struct GeofenceEvent {
    std::string identifier;
    GeofenceAction action = GeofenceAction::Enter;
    LocationSample location;
    TimePoint timestamp;
    nlohmann::json extras = nlohmann::json::object();
};

enum class RecordKind {
    Location,
    Geofence
};

struct Record {
    int64_t id = 0;
    RecordKind kind = RecordKind::Location;
    bool synced = false;
    TimePoint createdAt;
    nlohmann::json body = nlohmann::json::object();
};

enum class TrackingMode {
    Location,
    Geofences
};

struct SessionStateBlob {
    bool enabled = false;
    TrackingMode trackingMode = TrackingMode::Location;
    bool schedulerEnabled = false;
    double odometer = 0.0;
    bool isMoving = false;
    std::optional<TimePoint> lastLocationTime;
};

enum class TransportType {
    None,
    Wifi,
    Cellular,
    Ethernet
};

std::string activityTypeToString(ActivityType type);
ActivityType stringToActivityType(const std::string& str);
bool isMovingActivity(ActivityType type);

std::string motionStateToString(MotionState state);
std::string membershipStateToString(MembershipState state);

std::string geofenceActionToString(GeofenceAction action);
GeofenceAction stringToGeofenceAction(const std::string& str);

std::string recordKindToString(RecordKind kind);
RecordKind stringToRecordKind(const std::string& str);

std::string trackingModeToString(TrackingMode mode);
std::string transportTypeToString(TransportType type);
TransportType stringToTransportType(const std::string& str);

int64_t toEpochMillis(TimePoint time);
TimePoint fromEpochMillis(int64_t millis);
std::string formatIso8601(TimePoint time);

} // namespace geotrack
