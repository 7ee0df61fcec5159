#include "Model.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace geotrack {

std::string activityTypeToString(ActivityType type) {
    static const std::unordered_map<ActivityType, std::string> typeMap = {
        {ActivityType::Still, "still"},
        {ActivityType::Walking, "walking"},
        {ActivityType::Running, "running"},
        {ActivityType::OnFoot, "on_foot"},
        {ActivityType::OnBicycle, "on_bicycle"},
        {ActivityType::InVehicle, "in_vehicle"},
        {ActivityType::Tilting, "tilting"},
        {ActivityType::Unknown, "unknown"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

ActivityType stringToActivityType(const std::string& str) {
    static const std::unordered_map<std::string, ActivityType> stringMap = {
        {"still", ActivityType::Still},
        {"walking", ActivityType::Walking},
        {"running", ActivityType::Running},
        {"on_foot", ActivityType::OnFoot},
        {"on_bicycle", ActivityType::OnBicycle},
        {"in_vehicle", ActivityType::InVehicle},
        {"tilting", ActivityType::Tilting},
        {"unknown", ActivityType::Unknown}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : ActivityType::Unknown;
}

bool isMovingActivity(ActivityType type) {
    switch (type) {
        case ActivityType::Walking:
        case ActivityType::Running:
        case ActivityType::OnFoot:
        case ActivityType::OnBicycle:
        case ActivityType::InVehicle:
            return true;
        default:
            return false;
    }
}

std::string motionStateToString(MotionState state) {
    switch (state) {
        case MotionState::Moving: return "MOVING";
        case MotionState::Stationary: return "STATIONARY";
        case MotionState::PendingStop: return "PENDING_STOP";
        default: return "UNKNOWN";
    }
}

std::string membershipStateToString(MembershipState state) {
    switch (state) {
        case MembershipState::Outside: return "OUTSIDE";
        case MembershipState::Inside: return "INSIDE";
        case MembershipState::Dwelling: return "DWELLING";
        default: return "UNKNOWN";
    }
}

std::string geofenceActionToString(GeofenceAction action) {
    switch (action) {
        case GeofenceAction::Enter: return "ENTER";
        case GeofenceAction::Exit: return "EXIT";
        case GeofenceAction::Dwell: return "DWELL";
        default: return "UNKNOWN";
    }
}

GeofenceAction stringToGeofenceAction(const std::string& str) {
    if (str == "EXIT" || str == "exit") return GeofenceAction::Exit;
    if (str == "DWELL" || str == "dwell") return GeofenceAction::Dwell;
    return GeofenceAction::Enter;
}

std::string recordKindToString(RecordKind kind) {
    return kind == RecordKind::Geofence ? "geofence" : "location";
}

RecordKind stringToRecordKind(const std::string& str) {
    return str == "geofence" ? RecordKind::Geofence : RecordKind::Location;
}

std::string trackingModeToString(TrackingMode mode) {
    return mode == TrackingMode::Geofences ? "geofences" : "location";
}

std::string transportTypeToString(TransportType type) {
    switch (type) {
        case TransportType::None: return "none";
        case TransportType::Wifi: return "wifi";
        case TransportType::Cellular: return "cellular";
        case TransportType::Ethernet: return "ethernet";
        default: return "none";
    }
}

TransportType stringToTransportType(const std::string& str) {
    static const std::unordered_map<std::string, TransportType> stringMap = {
        {"none", TransportType::None},
        {"wifi", TransportType::Wifi},
        {"cellular", TransportType::Cellular},
        {"ethernet", TransportType::Ethernet}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : TransportType::None;
}

int64_t toEpochMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::string formatIso8601(TimePoint time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::stringstream ss;
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

} // namespace geotrack
