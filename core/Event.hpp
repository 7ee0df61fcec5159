#pragma once

#include "Model.hpp"
#include "Errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geotrack {

enum class EventType {
    Location,
    MotionChange,
    ActivityChange,
    Geofence,
    GeofencesChange,
    Http,
    Error,
    ConnectivityChange,
    Schedule,
    Enabled,
    Heartbeat,
    ProviderChange
};

struct HttpResult {
    bool success = false;
    int status = 0;
    std::string responseText;
    int attempt = 0;
    std::size_t recordCount = 0;
};

struct ProviderStatus {
    bool active = false;
    bool permissionGranted = false;
    bool highAccuracy = false;
    double distanceFilter = 0.0;
};

struct ErrorInfo {
    ErrorKind kind = ErrorKind::StoreError;
    std::string detail;
};

struct Event {
    EventType eventType = EventType::Location;
    TimePoint timestamp;

    std::optional<Record> record;
    std::optional<LocationSample> location;

    bool isMoving = false;
    ActivityType activity = ActivityType::Unknown;
    int confidence = 0;

    std::optional<GeofenceEvent> geofence;
    std::vector<std::string> monitoredOn;
    std::vector<std::string> monitoredOff;

    std::optional<HttpResult> http;
    std::optional<ErrorInfo> error;
    std::optional<ProviderStatus> provider;

    TransportType transport = TransportType::None;
    bool enabled = false;
};

std::string eventTypeToString(EventType type);
EventType stringToEventType(const std::string& str);

} // namespace geotrack
