#include "Event.hpp"
#include <unordered_map>

namespace geotrack {

std::string eventTypeToString(EventType type) {
    static const std::unordered_map<EventType, std::string> typeMap = {
        {EventType::Location, "location"},
        {EventType::MotionChange, "motionchange"},
        {EventType::ActivityChange, "activitychange"},
        {EventType::Geofence, "geofence"},
        {EventType::GeofencesChange, "geofenceschange"},
        {EventType::Http, "http"},
        {EventType::Error, "error"},
        {EventType::ConnectivityChange, "connectivitychange"},
        {EventType::Schedule, "schedule"},
        {EventType::Enabled, "enabledchange"},
        {EventType::Heartbeat, "heartbeat"},
        {EventType::ProviderChange, "providerchange"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

EventType stringToEventType(const std::string& str) {
    static const std::unordered_map<std::string, EventType> stringMap = {
        {"location", EventType::Location},
        {"motionchange", EventType::MotionChange},
        {"activitychange", EventType::ActivityChange},
        {"geofence", EventType::Geofence},
        {"geofenceschange", EventType::GeofencesChange},
        {"http", EventType::Http},
        {"error", EventType::Error},
        {"connectivitychange", EventType::ConnectivityChange},
        {"schedule", EventType::Schedule},
        {"enabledchange", EventType::Enabled},
        {"heartbeat", EventType::Heartbeat},
        {"providerchange", EventType::ProviderChange}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : EventType::Error;
}

} // namespace geotrack
