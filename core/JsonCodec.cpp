#include "JsonCodec.hpp"
#include "Errors.hpp"
#include <unordered_map>

namespace geotrack {

nlohmann::json JsonCodec::coordsToJson(const LocationSample& location) {
    nlohmann::json j;
    j["latitude"] = location.lat;
    j["longitude"] = location.lon;
    j["altitude"] = location.altitude;
    j["accuracy"] = location.accuracy;
    j["speed"] = location.speed;
    j["heading"] = location.heading;
    return j;
}

nlohmann::json JsonCodec::locationToJson(const LocationSample& location) {
    nlohmann::json j;
    j["timestamp"] = formatIso8601(location.timestamp);
    j["ts"] = toEpochMillis(location.timestamp);
    j["coords"] = coordsToJson(location);
    if (!location.providerTag.empty()) {
        j["provider"] = location.providerTag;
    }
    return j;
}

LocationSample JsonCodec::jsonToLocation(const nlohmann::json& json) {
    try {
        const auto& coords = json.contains("coords") ? json["coords"] : json;

        LocationSample location;
        location.lat = coords.value("latitude", coords.value("lat", 0.0));
        location.lon = coords.value("longitude", coords.value("lon", 0.0));
        location.altitude = coords.value("altitude", 0.0);
        location.accuracy = coords.value("accuracy", 0.0);
        location.speed = coords.value("speed", -1.0);
        location.heading = coords.value("heading", -1.0);
        location.timestamp = fromEpochMillis(json.value("ts", int64_t{0}));
        location.providerTag = json.value("provider", "");
        return location;
    } catch (const nlohmann::json::exception& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("malformed location: ") + e.what());
    }
}

nlohmann::json JsonCodec::locationBody(const LocationSample& location, const LocationContext& context) {
    nlohmann::json j = locationToJson(location);
    j["is_moving"] = context.isMoving;
    j["odometer"] = context.odometer;
    j["activity"] = {
        {"type", activityTypeToString(context.activity)},
        {"confidence", context.confidence}
    };
    return j;
}

nlohmann::json JsonCodec::geofenceBody(const GeofenceEvent& event) {
    nlohmann::json j = locationToJson(event.location);
    j["timestamp"] = formatIso8601(event.timestamp);
    j["geofence"] = {
        {"identifier", event.identifier},
        {"action", geofenceActionToString(event.action)},
        {"extras", event.extras}
    };
    return j;
}

nlohmann::json JsonCodec::geofenceToJson(const GeofenceRegion& region) {
    nlohmann::json j;
    j["identifier"] = region.identifier;
    j["latitude"] = region.lat;
    j["longitude"] = region.lon;
    j["radius"] = region.radius;
    j["notifyOnEntry"] = region.notifyOnEntry;
    j["notifyOnExit"] = region.notifyOnExit;
    j["notifyOnDwell"] = region.notifyOnDwell;
    j["loiteringDelay"] = region.loiteringDelay.count();
    j["extras"] = region.extras;
    return j;
}

GeofenceRegion JsonCodec::jsonToGeofence(const nlohmann::json& json) {
    try {
        GeofenceRegion region;
        region.identifier = json.value("identifier", "");
        region.lat = json.value("latitude", 0.0);
        region.lon = json.value("longitude", 0.0);
        region.radius = json.value("radius", 100.0);
        region.notifyOnEntry = json.value("notifyOnEntry", true);
        region.notifyOnExit = json.value("notifyOnExit", true);
        region.notifyOnDwell = json.value("notifyOnDwell", false);
        region.loiteringDelay = std::chrono::milliseconds(json.value("loiteringDelay", int64_t{0}));
        if (json.contains("extras") && json["extras"].is_object()) {
            region.extras = json["extras"];
        }
        return region;
    } catch (const nlohmann::json::exception& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("malformed geofence: ") + e.what());
    }
}

nlohmann::json JsonCodec::recordToJson(const Record& record) {
    nlohmann::json j = record.body;
    j["id"] = record.id;
    j["kind"] = recordKindToString(record.kind);
    j["created_at"] = formatIso8601(record.createdAt);
    return j;
}

nlohmann::json JsonCodec::eventToJson(const Event& event) {
    nlohmann::json j;
    j["event"] = eventTypeToString(event.eventType);
    j["ts"] = formatIso8601(event.timestamp);

    switch (event.eventType) {
        case EventType::Location:
        case EventType::Heartbeat:
            if (event.record) {
                j["record"] = recordToJson(*event.record);
            } else if (event.location) {
                j["location"] = locationToJson(*event.location);
            }
            break;
        case EventType::MotionChange:
            j["is_moving"] = event.isMoving;
            if (event.location) {
                j["location"] = locationToJson(*event.location);
            }
            break;
        case EventType::ActivityChange:
            j["activity"] = activityTypeToString(event.activity);
            j["confidence"] = event.confidence;
            break;
        case EventType::Geofence:
            if (event.geofence) {
                j["geofence"] = geofenceBody(*event.geofence);
            }
            break;
        case EventType::GeofencesChange:
            j["on"] = event.monitoredOn;
            j["off"] = event.monitoredOff;
            break;
        case EventType::Http:
            if (event.http) {
                j["success"] = event.http->success;
                j["status"] = event.http->status;
                j["responseText"] = event.http->responseText;
                j["attempt"] = event.http->attempt;
                j["count"] = event.http->recordCount;
            }
            break;
        case EventType::Error:
            if (event.error) {
                j["kind"] = errorKindToString(event.error->kind);
                j["detail"] = event.error->detail;
            }
            break;
        case EventType::ConnectivityChange:
            j["transport"] = transportTypeToString(event.transport);
            j["connected"] = event.transport != TransportType::None;
            break;
        case EventType::Schedule:
        case EventType::Enabled:
            j["enabled"] = event.enabled;
            break;
        case EventType::ProviderChange:
            if (event.provider) {
                j["enabled"] = event.provider->active;
                j["permission"] = event.provider->permissionGranted;
                j["mode"] = event.provider->highAccuracy ? "high_accuracy" : "low_power";
                j["distance_filter"] = event.provider->distanceFilter;
            }
            break;
    }
    return j;
}

ActivityTransition JsonCodec::jsonToActivity(const nlohmann::json& json) {
    try {
        ActivityTransition transition;
        transition.activity = stringToActivityType(json.value("activity", "unknown"));
        transition.entering = json.value("entering", true);
        transition.confidence = json.value("confidence", 100);
        transition.timestamp = fromEpochMillis(json.value("ts", int64_t{0}));
        return transition;
    } catch (const nlohmann::json::exception& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("malformed activity transition: ") + e.what());
    }
}

AccelerometerSample JsonCodec::jsonToAccelerometer(const nlohmann::json& json) {
    try {
        AccelerometerSample sample;
        sample.x = json.value("x", 0.0);
        sample.y = json.value("y", 0.0);
        sample.z = json.value("z", 0.0);
        sample.timestamp = fromEpochMillis(json.value("ts", int64_t{0}));
        return sample;
    } catch (const nlohmann::json::exception& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("malformed accelerometer sample: ") + e.what());
    }
}

const nlohmann::json* JsonCodec::lookupTemplateKey(const std::string& key, const nlohmann::json& flat) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"latitude", "coords.latitude"},
        {"longitude", "coords.longitude"},
        {"altitude", "coords.altitude"},
        {"accuracy", "coords.accuracy"},
        {"speed", "coords.speed"},
        {"heading", "coords.heading"},
        {"identifier", "geofence.identifier"},
        {"action", "geofence.action"}
    };

    std::string path = key;
    auto alias = aliases.find(key);
    if (alias != aliases.end()) {
        path = alias->second;
    }

    const nlohmann::json* node = &flat;
    std::size_t begin = 0;
    while (node != nullptr && begin <= path.size()) {
        auto dot = path.find('.', begin);
        std::string segment = path.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (!node->is_object() || !node->contains(segment)) {
            node = nullptr;
            break;
        }
        node = &(*node)[segment];
        if (dot == std::string::npos) {
            return node;
        }
        begin = dot + 1;
    }

    if (flat.contains("extras") && flat["extras"].is_object() && flat["extras"].contains(key)) {
        return &flat["extras"][key];
    }
    return nullptr;
}

nlohmann::json JsonCodec::renderTemplate(const std::string& tmpl, const Record& record) {
    const nlohmann::json source = recordToJson(record);
    static const std::string open = "<%=";
    static const std::string close = "%>";

    std::string out;
    std::size_t pos = 0;
    while (true) {
        auto start = tmpl.find(open, pos);
        if (start == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        auto end = tmpl.find(close, start + open.size());
        if (end == std::string::npos) {
            throw TrackingError(ErrorKind::ConfigInvalid, "unterminated template tag");
        }
        out.append(tmpl, pos, start - pos);

        std::string key = tmpl.substr(start + open.size(), end - start - open.size());
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);

        const nlohmann::json* value = key.empty() ? nullptr : lookupTemplateKey(key, source);
        if (value == nullptr) {
            out += "null";
        } else if (value->is_string()) {
            // String placeholders sit inside quotes in the template; splice the escaped body only.
            std::string quoted = value->dump();
            out.append(quoted, 1, quoted.size() - 2);
        } else {
            out += value->dump();
        }
        pos = end + close.size();
    }

    try {
        return nlohmann::json::parse(out);
    } catch (const nlohmann::json::parse_error& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("template does not render to JSON: ") + e.what());
    }
}

} // namespace geotrack
