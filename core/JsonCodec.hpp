#pragma once

#include "Event.hpp"
#include "Model.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace geotrack {

struct LocationContext {
    bool isMoving = false;
    double odometer = 0.0;
    ActivityType activity = ActivityType::Unknown;
    int confidence = 0;
};

// Decoders throw TrackingError{ConfigInvalid} when a field has the wrong JSON type.
class JsonCodec {
public:
    static nlohmann::json coordsToJson(const LocationSample& location);
    static nlohmann::json locationToJson(const LocationSample& location);
    static LocationSample jsonToLocation(const nlohmann::json& json);

    static nlohmann::json locationBody(const LocationSample& location, const LocationContext& context);
    static nlohmann::json geofenceBody(const GeofenceEvent& event);

    static nlohmann::json geofenceToJson(const GeofenceRegion& region);
    static GeofenceRegion jsonToGeofence(const nlohmann::json& json);

    static nlohmann::json recordToJson(const Record& record);
    static nlohmann::json eventToJson(const Event& event);

    static ActivityTransition jsonToActivity(const nlohmann::json& json);
    static AccelerometerSample jsonToAccelerometer(const nlohmann::json& json);

    /**
     * @brief Render a record through a "<%= key %>" template
     *
     * Keys resolve against the record body (latitude, longitude, ..., dotted
     * paths such as coords.speed, then extras). Strings are inserted escaped but
     * without their quotes, other values as JSON text, missing keys as null.
     * @return Parsed JSON produced by the template
     * @throws TrackingError{ConfigInvalid} when the rendered text is not JSON
     */
    static nlohmann::json renderTemplate(const std::string& tmpl, const Record& record);

private:
    static const nlohmann::json* lookupTemplateKey(const std::string& key, const nlohmann::json& flat);
};

} // namespace geotrack
