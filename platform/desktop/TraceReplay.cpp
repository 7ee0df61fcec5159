#include "TraceReplay.hpp"
#include "../../core/Errors.hpp"
#include "../../core/JsonCodec.hpp"
#include "../../core/Log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

namespace geotrack::desktop {

bool replayTraceLine(const std::string& line, domain::TrackingSession& session, ReplayConnectivity& connectivity) {
    nlohmann::json json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    try {
        std::string type = json.value("type", "");
        if (type == "location") {
            session.onLocation(JsonCodec::jsonToLocation(json));
        } else if (type == "activity") {
            session.onActivity(JsonCodec::jsonToActivity(json));
        } else if (type == "accelerometer") {
            session.onAccelerometer(JsonCodec::jsonToAccelerometer(json));
        } else if (type == "connectivity") {
            auto transport = stringToTransportType(json.value("transport", "none"));
            connectivity.setTransport(transport);
            session.onConnectivityChanged(transport);
        } else if (type == "geofence") {
            return session.addGeofence(JsonCodec::jsonToGeofence(json));
        } else if (type == "geofence_event") {
            session.onNativeGeofenceEvent(json.value("identifier", ""),
                                          stringToGeofenceAction(json.value("action", "ENTER")));
        } else if (type == "pace") {
            session.changePace(json.value("moving", true));
        } else if (type == "sync") {
            session.syncNow();
        } else if (type == "wait") {
            std::this_thread::sleep_for(std::chrono::milliseconds(json.value("ms", 0)));
        } else {
            return false;
        }
    } catch (const TrackingError& e) {
        Log::get("Replay")->warn("{}", e.detail());
        return false;
    } catch (const nlohmann::json::exception& e) {
        Log::get("Replay")->warn("malformed trace entry: {}", e.what());
        return false;
    }
    return true;
}

} // namespace geotrack::desktop
