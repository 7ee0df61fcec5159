#pragma once

#include "DesktopSources.hpp"
#include "../../core/domain/TrackingSession.hpp"
#include <string>

namespace geotrack::desktop {

/**
 * @brief Feeds one JSON-lines trace entry into a session
 *
 * Entry types: location, activity, accelerometer, connectivity, geofence,
 * geofence_event, pace, sync and wait.
 * @return false when the line is not a usable trace entry; the session is untouched
 */
bool replayTraceLine(const std::string& line, domain::TrackingSession& session, ReplayConnectivity& connectivity);

} // namespace geotrack::desktop
