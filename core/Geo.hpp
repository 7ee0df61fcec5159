#pragma once

#include "Model.hpp"

namespace geotrack {

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const LocationSample& a, const LocationSample& b);
    static double distanceToRegion(const LocationSample& location, const GeofenceRegion& region);

    static double bearingDegrees(double lat1, double lon1, double lat2, double lon2);

    // Point reached by travelling distanceMeters from `from` along bearingDeg.
    static LocationSample moveLocation(const LocationSample& from, double bearingDeg, double distanceMeters);

    // Boundary counts as inside.
    static bool isInsideRegion(const LocationSample& location, const GeofenceRegion& region);

    // m/s between two fixes; infinite for movement without elapsed time.
    static double impliedSpeed(const LocationSample& from, const LocationSample& to);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace geotrack
