#include "Geo.hpp"
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geotrack {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceMeters(const LocationSample& a, const LocationSample& b) {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

double Geo::distanceToRegion(const LocationSample& location, const GeofenceRegion& region) {
    return distanceMeters(location.lat, location.lon, region.lat, region.lon);
}

double Geo::bearingDegrees(double lat1, double lon1, double lat2, double lon2) {
    double dLon = toRadians(lon2 - lon1);
    double y = std::sin(dLon) * std::cos(toRadians(lat2));
    double x = std::cos(toRadians(lat1)) * std::sin(toRadians(lat2)) -
               std::sin(toRadians(lat1)) * std::cos(toRadians(lat2)) * std::cos(dLon);

    double bearing = toDegrees(std::atan2(y, x));
    return std::fmod(bearing + 360.0, 360.0);
}

LocationSample Geo::moveLocation(const LocationSample& from, double bearingDeg, double distanceMeters) {
    double bearing = toRadians(bearingDeg);
    double d = distanceMeters / EARTH_RADIUS_METERS;

    double lat1 = toRadians(from.lat);
    double lon1 = toRadians(from.lon);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                           std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                   std::cos(d) - std::sin(lat1) * std::sin(lat2));

    LocationSample result = from;
    result.lat = toDegrees(lat2);
    result.lon = toDegrees(lon2);
    return result;
}

bool Geo::isInsideRegion(const LocationSample& location, const GeofenceRegion& region) {
    return distanceToRegion(location, region) <= region.radius;
}

double Geo::impliedSpeed(const LocationSample& from, const LocationSample& to) {
    auto elapsed = std::chrono::duration<double>(to.timestamp - from.timestamp).count();
    double distance = distanceMeters(from, to);
    if (elapsed <= 0.0) {
        // Movement with no elapsed time is unbounded.
        return distance > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return distance / elapsed;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace geotrack
