#include "MockPlatform.hpp"

namespace geotrack::sim {

bool MockLocationProvider::start(ports::ProviderMode mode, double minDistanceMeters) {
    startCalls_.push_back(StartCall{mode, minDistanceMeters});
    active_ = startResult_;
    return startResult_;
}

void MockLocationProvider::stop() {
    active_ = false;
    stopCount_++;
}

bool MockMotionSensors::startActivityUpdates() {
    activityActive_ = activityAvailable_;
    return activityAvailable_;
}

bool MockMotionSensors::startAccelerometer() {
    accelerometerStarts_++;
    accelerometerActive_ = accelerometerAvailable_;
    return accelerometerAvailable_;
}

bool MockGeofenceRegistrar::registerRegion(const GeofenceRegion& region) {
    registerCalls_++;
    if (rejected_.count(region.identifier) > 0) {
        return false;
    }
    registered_.insert(region.identifier);
    return true;
}

void MockGeofenceRegistrar::unregisterRegion(const std::string& identifier) {
    unregisterCalls_++;
    registered_.erase(identifier);
}

} // namespace geotrack::sim
