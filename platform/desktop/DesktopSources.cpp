#include "DesktopSources.hpp"
#include "../../core/Log.hpp"

namespace geotrack::desktop {

bool ReplayLocationProvider::start(ports::ProviderMode mode, double minDistanceMeters) {
    Log::get("Platform")->info("location updates {}, distance filter {}m",
                               ports::providerModeToString(mode), minDistanceMeters);
    active_.store(true);
    return true;
}

void ReplayLocationProvider::stop() {
    if (active_.exchange(false)) {
        Log::get("Platform")->info("location updates stopped");
    }
}

bool ReplayMotionSensors::startActivityUpdates() {
    Log::get("Platform")->debug("activity updates on");
    return true;
}

void ReplayMotionSensors::stopActivityUpdates() {
    Log::get("Platform")->debug("activity updates off");
}

bool ReplayMotionSensors::startAccelerometer() {
    Log::get("Platform")->debug("accelerometer on");
    return true;
}

void ReplayMotionSensors::stopAccelerometer() {
    Log::get("Platform")->debug("accelerometer off");
}

bool ReplayGeofenceRegistrar::registerRegion(const GeofenceRegion& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.insert(region.identifier);
    Log::get("Platform")->debug("monitoring {}", region.identifier);
    return true;
}

void ReplayGeofenceRegistrar::unregisterRegion(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.erase(identifier);
}

std::size_t ReplayGeofenceRegistrar::registeredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_.size();
}

} // namespace geotrack::desktop
