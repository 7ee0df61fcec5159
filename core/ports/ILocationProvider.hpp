#pragma once

#include <string>

namespace geotrack::ports {

enum class ProviderMode {
    HighAccuracy,
    LowPower
};

inline std::string providerModeToString(ProviderMode mode) {
    return mode == ProviderMode::HighAccuracy ? "high_accuracy" : "low_power";
}

// Fixes and provider errors flow back through TrackingSession::onLocation()
// and TrackingSession::onSourceError(); the provider never calls domain code.
class ILocationProvider {
public:
    virtual ~ILocationProvider() = default;

    virtual bool hasPermission() const = 0;
    virtual bool start(ProviderMode mode, double minDistanceMeters) = 0;
    virtual void stop() = 0;
};

} // namespace geotrack::ports
