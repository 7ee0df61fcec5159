#pragma once

#include "../../core/ports/IConnectivity.hpp"
#include "../../core/ports/IGeofenceRegistrar.hpp"
#include "../../core/ports/ILocationProvider.hpp"
#include "../../core/ports/IMotionSensors.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>

namespace geotrack::desktop {

/**
 * @brief Platform sources for the desktop replay tool
 *
 * A desktop has no GNSS receiver or motion coprocessor. Samples come from a
 * trace file; these adapters only record what the engine asked the platform
 * to do so the requested power mode shows up in the log.
 */
class ReplayLocationProvider : public ports::ILocationProvider {
public:
    bool hasPermission() const override { return true; }
    bool start(ports::ProviderMode mode, double minDistanceMeters) override;
    void stop() override;

    bool isActive() const { return active_.load(); }

private:
    std::atomic<bool> active_{false};
};

class ReplayMotionSensors : public ports::IMotionSensors {
public:
    bool startActivityUpdates() override;
    void stopActivityUpdates() override;
    bool startAccelerometer() override;
    void stopAccelerometer() override;
};

class ReplayGeofenceRegistrar : public ports::IGeofenceRegistrar {
public:
    explicit ReplayGeofenceRegistrar(int capacity) : capacity_(capacity) {}

    int capacity() const override { return capacity_; }
    bool registerRegion(const GeofenceRegion& region) override;
    void unregisterRegion(const std::string& identifier) override;

    std::size_t registeredCount() const;

private:
    int capacity_;
    mutable std::mutex mutex_;
    std::set<std::string> registered_;
};

// Transport type is whatever the trace last announced.
class ReplayConnectivity : public ports::IConnectivity {
public:
    TransportType currentTransport() const override { return transport_.load(); }
    void setTransport(TransportType transport) { transport_.store(transport); }

private:
    std::atomic<TransportType> transport_{TransportType::Wifi};
};

} // namespace geotrack::desktop
