#pragma once

#include "../ports/IConnectivity.hpp"
#include "../ports/IGeofenceRegistrar.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/IMotionSensors.hpp"
#include <atomic>
#include <set>
#include <string>
#include <vector>

namespace geotrack::sim {

class MockLocationProvider : public ports::ILocationProvider {
public:
    struct StartCall {
        ports::ProviderMode mode;
        double minDistance;
    };

    bool hasPermission() const override { return permission_; }
    bool start(ports::ProviderMode mode, double minDistanceMeters) override;
    void stop() override;

    void setPermission(bool granted) { permission_ = granted; }
    void setStartResult(bool result) { startResult_ = result; }

    bool isActive() const { return active_; }
    const std::vector<StartCall>& startCalls() const { return startCalls_; }
    const StartCall& lastStart() const { return startCalls_.back(); }
    int stopCount() const { return stopCount_; }

private:
    bool permission_ = true;
    bool startResult_ = true;
    bool active_ = false;
    int stopCount_ = 0;
    std::vector<StartCall> startCalls_;
};

class MockMotionSensors : public ports::IMotionSensors {
public:
    bool startActivityUpdates() override;
    void stopActivityUpdates() override { activityActive_ = false; }
    bool startAccelerometer() override;
    void stopAccelerometer() override { accelerometerActive_ = false; }

    void setActivityAvailable(bool available) { activityAvailable_ = available; }
    void setAccelerometerAvailable(bool available) { accelerometerAvailable_ = available; }

    bool activityActive() const { return activityActive_; }
    bool accelerometerActive() const { return accelerometerActive_; }
    int accelerometerStarts() const { return accelerometerStarts_; }

private:
    bool activityAvailable_ = true;
    bool accelerometerAvailable_ = true;
    bool activityActive_ = false;
    bool accelerometerActive_ = false;
    int accelerometerStarts_ = 0;
};

class MockGeofenceRegistrar : public ports::IGeofenceRegistrar {
public:
    explicit MockGeofenceRegistrar(int capacity = 20) : capacity_(capacity) {}

    int capacity() const override { return capacity_; }
    bool registerRegion(const GeofenceRegion& region) override;
    void unregisterRegion(const std::string& identifier) override;

    void setCapacity(int capacity) { capacity_ = capacity; }
    // Identifiers listed here fail to register.
    void rejectRegion(const std::string& identifier) { rejected_.insert(identifier); }

    const std::set<std::string>& registered() const { return registered_; }
    bool isRegistered(const std::string& identifier) const { return registered_.count(identifier) > 0; }
    int registerCalls() const { return registerCalls_; }
    int unregisterCalls() const { return unregisterCalls_; }

private:
    int capacity_;
    std::set<std::string> registered_;
    std::set<std::string> rejected_;
    int registerCalls_ = 0;
    int unregisterCalls_ = 0;
};

class MockConnectivity : public ports::IConnectivity {
public:
    TransportType currentTransport() const override { return transport_.load(); }
    void setTransport(TransportType transport) { transport_.store(transport); }

private:
    std::atomic<TransportType> transport_{TransportType::Wifi};
};

} // namespace geotrack::sim
