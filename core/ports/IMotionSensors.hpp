#pragma once

namespace geotrack::ports {

// Enable/disable calls must be idempotent.
class IMotionSensors {
public:
    virtual ~IMotionSensors() = default;

    virtual bool startActivityUpdates() = 0;
    virtual void stopActivityUpdates() = 0;

    virtual bool startAccelerometer() = 0;
    virtual void stopAccelerometer() = 0;
};

} // namespace geotrack::ports
