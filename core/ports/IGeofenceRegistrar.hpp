#pragma once

#include "../Model.hpp"
#include <string>

namespace geotrack::ports {

class IGeofenceRegistrar {
public:
    virtual ~IGeofenceRegistrar() = default;

    // Maximum number of regions the platform monitors concurrently.
    virtual int capacity() const = 0;

    virtual bool registerRegion(const GeofenceRegion& region) = 0;
    virtual void unregisterRegion(const std::string& identifier) = 0;
};

} // namespace geotrack::ports
