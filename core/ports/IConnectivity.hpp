#pragma once

#include "../Model.hpp"

namespace geotrack::ports {

class IConnectivity {
public:
    virtual ~IConnectivity() = default;

    virtual TransportType currentTransport() const = 0;
};

} // namespace geotrack::ports
