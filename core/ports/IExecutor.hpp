#pragma once

#include <functional>

namespace geotrack::ports {

// Runs posted tasks in submission order on a context owned by the executor.
class IExecutor {
public:
    virtual ~IExecutor() = default;

    virtual void post(std::function<void()> task) = 0;
};

} // namespace geotrack::ports
