#pragma once

#include <chrono>

namespace geotrack::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    virtual const RetryPolicy& getRetryPolicy() const = 0;
};

} // namespace geotrack::ports
