#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../TrackingConfig.hpp"
#include <algorithm>
#include <cmath>

namespace geotrack::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::minutes(5),
                                int maxAttempts = 10)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        // Clamp in floating point so large attempt counts cannot overflow.
        double scaled = static_cast<double>(baseDelay_.count()) * std::pow(multiplier_, std::max(attemptCount - 1, 0));
        double capped = std::min(scaled, static_cast<double>(maxDelay_.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine() = default;

    explicit DefaultPolicyEngine(const SyncConfig& sync)
        : retryPolicy_(sync.backoffBase, 2.0, sync.backoffCeiling, sync.maxAttempts) {}

    const ports::RetryPolicy& getRetryPolicy() const override {
        return retryPolicy_;
    }

private:
    ExponentialBackoffRetryPolicy retryPolicy_;
};

} // namespace geotrack::adapters
