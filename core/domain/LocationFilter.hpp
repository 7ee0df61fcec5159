#pragma once

#include "../Model.hpp"
#include "../TrackingConfig.hpp"
#include <optional>
#include <string>

namespace geotrack::domain {

enum class FilterVerdict {
    Accepted,
    Adjusted,
    Rejected
};

struct FilterResult {
    FilterVerdict verdict = FilterVerdict::Rejected;
    LocationSample sample;
    bool emitError = false;          // discard policy surfaces the rejection
    std::string reason;
    bool odometerEligible = false;
    double odometerDelta = 0.0;      // distance from the previous odometer-eligible fix

    bool accepted() const { return verdict != FilterVerdict::Rejected; }
};

/**
 * @brief Per-session validation and adjustment of incoming fixes
 *
 * Checks run in order: tracking accuracy, implied speed against the last
 * accepted fix, odometer accuracy. The first two apply the configured policy,
 * the third only excludes the fix from odometer accumulation. After every
 * accepted fix the elastic distance filter is recomputed from the fix speed.
 */
class LocationFilter {
public:
    LocationFilter(const FilterConfig& filter, const ElasticityConfig& elasticity);

    FilterResult process(const LocationSample& fix);

    void reconfigure(const FilterConfig& filter, const ElasticityConfig& elasticity);
    void reset();

    double effectiveDistanceFilter() const { return effectiveDistance_; }
    const std::optional<LocationSample>& lastAccepted() const { return lastAccepted_; }
    std::size_t rejectedCount() const { return rejectedCount_; }

    // distanceFilter * (1 + multiplier * round(speed / 5)), unscaled when elasticity is disabled.
    static double elasticDistance(const ElasticityConfig& elasticity, double speedMetersPerSecond);

private:
    enum class CheckOutcome {
        Pass,
        Adjust,
        Reject
    };

    CheckOutcome applyPolicy(const std::string& reason, FilterResult& result);
    void recomputeElasticity(const LocationSample& fix, const std::optional<LocationSample>& previous);

    FilterConfig filter_;
    ElasticityConfig elasticity_;

    std::optional<LocationSample> lastAccepted_;
    std::optional<LocationSample> lastOdometerFix_;
    double effectiveDistance_ = 0.0;
    std::size_t rejectedCount_ = 0;

    static constexpr double ELASTICITY_SPEED_STEP = 5.0;   // m/s per scaling step
};

std::string filterVerdictToString(FilterVerdict verdict);

} // namespace geotrack::domain
