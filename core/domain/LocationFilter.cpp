#include "LocationFilter.hpp"
#include "../Geo.hpp"
#include "../Log.hpp"
#include <cmath>
#include <sstream>

namespace geotrack::domain {

LocationFilter::LocationFilter(const FilterConfig& filter, const ElasticityConfig& elasticity)
    : filter_(filter), elasticity_(elasticity), effectiveDistance_(elasticity.distanceFilter) {
}

void LocationFilter::reconfigure(const FilterConfig& filter, const ElasticityConfig& elasticity) {
    filter_ = filter;
    elasticity_ = elasticity;
    effectiveDistance_ = elasticity.distanceFilter;
}

void LocationFilter::reset() {
    lastAccepted_.reset();
    lastOdometerFix_.reset();
    effectiveDistance_ = elasticity_.distanceFilter;
    rejectedCount_ = 0;
}

FilterResult LocationFilter::process(const LocationSample& fix) {
    FilterResult result;
    result.verdict = FilterVerdict::Accepted;
    result.sample = fix;

    if (filter_.trackingAccuracyThreshold > 0.0 && fix.accuracy > filter_.trackingAccuracyThreshold) {
        std::ostringstream reason;
        reason << "accuracy " << fix.accuracy << "m exceeds " << filter_.trackingAccuracyThreshold << "m";
        if (applyPolicy(reason.str(), result) == CheckOutcome::Reject) {
            return result;
        }
    }

    if (filter_.maxImpliedSpeed > 0.0 && lastAccepted_ && result.verdict == FilterVerdict::Accepted) {
        double speed = Geo::impliedSpeed(*lastAccepted_, result.sample);
        if (speed > filter_.maxImpliedSpeed) {
            std::ostringstream reason;
            reason << "implied speed " << speed << "m/s exceeds " << filter_.maxImpliedSpeed << "m/s";
            if (applyPolicy(reason.str(), result) == CheckOutcome::Reject) {
                return result;
            }
        }
    }

    result.odometerEligible = result.verdict == FilterVerdict::Accepted &&
        (filter_.odometerAccuracyThreshold <= 0.0 || result.sample.accuracy <= filter_.odometerAccuracyThreshold);
    if (result.odometerEligible) {
        if (lastOdometerFix_) {
            result.odometerDelta = Geo::distanceMeters(*lastOdometerFix_, result.sample);
        }
        lastOdometerFix_ = result.sample;
    }

    auto previous = lastAccepted_;
    lastAccepted_ = result.sample;
    recomputeElasticity(result.sample, previous);
    return result;
}

LocationFilter::CheckOutcome LocationFilter::applyPolicy(const std::string& reason, FilterResult& result) {
    switch (filter_.policy) {
        case FilterPolicy::Adjust:
            if (lastAccepted_) {
                LocationSample adjusted = *lastAccepted_;
                adjusted.timestamp = result.sample.timestamp;
                adjusted.providerTag = result.sample.providerTag;
                result.sample = adjusted;
                result.verdict = FilterVerdict::Adjusted;
                result.reason = reason;
                Log::get("Filter")->debug("adjusted fix: {}", reason);
                return CheckOutcome::Adjust;
            }
            // Nothing to substitute yet: drop quietly.
            break;
        case FilterPolicy::Discard:
            result.emitError = true;
            break;
        case FilterPolicy::Ignore:
            break;
    }

    result.verdict = FilterVerdict::Rejected;
    result.reason = reason;
    ++rejectedCount_;
    Log::get("Filter")->debug("rejected fix ({}): {}", filterPolicyToString(filter_.policy), reason);
    return CheckOutcome::Reject;
}

void LocationFilter::recomputeElasticity(const LocationSample& fix, const std::optional<LocationSample>& previous) {
    double speed = fix.speed;
    if (speed < 0.0) {
        speed = previous ? Geo::impliedSpeed(*previous, fix) : 0.0;
    }
    if (!std::isfinite(speed)) {
        speed = 0.0;
    }
    effectiveDistance_ = elasticDistance(elasticity_, speed);
}

double LocationFilter::elasticDistance(const ElasticityConfig& elasticity, double speedMetersPerSecond) {
    if (elasticity.disableElasticity || speedMetersPerSecond <= 0.0) {
        return elasticity.distanceFilter;
    }
    double steps = std::round(speedMetersPerSecond / ELASTICITY_SPEED_STEP);
    return elasticity.distanceFilter * (1.0 + elasticity.elasticityMultiplier * steps);
}

std::string filterVerdictToString(FilterVerdict verdict) {
    switch (verdict) {
        case FilterVerdict::Accepted: return "accepted";
        case FilterVerdict::Adjusted: return "adjusted";
        case FilterVerdict::Rejected: return "rejected";
        default: return "unknown";
    }
}

} // namespace geotrack::domain
