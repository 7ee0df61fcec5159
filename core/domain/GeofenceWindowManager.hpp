#pragma once

#include "../Model.hpp"
#include "../TrackingConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IGeofenceRegistrar.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geotrack::domain {

struct MonitoredSetChange {
    std::vector<std::string> added;
    std::vector<std::string> removed;

    bool changed() const { return !added.empty() || !removed.empty(); }
};

struct GeofenceEvaluation {
    std::vector<GeofenceEvent> transitions;     // only those the region asked to be notified of
    MonitoredSetChange monitoredChange;
    std::vector<std::string> knockedOut;
};

/**
 * @brief Keeps the platform's bounded region monitor pointed at the nearest regions
 *
 * The registered set is unbounded; at most capacity() regions are handed to the
 * native registrar, chosen by distance to the latest qualifying fix with ties
 * broken by registration order. Membership (OUTSIDE, INSIDE, DWELLING) is
 * computed in-process for every registered region.
 */
class GeofenceWindowManager {
public:
    GeofenceWindowManager(const GeofenceConfig& config,
                         std::shared_ptr<ports::IGeofenceRegistrar> registrar,
                         std::shared_ptr<ports::IEventBus> eventBus,
                         std::shared_ptr<IClock> clock);

    void reconfigure(const GeofenceConfig& config);

    // Replaces an existing region with the same identifier.
    void addGeofence(const GeofenceRegion& region);
    bool removeGeofence(const std::string& identifier);
    void removeAll();

    bool exists(const std::string& identifier) const;
    std::optional<GeofenceRegion> getGeofence(const std::string& identifier) const;
    std::vector<GeofenceRegion> geofences() const;
    std::size_t size() const { return entries_.size(); }

    GeofenceEvaluation evaluate(const LocationSample& fix);
    MonitoredSetChange refreshMonitoredSet(const LocationSample& fix);
    std::vector<GeofenceEvent> checkDwell(TimePoint now);

    // Native registrar callback. Advisory only in high-accuracy mode.
    std::optional<GeofenceEvent> onNativeTransition(const std::string& identifier, GeofenceAction action);

    // Unregisters everything from the platform; membership is kept.
    MonitoredSetChange clearMonitoring();

    std::size_t capacity() const;
    const std::vector<std::string>& monitored() const { return monitored_; }
    MembershipState membership(const std::string& identifier) const;
    bool requiresHighAccuracy() const { return config_.highAccuracy && !entries_.empty(); }

private:
    struct Entry {
        GeofenceRegion region;
        uint64_t order = 0;
        MembershipState state = MembershipState::Outside;
        bool evaluated = false;
        TimePoint insideSince;
    };

    std::vector<std::string> selectTarget(const LocationSample& fix) const;
    MonitoredSetChange applyTarget(const std::vector<std::string>& target, MonitoredSetChange change);
    bool eraseEntry(const std::string& identifier, MonitoredSetChange& change);
    void publishMonitoredChange(const MonitoredSetChange& change);

    std::optional<GeofenceEvent> advance(Entry& entry, bool inside, const LocationSample& fix);
    std::optional<GeofenceEvent> makeEvent(const Entry& entry, GeofenceAction action,
                                           const LocationSample& fix, TimePoint when) const;
    std::chrono::milliseconds dwellDelayFor(const Entry& entry) const;
    Entry* find(const std::string& identifier);
    const Entry* find(const std::string& identifier) const;

    GeofenceConfig config_;
    std::shared_ptr<ports::IGeofenceRegistrar> registrar_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    std::vector<Entry> entries_;                // registration order
    std::vector<std::string> monitored_;
    std::optional<LocationSample> lastFix_;
    uint64_t nextOrder_ = 0;
};

} // namespace geotrack::domain
