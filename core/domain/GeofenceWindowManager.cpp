#include "GeofenceWindowManager.hpp"
#include "../Geo.hpp"
#include "../Log.hpp"
#include <algorithm>

namespace geotrack::domain {

GeofenceWindowManager::GeofenceWindowManager(const GeofenceConfig& config,
                                             std::shared_ptr<ports::IGeofenceRegistrar> registrar,
                                             std::shared_ptr<ports::IEventBus> eventBus,
                                             std::shared_ptr<IClock> clock)
    : config_(config), registrar_(registrar), eventBus_(eventBus), clock_(clock) {
}

void GeofenceWindowManager::reconfigure(const GeofenceConfig& config) {
    config_ = config;
    if (lastFix_) {
        refreshMonitoredSet(*lastFix_);
    }
}

void GeofenceWindowManager::addGeofence(const GeofenceRegion& region) {
    if (auto* existing = find(region.identifier)) {
        existing->region = region;
        existing->evaluated = false;
        existing->state = MembershipState::Outside;
        if (std::find(monitored_.begin(), monitored_.end(), region.identifier) != monitored_.end()) {
            registrar_->unregisterRegion(region.identifier);
            registrar_->registerRegion(region);
        }
        return;
    }

    Entry entry;
    entry.region = region;
    entry.order = nextOrder_++;
    entries_.push_back(std::move(entry));
}

bool GeofenceWindowManager::removeGeofence(const std::string& identifier) {
    MonitoredSetChange change;
    if (!eraseEntry(identifier, change)) return false;

    if (change.changed()) {
        publishMonitoredChange(change);
    }
    return true;
}

bool GeofenceWindowManager::eraseEntry(const std::string& identifier, MonitoredSetChange& change) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.region.identifier == identifier;
    });
    if (it == entries_.end()) return false;
    entries_.erase(it);

    auto monitoredIt = std::find(monitored_.begin(), monitored_.end(), identifier);
    if (monitoredIt != monitored_.end()) {
        registrar_->unregisterRegion(identifier);
        monitored_.erase(monitoredIt);
        change.removed.push_back(identifier);
    }
    return true;
}

void GeofenceWindowManager::removeAll() {
    clearMonitoring();
    entries_.clear();
}

bool GeofenceWindowManager::exists(const std::string& identifier) const {
    return find(identifier) != nullptr;
}

std::optional<GeofenceRegion> GeofenceWindowManager::getGeofence(const std::string& identifier) const {
    const auto* entry = find(identifier);
    if (!entry) return std::nullopt;
    return entry->region;
}

std::vector<GeofenceRegion> GeofenceWindowManager::geofences() const {
    std::vector<GeofenceRegion> regions;
    regions.reserve(entries_.size());
    for (const auto& entry : entries_) {
        regions.push_back(entry.region);
    }
    return regions;
}

std::size_t GeofenceWindowManager::capacity() const {
    int platform = std::max(registrar_->capacity(), 0);
    if (config_.maxMonitored > 0) {
        return static_cast<std::size_t>(std::min(config_.maxMonitored, platform));
    }
    return static_cast<std::size_t>(platform);
}

MembershipState GeofenceWindowManager::membership(const std::string& identifier) const {
    const auto* entry = find(identifier);
    return entry ? entry->state : MembershipState::Outside;
}

GeofenceEvaluation GeofenceWindowManager::evaluate(const LocationSample& fix) {
    GeofenceEvaluation evaluation;
    lastFix_ = fix;

    for (auto& entry : entries_) {
        bool inside = Geo::isInsideRegion(fix, entry.region);
        MembershipState before = entry.state;
        auto event = advance(entry, inside, fix);
        if (event) {
            evaluation.transitions.push_back(*event);
        }
        if (config_.knockOut && before != MembershipState::Outside && entry.state == MembershipState::Outside) {
            evaluation.knockedOut.push_back(entry.region.identifier);
        }
    }

    MonitoredSetChange knockOutChange;
    for (const auto& identifier : evaluation.knockedOut) {
        Log::get("Geofence")->info("knock-out removes {}", identifier);
        eraseEntry(identifier, knockOutChange);
    }

    evaluation.monitoredChange = applyTarget(selectTarget(fix), std::move(knockOutChange));
    return evaluation;
}

MonitoredSetChange GeofenceWindowManager::refreshMonitoredSet(const LocationSample& fix) {
    lastFix_ = fix;
    return applyTarget(selectTarget(fix), MonitoredSetChange{});
}

std::vector<GeofenceEvent> GeofenceWindowManager::checkDwell(TimePoint now) {
    std::vector<GeofenceEvent> events;
    if (!lastFix_) return events;

    for (auto& entry : entries_) {
        if (entry.state != MembershipState::Inside) continue;
        if (now - entry.insideSince < dwellDelayFor(entry)) continue;

        entry.state = MembershipState::Dwelling;
        if (auto event = makeEvent(entry, GeofenceAction::Dwell, *lastFix_, now)) {
            events.push_back(*event);
        }
    }
    return events;
}

std::optional<GeofenceEvent> GeofenceWindowManager::onNativeTransition(const std::string& identifier,
                                                                      GeofenceAction action) {
    if (config_.highAccuracy) {
        Log::get("Geofence")->info("native {} for {} (advisory, in-process evaluation is authoritative)",
                                   geofenceActionToString(action), identifier);
        return std::nullopt;
    }

    auto* entry = find(identifier);
    if (!entry) {
        Log::get("Geofence")->warn("native event for unknown region {}", identifier);
        return std::nullopt;
    }

    LocationSample where;
    if (lastFix_) {
        where = *lastFix_;
    } else {
        where.lat = entry->region.lat;
        where.lon = entry->region.lon;
        where.timestamp = clock_->now();
    }
    where.timestamp = clock_->now();

    // Native events only move the in-process state along an edge it has not seen yet.
    switch (action) {
        case GeofenceAction::Enter:
            if (entry->state != MembershipState::Outside) return std::nullopt;
            entry->evaluated = true;
            entry->state = MembershipState::Inside;
            entry->insideSince = where.timestamp;
            return makeEvent(*entry, GeofenceAction::Enter, where, where.timestamp);
        case GeofenceAction::Exit:
            if (entry->state == MembershipState::Outside) return std::nullopt;
            entry->state = MembershipState::Outside;
            return makeEvent(*entry, GeofenceAction::Exit, where, where.timestamp);
        case GeofenceAction::Dwell:
            if (entry->state != MembershipState::Inside) return std::nullopt;
            entry->state = MembershipState::Dwelling;
            return makeEvent(*entry, GeofenceAction::Dwell, where, where.timestamp);
    }
    return std::nullopt;
}

MonitoredSetChange GeofenceWindowManager::clearMonitoring() {
    return applyTarget({}, MonitoredSetChange{});
}

std::vector<std::string> GeofenceWindowManager::selectTarget(const LocationSample& fix) const {
    struct Candidate {
        double distance;
        uint64_t order;
        const std::string* identifier;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(entries_.size());
    for (const auto& entry : entries_) {
        double distance = Geo::distanceToRegion(fix, entry.region);
        if (config_.proximityRadius > 0.0 && distance > config_.proximityRadius + entry.region.radius) {
            continue;
        }
        candidates.push_back({distance, entry.order, &entry.region.identifier});
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.order < b.order;
    });

    std::size_t limit = std::min(capacity(), candidates.size());
    std::vector<std::string> target;
    target.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        target.push_back(*candidates[i].identifier);
    }
    return target;
}

MonitoredSetChange GeofenceWindowManager::applyTarget(const std::vector<std::string>& target,
                                                      MonitoredSetChange change) {
    // `change` may already carry regions unregistered earlier in the same evaluation.
    std::vector<std::string> leaving;
    for (const auto& identifier : monitored_) {
        if (std::find(target.begin(), target.end(), identifier) == target.end()) {
            leaving.push_back(identifier);
        }
    }
    std::vector<std::string> entering;
    for (const auto& identifier : target) {
        if (std::find(monitored_.begin(), monitored_.end(), identifier) == monitored_.end()) {
            entering.push_back(identifier);
        }
    }

    // Unregister first so the platform never sees more than capacity() regions.
    for (const auto& identifier : leaving) {
        registrar_->unregisterRegion(identifier);
        monitored_.erase(std::find(monitored_.begin(), monitored_.end(), identifier));
        change.removed.push_back(identifier);
    }

    for (const auto& identifier : entering) {
        const auto* entry = find(identifier);
        if (entry && registrar_->registerRegion(entry->region)) {
            monitored_.push_back(identifier);
            change.added.push_back(identifier);
        } else {
            Log::get("Geofence")->error("platform refused to monitor {}", identifier);
            Event event;
            event.eventType = EventType::Error;
            event.timestamp = clock_->now();
            event.error = ErrorInfo{ErrorKind::ProviderUnavailable, "cannot monitor geofence " + identifier};
            eventBus_->publish(event);
        }
    }

    if (change.changed()) {
        publishMonitoredChange(change);
    }
    return change;
}

void GeofenceWindowManager::publishMonitoredChange(const MonitoredSetChange& change) {
    Log::get("Geofence")->debug("monitored set +{} -{} now {}",
                                change.added.size(), change.removed.size(), monitored_.size());

    Event event;
    event.eventType = EventType::GeofencesChange;
    event.timestamp = clock_->now();
    event.monitoredOn = change.added;
    event.monitoredOff = change.removed;
    eventBus_->publish(event);
}

std::optional<GeofenceEvent> GeofenceWindowManager::advance(Entry& entry, bool inside, const LocationSample& fix) {
    if (!entry.evaluated) {
        entry.evaluated = true;
        if (!inside) {
            entry.state = MembershipState::Outside;
            return std::nullopt;
        }
        entry.state = MembershipState::Inside;
        entry.insideSince = fix.timestamp;
        if (!config_.initialTriggerEntry) {
            return std::nullopt;
        }
        return makeEvent(entry, GeofenceAction::Enter, fix, fix.timestamp);
    }

    switch (entry.state) {
        case MembershipState::Outside:
            if (inside) {
                entry.state = MembershipState::Inside;
                entry.insideSince = fix.timestamp;
                return makeEvent(entry, GeofenceAction::Enter, fix, fix.timestamp);
            }
            break;
        case MembershipState::Inside:
            if (!inside) {
                entry.state = MembershipState::Outside;
                return makeEvent(entry, GeofenceAction::Exit, fix, fix.timestamp);
            }
            if (fix.timestamp - entry.insideSince >= dwellDelayFor(entry)) {
                entry.state = MembershipState::Dwelling;
                return makeEvent(entry, GeofenceAction::Dwell, fix, fix.timestamp);
            }
            break;
        case MembershipState::Dwelling:
            if (!inside) {
                entry.state = MembershipState::Outside;
                return makeEvent(entry, GeofenceAction::Exit, fix, fix.timestamp);
            }
            break;
    }
    return std::nullopt;
}

std::optional<GeofenceEvent> GeofenceWindowManager::makeEvent(const Entry& entry, GeofenceAction action,
                                                              const LocationSample& fix, TimePoint when) const {
    const auto& region = entry.region;
    bool notify = (action == GeofenceAction::Enter && region.notifyOnEntry) ||
                  (action == GeofenceAction::Exit && region.notifyOnExit) ||
                  (action == GeofenceAction::Dwell && region.notifyOnDwell);

    Log::get("Geofence")->info("{} {}{}", geofenceActionToString(action), region.identifier,
                               notify ? "" : " (not notified)");
    if (!notify) return std::nullopt;

    GeofenceEvent event;
    event.identifier = region.identifier;
    event.action = action;
    event.location = fix;
    event.timestamp = when;
    event.extras = region.extras;
    return event;
}

std::chrono::milliseconds GeofenceWindowManager::dwellDelayFor(const Entry& entry) const {
    return entry.region.loiteringDelay.count() > 0 ? entry.region.loiteringDelay : config_.dwellDelay;
}

GeofenceWindowManager::Entry* GeofenceWindowManager::find(const std::string& identifier) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.region.identifier == identifier;
    });
    return it == entries_.end() ? nullptr : &*it;
}

const GeofenceWindowManager::Entry* GeofenceWindowManager::find(const std::string& identifier) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.region.identifier == identifier;
    });
    return it == entries_.end() ? nullptr : &*it;
}

} // namespace geotrack::domain
