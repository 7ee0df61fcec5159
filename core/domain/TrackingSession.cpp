#include "TrackingSession.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"
#include <cmath>

namespace geotrack::domain {

namespace {

void requirePort(bool present, const char* name) {
    if (!present) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("session port missing: ") + name);
    }
}

} // namespace

TrackingSession::TrackingSession(SessionPorts ports)
    : ports_(std::move(ports)),
      filter_(config_.filter, config_.elasticity),
      alive_(std::make_shared<TrackingSession*>(this)) {
    requirePort(ports_.locationProvider != nullptr, "locationProvider");
    requirePort(ports_.motionSensors != nullptr, "motionSensors");
    requirePort(ports_.geofenceRegistrar != nullptr, "geofenceRegistrar");
    requirePort(ports_.timers != nullptr, "timers");
    requirePort(ports_.transport != nullptr, "transport");
    requirePort(ports_.connectivity != nullptr, "connectivity");
    requirePort(ports_.store != nullptr, "store");
    requirePort(ports_.sessionExecutor != nullptr, "sessionExecutor");
    requirePort(ports_.storageExecutor != nullptr, "storageExecutor");
    requirePort(ports_.networkExecutor != nullptr, "networkExecutor");
    requirePort(ports_.clock != nullptr, "clock");
    requirePort(ports_.eventBus != nullptr, "eventBus");
    requirePort(static_cast<bool>(ports_.policyFactory), "policyFactory");

    motion_ = std::make_unique<MotionStateMachine>(config_.motion, ports_.motionSensors, ports_.timers,
                                                   ports_.eventBus, ports_.clock);
    motion_->setIntentHandler([this](const MotionIntent& intent) { handleIntent(intent); });
    motion_->setDispatcher([this](std::function<void()> work) { post(std::move(work)); });

    geofences_ = std::make_unique<GeofenceWindowManager>(config_.geofence, ports_.geofenceRegistrar,
                                                         ports_.eventBus, ports_.clock);

    retention_ = std::make_shared<RetentionStore>(config_.retention, ports_.store, ports_.storageExecutor,
                                                  ports_.eventBus, ports_.clock);

    sync_ = std::make_shared<SyncPipeline>(config_.sync, retention_, ports_.transport, ports_.connectivity,
                                           ports_.policyFactory(config_.sync), ports_.networkExecutor,
                                           ports_.timers, ports_.eventBus, ports_.clock);

    restore();
}

TrackingSession::~TrackingSession() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive_.reset();
        cancelTimer(scheduleTimer_);
        cancelTimer(autoStopTimer_);
        cancelTimer(heartbeatTimer_);
        if (active_) {
            motion_->stop();
            if (providerActive_) {
                ports_.locationProvider->stop();
                providerActive_ = false;
            }
            geofences_->clearMonitoring();
            active_ = false;
        }
    }
    sync_->shutdown();
}

void TrackingSession::restore() {
    try {
        auto blob = ports_.store->loadState();
        odometer_ = blob.odometer;
        trackingMode_ = blob.trackingMode;
        lastLocationTime_ = blob.lastLocationTime;

        auto regions = ports_.store->loadGeofences();
        for (const auto& region : regions) {
            geofences_->addGeofence(region);
        }
        Log::get("Session")->info("restored {} geofence(s), odometer {}m", regions.size(), odometer_);
    } catch (const TrackingError& e) {
        publishError(ErrorKind::StoreError, std::string("unable to restore session state: ") + e.what());
    }
}

void TrackingSession::configure(const TrackingConfig& config) {
    Schedule schedule;
    try {
        config.validate();
        schedule = Schedule::fromEntries(config.schedule.entries, config.schedule.useUtc);
    } catch (const TrackingError& e) {
        Log::get("Session")->error("configuration rejected: {}", e.detail());
        publishError(e.kind(), e.detail());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    schedule_ = std::move(schedule);
    Log::setLevel(config_.logger.level);

    filter_.reconfigure(config_.filter, config_.elasticity);
    motion_->reconfigure(config_.motion);
    geofences_->reconfigure(config_.geofence);
    retention_->reconfigure(config_.retention);
    sync_->reconfigure(config_.sync, ports_.policyFactory(config_.sync));

    configured_ = true;
    if (state_ == SessionState::Idle) {
        state_ = SessionState::Ready;
    }

    if (state_ == SessionState::Tracking) {
        schedulerEnabled_ = !schedule_.empty();
        if (schedulerEnabled_) {
            applyScheduleWindow();
            armScheduleTimer();
        } else {
            cancelTimer(scheduleTimer_);
            activateSources();
        }
        if (active_) {
            armHeartbeatTimer();
            applyProvider();
        }
    }
    Log::get("Session")->info("configuration accepted, state {}", sessionStateToString(state_));
}

bool TrackingSession::start() {
    return startMode(TrackingMode::Location);
}

bool TrackingSession::startGeofences() {
    return startMode(TrackingMode::Geofences);
}

bool TrackingSession::checkStartable() {
    if (!configured_) {
        publishError(ErrorKind::ConfigInvalid, "start requires an accepted configuration");
        return false;
    }
    if (!ports_.locationProvider->hasPermission()) {
        Log::get("Session")->warn("location permission denied");
        publishProviderChange();
        publishError(ErrorKind::PermissionDenied, "location permission not granted");
        return false;
    }
    return true;
}

bool TrackingSession::startMode(TrackingMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checkStartable()) return false;

    if (state_ == SessionState::Tracking) {
        if (trackingMode_ != mode) {
            Log::get("Session")->info("switching to {} mode", trackingModeToString(mode));
            trackingMode_ = mode;
            persistState();
        }
        if (!schedulerEnabled_) {
            activateSources();
        }
        return true;
    }

    trackingMode_ = mode;
    state_ = SessionState::Tracking;
    filter_.reset();

    if (!schedule_.empty()) {
        enableScheduler();
    } else {
        activateSources();
    }
    armAutoStopTimer();
    persistState();

    Log::get("Session")->info("tracking started in {} mode", trackingModeToString(mode));
    return true;
}

bool TrackingSession::startSchedule() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checkStartable()) return false;
    if (schedule_.empty()) {
        publishError(ErrorKind::ConfigInvalid, "startSchedule requires schedule entries");
        return false;
    }

    if (state_ != SessionState::Tracking) {
        state_ = SessionState::Tracking;
        filter_.reset();
        armAutoStopTimer();
        Log::get("Session")->info("tracking started under schedule in {} mode",
                                  trackingModeToString(trackingMode_));
    }
    if (!schedulerEnabled_) {
        enableScheduler();
    }
    persistState();
    return true;
}

void TrackingSession::stopSchedule() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!schedulerEnabled_) return;

    schedulerEnabled_ = false;
    cancelTimer(scheduleTimer_);
    persistState();
    Log::get("Session")->info("scheduler stopped, sources {}", active_ ? "engaged" : "idle");
}

void TrackingSession::enableScheduler() {
    schedulerEnabled_ = true;
    applyScheduleWindow();
    armScheduleTimer();

    Event event;
    event.eventType = EventType::Schedule;
    event.timestamp = ports_.clock->now();
    event.enabled = active_;
    ports_.eventBus->publish(event);
}

void TrackingSession::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
}

void TrackingSession::stopLocked() {
    if (state_ == SessionState::Idle) return;

    cancelTimer(scheduleTimer_);
    cancelTimer(autoStopTimer_);
    deactivateSources();
    schedulerEnabled_ = false;
    state_ = SessionState::Idle;
    persistState();

    Log::get("Session")->info("stopped");
}

void TrackingSession::activateSources() {
    if (active_) return;
    active_ = true;

    motion_->start(false);
    applyProvider();
    sync_->startSchedule();
    armHeartbeatTimer();
    publishEnabled(true);
}

void TrackingSession::deactivateSources() {
    if (!active_) return;
    active_ = false;

    motion_->stop();
    if (providerActive_) {
        ports_.locationProvider->stop();
        providerActive_ = false;
    }
    publishProviderChange();
    geofences_->clearMonitoring();
    cancelTimer(heartbeatTimer_);
    sync_->stopSchedule();
    publishEnabled(false);
}

void TrackingSession::applyProvider() {
    if (!active_) return;

    bool moving = motion_->isMoving();
    auto mode = (moving || geofences_->requiresHighAccuracy())
        ? ports::ProviderMode::HighAccuracy : ports::ProviderMode::LowPower;
    double distance = moving ? filter_.effectiveDistanceFilter() : config_.elasticity.stationaryRadius;

    if (providerActive_ && mode == providerMode_ && std::abs(distance - providerDistance_) < 0.01) {
        return;
    }

    providerMode_ = mode;
    providerDistance_ = distance;
    providerActive_ = ports_.locationProvider->start(mode, distance);
    publishProviderChange();
    if (providerActive_) {
        Log::get("Session")->debug("provider {}, distance filter {}m",
                                   ports::providerModeToString(mode), distance);
    } else {
        publishError(ErrorKind::ProviderUnavailable, "location provider failed to start");
    }
}

void TrackingSession::post(std::function<void()> work) {
    std::weak_ptr<TrackingSession*> weak = alive_;
    ports_.sessionExecutor->post([this, weak, work = std::move(work)]() {
        if (weak.expired()) return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alive_) return;
        work();
    });
}

void TrackingSession::onLocation(const LocationSample& fix) {
    post([this, fix]() { handleLocation(fix); });
}

void TrackingSession::onActivity(const ActivityTransition& transition) {
    post([this, transition]() {
        if (active_) {
            motion_->onActivityTransition(transition);
        }
    });
}

void TrackingSession::onAccelerometer(const AccelerometerSample& sample) {
    post([this, sample]() {
        if (active_) {
            motion_->onAccelerometerSample(sample);
        }
    });
}

void TrackingSession::onNativeGeofenceEvent(const std::string& identifier, GeofenceAction action) {
    post([this, identifier, action]() {
        if (state_ != SessionState::Tracking) return;
        if (auto event = geofences_->onNativeTransition(identifier, action)) {
            handleGeofenceEvents({*event});
        }
    });
}

void TrackingSession::onConnectivityChanged(TransportType transport) {
    post([this, transport]() {
        Log::get("Session")->info("connectivity changed to {}", transportTypeToString(transport));

        Event event;
        event.eventType = EventType::ConnectivityChange;
        event.timestamp = ports_.clock->now();
        event.transport = transport;
        ports_.eventBus->publish(event);

        sync_->onConnectivityChanged(transport);
    });
}

void TrackingSession::onSourceError(SourceKind source, const std::string& detail) {
    post([this, source, detail]() {
        switch (source) {
            case SourceKind::Location:
                providerActive_ = false;
                publishProviderChange();
                publishError(ErrorKind::ProviderUnavailable, "location provider: " + detail);
                break;
            case SourceKind::ActivityClassifier:
                motion_->onSourceLost(MotionSource::ActivityClassifier, detail);
                break;
            case SourceKind::Accelerometer:
                motion_->onSourceLost(MotionSource::Accelerometer, detail);
                break;
            case SourceKind::GeofenceRegistrar:
                publishError(ErrorKind::ProviderUnavailable, "geofence registrar: " + detail);
                break;
        }
    });
}

void TrackingSession::handleLocation(const LocationSample& fix) {
    if (state_ != SessionState::Tracking || !active_) {
        Log::get("Session")->debug("fix dropped while not tracking");
        return;
    }

    auto result = filter_.process(fix);
    if (!result.accepted()) {
        Log::get("Session")->debug("fix rejected: {}", result.reason);
        if (result.emitError) {
            publishError(ErrorKind::FilterRejected, result.reason);
        }
        return;
    }

    const LocationSample& sample = result.sample;
    bool moving = motion_->isMoving();
    if (result.odometerEligible && moving) {
        odometer_ += result.odometerDelta;
    }
    lastLocation_ = sample;
    lastLocationTime_ = sample.timestamp;

    if (geofences_->size() > 0) {
        auto evaluation = geofences_->evaluate(sample);
        handleGeofenceEvents(evaluation.transitions);
        for (const auto& identifier : evaluation.knockedOut) {
            try {
                ports_.store->removeGeofence(identifier);
            } catch (const TrackingError& e) {
                publishError(ErrorKind::StoreError, e.what());
            }
        }
    }

    if (trackingMode_ == TrackingMode::Location) {
        LocationContext context{moving, odometer_, motion_->lastActivity(), motion_->lastConfidence()};
        auto inserted = retention_->insert(RecordKind::Location, JsonCodec::locationBody(sample, context));

        Event event;
        event.eventType = EventType::Location;
        event.timestamp = sample.timestamp;
        event.location = sample;
        event.record = inserted.record;
        event.isMoving = moving;
        event.activity = context.activity;
        event.confidence = context.confidence;
        ports_.eventBus->publish(event);

        if (inserted.stored) {
            sync_->onRecordInserted();
        }
    }

    applyProvider();
    persistState();
}

void TrackingSession::handleGeofenceEvents(const std::vector<GeofenceEvent>& events) {
    for (const auto& geofenceEvent : events) {
        Log::get("Session")->info("{} {}",
                                  geofenceActionToString(geofenceEvent.action), geofenceEvent.identifier);
        auto inserted = retention_->insert(RecordKind::Geofence, JsonCodec::geofenceBody(geofenceEvent));

        Event event;
        event.eventType = EventType::Geofence;
        event.timestamp = geofenceEvent.timestamp;
        event.geofence = geofenceEvent;
        event.location = geofenceEvent.location;
        event.record = inserted.record;
        event.isMoving = motion_->isMoving();
        ports_.eventBus->publish(event);

        if (inserted.stored) {
            sync_->onRecordInserted();
        }
    }
}

void TrackingSession::handleIntent(const MotionIntent& intent) {
    applyProvider();

    Event event;
    event.eventType = EventType::MotionChange;
    event.timestamp = ports_.clock->now();
    event.isMoving = intent.moving;
    event.activity = intent.activity;
    event.location = lastLocation_;
    ports_.eventBus->publish(event);

    persistState();

    if (!intent.moving && config_.motion.stopOnStationary && state_ == SessionState::Tracking) {
        Log::get("Session")->info("stationary with stopOnStationary, stopping");
        stopLocked();
    }
}

void TrackingSession::changePace(bool moving) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        Log::get("Session")->warn("changePace ignored while not tracking");
        return;
    }
    motion_->changePace(moving);
}

double TrackingSession::odometer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return odometer_;
}

void TrackingSession::setOdometer(double meters) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (meters < 0.0) {
        publishError(ErrorKind::ConfigInvalid, "odometer cannot be negative");
        return;
    }
    odometer_ = meters;
    persistState();
}

bool TrackingSession::validateRegion(const GeofenceRegion& region) {
    std::string problem;
    if (region.identifier.empty()) {
        problem = "geofence identifier is empty";
    } else if (!(region.radius > 0.0)) {
        problem = "geofence " + region.identifier + " radius must be positive";
    } else if (region.lat < -90.0 || region.lat > 90.0 || region.lon < -180.0 || region.lon > 180.0) {
        problem = "geofence " + region.identifier + " center out of range";
    }

    if (problem.empty()) return true;
    Log::get("Session")->warn("{}", problem);
    publishError(ErrorKind::ConfigInvalid, problem);
    return false;
}

bool TrackingSession::addGeofence(const GeofenceRegion& region) {
    return addGeofences({region});
}

bool TrackingSession::addGeofences(const std::vector<GeofenceRegion>& regions) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& region : regions) {
        if (!validateRegion(region)) return false;
    }

    for (const auto& region : regions) {
        geofences_->addGeofence(region);
        try {
            ports_.store->saveGeofence(region);
        } catch (const TrackingError& e) {
            publishError(ErrorKind::StoreError, e.what());
        }
    }
    refreshGeofenceWindow();
    return true;
}

bool TrackingSession::removeGeofence(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = geofences_->removeGeofence(identifier);
    try {
        ports_.store->removeGeofence(identifier);
    } catch (const TrackingError& e) {
        publishError(ErrorKind::StoreError, e.what());
    }
    if (removed) {
        refreshGeofenceWindow();
    }
    return removed;
}

void TrackingSession::removeGeofences() {
    std::lock_guard<std::mutex> lock(mutex_);
    geofences_->removeAll();
    try {
        ports_.store->removeAllGeofences();
    } catch (const TrackingError& e) {
        publishError(ErrorKind::StoreError, e.what());
    }
    applyProvider();
}

bool TrackingSession::geofenceExists(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return geofences_->exists(identifier);
}

std::optional<GeofenceRegion> TrackingSession::getGeofence(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return geofences_->getGeofence(identifier);
}

std::vector<GeofenceRegion> TrackingSession::geofences() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return geofences_->geofences();
}

void TrackingSession::refreshGeofenceWindow() {
    if (active_ && lastLocation_) {
        geofences_->refreshMonitoredSet(*lastLocation_);
    }
    applyProvider();
}

SessionSnapshot TrackingSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionSnapshot snap;
    snap.state = state_;
    snap.enabled = active_;
    snap.trackingMode = trackingMode_;
    snap.schedulerEnabled = schedulerEnabled_;
    snap.isMoving = motion_->isRunning() && motion_->isMoving();
    snap.motionState = motion_->getCurrentState();
    snap.activity = motion_->lastActivity();
    snap.confidence = motion_->lastConfidence();
    snap.odometer = odometer_;
    snap.lastLocation = lastLocation_;
    snap.effectiveDistanceFilter = filter_.effectiveDistanceFilter();
    snap.providerMode = providerMode_;
    snap.providerActive = providerActive_;
    snap.registeredGeofences = geofences_->size();
    snap.monitoredGeofences = geofences_->monitored().size();
    snap.rejectedFixes = filter_.rejectedCount();
    snap.unsyncedRecords = retention_->count(false);
    snap.syncInFlight = sync_->isInFlight();
    return snap;
}

SessionState TrackingSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<Record> TrackingSession::records(const ports::RecordQuery& query) const {
    return retention_->query(query);
}

std::size_t TrackingSession::count(std::optional<bool> synced) const {
    return retention_->count(synced);
}

void TrackingSession::syncNow() {
    sync_->requestDrain(DrainTrigger::Explicit);
}

std::optional<int64_t> TrackingSession::insertLocation(const LocationSample& fix) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fix.lat < -90.0 || fix.lat > 90.0 || fix.lon < -180.0 || fix.lon > 180.0) {
        publishError(ErrorKind::ConfigInvalid, "inserted location out of range");
        return std::nullopt;
    }

    bool moving = motion_->isRunning() && motion_->isMoving();
    LocationContext context{moving, odometer_, motion_->lastActivity(), motion_->lastConfidence()};
    auto inserted = retention_->insert(RecordKind::Location, JsonCodec::locationBody(fix, context));
    if (!inserted.stored) {
        return std::nullopt;
    }
    sync_->onRecordInserted();
    return inserted.record.id;
}

bool TrackingSession::destroyLocation(int64_t id) {
    return retention_->remove(id);
}

PruneResult TrackingSession::pruneNow() {
    return retention_->enforceRetention();
}

std::size_t TrackingSession::clearRecords() {
    return retention_->clear();
}

ports::TimerId TrackingSession::scheduleTimer(std::chrono::milliseconds delay,
                                              std::function<void(ports::TimerId)> work) {
    std::weak_ptr<TrackingSession*> weak = alive_;
    auto id = std::make_shared<ports::TimerId>(ports::kInvalidTimer);
    *id = ports_.timers->schedule(delay, [this, weak, id, work]() {
        if (weak.expired()) return;
        post([id, work]() { work(*id); });
    });
    return *id;
}

void TrackingSession::cancelTimer(ports::TimerId& id) {
    if (id != ports::kInvalidTimer) {
        ports_.timers->cancel(id);
        id = ports::kInvalidTimer;
    }
}

void TrackingSession::applyScheduleWindow() {
    bool inside = schedule_.isActive(ports_.clock->now());
    if (inside) {
        activateSources();
    } else {
        deactivateSources();
    }
}

void TrackingSession::armScheduleTimer() {
    cancelTimer(scheduleTimer_);

    auto now = ports_.clock->now();
    auto next = schedule_.nextTransition(now);
    if (!next) return;

    auto delay = std::chrono::ceil<std::chrono::milliseconds>(*next - now);
    scheduleTimer_ = scheduleTimer(delay, [this](ports::TimerId id) { handleScheduleEdge(id); });
}

void TrackingSession::handleScheduleEdge(ports::TimerId id) {
    if (id != scheduleTimer_) return;
    scheduleTimer_ = ports::kInvalidTimer;
    if (state_ != SessionState::Tracking || !schedulerEnabled_) return;

    bool wasActive = active_;
    applyScheduleWindow();
    if (wasActive != active_) {
        Log::get("Session")->info("schedule window {}", active_ ? "opened" : "closed");

        Event event;
        event.eventType = EventType::Schedule;
        event.timestamp = ports_.clock->now();
        event.enabled = active_;
        ports_.eventBus->publish(event);
        persistState();
    }
    armScheduleTimer();
}

void TrackingSession::armAutoStopTimer() {
    cancelTimer(autoStopTimer_);
    if (config_.app.stopAfterElapsedMinutes <= 0) return;

    autoStopTimer_ = scheduleTimer(std::chrono::minutes(config_.app.stopAfterElapsedMinutes),
                                   [this](ports::TimerId id) {
        if (id != autoStopTimer_) return;
        autoStopTimer_ = ports::kInvalidTimer;
        Log::get("Session")->info("stopAfterElapsedMinutes reached");
        stopLocked();
    });
}

void TrackingSession::armHeartbeatTimer() {
    cancelTimer(heartbeatTimer_);
    if (config_.app.heartbeatInterval.count() <= 0) return;

    heartbeatTimer_ = scheduleTimer(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.app.heartbeatInterval),
        [this](ports::TimerId id) { handleHeartbeat(id); });
}

void TrackingSession::handleHeartbeat(ports::TimerId id) {
    if (id != heartbeatTimer_) return;
    heartbeatTimer_ = ports::kInvalidTimer;
    if (!active_) return;

    handleGeofenceEvents(geofences_->checkDwell(ports_.clock->now()));

    Event event;
    event.eventType = EventType::Heartbeat;
    event.timestamp = ports_.clock->now();
    event.location = lastLocation_;
    event.isMoving = motion_->isMoving();
    ports_.eventBus->publish(event);

    armHeartbeatTimer();
}

void TrackingSession::persistState() {
    SessionStateBlob blob;
    blob.enabled = state_ == SessionState::Tracking;
    blob.trackingMode = trackingMode_;
    blob.schedulerEnabled = schedulerEnabled_;
    blob.odometer = odometer_;
    blob.isMoving = motion_->isRunning() && motion_->isMoving();
    blob.lastLocationTime = lastLocationTime_;

    auto store = ports_.store;
    auto eventBus = ports_.eventBus;
    auto clock = ports_.clock;
    ports_.storageExecutor->post([store, eventBus, clock, blob]() {
        try {
            store->saveState(blob);
        } catch (const TrackingError& e) {
            Log::get("Session")->error("unable to save state: {}", e.what());

            Event event;
            event.eventType = EventType::Error;
            event.timestamp = clock->now();
            event.error = ErrorInfo{ErrorKind::StoreError, e.what()};
            eventBus->publish(event);
        }
    });
}

void TrackingSession::publishEnabled(bool enabled) {
    Event event;
    event.eventType = EventType::Enabled;
    event.timestamp = ports_.clock->now();
    event.enabled = enabled;
    ports_.eventBus->publish(event);
}

void TrackingSession::publishProviderChange() {
    ProviderStatus status;
    status.active = providerActive_;
    status.permissionGranted = ports_.locationProvider->hasPermission();
    status.highAccuracy = providerMode_ == ports::ProviderMode::HighAccuracy;
    status.distanceFilter = providerActive_ ? providerDistance_ : 0.0;

    if (reportedProvider_ && reportedProvider_->active == status.active &&
        reportedProvider_->permissionGranted == status.permissionGranted &&
        reportedProvider_->highAccuracy == status.highAccuracy &&
        reportedProvider_->distanceFilter == status.distanceFilter) {
        return;
    }
    reportedProvider_ = status;

    Event event;
    event.eventType = EventType::ProviderChange;
    event.timestamp = ports_.clock->now();
    event.enabled = status.active;
    event.provider = status;
    ports_.eventBus->publish(event);
}

void TrackingSession::publishError(ErrorKind kind, const std::string& detail) {
    Event event;
    event.eventType = EventType::Error;
    event.timestamp = ports_.clock->now();
    event.error = ErrorInfo{kind, detail};
    ports_.eventBus->publish(event);
}

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Ready: return "ready";
        case SessionState::Tracking: return "tracking";
    }
    return "unknown";
}

std::string sourceKindToString(SourceKind source) {
    switch (source) {
        case SourceKind::Location: return "location";
        case SourceKind::ActivityClassifier: return "activity_classifier";
        case SourceKind::Accelerometer: return "accelerometer";
        case SourceKind::GeofenceRegistrar: return "geofence_registrar";
    }
    return "unknown";
}

} // namespace geotrack::domain
