#pragma once

#include "GeofenceWindowManager.hpp"
#include "LocationFilter.hpp"
#include "MotionStateMachine.hpp"
#include "RetentionStore.hpp"
#include "SyncPipeline.hpp"
#include "../Schedule.hpp"
#include "../TrackingConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IConnectivity.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IExecutor.hpp"
#include "../ports/IGeofenceRegistrar.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/IMotionSensors.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IRecordStore.hpp"
#include "../ports/ITimerService.hpp"
#include "../ports/ITransport.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace geotrack::domain {

enum class SessionState {
    Idle,
    Ready,
    Tracking
};

enum class SourceKind {
    Location,
    ActivityClassifier,
    Accelerometer,
    GeofenceRegistrar
};

using PolicyFactory = std::function<std::shared_ptr<ports::IPolicyEngine>(const SyncConfig&)>;

// Everything the session talks to. All members are required.
struct SessionPorts {
    std::shared_ptr<ports::ILocationProvider> locationProvider;
    std::shared_ptr<ports::IMotionSensors> motionSensors;
    std::shared_ptr<ports::IGeofenceRegistrar> geofenceRegistrar;
    std::shared_ptr<ports::ITimerService> timers;
    std::shared_ptr<ports::ITransport> transport;
    std::shared_ptr<ports::IConnectivity> connectivity;
    std::shared_ptr<ports::IRecordStore> store;
    std::shared_ptr<ports::IExecutor> sessionExecutor;
    std::shared_ptr<ports::IExecutor> storageExecutor;
    std::shared_ptr<ports::IExecutor> networkExecutor;
    std::shared_ptr<IClock> clock;
    std::shared_ptr<ports::IEventBus> eventBus;
    PolicyFactory policyFactory;
};

struct SessionSnapshot {
    SessionState state = SessionState::Idle;
    bool enabled = false;                   // sources engaged (false outside schedule windows)
    TrackingMode trackingMode = TrackingMode::Location;
    bool schedulerEnabled = false;
    bool isMoving = false;
    MotionState motionState = MotionState::Stationary;
    ActivityType activity = ActivityType::Unknown;
    int confidence = 0;
    double odometer = 0.0;
    std::optional<LocationSample> lastLocation;
    double effectiveDistanceFilter = 0.0;
    ports::ProviderMode providerMode = ports::ProviderMode::LowPower;
    bool providerActive = false;
    std::size_t registeredGeofences = 0;
    std::size_t monitoredGeofences = 0;
    std::size_t rejectedFixes = 0;
    std::size_t unsyncedRecords = 0;
    bool syncInFlight = false;
};

/**
 * @brief Owns one tracking session and serializes every state change
 *
 * Source callbacks (fixes, activity transitions, accelerometer samples,
 * connectivity, native geofence transitions) only post to the session
 * executor. Each posted task takes the session mutex, so a fix is filtered,
 * classified against geofences, persisted and announced before the next one
 * starts. Persistence pruning and uploads run on their own executors.
 *
 * States: IDLE -> READY (configure) -> TRACKING (start/startGeofences) -> IDLE (stop).
 * The accepted configuration survives stop(), so start() from IDLE is allowed
 * once a configuration has been accepted.
 *
 * startSchedule() enters TRACKING under schedule control without start().
 * stopSchedule() only hands control back: the session stays in TRACKING with
 * its sources as the last window left them until stop() or start().
 */
class TrackingSession {
public:
    explicit TrackingSession(SessionPorts ports);
    ~TrackingSession();

    TrackingSession(const TrackingSession&) = delete;
    TrackingSession& operator=(const TrackingSession&) = delete;

    /// @throws TrackingError{ConfigInvalid}; an error event is published as well
    void configure(const TrackingConfig& config);

    // Return false when the session cannot reach TRACKING (no config, no permission).
    bool start();
    bool startGeofences();
    void stop();
    bool startSchedule();
    void stopSchedule();

    // Source entry points; safe to call from any thread.
    void onLocation(const LocationSample& fix);
    void onActivity(const ActivityTransition& transition);
    void onAccelerometer(const AccelerometerSample& sample);
    void onNativeGeofenceEvent(const std::string& identifier, GeofenceAction action);
    void onConnectivityChanged(TransportType transport);
    void onSourceError(SourceKind source, const std::string& detail);

    void changePace(bool moving);
    double odometer() const;
    void setOdometer(double meters);

    bool addGeofence(const GeofenceRegion& region);
    bool addGeofences(const std::vector<GeofenceRegion>& regions);
    bool removeGeofence(const std::string& identifier);
    void removeGeofences();
    bool geofenceExists(const std::string& identifier) const;
    std::optional<GeofenceRegion> getGeofence(const std::string& identifier) const;
    std::vector<GeofenceRegion> geofences() const;

    SessionSnapshot snapshot() const;
    SessionState state() const;
    std::vector<Record> records(const ports::RecordQuery& query) const;
    std::size_t count(std::optional<bool> synced = std::nullopt) const;
    // Stores a fix as-is, bypassing the filter. Returns the record id.
    std::optional<int64_t> insertLocation(const LocationSample& fix);
    bool destroyLocation(int64_t id);
    void syncNow();
    PruneResult pruneNow();
    std::size_t clearRecords();

    const TrackingConfig& config() const { return config_; }
    const std::shared_ptr<ports::IEventBus>& eventBus() const { return ports_.eventBus; }

private:
    bool startMode(TrackingMode mode);
    bool checkStartable();
    void enableScheduler();
    void stopLocked();

    void post(std::function<void()> work);

    void handleLocation(const LocationSample& fix);
    void handleGeofenceEvents(const std::vector<GeofenceEvent>& events);
    void handleIntent(const MotionIntent& intent);
    void handleHeartbeat(ports::TimerId id);
    void handleScheduleEdge(ports::TimerId id);

    void activateSources();
    void deactivateSources();
    void applyProvider();
    void applyScheduleWindow();
    void armScheduleTimer();
    void armAutoStopTimer();
    void armHeartbeatTimer();
    void cancelTimer(ports::TimerId& id);
    ports::TimerId scheduleTimer(std::chrono::milliseconds delay, std::function<void(ports::TimerId)> work);

    void restore();
    void persistState();
    void publishEnabled(bool enabled);
    void publishProviderChange();
    void publishError(ErrorKind kind, const std::string& detail);
    bool validateRegion(const GeofenceRegion& region);
    void refreshGeofenceWindow();

    SessionPorts ports_;
    TrackingConfig config_;
    Schedule schedule_;

    LocationFilter filter_;
    std::unique_ptr<MotionStateMachine> motion_;
    std::unique_ptr<GeofenceWindowManager> geofences_;
    std::shared_ptr<RetentionStore> retention_;
    std::shared_ptr<SyncPipeline> sync_;

    mutable std::mutex mutex_;
    std::shared_ptr<TrackingSession*> alive_;

    SessionState state_ = SessionState::Idle;
    bool configured_ = false;
    bool active_ = false;
    TrackingMode trackingMode_ = TrackingMode::Location;
    bool schedulerEnabled_ = false;
    double odometer_ = 0.0;
    std::optional<LocationSample> lastLocation_;
    std::optional<TimePoint> lastLocationTime_;

    bool providerActive_ = false;
    ports::ProviderMode providerMode_ = ports::ProviderMode::LowPower;
    double providerDistance_ = 0.0;
    std::optional<ProviderStatus> reportedProvider_;

    ports::TimerId scheduleTimer_ = ports::kInvalidTimer;
    ports::TimerId autoStopTimer_ = ports::kInvalidTimer;
    ports::TimerId heartbeatTimer_ = ports::kInvalidTimer;
};

std::string sessionStateToString(SessionState state);
std::string sourceKindToString(SourceKind source);

} // namespace geotrack::domain
