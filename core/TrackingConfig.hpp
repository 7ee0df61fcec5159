#pragma once

#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace geotrack {

enum class FilterPolicy {
    Adjust,
    Ignore,
    Discard
};

enum class PersistMode {
    All,
    LocationOnly,
    GeofenceOnly,
    None
};

enum class HttpMethod {
    Post,
    Put
};

enum class SortOrder {
    Ascending,
    Descending
};

struct ElasticityConfig {
    double distanceFilter = 10.0;
    double stationaryRadius = 25.0;
    bool disableElasticity = false;
    double elasticityMultiplier = 1.0;
};

// Thresholds of 0 disable the corresponding check.
struct FilterConfig {
    FilterPolicy policy = FilterPolicy::Adjust;
    double trackingAccuracyThreshold = 0.0;
    double maxImpliedSpeed = 0.0;
    double odometerAccuracyThreshold = 0.0;
};

struct MotionConfig {
    std::chrono::milliseconds stopTimeout = std::chrono::minutes(5);
    std::chrono::milliseconds motionTriggerDelay{0};
    double shakeThreshold = 2.5;
    int minimumActivityConfidence = 75;
    bool disableMotionActivityUpdates = false;
    bool disableStopDetection = false;
    bool stopOnStationary = false;
};

struct GeofenceConfig {
    int maxMonitored = -1;              // -1 uses the registrar's capacity
    double proximityRadius = 0.0;       // 0 disables the proximity cut-off
    std::chrono::milliseconds dwellDelay = std::chrono::minutes(5);
    bool initialTriggerEntry = true;
    bool knockOut = false;
    bool highAccuracy = false;
};

struct RetentionConfig {
    PersistMode persistMode = PersistMode::All;
    int maxDaysToPersist = -1;
    int maxRecordsToPersist = -1;
    nlohmann::json extras = nlohmann::json::object();
    std::string locationTemplate;
    std::string geofenceTemplate;
};

struct SyncConfig {
    std::string url;
    HttpMethod method = HttpMethod::Post;
    std::map<std::string, std::string> headers;
    std::string rootProperty = "location";
    bool batchSync = false;
    int maxBatchSize = 250;
    bool autoSync = true;
    int autoSyncThreshold = 0;
    std::chrono::milliseconds timeout{60000};
    nlohmann::json params = nlohmann::json::object();
    SortOrder order = SortOrder::Ascending;
    bool disableAutoSyncOnCellular = false;
    int maxAttempts = 10;
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffCeiling{300000};
    std::chrono::seconds syncInterval{0};
    std::string signingKey;

    bool enabled() const { return !url.empty(); }
    std::size_t batchLimit() const;
};

struct ScheduleConfig {
    std::vector<std::string> entries;
    bool useUtc = false;
};

struct AppConfig {
    int stopAfterElapsedMinutes = -1;
    std::chrono::seconds heartbeatInterval{0};
};

struct LoggerConfig {
    LogLevel level = LogLevel::Info;
};

/**
 * @brief Immutable configuration snapshot for one tracking session
 *
 * Built once from JSON and validated before a session accepts it. Replacing the
 * snapshot goes through TrackingSession::configure(); nothing mutates a snapshot
 * a component already holds.
 */
struct TrackingConfig {
    ElasticityConfig elasticity;
    FilterConfig filter;
    MotionConfig motion;
    GeofenceConfig geofence;
    RetentionConfig retention;
    SyncConfig sync;
    ScheduleConfig schedule;
    AppConfig app;
    LoggerConfig logger;

    /// @throws TrackingError{ConfigInvalid} naming the first invalid field
    void validate() const;

    /// @throws TrackingError{ConfigInvalid} on type mismatches or unknown enum strings
    static TrackingConfig fromJson(const nlohmann::json& json);
    static TrackingConfig fromFile(const std::string& path);
};

std::string filterPolicyToString(FilterPolicy policy);
std::string persistModeToString(PersistMode mode);
std::string httpMethodToString(HttpMethod method);

} // namespace geotrack
