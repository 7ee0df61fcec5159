#include "TrackingConfig.hpp"
#include "Errors.hpp"
#include "JsonCodec.hpp"
#include "Schedule.hpp"
#include <fstream>
#include <unordered_map>

namespace geotrack {

namespace {

const nlohmann::json& section(const nlohmann::json& json, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = json.find(name);
    if (it == json.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("section '") + name + "' must be an object");
    }
    return *it;
}

template <typename T>
T read(const nlohmann::json& json, const char* key, T fallback) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        throw TrackingError(ErrorKind::ConfigInvalid, std::string("field '") + key + "' has the wrong type");
    }
}

FilterPolicy parseFilterPolicy(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        switch (value.get<int>()) {
            case 0: return FilterPolicy::Adjust;
            case 1: return FilterPolicy::Ignore;
            case 2: return FilterPolicy::Discard;
            default: break;
        }
    } else if (value.is_string()) {
        static const std::unordered_map<std::string, FilterPolicy> policies = {
            {"adjust", FilterPolicy::Adjust},
            {"ignore", FilterPolicy::Ignore},
            {"discard", FilterPolicy::Discard}
        };
        auto it = policies.find(value.get<std::string>());
        if (it != policies.end()) return it->second;
    }
    throw TrackingError(ErrorKind::ConfigInvalid, "filter.policy must be adjust, ignore or discard");
}

PersistMode parsePersistMode(const nlohmann::json& value) {
    if (value.is_string()) {
        static const std::unordered_map<std::string, PersistMode> modes = {
            {"all", PersistMode::All},
            {"location", PersistMode::LocationOnly},
            {"geofence", PersistMode::GeofenceOnly},
            {"none", PersistMode::None}
        };
        auto it = modes.find(value.get<std::string>());
        if (it != modes.end()) return it->second;
    }
    throw TrackingError(ErrorKind::ConfigInvalid, "persistence.persistMode must be all, location, geofence or none");
}

HttpMethod parseHttpMethod(const nlohmann::json& value) {
    if (value.is_string()) {
        auto method = value.get<std::string>();
        if (method == "POST" || method == "post") return HttpMethod::Post;
        if (method == "PUT" || method == "put") return HttpMethod::Put;
    }
    throw TrackingError(ErrorKind::ConfigInvalid, "http.method must be POST or PUT");
}

SortOrder parseSortOrder(const nlohmann::json& value) {
    if (value.is_string()) {
        auto order = value.get<std::string>();
        if (order == "ASC" || order == "asc") return SortOrder::Ascending;
        if (order == "DESC" || order == "desc") return SortOrder::Descending;
    }
    throw TrackingError(ErrorKind::ConfigInvalid, "http.locationsOrderDirection must be ASC or DESC");
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw TrackingError(ErrorKind::ConfigInvalid, message);
    }
}

Record sampleRecord(RecordKind kind) {
    Record record;
    record.id = 1;
    record.kind = kind;
    if (kind == RecordKind::Location) {
        record.body = JsonCodec::locationBody(LocationSample{}, LocationContext{});
    } else {
        record.body = JsonCodec::geofenceBody(GeofenceEvent{});
    }
    return record;
}

} // namespace

std::size_t SyncConfig::batchLimit() const {
    if (!batchSync) {
        return 1;
    }
    return maxBatchSize < 0 ? static_cast<std::size_t>(1000) : static_cast<std::size_t>(maxBatchSize);
}

TrackingConfig TrackingConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw TrackingError(ErrorKind::ConfigInvalid, "configuration must be a JSON object");
    }

    TrackingConfig config;

    const auto& geo = section(json, "geo");
    config.elasticity.distanceFilter = read(geo, "distanceFilter", config.elasticity.distanceFilter);
    config.elasticity.stationaryRadius = read(geo, "stationaryRadius", config.elasticity.stationaryRadius);
    config.elasticity.disableElasticity = read(geo, "disableElasticity", config.elasticity.disableElasticity);
    config.elasticity.elasticityMultiplier = read(geo, "elasticityMultiplier", config.elasticity.elasticityMultiplier);

    const auto& filter = section(json, "filter");
    if (filter.contains("policy")) {
        config.filter.policy = parseFilterPolicy(filter["policy"]);
    }
    config.filter.trackingAccuracyThreshold = read(filter, "trackingAccuracyThreshold", config.filter.trackingAccuracyThreshold);
    config.filter.maxImpliedSpeed = read(filter, "maxImpliedSpeed", config.filter.maxImpliedSpeed);
    config.filter.odometerAccuracyThreshold = read(filter, "odometerAccuracyThreshold", config.filter.odometerAccuracyThreshold);

    const auto& motion = section(json, "motion");
    config.motion.stopTimeout = std::chrono::minutes(read<int64_t>(motion, "stopTimeout", 5));
    config.motion.motionTriggerDelay = std::chrono::milliseconds(read<int64_t>(motion, "motionTriggerDelay", 0));
    config.motion.shakeThreshold = read(motion, "shakeThreshold", config.motion.shakeThreshold);
    config.motion.minimumActivityConfidence = read(motion, "minimumActivityRecognitionConfidence", config.motion.minimumActivityConfidence);
    config.motion.disableMotionActivityUpdates = read(motion, "disableMotionActivityUpdates", config.motion.disableMotionActivityUpdates);
    config.motion.disableStopDetection = read(motion, "disableStopDetection", config.motion.disableStopDetection);
    config.motion.stopOnStationary = read(motion, "stopOnStationary", config.motion.stopOnStationary);

    const auto& geofence = section(json, "geofence");
    config.geofence.maxMonitored = read(geofence, "maxMonitoredGeofences", config.geofence.maxMonitored);
    config.geofence.proximityRadius = read(geofence, "geofenceProximityRadius", config.geofence.proximityRadius);
    config.geofence.dwellDelay = std::chrono::milliseconds(read<int64_t>(geofence, "dwellDelay", config.geofence.dwellDelay.count()));
    config.geofence.initialTriggerEntry = read(geofence, "geofenceInitialTriggerEntry", config.geofence.initialTriggerEntry);
    config.geofence.knockOut = read(geofence, "geofenceModeKnockOut", config.geofence.knockOut);
    config.geofence.highAccuracy = read(geofence, "geofenceModeHighAccuracy", config.geofence.highAccuracy);

    const auto& persistence = section(json, "persistence");
    if (persistence.contains("persistMode")) {
        config.retention.persistMode = parsePersistMode(persistence["persistMode"]);
    }
    config.retention.maxDaysToPersist = read(persistence, "maxDaysToPersist", config.retention.maxDaysToPersist);
    config.retention.maxRecordsToPersist = read(persistence, "maxRecordsToPersist", config.retention.maxRecordsToPersist);
    config.retention.locationTemplate = read(persistence, "locationTemplate", config.retention.locationTemplate);
    config.retention.geofenceTemplate = read(persistence, "geofenceTemplate", config.retention.geofenceTemplate);
    if (persistence.contains("extras")) {
        require(persistence["extras"].is_object(), "persistence.extras must be an object");
        config.retention.extras = persistence["extras"];
    }

    const auto& http = section(json, "http");
    config.sync.url = read(http, "url", config.sync.url);
    if (http.contains("method")) {
        config.sync.method = parseHttpMethod(http["method"]);
    }
    config.sync.headers = read(http, "headers", config.sync.headers);
    config.sync.rootProperty = read(http, "httpRootProperty", config.sync.rootProperty);
    config.sync.batchSync = read(http, "batchSync", config.sync.batchSync);
    config.sync.maxBatchSize = read(http, "maxBatchSize", config.sync.maxBatchSize);
    config.sync.autoSync = read(http, "autoSync", config.sync.autoSync);
    config.sync.autoSyncThreshold = read(http, "autoSyncThreshold", config.sync.autoSyncThreshold);
    config.sync.timeout = std::chrono::milliseconds(read<int64_t>(http, "httpTimeout", config.sync.timeout.count()));
    if (http.contains("params")) {
        require(http["params"].is_object(), "http.params must be an object");
        config.sync.params = http["params"];
    }
    if (http.contains("locationsOrderDirection")) {
        config.sync.order = parseSortOrder(http["locationsOrderDirection"]);
    }
    config.sync.disableAutoSyncOnCellular = read(http, "disableAutoSyncOnCellular", config.sync.disableAutoSyncOnCellular);
    config.sync.maxAttempts = read(http, "maxAttempts", config.sync.maxAttempts);
    config.sync.backoffBase = std::chrono::milliseconds(read<int64_t>(http, "retryBaseDelay", config.sync.backoffBase.count()));
    config.sync.backoffCeiling = std::chrono::milliseconds(read<int64_t>(http, "retryMaxDelay", config.sync.backoffCeiling.count()));
    config.sync.syncInterval = std::chrono::seconds(read<int64_t>(http, "syncInterval", config.sync.syncInterval.count()));
    config.sync.signingKey = read(http, "signingKey", config.sync.signingKey);

    const auto& app = section(json, "app");
    config.app.stopAfterElapsedMinutes = read(app, "stopAfterElapsedMinutes", config.app.stopAfterElapsedMinutes);
    config.app.heartbeatInterval = std::chrono::seconds(read<int64_t>(app, "heartbeatInterval", config.app.heartbeatInterval.count()));
    config.schedule.entries = read(app, "schedule", config.schedule.entries);
    config.schedule.useUtc = read(app, "scheduleUseUtc", config.schedule.useUtc);

    const auto& logger = section(json, "logger");
    if (logger.contains("logLevel")) {
        config.logger.level = stringToLogLevel(read<std::string>(logger, "logLevel", "info"));
    }

    return config;
}

TrackingConfig TrackingConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TrackingError(ErrorKind::ConfigInvalid, "cannot open configuration file " + path);
    }
    try {
        return fromJson(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw TrackingError(ErrorKind::ConfigInvalid, path + ": " + e.what());
    }
}

void TrackingConfig::validate() const {
    require(elasticity.distanceFilter >= 0.0, "geo.distanceFilter must be >= 0");
    require(elasticity.stationaryRadius >= 0.0, "geo.stationaryRadius must be >= 0");
    require(elasticity.elasticityMultiplier > 0.0, "geo.elasticityMultiplier must be > 0");

    require(filter.trackingAccuracyThreshold >= 0.0, "filter.trackingAccuracyThreshold must be >= 0");
    require(filter.maxImpliedSpeed >= 0.0, "filter.maxImpliedSpeed must be >= 0");
    require(filter.odometerAccuracyThreshold >= 0.0, "filter.odometerAccuracyThreshold must be >= 0");

    require(motion.stopTimeout.count() >= 0, "motion.stopTimeout must be >= 0");
    require(motion.motionTriggerDelay.count() >= 0, "motion.motionTriggerDelay must be >= 0");
    require(motion.shakeThreshold > 0.0, "motion.shakeThreshold must be > 0");
    require(motion.minimumActivityConfidence >= 0 && motion.minimumActivityConfidence <= 100,
            "motion.minimumActivityRecognitionConfidence must be within 0..100");

    require(geofence.maxMonitored == -1 || geofence.maxMonitored > 0, "geofence.maxMonitoredGeofences must be -1 or > 0");
    require(geofence.proximityRadius >= 0.0, "geofence.geofenceProximityRadius must be >= 0");
    require(geofence.dwellDelay.count() >= 0, "geofence.dwellDelay must be >= 0");

    require(retention.maxDaysToPersist == -1 || retention.maxDaysToPersist > 0, "persistence.maxDaysToPersist must be -1 or > 0");
    require(retention.maxRecordsToPersist == -1 || retention.maxRecordsToPersist > 0, "persistence.maxRecordsToPersist must be -1 or > 0");
    if (!retention.locationTemplate.empty()) {
        JsonCodec::renderTemplate(retention.locationTemplate, sampleRecord(RecordKind::Location));
    }
    if (!retention.geofenceTemplate.empty()) {
        JsonCodec::renderTemplate(retention.geofenceTemplate, sampleRecord(RecordKind::Geofence));
    }

    if (sync.enabled()) {
        require(sync.maxBatchSize == -1 || sync.maxBatchSize > 0, "http.maxBatchSize must be -1 or > 0");
        require(sync.timeout.count() > 0, "http.httpTimeout must be > 0");
        require(sync.autoSyncThreshold >= 0, "http.autoSyncThreshold must be >= 0");
        require(sync.maxAttempts > 0, "http.maxAttempts must be > 0");
        require(sync.backoffBase.count() > 0, "http.retryBaseDelay must be > 0");
        require(sync.backoffCeiling >= sync.backoffBase, "http.retryMaxDelay must be >= http.retryBaseDelay");
        require(sync.syncInterval.count() >= 0, "http.syncInterval must be >= 0");
        require(!sync.rootProperty.empty(), "http.httpRootProperty must not be empty");
    }

    require(app.stopAfterElapsedMinutes == -1 || app.stopAfterElapsedMinutes > 0, "app.stopAfterElapsedMinutes must be -1 or > 0");
    require(app.heartbeatInterval.count() >= 0, "app.heartbeatInterval must be >= 0");
    Schedule::fromEntries(schedule.entries, schedule.useUtc);
}

std::string filterPolicyToString(FilterPolicy policy) {
    switch (policy) {
        case FilterPolicy::Adjust: return "adjust";
        case FilterPolicy::Ignore: return "ignore";
        case FilterPolicy::Discard: return "discard";
        default: return "adjust";
    }
}

std::string persistModeToString(PersistMode mode) {
    switch (mode) {
        case PersistMode::All: return "all";
        case PersistMode::LocationOnly: return "location";
        case PersistMode::GeofenceOnly: return "geofence";
        case PersistMode::None: return "none";
        default: return "all";
    }
}

std::string httpMethodToString(HttpMethod method) {
    return method == HttpMethod::Put ? "PUT" : "POST";
}

} // namespace geotrack
