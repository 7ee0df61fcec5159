#include "RetentionStore.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include "../Log.hpp"

namespace geotrack::domain {

RetentionStore::RetentionStore(const RetentionConfig& config,
                               std::shared_ptr<ports::IRecordStore> store,
                               std::shared_ptr<ports::IExecutor> storageExecutor,
                               std::shared_ptr<ports::IEventBus> eventBus,
                               std::shared_ptr<IClock> clock)
    : config_(config), store_(store), storageExecutor_(storageExecutor), eventBus_(eventBus), clock_(clock) {
}

void RetentionStore::reconfigure(const RetentionConfig& config) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
    }
    scheduleRetention();
}

RetentionConfig RetentionStore::snapshot() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

bool RetentionStore::shouldPersist(RecordKind kind) const {
    switch (snapshot().persistMode) {
        case PersistMode::All: return true;
        case PersistMode::LocationOnly: return kind == RecordKind::Location;
        case PersistMode::GeofenceOnly: return kind == RecordKind::Geofence;
        case PersistMode::None: return false;
    }
    return true;
}

InsertResult RetentionStore::insert(RecordKind kind, nlohmann::json body) {
    auto config = snapshot();

    InsertResult result;
    result.record.kind = kind;
    result.record.createdAt = clock_->now();

    if (!config.extras.empty()) {
        auto& extras = body["extras"];
        if (!extras.is_object()) {
            extras = nlohmann::json::object();
        }
        for (const auto& [key, value] : config.extras.items()) {
            if (!extras.contains(key)) {
                extras[key] = value;
            }
        }
    }
    result.record.body = std::move(body);

    if (!shouldPersist(kind)) {
        result.skipped = true;
        return result;
    }

    try {
        result.record.id = store_->insert(kind, result.record.createdAt, result.record.body.dump());
        result.stored = true;
    } catch (const TrackingError& e) {
        reportStoreError(std::string("insert failed, record lost: ") + e.what());
        return result;
    }

    scheduleRetention();
    return result;
}

void RetentionStore::scheduleRetention() {
    auto config = snapshot();
    if (config.maxDaysToPersist <= 0 && config.maxRecordsToPersist <= 0) return;
    if (retentionQueued_.exchange(true)) return;

    std::weak_ptr<RetentionStore> weak = weak_from_this();
    storageExecutor_->post([weak]() {
        if (auto self = weak.lock()) {
            self->retentionQueued_.store(false);
            self->enforceRetention();
        }
    });
}

PruneResult RetentionStore::enforceRetention() {
    auto config = snapshot();
    PruneResult result;

    try {
        if (config.maxDaysToPersist > 0) {
            auto cutoff = clock_->now() - std::chrono::hours(24 * config.maxDaysToPersist);
            result.expired = store_->deleteOlderThan(cutoff);
        }
        if (config.maxRecordsToPersist > 0) {
            result.overCapacity = store_->deleteOldestBeyond(static_cast<std::size_t>(config.maxRecordsToPersist));
        }
    } catch (const TrackingError& e) {
        reportStoreError(std::string("retention failed: ") + e.what());
        return result;
    }

    if (result.expired > 0 || result.overCapacity > 0) {
        Log::get("Store")->debug("retention pruned {} expired, {} over capacity",
                                 result.expired, result.overCapacity);
    }
    return result;
}

nlohmann::json RetentionStore::serialize(const Record& record) const {
    auto config = snapshot();
    const auto& tmpl = record.kind == RecordKind::Geofence ? config.geofenceTemplate : config.locationTemplate;
    if (tmpl.empty()) {
        return JsonCodec::recordToJson(record);
    }
    return JsonCodec::renderTemplate(tmpl, record);
}

std::vector<Record> RetentionStore::query(const ports::RecordQuery& query) const {
    try {
        return store_->query(query);
    } catch (const TrackingError& e) {
        reportStoreError(e.what());
        return {};
    }
}

std::size_t RetentionStore::count(std::optional<bool> synced) const {
    try {
        return store_->count(synced);
    } catch (const TrackingError& e) {
        reportStoreError(e.what());
        return 0;
    }
}

bool RetentionStore::remove(int64_t id) {
    try {
        return store_->deleteById(id);
    } catch (const TrackingError& e) {
        reportStoreError(e.what());
        return false;
    }
}

std::size_t RetentionStore::clear() {
    try {
        return store_->deleteAll();
    } catch (const TrackingError& e) {
        reportStoreError(e.what());
        return 0;
    }
}

void RetentionStore::reportStoreError(const std::string& detail) const {
    Log::get("Store")->error("{}", detail);

    Event event;
    event.eventType = EventType::Error;
    event.timestamp = clock_->now();
    event.error = ErrorInfo{ErrorKind::StoreError, detail};
    eventBus_->publish(event);
}

} // namespace geotrack::domain
