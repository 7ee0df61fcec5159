#pragma once

#include "../Model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geotrack::ports {

struct RecordQuery {
    std::optional<TimePoint> from;
    std::optional<TimePoint> to;
    std::optional<bool> synced;
    bool descending = false;
    std::size_t offset = 0;
    std::size_t limit = 100;
};

/**
 * @brief Persistence port for records, geofence definitions and the session blob
 *
 * Implementations are thread-safe. Failures throw TrackingError{StoreError}.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    // Assigns and returns the next monotonic id.
    virtual int64_t insert(RecordKind kind, TimePoint createdAt, const std::string& body) = 0;
    virtual std::vector<Record> query(const RecordQuery& query) const = 0;
    virtual std::vector<Record> unsynced(std::size_t limit, bool descending) const = 0;
    virtual std::size_t markSynced(const std::vector<int64_t>& ids) = 0;
    virtual std::size_t count(std::optional<bool> synced = std::nullopt) const = 0;
    // The subset of ids that still exist and are not yet synced.
    virtual std::vector<int64_t> unsyncedAmong(const std::vector<int64_t>& ids) const = 0;

    virtual bool deleteById(int64_t id) = 0;

    virtual std::size_t deleteOlderThan(TimePoint cutoff) = 0;
    virtual std::size_t deleteOldestBeyond(std::size_t maxRecords) = 0;
    virtual std::size_t deleteAll() = 0;

    virtual void saveGeofence(const GeofenceRegion& region) = 0;
    virtual bool removeGeofence(const std::string& identifier) = 0;
    virtual std::size_t removeAllGeofences() = 0;
    virtual std::vector<GeofenceRegion> loadGeofences() const = 0;

    virtual void saveState(const SessionStateBlob& state) = 0;
    virtual SessionStateBlob loadState() const = 0;
};

} // namespace geotrack::ports
