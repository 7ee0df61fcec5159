#pragma once

#include "../ports/IRecordStore.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace geotrack::adapters {

/**
 * @brief SQLite implementation of the record store port
 *
 * Three tables: records (monotonic AUTOINCREMENT id, kind, created_at in
 * epoch milliseconds, synced flag, JSON body), geofences (one row per
 * identifier, registration order preserved) and state (a single row holding
 * the session blob). Pass ":memory:" for a private in-memory database.
 */
class SqliteRecordStore : public ports::IRecordStore {
public:
    /// @throws TrackingError{StoreError} when the database cannot be opened or migrated
    explicit SqliteRecordStore(const std::string& path);
    ~SqliteRecordStore() override;

    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    int64_t insert(RecordKind kind, TimePoint createdAt, const std::string& body) override;
    std::vector<Record> query(const ports::RecordQuery& query) const override;
    std::vector<Record> unsynced(std::size_t limit, bool descending) const override;
    std::size_t markSynced(const std::vector<int64_t>& ids) override;
    std::size_t count(std::optional<bool> synced = std::nullopt) const override;
    std::vector<int64_t> unsyncedAmong(const std::vector<int64_t>& ids) const override;

    bool deleteById(int64_t id) override;

    std::size_t deleteOlderThan(TimePoint cutoff) override;
    std::size_t deleteOldestBeyond(std::size_t maxRecords) override;
    std::size_t deleteAll() override;

    void saveGeofence(const GeofenceRegion& region) override;
    bool removeGeofence(const std::string& identifier) override;
    std::size_t removeAllGeofences() override;
    std::vector<GeofenceRegion> loadGeofences() const override;

    void saveState(const SessionStateBlob& state) override;
    SessionStateBlob loadState() const override;

    const std::string& path() const { return path_; }

private:
    void migrate();
    void exec(const std::string& sql) const;

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace geotrack::adapters
