#include "SqliteRecordStore.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <sstream>

namespace geotrack::adapters {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    throw TrackingError(ErrorKind::StoreError, what + ": " + (db ? sqlite3_errmsg(db) : "no database"));
}

// Owns one prepared statement for the duration of a call.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            fail(db_, "prepare failed for \"" + sql + "\"");
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }
    void bind(int index, int value) { check(sqlite3_bind_int(stmt_, index, value)); }
    void bind(int index, double value) { check(sqlite3_bind_double(stmt_, index, value)); }
    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bindNull(int index) { check(sqlite3_bind_null(stmt_, index)); }

    // Returns true while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step failed");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t columnInt64(int column) const { return sqlite3_column_int64(stmt_, column); }
    int columnInt(int column) const { return sqlite3_column_int(stmt_, column); }
    double columnDouble(int column) const { return sqlite3_column_double(stmt_, column); }
    bool columnIsNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }
    std::string columnText(int column) const {
        auto text = sqlite3_column_text(stmt_, column);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) fail(db_, "bind failed");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

Record readRecord(const Statement& stmt) {
    Record record;
    record.id = stmt.columnInt64(0);
    record.kind = stringToRecordKind(stmt.columnText(1));
    record.createdAt = fromEpochMillis(stmt.columnInt64(2));
    record.synced = stmt.columnInt(3) != 0;

    auto body = stmt.columnText(4);
    record.body = nlohmann::json::parse(body, nullptr, false);
    if (record.body.is_discarded()) {
        Log::get("Store")->warn("record {} has an unreadable body", record.id);
        record.body = nlohmann::json::object();
    }
    return record;
}

constexpr const char* RECORD_COLUMNS = "id, kind, created_at, synced, body";

} // namespace

SqliteRecordStore::SqliteRecordStore(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw TrackingError(ErrorKind::StoreError, "unable to open " + path_ + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        migrate();
    } catch (const TrackingError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    Log::get("Store")->info("opened {}", path_);
}

SqliteRecordStore::~SqliteRecordStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteRecordStore::exec(const std::string& sql) const {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw TrackingError(ErrorKind::StoreError, message);
    }
}

void SqliteRecordStore::migrate() {
    exec("PRAGMA journal_mode=WAL");
    exec("CREATE TABLE IF NOT EXISTS records ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT, "
         "kind TEXT NOT NULL, "
         "created_at INTEGER NOT NULL, "
         "synced INTEGER NOT NULL DEFAULT 0, "
         "body TEXT NOT NULL)");
    exec("CREATE INDEX IF NOT EXISTS records_synced ON records (synced, id)");
    exec("CREATE INDEX IF NOT EXISTS records_created_at ON records (created_at)");
    exec("CREATE TABLE IF NOT EXISTS geofences ("
         "identifier TEXT PRIMARY KEY, "
         "latitude REAL NOT NULL, "
         "longitude REAL NOT NULL, "
         "radius REAL NOT NULL, "
         "notify_on_entry INTEGER NOT NULL, "
         "notify_on_exit INTEGER NOT NULL, "
         "notify_on_dwell INTEGER NOT NULL, "
         "loitering_delay INTEGER NOT NULL, "
         "extras TEXT NOT NULL)");
    exec("CREATE TABLE IF NOT EXISTS state ("
         "id INTEGER PRIMARY KEY CHECK (id = 1), "
         "enabled INTEGER NOT NULL, "
         "tracking_mode TEXT NOT NULL, "
         "scheduler_enabled INTEGER NOT NULL, "
         "odometer REAL NOT NULL, "
         "is_moving INTEGER NOT NULL, "
         "last_location_time INTEGER)");
}

int64_t SqliteRecordStore::insert(RecordKind kind, TimePoint createdAt, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO records (kind, created_at, synced, body) VALUES (?, ?, 0, ?)");
    stmt.bind(1, recordKindToString(kind));
    stmt.bind(2, toEpochMillis(createdAt));
    stmt.bind(3, body);
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<Record> SqliteRecordStore::query(const ports::RecordQuery& query) const {
    std::ostringstream sql;
    sql << "SELECT " << RECORD_COLUMNS << " FROM records WHERE 1 = 1";
    if (query.from) sql << " AND created_at >= ?";
    if (query.to) sql << " AND created_at <= ?";
    if (query.synced) sql << " AND synced = ?";
    sql << " ORDER BY id " << (query.descending ? "DESC" : "ASC") << " LIMIT ? OFFSET ?";

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, sql.str());
    int index = 1;
    if (query.from) stmt.bind(index++, toEpochMillis(*query.from));
    if (query.to) stmt.bind(index++, toEpochMillis(*query.to));
    if (query.synced) stmt.bind(index++, *query.synced ? 1 : 0);
    stmt.bind(index++, static_cast<int64_t>(query.limit));
    stmt.bind(index++, static_cast<int64_t>(query.offset));

    std::vector<Record> records;
    while (stmt.step()) {
        records.push_back(readRecord(stmt));
    }
    return records;
}

std::vector<Record> SqliteRecordStore::unsynced(std::size_t limit, bool descending) const {
    ports::RecordQuery q;
    q.synced = false;
    q.descending = descending;
    q.limit = limit;
    return query(q);
}

std::size_t SqliteRecordStore::markSynced(const std::vector<int64_t>& ids) {
    if (ids.empty()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE");
    std::size_t updated = 0;
    try {
        Statement stmt(db_, "UPDATE records SET synced = 1 WHERE id = ?");
        for (auto id : ids) {
            stmt.bind(1, id);
            stmt.step();
            updated += static_cast<std::size_t>(sqlite3_changes(db_));
            stmt.reset();
        }
        exec("COMMIT");
    } catch (const TrackingError&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
    return updated;
}

std::size_t SqliteRecordStore::count(std::optional<bool> synced) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, synced ? "SELECT COUNT(*) FROM records WHERE synced = ?" : "SELECT COUNT(*) FROM records");
    if (synced) stmt.bind(1, *synced ? 1 : 0);
    stmt.step();
    return static_cast<std::size_t>(stmt.columnInt64(0));
}

std::vector<int64_t> SqliteRecordStore::unsyncedAmong(const std::vector<int64_t>& ids) const {
    std::vector<int64_t> present;
    if (ids.empty()) return present;

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT 1 FROM records WHERE id = ? AND synced = 0");
    for (auto id : ids) {
        stmt.bind(1, id);
        if (stmt.step()) {
            present.push_back(id);
        }
        stmt.reset();
    }
    return present;
}

bool SqliteRecordStore::deleteById(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM records WHERE id = ?");
    stmt.bind(1, id);
    stmt.step();
    return sqlite3_changes(db_) > 0;
}

std::size_t SqliteRecordStore::deleteOlderThan(TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM records WHERE created_at < ?");
    stmt.bind(1, toEpochMillis(cutoff));
    stmt.step();
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

std::size_t SqliteRecordStore::deleteOldestBeyond(std::size_t maxRecords) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM records WHERE id NOT IN "
                        "(SELECT id FROM records ORDER BY id DESC LIMIT ?)");
    stmt.bind(1, static_cast<int64_t>(maxRecords));
    stmt.step();
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

std::size_t SqliteRecordStore::deleteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM records");
    stmt.step();
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

void SqliteRecordStore::saveGeofence(const GeofenceRegion& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Upsert keeps the original rowid, and with it the registration order.
    Statement stmt(db_, "INSERT INTO geofences (identifier, latitude, longitude, radius, notify_on_entry, "
                        "notify_on_exit, notify_on_dwell, loitering_delay, extras) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
                        "ON CONFLICT (identifier) DO UPDATE SET latitude = excluded.latitude, "
                        "longitude = excluded.longitude, radius = excluded.radius, "
                        "notify_on_entry = excluded.notify_on_entry, notify_on_exit = excluded.notify_on_exit, "
                        "notify_on_dwell = excluded.notify_on_dwell, loitering_delay = excluded.loitering_delay, "
                        "extras = excluded.extras");
    stmt.bind(1, region.identifier);
    stmt.bind(2, region.lat);
    stmt.bind(3, region.lon);
    stmt.bind(4, region.radius);
    stmt.bind(5, region.notifyOnEntry ? 1 : 0);
    stmt.bind(6, region.notifyOnExit ? 1 : 0);
    stmt.bind(7, region.notifyOnDwell ? 1 : 0);
    stmt.bind(8, static_cast<int64_t>(region.loiteringDelay.count()));
    stmt.bind(9, region.extras.dump());
    stmt.step();
}

bool SqliteRecordStore::removeGeofence(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM geofences WHERE identifier = ?");
    stmt.bind(1, identifier);
    stmt.step();
    return sqlite3_changes(db_) > 0;
}

std::size_t SqliteRecordStore::removeAllGeofences() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM geofences");
    stmt.step();
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

std::vector<GeofenceRegion> SqliteRecordStore::loadGeofences() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT identifier, latitude, longitude, radius, notify_on_entry, notify_on_exit, "
                        "notify_on_dwell, loitering_delay, extras FROM geofences ORDER BY rowid");

    std::vector<GeofenceRegion> regions;
    while (stmt.step()) {
        GeofenceRegion region;
        region.identifier = stmt.columnText(0);
        region.lat = stmt.columnDouble(1);
        region.lon = stmt.columnDouble(2);
        region.radius = stmt.columnDouble(3);
        region.notifyOnEntry = stmt.columnInt(4) != 0;
        region.notifyOnExit = stmt.columnInt(5) != 0;
        region.notifyOnDwell = stmt.columnInt(6) != 0;
        region.loiteringDelay = std::chrono::milliseconds(stmt.columnInt64(7));
        region.extras = nlohmann::json::parse(stmt.columnText(8), nullptr, false);
        if (region.extras.is_discarded()) {
            region.extras = nlohmann::json::object();
        }
        regions.push_back(std::move(region));
    }
    return regions;
}

void SqliteRecordStore::saveState(const SessionStateBlob& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO state (id, enabled, tracking_mode, scheduler_enabled, "
                        "odometer, is_moving, last_location_time) VALUES (1, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, state.enabled ? 1 : 0);
    stmt.bind(2, trackingModeToString(state.trackingMode));
    stmt.bind(3, state.schedulerEnabled ? 1 : 0);
    stmt.bind(4, state.odometer);
    stmt.bind(5, state.isMoving ? 1 : 0);
    if (state.lastLocationTime) {
        stmt.bind(6, toEpochMillis(*state.lastLocationTime));
    } else {
        stmt.bindNull(6);
    }
    stmt.step();
}

SessionStateBlob SqliteRecordStore::loadState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT enabled, tracking_mode, scheduler_enabled, odometer, is_moving, "
                        "last_location_time FROM state WHERE id = 1");

    SessionStateBlob state;
    if (stmt.step()) {
        state.enabled = stmt.columnInt(0) != 0;
        state.trackingMode = stmt.columnText(1) == trackingModeToString(TrackingMode::Geofences)
            ? TrackingMode::Geofences : TrackingMode::Location;
        state.schedulerEnabled = stmt.columnInt(2) != 0;
        state.odometer = stmt.columnDouble(3);
        state.isMoving = stmt.columnInt(4) != 0;
        if (!stmt.columnIsNull(5)) {
            state.lastLocationTime = fromEpochMillis(stmt.columnInt64(5));
        }
    }
    return state;
}

} // namespace geotrack::adapters
