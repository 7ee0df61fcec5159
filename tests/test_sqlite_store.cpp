#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/adapters/SqliteRecordStore.hpp"
#include <chrono>

using namespace geotrack;
using adapters::SqliteRecordStore;

namespace {

TimePoint at(int seconds) {
    return TimePoint(std::chrono::seconds(1704067200 + seconds));
}

std::string body(int n) {
    return nlohmann::json{{"n", n}}.dump();
}

} // namespace

TEST(SqliteRecordStoreTest, InsertAssignsIncreasingIds) {
    SqliteRecordStore store(":memory:");
    int64_t first = store.insert(RecordKind::Location, at(0), body(1));
    int64_t second = store.insert(RecordKind::Geofence, at(1), body(2));
    EXPECT_GT(second, first);
    EXPECT_EQ(store.count(), 2u);
    EXPECT_EQ(store.count(false), 2u);
    EXPECT_EQ(store.count(true), 0u);

    auto records = store.query(ports::RecordQuery{});
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, first);
    EXPECT_EQ(records[0].kind, RecordKind::Location);
    EXPECT_EQ(records[0].createdAt, at(0));
    EXPECT_EQ(records[0].body["n"], 1);
    EXPECT_EQ(records[1].kind, RecordKind::Geofence);
}

TEST(SqliteRecordStoreTest, QueryFiltersAndPages) {
    SqliteRecordStore store(":memory:");
    for (int i = 0; i < 10; ++i) {
        store.insert(RecordKind::Location, at(i * 60), body(i));
    }

    ports::RecordQuery window;
    window.from = at(120);
    window.to = at(300);
    auto inWindow = store.query(window);
    ASSERT_EQ(inWindow.size(), 4u);
    EXPECT_EQ(inWindow.front().body["n"], 2);
    EXPECT_EQ(inWindow.back().body["n"], 5);

    ports::RecordQuery page;
    page.descending = true;
    page.limit = 3;
    page.offset = 1;
    auto newest = store.query(page);
    ASSERT_EQ(newest.size(), 3u);
    EXPECT_EQ(newest[0].body["n"], 8);
    EXPECT_EQ(newest[2].body["n"], 6);
}

TEST(SqliteRecordStoreTest, MarkSyncedExcludesFromUnsynced) {
    SqliteRecordStore store(":memory:");
    std::vector<int64_t> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(store.insert(RecordKind::Location, at(i), body(i)));
    }

    EXPECT_EQ(store.markSynced({ids[0], ids[2]}), 2u);
    EXPECT_EQ(store.markSynced({}), 0u);
    EXPECT_EQ(store.count(true), 2u);

    auto pending = store.unsynced(10, false);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, ids[1]);
    EXPECT_EQ(pending[1].id, ids[3]);

    auto newestFirst = store.unsynced(1, true);
    ASSERT_EQ(newestFirst.size(), 1u);
    EXPECT_EQ(newestFirst[0].id, ids[3]);
}

TEST(SqliteRecordStoreTest, RetentionDeletes) {
    SqliteRecordStore store(":memory:");
    for (int i = 0; i < 6; ++i) {
        store.insert(RecordKind::Location, at(i * 10), body(i));
    }

    EXPECT_EQ(store.deleteOlderThan(at(20)), 2u);
    EXPECT_EQ(store.count(), 4u);

    EXPECT_EQ(store.deleteOldestBeyond(3), 1u);
    auto remaining = store.query(ports::RecordQuery{});
    ASSERT_EQ(remaining.size(), 3u);
    EXPECT_EQ(remaining.front().body["n"], 3);

    EXPECT_EQ(store.deleteOldestBeyond(10), 0u);
    EXPECT_EQ(store.deleteAll(), 3u);
    EXPECT_EQ(store.count(), 0u);
}

TEST(SqliteRecordStoreTest, GeofenceUpsertKeepsRegistrationOrder) {
    SqliteRecordStore store(":memory:");

    GeofenceRegion home;
    home.identifier = "home";
    home.lat = 52.0;
    home.lon = 4.0;
    home.radius = 150.0;
    home.notifyOnDwell = true;
    home.loiteringDelay = std::chrono::milliseconds(60000);
    home.extras = {{"owner", "alice"}};

    GeofenceRegion work;
    work.identifier = "work";
    work.lat = 52.3;
    work.lon = 4.9;

    store.saveGeofence(home);
    store.saveGeofence(work);
    home.radius = 300.0;
    store.saveGeofence(home);

    auto regions = store.loadGeofences();
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].identifier, "home");
    EXPECT_DOUBLE_EQ(regions[0].radius, 300.0);
    EXPECT_TRUE(regions[0].notifyOnDwell);
    EXPECT_EQ(regions[0].loiteringDelay, std::chrono::milliseconds(60000));
    EXPECT_EQ(regions[0].extras["owner"], "alice");
    EXPECT_EQ(regions[1].identifier, "work");

    EXPECT_TRUE(store.removeGeofence("home"));
    EXPECT_FALSE(store.removeGeofence("home"));
    EXPECT_EQ(store.removeAllGeofences(), 1u);
    EXPECT_TRUE(store.loadGeofences().empty());
}

TEST(SqliteRecordStoreTest, StateBlobRoundTrip) {
    SqliteRecordStore store(":memory:");

    auto empty = store.loadState();
    EXPECT_FALSE(empty.enabled);
    EXPECT_DOUBLE_EQ(empty.odometer, 0.0);
    EXPECT_FALSE(empty.lastLocationTime.has_value());

    SessionStateBlob state;
    state.enabled = true;
    state.trackingMode = TrackingMode::Geofences;
    state.schedulerEnabled = true;
    state.odometer = 4321.5;
    state.isMoving = true;
    state.lastLocationTime = at(90);
    store.saveState(state);

    state.odometer = 5000.0;
    store.saveState(state);

    auto loaded = store.loadState();
    EXPECT_TRUE(loaded.enabled);
    EXPECT_EQ(loaded.trackingMode, TrackingMode::Geofences);
    EXPECT_TRUE(loaded.schedulerEnabled);
    EXPECT_DOUBLE_EQ(loaded.odometer, 5000.0);
    EXPECT_TRUE(loaded.isMoving);
    ASSERT_TRUE(loaded.lastLocationTime.has_value());
    EXPECT_EQ(*loaded.lastLocationTime, at(90));
}

TEST(SqliteRecordStoreTest, UnopenablePathThrows) {
    try {
        SqliteRecordStore store("/nonexistent-directory/geotrack.db");
        FAIL() << "expected TrackingError";
    } catch (const TrackingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StoreError);
    }
}
