#pragma once

#include "../Model.hpp"
#include "../TrackingConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IExecutor.hpp"
#include "../ports/IRecordStore.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace geotrack::domain {

struct InsertResult {
    bool stored = false;
    bool skipped = false;       // excluded by persistMode
    Record record;              // id 0 unless stored
};

struct PruneResult {
    std::size_t expired = 0;
    std::size_t overCapacity = 0;
};

/**
 * @brief Append-only record log with age and count retention
 *
 * Inserts apply persistMode and merge the configured extras before the row is
 * written. Retention runs afterwards on the storage executor in two passes
 * (age, then count) and never blocks the insert path. Templates are applied
 * only when a record is serialized for upload.
 */
class RetentionStore : public std::enable_shared_from_this<RetentionStore> {
public:
    RetentionStore(const RetentionConfig& config,
                  std::shared_ptr<ports::IRecordStore> store,
                  std::shared_ptr<ports::IExecutor> storageExecutor,
                  std::shared_ptr<ports::IEventBus> eventBus,
                  std::shared_ptr<IClock> clock);

    void reconfigure(const RetentionConfig& config);

    InsertResult insert(RecordKind kind, nlohmann::json body);
    bool shouldPersist(RecordKind kind) const;

    // Coalesces: at most one retention pass is queued at a time.
    void scheduleRetention();
    PruneResult enforceRetention();

    nlohmann::json serialize(const Record& record) const;

    std::vector<Record> query(const ports::RecordQuery& query) const;
    std::size_t count(std::optional<bool> synced = std::nullopt) const;
    bool remove(int64_t id);
    std::size_t clear();

    const std::shared_ptr<ports::IRecordStore>& backend() const { return store_; }

private:
    RetentionConfig snapshot() const;
    void reportStoreError(const std::string& detail) const;

    RetentionConfig config_;
    mutable std::mutex configMutex_;

    std::shared_ptr<ports::IRecordStore> store_;
    std::shared_ptr<ports::IExecutor> storageExecutor_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    std::atomic<bool> retentionQueued_{false};
};

} // namespace geotrack::domain
