#pragma once

#include "RetentionStore.hpp"
#include "../TrackingConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IConnectivity.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IExecutor.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ITimerService.hpp"
#include "../ports/ITransport.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace geotrack::domain {

enum class DrainTrigger {
    Auto,
    Scheduled,
    Connectivity,
    Explicit
};

enum class UploadOutcome {
    Success,
    Retryable,
    Terminal
};

struct SyncStats {
    std::size_t attempts = 0;
    std::size_t batchesSynced = 0;
    std::size_t recordsSynced = 0;
    std::size_t batchesParked = 0;
    std::size_t skippedByGate = 0;
    std::size_t deferredDrains = 0;
};

/**
 * @brief Uploads unsynced records in bounded batches, one batch at a time
 *
 * A drain selects the oldest (or newest, per configuration) unsynced records
 * and uploads them on the network executor. A drain requested while a batch
 * is in flight, including while it waits out a backoff, is deferred until the
 * batch settles. Retryable failures back off exponentially up to the policy's
 * attempt cap and then park the batch until the next scheduled or
 * connectivity-triggered drain. Terminal failures park the batch until an
 * explicit sync.
 */
class SyncPipeline : public std::enable_shared_from_this<SyncPipeline> {
public:
    SyncPipeline(const SyncConfig& config,
                std::shared_ptr<RetentionStore> store,
                std::shared_ptr<ports::ITransport> transport,
                std::shared_ptr<ports::IConnectivity> connectivity,
                std::shared_ptr<ports::IPolicyEngine> policyEngine,
                std::shared_ptr<ports::IExecutor> networkExecutor,
                std::shared_ptr<ports::ITimerService> timers,
                std::shared_ptr<ports::IEventBus> eventBus,
                std::shared_ptr<IClock> clock);
    ~SyncPipeline();

    void reconfigure(const SyncConfig& config, std::shared_ptr<ports::IPolicyEngine> policyEngine);

    void requestDrain(DrainTrigger trigger);
    void onRecordInserted();
    void onConnectivityChanged(TransportType transport);

    void startSchedule();
    void stopSchedule();
    void shutdown();

    bool isInFlight() const;
    bool hasPendingConnectivityDrain() const;
    std::size_t terminalParkedCount() const;
    std::size_t retryParkedCount() const;
    SyncStats stats() const;

    static UploadOutcome classify(const ports::SyncResponse& response);
    nlohmann::json buildBody(const std::vector<Record>& batch) const;

private:
    struct Batch {
        std::vector<Record> records;
        DrainTrigger trigger = DrainTrigger::Auto;
        int attempt = 0;
    };

    enum class GateDecision {
        Open,
        Offline,
        CellularBlocked
    };

    SyncConfig snapshot() const;
    GateDecision checkGateLocked(DrainTrigger trigger) const;
    void runDrain(DrainTrigger trigger);
    std::vector<Record> selectBatch(DrainTrigger trigger);
    // Forgets parked ids that were pruned, cleared or synced since they were parked.
    void pruneParked();
    // Returns true when the drain should go on with the next batch.
    bool attempt(const std::shared_ptr<Batch>& batch);
    void scheduleRetry(const std::shared_ptr<Batch>& batch, std::chrono::milliseconds delay);
    void onRetryTimer(const std::shared_ptr<Batch>& batch);
    void park(const Batch& batch, ErrorKind kind, const std::string& detail);
    void settle();
    void armScheduleTimerLocked();
    void onScheduleTimer();
    ports::SyncRequest buildRequest(const SyncConfig& config, const std::vector<Record>& batch) const;
    nlohmann::json buildBody(const SyncConfig& config, const std::vector<Record>& batch) const;

    void publishHttp(const ports::SyncResponse& response, const Batch& batch, bool success);
    void publishError(ErrorKind kind, const std::string& detail);

    SyncConfig config_;
    std::shared_ptr<RetentionStore> store_;
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<ports::IConnectivity> connectivity_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<ports::IExecutor> networkExecutor_;
    std::shared_ptr<ports::ITimerService> timers_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    bool inFlight_ = false;
    bool stopped_ = false;
    std::optional<DrainTrigger> deferred_;
    bool pendingOnConnect_ = false;
    std::set<int64_t> terminalParked_;     // cleared only by an explicit drain
    std::set<int64_t> retryParked_;        // cleared by scheduled, connectivity and explicit drains
    ports::TimerId retryTimer_ = ports::kInvalidTimer;
    ports::TimerId scheduleTimer_ = ports::kInvalidTimer;
    SyncStats stats_;
};

std::string drainTriggerToString(DrainTrigger trigger);

} // namespace geotrack::domain
