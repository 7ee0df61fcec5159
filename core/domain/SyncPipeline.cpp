#include "SyncPipeline.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"
#include "../../crypto/SasToken.hpp"
#include <algorithm>
#include <iterator>

namespace geotrack::domain {

SyncPipeline::SyncPipeline(const SyncConfig& config,
                           std::shared_ptr<RetentionStore> store,
                           std::shared_ptr<ports::ITransport> transport,
                           std::shared_ptr<ports::IConnectivity> connectivity,
                           std::shared_ptr<ports::IPolicyEngine> policyEngine,
                           std::shared_ptr<ports::IExecutor> networkExecutor,
                           std::shared_ptr<ports::ITimerService> timers,
                           std::shared_ptr<ports::IEventBus> eventBus,
                           std::shared_ptr<IClock> clock)
    : config_(config), store_(store), transport_(transport), connectivity_(connectivity),
      policyEngine_(policyEngine), networkExecutor_(networkExecutor), timers_(timers),
      eventBus_(eventBus), clock_(clock) {
}

SyncPipeline::~SyncPipeline() {
    timers_->cancel(retryTimer_);
    timers_->cancel(scheduleTimer_);
}

void SyncPipeline::reconfigure(const SyncConfig& config, std::shared_ptr<ports::IPolicyEngine> policyEngine) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    policyEngine_ = policyEngine;

    if (scheduleTimer_ != ports::kInvalidTimer) {
        timers_->cancel(scheduleTimer_);
        scheduleTimer_ = ports::kInvalidTimer;
        armScheduleTimerLocked();
    }
}

SyncConfig SyncPipeline::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void SyncPipeline::requestDrain(DrainTrigger trigger) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || !config_.enabled()) {
            return;
        }

        if (inFlight_) {
            // Keep the strongest pending trigger; Explicit outranks the rest.
            if (!deferred_ || static_cast<int>(trigger) > static_cast<int>(*deferred_)) {
                deferred_ = trigger;
            }
            stats_.deferredDrains++;
            Log::get("Sync")->debug("drain ({}) deferred, batch in flight", drainTriggerToString(trigger));
            return;
        }

        switch (checkGateLocked(trigger)) {
            case GateDecision::Offline:
                pendingOnConnect_ = true;
                Log::get("Sync")->debug("offline, drain waits for connectivity");
                return;
            case GateDecision::CellularBlocked:
                stats_.skippedByGate++;
                Log::get("Sync")->debug("auto sync disabled on cellular, drain skipped");
                return;
            case GateDecision::Open:
                break;
        }

        inFlight_ = true;
        pendingOnConnect_ = false;
        if (trigger != DrainTrigger::Auto) {
            retryParked_.clear();
        }
        if (trigger == DrainTrigger::Explicit) {
            terminalParked_.clear();
        }
    }

    std::weak_ptr<SyncPipeline> weak = weak_from_this();
    networkExecutor_->post([weak, trigger]() {
        if (auto self = weak.lock()) {
            self->runDrain(trigger);
        }
    });
}

void SyncPipeline::onRecordInserted() {
    auto config = snapshot();
    if (!config.enabled() || !config.autoSync) {
        return;
    }
    if (config.autoSyncThreshold > 0 &&
        store_->count(false) < static_cast<std::size_t>(config.autoSyncThreshold)) {
        return;
    }
    requestDrain(DrainTrigger::Auto);
}

void SyncPipeline::onConnectivityChanged(TransportType transport) {
    if (transport == TransportType::None) {
        return;
    }
    requestDrain(DrainTrigger::Connectivity);
}

SyncPipeline::GateDecision SyncPipeline::checkGateLocked(DrainTrigger trigger) const {
    auto transport = connectivity_->currentTransport();
    if (transport == TransportType::None) {
        return GateDecision::Offline;
    }
    if (transport == TransportType::Cellular && config_.disableAutoSyncOnCellular &&
        trigger != DrainTrigger::Explicit) {
        return GateDecision::CellularBlocked;
    }
    return GateDecision::Open;
}

void SyncPipeline::runDrain(DrainTrigger trigger) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                inFlight_ = false;
                return;
            }
        }

        auto records = selectBatch(trigger);
        if (records.empty()) {
            settle();
            return;
        }

        auto batch = std::make_shared<Batch>();
        batch->records = std::move(records);
        batch->trigger = trigger;

        if (!attempt(batch)) {
            return;
        }
    }
}

void SyncPipeline::pruneParked() {
    std::vector<int64_t> parked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parked.assign(terminalParked_.begin(), terminalParked_.end());
        parked.insert(parked.end(), retryParked_.begin(), retryParked_.end());
    }
    if (parked.empty()) return;

    std::set<int64_t> present;
    try {
        auto ids = store_->backend()->unsyncedAmong(parked);
        present.insert(ids.begin(), ids.end());
    } catch (const TrackingError& e) {
        publishError(ErrorKind::StoreError, std::string("unable to check parked records: ") + e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* parkedSet : {&terminalParked_, &retryParked_}) {
        for (auto it = parkedSet->begin(); it != parkedSet->end();) {
            it = present.count(*it) > 0 ? std::next(it) : parkedSet->erase(it);
        }
    }
}

std::vector<Record> SyncPipeline::selectBatch(DrainTrigger trigger) {
    pruneParked();

    SyncConfig config;
    std::set<int64_t> excluded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        excluded = terminalParked_;
        if (trigger == DrainTrigger::Auto) {
            excluded.insert(retryParked_.begin(), retryParked_.end());
        }
    }

    const std::size_t limit = config.batchLimit();
    std::vector<Record> records;
    try {
        records = store_->backend()->unsynced(limit + excluded.size(), config.order == SortOrder::Descending);
    } catch (const TrackingError& e) {
        publishError(ErrorKind::StoreError, std::string("unable to select batch: ") + e.what());
        return {};
    }

    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&excluded](const Record& r) { return excluded.count(r.id) > 0; }),
                  records.end());
    if (records.size() > limit) {
        records.resize(limit);
    }
    return records;
}

bool SyncPipeline::attempt(const std::shared_ptr<Batch>& batch) {
    auto config = snapshot();
    std::shared_ptr<ports::IPolicyEngine> policyEngine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        policyEngine = policyEngine_;
        stats_.attempts++;
    }
    batch->attempt++;

    ports::SyncRequest request;
    try {
        request = buildRequest(config, batch->records);
    } catch (const TrackingError& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& record : batch->records) {
                terminalParked_.insert(record.id);
            }
        }
        park(*batch, ErrorKind::SyncTerminal, std::string("unable to encode batch: ") + e.what());
        return true;
    }

    ports::SyncResponse response;
    try {
        response = transport_->send(request);
    } catch (const std::exception& e) {
        response.status = 0;
        response.failure = ports::TransportFailure::Network;
        response.body = e.what();
    }

    auto outcome = classify(response);
    publishHttp(response, *batch, outcome == UploadOutcome::Success);

    switch (outcome) {
        case UploadOutcome::Success: {
            std::vector<int64_t> ids;
            ids.reserve(batch->records.size());
            for (const auto& record : batch->records) {
                ids.push_back(record.id);
            }
            try {
                store_->backend()->markSynced(ids);
            } catch (const TrackingError& e) {
                // The batch will be uploaded again on the next drain.
                publishError(ErrorKind::StoreError, std::string("unable to mark batch synced: ") + e.what());
                settle();
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.batchesSynced++;
                stats_.recordsSynced += ids.size();
            }
            Log::get("Sync")->info("uploaded {} record(s), HTTP {}", ids.size(), response.status);
            return true;
        }

        case UploadOutcome::Retryable: {
            const auto& retryPolicy = policyEngine->getRetryPolicy();
            if (retryPolicy.shouldRetry(batch->attempt)) {
                auto delay = retryPolicy.getBackoffDelay(batch->attempt);
                Log::get("Sync")->warn("attempt {} failed (HTTP {}), retrying in {} ms",
                                       batch->attempt, response.status, delay.count());
                scheduleRetry(batch, delay);
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& record : batch->records) {
                    retryParked_.insert(record.id);
                }
            }
            park(*batch, ErrorKind::SyncRetryable,
                 "gave up after " + std::to_string(batch->attempt) + " attempts, last status " +
                 std::to_string(response.status));
            settle();
            return false;
        }

        case UploadOutcome::Terminal: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto& record : batch->records) {
                    terminalParked_.insert(record.id);
                }
            }
            park(*batch, ErrorKind::SyncTerminal,
                 "server rejected batch with status " + std::to_string(response.status));
            return true;
        }
    }
    return false;
}

void SyncPipeline::scheduleRetry(const std::shared_ptr<Batch>& batch, std::chrono::milliseconds delay) {
    std::weak_ptr<SyncPipeline> weak = weak_from_this();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        inFlight_ = false;
        return;
    }
    retryTimer_ = timers_->schedule(delay, [weak, batch]() {
        auto self = weak.lock();
        if (!self) return;
        self->networkExecutor_->post([weak, batch]() {
            if (auto pipeline = weak.lock()) {
                pipeline->onRetryTimer(batch);
            }
        });
    });
}

void SyncPipeline::onRetryTimer(const std::shared_ptr<Batch>& batch) {
    GateDecision gate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retryTimer_ = ports::kInvalidTimer;
        if (stopped_) {
            inFlight_ = false;
            return;
        }

        gate = checkGateLocked(batch->trigger);
        if (gate == GateDecision::Offline) {
            pendingOnConnect_ = true;
        } else if (gate == GateDecision::CellularBlocked) {
            stats_.skippedByGate++;
        }
    }

    if (gate != GateDecision::Open) {
        Log::get("Sync")->debug("retry skipped, transport gate closed");
        settle();
        return;
    }

    if (attempt(batch)) {
        runDrain(batch->trigger);
    }
}

void SyncPipeline::park(const Batch& batch, ErrorKind kind, const std::string& detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.batchesParked++;
    }
    Log::get("Sync")->warn("parked {} record(s): {}", batch.records.size(), detail);
    publishError(kind, detail);
}

void SyncPipeline::settle() {
    std::optional<DrainTrigger> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_ = false;
        next = deferred_;
        deferred_.reset();
    }
    if (next) {
        requestDrain(*next);
    }
}

void SyncPipeline::startSchedule() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
    if (scheduleTimer_ == ports::kInvalidTimer) {
        armScheduleTimerLocked();
    }
}

void SyncPipeline::stopSchedule() {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_->cancel(scheduleTimer_);
    scheduleTimer_ = ports::kInvalidTimer;
}

void SyncPipeline::armScheduleTimerLocked() {
    if (!config_.enabled() || config_.syncInterval.count() <= 0) {
        return;
    }

    std::weak_ptr<SyncPipeline> weak = weak_from_this();
    scheduleTimer_ = timers_->schedule(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.syncInterval),
        [weak]() {
            if (auto self = weak.lock()) {
                self->onScheduleTimer();
            }
        });
}

void SyncPipeline::onScheduleTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduleTimer_ = ports::kInvalidTimer;
        if (stopped_) return;
        armScheduleTimerLocked();
    }
    requestDrain(DrainTrigger::Scheduled);
}

void SyncPipeline::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    deferred_.reset();
    timers_->cancel(retryTimer_);
    timers_->cancel(scheduleTimer_);
    retryTimer_ = ports::kInvalidTimer;
    scheduleTimer_ = ports::kInvalidTimer;
    // A batch waiting on its retry timer is abandoned; its records stay unsynced.
    inFlight_ = false;
}

bool SyncPipeline::isInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_;
}

bool SyncPipeline::hasPendingConnectivityDrain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingOnConnect_;
}

std::size_t SyncPipeline::terminalParkedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminalParked_.size();
}

std::size_t SyncPipeline::retryParkedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retryParked_.size();
}

SyncStats SyncPipeline::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

UploadOutcome SyncPipeline::classify(const ports::SyncResponse& response) {
    switch (response.failure) {
        case ports::TransportFailure::Rejected:
            return UploadOutcome::Terminal;
        case ports::TransportFailure::Network:
        case ports::TransportFailure::Timeout:
            return UploadOutcome::Retryable;
        case ports::TransportFailure::None:
            break;
    }

    if (response.status >= 200 && response.status < 300) return UploadOutcome::Success;
    if (response.status == 0 || response.status >= 500) return UploadOutcome::Retryable;
    return UploadOutcome::Terminal;
}

nlohmann::json SyncPipeline::buildBody(const std::vector<Record>& batch) const {
    return buildBody(snapshot(), batch);
}

nlohmann::json SyncPipeline::buildBody(const SyncConfig& config, const std::vector<Record>& batch) const {
    nlohmann::json body = nlohmann::json::object();

    if (config.batchSync) {
        nlohmann::json records = nlohmann::json::array();
        for (const auto& record : batch) {
            records.push_back(store_->serialize(record));
        }
        body[config.rootProperty] = std::move(records);
    } else if (!batch.empty()) {
        body[config.rootProperty] = store_->serialize(batch.front());
    }

    if (config.params.is_object()) {
        for (const auto& [key, value] : config.params.items()) {
            if (!body.contains(key)) {
                body[key] = value;
            }
        }
    }
    return body;
}

ports::SyncRequest SyncPipeline::buildRequest(const SyncConfig& config, const std::vector<Record>& batch) const {
    ports::SyncRequest request;
    request.url = config.url;
    request.method = httpMethodToString(config.method);
    request.timeout = config.timeout;
    request.headers = config.headers;
    if (request.headers.find("Content-Type") == request.headers.end()) {
        request.headers["Content-Type"] = "application/json";
    }

    request.body = buildBody(config, batch).dump();

    if (!config.signingKey.empty()) {
        request.headers["X-Geotrack-Signature"] = SasToken::signPayload(config.signingKey, request.body);
    }
    return request;
}

void SyncPipeline::publishHttp(const ports::SyncResponse& response, const Batch& batch, bool success) {
    Event event;
    event.eventType = EventType::Http;
    event.timestamp = clock_->now();
    event.http = HttpResult{success, response.status, response.body, batch.attempt, batch.records.size()};
    eventBus_->publish(event);
}

void SyncPipeline::publishError(ErrorKind kind, const std::string& detail) {
    Event event;
    event.eventType = EventType::Error;
    event.timestamp = clock_->now();
    event.error = ErrorInfo{kind, detail};
    eventBus_->publish(event);
}

std::string drainTriggerToString(DrainTrigger trigger) {
    switch (trigger) {
        case DrainTrigger::Auto: return "auto";
        case DrainTrigger::Scheduled: return "scheduled";
        case DrainTrigger::Connectivity: return "connectivity";
        case DrainTrigger::Explicit: return "explicit";
    }
    return "unknown";
}

} // namespace geotrack::domain
