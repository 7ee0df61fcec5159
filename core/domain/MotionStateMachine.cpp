#include "MotionStateMachine.hpp"
#include "../Log.hpp"
#include <cmath>

namespace geotrack::domain {

MotionStateMachine::MotionStateMachine(const MotionConfig& config,
                                       std::shared_ptr<ports::IMotionSensors> sensors,
                                       std::shared_ptr<ports::ITimerService> timers,
                                       std::shared_ptr<ports::IEventBus> eventBus,
                                       std::shared_ptr<IClock> clock)
    : config_(config), sensors_(sensors), timers_(timers), eventBus_(eventBus), clock_(clock),
      alive_(std::make_shared<MotionStateMachine*>(this)) {
}

MotionStateMachine::~MotionStateMachine() {
    cancelStopTimer();
    cancelTriggerTimer();
}

void MotionStateMachine::reconfigure(const MotionConfig& config) {
    config_ = config;
    if (config_.disableStopDetection && currentState_ == MotionState::PendingStop) {
        cancelStopTimer();
        transitionTo(MotionState::Moving);
    }
}

void MotionStateMachine::start(bool initiallyMoving) {
    if (running_) return;
    running_ = true;
    currentState_ = initiallyMoving ? MotionState::Moving : MotionState::Stationary;

    if (!config_.disableMotionActivityUpdates && !activityUpdatesActive_) {
        activityUpdatesActive_ = sensors_->startActivityUpdates();
        if (!activityUpdatesActive_) {
            emitError("activity classifier unavailable");
        }
    }
    if (currentState_ == MotionState::Stationary) {
        startAccelerometer();
    }

    Log::get("Motion")->info("started in {}", motionStateToString(currentState_));
}

void MotionStateMachine::stop() {
    if (!running_) return;
    running_ = false;

    cancelStopTimer();
    cancelTriggerTimer();
    stopAccelerometer();
    if (activityUpdatesActive_) {
        sensors_->stopActivityUpdates();
        activityUpdatesActive_ = false;
    }
    Log::get("Motion")->info("stopped in {}", motionStateToString(currentState_));
}

void MotionStateMachine::onActivityTransition(const ActivityTransition& transition) {
    if (!running_) return;

    if (transition.confidence < config_.minimumActivityConfidence) {
        Log::get("Motion")->debug("ignoring {} at confidence {}",
                                  activityTypeToString(transition.activity), transition.confidence);
        return;
    }

    bool repeated = transition.activity == lastActivity_ && transition.entering == lastEntering_;
    lastActivity_ = transition.activity;
    lastEntering_ = transition.entering;
    lastConfidence_ = transition.confidence;
    if (transition.entering && !repeated) {
        emitActivityChange(transition.activity, transition.confidence);
    }

    if (transition.activity == ActivityType::Still) {
        if (transition.entering) {
            handleStillEntered();
        } else {
            handleMovementDetected(ActivityType::Unknown);
        }
    } else if (transition.entering && isMovingActivity(transition.activity)) {
        handleMovementDetected(transition.activity);
    }
}

void MotionStateMachine::onAccelerometerSample(const AccelerometerSample& sample) {
    if (!running_ || currentState_ != MotionState::Stationary || !accelerometerActive_) return;

    double magnitude = shakeMagnitude(sample);
    if (magnitude > config_.shakeThreshold) {
        Log::get("Motion")->info("shake {}m/s2 above threshold {}", magnitude, config_.shakeThreshold);
        stopAccelerometer();
        cancelTriggerTimer();
        declareMoving(ActivityType::Unknown);
    }
}

void MotionStateMachine::onSourceLost(MotionSource source, const std::string& detail) {
    if (source == MotionSource::ActivityClassifier) {
        activityUpdatesActive_ = false;
        emitError("activity classifier lost: " + detail);
    } else {
        accelerometerActive_ = false;
        emitError("accelerometer lost: " + detail);
    }
}

void MotionStateMachine::changePace(bool moving) {
    cancelTriggerTimer();
    if (moving) {
        cancelStopTimer();
        if (currentState_ == MotionState::Stationary) {
            stopAccelerometer();
            declareMoving(lastActivity_);
        } else {
            transitionTo(MotionState::Moving);
        }
    } else if (currentState_ != MotionState::Stationary) {
        cancelStopTimer();
        declareStationary();
    }
}

void MotionStateMachine::handleStillEntered() {
    cancelTriggerTimer();
    if (currentState_ == MotionState::Moving && !config_.disableStopDetection) {
        armStopTimer();
        transitionTo(MotionState::PendingStop);
    }
}

void MotionStateMachine::handleMovementDetected(ActivityType activity) {
    switch (currentState_) {
        case MotionState::PendingStop:
            // Never declared stationary, so there is nothing to announce.
            cancelStopTimer();
            transitionTo(MotionState::Moving);
            break;
        case MotionState::Stationary:
            if (config_.motionTriggerDelay.count() > 0) {
                armTriggerTimer(activity);
            } else {
                stopAccelerometer();
                declareMoving(activity);
            }
            break;
        case MotionState::Moving:
            break;
    }
}

void MotionStateMachine::declareMoving(ActivityType activity) {
    transitionTo(MotionState::Moving);
    if (intentHandler_) {
        intentHandler_(MotionIntent{true, ports::ProviderMode::HighAccuracy, activity});
    }
}

void MotionStateMachine::declareStationary() {
    transitionTo(MotionState::Stationary);
    startAccelerometer();
    if (intentHandler_) {
        intentHandler_(MotionIntent{false, ports::ProviderMode::LowPower, ActivityType::Still});
    }
}

void MotionStateMachine::transitionTo(MotionState newState) {
    if (newState == currentState_) return;

    MotionState oldState = currentState_;
    currentState_ = newState;
    Log::get("Motion")->info("State transition: {} -> {}",
                             motionStateToString(oldState), motionStateToString(newState));
}

void MotionStateMachine::armStopTimer() {
    cancelStopTimer();
    std::weak_ptr<MotionStateMachine*> weak = alive_;
    auto id = std::make_shared<ports::TimerId>(ports::kInvalidTimer);
    *id = timers_->schedule(config_.stopTimeout, [this, weak, id]() {
        if (weak.expired()) return;
        dispatch([this, weak, id]() {
            if (!weak.expired()) onStopTimeout(*id);
        });
    });
    stopTimer_ = *id;
}

void MotionStateMachine::cancelStopTimer() {
    if (stopTimer_ != ports::kInvalidTimer) {
        timers_->cancel(stopTimer_);
        stopTimer_ = ports::kInvalidTimer;
    }
}

void MotionStateMachine::armTriggerTimer(ActivityType activity) {
    if (triggerTimer_ != ports::kInvalidTimer) return;

    std::weak_ptr<MotionStateMachine*> weak = alive_;
    auto id = std::make_shared<ports::TimerId>(ports::kInvalidTimer);
    *id = timers_->schedule(config_.motionTriggerDelay, [this, weak, id, activity]() {
        if (weak.expired()) return;
        dispatch([this, weak, id, activity]() {
            if (!weak.expired()) onTriggerDelayElapsed(*id, activity);
        });
    });
    triggerTimer_ = *id;
}

void MotionStateMachine::cancelTriggerTimer() {
    if (triggerTimer_ != ports::kInvalidTimer) {
        timers_->cancel(triggerTimer_);
        triggerTimer_ = ports::kInvalidTimer;
    }
}

void MotionStateMachine::onStopTimeout(ports::TimerId id) {
    // A firing that raced with cancel() carries a stale id.
    if (id != stopTimer_ || currentState_ != MotionState::PendingStop) return;

    stopTimer_ = ports::kInvalidTimer;
    declareStationary();
}

void MotionStateMachine::onTriggerDelayElapsed(ports::TimerId id, ActivityType activity) {
    if (id != triggerTimer_) return;

    triggerTimer_ = ports::kInvalidTimer;
    if (running_ && currentState_ == MotionState::Stationary) {
        stopAccelerometer();
        declareMoving(activity);
    }
}

void MotionStateMachine::startAccelerometer() {
    if (accelerometerActive_ || !running_) return;

    accelerometerActive_ = sensors_->startAccelerometer();
    if (!accelerometerActive_) {
        emitError("accelerometer unavailable");
    }
}

void MotionStateMachine::stopAccelerometer() {
    if (!accelerometerActive_) return;

    sensors_->stopAccelerometer();
    accelerometerActive_ = false;
}

void MotionStateMachine::emitActivityChange(ActivityType activity, int confidence) {
    Event event;
    event.eventType = EventType::ActivityChange;
    event.timestamp = clock_->now();
    event.activity = activity;
    event.confidence = confidence;
    eventBus_->publish(event);
}

void MotionStateMachine::emitError(const std::string& detail) {
    Log::get("Motion")->warn("{}", detail);

    Event event;
    event.eventType = EventType::Error;
    event.timestamp = clock_->now();
    event.error = ErrorInfo{ErrorKind::ProviderUnavailable, detail};
    eventBus_->publish(event);
}

void MotionStateMachine::dispatch(std::function<void()> work) {
    if (dispatcher_) {
        dispatcher_(std::move(work));
    } else {
        work();
    }
}

double MotionStateMachine::shakeMagnitude(const AccelerometerSample& sample) {
    return std::sqrt(sample.x * sample.x + sample.y * sample.y + sample.z * sample.z) - GRAVITY;
}

} // namespace geotrack::domain
