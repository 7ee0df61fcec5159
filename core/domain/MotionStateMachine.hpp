#pragma once

#include "../Model.hpp"
#include "../TrackingConfig.hpp"
#include "../IClock.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IMotionSensors.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/ITimerService.hpp"
#include <functional>
#include <memory>

namespace geotrack::domain {

// Command for the orchestrator; the machine never drives the location provider itself.
struct MotionIntent {
    bool moving = false;
    ports::ProviderMode providerMode = ports::ProviderMode::LowPower;
    ActivityType activity = ActivityType::Unknown;
};

enum class MotionSource {
    ActivityClassifier,
    Accelerometer
};

class MotionStateMachine {
public:
    using IntentHandler = std::function<void(const MotionIntent&)>;
    // Routes timer callbacks back through the owner's mutation point.
    using Dispatcher = std::function<void(std::function<void()>)>;

    MotionStateMachine(const MotionConfig& config,
                      std::shared_ptr<ports::IMotionSensors> sensors,
                      std::shared_ptr<ports::ITimerService> timers,
                      std::shared_ptr<ports::IEventBus> eventBus,
                      std::shared_ptr<IClock> clock);
    ~MotionStateMachine();

    MotionStateMachine(const MotionStateMachine&) = delete;
    MotionStateMachine& operator=(const MotionStateMachine&) = delete;

    void setIntentHandler(IntentHandler handler) { intentHandler_ = std::move(handler); }
    void setDispatcher(Dispatcher dispatcher) { dispatcher_ = std::move(dispatcher); }
    void reconfigure(const MotionConfig& config);

    void start(bool initiallyMoving);
    void stop();

    void onActivityTransition(const ActivityTransition& transition);
    void onAccelerometerSample(const AccelerometerSample& sample);
    void onSourceLost(MotionSource source, const std::string& detail);
    void changePace(bool moving);

    MotionState getCurrentState() const { return currentState_; }
    bool isMoving() const { return currentState_ != MotionState::Stationary; }
    bool isRunning() const { return running_; }
    bool isStopTimerArmed() const { return stopTimer_ != ports::kInvalidTimer; }
    bool isAccelerometerActive() const { return accelerometerActive_; }
    ActivityType lastActivity() const { return lastActivity_; }
    int lastConfidence() const { return lastConfidence_; }

    static double shakeMagnitude(const AccelerometerSample& sample);

private:
    void handleStillEntered();
    void handleMovementDetected(ActivityType activity);

    void declareMoving(ActivityType activity);
    void declareStationary();
    void transitionTo(MotionState newState);

    void armStopTimer();
    void cancelStopTimer();
    void armTriggerTimer(ActivityType activity);
    void cancelTriggerTimer();
    void onStopTimeout(ports::TimerId id);
    void onTriggerDelayElapsed(ports::TimerId id, ActivityType activity);

    void startAccelerometer();
    void stopAccelerometer();
    void emitActivityChange(ActivityType activity, int confidence);
    void emitError(const std::string& detail);
    void dispatch(std::function<void()> work);

    MotionConfig config_;
    std::shared_ptr<ports::IMotionSensors> sensors_;
    std::shared_ptr<ports::ITimerService> timers_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    IntentHandler intentHandler_;
    Dispatcher dispatcher_;
    // Timer callbacks hold a weak reference and become no-ops after destruction.
    std::shared_ptr<MotionStateMachine*> alive_;

    MotionState currentState_ = MotionState::Stationary;
    bool running_ = false;
    bool accelerometerActive_ = false;
    bool activityUpdatesActive_ = false;

    ports::TimerId stopTimer_ = ports::kInvalidTimer;
    ports::TimerId triggerTimer_ = ports::kInvalidTimer;

    ActivityType lastActivity_ = ActivityType::Unknown;
    bool lastEntering_ = false;
    int lastConfidence_ = 0;

    static constexpr double GRAVITY = 9.81;
};

} // namespace geotrack::domain
