/**
 * @file main_cli.cpp
 * @brief Command-line replay tool for the tracking engine
 *
 * Feeds a JSON-lines trace (fixes, activity transitions, accelerometer
 * samples, connectivity changes, geofences) into a TrackingSession wired to
 * the production adapters: SQLite persistence, worker-thread executors and an
 * HTTP (or MQTT) upload transport. Every engine event is printed as one JSON
 * line on stdout.
 *
 * Trace line examples:
 *   {"type":"location","ts":1704067200000,"coords":{"latitude":52.1,"longitude":4.3,"accuracy":8}}
 *   {"type":"activity","activity":"in_vehicle","confidence":90,"ts":1704067200000}
 *   {"type":"connectivity","transport":"cellular"}
 *   {"type":"geofence","identifier":"home","latitude":52.1,"longitude":4.3,"radius":150}
 *   {"type":"wait","ms":2000}
 */

#include "DesktopSources.hpp"
#include "TraceReplay.hpp"
#include "../../core/Errors.hpp"
#include "../../core/IClock.hpp"
#include "../../core/JsonCodec.hpp"
#include "../../core/Log.hpp"
#include "../../core/TrackingConfig.hpp"
#include "../../core/adapters/BeastHttpTransport.hpp"
#include "../../core/adapters/DefaultPolicies.hpp"
#include "../../core/adapters/SqliteRecordStore.hpp"
#include "../../core/adapters/ThreadExecutor.hpp"
#include "../../core/adapters/ThreadTimerService.hpp"
#include "../../core/domain/EventBus.hpp"
#include "../../core/domain/TrackingSession.hpp"
#ifdef GEOTRACK_WITH_MQTT
#include "../../core/adapters/MqttTransportAdapter.hpp"
#include "../../net/mqtt/PahoMqttClient.hpp"
#endif
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

using namespace geotrack;

static std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>    Tracking configuration (JSON)\n"
              << "  --trace <file>     Trace to replay, one JSON object per line (default: stdin)\n"
              << "  --db <file>        SQLite database (default: geotrack.db)\n"
              << "  --geofences-only   Start in geofences-only mode\n"
              << "  --hold             Keep running after the trace until Ctrl+C\n"
              << "  --help             Show this help message\n"
              << "\nEnvironment:\n"
              << "  GEOTRACK_SYNC_URL   overrides sync.url\n"
              << "  GEOTRACK_DB_PATH    overrides --db\n"
              << "  GEOTRACK_LOG_LEVEL  overrides logger.level (error, warning, info, debug, verbose)\n"
#ifdef GEOTRACK_WITH_MQTT
              << "  GEOTRACK_MQTT_HOST, GEOTRACK_MQTT_DEVICE_ID, GEOTRACK_MQTT_DEVICE_KEY, GEOTRACK_MQTT_TOPIC\n"
              << "                      upload over MQTT instead of HTTP\n"
#endif
              << std::endl;
}

std::string safeGetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
}

std::shared_ptr<ports::ITransport> makeTransport() {
#ifdef GEOTRACK_WITH_MQTT
    std::string host = safeGetEnv("GEOTRACK_MQTT_HOST");
    if (!host.empty()) {
        adapters::MqttTransportConfig mqtt;
        mqtt.connection.host = host;
        mqtt.connection.clientId = safeGetEnv("GEOTRACK_MQTT_DEVICE_ID");
        mqtt.connection.username = host + "/" + mqtt.connection.clientId;
        mqtt.sasDeviceKeyBase64 = safeGetEnv("GEOTRACK_MQTT_DEVICE_KEY");
        std::string topic = safeGetEnv("GEOTRACK_MQTT_TOPIC");
        if (!topic.empty()) mqtt.topic = topic;
        Log::get("CLI")->info("uploading over MQTT to {} topic {}", host, mqtt.topic);
        return std::make_shared<adapters::MqttTransportAdapter>(std::make_shared<PahoMqttClient>(), mqtt);
    }
#endif
    return std::make_shared<adapters::BeastHttpTransport>();
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::string configFile;
    std::string traceFile;
    std::string dbPath = "geotrack.db";
    bool geofencesOnly = false;
    bool hold = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--trace" && i + 1 < argc) {
            traceFile = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            dbPath = argv[++i];
        } else if (arg == "--geofences-only") {
            geofencesOnly = true;
        } else if (arg == "--hold") {
            hold = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    TrackingConfig config;
    try {
        if (!configFile.empty()) {
            config = TrackingConfig::fromFile(configFile);
        }
        std::string url = safeGetEnv("GEOTRACK_SYNC_URL");
        if (!url.empty()) config.sync.url = url;
        std::string level = safeGetEnv("GEOTRACK_LOG_LEVEL");
        if (!level.empty()) config.logger.level = stringToLogLevel(level);
        config.validate();
    } catch (const TrackingError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::string envDb = safeGetEnv("GEOTRACK_DB_PATH");
    if (!envDb.empty()) dbPath = envDb;
    Log::setLevel(config.logger.level);

    auto connectivity = std::make_shared<desktop::ReplayConnectivity>();
    auto sessionExecutor = std::make_shared<adapters::ThreadExecutor>("session");
    auto storageExecutor = std::make_shared<adapters::ThreadExecutor>("storage");
    auto networkExecutor = std::make_shared<adapters::ThreadExecutor>("network");
    auto timers = std::make_shared<adapters::ThreadTimerService>();
    auto eventBus = std::make_shared<domain::EventBus>();

    domain::SessionPorts ports;
    ports.locationProvider = std::make_shared<desktop::ReplayLocationProvider>();
    ports.motionSensors = std::make_shared<desktop::ReplayMotionSensors>();
    ports.geofenceRegistrar = std::make_shared<desktop::ReplayGeofenceRegistrar>(20);
    ports.timers = timers;
    ports.connectivity = connectivity;
    ports.sessionExecutor = sessionExecutor;
    ports.storageExecutor = storageExecutor;
    ports.networkExecutor = networkExecutor;
    ports.clock = std::make_shared<SystemClock>();
    ports.eventBus = eventBus;
    ports.policyFactory = [](const SyncConfig& sync) {
        return std::make_shared<adapters::DefaultPolicyEngine>(sync);
    };

    std::unique_ptr<domain::TrackingSession> session;
    try {
        ports.transport = makeTransport();
        ports.store = std::make_shared<adapters::SqliteRecordStore>(dbPath);
        session = std::make_unique<domain::TrackingSession>(ports);
        session->configure(config);
    } catch (const TrackingError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    eventBus->subscribe([](const Event& event) {
        std::cout << JsonCodec::eventToJson(event).dump() << std::endl;
    });

    bool started = geofencesOnly ? session->startGeofences() : session->start();
    if (!started) {
        eventBus->processEvents();
        std::cerr << "Error: session did not start" << std::endl;
        return 1;
    }
    Log::get("CLI")->info("replaying {} into {}", traceFile.empty() ? "stdin" : traceFile, dbPath);

    std::ifstream traceStream;
    if (!traceFile.empty()) {
        traceStream.open(traceFile);
        if (!traceStream.is_open()) {
            std::cerr << "Error: cannot open trace " << traceFile << std::endl;
            return 1;
        }
    }
    std::istream& input = traceFile.empty() ? std::cin : traceStream;

    std::string line;
    std::size_t lineNumber = 0;
    while (g_running && std::getline(input, line)) {
        ++lineNumber;
        if (line.empty() || line[0] == '#') continue;
        if (!desktop::replayTraceLine(line, *session, *connectivity)) {
            Log::get("CLI")->warn("line {} skipped", lineNumber);
        }
        eventBus->processEvents();
    }

    session->syncNow();
    auto drainDeadline = std::chrono::steady_clock::now() + config.sync.timeout;
    do {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        eventBus->processEvents();
    } while (g_running && session->snapshot().syncInFlight && std::chrono::steady_clock::now() < drainDeadline);

    while (hold && g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        eventBus->processEvents();
    }

    auto snapshot = session->snapshot();
    session->stop();
    timers->shutdown();
    sessionExecutor->shutdown();
    session.reset();
    networkExecutor->shutdown();
    storageExecutor->shutdown();
    eventBus->processEvents();

    std::cerr << "odometer " << snapshot.odometer << "m, rejected fixes " << snapshot.rejectedFixes
              << ", unsynced records " << snapshot.unsyncedRecords << std::endl;
    return 0;
}
