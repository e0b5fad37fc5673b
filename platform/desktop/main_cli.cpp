/**
 * @file main_cli.cpp
 * @brief Command-line replay tool for the farmfence engine
 * 
 * Loads a zone/tree snapshot and a recorded GPS track, replays the track
 * through a FieldTracker and prints one JSON line per event: accepted fixes
 * with their proximity result, permission changes, sensor errors and
 * geofence transitions, followed by a session summary. The loaded zones are
 * printed first with their areas.
 * 
 * @note stdout carries only the JSON records; diagnostics go to stderr
 * @note Command-line options override the configuration file
 * @note Includes proper signal handling for interrupting long replays
 */

#include "domain/FieldTracker.hpp"
#include "domain/EventBus.hpp"
#include "adapters/JsonFieldDataSource.hpp"
#include "sim/ReplayLocationSensor.hpp"
#include "JsonCodec.hpp"
#include "IClock.hpp"
#include "TomlConfig.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <signal.h>
#include <cstdlib>

using namespace farmfence;

/// Global flag for graceful shutdown coordination
static volatile sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: farmfence.toml)\n"
              << "  --zones [file]     Zone snapshot (JSON)\n"
              << "  --trees [file]     Tree snapshot (JSON)\n"
              << "  --track [file]     Recorded track to replay (JSON)\n"
              << "  --radius [meters]  Proximity radius\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [tracking]\n"
              << "  distance_filter_meters = 5\n"
              << "  [proximity]\n"
              << "  radius_meters = 30\n"
              << "  [data]\n"
              << "  zones_file = \"zones.json\"\n"
              << "\nEnvironment: FARMFENCE_RADIUS_M, FARMFENCE_DISTANCE_FILTER_M\n"
              << std::endl;
}

std::string safeGetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
}

/**
 * @brief Apply environment overrides on top of the file configuration
 * @return false if a variable is set but not a valid number
 */
bool applyEnvOverrides(domain::EngineConfig& config) {
    std::string radius = safeGetEnv("FARMFENCE_RADIUS_M");
    std::string distanceFilter = safeGetEnv("FARMFENCE_DISTANCE_FILTER_M");
    
    try {
        if (!radius.empty()) {
            config.proximityRadiusMeters = TomlConfig::parseNonNegative("FARMFENCE_RADIUS_M", radius);
        }
        if (!distanceFilter.empty()) {
            config.stream.distanceFilterMeters =
                TomlConfig::parseNonNegative("FARMFENCE_DISTANCE_FILTER_M", distanceFilter);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "[CLI] Invalid environment override: " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    
    std::string configFile = "farmfence.toml";
    std::string zonesFile;
    std::string treesFile;
    std::string trackFile;
    std::string radiusArg;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && hasValue) {
            configFile = argv[++i];
        } else if (arg == "--zones" && hasValue) {
            zonesFile = argv[++i];
        } else if (arg == "--trees" && hasValue) {
            treesFile = argv[++i];
        } else if (arg == "--track" && hasValue) {
            trackFile = argv[++i];
        } else if (arg == "--radius" && hasValue) {
            radiusArg = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }
    
    domain::EngineConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
        if (!radiusArg.empty()) {
            config.proximityRadiusMeters = TomlConfig::parseNonNegative("--radius", radiusArg);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!applyEnvOverrides(config)) {
        return 1;
    }
    
    if (!zonesFile.empty()) config.zonesFile = zonesFile;
    if (!treesFile.empty()) config.treesFile = treesFile;
    if (!trackFile.empty()) config.trackFile = trackFile;
    
    if (config.trackFile.empty()) {
        std::cerr << "Error: no track to replay (use --track or [data] track_file)" << std::endl;
        return 1;
    }
    
    auto dataSource = std::make_shared<adapters::JsonFieldDataSource>();
    if (!config.zonesFile.empty() && !dataSource->loadZonesFile(config.zonesFile)) {
        return 1;
    }
    if (!config.treesFile.empty() && !dataSource->loadTreesFile(config.treesFile)) {
        return 1;
    }
    
    {
        nlohmann::json zones;
        zones["type"] = "zones";
        zones["zones"] = nlohmann::json::array();
        for (const auto& zone : dataSource->zones()) {
            zones["zones"].push_back(JsonCodec::zoneToJson(zone));
        }
        std::cout << zones.dump() << std::endl;
    }
    
    std::vector<sim::TrackEntry> track;
    {
        std::ifstream file(config.trackFile);
        if (!file.is_open()) {
            std::cerr << "Error: could not open track file: " << config.trackFile << std::endl;
            return 1;
        }
        try {
            track = sim::ReplayLocationSensor::parseTrack(nlohmann::json::parse(file));
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: invalid track JSON: " << e.what() << std::endl;
            return 1;
        }
    }
    
    std::cerr << "[CLI] Replaying " << track.size() << " track entries, radius "
              << config.proximityRadiusMeters << "m" << std::endl;
    
    auto sensor = std::make_shared<sim::ReplayLocationSensor>(std::move(track));
    auto eventBus = std::make_shared<domain::EventBus>();
    auto clock = std::make_shared<SystemClock>();
    
    domain::FieldTracker tracker(sensor, dataSource, eventBus, clock, config);
    
    // Everything the consumer can observe is printed as it is dispatched
    auto printEvent = [](const StreamEvent& event) {
        nlohmann::json line = JsonCodec::eventToJson(event);
        std::cout << line.dump() << std::endl;
    };
    eventBus->subscribe(StreamEventType::PermissionChanged, printEvent);
    eventBus->subscribe(StreamEventType::TrackingError, printEvent);
    eventBus->subscribe(StreamEventType::Geofence, printEvent);
    
    tracker.setProximityHandler([](const Position& position, const ProximityResult& result) {
        nlohmann::json line;
        line["type"] = "proximity";
        line["position"] = JsonCodec::positionToJson(position);
        line["proximity"] = JsonCodec::proximityToJson(result);
        std::cout << line.dump() << std::endl;
    });
    
    try {
        tracker.start();
    } catch (const domain::TrackingError& e) {
        eventBus->processEvents();
        std::cerr << "Error: tracking could not start: " << e.what()
                  << " (" << errorKindToString(e.kind()) << ")" << std::endl;
        return 2;
    }
    
    while (g_running && tracker.isRunning() && sensor->replayNext()) {
        eventBus->processEvents();
    }
    eventBus->processEvents();
    
    tracker.stop();
    
    nlohmann::json summary;
    summary["type"] = "session";
    summary["session"] = JsonCodec::sessionToJson(tracker.session());
    summary["finishedAt"] = clock->iso8601();
    std::cout << summary.dump() << std::endl;
    
    return 0;
}
