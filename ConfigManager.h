// ConfigManager.h
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "AdvertisementClassifier.h"
#include "BleTypes.h"
#include "DeviceManager.h"

struct WebSocketConfig {
    std::string host = "0.0.0.0";
    int port = 8765;
    std::string auth_token; // Empty disables authentication
};

struct SimulatedDeviceConfig {
    std::string address;
    std::string name;
    uint16_t company_id = kPreferredCompanyId;
    std::vector<uint8_t> payload;
    DeviceState initial_state;
};

struct SimulationConfig {
    std::vector<SimulatedDeviceConfig> devices;
    std::chrono::milliseconds advertise_interval{ 1000 };
    std::chrono::milliseconds command_latency{ 150 };
    int notification_burst = 3;
};

struct HubConfig {
    WebSocketConfig websocket;
    std::vector<DeviceIdentity> devices;
    ManagerTiming timing;
    int worker_threads = 0; // 0 = hardware concurrency
    bool log_ingress = true;
    bool log_egress = true;

    std::string platform = "simulated";
    ClassifierConfig classifier;
    SimulationConfig simulation;
};

// --- ConfigManager ---
// Loads and validates the JSON service configuration. Every failure throws ConfigError.
class ConfigManager {
public:
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static HubConfig LoadFile(const std::string& path);
    static HubConfig Parse(const nlohmann::json& raw);

    // Keeps the hex digits of value (lower-cased); exactly 16 must remain.
    static std::string NormalizeHexPassword(const std::string& value);
    static std::vector<uint8_t> ParseHexBytes(const std::string& value);

private:
    ConfigManager() = default;

    static WebSocketConfig ParseWebSocket(const nlohmann::json& raw);
    static std::vector<DeviceIdentity> ParseDevices(const nlohmann::json& raw);
    static ManagerTiming ParseTiming(const nlohmann::json& raw);
    static ClassifierConfig ParseClassifier(const nlohmann::json& raw);
    static SimulationConfig ParseSimulation(const nlohmann::json& raw);
};
