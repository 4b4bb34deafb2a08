#include "ConfigManager.h"

#include <cctype>
#include <fstream>
#include <set>

#include "GatewayErrors.h"
#include "Log.h"
#include "StringUtils.h"

namespace {

ClassifierConfig DefaultClassifierConfig() {
    ClassifierConfig config;
    config.advertisement_length = 9;
    config.pairing_flags = 0x01;
    config.firmware_by_flags = {
        { 0x04, "V2" }, { 0x08, "V3" }, { 0x0C, "V4" }, { 0x10, "V5" }, { 0x14, "V6" }
    };
    config.original_firmware = { "V2", "V3", "V4", "V5" };
    config.unnamed_pro_firmware = { "V6" };
    return config;
}

std::string OptionalString(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return "";
    if (!obj[key].is_string()) throw ConfigError(std::string(key) + " must be a string");
    return obj[key].get<std::string>();
}

int SecondsToMs(double seconds, const char* key) {
    if (seconds < 0) throw ConfigError(std::string("service.timing.") + key + " must be non-negative");
    return static_cast<int>(seconds * 1000.0);
}

std::optional<bool> OptionalBool(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return obj[key].get<bool>();
}

std::optional<int> OptionalInt(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return obj[key].get<int>();
}

} // namespace

HubConfig ConfigManager::LoadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Config file not found: " + path);
    }

    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }

    HubConfig config = Parse(raw);
    AddLog("Config: loaded " + std::to_string(config.devices.size()) + " device(s) from " + path);
    return config;
}

HubConfig ConfigManager::Parse(const nlohmann::json& raw) {
    if (!raw.is_object()) throw ConfigError("Config root must be an object");

    HubConfig config;
    try {
        const nlohmann::json service = raw.value("service", nlohmann::json::object());
        if (!service.is_object()) throw ConfigError("service must be an object");

        config.websocket = ParseWebSocket(service.value("websocket", nlohmann::json::object()));
        config.devices = ParseDevices(service.value("devices", nlohmann::json::array()));
        config.timing = ParseTiming(service.value("timing", nlohmann::json::object()));
        config.worker_threads = service.value("worker_threads", 0);
        if (config.worker_threads < 0) throw ConfigError("service.worker_threads must be non-negative");

        const nlohmann::json log = service.value("log", nlohmann::json::object());
        config.log_ingress = log.value("ingress", true);
        config.log_egress = log.value("egress", true);

        config.platform = ToLower(Trim(raw.value("platform", std::string("simulated"))));
        if (config.platform != "simulated") {
            throw ConfigError("Unknown platform: " + config.platform);
        }
        config.classifier = raw.contains("classifier") ? ParseClassifier(raw["classifier"]) : DefaultClassifierConfig();
        config.simulation = ParseSimulation(raw.value("simulation", nlohmann::json::object()));
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
    return config;
}

std::string ConfigManager::NormalizeHexPassword(const std::string& value) {
    std::string cleaned;
    for (char c : ToLower(Trim(value))) {
        if (std::isxdigit(static_cast<unsigned char>(c))) cleaned.push_back(c);
    }
    if (cleaned.size() != 16) {
        throw ConfigError("Invalid password hex length: expected 16 hex chars, got " + std::to_string(cleaned.size()));
    }
    return cleaned;
}

std::vector<uint8_t> ConfigManager::ParseHexBytes(const std::string& value) {
    std::string digits;
    for (char c : value) {
        if (std::isxdigit(static_cast<unsigned char>(c))) digits.push_back(c);
        else if (c != ' ' && c != ':' && c != '-') throw ConfigError("Invalid hex string: " + value);
    }
    if (digits.size() % 2 != 0) throw ConfigError("Hex string has an odd number of digits: " + value);

    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

WebSocketConfig ConfigManager::ParseWebSocket(const nlohmann::json& raw) {
    WebSocketConfig ws;
    ws.host = raw.value("host", ws.host);
    ws.port = raw.value("port", ws.port);
    ws.auth_token = OptionalString(raw, "auth_token");
    if (ws.port < 1 || ws.port > 65535) {
        throw ConfigError("service.websocket.port out of range: " + std::to_string(ws.port));
    }
    return ws;
}

std::vector<DeviceIdentity> ConfigManager::ParseDevices(const nlohmann::json& raw) {
    if (!raw.is_array()) throw ConfigError("service.devices must be a list");

    std::vector<DeviceIdentity> devices;
    std::set<std::string> names;
    std::set<std::string> addresses;
    std::set<std::string> match_names;
    for (const auto& entry : raw) {
        if (!entry.is_object()) throw ConfigError("service.devices entries must be objects");
        if (!entry.contains("device_name")) throw ConfigError("Device entry is missing device_name");
        if (!entry.contains("password")) {
            throw ConfigError("Device '" + entry["device_name"].get<std::string>() + "' is missing password");
        }

        DeviceIdentity identity;
        identity.name = entry["device_name"].get<std::string>();
        identity.address = ToUpper(Trim(OptionalString(entry, "address")));
        identity.match_name = OptionalString(entry, "name");
        identity.secret = NormalizeHexPassword(entry["password"].get<std::string>());

        if (identity.name.empty()) throw ConfigError("device_name must not be empty");
        if (identity.address.empty() && identity.match_name.empty()) {
            throw ConfigError("Device '" + identity.name + "' must specify either 'address' or 'name'");
        }
        if (!names.insert(identity.name).second) {
            throw ConfigError("Duplicate device_name found in config: " + identity.name);
        }
        // Each advertisement binds at most one identity.
        if (!identity.address.empty() && !addresses.insert(identity.address).second) {
            throw ConfigError("Duplicate address found in config: " + identity.address);
        }
        if (identity.address.empty() && !match_names.insert(ToLower(Trim(identity.match_name))).second) {
            throw ConfigError("Duplicate name found in config: " + identity.match_name);
        }
        devices.push_back(std::move(identity));
    }

    if (devices.empty()) throw ConfigError("No devices configured (service.devices is empty)");
    return devices;
}

ManagerTiming ConfigManager::ParseTiming(const nlohmann::json& raw) {
    ManagerTiming timing;
    timing.initial_scan_timeout = std::chrono::milliseconds(SecondsToMs(raw.value("initial_scan_s", 12.0), "initial_scan_s"));
    timing.rescan_interval = std::chrono::milliseconds(SecondsToMs(raw.value("rescan_interval_s", 30.0), "rescan_interval_s"));
    timing.rescan_timeout = std::chrono::milliseconds(SecondsToMs(raw.value("rescan_timeout_s", 8.0), "rescan_timeout_s"));

    int debounce_ms = raw.value("debounce_ms", 250);
    if (debounce_ms < 0) throw ConfigError("service.timing.debounce_ms must be non-negative");
    timing.debounce = std::chrono::milliseconds(debounce_ms);

    if (timing.rescan_interval.count() == 0) throw ConfigError("service.timing.rescan_interval_s must be positive");
    return timing;
}

ClassifierConfig ConfigManager::ParseClassifier(const nlohmann::json& raw) {
    if (!raw.is_object()) throw ConfigError("classifier must be an object");

    ClassifierConfig config = DefaultClassifierConfig();
    config.advertisement_length = raw.value("advertisement_length", config.advertisement_length);

    if (raw.contains("pairing_flags")) {
        config.pairing_flags = static_cast<uint8_t>(raw["pairing_flags"].get<int>());
    }
    if (raw.contains("firmware_by_flags")) {
        config.firmware_by_flags.clear();
        for (const auto& [key, value] : raw["firmware_by_flags"].items()) {
            unsigned long flags = 0;
            try {
                flags = std::stoul(key, nullptr, 16);
            }
            catch (const std::exception&) {
                throw ConfigError("classifier.firmware_by_flags key is not hex: " + key);
            }
            if (flags > 0xFF) throw ConfigError("classifier.firmware_by_flags key out of range: " + key);
            config.firmware_by_flags[static_cast<uint8_t>(flags)] = value.get<std::string>();
        }
    }
    if (raw.contains("original_firmware")) {
        config.original_firmware = raw["original_firmware"].get<std::set<std::string>>();
    }
    if (raw.contains("unnamed_pro_firmware")) {
        config.unnamed_pro_firmware = raw["unnamed_pro_firmware"].get<std::set<std::string>>();
    }
    return config;
}

SimulationConfig ConfigManager::ParseSimulation(const nlohmann::json& raw) {
    SimulationConfig sim;
    sim.advertise_interval = std::chrono::milliseconds(raw.value("advertise_interval_ms", 1000));
    sim.command_latency = std::chrono::milliseconds(raw.value("command_latency_ms", 150));
    sim.notification_burst = raw.value("notification_burst", 3);

    for (const auto& entry : raw.value("devices", nlohmann::json::array())) {
        SimulatedDeviceConfig device;
        device.address = ToUpper(Trim(entry.value("address", std::string())));
        device.name = entry.value("name", std::string());
        if (device.address.empty()) throw ConfigError("simulation.devices entries need an address");

        device.company_id = static_cast<uint16_t>(entry.value("company_id", static_cast<int>(kPreferredCompanyId)));
        device.payload = ParseHexBytes(entry.value("payload", std::string()));

        const nlohmann::json state = entry.value("state", nlohmann::json::object());
        device.initial_state.on = OptionalBool(state, "on");
        device.initial_state.volume = OptionalInt(state, "volume");
        device.initial_state.light_on = OptionalBool(state, "light_on");
        device.initial_state.light_brightness = OptionalInt(state, "light_brightness");
        device.initial_state.night_mode_enabled = OptionalBool(state, "night_mode_enabled");
        sim.devices.push_back(std::move(device));
    }
    return sim;
}
