// BleTypes.h
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// --- Radio Observations ---
struct Advertisement {
    std::string address;   // Hardware address (Linux MAC)
    std::string name;      // Local name, falls back to the cached device name
    std::map<uint16_t, std::vector<uint8_t>> manufacturer_data;
};

// --- Configured Identity ---
// Empty address / match_name means "not configured".
struct DeviceIdentity {
    std::string name;
    std::string address;
    std::string match_name;
    std::string secret;
};

struct DeviceModelInfo {
    std::string model;
    std::string firmware_version;
    std::string secret;
};

enum class ConnectionStatus {
    UNKNOWN,
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

const char* ConnectionStatusName(ConnectionStatus status);

// All fields stay empty until the first successful read.
struct DeviceState {
    std::optional<bool> on;
    std::optional<int> volume;
    std::optional<bool> light_on;
    std::optional<int> light_brightness;
    std::optional<bool> night_mode_enabled;

    bool operator==(const DeviceState& other) const {
        return on == other.on && volume == other.volume && light_on == other.light_on &&
            light_brightness == other.light_brightness && night_mode_enabled == other.night_mode_enabled;
    }
    bool operator!=(const DeviceState& other) const { return !(*this == other); }
};

// --- Commands ---
enum class CommandKind {
    NOISE_ON,
    NOISE_OFF,
    SET_VOLUME,
    LIGHT_ON,
    LIGHT_OFF,
    SET_LIGHT_BRIGHTNESS
};

const char* CommandKindName(CommandKind kind);

struct DeviceCommand {
    CommandKind kind;
    std::optional<int> volume;
    std::optional<double> duration_s;
    std::optional<int> brightness;

    static DeviceCommand NoiseOn(std::optional<int> volume = std::nullopt);
    static DeviceCommand NoiseOff(std::optional<double> duration_s = std::nullopt);
    static DeviceCommand SetVolume(int volume);
    static DeviceCommand LightOn();
    static DeviceCommand LightOff();
    static DeviceCommand SetLightBrightness(int brightness);
};

enum class CommandStatus {
    SUCCESSFUL,
    CANCELLED,
    DEVICE_UNAVAILABLE,
    UNEXPECTED_ERROR
};

const char* CommandStatusName(CommandStatus status);

struct CommandResult {
    CommandStatus status = CommandStatus::UNEXPECTED_ERROR;
    std::optional<double> duration_s;
    nlohmann::json response; // null when the device sent nothing back
};

// {status, duration_s, response}
nlohmann::json CommandResultToJson(const CommandResult& result);

// --- Snapshots & Events ---
struct DeviceSnapshot {
    std::string device_name;
    std::optional<std::string> address;
    std::optional<std::string> display_name;
    bool connected = false;
    ConnectionStatus connection_status = ConnectionStatus::UNKNOWN;
    std::optional<std::string> model;
    std::optional<std::string> firmware_version;
    DeviceState state;
};

nlohmann::json SnapshotToJson(const DeviceSnapshot& snapshot);

struct DeviceEvent {
    std::string device_name;
    DeviceSnapshot snapshot;
};
