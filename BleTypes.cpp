#include "BleTypes.h"

namespace {

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

}

const char* ConnectionStatusName(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
    case ConnectionStatus::CONNECTING:   return "CONNECTING";
    case ConnectionStatus::CONNECTED:    return "CONNECTED";
    case ConnectionStatus::UNKNOWN:      break;
    }
    return "UNKNOWN";
}

const char* CommandKindName(CommandKind kind) {
    switch (kind) {
    case CommandKind::NOISE_ON:             return "noise_on";
    case CommandKind::NOISE_OFF:            return "noise_off";
    case CommandKind::SET_VOLUME:           return "set_volume";
    case CommandKind::LIGHT_ON:             return "light_on";
    case CommandKind::LIGHT_OFF:            return "light_off";
    case CommandKind::SET_LIGHT_BRIGHTNESS: return "set_light_brightness";
    }
    return "unknown";
}

const char* CommandStatusName(CommandStatus status) {
    switch (status) {
    case CommandStatus::SUCCESSFUL:         return "SUCCESSFUL";
    case CommandStatus::CANCELLED:          return "CANCELLED";
    case CommandStatus::DEVICE_UNAVAILABLE: return "DEVICE_UNAVAILABLE";
    case CommandStatus::UNEXPECTED_ERROR:   return "UNEXPECTED_ERROR";
    }
    return "UNEXPECTED_ERROR";
}

// --- DeviceCommand Factories ---

DeviceCommand DeviceCommand::NoiseOn(std::optional<int> volume) {
    DeviceCommand cmd{ CommandKind::NOISE_ON };
    cmd.volume = volume;
    return cmd;
}

DeviceCommand DeviceCommand::NoiseOff(std::optional<double> duration_s) {
    DeviceCommand cmd{ CommandKind::NOISE_OFF };
    cmd.duration_s = duration_s;
    return cmd;
}

DeviceCommand DeviceCommand::SetVolume(int volume) {
    DeviceCommand cmd{ CommandKind::SET_VOLUME };
    cmd.volume = volume;
    return cmd;
}

DeviceCommand DeviceCommand::LightOn() {
    return DeviceCommand{ CommandKind::LIGHT_ON };
}

DeviceCommand DeviceCommand::LightOff() {
    return DeviceCommand{ CommandKind::LIGHT_OFF };
}

DeviceCommand DeviceCommand::SetLightBrightness(int brightness) {
    DeviceCommand cmd{ CommandKind::SET_LIGHT_BRIGHTNESS };
    cmd.brightness = brightness;
    return cmd;
}

// --- JSON Shapes ---

nlohmann::json CommandResultToJson(const CommandResult& result) {
    return {
        {"status", CommandStatusName(result.status)},
        {"duration_s", OptionalToJson(result.duration_s)},
        {"response", result.response}
    };
}

nlohmann::json SnapshotToJson(const DeviceSnapshot& snapshot) {
    const DeviceState& state = snapshot.state;
    return {
        {"device_name", snapshot.device_name},
        {"address", OptionalToJson(snapshot.address)},
        {"display_name", OptionalToJson(snapshot.display_name)},
        {"connected", snapshot.connected},
        {"connection_status", ConnectionStatusName(snapshot.connection_status)},
        {"model", OptionalToJson(snapshot.model)},
        {"firmware_version", OptionalToJson(snapshot.firmware_version)},
        {"state", {
            {"on", OptionalToJson(state.on)},
            {"volume", OptionalToJson(state.volume)},
            {"light_on", OptionalToJson(state.light_on)},
            {"light_brightness", OptionalToJson(state.light_brightness)},
            {"night_mode_enabled", OptionalToJson(state.night_mode_enabled)}
        }}
    };
}
