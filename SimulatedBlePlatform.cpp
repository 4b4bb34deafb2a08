#include "SimulatedBlePlatform.h"

#include <stdexcept>
#include <vector>

#include "GatewayErrors.h"
#include "Log.h"
#include "StringUtils.h"

// --- SimulatedScanner ---
SimulatedScanner::SimulatedScanner(SimulationConfig config)
    : m_config(std::move(config)) {
}

SimulatedScanner::~SimulatedScanner() {
    StopScan();
}

bool SimulatedScanner::StartScan(AdvertisementCallback on_advertisement) {
    if (m_scanning) return false;
    if (m_scan_thread.joinable()) m_scan_thread.join();

    m_scanning = true;
    m_scan_thread = std::thread(&SimulatedScanner::RunScan, this, std::move(on_advertisement));
    return true;
}

void SimulatedScanner::StopScan() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scanning = false;
    }
    m_cv.notify_all();
    if (m_scan_thread.joinable()) {
        if (m_scan_thread.get_id() == std::this_thread::get_id()) {
            m_scan_thread.detach();
        }
        else {
            m_scan_thread.join();
        }
    }
}

void SimulatedScanner::RunScan(AdvertisementCallback on_advertisement) {
    while (m_scanning) {
        for (const auto& device : m_config.devices) {
            if (!m_scanning) break;
            Advertisement adv;
            adv.address = device.address;
            adv.name = device.name;
            adv.manufacturer_data[device.company_id] = device.payload;
            try {
                on_advertisement(adv);
            }
            catch (const std::exception& e) {
                AddLog("Simulated scanner: advertisement handler failed: " + std::string(e.what()));
            }
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, m_config.advertise_interval, [this] { return !m_scanning; });
    }
}

// --- SimulatedDeviceControl ---
SimulatedDeviceControl::SimulatedDeviceControl(std::string address, DeviceModelInfo info, DeviceState initial_state,
    std::chrono::milliseconds latency, int notification_burst)
    : m_address(std::move(address)),
    m_info(std::move(info)),
    m_latency(latency),
    m_notification_burst(notification_burst),
    m_state(std::move(initial_state)) {
}

void SimulatedDeviceControl::Connect() {
    m_status = ConnectionStatus::CONNECTING;
    std::this_thread::sleep_for(m_latency);
    m_status = ConnectionStatus::CONNECTED;
}

void SimulatedDeviceControl::Disconnect() {
    m_status = ConnectionStatus::DISCONNECTED;
}

CommandResult SimulatedDeviceControl::ExecuteCommand(const DeviceCommand& cmd) {
    CommandResult result;
    if (m_status != ConnectionStatus::CONNECTED) {
        result.status = CommandStatus::DEVICE_UNAVAILABLE;
        return result;
    }

    std::this_thread::sleep_for(m_latency);

    DeviceState before;
    DeviceState after;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        before = m_state;
        switch (cmd.kind) {
        case CommandKind::NOISE_ON:
            m_state.on = true;
            if (cmd.volume) m_state.volume = *cmd.volume;
            break;
        case CommandKind::NOISE_OFF:
            m_state.on = false;
            break;
        case CommandKind::SET_VOLUME:
            m_state.volume = cmd.volume;
            break;
        case CommandKind::LIGHT_ON:
            m_state.light_on = true;
            if (!m_state.light_brightness) m_state.light_brightness = 100;
            break;
        case CommandKind::LIGHT_OFF:
            m_state.light_on = false;
            break;
        case CommandKind::SET_LIGHT_BRIGHTNESS:
            m_state.light_brightness = cmd.brightness;
            m_state.light_on = cmd.brightness.value_or(0) > 0;
            break;
        }
        after = m_state;
    }

    NotifyBurst(before, after);

    result.status = CommandStatus::SUCCESSFUL;
    result.duration_s = cmd.duration_s;
    return result;
}

DeviceState SimulatedDeviceControl::ReadState(bool use_cached) {
    if (m_status != ConnectionStatus::CONNECTED) {
        throw std::runtime_error("device " + m_address + " is not connected");
    }
    if (!use_cached) std::this_thread::sleep_for(m_latency);
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

IDeviceControl::SubscriptionId SimulatedDeviceControl::SubscribeToStateChange(StateCallback callback) {
    std::lock_guard<std::mutex> lock(m_subscribers_mutex);
    SubscriptionId id = m_next_subscription++;
    m_subscribers[id] = std::move(callback);
    return id;
}

void SimulatedDeviceControl::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_subscribers_mutex);
    m_subscribers.erase(id);
}

// Volume and brightness ramp towards the new value; the last notification is the final state.
void SimulatedDeviceControl::NotifyBurst(const DeviceState& from, const DeviceState& to) {
    if (m_notification_burst <= 1) {
        Notify(to);
        return;
    }

    auto ramp = [](const std::optional<int>& a, const std::optional<int>& b, int step, int steps) -> std::optional<int> {
        if (!b) return b;
        int start = a.value_or(0);
        return start + (*b - start) * step / steps;
    };

    for (int i = 1; i <= m_notification_burst; ++i) {
        DeviceState step = to;
        step.volume = ramp(from.volume, to.volume, i, m_notification_burst);
        step.light_brightness = ramp(from.light_brightness, to.light_brightness, i, m_notification_burst);
        Notify(step);
    }
}

void SimulatedDeviceControl::Notify(const DeviceState& state) {
    std::vector<StateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        for (const auto& [id, callback] : m_subscribers) callbacks.push_back(callback);
    }
    for (const auto& callback : callbacks) {
        callback(state);
    }
}

// --- SimulatedBlePlatform ---
SimulatedBlePlatform::SimulatedBlePlatform(SimulationConfig config, ClassifierConfig classifier)
    : m_config(config),
    m_scanner(std::move(config)),
    m_pairing_probe(std::move(classifier)) {
    AddLog("BLE platform: simulated (" + std::to_string(m_config.devices.size()) + " device(s))");
}

std::shared_ptr<IDeviceControl> SimulatedBlePlatform::CreateDeviceControl(const Advertisement& adv, const DeviceModelInfo& info) {
    if (auto secret = m_pairing_probe.ExtractPairingSecret(adv)) {
        AddLog("Simulated platform: " + adv.address + " is in pairing mode (advertised secret " + *secret + ")");
    }

    DeviceState initial;
    for (const auto& device : m_config.devices) {
        if (device.address == ToUpper(adv.address)) {
            initial = device.initial_state;
            break;
        }
    }
    return std::make_shared<SimulatedDeviceControl>(adv.address, info, initial,
        m_config.command_latency, m_config.notification_burst);
}

IBlePlatform::Ptr CreatePlatform(const HubConfig& config) {
    if (config.platform == "simulated") {
        return std::make_shared<SimulatedBlePlatform>(config.simulation, config.classifier);
    }
    throw ConfigError("Unknown platform: " + config.platform);
}
