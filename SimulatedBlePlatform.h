// SimulatedBlePlatform.h
#pragma once

// Radio-less IBlePlatform: the configured devices advertise on a background thread and
// answer commands from in-memory state after a fixed latency.

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "AdvertisementClassifier.h"
#include "BlePlatform.h"
#include "ConfigManager.h"

// --- SimulatedScanner ---
class SimulatedScanner : public IBleScanner {
public:
    explicit SimulatedScanner(SimulationConfig config);
    ~SimulatedScanner() override;

    bool StartScan(AdvertisementCallback on_advertisement) override;
    void StopScan() override;

    bool IsScanning() const { return m_scanning; }

private:
    void RunScan(AdvertisementCallback on_advertisement);

    SimulationConfig m_config;
    std::thread m_scan_thread;
    std::atomic<bool> m_scanning{ false };
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

// --- SimulatedDeviceControl ---
class SimulatedDeviceControl : public IDeviceControl {
public:
    SimulatedDeviceControl(std::string address, DeviceModelInfo info, DeviceState initial_state,
        std::chrono::milliseconds latency, int notification_burst);

    void Connect() override;
    void Disconnect() override;
    CommandResult ExecuteCommand(const DeviceCommand& cmd) override;
    DeviceState ReadState(bool use_cached) override;
    ConnectionStatus GetConnectionStatus() const override { return m_status; }

    SubscriptionId SubscribeToStateChange(StateCallback callback) override;
    void Unsubscribe(SubscriptionId id) override;

    const DeviceModelInfo& ModelInfo() const { return m_info; }

private:
    void NotifyBurst(const DeviceState& from, const DeviceState& to);
    void Notify(const DeviceState& state);

    std::string m_address;
    DeviceModelInfo m_info;
    std::chrono::milliseconds m_latency;
    int m_notification_burst;

    std::atomic<ConnectionStatus> m_status{ ConnectionStatus::DISCONNECTED };
    std::mutex m_state_mutex;
    DeviceState m_state;

    std::mutex m_subscribers_mutex;
    std::map<SubscriptionId, StateCallback> m_subscribers;
    SubscriptionId m_next_subscription = 1;
};

// --- SimulatedBlePlatform ---
class SimulatedBlePlatform : public IBlePlatform {
public:
    // classifier is only used to report devices that advertise in pairing mode.
    SimulatedBlePlatform(SimulationConfig config, ClassifierConfig classifier = ClassifierConfig());

    IBleScanner& Scanner() override { return m_scanner; }
    std::shared_ptr<IDeviceControl> CreateDeviceControl(const Advertisement& adv, const DeviceModelInfo& info) override;
    std::string GetName() const override { return "simulated"; }

private:
    SimulationConfig m_config;
    SimulatedScanner m_scanner;
    FirmwareFlagClassifier m_pairing_probe;
};

// Builds the platform named in the config. Throws ConfigError for unknown names.
IBlePlatform::Ptr CreatePlatform(const HubConfig& config);
