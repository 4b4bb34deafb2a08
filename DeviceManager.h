// DeviceManager.h
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>

#include "BlePlatform.h"
#include "DeviceRegistry.h"
#include "DiscoveryScanner.h"
#include "EventBroadcaster.h"
#include "OperationSerializer.h"
#include "RescanSupervisor.h"

struct ManagerTiming {
    std::chrono::milliseconds initial_scan_timeout{ 12000 };
    std::chrono::milliseconds rescan_interval = RescanSupervisor::kDefaultInterval;
    std::chrono::milliseconds rescan_timeout = RescanSupervisor::kDefaultScanTimeout;
    std::chrono::milliseconds debounce = DeviceSession::kDefaultDebounce;
};

// Set by the caller to abandon a queued command before it reaches the radio.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

// --- DeviceManager ---
// Owns the fleet: registry, discovery, rescans, the radio gate and the event fan-out.
// Every method runs on the core strand; callbacks are invoked on it too.
class DeviceManager {
public:
    // error is nullptr on success; result is meaningful whenever the device answered.
    using CommandCallback = std::function<void(std::exception_ptr error, const CommandResult& result)>;

    DeviceManager(boost::asio::io_context& io_ctx,
        CoreStrand strand,
        IBlePlatform& platform,
        const IAdvertisementClassifier& classifier,
        ManagerTiming timing = ManagerTiming());
    ~DeviceManager();

    // --- Registration (startup only) ---
    std::shared_ptr<DeviceSession> AddDevice(const DeviceIdentity& identity);

    // --- Lifecycle ---
    // Initial discovery over every identity, then the rescan loop. on_ready fires once the
    // initial scan has been applied.
    void Start(std::function<void()> on_ready = nullptr);
    void Stop();
    bool IsRunning() const { return m_running; }

    // --- Accessors ---
    std::vector<std::string> GetDeviceNames() const;
    DeviceSnapshot GetState(const std::string& device_name) const; // Throws GatewayError(UnknownDevice)
    std::shared_ptr<DeviceSession> GetDevice(const std::string& device_name) const;

    // --- Commands ---
    void ExecuteCommand(const std::string& device_name, const DeviceCommand& cmd, CommandCallback done,
        CancelFlag cancelled = nullptr);

    // Range checks. Throws GatewayError(ValidationError).
    static void ValidateCommand(const DeviceCommand& cmd);

    EventBroadcaster& Events() { return m_broadcaster; }
    OperationSerializer& Serializer() { return m_serializer; }
    DeviceRegistry& Registry() { return m_registry; }
    RescanSupervisor& Supervisor() { return m_supervisor; }

private:
    void RunCommand(const std::shared_ptr<DeviceSession>& session, const DeviceCommand& cmd,
        CommandCallback done, CancelFlag cancelled, OperationSerializer::Release release);
    void Fail(const CommandCallback& done, std::exception_ptr error);

    boost::asio::io_context& m_io_context;
    CoreStrand m_strand;
    IBlePlatform& m_platform;
    const IAdvertisementClassifier& m_classifier;
    ManagerTiming m_timing;

    OperationSerializer m_serializer;
    EventBroadcaster m_broadcaster;
    DeviceRegistry m_registry;
    DiscoveryScanner m_scanner;
    RescanSupervisor m_supervisor;

    bool m_running = false;
};
