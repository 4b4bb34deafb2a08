// GatewayHub.h
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// --- Boost.Asio ---
#include <boost/asio.hpp>

#include "AdvertisementClassifier.h"
#include "BlePlatform.h"
#include "ConfigManager.h"
#include "DeviceManager.h"
#include "GatewayProtocol.h"
#include "Log.h"
#include "WsGateway.h"

extern unsigned int s_hardware_cores;

// --- GatewayHub ---
// Composition root. Owns the Asio io_context and its worker pool, the core strand, the BLE
// platform, the device manager and the WebSocket gateway.
class GatewayHub {
private:
    // --- Member Variables ---
    HubConfig m_config;
    std::atomic<bool> m_running;

    // Asio Thread Pool
    boost::asio::io_context m_io_context;
    std::vector<std::thread> m_thread_pool;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work_guard;
    CoreStrand m_strand;

    IBlePlatform::Ptr m_platform;
    FirmwareFlagClassifier m_classifier;
    std::unique_ptr<DeviceManager> m_manager;
    std::unique_ptr<GatewayProtocol> m_protocol;
    std::unique_ptr<WsGateway> m_gateway;

    // --- Private Method Declarations ---
    void StartWorkerPool();
    void JoinWorkerPool();
    void StartCore();

public:
    // --- Constructor & Destructor ---
    // platform defaults to the one named in the config.
    explicit GatewayHub(HubConfig config, IBlePlatform::Ptr platform = nullptr);
    ~GatewayHub();

    // --- Public Method Declarations ---
    // Blocks until initial discovery is done and the gateway listens. Throws on failure.
    void Start();
    // Stops the gateway, then the core, then drains the worker pool.
    void Stop();

    std::vector<std::string> GetDeviceNames();
    int GetWorkerCount() const;

    // Simple getters are left inline
    bool IsRunning() const {
        return m_running;
    }
    void GetLogs(std::vector<std::string>& logs) const {
        ::GetLogs(logs);
    }
    const HubConfig& Config() const {
        return m_config;
    }
};
