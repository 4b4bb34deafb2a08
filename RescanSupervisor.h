// RescanSupervisor.h
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <boost/asio.hpp>

#include "BlePlatform.h"
#include "DeviceRegistry.h"
#include "DiscoveryScanner.h"

// --- RescanSupervisor ---
// Every interval, scans for the identities that are still unbound and binds + starts
// whatever turns up. Bound sessions are never rescanned, even when their start failed.
class RescanSupervisor {
public:
    static constexpr std::chrono::milliseconds kDefaultInterval{ 30000 };
    static constexpr std::chrono::milliseconds kDefaultScanTimeout{ 8000 };

    RescanSupervisor(DeviceRegistry& registry,
        DiscoveryScanner& scanner,
        const IAdvertisementClassifier& classifier,
        IBlePlatform& platform,
        CoreStrand strand,
        std::chrono::milliseconds interval = kDefaultInterval,
        std::chrono::milliseconds scan_timeout = kDefaultScanTimeout);

    // Core strand only.
    void Start();
    void Stop();

    // Binds and starts each match that is still unbound. context is used for logging.
    void BindAndStart(const ScanResults& results, const std::string& context);

    bool IsRunning() const { return m_running; }
    uint64_t TickCount() const { return m_ticks; }

private:
    void ScheduleTick();
    void OnTick(const boost::system::error_code& ec);

    DeviceRegistry& m_registry;
    DiscoveryScanner& m_scanner;
    const IAdvertisementClassifier& m_classifier;
    IBlePlatform& m_platform;
    CoreStrand m_strand;
    boost::asio::steady_timer m_timer;
    std::chrono::milliseconds m_interval;
    std::chrono::milliseconds m_scan_timeout;

    bool m_running = false;
    uint64_t m_ticks = 0;
};
