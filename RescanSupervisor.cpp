#include "RescanSupervisor.h"

#include "GatewayErrors.h"
#include "Log.h"

RescanSupervisor::RescanSupervisor(DeviceRegistry& registry,
    DiscoveryScanner& scanner,
    const IAdvertisementClassifier& classifier,
    IBlePlatform& platform,
    CoreStrand strand,
    std::chrono::milliseconds interval,
    std::chrono::milliseconds scan_timeout)
    : m_registry(registry),
    m_scanner(scanner),
    m_classifier(classifier),
    m_platform(platform),
    m_strand(strand),
    m_timer(strand),
    m_interval(interval),
    m_scan_timeout(scan_timeout) {
}

void RescanSupervisor::Start() {
    if (m_running) return;
    m_running = true;
    ScheduleTick();
}

void RescanSupervisor::Stop() {
    if (!m_running) return;
    m_running = false;
    m_timer.cancel();
    m_scanner.Cancel();
}

void RescanSupervisor::ScheduleTick() {
    if (!m_running) return;
    m_timer.expires_after(m_interval);
    m_timer.async_wait(boost::asio::bind_executor(m_strand,
        std::bind(&RescanSupervisor::OnTick, this, std::placeholders::_1)));
}

void RescanSupervisor::OnTick(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !m_running) return;
    ++m_ticks;

    try {
        std::vector<DeviceIdentity> missing = m_registry.UnboundIdentities();
        if (missing.empty()) {
            ScheduleTick();
            return;
        }

        std::string names;
        for (const auto& identity : missing) {
            names += (names.empty() ? "" : ", ") + identity.name;
        }
        AddLog("Rescanning for missing devices: [" + names + "]");

        bool started = m_scanner.Scan(missing, m_scan_timeout, [this](const ScanResults& results) {
            if (!m_running) return;
            BindAndStart(results, "rescan");
            ScheduleTick();
        });
        if (!started) ScheduleTick();
    }
    catch (const std::exception& e) {
        AddLog("Rescan loop error: " + std::string(e.what()));
        ScheduleTick();
    }
}

void RescanSupervisor::BindAndStart(const ScanResults& results, const std::string& context) {
    for (const auto& [name, adv] : results) {
        auto session = m_registry.Find(name);
        // A concurrent bind may have won the race.
        if (!session || session->GetBindState() != DeviceSession::BindState::UNBOUND) continue;
        if (!session->Bind(adv, m_classifier, m_platform)) continue;

        try {
            session->Start([name, context](std::exception_ptr error) {
                if (error) {
                    AddLog("[" + name + "] Start/connect failed after " + context + ": " + DescribeException(error));
                }
            });
        }
        catch (const GatewayError& e) {
            AddLog("[" + name + "] Start rejected after " + context + ": " + std::string(e.what()));
        }
    }
}
