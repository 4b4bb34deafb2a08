#include "DiscoveryScanner.h"

#include "Log.h"
#include "StringUtils.h"

// --- TargetMatcher ---

// The first identity registered under a key keeps it; a duplicate can never be matched,
// so only distinct keys count towards an early finish.
TargetMatcher::TargetMatcher(const std::vector<DeviceIdentity>& targets) {
    for (const auto& target : targets) {
        if (!target.address.empty()) {
            m_by_address.emplace(ToUpper(target.address), target.name);
        }
        else if (!Trim(target.match_name).empty()) {
            m_by_name.emplace(ToLower(Trim(target.match_name)), target.name);
        }
    }
    m_target_count = m_by_address.size() + m_by_name.size();
}

std::optional<std::string> TargetMatcher::Match(const Advertisement& adv) const {
    const std::string address = ToUpper(adv.address);
    if (!address.empty()) {
        auto it = m_by_address.find(address);
        if (it != m_by_address.end()) return it->second;
    }
    const std::string name = ToLower(Trim(adv.name));
    if (!name.empty()) {
        auto it = m_by_name.find(name);
        if (it != m_by_name.end()) return it->second;
    }
    return std::nullopt;
}

// --- DiscoveryScanner ---

DiscoveryScanner::DiscoveryScanner(IBleScanner& scanner, CoreStrand strand)
    : m_scanner(scanner),
    m_strand(strand),
    m_timeout_timer(strand) {
}

DiscoveryScanner::~DiscoveryScanner() {
    StopRadio();
}

bool DiscoveryScanner::Scan(const std::vector<DeviceIdentity>& targets, std::chrono::milliseconds timeout, ResultCallback on_complete) {
    if (m_scanning) {
        AddLog("Discovery: scan requested while another scan is running");
        return false;
    }

    const uint64_t generation = ++m_generation;
    m_scanning = true;
    m_matcher.emplace(targets);
    m_found.clear();
    m_on_complete = std::move(on_complete);

    if (targets.empty()) {
        boost::asio::post(m_strand, [this, generation]() { Finish(generation); });
        return true;
    }

    m_timeout_timer.expires_after(timeout);
    m_timeout_timer.async_wait(boost::asio::bind_executor(m_strand,
        [this, generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            Finish(generation);
        }));

    m_radio_active = m_scanner.StartScan([this, generation](const Advertisement& adv) {
        boost::asio::post(m_strand, [this, generation, adv]() { OnAdvertisement(generation, adv); });
    });
    if (!m_radio_active) {
        AddLog("Discovery: failed to start the radio scan");
        m_timeout_timer.cancel();
        boost::asio::post(m_strand, [this, generation]() { Finish(generation); });
    }
    return true;
}

void DiscoveryScanner::Cancel() {
    if (!m_scanning) return;
    ++m_generation;
    m_scanning = false;
    m_timeout_timer.cancel();
    StopRadio();
    m_on_complete = nullptr;
    m_found.clear();
    AddLog("Discovery: scan cancelled");
}

void DiscoveryScanner::OnAdvertisement(uint64_t generation, const Advertisement& adv) {
    if (!m_scanning || generation != m_generation) return;

    auto matched = m_matcher->Match(adv);
    if (!matched || m_found.count(*matched)) return;

    m_found[*matched] = adv;
    if (g_log_show_ingress) AddLog("[" + *matched + "] Discovered at " + adv.address + " (" + adv.name + ")", LogType::INGRESS);

    if (m_found.size() == m_matcher->TargetCount()) {
        Finish(generation);
    }
}

void DiscoveryScanner::Finish(uint64_t generation) {
    if (!m_scanning || generation != m_generation) return;
    m_scanning = false;
    m_timeout_timer.cancel();
    StopRadio();

    ResultCallback callback = std::move(m_on_complete);
    m_on_complete = nullptr;
    ScanResults results = std::move(m_found);
    m_found.clear();
    if (callback) callback(results);
}

void DiscoveryScanner::StopRadio() {
    if (!m_radio_active) return;
    m_radio_active = false;
    m_scanner.StopScan();
}
