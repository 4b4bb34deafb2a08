// DiscoveryScanner.h
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>

#include "BlePlatform.h"
#include "OperationSerializer.h"

// Target name -> the advertisement it was matched on.
using ScanResults = std::map<std::string, Advertisement>;

// --- TargetMatcher ---
// Identities with an address match on address only (case-insensitive). Identities without
// one match on the advertised name (case-insensitive, trimmed).
class TargetMatcher {
public:
    explicit TargetMatcher(const std::vector<DeviceIdentity>& targets);

    std::optional<std::string> Match(const Advertisement& adv) const;
    size_t TargetCount() const { return m_target_count; }

private:
    std::map<std::string, std::string> m_by_address;
    std::map<std::string, std::string> m_by_name;
    size_t m_target_count = 0;
};

// --- DiscoveryScanner ---
// One bounded scan at a time. Completes as soon as every target is matched, or when the
// timeout elapses, whichever comes first. Unmatched targets are simply absent from the
// results. All methods run on the core strand.
class DiscoveryScanner {
public:
    using ResultCallback = std::function<void(const ScanResults&)>;

    DiscoveryScanner(IBleScanner& scanner, CoreStrand strand);
    ~DiscoveryScanner();

    // Returns false if a scan is already running.
    bool Scan(const std::vector<DeviceIdentity>& targets, std::chrono::milliseconds timeout, ResultCallback on_complete);

    // Stops the running scan without invoking its callback.
    void Cancel();

    bool IsScanning() const { return m_scanning; }

private:
    void OnAdvertisement(uint64_t generation, const Advertisement& adv);
    void Finish(uint64_t generation);
    void StopRadio();

    IBleScanner& m_scanner;
    CoreStrand m_strand;
    boost::asio::steady_timer m_timeout_timer;

    bool m_scanning = false;
    bool m_radio_active = false;
    uint64_t m_generation = 0;
    std::optional<TargetMatcher> m_matcher;
    ScanResults m_found;
    ResultCallback m_on_complete;
};
