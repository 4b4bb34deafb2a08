// AdvertisementClassifier.h
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "BlePlatform.h"

// Company id the appliances advertise under.
constexpr uint16_t kPreferredCompanyId = 0xFFFF;

struct ClassifierConfig {
    size_t advertisement_length = 9;
    uint8_t pairing_flags = 0;
    std::map<uint8_t, std::string> firmware_by_flags;
    std::set<std::string> original_firmware;    // "snooz*" names on these firmwares are ORIGINAL
    std::set<std::string> unnamed_pro_firmware; // Unrecognised names are PRO only on these firmwares
};

// Returns the payload under kPreferredCompanyId, else the first entry.
std::optional<std::vector<uint8_t>> SelectManufacturerPayload(const Advertisement& adv);

// --- FirmwareFlagClassifier ---
// Table-driven: byte 0 of the payload carries firmware flags, the advertised name picks
// the model family.
class FirmwareFlagClassifier : public IAdvertisementClassifier {
public:
    explicit FirmwareFlagClassifier(ClassifierConfig config);

    std::optional<DeviceModelInfo> Classify(const Advertisement& adv, const std::string& secret) const override;

    // Firmware name for the flags byte with the pairing bits removed.
    std::optional<std::string> FirmwareForFlags(uint8_t flags) const;
    bool IsPairing(uint8_t flags) const;

    // Hex of the bytes after the flags when the device advertises in pairing mode.
    std::optional<std::string> ExtractPairingSecret(const Advertisement& adv) const;

private:
    ClassifierConfig m_config;
};
