#include "AdvertisementClassifier.h"

#include <iomanip>
#include <sstream>

#include "StringUtils.h"

std::optional<std::vector<uint8_t>> SelectManufacturerPayload(const Advertisement& adv) {
    if (adv.manufacturer_data.empty()) return std::nullopt;
    auto it = adv.manufacturer_data.find(kPreferredCompanyId);
    if (it != adv.manufacturer_data.end()) return it->second;
    return adv.manufacturer_data.begin()->second;
}

FirmwareFlagClassifier::FirmwareFlagClassifier(ClassifierConfig config)
    : m_config(std::move(config)) {
}

bool FirmwareFlagClassifier::IsPairing(uint8_t flags) const {
    return m_config.pairing_flags != 0 && (flags & m_config.pairing_flags) == m_config.pairing_flags;
}

std::optional<std::string> FirmwareFlagClassifier::FirmwareForFlags(uint8_t flags) const {
    uint8_t without_pairing = static_cast<uint8_t>(flags & ~m_config.pairing_flags);
    auto it = m_config.firmware_by_flags.find(without_pairing);
    if (it == m_config.firmware_by_flags.end()) return std::nullopt;
    return it->second;
}

std::optional<DeviceModelInfo> FirmwareFlagClassifier::Classify(const Advertisement& adv, const std::string& secret) const {
    auto payload = SelectManufacturerPayload(adv);
    if (!payload || payload->size() != m_config.advertisement_length) return std::nullopt;

    auto firmware = FirmwareForFlags((*payload)[0]);
    if (!firmware) return std::nullopt;

    std::string model;
    const std::string lower = ToLower(adv.name);
    if (StartsWith(lower, "breez")) {
        model = "BREEZ";
    }
    else if (StartsWith(lower, "snooz")) {
        model = m_config.original_firmware.count(*firmware) ? "ORIGINAL" : "PRO";
    }
    else if (m_config.unnamed_pro_firmware.count(*firmware)) {
        model = "PRO";
    }
    else {
        return std::nullopt;
    }

    return DeviceModelInfo{ model, *firmware, secret };
}

std::optional<std::string> FirmwareFlagClassifier::ExtractPairingSecret(const Advertisement& adv) const {
    auto payload = SelectManufacturerPayload(adv);
    if (!payload || payload->size() != m_config.advertisement_length) return std::nullopt;
    if (!IsPairing((*payload)[0])) return std::nullopt;

    std::ostringstream ss;
    for (size_t i = 1; i < payload->size(); ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>((*payload)[i]);
    }
    return ss.str();
}
