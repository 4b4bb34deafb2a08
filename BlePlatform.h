// BlePlatform.h
#pragma once

// Seams to the external BLE stack. Implementations wrap the radio library; the core
// never talks to the radio except through these interfaces.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "BleTypes.h"

// --- IBleScanner ---
// The advertisement callback may fire on any thread.
class IBleScanner {
public:
    using AdvertisementCallback = std::function<void(const Advertisement&)>;

    virtual ~IBleScanner() = default;

    virtual bool StartScan(AdvertisementCallback on_advertisement) = 0;
    virtual void StopScan() = 0;
};

// --- IDeviceControl ---
// Control session for one bound device. Connect, Disconnect, ExecuteCommand and
// ReadState may block on radio I/O and throw std::exception on failure.
// GetConnectionStatus never blocks.
class IDeviceControl {
public:
    using StateCallback = std::function<void(const DeviceState&)>;
    using SubscriptionId = uint64_t;

    virtual ~IDeviceControl() = default;

    virtual void Connect() = 0;
    virtual void Disconnect() = 0;
    virtual CommandResult ExecuteCommand(const DeviceCommand& cmd) = 0;
    virtual DeviceState ReadState(bool use_cached) = 0;
    virtual ConnectionStatus GetConnectionStatus() const = 0;

    virtual SubscriptionId SubscribeToStateChange(StateCallback callback) = 0;
    virtual void Unsubscribe(SubscriptionId id) = 0;
};

// --- IAdvertisementClassifier ---
// Infers model and firmware from the advertisement payload. std::nullopt means the
// device is not a supported model/firmware pair.
class IAdvertisementClassifier {
public:
    virtual ~IAdvertisementClassifier() = default;

    virtual std::optional<DeviceModelInfo> Classify(const Advertisement& adv, const std::string& secret) const = 0;
};

// --- IBlePlatform ---
class IBlePlatform {
public:
    using Ptr = std::shared_ptr<IBlePlatform>;

    virtual ~IBlePlatform() = default;

    virtual IBleScanner& Scanner() = 0;
    virtual std::shared_ptr<IDeviceControl> CreateDeviceControl(const Advertisement& adv, const DeviceModelInfo& info) = 0;
    virtual std::string GetName() const = 0;
};
