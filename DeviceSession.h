// DeviceSession.h
#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>

#include "BlePlatform.h"
#include "OperationSerializer.h"

// Result of a successful discovery match.
struct DeviceBinding {
    std::shared_ptr<IDeviceControl> control;
    Advertisement advertisement;
    DeviceModelInfo model_info;
    std::string display_name;
};

// --- DeviceSession ---
// One configured identity: its binding (once discovered), the cached device state and the
// debounce timer that coalesces bursts of raw notifications into one event.
// Everything except the constructor runs on the core strand.
class DeviceSession : public std::enable_shared_from_this<DeviceSession> {
public:
    enum class BindState { UNBOUND, BINDING, BOUND };

    using EventSink = std::function<void(const DeviceEvent&)>;
    // Receives nullptr on success.
    using StartCallback = std::function<void(std::exception_ptr)>;

    static constexpr std::chrono::milliseconds kDefaultDebounce{ 250 };

    DeviceSession(DeviceIdentity identity,
        boost::asio::io_context& io_ctx,
        CoreStrand strand,
        OperationSerializer& serializer,
        std::chrono::milliseconds debounce = kDefaultDebounce);
    ~DeviceSession();

    const std::string& Name() const { return m_identity.name; }
    const DeviceIdentity& Identity() const { return m_identity; }

    // Returns false when the advertisement is not a supported model/firmware pair, or
    // when the session is already bound.
    bool Bind(const Advertisement& adv, const IAdvertisementClassifier& classifier, IBlePlatform& platform);

    // Connects and performs one forced state read. Throws GatewayError(NotBound) when
    // called before a successful Bind. Failures are logged and reported to done; nothing
    // is retried.
    void Start(StartCallback done);

    // Forced read; fires the debounced event path only if the state changed.
    // No-op when not connected.
    void RefreshState(std::function<void()> done = nullptr);

    // Never blocks, never touches the radio.
    DeviceSnapshot Snapshot() const;

    // Cancels the debounce timer, unsubscribes and queues a disconnect on the radio gate.
    // Idempotent.
    void Stop();

    // Entry point for raw notifications; restarts the debounce delay.
    void OnRawStateChange(const DeviceState& state);

    void AddEventListener(EventSink sink);

    BindState GetBindState() const { return m_bind_state; }
    bool IsBound() const { return m_bind_state == BindState::BOUND; }
    bool IsConnected() const;
    bool IsStarted() const { return m_started; }
    std::shared_ptr<IDeviceControl> Control() const;
    uint64_t EmittedEventCount() const { return m_emitted_events; }

private:
    void ApplyReadState(const DeviceState& state);
    void RestartDebounce();
    void EmitEvent();

    DeviceIdentity m_identity;
    boost::asio::io_context& m_io_context;
    CoreStrand m_strand;
    OperationSerializer& m_serializer;
    std::chrono::milliseconds m_debounce;

    BindState m_bind_state = BindState::UNBOUND;
    std::optional<DeviceBinding> m_binding;
    std::string m_resolved_address;
    std::optional<IDeviceControl::SubscriptionId> m_subscription;
    DeviceState m_state;
    bool m_started = false;
    bool m_stopped = false;

    std::unique_ptr<boost::asio::steady_timer> m_debounce_timer;
    uint64_t m_debounce_generation = 0;
    uint64_t m_emitted_events = 0;
    std::vector<EventSink> m_event_sinks;
};
