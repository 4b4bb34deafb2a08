// DeviceRegistry.h
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>

#include "DeviceSession.h"
#include "EventBroadcaster.h"
#include "OperationSerializer.h"

// --- DeviceRegistry ---
// Owns every DeviceSession. Filled during startup, read-only afterwards.
class DeviceRegistry {
public:
    DeviceRegistry(boost::asio::io_context& io_ctx,
        CoreStrand strand,
        OperationSerializer& serializer,
        EventBroadcaster& broadcaster,
        std::chrono::milliseconds debounce = DeviceSession::kDefaultDebounce);

    // Throws GatewayError(DuplicateIdentity) for a name already present and
    // GatewayError(ValidationError) for an identity without address or match name.
    std::shared_ptr<DeviceSession> Register(const DeviceIdentity& identity);

    // Throws GatewayError(UnknownDevice).
    std::shared_ptr<DeviceSession> Get(const std::string& name) const;
    std::shared_ptr<DeviceSession> Find(const std::string& name) const;

    // Registration order.
    std::vector<std::string> ListNames() const;
    const std::vector<std::shared_ptr<DeviceSession>>& Sessions() const { return m_ordered; }
    std::vector<DeviceIdentity> UnboundIdentities() const;

    size_t Size() const { return m_ordered.size(); }

private:
    boost::asio::io_context& m_io_context;
    CoreStrand m_strand;
    OperationSerializer& m_serializer;
    EventBroadcaster& m_broadcaster;
    std::chrono::milliseconds m_debounce;

    std::map<std::string, std::shared_ptr<DeviceSession>> m_sessions;
    std::vector<std::shared_ptr<DeviceSession>> m_ordered;
};
