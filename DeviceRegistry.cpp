#include "DeviceRegistry.h"

#include "GatewayErrors.h"
#include "Log.h"

DeviceRegistry::DeviceRegistry(boost::asio::io_context& io_ctx,
    CoreStrand strand,
    OperationSerializer& serializer,
    EventBroadcaster& broadcaster,
    std::chrono::milliseconds debounce)
    : m_io_context(io_ctx),
    m_strand(std::move(strand)),
    m_serializer(serializer),
    m_broadcaster(broadcaster),
    m_debounce(debounce) {
}

std::shared_ptr<DeviceSession> DeviceRegistry::Register(const DeviceIdentity& identity) {
    if (identity.name.empty()) {
        throw GatewayError(ErrorCode::ValidationError, "device_name is required");
    }
    if (identity.address.empty() && identity.match_name.empty()) {
        throw GatewayError(ErrorCode::ValidationError,
            "Device '" + identity.name + "' must specify either 'address' or 'name'");
    }
    if (m_sessions.count(identity.name)) {
        throw GatewayError(ErrorCode::DuplicateIdentity, "Duplicate device_name: " + identity.name);
    }

    auto session = std::make_shared<DeviceSession>(identity, m_io_context, m_strand, m_serializer, m_debounce);
    EventBroadcaster* broadcaster = &m_broadcaster;
    session->AddEventListener([broadcaster](const DeviceEvent& event) {
        broadcaster->Publish(event);
    });

    m_sessions[identity.name] = session;
    m_ordered.push_back(session);
    AddLog("Registry: Added device " + identity.name);
    return session;
}

std::shared_ptr<DeviceSession> DeviceRegistry::Get(const std::string& name) const {
    auto session = Find(name);
    if (!session) {
        throw GatewayError(ErrorCode::UnknownDevice, "unknown_device: " + name);
    }
    return session;
}

std::shared_ptr<DeviceSession> DeviceRegistry::Find(const std::string& name) const {
    auto it = m_sessions.find(name);
    return (it == m_sessions.end()) ? nullptr : it->second;
}

std::vector<std::string> DeviceRegistry::ListNames() const {
    std::vector<std::string> names;
    names.reserve(m_ordered.size());
    for (const auto& session : m_ordered) {
        names.push_back(session->Name());
    }
    return names;
}

std::vector<DeviceIdentity> DeviceRegistry::UnboundIdentities() const {
    std::vector<DeviceIdentity> unbound;
    for (const auto& session : m_ordered) {
        if (session->GetBindState() == DeviceSession::BindState::UNBOUND) {
            unbound.push_back(session->Identity());
        }
    }
    return unbound;
}
