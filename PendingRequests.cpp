#include "PendingRequests.h"

PendingRequestTable::Token PendingRequestTable::Create(uint64_t connection_id, const nlohmann::json& request_id, const std::string& command) {
    Token token = m_next_token++;
    m_pending[token] = PendingRequest{ connection_id, request_id, command, std::make_shared<std::atomic<bool>>(false) };
    return token;
}

std::optional<PendingRequestTable::PendingRequest> PendingRequestTable::Resolve(Token token) {
    auto it = m_pending.find(token);
    if (it == m_pending.end()) return std::nullopt;
    PendingRequest request = std::move(it->second);
    m_pending.erase(it);
    if (request.cancelled->load()) return std::nullopt;
    return request;
}

size_t PendingRequestTable::CancelConnection(uint64_t connection_id) {
    size_t dropped = 0;
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->second.connection_id == connection_id) {
            it->second.cancelled->store(true);
            it = m_pending.erase(it);
            ++dropped;
        }
        else {
            ++it;
        }
    }
    return dropped;
}

std::shared_ptr<std::atomic<bool>> PendingRequestTable::CancelFlagFor(Token token) const {
    auto it = m_pending.find(token);
    return (it == m_pending.end()) ? nullptr : it->second.cancelled;
}

size_t PendingRequestTable::CountFor(uint64_t connection_id) const {
    size_t count = 0;
    for (const auto& [token, request] : m_pending) {
        if (request.connection_id == connection_id) ++count;
    }
    return count;
}
