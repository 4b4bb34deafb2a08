// PendingRequests.h
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// --- PendingRequestTable ---
// Correlation slots for commands still in flight, keyed by an internal token (client
// request ids may be null or repeated). A slot belongs to the connection that created it:
// closing the connection cancels its slots and nobody else's. Core strand only.
class PendingRequestTable {
public:
    using Token = uint64_t;

    struct PendingRequest {
        uint64_t connection_id = 0;
        nlohmann::json request_id;
        std::string command;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    Token Create(uint64_t connection_id, const nlohmann::json& request_id, const std::string& command);

    // Removes and returns the slot; std::nullopt if it was cancelled or never existed.
    std::optional<PendingRequest> Resolve(Token token);

    // Flags and drops every slot owned by the connection. Returns how many were dropped.
    size_t CancelConnection(uint64_t connection_id);

    std::shared_ptr<std::atomic<bool>> CancelFlagFor(Token token) const;

    size_t Count() const { return m_pending.size(); }
    size_t CountFor(uint64_t connection_id) const;

private:
    std::map<Token, PendingRequest> m_pending;
    Token m_next_token = 1;
};
