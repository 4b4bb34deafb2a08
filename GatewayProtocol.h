// GatewayProtocol.h
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "DeviceManager.h"
#include "PendingRequests.h"

enum class AuthResult {
    ACCEPTED,
    UNAUTHORIZED, // Missing or non-bearer Authorization header
    FORBIDDEN     // Bearer token does not match
};

// --- GatewayProtocol ---
// Transport-independent half of the WebSocket gateway: parses client frames, dispatches
// them to one command handler each and produces exactly one correlated response per frame.
// A failing frame never affects the connection or other requests.
//
// Client:   {"type":"command","request_id":...,"command":"...","device_name":"...", args}
// Response: {"type":"response","request_id":...,"status":"ok"|"error","data"|"error":...}
// Event:    {"type":"event","event":"device_state","device_name":"...","state":{...}}
class GatewayProtocol {
public:
    // Called on the core strand; the transport hands the frame to the socket.
    using ReplyFn = std::function<void(const std::string& frame)>;

    GatewayProtocol(DeviceManager& manager, CoreStrand strand);

    // --- Transport Entry Points (any thread) ---
    void HandleFrame(uint64_t connection_id, std::string frame, ReplyFn reply);
    void OnConnectionClosed(uint64_t connection_id);

    // Core strand only.
    void ProcessFrame(uint64_t connection_id, const std::string& frame, const ReplyFn& reply);
    size_t PendingCount() const { return m_pending.Count(); }
    size_t PendingCountFor(uint64_t connection_id) const { return m_pending.CountFor(connection_id); }

    // --- Frame Builders ---
    static std::string BuildOk(const nlohmann::json& request_id, const nlohmann::json& data);
    static std::string BuildError(const nlohmann::json& request_id, const std::string& error);
    static std::string BuildEventFrame(const DeviceEvent& event);

    // token is the configured bearer token; empty disables authentication.
    static AuthResult CheckAuthorization(const std::string& token, std::string_view authorization_header);

private:
    struct Request {
        uint64_t connection_id;
        nlohmann::json request_id;
        std::string command;
        const nlohmann::json& msg;
        const ReplyFn& reply;
    };

    using Handler = void (GatewayProtocol::*)(const Request&);

    void HandleHeartbeat(const Request& req);
    void HandleListDevices(const Request& req);
    void HandleGetState(const Request& req);
    void HandleNoiseOn(const Request& req);
    void HandleNoiseOff(const Request& req);
    void HandleSetVolume(const Request& req);
    void HandleLightOn(const Request& req);
    void HandleLightOff(const Request& req);
    void HandleSetLightBrightness(const Request& req);

    // Runs cmd through the manager and answers once the device is done.
    // device_name is checked before any argument.
    void SubmitCommand(const Request& req, const std::string& device_name, const DeviceCommand& cmd);

    // --- Argument Helpers (throw GatewayError(ValidationError)) ---
    static std::string RequireDeviceName(const nlohmann::json& msg);
    static std::optional<int> OptionalInt(const nlohmann::json& msg, const char* field);
    static int RequireInt(const nlohmann::json& msg, const char* field);
    static std::optional<double> OptionalDuration(const nlohmann::json& msg, const char* field);

    DeviceManager& m_manager;
    CoreStrand m_strand;
    PendingRequestTable m_pending;
    std::map<std::string, Handler> m_handlers;
};
