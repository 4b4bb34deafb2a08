#include "GatewayProtocol.h"

#include <chrono>
#include <cmath>
#include <limits>

#include "GatewayErrors.h"
#include "Log.h"

GatewayProtocol::GatewayProtocol(DeviceManager& manager, CoreStrand strand)
    : m_manager(manager),
    m_strand(strand) {
    m_handlers = {
        {"heartbeat", &GatewayProtocol::HandleHeartbeat},
        {"list_devices", &GatewayProtocol::HandleListDevices},
        {"get_state", &GatewayProtocol::HandleGetState},
        {"noise_on", &GatewayProtocol::HandleNoiseOn},
        {"noise_off", &GatewayProtocol::HandleNoiseOff},
        {"set_volume", &GatewayProtocol::HandleSetVolume},
        {"light_on", &GatewayProtocol::HandleLightOn},
        {"light_off", &GatewayProtocol::HandleLightOff},
        {"set_light_brightness", &GatewayProtocol::HandleSetLightBrightness}
    };
}

// --- Transport Entry Points ---

void GatewayProtocol::HandleFrame(uint64_t connection_id, std::string frame, ReplyFn reply) {
    boost::asio::post(m_strand, [this, connection_id, frame = std::move(frame), reply = std::move(reply)]() {
        ProcessFrame(connection_id, frame, reply);
    });
}

void GatewayProtocol::OnConnectionClosed(uint64_t connection_id) {
    boost::asio::post(m_strand, [this, connection_id]() {
        size_t dropped = m_pending.CancelConnection(connection_id);
        if (dropped > 0) {
            AddLog("Gateway: dropped " + std::to_string(dropped) + " pending request(s) of closed connection #" +
                std::to_string(connection_id));
        }
    });
}

void GatewayProtocol::ProcessFrame(uint64_t connection_id, const std::string& frame, const ReplyFn& reply) {
    nlohmann::json msg = nlohmann::json::parse(frame, nullptr, false);
    if (msg.is_discarded()) {
        reply(BuildError(nullptr, "invalid_json"));
        return;
    }
    if (!msg.is_object()) {
        reply(BuildError(nullptr, "type_must_be_command"));
        return;
    }

    nlohmann::json request_id = msg.contains("request_id") ? msg["request_id"] : nlohmann::json(nullptr);
    if (msg.value("type", nlohmann::json()) != "command") {
        reply(BuildError(request_id, "type_must_be_command"));
        return;
    }

    const nlohmann::json command_value = msg.value("command", nlohmann::json());
    const std::string command = command_value.is_string() ? command_value.get<std::string>() : command_value.dump();
    if (g_log_show_egress) AddLog("Client #" + std::to_string(connection_id) + " command: " + command, LogType::EGRESS);

    try {
        auto it = m_handlers.find(command);
        if (!command_value.is_string() || it == m_handlers.end()) {
            throw GatewayError(ErrorCode::ProtocolError, "unknown_command: " + command);
        }
        Request req{ connection_id, request_id, command, msg, reply };
        (this->*(it->second))(req);
    }
    catch (const GatewayError& e) {
        AddLog("Command '" + command + "' rejected (" + ErrorCodeName(e.Code()) + "): " + std::string(e.what()));
        reply(BuildError(request_id, e.what()));
    }
    catch (const std::exception& e) {
        AddLog("Error handling command '" + command + "': " + std::string(e.what()));
        reply(BuildError(request_id, e.what()));
    }
}

// --- Handlers ---

void GatewayProtocol::HandleHeartbeat(const Request& req) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    double server_time = std::chrono::duration<double>(now).count();
    req.reply(BuildOk(req.request_id, { {"server_time", server_time} }));
}

void GatewayProtocol::HandleListDevices(const Request& req) {
    req.reply(BuildOk(req.request_id, { {"devices", m_manager.GetDeviceNames()} }));
}

void GatewayProtocol::HandleGetState(const Request& req) {
    std::string device_name = RequireDeviceName(req.msg);
    req.reply(BuildOk(req.request_id, SnapshotToJson(m_manager.GetState(device_name))));
}

void GatewayProtocol::HandleNoiseOn(const Request& req) {
    std::string device_name = RequireDeviceName(req.msg);
    SubmitCommand(req, device_name, DeviceCommand::NoiseOn(OptionalInt(req.msg, "volume")));
}

void GatewayProtocol::HandleNoiseOff(const Request& req) {
    std::string device_name = RequireDeviceName(req.msg);
    SubmitCommand(req, device_name, DeviceCommand::NoiseOff(OptionalDuration(req.msg, "duration_s")));
}

void GatewayProtocol::HandleSetVolume(const Request& req) {
    std::string device_name = RequireDeviceName(req.msg);
    SubmitCommand(req, device_name, DeviceCommand::SetVolume(RequireInt(req.msg, "volume")));
}

void GatewayProtocol::HandleLightOn(const Request& req) {
    SubmitCommand(req, RequireDeviceName(req.msg), DeviceCommand::LightOn());
}

void GatewayProtocol::HandleLightOff(const Request& req) {
    SubmitCommand(req, RequireDeviceName(req.msg), DeviceCommand::LightOff());
}

void GatewayProtocol::HandleSetLightBrightness(const Request& req) {
    std::string device_name = RequireDeviceName(req.msg);
    SubmitCommand(req, device_name, DeviceCommand::SetLightBrightness(RequireInt(req.msg, "brightness")));
}

void GatewayProtocol::SubmitCommand(const Request& req, const std::string& device_name, const DeviceCommand& cmd) {
    DeviceManager::ValidateCommand(cmd);

    PendingRequestTable::Token token = m_pending.Create(req.connection_id, req.request_id, req.command);
    ReplyFn reply = req.reply;
    m_manager.ExecuteCommand(device_name, cmd,
        [this, token, reply](std::exception_ptr error, const CommandResult& result) {
            auto pending = m_pending.Resolve(token);
            if (!pending) return; // Connection went away
            if (error) {
                reply(BuildError(pending->request_id, DescribeException(error)));
                return;
            }
            reply(BuildOk(pending->request_id, CommandResultToJson(result)));
        },
        m_pending.CancelFlagFor(token));
}

// --- Argument Helpers ---

std::string GatewayProtocol::RequireDeviceName(const nlohmann::json& msg) {
    auto it = msg.find("device_name");
    if (it == msg.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw GatewayError(ErrorCode::ValidationError, "device_name is required");
    }
    return it->get<std::string>();
}

std::optional<int> GatewayProtocol::OptionalInt(const nlohmann::json& msg, const char* field) {
    auto it = msg.find(field);
    if (it == msg.end() || it->is_null()) return std::nullopt;

    double value = 0.0;
    if (it->is_number_integer() || it->is_number_unsigned()) {
        value = it->get<double>();
    }
    else if (it->is_number_float() && std::floor(it->get<double>()) == it->get<double>()) {
        value = it->get<double>();
    }
    else {
        throw GatewayError(ErrorCode::ValidationError, std::string(field) + " must be an integer");
    }

    // Out-of-range values are clamped so the range check reports them.
    if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(value);
}

int GatewayProtocol::RequireInt(const nlohmann::json& msg, const char* field) {
    auto value = OptionalInt(msg, field);
    if (!value) {
        throw GatewayError(ErrorCode::ValidationError, std::string(field) + " is required");
    }
    return *value;
}

std::optional<double> GatewayProtocol::OptionalDuration(const nlohmann::json& msg, const char* field) {
    auto it = msg.find(field);
    if (it == msg.end() || it->is_null()) return std::nullopt;
    if (!it->is_number() || !(it->get<double>() >= 0.0)) {
        throw GatewayError(ErrorCode::ValidationError, std::string(field) + " must be a non-negative number");
    }
    return it->get<double>();
}

// --- Frame Builders ---

std::string GatewayProtocol::BuildOk(const nlohmann::json& request_id, const nlohmann::json& data) {
    nlohmann::json response = {
        {"type", "response"},
        {"request_id", request_id},
        {"status", "ok"},
        {"data", data}
    };
    return response.dump();
}

std::string GatewayProtocol::BuildError(const nlohmann::json& request_id, const std::string& error) {
    nlohmann::json response = {
        {"type", "response"},
        {"request_id", request_id},
        {"status", "error"},
        {"error", error}
    };
    return response.dump();
}

std::string GatewayProtocol::BuildEventFrame(const DeviceEvent& event) {
    nlohmann::json payload = {
        {"type", "event"},
        {"event", "device_state"},
        {"device_name", event.device_name},
        {"state", SnapshotToJson(event.snapshot)}
    };
    return payload.dump();
}

AuthResult GatewayProtocol::CheckAuthorization(const std::string& token, std::string_view authorization_header) {
    if (token.empty()) return AuthResult::ACCEPTED;

    constexpr std::string_view prefix = "Bearer ";
    if (authorization_header.size() < prefix.size() || authorization_header.substr(0, prefix.size()) != prefix) {
        return AuthResult::UNAUTHORIZED;
    }

    std::string_view presented = authorization_header.substr(prefix.size());
    while (!presented.empty() && (presented.front() == ' ' || presented.front() == '\t')) presented.remove_prefix(1);
    while (!presented.empty() && (presented.back() == ' ' || presented.back() == '\t')) presented.remove_suffix(1);

    return (presented == token) ? AuthResult::ACCEPTED : AuthResult::FORBIDDEN;
}
