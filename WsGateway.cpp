#include "WsGateway.h"

#include <chrono>
#include <vector>

#include "GatewayErrors.h"
#include "Log.h"

WsGateway::WsGateway(GatewayProtocol& protocol, EventBroadcaster& events, std::string host, int port, std::string auth_token)
    : m_protocol(protocol),
    m_events(events),
    m_host(std::move(host)),
    m_port(port),
    m_auth_token(std::move(auth_token)) {
}

WsGateway::~WsGateway() {
    Stop();
}

bool WsGateway::Start() {
    if (m_uws_running) {
        AddLog("uWS Server is already running.");
        return true;
    }
    if (m_uws_thread.joinable()) {
        m_uws_thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_uws_mutex);
        m_uws_started = false;
    }
    m_uws_thread = std::thread(&WsGateway::RunUwsServer, this);

    std::unique_lock<std::mutex> lock(m_uws_mutex);
    if (!m_uws_cv.wait_for(lock, std::chrono::seconds(5), [this] { return m_uws_started; })) {
        lock.unlock();
        AddLog("uWS Server failed to initialize (timeout).");
        return false;
    }
    lock.unlock();

    if (!m_uws_running) {
        if (m_uws_thread.joinable()) m_uws_thread.join();
        return false;
    }

    m_listener_id = m_events.AddListener("websocket", [this](const DeviceEvent& event) {
        DeferPublish(GatewayProtocol::BuildEventFrame(event));
    });
    return true;
}

void WsGateway::Stop() {
    if (m_listener_id != 0) {
        m_events.RemoveListener(m_listener_id);
        m_listener_id = 0;
    }

    {
        std::lock_guard<std::mutex> lock(m_uws_mutex);
        if (m_uws_loop) {
            m_uws_loop->defer([this] { CloseAll(); });
        }
    }
    if (m_uws_thread.joinable()) {
        m_uws_thread.join();
    }
}

void WsGateway::RunUwsServer() {
    AddLog("uWS thread started.");
    try {
        uWS::App local_app;
        uWS::App::WebSocketBehavior<PerSocketData> behavior;
        behavior.maxPayloadLength = 64 * 1024;
        behavior.idleTimeout = 30;
        behavior.sendPingsAutomatically = true;

        behavior.upgrade = [this](auto* res, auto* req, auto* context) {
            AuthResult auth = GatewayProtocol::CheckAuthorization(m_auth_token, req->getHeader("authorization"));
            if (auth == AuthResult::UNAUTHORIZED) {
                AddLog(std::string("Client rejected (") + ErrorCodeName(ErrorCode::AuthRejected) + "): missing Authorization header");
                res->writeStatus("401 Unauthorized")
                    ->writeHeader("WWW-Authenticate", "Bearer")
                    ->end("Missing Authorization header\n");
                return;
            }
            if (auth == AuthResult::FORBIDDEN) {
                AddLog(std::string("Client rejected (") + ErrorCodeName(ErrorCode::AuthRejected) + "): invalid auth token");
                res->writeStatus("403 Forbidden")->end("Invalid auth token\n");
                return;
            }
            res->template upgrade<PerSocketData>(
                PerSocketData{ m_next_connection_id++ },
                req->getHeader("sec-websocket-key"),
                req->getHeader("sec-websocket-protocol"),
                req->getHeader("sec-websocket-extensions"),
                context);
        };
        behavior.open = [this](auto* ws) {
            uint64_t id = ws->getUserData()->connection_id;
            m_clients[id] = ws;
            m_client_count = m_clients.size();
            ws->subscribe(kEventTopic);
            AddLog("Client #" + std::to_string(id) + " connected (" + std::to_string(m_clients.size()) + " total)");
        };
        behavior.message = [this](auto* ws, std::string_view message, uWS::OpCode) {
            uint64_t id = ws->getUserData()->connection_id;
            m_protocol.HandleFrame(id, std::string(message), [this, id](const std::string& frame) {
                DeferSend(id, frame);
            });
        };
        behavior.close = [this](auto* ws, int, std::string_view) {
            uint64_t id = ws->getUserData()->connection_id;
            m_clients.erase(id);
            m_client_count = m_clients.size();
            m_protocol.OnConnectionClosed(id);
            AddLog("Client #" + std::to_string(id) + " disconnected (" + std::to_string(m_clients.size()) + " total)");
        };

        local_app.ws<PerSocketData>("/*", std::move(behavior))
            .listen(m_host, m_port, [this](auto* token) {
                m_listen_socket = token;
                if (token) {
                    m_port = us_socket_local_port(0, reinterpret_cast<us_socket_t*>(token));
                    AddLog("WebSocket server listening on ws://" + m_host + ":" + std::to_string(m_port));
                    m_uws_running = true;
                }
                else {
                    AddLog("uWS Server FAILED to listen on " + m_host + ":" + std::to_string(m_port) +
                        ". The host or port may be invalid or already in use.");
                    m_uws_running = false;
                }
            });

        {
            std::lock_guard<std::mutex> lock(m_uws_mutex);
            m_uws_loop = uWS::Loop::get();
            m_uws_app_ptr = &local_app;
            m_uws_started = true;
            m_uws_cv.notify_one();
        }
        if (m_uws_running) {
            local_app.run(); // Blocking call
        }
    }
    catch (const std::exception& e) {
        AddLog("uWS Thread exception: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(m_uws_mutex);
        m_uws_loop = nullptr;
        m_uws_app_ptr = nullptr;
        m_uws_started = true;
        m_uws_cv.notify_one();
    }
    m_uws_running = false;
    AddLog("uWS Server thread stopped.");
}

void WsGateway::DeferSend(uint64_t connection_id, std::string frame) {
    std::lock_guard<std::mutex> lock(m_uws_mutex);
    if (!m_uws_loop) return;
    m_uws_loop->defer([this, connection_id, frame = std::move(frame)] {
        auto it = m_clients.find(connection_id);
        if (it == m_clients.end()) return; // Closed before the reply was ready
        it->second->send(frame, uWS::OpCode::TEXT);
    });
}

void WsGateway::DeferPublish(std::string frame) {
    std::lock_guard<std::mutex> lock(m_uws_mutex);
    if (!m_uws_loop) return;
    AddLog("Ingress: " + frame, LogType::INGRESS);
    m_uws_loop->defer([this, frame = std::move(frame)] {
        if (!m_uws_app_ptr) return;
        m_uws_app_ptr->publish(kEventTopic, frame, uWS::OpCode::TEXT);
    });
}

void WsGateway::CloseAll() {
    if (m_listen_socket) {
        us_listen_socket_close(0, m_listen_socket);
        m_listen_socket = nullptr;
    }
    std::vector<GatewaySocket*> sockets;
    for (auto& [id, ws] : m_clients) sockets.push_back(ws);
    for (auto* ws : sockets) {
        ws->end(1001, "Server shutting down");
    }
    AddLog("WebSocket server closed (" + std::to_string(sockets.size()) + " client(s) disconnected).");
}
