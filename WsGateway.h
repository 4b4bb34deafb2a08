// WsGateway.h
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// --- uWebSockets ---
#include <uwebsockets/App.h>
#include <uwebsockets/WebSocket.h>

#include "EventBroadcaster.h"
#include "GatewayProtocol.h"

struct PerSocketData {
    uint64_t connection_id = 0;
};

using GatewaySocket = uWS::WebSocket<false, true, PerSocketData>;

// --- WsGateway ---
// uWebSockets transport for GatewayProtocol. The uWS loop runs on its own thread; frames
// go to the protocol on the core strand, replies and events come back through
// uWS::Loop::defer. Authentication happens once, on the HTTP upgrade.
class WsGateway {
public:
    static constexpr const char* kEventTopic = "devices/state";

    WsGateway(GatewayProtocol& protocol, EventBroadcaster& events, std::string host, int port, std::string auth_token);
    ~WsGateway();

    // Blocks until the socket listens (or fails to, within 5 s).
    bool Start();
    // Closes every client with 1001 and stops listening.
    void Stop();

    bool IsRunning() const { return m_uws_running; }
    size_t ClientCount() const { return m_client_count; }
    // Bound port; differs from the configured one when that was 0. Valid after Start.
    int Port() const { return m_port; }

private:
    void RunUwsServer();
    void DeferSend(uint64_t connection_id, std::string frame);
    void DeferPublish(std::string frame);
    void CloseAll();

    GatewayProtocol& m_protocol;
    EventBroadcaster& m_events;
    std::string m_host;
    int m_port;
    std::string m_auth_token;
    EventBroadcaster::ListenerId m_listener_id = 0;

    // uWebSockets
    std::thread m_uws_thread;
    std::atomic<bool> m_uws_running{ false };
    bool m_uws_started = false;
    uWS::Loop* m_uws_loop = nullptr;
    uWS::App* m_uws_app_ptr = nullptr;
    us_listen_socket_t* m_listen_socket = nullptr;
    std::mutex m_uws_mutex;
    std::condition_variable m_uws_cv;

    // Touched on the uWS thread only
    std::map<uint64_t, GatewaySocket*> m_clients;
    uint64_t m_next_connection_id = 1;
    std::atomic<size_t> m_client_count{ 0 };
};
