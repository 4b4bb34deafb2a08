/*
 * BLE Hub - WebSocket gateway for a fleet of BLE sound machines
 *
 * Architecture:
 * 1. Main Thread: loads the config, starts the hub and waits for SIGINT/SIGTERM.
 * 2. GatewayHub: composition root. Owns the Asio io_context.
 * 3. Asio Thread Pool: runs blocking radio calls (connect, read, command) and the
 *    listener strands of the event fan-out.
 * 4. Core Strand: every piece of device state (registry, sessions, the radio gate,
 *    discovery, rescans, pending client requests) is touched only from here.
 * 5. uWS Thread: the WebSocket server. Frames go to the core strand; replies and
 *    events come back through uWS::Loop::defer.
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include <boost/asio.hpp>

#include "ConfigManager.h"
#include "GatewayErrors.h"
#include "GatewayHub.h"
#include "Log.h"

int main(int argc, char** argv) {
    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    HubConfig config;
    try {
        config = ConfigManager::LoadFile(config_path);
    }
    catch (const ConfigError& e) {
        AddLog("Config Error: " + std::string(e.what()));
        return 2;
    }

    try {
        GatewayHub hub(std::move(config));
        hub.Start();

        boost::asio::io_context signal_ctx;
        boost::asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
            if (!ec) AddLog("Received signal " + std::to_string(signal_number) + ", shutting down...");
        });
        signal_ctx.run();

        hub.Stop();
    }
    catch (const std::exception& e) {
        AddLog("Fatal: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
