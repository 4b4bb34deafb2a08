#include "GatewayHub.h"

#include <algorithm>
#include <future>
#include <stdexcept>

#include "GatewayErrors.h"
#include "SimulatedBlePlatform.h"

unsigned int s_hardware_cores = (std::thread::hardware_concurrency() > 0) ? std::thread::hardware_concurrency() : 4;

GatewayHub::GatewayHub(HubConfig config, IBlePlatform::Ptr platform)
    : m_config(std::move(config)),
    m_running(false),
    m_work_guard(boost::asio::make_work_guard(m_io_context)),
    m_strand(boost::asio::make_strand(m_io_context)),
    m_platform(platform ? std::move(platform) : CreatePlatform(m_config)),
    m_classifier(m_config.classifier) {
    g_log_show_ingress = m_config.log_ingress;
    g_log_show_egress = m_config.log_egress;

    m_manager = std::make_unique<DeviceManager>(m_io_context, m_strand, *m_platform, m_classifier, m_config.timing);
    m_protocol = std::make_unique<GatewayProtocol>(*m_manager, m_strand);
    m_gateway = std::make_unique<WsGateway>(*m_protocol, m_manager->Events(),
        m_config.websocket.host, m_config.websocket.port, m_config.websocket.auth_token);
    AddLog("GatewayHub constructed.");
}

GatewayHub::~GatewayHub() {
    Stop();
    JoinWorkerPool();
}

int GatewayHub::GetWorkerCount() const {
    int count = (m_config.worker_threads > 0) ? m_config.worker_threads : static_cast<int>(s_hardware_cores);
    return std::max(count, 2);
}

void GatewayHub::Start() {
    if (m_running) return;

    StartWorkerPool();
    StartCore();
    m_running = true;

    if (!m_gateway->Start()) {
        Stop();
        throw std::runtime_error("WebSocket gateway failed to listen on " +
            m_config.websocket.host + ":" + std::to_string(m_config.websocket.port));
    }
    AddLog("BLE Hub started (" + std::to_string(m_config.devices.size()) + " device(s), auth " +
        (m_config.websocket.auth_token.empty() ? "disabled" : "enabled") + ").");
}

void GatewayHub::Stop() {
    if (!m_running) return;
    m_running = false;

    m_gateway->Stop();

    std::promise<void> stopped;
    boost::asio::post(m_strand, [this, &stopped] {
        m_manager->Stop();
        stopped.set_value();
    });
    stopped.get_future().wait();

    JoinWorkerPool();
    AddLog("BLE Hub stopped.");
}

std::vector<std::string> GatewayHub::GetDeviceNames() {
    std::promise<std::vector<std::string>> names;
    auto future = names.get_future();
    boost::asio::post(m_strand, [this, &names] {
        names.set_value(m_manager->GetDeviceNames());
    });
    return future.get();
}

void GatewayHub::StartWorkerPool() {
    if (!m_thread_pool.empty()) return;
    int pool_size = GetWorkerCount();
    for (int i = 0; i < pool_size; ++i) {
        m_thread_pool.emplace_back([this] {
            m_io_context.run();
            });
    }
    AddLog("Asio worker pool started with " + std::to_string(pool_size) + " threads.");
}

// In-flight work (commands on the radio, disconnects) runs to completion before the
// threads exit.
void GatewayHub::JoinWorkerPool() {
    m_work_guard.reset();
    for (auto& t : m_thread_pool) {
        if (t.joinable()) t.join();
    }
    m_thread_pool.clear();
}

void GatewayHub::StartCore() {
    auto ready = std::make_shared<std::promise<void>>();
    auto future = ready->get_future();

    boost::asio::post(m_strand, [this, ready] {
        try {
            for (const auto& identity : m_config.devices) {
                m_manager->AddDevice(identity);
            }
        }
        catch (const std::exception&) {
            ready->set_exception(std::current_exception());
            return;
        }
        m_manager->Start([ready] {
            ready->set_value();
        });
    });

    try {
        future.get();
    }
    catch (const std::exception& e) {
        AddLog("System Error: core failed to start: " + std::string(e.what()));
        JoinWorkerPool();
        throw;
    }
}
