#include "DeviceManager.h"

#include <set>

#include "GatewayErrors.h"
#include "Log.h"

namespace {

void CheckPercent(const char* field, int value) {
    if (value < 0 || value > 100) {
        throw GatewayError(ErrorCode::ValidationError, std::string(field) + " must be 0..100");
    }
}

}

DeviceManager::DeviceManager(boost::asio::io_context& io_ctx,
    CoreStrand strand,
    IBlePlatform& platform,
    const IAdvertisementClassifier& classifier,
    ManagerTiming timing)
    : m_io_context(io_ctx),
    m_strand(strand),
    m_platform(platform),
    m_classifier(classifier),
    m_timing(timing),
    m_serializer(strand),
    m_broadcaster(io_ctx),
    m_registry(io_ctx, strand, m_serializer, m_broadcaster, timing.debounce),
    m_scanner(platform.Scanner(), strand),
    m_supervisor(m_registry, m_scanner, classifier, platform, strand, timing.rescan_interval, timing.rescan_timeout) {
}

DeviceManager::~DeviceManager() {
    if (m_running) Stop();
}

std::shared_ptr<DeviceSession> DeviceManager::AddDevice(const DeviceIdentity& identity) {
    return m_registry.Register(identity);
}

// --- Lifecycle ---

void DeviceManager::Start(std::function<void()> on_ready) {
    if (m_running) return;
    m_running = true;

    std::vector<DeviceIdentity> targets;
    for (const auto& session : m_registry.Sessions()) {
        targets.push_back(session->Identity());
    }
    AddLog("DeviceManager: initial discovery for " + std::to_string(targets.size()) + " device(s) on " + m_platform.GetName());

    bool started = m_scanner.Scan(targets, m_timing.initial_scan_timeout, [this, on_ready](const ScanResults& found) {
        if (!m_running) return;
        m_supervisor.BindAndStart(found, "startup");

        std::set<std::string> missing;
        for (const auto& name : m_registry.ListNames()) {
            if (!found.count(name)) missing.insert(name);
        }
        if (!missing.empty()) {
            std::string names;
            for (const auto& name : missing) names += (names.empty() ? "" : ", ") + name;
            AddLog("WARNING: Some devices not discovered at startup: [" + names + "]");
        }

        m_supervisor.Start();
        if (on_ready) on_ready();
    });

    if (!started) {
        m_supervisor.Start();
        if (on_ready) on_ready();
    }
}

void DeviceManager::Stop() {
    if (!m_running) return;
    m_running = false;
    m_supervisor.Stop();
    m_scanner.Cancel();
    for (const auto& session : m_registry.Sessions()) {
        session->Stop();
    }
    AddLog("DeviceManager stopped.");
}

// --- Accessors ---

std::vector<std::string> DeviceManager::GetDeviceNames() const {
    return m_registry.ListNames();
}

DeviceSnapshot DeviceManager::GetState(const std::string& device_name) const {
    return m_registry.Get(device_name)->Snapshot();
}

std::shared_ptr<DeviceSession> DeviceManager::GetDevice(const std::string& device_name) const {
    return m_registry.Get(device_name);
}

// --- Commands ---

void DeviceManager::ValidateCommand(const DeviceCommand& cmd) {
    switch (cmd.kind) {
    case CommandKind::SET_VOLUME:
        if (!cmd.volume) throw GatewayError(ErrorCode::ValidationError, "volume is required");
        CheckPercent("volume", *cmd.volume);
        break;
    case CommandKind::NOISE_ON:
        if (cmd.volume) CheckPercent("volume", *cmd.volume);
        break;
    case CommandKind::NOISE_OFF:
        if (cmd.duration_s && !(*cmd.duration_s >= 0.0)) {
            throw GatewayError(ErrorCode::ValidationError, "duration_s must be a non-negative number");
        }
        break;
    case CommandKind::SET_LIGHT_BRIGHTNESS:
        if (!cmd.brightness) throw GatewayError(ErrorCode::ValidationError, "brightness is required");
        CheckPercent("brightness", *cmd.brightness);
        break;
    case CommandKind::LIGHT_ON:
    case CommandKind::LIGHT_OFF:
        break;
    }
}

void DeviceManager::ExecuteCommand(const std::string& device_name, const DeviceCommand& cmd, CommandCallback done,
    CancelFlag cancelled) {
    std::shared_ptr<DeviceSession> session;
    try {
        ValidateCommand(cmd);
        session = m_registry.Get(device_name);
        if (!session->IsBound() || !session->IsConnected()) {
            throw GatewayError(ErrorCode::DeviceUnavailable, "device_unavailable");
        }
    }
    catch (const GatewayError&) {
        Fail(done, std::current_exception());
        return;
    }

    const std::string label = device_name + ": " + CommandKindName(cmd.kind);
    m_serializer.Enqueue(label, [this, session, cmd, done, cancelled](OperationSerializer::Release release) {
        RunCommand(session, cmd, done, cancelled, release);
    });
}

void DeviceManager::RunCommand(const std::shared_ptr<DeviceSession>& session, const DeviceCommand& cmd,
    CommandCallback done, CancelFlag cancelled, OperationSerializer::Release release) {
    if (cancelled && cancelled->load()) {
        release();
        Fail(done, std::make_exception_ptr(GatewayError(ErrorCode::ProtocolError, "request_cancelled")));
        return;
    }
    // The device may have dropped while the command waited for the gate.
    auto control = session->Control();
    if (!control || !session->IsConnected()) {
        release();
        Fail(done, std::make_exception_ptr(GatewayError(ErrorCode::DeviceUnavailable, "device_unavailable")));
        return;
    }

    const std::string name = session->Name();
    boost::asio::post(m_io_context, [this, control, cmd, done, release, name]() {
        CommandResult result;
        std::exception_ptr error;
        try {
            result = control->ExecuteCommand(cmd);
        }
        catch (...) {
            error = std::current_exception();
        }
        release();

        boost::asio::post(m_strand, [done, result, error, name, cmd]() {
            if (error) {
                AddLog("[" + name + "] " + CommandKindName(cmd.kind) + " failed: " + DescribeException(error));
                done(error, result);
                return;
            }
            if (result.status != CommandStatus::SUCCESSFUL) {
                AddLog("[" + name + "] " + CommandKindName(cmd.kind) + " returned " + CommandStatusName(result.status));
                done(std::make_exception_ptr(GatewayError(ErrorCode::CommandFailed,
                    std::string("command_failed: ") + CommandStatusName(result.status))), result);
                return;
            }
            done(nullptr, result);
        });
    });
}

void DeviceManager::Fail(const CommandCallback& done, std::exception_ptr error) {
    boost::asio::post(m_strand, [done, error]() {
        done(error, CommandResult());
    });
}
