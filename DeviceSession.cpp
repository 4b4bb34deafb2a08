#include "DeviceSession.h"

#include "GatewayErrors.h"
#include "Log.h"
#include "StringUtils.h"

DeviceSession::DeviceSession(DeviceIdentity identity,
    boost::asio::io_context& io_ctx,
    CoreStrand strand,
    OperationSerializer& serializer,
    std::chrono::milliseconds debounce)
    : m_identity(std::move(identity)),
    m_io_context(io_ctx),
    m_strand(std::move(strand)),
    m_serializer(serializer),
    m_debounce(debounce) {
    m_identity.address = ToUpper(m_identity.address);
}

DeviceSession::~DeviceSession() {
    if (m_debounce_timer) m_debounce_timer->cancel();
}

bool DeviceSession::Bind(const Advertisement& adv, const IAdvertisementClassifier& classifier, IBlePlatform& platform) {
    if (m_bind_state != BindState::UNBOUND) return false;
    m_bind_state = BindState::BINDING;

    auto info = classifier.Classify(adv, m_identity.secret);
    if (!info) {
        AddLog("[" + Name() + "] Advertisement from " + adv.address + " is not a supported model/firmware");
        m_bind_state = BindState::UNBOUND;
        return false;
    }

    std::shared_ptr<IDeviceControl> control;
    try {
        control = platform.CreateDeviceControl(adv, *info);
    }
    catch (const std::exception& e) {
        AddLog("[" + Name() + "] Failed to create device control: " + std::string(e.what()));
    }
    if (!control) {
        m_bind_state = BindState::UNBOUND;
        return false;
    }

    const std::string advertised = adv.name.empty() ? std::string("BLE Device") : adv.name;
    m_binding = DeviceBinding{ control, adv, *info, MakeDisplayName(advertised, adv.address) };
    m_resolved_address = ToUpper(adv.address);

    std::weak_ptr<DeviceSession> weak_self = weak_from_this();
    CoreStrand strand = m_strand;
    m_subscription = control->SubscribeToStateChange([weak_self, strand](const DeviceState& state) {
        boost::asio::post(strand, [weak_self, state]() {
            if (auto self = weak_self.lock()) self->OnRawStateChange(state);
        });
    });

    m_bind_state = BindState::BOUND;
    AddLog("[" + Name() + "] Bound discovery: " + m_binding->display_name + " (" + m_resolved_address + ")");
    return true;
}

void DeviceSession::Start(StartCallback done) {
    if (!IsBound()) {
        throw GatewayError(ErrorCode::NotBound, "[" + Name() + "] Device not discovered/bound yet");
    }

    auto self = shared_from_this();
    auto control = m_binding->control;
    m_serializer.Enqueue(Name() + ": connect", [this, self, control, done](OperationSerializer::Release release) {
        boost::asio::post(m_io_context, [this, self, control, done, release]() {
            std::exception_ptr error;
            DeviceState state;
            try {
                control->Connect();
                state = control->ReadState(false);
            }
            catch (...) {
                error = std::current_exception();
            }
            release();

            boost::asio::post(m_strand, [this, self, done, error, state]() {
                if (error) {
                    AddLog("[" + Name() + "] Failed to start/connect: " + DescribeException(error));
                }
                else if (!m_stopped) {
                    m_started = true;
                    AddLog("[" + Name() + "] Connected: model=" + m_binding->model_info.model +
                        " firmware=" + m_binding->model_info.firmware_version);
                    ApplyReadState(state);
                }
                if (done) done(error);
            });
        });
    });
}

void DeviceSession::RefreshState(std::function<void()> done) {
    if (!IsBound() || m_stopped || !IsConnected()) {
        if (done) done();
        return;
    }

    auto self = shared_from_this();
    auto control = m_binding->control;
    m_serializer.Enqueue(Name() + ": read_state", [this, self, control, done](OperationSerializer::Release release) {
        boost::asio::post(m_io_context, [this, self, control, done, release]() {
            std::optional<DeviceState> state;
            std::string failure;
            try {
                state = control->ReadState(false);
            }
            catch (...) {
                failure = DescribeException(std::current_exception());
            }
            release();

            boost::asio::post(m_strand, [this, self, done, state, failure]() {
                if (state && !m_stopped) {
                    ApplyReadState(*state);
                }
                else if (!failure.empty()) {
                    AddLog("[" + Name() + "] State refresh failed: " + failure);
                }
                if (done) done();
            });
        });
    });
}

DeviceSnapshot DeviceSession::Snapshot() const {
    DeviceSnapshot snap;
    snap.device_name = m_identity.name;
    if (!m_resolved_address.empty()) {
        snap.address = m_resolved_address;
    }
    else if (!m_identity.address.empty()) {
        snap.address = m_identity.address;
    }

    if (m_binding) {
        snap.display_name = m_binding->display_name;
        snap.model = m_binding->model_info.model;
        snap.firmware_version = m_binding->model_info.firmware_version;
        snap.connection_status = m_binding->control->GetConnectionStatus();
        snap.connected = snap.connection_status == ConnectionStatus::CONNECTED;
        snap.state = m_state;
    }
    return snap;
}

void DeviceSession::Stop() {
    if (m_stopped) return;
    m_stopped = true;

    ++m_debounce_generation;
    if (m_debounce_timer) {
        m_debounce_timer->cancel();
        m_debounce_timer.reset();
    }

    if (!m_binding) return;
    auto control = m_binding->control;
    if (m_subscription) {
        try {
            control->Unsubscribe(*m_subscription);
        }
        catch (const std::exception& e) {
            AddLog("[" + Name() + "] Unsubscribe failed: " + std::string(e.what()));
        }
        m_subscription.reset();
    }

    // Queued behind any connect, read or command still holding the radio.
    auto self = shared_from_this();
    m_serializer.Enqueue(Name() + ": disconnect", [this, self, control](OperationSerializer::Release release) {
        boost::asio::post(m_io_context, [self, control, release]() {
            try {
                control->Disconnect();
            }
            catch (...) {
                AddLog("[" + self->Name() + "] Error during disconnect: " + DescribeException(std::current_exception()));
            }
            release();
        });
    });
}

void DeviceSession::OnRawStateChange(const DeviceState& state) {
    if (m_stopped) return;
    m_state = state;
    RestartDebounce();
}

void DeviceSession::AddEventListener(EventSink sink) {
    m_event_sinks.push_back(std::move(sink));
}

bool DeviceSession::IsConnected() const {
    return m_binding && m_binding->control->GetConnectionStatus() == ConnectionStatus::CONNECTED;
}

std::shared_ptr<IDeviceControl> DeviceSession::Control() const {
    return m_binding ? m_binding->control : nullptr;
}

void DeviceSession::ApplyReadState(const DeviceState& state) {
    if (state == m_state) return;
    m_state = state;
    RestartDebounce();
}

void DeviceSession::RestartDebounce() {
    const uint64_t generation = ++m_debounce_generation;
    if (m_debounce_timer) m_debounce_timer->cancel();

    m_debounce_timer = std::make_unique<boost::asio::steady_timer>(m_strand, m_debounce);
    m_debounce_timer->async_wait(boost::asio::bind_executor(m_strand,
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (generation != self->m_debounce_generation || self->m_stopped) return;
            self->EmitEvent();
        }));
}

void DeviceSession::EmitEvent() {
    DeviceEvent event{ Name(), Snapshot() };
    ++m_emitted_events;
    if (g_log_show_ingress) AddLog("[" + Name() + "] State event", LogType::INGRESS);
    for (auto& sink : m_event_sinks) {
        try {
            sink(event);
        }
        catch (const std::exception& e) {
            AddLog("[" + Name() + "] State callback error: " + std::string(e.what()));
        }
    }
}
