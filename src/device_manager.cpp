#include <cmath>

#include <QDeadlineTimer>
#include <QMetaObject>

#include "device_manager.hpp"
#include "g6_logging.hpp"
#include "protocol_console.hpp"
#include "response_parser.hpp"
#include "runtime_settings.hpp"
#include "util.hpp"

namespace g6
{

namespace
{

template <typename T>
bool holds(const DecodedResponse& r)
{
    return std::holds_alternative<T>(r);
}

std::function<bool(float)> toggle_value(bool enabled)
{
    return [enabled](float v) {
        bool e;
        return unit_to_toggle(v, e) && e == enabled;
    };
}

std::function<bool(float)> level_value(int level)
{
    return [level](float v) {
        uint8_t l;
        return unit_to_level(v, l) && l == level;
    };
}

std::function<bool(float)> raw_value(float value)
{
    return [value](float v) { return std::fabs(v - value) < 1e-4f; };
}

std::function<bool(float)> any_value()
{
    return [](float) { return true; };
}

} // namespace

DeviceManager::DeviceManager(std::unique_ptr<TransportFactory> factory, const QString &statePath, QObject *parent)
    : QObject{parent},
      m_factory(std::move(factory)),
      m_broadcastListener(nullptr),
      m_knobListener(nullptr),
      m_settingsStore(statePath),
      m_connState(ConnectionState::Disconnected),
      m_switching(false),
      m_cancel(false),
      m_lastWarning(Error::Ok)
{
    qRegisterMetaType<g6::DeviceEvent>();
    qRegisterMetaType<g6::Error>();
    qRegisterMetaType<g6::ConnectionState>();

    m_store = StateStore(m_settingsStore.load());
}

DeviceManager::~DeviceManager()
{
    stopListeners();
    if (m_control) {
        m_control->transport().close();
    }
}

DeviceManager::Matcher DeviceManager::audioValueMatcher(proto::Space space, uint8_t code, std::function<bool(float)> valueMatches)
{
    return [space, code, valueMatches](const DecodedResponse& r) {
        auto* v = std::get_if<AudioValue>(&r);
        return v && v->space == space && v->feature == code && valueMatches(v->value);
    };
}

/* Connection lifecycle */

Error DeviceManager::connectDevice()
{
    if (m_connState != ConnectionState::Disconnected) {
        qCDebug(lcManager) << "Already connected";
        return Error::Ok;
    }
    m_cancel = false;
    m_lastWarning = Error::Ok;
    setConnectionState(ConnectionState::Connecting);

    std::unique_ptr<Transport> control;
    Error err = m_factory->open_control(control);
    if (err == Error::Ok && !control) {
        err = Error::NotFound;
    }
    if (err != Error::Ok) {
        qCWarning(lcManager) << "Could not open G6:" << error_str(err);
        setConnectionState(ConnectionState::Disconnected);
        return err;
    }
    m_control = std::make_shared<SharedTransport>(std::move(control));
    m_store = StateStore(m_settingsStore.load());
    protocol_console.note(ConsoleDir::Info, "Connected, reading device state");

    setConnectionState(ConnectionState::Syncing);
    err = fullSync();
    if (is_terminal(err)) {
        return failSession(err);
    }
    if (err != Error::Ok) {
        qCWarning(lcManager) << "Connect failed:" << error_str(err);
        teardown(err);
        return err;
    }

    std::unique_ptr<Transport> knob;
    if (m_factory->open_knob(knob) != Error::Ok) {
        qCWarning(lcManager) << "Volume knob channel unavailable";
        knob.reset();
    }
    startListeners(std::move(knob));

    m_store.set_connected(true);
    setConnectionState(ConnectionState::Ready);
    persist();
    emit stateChanged();
    qCInfo(lcManager).noquote() << "G6 ready, firmware" << QString::fromStdString(m_store.get().firmware_version);
    return Error::Ok;
}

void DeviceManager::disconnectDevice()
{
    if (m_connState == ConnectionState::Disconnected) {
        return;
    }
    teardown(Error::Ok);
}

void DeviceManager::cancel()
{
    m_cancel = true;
    // Idle sessions are torn down from the event loop, busy ones notice
    // the flag at their next read
    QMetaObject::invokeMethod(this, [this]() {
        if (m_cancel && m_connState == ConnectionState::Ready) {
            teardown(Error::Disconnected);
        }
    }, Qt::QueuedConnection);
}

Error DeviceManager::synchronize()
{
    if (m_cancel && m_connState != ConnectionState::Disconnected) {
        return failSession(Error::Disconnected);
    }
    if (m_connState != ConnectionState::Ready) {
        return Error::Disconnected;
    }
    setConnectionState(ConnectionState::Syncing);
    Error err = fullSync();
    if (is_terminal(err)) {
        return failSession(err);
    }
    setConnectionState(ConnectionState::Ready);
    persist();
    emit stateChanged();
    return err;
}

bool DeviceManager::isConnected() const
{
    return m_connState == ConnectionState::Syncing || m_connState == ConnectionState::Ready
        || m_connState == ConnectionState::Writing;
}

SettingsState DeviceManager::state() const
{
    return m_store.snapshot();
}

Error DeviceManager::fullSync()
{
    struct Step
    {
        Frame query;
        Matcher matches;
    };

    std::vector<Step> steps;
    steps.push_back({query_frame(op::QueryKind::Identification), holds<Identification>});
    steps.push_back({query_frame(op::QueryKind::HardwareStatus), holds<HardwareStatus>});
    refreshOutputPhase();
    if (!m_switching) {
        steps.push_back({query_frame(op::QueryKind::Routing), holds<Route>});
    }
    steps.push_back({query_frame(op::QueryKind::Gaming), holds<GamingModes>});
    for (proto::Space space : {proto::Space::Sbx, proto::Space::Equalizer}) {
        for (int code = 0; code <= space_last_code(space); ++code) {
            std::vector<Frame> frames;
            if (encode(op::ReadFeature{space, (uint8_t)code}, frames) == Error::Ok) {
                steps.push_back({frames.front(), audioValueMatcher(space, (uint8_t)code, any_value())});
            }
        }
    }
    steps.push_back({query_frame(op::QueryKind::FirmwareAscii), holds<FirmwareVersion>});

    const int timeout_ms = runtime_settings.get_query_timeout_ms();
    const int max_timeouts = runtime_settings.get_max_consecutive_timeouts();

    std::shared_ptr<SharedTransport> control = m_control;
    CommandLock lock(*control);
    int consecutive = 0;
    int answered = 0;
    for (const auto& step : steps) {
        std::optional<DecodedResponse> reply;
        Error err = runQuery(*control, step.query, step.matches, timeout_ms, reply);
        if (err != Error::Ok) {
            return err;
        }
        if (!reply) {
            qCDebug(lcManager).noquote() << "No reply to" << QString::fromStdString(describe_frame(step.query));
            if (++consecutive >= max_timeouts) {
                qCWarning(lcManager) << consecutive << "consecutive queries timed out";
                return Error::ConnectFailed;
            }
            continue;
        }
        consecutive = 0;
        ++answered;
        m_store.apply(*reply);
    }
    m_store.mark_full_read(epoch_ms());
    qCInfo(lcManager) << "Full read complete," << answered << "of" << steps.size() << "queries answered";
    return Error::Ok;
}

Error DeviceManager::runQuery(SharedTransport &control, const Frame &query, const Matcher &matches, int timeout_ms,
                              std::optional<DecodedResponse> &reply, Frame *raw)
{
    reply.reset();
    if (m_cancel) {
        return Error::Disconnected;
    }
    Error err = send_frame(control.transport(), query);
    if (err == Error::DeviceGone) {
        return err;
    }
    if (err != Error::Ok) {
        // Counted as an unanswered query
        return Error::Ok;
    }

    QDeadlineTimer deadline(timeout_ms);
    while (!deadline.hasExpired()) {
        if (m_cancel) {
            return Error::Disconnected;
        }
        Frame frame = {};
        err = receive_frame(control.transport(), frame, (int)deadline.remainingTime());
        if (err == Error::DeviceGone) {
            return err;
        }
        if (err != Error::Ok) {
            break;
        }
        DecodedResponse decoded = decode(frame);
        if (matches(decoded)) {
            reply = decoded;
            if (raw) {
                *raw = frame;
            }
            return Error::Ok;
        }
        qCDebug(lcManager).noquote() << "Skipping" << QString::fromStdString(describe_frame(frame));
    }
    return Error::Ok;
}

/* Writes */

Error DeviceManager::beginOperation(const Operation &operation, std::vector<Frame> &frames)
{
    Error err = encode(operation, frames);
    if (err != Error::Ok) {
        qCWarning(lcManager) << "Rejected operation:" << error_str(err);
        return err;
    }
    if (m_cancel && m_connState != ConnectionState::Disconnected) {
        return failSession(Error::Disconnected);
    }
    if (m_connState != ConnectionState::Ready || !m_control) {
        return Error::Disconnected;
    }
    return Error::Ok;
}

Error DeviceManager::writeAndConfirm(const std::vector<Frame> &frames, std::vector<Expectation> &expectations)
{
    std::shared_ptr<SharedTransport> control = m_control;
    CommandLock lock(*control);
    for (const auto& frame : frames) {
        if (m_cancel) {
            return Error::Disconnected;
        }
        Error err = send_frame(control->transport(), frame);
        if (err != Error::Ok) {
            return err;
        }
    }
    if (expectations.empty()) {
        return Error::Ok;
    }
    return drain(*control, expectations);
}

/* After any write the device replays buffered replies to earlier
   queries. Only a frame naming the setting just written, with the value
   just written, confirms the write. Everything else is discarded. */
Error DeviceManager::drain(SharedTransport &control, std::vector<Expectation> &expectations)
{
    const int max_reads = runtime_settings.get_drain_max_reads();
    const int timeout_ms = runtime_settings.get_drain_read_timeout_ms();

    size_t pending = expectations.size();
    for (int i = 0; i < max_reads; ++i) {
        if (m_cancel) {
            return Error::Disconnected;
        }
        Frame frame = {};
        Error err = receive_frame(control.transport(), frame, timeout_ms);
        if (err == Error::DeviceGone) {
            return err;
        }
        if (err != Error::Ok) {
            continue;
        }
        DecodedResponse decoded = decode(frame);
        bool matched = false;
        for (auto& e : expectations) {
            if (!e.confirmed && e.matches(decoded)) {
                e.confirmed = true;
                matched = true;
                --pending;
                break;
            }
        }
        if (!matched) {
            qCDebug(lcManager).noquote() << "Drained" << QString::fromStdString(describe_frame(frame));
            continue;
        }
        if (pending == 0) {
            qCDebug(lcManager) << "Write confirmed after" << i + 1 << "reads";
            return Error::Ok;
        }
    }
    qCWarning(lcManager) << pending << "of" << expectations.size() << "values unconfirmed after" << max_reads << "reads";
    return Error::UnconfirmedWrite;
}

Error DeviceManager::runWrite(const Operation &operation, std::vector<Expectation> expectations, const std::function<bool()> &apply)
{
    std::vector<Frame> frames;
    Error err = beginOperation(operation, frames);
    if (err != Error::Ok) {
        return err;
    }

    setConnectionState(ConnectionState::Writing);
    err = writeAndConfirm(frames, expectations);
    if (is_terminal(err)) {
        return failSession(err);
    }
    setConnectionState(ConnectionState::Ready);
    if (err != Error::Ok && err != Error::UnconfirmedWrite) {
        return err;
    }

    // The device executes writes it does not confirm, apply either way
    bool changed = apply();
    m_lastWarning = err;
    if (err == Error::UnconfirmedWrite) {
        protocol_console.note(ConsoleDir::Warn, error_str(err));
        emit warning(err);
    }
    if (changed) {
        persist();
        emit stateChanged();
    }
    return Error::Ok;
}

Error DeviceManager::setEffect(Effect effect, bool enabled, int level)
{
    auto toggle = toggle_feature(effect);
    auto lvl = level_feature(effect);
    if (!toggle || !lvl) {
        return Error::InvalidOperation;
    }
    auto ti = feature_info(*toggle);
    auto li = feature_info(*lvl);

    std::vector<Expectation> expectations;
    expectations.push_back({audioValueMatcher(ti->space, ti->code, toggle_value(enabled))});
    expectations.push_back({audioValueMatcher(li->space, li->code, level_value(level))});

    return runWrite(op::SetEffect{effect, enabled, level}, std::move(expectations), [&]() {
        bool changed = m_store.set_effect_enabled(effect, enabled);
        changed |= m_store.set_effect_value(effect, (uint8_t)level);
        return changed;
    });
}

Error DeviceManager::setToggle(Feature feature, bool enabled)
{
    auto info = feature_info(feature);
    if (!info) {
        return Error::InvalidOperation;
    }
    float value = enabled ? 1.0f : 0.0f;
    std::vector<Expectation> expectations;
    expectations.push_back({audioValueMatcher(info->space, info->code, toggle_value(enabled))});
    return runWrite(op::SetToggle{feature, enabled}, std::move(expectations), [&]() {
        return m_store.apply(AudioValue{info->space, info->code, value, 0.0f});
    });
}

Error DeviceManager::setLevel(Feature feature, int level)
{
    auto info = feature_info(feature);
    if (!info) {
        return Error::InvalidOperation;
    }
    std::vector<Expectation> expectations;
    expectations.push_back({audioValueMatcher(info->space, info->code, level_value(level))});
    return runWrite(op::SetLevel{feature, level}, std::move(expectations), [&]() {
        return m_store.apply(AudioValue{info->space, info->code, level_to_unit(level), 0.0f});
    });
}

Error DeviceManager::setSmartVolumePreset(SmartVolumePreset preset)
{
    std::vector<Expectation> expectations;
    expectations.push_back({audioValueMatcher(proto::Space::Sbx, proto::SbxCode::smart_volume_preset,
                                              [preset](float v) { return unit_to_preset(v) == preset; })});
    return runWrite(op::SetSmartVolumePreset{preset}, std::move(expectations), [&]() {
        return m_store.set_smart_volume_preset(preset);
    });
}

Error DeviceManager::setEqBand(uint8_t band, float value)
{
    std::vector<Expectation> expectations;
    expectations.push_back({audioValueMatcher(proto::Space::Equalizer, band, raw_value(value))});
    return runWrite(op::SetEqBand{band, value}, std::move(expectations), [&]() {
        return m_store.set_eq_band(band, value);
    });
}

Error DeviceManager::setMode(Mode mode, bool enabled)
{
    std::vector<Expectation> expectations;
    expectations.push_back({[mode, enabled](const DecodedResponse& r) {
        if (auto* g = std::get_if<GamingModes>(&r)) {
            return (mode == Mode::Sbx ? g->sbx : g->scout) == enabled;
        }
        auto* m = std::get_if<ModeReport>(&r);
        return m && m->mode == mode && m->enabled == enabled;
    }});
    return runWrite(op::SetMode{mode, enabled}, std::move(expectations), [&]() {
        return m_store.set_mode(mode, enabled);
    });
}

/* Output relay. No confirming read: the relay takes seconds to settle
   and reads during that time are unreliable. A later route broadcast
   confirms or corrects the optimistic value. */
Error DeviceManager::setOutput(Output output)
{
    std::vector<Frame> frames;
    Error err = beginOperation(op::SetOutput{output}, frames);
    if (err != Error::Ok) {
        return err;
    }
    refreshOutputPhase();
    if (m_store.get().output == output) {
        qCDebug(lcManager) << "Output already" << output_str(output);
        return Error::Ok;
    }

    setConnectionState(ConnectionState::Writing);
    std::vector<Expectation> none;
    err = writeAndConfirm(frames, none);
    if (is_terminal(err)) {
        return failSession(err);
    }
    setConnectionState(ConnectionState::Ready);
    if (err != Error::Ok) {
        return err;
    }

    m_store.set_output(output);
    m_switching = true;
    m_switchTimer.restart();
    m_lastWarning = Error::Ok;
    qCInfo(lcManager) << "Output switching to" << output_str(output);
    persist();
    emit stateChanged();
    return Error::Ok;
}

Error DeviceManager::toggleOutput()
{
    Output next = m_store.get().output == Output::Speakers ? Output::Headphones : Output::Speakers;
    return setOutput(next);
}

OutputState DeviceManager::outputState()
{
    refreshOutputPhase();
    if (m_switching) {
        return OutputState::Switching;
    }
    return m_store.get().output == Output::Speakers ? OutputState::Speakers : OutputState::Headphones;
}

void DeviceManager::refreshOutputPhase()
{
    if (m_switching && m_switchTimer.hasExpired(runtime_settings.get_output_settle_ms())) {
        m_switching = false;
    }
}

Error DeviceManager::readRaw(op::QueryKind kind, std::optional<Frame> &reply)
{
    reply.reset();
    std::vector<Frame> frames;
    Error err = beginOperation(op::Query{kind}, frames);
    if (err != Error::Ok) {
        return err;
    }

    std::optional<DecodedResponse> decoded;
    Frame raw = {};
    {
        std::shared_ptr<SharedTransport> control = m_control;
        CommandLock lock(*control);
        err = runQuery(*control, frames.front(), [](const DecodedResponse&) { return true; },
                       runtime_settings.get_query_timeout_ms(), decoded, &raw);
    }
    if (is_terminal(err)) {
        return failSession(err);
    }
    if (decoded) {
        reply = raw;
    }
    return Error::Ok;
}

/* Listener plumbing */

void DeviceManager::startListeners(std::unique_ptr<Transport> knob)
{
    m_broadcastListener = new EventListener(m_control, this);
    connect(m_broadcastListener, &EventListener::deviceEvent, this, &DeviceManager::onListenerEvent, Qt::QueuedConnection);
    connect(m_broadcastListener, &EventListener::listenerStopped, this, &DeviceManager::onListenerStopped, Qt::QueuedConnection);
    m_broadcastListener->start();

    if (knob) {
        m_knobListener = new EventListener(std::move(knob), this);
        connect(m_knobListener, &EventListener::deviceEvent, this, &DeviceManager::onListenerEvent, Qt::QueuedConnection);
        connect(m_knobListener, &EventListener::listenerStopped, this, &DeviceManager::onListenerStopped, Qt::QueuedConnection);
        m_knobListener->start();
    }
}

void DeviceManager::stopListeners()
{
    for (EventListener **listener : {&m_broadcastListener, &m_knobListener}) {
        if (!*listener) {
            continue;
        }
        QObject::disconnect(*listener, nullptr, this, nullptr);
        if ((*listener)->stop()) {
            delete *listener;
        } else {
            // Outlives the manager until the thread returns
            (*listener)->setParent(nullptr);
            connect(*listener, &QThread::finished, *listener, &QObject::deleteLater);
        }
        *listener = nullptr;
    }
}

void DeviceManager::onListenerEvent(g6::DeviceEvent event)
{
    if (m_connState == ConnectionState::Disconnected) {
        return;
    }
    if (std::holds_alternative<event::OutputChanged>(event)) {
        m_switching = false;
    } else if (auto* b = std::get_if<event::ButtonPressed>(&event)) {
        if (b->code == proto::ButtonCode::OutputButton) {
            // The relay moves on its own, a route broadcast follows
            m_switching = true;
            m_switchTimer.restart();
        }
    }
    bool changed = m_store.apply(event);
    if (auto* u = std::get_if<event::Unrecognized>(&event)) {
        // Preset, EQ and extended parameter reports have no event of
        // their own but still name a stored setting
        DecodedResponse decoded = decode(u->raw);
        if (std::holds_alternative<AudioValue>(decoded)) {
            changed |= m_store.apply(decoded);
        }
    }
    if (changed) {
        persist();
        emit stateChanged();
    }
    emit deviceEvent(event);
}

void DeviceManager::onListenerStopped(g6::Error reason)
{
    if (reason == Error::Ok || m_connState == ConnectionState::Disconnected) {
        return;
    }
    if (reason == Error::DeviceGone || sender() == m_broadcastListener) {
        teardown(reason);
    } else {
        qCWarning(lcManager) << "Volume knob listener stopped:" << error_str(reason);
    }
}

Error DeviceManager::failSession(Error reason)
{
    teardown(reason == Error::DeviceGone ? Error::DeviceGone : Error::Disconnected);
    return Error::Disconnected;
}

void DeviceManager::teardown(Error reason)
{
    m_cancel = true;
    stopListeners();
    if (m_control) {
        m_control->transport().close();
        m_control.reset();
    }
    m_switching = false;
    // Nothing read from the device survives, only what was persisted
    m_store = StateStore(m_settingsStore.load());

    bool was_connected = m_connState != ConnectionState::Disconnected;
    setConnectionState(ConnectionState::Disconnected);
    if (reason != Error::Ok) {
        qCWarning(lcManager) << "Session ended:" << error_str(reason);
        protocol_console.note(ConsoleDir::Warn, error_str(reason));
    } else {
        qCInfo(lcManager) << "Disconnected";
    }
    if (was_connected) {
        emit disconnected(reason);
    }
    emit stateChanged();
}

void DeviceManager::setConnectionState(ConnectionState state)
{
    if (m_connState == state) {
        return;
    }
    qCDebug(lcManager) << connection_state_str(m_connState) << "->" << connection_state_str(state);
    m_connState = state;
    emit connectionStateChanged(state);
}

void DeviceManager::persist()
{
    if (!m_settingsStore.save(m_store.get())) {
        qCWarning(lcManager) << "Could not persist settings to" << m_settingsStore.file_path();
    }
}

} // namespace g6
