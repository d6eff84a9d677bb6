#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <QElapsedTimer>
#include <QObject>
#include <QString>

#include <g6_errors.hpp>

#include "command_encoder.hpp"
#include "event_listener.hpp"
#include "settings_store.hpp"
#include "state_store.hpp"
#include "transport.hpp"

namespace g6
{

enum class ConnectionState : uint8_t
{
    Disconnected = 0,
    Connecting,
    Syncing,
    Ready,
    Writing,
};

enum class OutputState : uint8_t {Speakers = 0, Headphones, Switching};

constexpr const char* connection_state_str(ConnectionState s)
{
    switch (s) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Syncing:      return "Syncing";
        case ConnectionState::Ready:        return "Ready";
        case ConnectionState::Writing:      return "Writing";
        default:                            return "Unknown";
    }
}

/* Owns the device session. All methods run on the thread the manager
   lives on, listener events reach it as queued signals so the state
   store only ever has one writer. cancel() is the one exception and
   may be called from anywhere. */
class DeviceManager : public QObject
{
    Q_OBJECT

public:
    DeviceManager(std::unique_ptr<TransportFactory> factory, const QString &statePath, QObject *parent = nullptr);
    virtual ~DeviceManager();

    Error connectDevice();
    void disconnectDevice();
    void cancel();

    // Full resync of an open session
    Error synchronize();

    SettingsState state() const;
    ConnectionState connectionState() const { return m_connState; }
    OutputState outputState();
    bool isConnected() const;

    Error setEffect(Effect effect, bool enabled, int level);
    Error setToggle(Feature feature, bool enabled);
    Error setLevel(Feature feature, int level);
    Error setSmartVolumePreset(SmartVolumePreset preset);
    Error setEqBand(uint8_t band, float value);
    Error setMode(Mode mode, bool enabled);
    Error setOutput(Output output);
    Error toggleOutput();

    // Sends a query and returns the first reply, if any arrived
    Error readRaw(op::QueryKind kind, std::optional<Frame> &reply);

    // UnconfirmedWrite from the last write, Ok otherwise
    Error lastWarning() const { return m_lastWarning; }

signals:
    void deviceEvent(g6::DeviceEvent event);
    void stateChanged();
    void connectionStateChanged(g6::ConnectionState state);
    void warning(g6::Error warning);
    void disconnected(g6::Error reason);

private slots:
    void onListenerEvent(g6::DeviceEvent event);
    void onListenerStopped(g6::Error reason);

private:
    using Matcher = std::function<bool(const DecodedResponse&)>;

    struct Expectation
    {
        Matcher matches;
        bool confirmed = false;
    };

    Error beginOperation(const Operation &operation, std::vector<Frame> &frames);
    Error writeAndConfirm(const std::vector<Frame> &frames, std::vector<Expectation> &expectations);
    Error drain(SharedTransport &control, std::vector<Expectation> &expectations);
    Error runWrite(const Operation &operation, std::vector<Expectation> expectations, const std::function<bool()> &apply);

    Error fullSync();
    Error runQuery(SharedTransport &control, const Frame &query, const Matcher &matches, int timeout_ms,
                   std::optional<DecodedResponse> &reply, Frame *raw = nullptr);

    void startListeners(std::unique_ptr<Transport> knob);
    void stopListeners();
    void teardown(Error reason);
    Error failSession(Error reason);

    void setConnectionState(ConnectionState state);
    void refreshOutputPhase();
    void persist();

    static Matcher audioValueMatcher(proto::Space space, uint8_t code, std::function<bool(float)> valueMatches);

    std::unique_ptr<TransportFactory> m_factory;
    std::shared_ptr<SharedTransport> m_control;
    EventListener *m_broadcastListener;
    EventListener *m_knobListener;

    StateStore m_store;
    SettingsStore m_settingsStore;

    ConnectionState m_connState;
    bool m_switching;
    QElapsedTimer m_switchTimer;

    std::atomic<bool> m_cancel;
    Error m_lastWarning;
};

} // namespace g6

Q_DECLARE_METATYPE(g6::ConnectionState)
