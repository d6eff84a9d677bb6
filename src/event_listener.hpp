#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include <QMetaType>
#include <QThread>

#include <g6_errors.hpp>

#include "g6_types.hpp"
#include "transport.hpp"

namespace g6
{

// Broadcast view of a decoded frame. Returns nothing for frames that
// carry no event, such as an idle knob report.
std::vector<DeviceEvent> events_from(const DecodedResponse& decoded, const Frame& raw);

// True for replies the device replays after a command
bool is_command_response(const DecodedResponse& decoded);

/* Polls one unsolicited channel and publishes DeviceEvents. The
   broadcast channel shares the control transport with the manager and
   only reads between command sequences. The knob channel has its own
   node and owns it. Never writes. */
class EventListener : public QThread
{
    Q_OBJECT

public:
    explicit EventListener(std::shared_ptr<SharedTransport> control, QObject *parent = nullptr);
    explicit EventListener(std::unique_ptr<Transport> knob, QObject *parent = nullptr);
    virtual ~EventListener();

    // Cooperative stop, returns false if the thread did not finish in time
    bool stop(int timeout_ms = 2000);

    bool isKnobChannel() const { return m_knob != nullptr; }

signals:
    void deviceEvent(g6::DeviceEvent event);
    void listenerStopped(g6::Error reason);

protected:
    void run() override;

private:
    Error readShared(Frame& frame, bool& stale_window);
    void publish(const DecodedResponse& decoded, const Frame& frame, bool stale_window);

    std::shared_ptr<SharedTransport> m_control;
    std::unique_ptr<Transport> m_knob;
    std::atomic<bool> m_stop;
    int m_pollMs;
    int m_quietMs;
};

} // namespace g6

Q_DECLARE_METATYPE(g6::DeviceEvent)
Q_DECLARE_METATYPE(g6::Error)
