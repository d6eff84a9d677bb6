#include <mutex>

#include <QDeadlineTimer>

#include "event_listener.hpp"
#include "g6_logging.hpp"
#include "response_parser.hpp"
#include "runtime_settings.hpp"
#include "util.hpp"

namespace g6
{

constexpr int max_io_errors = 5;

std::vector<DeviceEvent> events_from(const DecodedResponse& decoded, const Frame& raw)
{
    std::vector<DeviceEvent> events;
    if (auto* r = std::get_if<Route>(&decoded)) {
        events.push_back(event::OutputChanged{r->output});
    } else if (auto* v = std::get_if<AudioValue>(&decoded)) {
        auto slot = v->space == proto::Space::Sbx ? effect_slot(v->feature) : std::nullopt;
        bool enabled;
        uint8_t level;
        if (slot && slot->is_toggle && unit_to_toggle(v->value, enabled)) {
            events.push_back(event::EffectToggled{slot->effect, enabled});
        } else if (slot && !slot->is_toggle && unit_to_level(v->value, level)) {
            events.push_back(event::EffectValueChanged{slot->effect, level});
        } else {
            events.push_back(event::Unrecognized{raw});
        }
    } else if (auto* g = std::get_if<GamingModes>(&decoded)) {
        events.push_back(event::ModeChanged{Mode::Sbx, g->sbx});
        events.push_back(event::ModeChanged{Mode::Scout, g->scout});
    } else if (auto* m = std::get_if<ModeReport>(&decoded)) {
        events.push_back(event::ModeChanged{m->mode, m->enabled});
    } else if (auto* b = std::get_if<ButtonState>(&decoded)) {
        events.push_back(event::ButtonPressed{b->code});
    } else if (auto* k = std::get_if<KnobDelta>(&decoded)) {
        events.push_back(event::VolumeKnobTurned{k->delta});
    } else if (used_len(raw) > 0) {
        events.push_back(event::Unrecognized{raw});
    }
    return events;
}

bool is_command_response(const DecodedResponse& decoded)
{
    return !std::holds_alternative<ButtonState>(decoded) && !std::holds_alternative<KnobDelta>(decoded);
}

EventListener::EventListener(std::shared_ptr<SharedTransport> control, QObject *parent)
    : QThread{parent}, m_control(std::move(control)), m_stop(false),
      m_pollMs(runtime_settings.get_listener_poll_ms()),
      m_quietMs(runtime_settings.get_quiet_window_ms())
{
}

EventListener::EventListener(std::unique_ptr<Transport> knob, QObject *parent)
    : QThread{parent}, m_knob(std::move(knob)), m_stop(false),
      m_pollMs(runtime_settings.get_listener_poll_ms()),
      m_quietMs(0)
{
}

EventListener::~EventListener()
{
    stop();
}

bool EventListener::stop(int timeout_ms)
{
    m_stop = true;
    if (!isRunning()) {
        return true;
    }
    bool finished = wait(QDeadlineTimer(timeout_ms));
    if (!finished) {
        qCWarning(lcListener) << "Listener did not stop within" << timeout_ms << "ms";
    }
    return finished;
}

Error EventListener::readShared(Frame& frame, bool& stale_window)
{
    if (m_control->command_waiting()) {
        msleep(1);
        return Error::Timeout;
    }
    if (!m_control->mutex().tryLock(m_pollMs)) {
        return Error::Timeout;
    }
    std::lock_guard<QMutex> guard(m_control->mutex(), std::adopt_lock);
    Error err = receive_frame(m_control->transport(), frame, m_pollMs);
    stale_window = m_control->in_quiet_window(m_quietMs);
    return err;
}

void EventListener::publish(const DecodedResponse& decoded, const Frame& frame, bool stale_window)
{
    if (stale_window && is_command_response(decoded)) {
        qCDebug(lcListener) << "Dropping replayed command response";
        return;
    }
    for (const auto& ev : events_from(decoded, frame)) {
        if (std::holds_alternative<event::Unrecognized>(ev)) {
            qCDebug(lcListener).noquote() << "Unrecognized broadcast" << QString::fromStdString(hex_dump(frame, 16));
        }
        emit deviceEvent(ev);
    }
}

void EventListener::run()
{
    const char* name = isKnobChannel() ? "knob" : "broadcast";
    qCInfo(lcListener) << "Listening on" << name << "channel";

    int io_errors = 0;
    Error reason = Error::Ok;
    while (!m_stop) {
        Frame frame = {};
        bool stale_window = false;
        Error err = isKnobChannel() ? receive_frame(*m_knob, frame, m_pollMs)
                                    : readShared(frame, stale_window);
        if (err == Error::Timeout) {
            continue;
        }
        if (err == Error::DeviceGone) {
            reason = err;
            break;
        }
        if (err != Error::Ok) {
            if (++io_errors >= max_io_errors) {
                reason = err;
                break;
            }
            continue;
        }
        io_errors = 0;
        publish(isKnobChannel() ? decode_knob(frame) : decode(frame), frame, stale_window);
    }

    if (reason != Error::Ok) {
        qCWarning(lcListener) << "Listener on" << name << "channel stopped:" << error_str(reason);
    } else {
        qCDebug(lcListener) << "Listener on" << name << "channel stopped";
    }
    emit listenerStopped(reason);
}

} // namespace g6
