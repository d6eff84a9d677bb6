#include <algorithm>

#include "g6_logging.hpp"
#include "protocol_console.hpp"
#include "transport.hpp"
#include "util.hpp"

namespace g6
{

Report make_report(const Frame& frame)
{
    Report report = {};
    report[0] = proto::report_id;
    std::copy(frame.begin(), frame.end(), report.begin() + 1);
    return report;
}

Error send_frame(Transport& transport, const Frame& frame)
{
    G6_TRACE_FRAME("TX", frame);
    protocol_console.record(ConsoleDir::Tx, frame);
    Error err = transport.write(frame);
    if (err != Error::Ok) {
        qCWarning(lcTransport) << "Write failed:" << error_str(err);
        protocol_console.note(ConsoleDir::Warn, error_str(err));
    }
    return err;
}

Error receive_frame(Transport& transport, Frame& frame, int timeout_ms)
{
    Error err = transport.read(frame, timeout_ms);
    if (err == Error::Ok) {
        G6_TRACE_FRAME("RX", frame);
        protocol_console.record(ConsoleDir::Rx, frame);
    } else if (err != Error::Timeout) {
        qCWarning(lcTransport) << "Read failed:" << error_str(err);
        protocol_console.note(ConsoleDir::Warn, error_str(err));
    }
    return err;
}

SharedTransport::SharedTransport(std::unique_ptr<Transport> transport)
    : m_transport(std::move(transport)), m_lastCommandEnd(-1), m_waiting(0)
{
    m_clock.start();
}

void SharedTransport::mark_command_end()
{
    m_lastCommandEnd = m_clock.elapsed();
}

bool SharedTransport::in_quiet_window(int window_ms) const
{
    qint64 last = m_lastCommandEnd;
    return last >= 0 && (m_clock.elapsed() - last) < window_ms;
}

CommandLock::CommandLock(SharedTransport& shared)
    : m_shared(shared)
{
    ++m_shared.m_waiting;
    m_shared.m_mutex.lock();
    --m_shared.m_waiting;
}

CommandLock::~CommandLock()
{
    m_shared.mark_command_end();
    m_shared.m_mutex.unlock();
}

} // namespace g6
