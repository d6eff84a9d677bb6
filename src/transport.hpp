#pragma once

#include <array>
#include <atomic>
#include <memory>

#include <QElapsedTimer>
#include <QMutex>

#include <g6_errors.hpp>

#include "g6_types.hpp"

namespace g6
{

using Report = std::array<uint8_t, proto::report_len>;

// Prepends the report id. Without it the first payload byte is eaten
// as the report id and every following field shifts.
Report make_report(const Frame& frame);

/* One physical HID channel. Callers serialize access. */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual Error write(const Frame& frame) = 0;
    // Ok with a frame, Timeout when nothing arrived, DeviceGone on removal
    virtual Error read(Frame& frame, int timeout_ms) = 0;
    virtual void close() = 0;
};

// Write and read through the protocol console and frame trace
Error send_frame(Transport& transport, const Frame& frame);
Error receive_frame(Transport& transport, Frame& frame, int timeout_ms);

/* The control channel is shared between the manager and the broadcast
   listener. Whoever holds the mutex owns the pipe. The manager stamps
   the end of each command sequence so the listener can tell replayed
   command responses from real broadcasts. */
class SharedTransport
{
public:
    explicit SharedTransport(std::unique_ptr<Transport> transport);

    Transport& transport() { return *m_transport; }
    QMutex& mutex() { return m_mutex; }

    void mark_command_end();
    bool in_quiet_window(int window_ms) const;

    // The listener backs off while a command sequence waits for the pipe
    bool command_waiting() const { return m_waiting > 0; }

private:
    friend class CommandLock;

    std::unique_ptr<Transport> m_transport;
    QMutex m_mutex;
    QElapsedTimer m_clock;
    std::atomic<qint64> m_lastCommandEnd;
    std::atomic<int> m_waiting;
};

/* Holds the control channel for a whole write-then-confirm sequence */
class CommandLock
{
public:
    explicit CommandLock(SharedTransport& shared);
    ~CommandLock();

    CommandLock(const CommandLock&) = delete;
    CommandLock& operator=(const CommandLock&) = delete;

private:
    SharedTransport& m_shared;
};

/* Opens the device channels. The hidraw implementation enumerates
   through udev, tests substitute an in-memory device. */
class TransportFactory
{
public:
    virtual ~TransportFactory() = default;

    virtual Error open_control(std::unique_ptr<Transport>& transport) = 0;
    // A missing knob channel is not an error, transport stays null
    virtual Error open_knob(std::unique_ptr<Transport>& transport) = 0;
};

} // namespace g6
