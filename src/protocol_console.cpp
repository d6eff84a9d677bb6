#include <QMutexLocker>

#include "protocol_console.hpp"
#include "response_parser.hpp"
#include "util.hpp"

namespace g6
{

ProtocolConsole protocol_console;

void ProtocolConsole::record(ConsoleDir dir, const Frame& frame)
{
    {
        QMutexLocker lock(&mtx);
        if (!enabled) {
            return;
        }
    }
    ConsoleMessage msg;
    msg.ts_ms = epoch_ms();
    msg.dir = dir;
    std::string hex = hex_dump(frame, used_len(frame));
    msg.hex.assign(hex.c_str(), hex.size() < console_hex_len ? hex.size() : console_hex_len);
    std::string text = describe_frame(frame);
    msg.text.assign(text.c_str(), text.size() < console_text_len ? text.size() : console_text_len);
    push(msg);
}

void ProtocolConsole::note(ConsoleDir dir, const char* text)
{
    {
        QMutexLocker lock(&mtx);
        if (!enabled) {
            return;
        }
    }
    ConsoleMessage msg;
    msg.ts_ms = epoch_ms();
    msg.dir = dir;
    msg.text.assign(text);
    push(msg);
}

void ProtocolConsole::push(const ConsoleMessage& msg)
{
    QMutexLocker lock(&mtx);
    buffer.push(msg);
}

std::vector<ConsoleMessage> ProtocolConsole::messages() const
{
    QMutexLocker lock(&mtx);
    return std::vector<ConsoleMessage>(buffer.begin(), buffer.end());
}

size_t ProtocolConsole::size() const
{
    QMutexLocker lock(&mtx);
    return buffer.size();
}

void ProtocolConsole::clear()
{
    QMutexLocker lock(&mtx);
    buffer.clear();
}

void ProtocolConsole::set_enabled(bool is_enabled)
{
    QMutexLocker lock(&mtx);
    enabled = is_enabled;
}

} // namespace g6
