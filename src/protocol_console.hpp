#pragma once

#include <cstdint>
#include <vector>

#include <QMutex>

#include <etl/circular_buffer.h>
#include <etl/string.h>

#include "g6_types.hpp"

namespace g6
{

constexpr size_t console_hex_len = 192;
constexpr size_t console_text_len = 128;
constexpr size_t console_lines = 256;

enum class ConsoleDir : uint8_t {Tx = 0, Rx, Info, Warn};

constexpr const char* console_dir_str(ConsoleDir dir)
{
    switch (dir) {
        case ConsoleDir::Tx:   return "TX";
        case ConsoleDir::Rx:   return "RX";
        case ConsoleDir::Info: return "INFO";
        case ConsoleDir::Warn: return "WARN";
        default:               return "?";
    }
}

struct ConsoleMessage
{
    int64_t ts_ms = 0;
    ConsoleDir dir = ConsoleDir::Info;
    etl::string<console_hex_len> hex;
    etl::string<console_text_len> text;
};

/* Bounded history of the frames that crossed the wire, newest last.
   Oldest messages are overwritten once full. */
class ProtocolConsole
{
public:
    void record(ConsoleDir dir, const Frame& frame);
    void note(ConsoleDir dir, const char* text);

    std::vector<ConsoleMessage> messages() const;
    size_t size() const;
    void clear();

    void set_enabled(bool enabled);

private:
    void push(const ConsoleMessage& msg);

    etl::circular_buffer<ConsoleMessage, console_lines> buffer;
    bool enabled = true;
    mutable QMutex mtx;
};

extern ProtocolConsole protocol_console;

} // namespace g6
