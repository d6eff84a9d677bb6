#pragma once

#include <cstdint>
#include <string_view>

#include <QLoggingCategory>

namespace g6
{

enum class LogLevel : uint8_t
{
    None = 0,
    Error,
    Info,
    Debug,
    Protocol,
};

constexpr const char* log_level_to_str(LogLevel level)
{
    switch (level) {
        case LogLevel::Error:    return "error";
        case LogLevel::Info:     return "info";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Protocol: return "protocol";
        default:                 return "none";
    }
}

constexpr LogLevel str_to_log_level(std::string_view str)
{
    if (str == "error") return LogLevel::Error;
    if (str == "info") return LogLevel::Info;
    if (str == "debug") return LogLevel::Debug;
    if (str == "protocol") return LogLevel::Protocol;
    return LogLevel::None;
}

// Installs category filter rules for the given level
void apply_log_level(LogLevel level);

bool frame_tracing_enabled();

} // namespace g6

Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcProtocol)
Q_DECLARE_LOGGING_CATEGORY(lcListener)
Q_DECLARE_LOGGING_CATEGORY(lcManager)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

#define G6_TRACE_FRAME(dir, frame) \
    if (g6::frame_tracing_enabled()) { \
        qCDebug(lcProtocol).noquote() << (dir) << QString::fromStdString(g6::hex_dump((frame), g6::used_len(frame))); \
    }
