#include <atomic>

#include <QString>

#include "g6_logging.hpp"

Q_LOGGING_CATEGORY(lcTransport, "g6.transport")
Q_LOGGING_CATEGORY(lcProtocol, "g6.protocol")
Q_LOGGING_CATEGORY(lcListener, "g6.listener")
Q_LOGGING_CATEGORY(lcManager, "g6.manager")
Q_LOGGING_CATEGORY(lcSettings, "g6.settings")
Q_LOGGING_CATEGORY(lcCli, "g6.cli")

namespace g6
{

static std::atomic<bool> trace_frames{false};

void apply_log_level(LogLevel level)
{
    QString rules;
    switch (level) {
    case LogLevel::None:
        rules = "g6.*=false";
        break;
    case LogLevel::Error:
        rules = "g6.*.debug=false\ng6.*.info=false\ng6.*.warning=true\ng6.*.critical=true";
        break;
    case LogLevel::Info:
        rules = "g6.*.debug=false\ng6.*.info=true";
        break;
    case LogLevel::Debug:
        rules = "g6.*=true\ng6.protocol.debug=false";
        break;
    case LogLevel::Protocol:
        rules = "g6.*=true";
        break;
    }
    trace_frames = (level == LogLevel::Protocol);
    QLoggingCategory::setFilterRules(rules);
}

bool frame_tracing_enabled()
{
    return trace_frames;
}

} // namespace g6
