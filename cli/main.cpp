#include <QCommandLineParser>
#include <QCoreApplication>

#include "g6_logging.hpp"
#include "hidraw_transport.hpp"
#include "protocol_console.hpp"
#include "runtime_settings.hpp"

#include "g6ctl.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("G6Control");
    QCoreApplication::setApplicationName("g6control");
    QCoreApplication::setApplicationVersion("0.3.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Control the Sound Blaster X G6 over its vendor HID protocol.\n\n" + G6Ctl::usage());
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption logLevelOpt("log-level", "Log level: error, info, debug or protocol.", "level");
    QCommandLineOption drainOpt("drain-reads", "Reads spent confirming a write.", "n");
    QCommandLineOption stateOpt("state-file", "Where the last known settings are kept.", "path");
    parser.addOption(logLevelOpt);
    parser.addOption(drainOpt);
    parser.addOption(stateOpt);
    parser.addPositionalArgument("command", "Command to run, see above.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    g6::runtime_settings.init();
    if (parser.isSet(logLevelOpt)) {
        g6::LogLevel level = g6::str_to_log_level(parser.value(logLevelOpt).toStdString());
        if (level == g6::LogLevel::None) {
            qCritical() << "Unknown log level" << parser.value(logLevelOpt);
            return 1;
        }
        g6::runtime_settings.set_log_level(level);
    }
    if (parser.isSet(drainOpt)) {
        bool ok = false;
        int reads = parser.value(drainOpt).toInt(&ok);
        if (!ok || reads < 1) {
            qCritical() << "--drain-reads needs a positive number";
            return 1;
        }
        g6::runtime_settings.set_drain_max_reads(reads);
    }
    if (parser.isSet(stateOpt)) {
        g6::runtime_settings.set_state_path(parser.value(stateOpt));
    }

    g6::apply_log_level(g6::runtime_settings.get_log_level());
    g6::protocol_console.set_enabled(g6::runtime_settings.get_console_enabled());

    G6Ctl ctl(std::make_unique<g6::HidrawTransportFactory>(g6::runtime_settings.get_knob_interface()),
              g6::runtime_settings.get_state_path());
    return ctl.run(parser.positionalArguments());
}
