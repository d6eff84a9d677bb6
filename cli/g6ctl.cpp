#include <csignal>

#include <sys/socket.h>
#include <unistd.h>

#include <QCoreApplication>
#include <QDateTime>
#include <QTimer>

#include "g6_logging.hpp"
#include "hidraw_transport.hpp"
#include "protocol_console.hpp"
#include "util.hpp"

#include "g6ctl.h"

using namespace g6;

namespace
{

constexpr int exit_ok = 0;
constexpr int exit_usage = 1;
constexpr int exit_device = 2;

int sigint_fd[2] = {-1, -1};

void sigint_handler(int)
{
    char c = 1;
    ssize_t res = ::write(sigint_fd[0], &c, sizeof(c));
    (void)res;
}

bool parse_on_off(const QString &s, bool &value)
{
    if (s == "on" || s == "1" || s == "true") {
        value = true;
        return true;
    }
    if (s == "off" || s == "0" || s == "false") {
        value = false;
        return true;
    }
    return false;
}

bool parse_effect(const QString &s, Effect &effect)
{
    static const struct { const char *name; Effect effect; } names[] = {
        {"surround", Effect::Surround},
        {"crystalizer", Effect::Crystalizer},
        {"bass", Effect::Bass},
        {"smart-volume", Effect::SmartVolume},
        {"dialog-plus", Effect::DialogPlus},
    };
    for (const auto &n : names) {
        if (s == n.name) {
            effect = n.effect;
            return true;
        }
    }
    return false;
}

QString on_off(bool b)
{
    return b ? "on" : "off";
}

QString describe_event(const DeviceEvent &event)
{
    if (auto *o = std::get_if<event::OutputChanged>(&event)) {
        return QString("output %1").arg(QString(output_str(o->output)));
    }
    if (auto *t = std::get_if<event::EffectToggled>(&event)) {
        return QString("%1 %2").arg(QString(effect_str(t->effect)), on_off(t->enabled));
    }
    if (auto *v = std::get_if<event::EffectValueChanged>(&event)) {
        return QString("%1 level %2").arg(QString(effect_str(v->effect))).arg((int)v->value);
    }
    if (auto *m = std::get_if<event::ModeChanged>(&event)) {
        return QString("%1 mode %2").arg(QString(mode_str(m->mode)), on_off(m->enabled));
    }
    if (auto *b = std::get_if<event::ButtonPressed>(&event)) {
        return QString("button 0x%1").arg((int)b->code, 2, 16, QChar('0'));
    }
    if (auto *k = std::get_if<event::VolumeKnobTurned>(&event)) {
        return QString("volume knob %1").arg((int)k->delta);
    }
    auto &raw = std::get<event::Unrecognized>(event).raw;
    return QString("unrecognized %1").arg(QString::fromStdString(hex_dump(raw, 16)));
}

} // namespace

G6Ctl::G6Ctl(std::unique_ptr<g6::TransportFactory> factory, const QString &statePath, QObject *parent)
    : QObject{parent}, m_manager(std::move(factory), statePath, this), m_out(stdout), m_err(stderr), m_sigNotifier(nullptr)
{
    QObject::connect(&m_manager, &DeviceManager::deviceEvent, this, &G6Ctl::onDeviceEvent);
    QObject::connect(&m_manager, &DeviceManager::warning, this, &G6Ctl::onWarning);
    QObject::connect(&m_manager, &DeviceManager::disconnected, this, &G6Ctl::onDisconnected);
}

G6Ctl::~G6Ctl()
{
    m_manager.disconnectDevice();
}

QString G6Ctl::usage()
{
    return "Commands:\n"
           "  list                                  List G6 hidraw nodes\n"
           "  status                                Read and print the device state\n"
           "  output <speakers|headphones|toggle>   Switch the output relay\n"
           "  effect <name> <on|off> <0-100>        name: surround, crystalizer, bass,\n"
           "                                        smart-volume, dialog-plus\n"
           "  mode <sbx|scout> <on|off>             Switch SBX or Scout mode\n"
           "  preset <none|night|loud>              Smart Volume preset\n"
           "  eq <band> <value>                     Write a raw equalizer band value\n"
           "  sync                                  Re-read every setting\n"
           "  monitor [seconds]                     Print device events\n"
           "  console                               Print the protocol console after a status read\n"
           "  raw <digital-filter|system-a|system-b|firmware-binary>\n";
}

int G6Ctl::run(const QStringList &args)
{
    if (args.isEmpty()) {
        m_err << usage();
        return exit_usage;
    }
    QString cmd = args.first();
    QStringList rest = args.mid(1);

    if (cmd == "list") return cmdList();
    if (cmd == "status") return cmdStatus();
    if (cmd == "output") return cmdOutput(rest);
    if (cmd == "effect") return cmdEffect(rest);
    if (cmd == "mode") return cmdMode(rest);
    if (cmd == "preset") return cmdPreset(rest);
    if (cmd == "eq") return cmdEq(rest);
    if (cmd == "sync") return cmdSync();
    if (cmd == "monitor") return cmdMonitor(rest);
    if (cmd == "console") return cmdConsole();
    if (cmd == "raw") return cmdRaw(rest);

    m_err << "Unknown command: " << cmd << "\n" << usage();
    return exit_usage;
}

bool G6Ctl::ensureConnected()
{
    if (m_manager.isConnected()) {
        return true;
    }
    Error err = m_manager.connectDevice();
    if (err != Error::Ok) {
        m_err << "Could not connect: " << error_str(err) << "\n";
        m_err.flush();
        return false;
    }
    return true;
}

int G6Ctl::finish(Error err)
{
    if (err != Error::Ok) {
        m_err << "Error: " << error_str(err) << "\n";
        m_err.flush();
        return err == Error::InvalidOperation ? exit_usage : exit_device;
    }
    m_out.flush();
    return exit_ok;
}

void G6Ctl::printState()
{
    SettingsState s = m_manager.state();
    m_out << "Connected:   " << (s.connected ? "yes" : "no") << "\n";
    m_out << "Firmware:    " << QString::fromStdString(s.firmware_version) << "\n";
    m_out << "Output:      " << output_str(s.output) << "\n";
    for (size_t i = 0; i < num_effects; ++i) {
        Effect e = static_cast<Effect>(i);
        m_out << QString("%1 %2 %3")
                 .arg(QString(effect_str(e)) + ":", -12)
                 .arg(on_off(s.effect(e).enabled), -3)
                 .arg((int)s.effect(e).value);
        // Capabilities are only known after a live read
        if (s.capabilities.raw != 0 && !s.capabilities.supports(e)) {
            m_out << " (not supported)";
        }
        m_out << "\n";
    }
    m_out << "SV preset:   " << preset_str(s.smart_volume_preset) << "\n";
    m_out << "SBX mode:    " << on_off(s.sbx_enabled) << "\n";
    m_out << "Scout mode:  " << on_off(s.scout_enabled) << "\n";
    m_out << "Capabilities: 0x" << QString::number(s.capabilities.raw, 16) << "\n";
    if (s.eq_enabled) {
        m_out << "EQ:          " << on_off(*s.eq_enabled) << "\n";
    }
    for (const auto &[band, value] : s.eq_bands) {
        m_out << "  EQ band " << (int)band << ": " << value.value << "\n";
    }
    for (const auto &[code, value] : s.extended_params) {
        m_out << "  Param 0x" << QString::number(code, 16) << ": " << value << "\n";
    }
    if (s.last_full_read_ms > 0) {
        m_out << "Last read:   " << QDateTime::fromMSecsSinceEpoch(s.last_full_read_ms).toString(Qt::ISODate) << "\n";
    }
    m_out.flush();
}

int G6Ctl::cmdList()
{
    auto nodes = enumerate_g6_nodes();
    if (nodes.empty()) {
        m_err << "No G6 found\n";
        return exit_device;
    }
    for (const auto &node : nodes) {
        m_out << QString::fromStdString(node.devnode) << " interface " << node.interface_number << "\n";
    }
    m_out.flush();
    return exit_ok;
}

int G6Ctl::cmdStatus()
{
    if (!ensureConnected()) {
        return exit_device;
    }
    printState();
    return exit_ok;
}

int G6Ctl::cmdOutput(const QStringList &args)
{
    if (args.size() != 1) {
        m_err << usage();
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    const QString &target = args.first();
    if (target == "toggle") {
        return finish(m_manager.toggleOutput());
    }
    if (target == "speakers") {
        return finish(m_manager.setOutput(Output::Speakers));
    }
    if (target == "headphones") {
        return finish(m_manager.setOutput(Output::Headphones));
    }
    m_err << "Unknown output: " << target << "\n";
    return exit_usage;
}

int G6Ctl::cmdEffect(const QStringList &args)
{
    Effect effect;
    bool enabled;
    bool ok = false;
    int level = args.size() == 3 ? args[2].toInt(&ok) : -1;
    if (args.size() != 3 || !parse_effect(args[0], effect) || !parse_on_off(args[1], enabled) || !ok) {
        m_err << usage();
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    return finish(m_manager.setEffect(effect, enabled, level));
}

int G6Ctl::cmdMode(const QStringList &args)
{
    bool enabled;
    if (args.size() != 2 || !parse_on_off(args[1], enabled) || (args[0] != "sbx" && args[0] != "scout")) {
        m_err << usage();
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    return finish(m_manager.setMode(args[0] == "sbx" ? Mode::Sbx : Mode::Scout, enabled));
}

int G6Ctl::cmdPreset(const QStringList &args)
{
    if (args.size() != 1) {
        m_err << usage();
        return exit_usage;
    }
    SmartVolumePreset preset;
    if (args[0] == "none") {
        preset = SmartVolumePreset::None;
    } else if (args[0] == "night") {
        preset = SmartVolumePreset::Night;
    } else if (args[0] == "loud") {
        preset = SmartVolumePreset::Loud;
    } else {
        m_err << "Unknown preset: " << args[0] << "\n";
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    return finish(m_manager.setSmartVolumePreset(preset));
}

int G6Ctl::cmdEq(const QStringList &args)
{
    bool band_ok = false;
    bool value_ok = false;
    int band = args.size() == 2 ? args[0].toInt(&band_ok, 0) : -1;
    float value = args.size() == 2 ? args[1].toFloat(&value_ok) : 0.0f;
    if (!band_ok || !value_ok || band < 0 || band > 0xff) {
        m_err << usage();
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    return finish(m_manager.setEqBand((uint8_t)band, value));
}

int G6Ctl::cmdSync()
{
    if (!ensureConnected()) {
        return exit_device;
    }
    Error err = m_manager.synchronize();
    if (err == Error::Ok) {
        printState();
    }
    return finish(err);
}

int G6Ctl::cmdMonitor(const QStringList &args)
{
    if (!ensureConnected()) {
        return exit_device;
    }
    installSigintHandler();
    if (!args.isEmpty()) {
        bool ok = false;
        int seconds = args.first().toInt(&ok);
        if (!ok || seconds <= 0) {
            m_err << usage();
            return exit_usage;
        }
        QTimer::singleShot(seconds * 1000, qApp, &QCoreApplication::quit);
    }
    m_out << "Listening for device events, Ctrl+C to stop\n";
    m_out.flush();
    QCoreApplication::exec();
    return m_manager.isConnected() ? exit_ok : exit_device;
}

int G6Ctl::cmdConsole()
{
    if (!ensureConnected()) {
        return exit_device;
    }
    for (const auto &msg : protocol_console.messages()) {
        m_out << QDateTime::fromMSecsSinceEpoch(msg.ts_ms).toString("hh:mm:ss.zzz") << " "
              << QString(console_dir_str(msg.dir)).leftJustified(4) << " "
              << msg.text.c_str();
        if (!msg.hex.empty()) {
            m_out << "\n    " << msg.hex.c_str();
        }
        m_out << "\n";
    }
    m_out.flush();
    return exit_ok;
}

int G6Ctl::cmdRaw(const QStringList &args)
{
    op::QueryKind kind;
    QString which = args.isEmpty() ? QString() : args.first();
    if (which == "digital-filter") {
        kind = op::QueryKind::DigitalFilter;
    } else if (which == "system-a") {
        kind = op::QueryKind::SystemConfigA;
    } else if (which == "system-b") {
        kind = op::QueryKind::SystemConfigB;
    } else if (which == "firmware-binary") {
        kind = op::QueryKind::FirmwareBinary;
    } else {
        m_err << usage();
        return exit_usage;
    }
    if (!ensureConnected()) {
        return exit_device;
    }
    std::optional<Frame> reply;
    Error err = m_manager.readRaw(kind, reply);
    if (err == Error::Ok) {
        if (reply) {
            m_out << QString::fromStdString(hex_dump(*reply, used_len(*reply))) << "\n";
        } else {
            m_out << "No reply\n";
        }
    }
    return finish(err);
}

void G6Ctl::installSigintHandler()
{
    if (m_sigNotifier) {
        return;
    }
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sigint_fd) != 0) {
        qCWarning(lcCli) << "Could not create signal socket pair";
        return;
    }
    m_sigNotifier = new QSocketNotifier(sigint_fd[1], QSocketNotifier::Read, this);
    QObject::connect(m_sigNotifier, &QSocketNotifier::activated, this, &G6Ctl::onSigint);
    std::signal(SIGINT, sigint_handler);
}

void G6Ctl::onSigint()
{
    m_sigNotifier->setEnabled(false);
    char c;
    ssize_t res = ::read(sigint_fd[1], &c, sizeof(c));
    (void)res;
    QCoreApplication::quit();
}

void G6Ctl::onDeviceEvent(g6::DeviceEvent event)
{
    m_out << QDateTime::currentDateTime().toString("hh:mm:ss.zzz") << " " << describe_event(event) << "\n";
    m_out.flush();
}

void G6Ctl::onWarning(g6::Error warning)
{
    m_err << "Warning: " << error_str(warning) << "\n";
    m_err.flush();
}

void G6Ctl::onDisconnected(g6::Error reason)
{
    if (reason != Error::Ok) {
        m_err << "Device disconnected: " << error_str(reason) << "\n";
        m_err.flush();
        QCoreApplication::exit(exit_device);
    }
}
