#include <QDir>
#include <QMutexLocker>
#include <QSettings>
#include <QStandardPaths>

#include "runtime_settings.hpp"

namespace g6
{

RuntimeSettings runtime_settings;

namespace
{

int clamp_int(int v, int lo, int hi)
{
    return v < lo ? lo : (v > hi ? hi : v);
}

QString default_state_path()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty()) {
        dir = QDir::homePath() + "/.config/g6control";
    }
    return dir + "/settings.json";
}

template <typename T>
bool get_key(QSettings& store, const char* key, T& var)
{
    QVariant v = store.value(key);
    if (!v.isValid() || !v.canConvert<T>()) {
        return false;
    }
    var = v.value<T>();
    return true;
}

} // namespace

void RuntimeSettings::init()
{
    QSettings store("G6Control", "g6control");
    init(store);
}

void RuntimeSettings::init(QSettings& store)
{
    QMutexLocker lock(&mtx);
    get_settings(store);
}

void RuntimeSettings::get_settings(QSettings& store)
{
    if (get_key(store, SettingKey::drain_max_reads, drain_max_reads)) {
        drain_max_reads = clamp_int(drain_max_reads, 1, max_drain_reads);
    }
    if (get_key(store, SettingKey::drain_read_timeout, drain_read_timeout_ms)) {
        drain_read_timeout_ms = clamp_int(drain_read_timeout_ms, 1, 5000);
    }
    if (get_key(store, SettingKey::query_timeout, query_timeout_ms)) {
        query_timeout_ms = clamp_int(query_timeout_ms, 1, 10000);
    }
    if (get_key(store, SettingKey::max_consecutive_timeouts, max_consecutive_timeouts)) {
        max_consecutive_timeouts = clamp_int(max_consecutive_timeouts, 1, 100);
    }
    if (get_key(store, SettingKey::listener_poll, listener_poll_ms)) {
        listener_poll_ms = clamp_int(listener_poll_ms, 10, 1000);
    }
    if (get_key(store, SettingKey::quiet_window, quiet_window_ms)) {
        quiet_window_ms = clamp_int(quiet_window_ms, 0, 10000);
    }
    if (get_key(store, SettingKey::output_settle, output_settle_ms)) {
        output_settle_ms = clamp_int(output_settle_ms, 0, 30000);
    }
    get_key(store, SettingKey::knob_interface, knob_interface);
    QString level;
    if (get_key(store, SettingKey::log_level, level)) {
        LogLevel ll = str_to_log_level(level.toStdString());
        if (ll != LogLevel::None) {
            log_level = ll;
        }
    }
    get_key(store, SettingKey::console_enabled, console_enabled);
    if (!get_key(store, SettingKey::state_path, state_path) || state_path.isEmpty()) {
        state_path = default_state_path();
    }
}

int RuntimeSettings::get_drain_max_reads()
{
    QMutexLocker lock(&mtx);
    return drain_max_reads;
}

int RuntimeSettings::get_drain_read_timeout_ms()
{
    QMutexLocker lock(&mtx);
    return drain_read_timeout_ms;
}

int RuntimeSettings::get_query_timeout_ms()
{
    QMutexLocker lock(&mtx);
    return query_timeout_ms;
}

int RuntimeSettings::get_max_consecutive_timeouts()
{
    QMutexLocker lock(&mtx);
    return max_consecutive_timeouts;
}

int RuntimeSettings::get_listener_poll_ms()
{
    QMutexLocker lock(&mtx);
    return listener_poll_ms;
}

int RuntimeSettings::get_quiet_window_ms()
{
    QMutexLocker lock(&mtx);
    return quiet_window_ms;
}

int RuntimeSettings::get_output_settle_ms()
{
    QMutexLocker lock(&mtx);
    return output_settle_ms;
}

int RuntimeSettings::get_knob_interface()
{
    QMutexLocker lock(&mtx);
    return knob_interface;
}

LogLevel RuntimeSettings::get_log_level()
{
    QMutexLocker lock(&mtx);
    return log_level;
}

bool RuntimeSettings::get_console_enabled()
{
    QMutexLocker lock(&mtx);
    return console_enabled;
}

QString RuntimeSettings::get_state_path()
{
    QMutexLocker lock(&mtx);
    return state_path.isEmpty() ? default_state_path() : state_path;
}

void RuntimeSettings::set_drain_max_reads(int reads)
{
    QMutexLocker lock(&mtx);
    drain_max_reads = clamp_int(reads, 1, max_drain_reads);
}

void RuntimeSettings::set_drain_read_timeout_ms(int ms)
{
    QMutexLocker lock(&mtx);
    drain_read_timeout_ms = clamp_int(ms, 1, 5000);
}

void RuntimeSettings::set_query_timeout_ms(int ms)
{
    QMutexLocker lock(&mtx);
    query_timeout_ms = clamp_int(ms, 1, 10000);
}

void RuntimeSettings::set_listener_poll_ms(int ms)
{
    QMutexLocker lock(&mtx);
    listener_poll_ms = clamp_int(ms, 10, 1000);
}

void RuntimeSettings::set_quiet_window_ms(int ms)
{
    QMutexLocker lock(&mtx);
    quiet_window_ms = clamp_int(ms, 0, 10000);
}

void RuntimeSettings::set_output_settle_ms(int ms)
{
    QMutexLocker lock(&mtx);
    output_settle_ms = clamp_int(ms, 0, 30000);
}

void RuntimeSettings::set_log_level(LogLevel level)
{
    QMutexLocker lock(&mtx);
    log_level = level;
}

void RuntimeSettings::set_console_enabled(bool enabled)
{
    QMutexLocker lock(&mtx);
    console_enabled = enabled;
}

void RuntimeSettings::set_state_path(const QString& path)
{
    QMutexLocker lock(&mtx);
    state_path = path;
}

void RuntimeSettings::reset()
{
    QMutexLocker lock(&mtx);
    drain_max_reads = 8;
    drain_read_timeout_ms = 250;
    query_timeout_ms = 1000;
    max_consecutive_timeouts = 3;
    listener_poll_ms = 200;
    quiet_window_ms = 500;
    output_settle_ms = 3000;
    knob_interface = 3;
    log_level = LogLevel::Info;
    console_enabled = true;
    state_path.clear();
}

} // namespace g6
