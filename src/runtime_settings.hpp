#pragma once

#include <cstdint>

#include <QMutex>
#include <QString>

#include "g6_logging.hpp"

class QSettings;

namespace g6
{

namespace SettingKey {
    constexpr const char drain_max_reads[] = "drain/maxReads";
    constexpr const char drain_read_timeout[] = "drain/readTimeoutMs";
    constexpr const char query_timeout[] = "connect/queryTimeoutMs";
    constexpr const char max_consecutive_timeouts[] = "connect/maxConsecutiveTimeouts";
    constexpr const char listener_poll[] = "listener/pollTimeoutMs";
    constexpr const char quiet_window[] = "listener/quietWindowMs";
    constexpr const char output_settle[] = "output/settleMs";
    constexpr const char knob_interface[] = "device/knobInterface";
    constexpr const char log_level[] = "log/level";
    constexpr const char console_enabled[] = "console/enabled";
    constexpr const char state_path[] = "state/path";
}

constexpr int max_drain_reads = 32;

/* Tunables loaded from QSettings. Settings missing from storage keep
   their default. Defaults are never written back so that changing a
   default reaches every install. */
struct RuntimeSettings
{
    void init();
    void init(QSettings& store);

    int get_drain_max_reads();
    int get_drain_read_timeout_ms();
    int get_query_timeout_ms();
    int get_max_consecutive_timeouts();
    int get_listener_poll_ms();
    int get_quiet_window_ms();
    int get_output_settle_ms();
    int get_knob_interface();
    LogLevel get_log_level();
    bool get_console_enabled();
    QString get_state_path();

    void set_drain_max_reads(int reads);
    void set_drain_read_timeout_ms(int ms);
    void set_query_timeout_ms(int ms);
    void set_listener_poll_ms(int ms);
    void set_quiet_window_ms(int ms);
    void set_output_settle_ms(int ms);
    void set_log_level(LogLevel level);
    void set_console_enabled(bool enabled);
    void set_state_path(const QString& path);

    // Restores every default, used by tests
    void reset();

private:
    void get_settings(QSettings& store);

    int drain_max_reads = 8;
    int drain_read_timeout_ms = 250;
    int query_timeout_ms = 1000;
    int max_consecutive_timeouts = 3;
    int listener_poll_ms = 200;
    int quiet_window_ms = 500;
    int output_settle_ms = 3000;
    // -1 disables the knob listener
    int knob_interface = 3;
    LogLevel log_level = LogLevel::Info;
    bool console_enabled = true;
    QString state_path;

    QMutex mtx;
};

extern RuntimeSettings runtime_settings;

} // namespace g6
