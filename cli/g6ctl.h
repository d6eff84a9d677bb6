#ifndef G6CTL_H
#define G6CTL_H

#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include "device_manager.hpp"

class G6Ctl : public QObject
{
    Q_OBJECT

public:
    explicit G6Ctl(std::unique_ptr<g6::TransportFactory> factory, const QString &statePath, QObject *parent = nullptr);
    virtual ~G6Ctl();

    int run(const QStringList &args);

    static QString usage();

private:
    int cmdList();
    int cmdStatus();
    int cmdOutput(const QStringList &args);
    int cmdEffect(const QStringList &args);
    int cmdMode(const QStringList &args);
    int cmdPreset(const QStringList &args);
    int cmdEq(const QStringList &args);
    int cmdSync();
    int cmdMonitor(const QStringList &args);
    int cmdConsole();
    int cmdRaw(const QStringList &args);

    bool ensureConnected();
    int finish(g6::Error err);
    void printState();

    void installSigintHandler();

    g6::DeviceManager m_manager;
    QTextStream m_out;
    QTextStream m_err;
    QSocketNotifier *m_sigNotifier;

public slots:
    void onDeviceEvent(g6::DeviceEvent event);
    void onWarning(g6::Error warning);
    void onDisconnected(g6::Error reason);
    void onSigint();
};

#endif // G6CTL_H
