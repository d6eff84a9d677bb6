#pragma once

#include <QByteArray>
#include <QString>

#include "g6_types.hpp"

namespace g6
{

/* Last known settings on disk, shown before a live sync completes.
   The connected flag and read timestamp are session only and never
   stored. */
class SettingsStore
{
public:
    explicit SettingsStore(QString path) : path(std::move(path)) {}

    // Missing file or fields fall back to the defaults
    SettingsState load() const;
    bool save(const SettingsState& state) const;

    const QString& file_path() const { return path; }

    static QByteArray to_json(const SettingsState& state);
    static SettingsState from_json(const QByteArray& json);

private:
    QString path;
};

} // namespace g6
