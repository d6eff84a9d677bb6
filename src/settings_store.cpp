#include <cmath>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include "g6_logging.hpp"
#include "settings_store.hpp"

namespace g6
{

namespace
{

constexpr const char* effect_keys[num_effects] = {
    "surround",
    "crystalizer",
    "bass",
    "smart_volume",
    "dialog_plus",
};

QString preset_key(SmartVolumePreset preset)
{
    switch (preset) {
        case SmartVolumePreset::Night: return "night";
        case SmartVolumePreset::Loud:  return "loud";
        default:                       return "none";
    }
}

SmartVolumePreset preset_from_key(const QString& key)
{
    if (key == "night") return SmartVolumePreset::Night;
    if (key == "loud") return SmartVolumePreset::Loud;
    return SmartVolumePreset::None;
}

bool read_code(const QJsonObject& obj, uint8_t last, uint8_t& code)
{
    int c = obj.value("code").toInt(-1);
    if (c < 0 || c > last) {
        return false;
    }
    code = (uint8_t)c;
    return true;
}

} // namespace

QByteArray SettingsStore::to_json(const SettingsState& state)
{
    QJsonObject root;
    root["output"] = state.output == Output::Speakers ? "speakers" : "headphones";

    QJsonObject effects;
    for (size_t i = 0; i < num_effects; ++i) {
        QJsonObject e;
        e["enabled"] = state.effects[i].enabled;
        e["value"] = state.effects[i].value;
        effects[effect_keys[i]] = e;
    }
    root["effects"] = effects;
    root["smart_volume_preset"] = preset_key(state.smart_volume_preset);
    root["sbx"] = state.sbx_enabled;
    root["scout"] = state.scout_enabled;
    root["firmware"] = QString::fromStdString(state.firmware_version);
    if (state.eq_enabled) {
        root["eq_enabled"] = *state.eq_enabled;
    }

    QJsonArray bands;
    for (const auto& [code, band] : state.eq_bands) {
        QJsonObject b;
        b["code"] = code;
        b["value"] = band.value;
        b["secondary"] = band.secondary;
        bands.append(b);
    }
    root["eq_bands"] = bands;

    QJsonArray params;
    for (const auto& [code, value] : state.extended_params) {
        QJsonObject p;
        p["code"] = code;
        p["value"] = value;
        params.append(p);
    }
    root["extended"] = params;

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

SettingsState SettingsStore::from_json(const QByteArray& json)
{
    SettingsState state;
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcSettings) << "Ignoring invalid settings file:" << err.errorString();
        return state;
    }
    QJsonObject root = doc.object();

    QString output = root.value("output").toString();
    if (output == "speakers") {
        state.output = Output::Speakers;
    } else if (output == "headphones") {
        state.output = Output::Headphones;
    }

    QJsonObject effects = root.value("effects").toObject();
    for (size_t i = 0; i < num_effects; ++i) {
        QJsonObject e = effects.value(effect_keys[i]).toObject();
        EffectState& slot = state.effects[i];
        slot.enabled = e.value("enabled").toBool(slot.enabled);
        int value = e.value("value").toInt(slot.value);
        if (value >= 0 && value <= 100) {
            slot.value = (uint8_t)value;
        }
    }

    state.smart_volume_preset = preset_from_key(root.value("smart_volume_preset").toString());
    state.sbx_enabled = root.value("sbx").toBool(false);
    state.scout_enabled = root.value("scout").toBool(false);
    state.firmware_version = root.value("firmware").toString().toStdString();
    if (root.value("eq_enabled").isBool()) {
        state.eq_enabled = root.value("eq_enabled").toBool();
    }

    for (const auto& v : root.value("eq_bands").toArray()) {
        QJsonObject b = v.toObject();
        uint8_t code;
        if (!read_code(b, proto::EqCode::last, code) || code < proto::EqCode::first_band) {
            continue;
        }
        double value = b.value("value").toDouble(NAN);
        if (!std::isfinite(value)) {
            continue;
        }
        state.eq_bands[code] = EqBand{(float)value, (float)b.value("secondary").toDouble(0.0)};
    }

    for (const auto& v : root.value("extended").toArray()) {
        QJsonObject p = v.toObject();
        uint8_t code;
        double value = p.value("value").toDouble(NAN);
        if (read_code(p, proto::SbxCode::last, code) && std::isfinite(value)) {
            state.extended_params[code] = (float)value;
        }
    }
    return state;
}

SettingsState SettingsStore::load() const
{
    QFile file(path);
    if (!file.exists()) {
        qCInfo(lcSettings) << "No saved settings at" << path << ", using defaults";
        return SettingsState{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcSettings) << "Could not read" << path << ":" << file.errorString();
        return SettingsState{};
    }
    return from_json(file.readAll());
}

bool SettingsStore::save(const SettingsState& state) const
{
    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        qCWarning(lcSettings) << "Could not create" << dir.absolutePath();
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcSettings) << "Could not write" << path << ":" << file.errorString();
        return false;
    }
    QByteArray json = to_json(state);
    if (file.write(json) != json.size()) {
        qCWarning(lcSettings) << "Short write to" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcSettings) << "Could not commit" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace g6
