#include <cmath>

#include "command_encoder.hpp"
#include "state_store.hpp"
#include "util.hpp"

namespace g6
{

namespace
{

template <typename T>
bool assign(T& field, const T& value)
{
    if (field == value) {
        return false;
    }
    field = value;
    return true;
}

} // namespace

bool StateStore::apply(const DecodedResponse& response)
{
    if (auto* v = std::get_if<AudioValue>(&response)) {
        return apply_audio_value(*v);
    }
    if (auto* r = std::get_if<Route>(&response)) {
        return set_output(r->output);
    }
    if (auto* g = std::get_if<GamingModes>(&response)) {
        bool changed = assign(state.sbx_enabled, g->sbx);
        changed |= assign(state.scout_enabled, g->scout);
        return changed;
    }
    if (auto* m = std::get_if<ModeReport>(&response)) {
        return set_mode(m->mode, m->enabled);
    }
    if (auto* id = std::get_if<Identification>(&response)) {
        return assign(state.capabilities.raw, id->capabilities);
    }
    if (auto* fw = std::get_if<FirmwareVersion>(&response)) {
        return assign(state.firmware_version, fw->version);
    }
    return false;
}

bool StateStore::apply(const DeviceEvent& event)
{
    if (auto* o = std::get_if<event::OutputChanged>(&event)) {
        return set_output(o->output);
    }
    if (auto* t = std::get_if<event::EffectToggled>(&event)) {
        return set_effect_enabled(t->effect, t->enabled);
    }
    if (auto* v = std::get_if<event::EffectValueChanged>(&event)) {
        return set_effect_value(v->effect, v->value);
    }
    if (auto* m = std::get_if<event::ModeChanged>(&event)) {
        return set_mode(m->mode, m->enabled);
    }
    return false;
}

bool StateStore::apply_audio_value(const AudioValue& value)
{
    switch (value.space) {
        case proto::Space::Sbx:       return apply_sbx(value.feature, value.value);
        case proto::Space::Equalizer: return apply_eq(value.feature, value.value, value.secondary);
        default:                      return false;
    }
}

bool StateStore::apply_sbx(uint8_t code, float value)
{
    if (code > proto::SbxCode::last || !std::isfinite(value)) {
        return false;
    }
    if (auto slot = effect_slot(code)) {
        if (slot->is_toggle) {
            bool enabled;
            return unit_to_toggle(value, enabled) && set_effect_enabled(slot->effect, enabled);
        }
        uint8_t level;
        return unit_to_level(value, level) && set_effect_value(slot->effect, level);
    }
    if (code == proto::SbxCode::smart_volume_preset) {
        return set_smart_volume_preset(unit_to_preset(value));
    }
    auto it = state.extended_params.find(code);
    if (it != state.extended_params.end() && it->second == value) {
        return false;
    }
    state.extended_params[code] = value;
    return true;
}

bool StateStore::apply_eq(uint8_t code, float value, float secondary)
{
    if (code > proto::EqCode::last || !std::isfinite(value)) {
        return false;
    }
    if (code == proto::EqCode::toggle) {
        bool enabled;
        if (!unit_to_toggle(value, enabled)) {
            return false;
        }
        return assign(state.eq_enabled, std::optional<bool>(enabled));
    }
    EqBand band{value, std::isfinite(secondary) ? secondary : 0.0f};
    auto it = state.eq_bands.find(code);
    if (it != state.eq_bands.end() && it->second == band) {
        return false;
    }
    state.eq_bands[code] = band;
    return true;
}

bool StateStore::set_output(Output output)
{
    return assign(state.output, output);
}

bool StateStore::set_effect_enabled(Effect effect, bool enabled)
{
    if (static_cast<size_t>(effect) >= num_effects) {
        return false;
    }
    return assign(state.effect(effect).enabled, enabled);
}

bool StateStore::set_effect_value(Effect effect, uint8_t value)
{
    if (static_cast<size_t>(effect) >= num_effects || value > 100) {
        return false;
    }
    return assign(state.effect(effect).value, value);
}

bool StateStore::set_mode(Mode mode, bool enabled)
{
    switch (mode) {
        case Mode::Sbx:   return assign(state.sbx_enabled, enabled);
        case Mode::Scout: return assign(state.scout_enabled, enabled);
        default:          return false;
    }
}

bool StateStore::set_smart_volume_preset(SmartVolumePreset preset)
{
    return assign(state.smart_volume_preset, preset);
}

bool StateStore::set_eq_band(uint8_t band, float value)
{
    if (band < proto::EqCode::first_band || band > proto::EqCode::last || !std::isfinite(value)) {
        return false;
    }
    auto it = state.eq_bands.find(band);
    if (it == state.eq_bands.end()) {
        state.eq_bands[band] = EqBand{value, 0.0f};
        return true;
    }
    return assign(it->second.value, value);
}

void StateStore::set_connected(bool connected)
{
    state.connected = connected;
}

void StateStore::mark_full_read(int64_t when_ms)
{
    state.last_full_read_ms = when_ms;
}

} // namespace g6
