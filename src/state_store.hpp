#pragma once

#include "g6_types.hpp"

namespace g6
{

class StateStore
{
public:
    StateStore() = default;
    explicit StateStore(const SettingsState& seed) : state(seed) {}

    // Each apply touches the one setting the input names. Returns true
    // when the stored value changed.
    bool apply(const DecodedResponse& response);
    bool apply(const DeviceEvent& event);

    bool set_output(Output output);
    bool set_effect_enabled(Effect effect, bool enabled);
    bool set_effect_value(Effect effect, uint8_t value);
    bool set_mode(Mode mode, bool enabled);
    bool set_smart_volume_preset(SmartVolumePreset preset);
    bool set_eq_band(uint8_t band, float value);

    void set_connected(bool connected);
    void mark_full_read(int64_t when_ms);

    const SettingsState& get() const { return state; }
    SettingsState snapshot() const { return state; }

private:
    bool apply_audio_value(const AudioValue& value);
    bool apply_sbx(uint8_t code, float value);
    bool apply_eq(uint8_t code, float value, float secondary);

    SettingsState state;
};

} // namespace g6
