#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include <g6_protocol.hpp>

namespace g6
{

using Frame = std::array<uint8_t, proto::payload_len>;

enum class Output : uint8_t {Speakers = 0, Headphones = 1};
enum class Mode : uint8_t {Sbx = 0, Scout = 1};
enum class SmartVolumePreset : uint8_t {None = 0, Night = 1, Loud = 2};

enum class Effect : uint8_t
{
    Surround = 0,
    Crystalizer,
    Bass,
    SmartVolume,
    DialogPlus,
};

constexpr size_t num_effects = 5;

enum class ValueKind : uint8_t
{
    Toggle,
    UnitFloat,
    RawFloat,
    Enum,
};

enum class Feature : uint8_t
{
    SurroundToggle,
    SurroundLevel,
    DialogPlusToggle,
    DialogPlusLevel,
    SmartVolumeToggle,
    SmartVolumeLevel,
    SmartVolumePreset,
    CrystalizerToggle,
    CrystalizerLevel,
    BassToggle,
    BassLevel,
    EqToggle,
};

struct FeatureInfo
{
    proto::Space space;
    uint8_t code;
    ValueKind kind;
};

constexpr std::optional<FeatureInfo> feature_info(Feature f)
{
    using proto::Space;
    namespace Sbx = proto::SbxCode;
    switch (f) {
        case Feature::SurroundToggle:    return FeatureInfo{Space::Sbx, Sbx::surround_toggle, ValueKind::Toggle};
        case Feature::SurroundLevel:     return FeatureInfo{Space::Sbx, Sbx::surround_level, ValueKind::UnitFloat};
        case Feature::DialogPlusToggle:  return FeatureInfo{Space::Sbx, Sbx::dialog_plus_toggle, ValueKind::Toggle};
        case Feature::DialogPlusLevel:   return FeatureInfo{Space::Sbx, Sbx::dialog_plus_level, ValueKind::UnitFloat};
        case Feature::SmartVolumeToggle: return FeatureInfo{Space::Sbx, Sbx::smart_volume_toggle, ValueKind::Toggle};
        case Feature::SmartVolumeLevel:  return FeatureInfo{Space::Sbx, Sbx::smart_volume_level, ValueKind::UnitFloat};
        case Feature::SmartVolumePreset: return FeatureInfo{Space::Sbx, Sbx::smart_volume_preset, ValueKind::Enum};
        case Feature::CrystalizerToggle: return FeatureInfo{Space::Sbx, Sbx::crystalizer_toggle, ValueKind::Toggle};
        case Feature::CrystalizerLevel:  return FeatureInfo{Space::Sbx, Sbx::crystalizer_level, ValueKind::UnitFloat};
        case Feature::BassToggle:        return FeatureInfo{Space::Sbx, Sbx::bass_toggle, ValueKind::Toggle};
        case Feature::BassLevel:         return FeatureInfo{Space::Sbx, Sbx::bass_level, ValueKind::UnitFloat};
        case Feature::EqToggle:          return FeatureInfo{Space::Equalizer, proto::EqCode::toggle, ValueKind::Toggle};
        default:                         return std::nullopt;
    }
}

constexpr std::optional<Feature> toggle_feature(Effect e)
{
    switch (e) {
        case Effect::Surround:    return Feature::SurroundToggle;
        case Effect::Crystalizer: return Feature::CrystalizerToggle;
        case Effect::Bass:        return Feature::BassToggle;
        case Effect::SmartVolume: return Feature::SmartVolumeToggle;
        case Effect::DialogPlus:  return Feature::DialogPlusToggle;
        default:                  return std::nullopt;
    }
}

constexpr std::optional<Feature> level_feature(Effect e)
{
    switch (e) {
        case Effect::Surround:    return Feature::SurroundLevel;
        case Effect::Crystalizer: return Feature::CrystalizerLevel;
        case Effect::Bass:        return Feature::BassLevel;
        case Effect::SmartVolume: return Feature::SmartVolumeLevel;
        case Effect::DialogPlus:  return Feature::DialogPlusLevel;
        default:                  return std::nullopt;
    }
}

// Slot an SBX code names: which effect and whether it is the toggle
struct EffectSlot
{
    Effect effect;
    bool is_toggle;
};

constexpr std::optional<EffectSlot> effect_slot(uint8_t sbx_code)
{
    namespace Sbx = proto::SbxCode;
    switch (sbx_code) {
        case Sbx::surround_toggle:     return EffectSlot{Effect::Surround, true};
        case Sbx::surround_level:      return EffectSlot{Effect::Surround, false};
        case Sbx::dialog_plus_toggle:  return EffectSlot{Effect::DialogPlus, true};
        case Sbx::dialog_plus_level:   return EffectSlot{Effect::DialogPlus, false};
        case Sbx::smart_volume_toggle: return EffectSlot{Effect::SmartVolume, true};
        case Sbx::smart_volume_level:  return EffectSlot{Effect::SmartVolume, false};
        case Sbx::crystalizer_toggle:  return EffectSlot{Effect::Crystalizer, true};
        case Sbx::crystalizer_level:   return EffectSlot{Effect::Crystalizer, false};
        case Sbx::bass_toggle:         return EffectSlot{Effect::Bass, true};
        case Sbx::bass_level:          return EffectSlot{Effect::Bass, false};
        default:                       return std::nullopt;
    }
}

constexpr const char* effect_str(Effect e)
{
    switch (e) {
        case Effect::Surround:    return "Surround";
        case Effect::Crystalizer: return "Crystalizer";
        case Effect::Bass:        return "Bass";
        case Effect::SmartVolume: return "SmartVolume";
        case Effect::DialogPlus:  return "DialogPlus";
        default:                  return "Unknown";
    }
}

constexpr const char* output_str(Output o)
{
    return o == Output::Speakers ? "Speakers" : "Headphones";
}

constexpr const char* mode_str(Mode m)
{
    return m == Mode::Sbx ? "SBX" : "Scout";
}

constexpr const char* preset_str(SmartVolumePreset p)
{
    switch (p) {
        case SmartVolumePreset::Night: return "Night";
        case SmartVolumePreset::Loud:  return "Loud";
        default:                       return "None";
    }
}

struct Capabilities
{
    uint8_t raw = 0;

    bool has_surround() const { return raw & proto::CapabilityFlags::surround; }
    bool has_crystalizer() const { return raw & proto::CapabilityFlags::crystalizer; }
    bool has_bass() const { return raw & proto::CapabilityFlags::bass; }
    bool has_smart_volume() const { return raw & proto::CapabilityFlags::smart_volume; }
    bool has_dialog_plus() const { return raw & proto::CapabilityFlags::dialog_plus; }

    bool supports(Effect e) const
    {
        switch (e) {
            case Effect::Surround:    return has_surround();
            case Effect::Crystalizer: return has_crystalizer();
            case Effect::Bass:        return has_bass();
            case Effect::SmartVolume: return has_smart_volume();
            case Effect::DialogPlus:  return has_dialog_plus();
            default:                  return false;
        }
    }
};

struct EffectState
{
    bool enabled = false;
    uint8_t value = 50;

    bool operator==(const EffectState&) const = default;
};

struct EqBand
{
    float value = 0.0f;
    float secondary = 0.0f;

    bool operator==(const EqBand&) const = default;
};

struct SettingsState
{
    Output output = Output::Headphones;
    std::array<EffectState, num_effects> effects = {};
    SmartVolumePreset smart_volume_preset = SmartVolumePreset::None;
    bool sbx_enabled = false;
    bool scout_enabled = false;
    std::string firmware_version;
    Capabilities capabilities = {};
    std::optional<bool> eq_enabled;
    std::map<uint8_t, EqBand> eq_bands;
    std::map<uint8_t, float> extended_params;
    bool connected = false;
    // ms since epoch, 0 if never read
    int64_t last_full_read_ms = 0;

    EffectState& effect(Effect e) { return effects[static_cast<size_t>(e)]; }
    const EffectState& effect(Effect e) const { return effects[static_cast<size_t>(e)]; }
};

/* Decoded responses */

struct Identification { uint8_t capabilities; bool operator==(const Identification&) const = default; };
struct FirmwareVersion { std::string version; bool operator==(const FirmwareVersion&) const = default; };
struct HardwareStatus { Frame raw; bool operator==(const HardwareStatus&) const = default; };
struct AudioValue
{
    proto::Space space;
    uint8_t feature;
    float value;
    float secondary;

    bool operator==(const AudioValue&) const = default;
};
struct Route { Output output; bool operator==(const Route&) const = default; };
struct GamingModes { bool sbx; bool scout; bool operator==(const GamingModes&) const = default; };
struct ModeReport { Mode mode; bool enabled; bool operator==(const ModeReport&) const = default; };
struct ButtonState { proto::ButtonCode code; uint8_t raw_code; bool operator==(const ButtonState&) const = default; };
struct KnobDelta { int8_t delta; bool operator==(const KnobDelta&) const = default; };
struct BinaryResponse { proto::Family family; Frame raw; bool operator==(const BinaryResponse&) const = default; };
struct Unrecognized { Frame raw; bool operator==(const Unrecognized&) const = default; };

using DecodedResponse = std::variant<
    Unrecognized,
    Identification,
    FirmwareVersion,
    HardwareStatus,
    AudioValue,
    Route,
    GamingModes,
    ModeReport,
    ButtonState,
    KnobDelta,
    BinaryResponse>;

/* Broadcast events */

namespace event
{
    struct OutputChanged { Output output; bool operator==(const OutputChanged&) const = default; };
    struct EffectToggled { Effect effect; bool enabled; bool operator==(const EffectToggled&) const = default; };
    struct EffectValueChanged { Effect effect; uint8_t value; bool operator==(const EffectValueChanged&) const = default; };
    struct ModeChanged { Mode mode; bool enabled; bool operator==(const ModeChanged&) const = default; };
    struct ButtonPressed { proto::ButtonCode code; bool operator==(const ButtonPressed&) const = default; };
    struct VolumeKnobTurned { int8_t delta; bool operator==(const VolumeKnobTurned&) const = default; };
    struct Unrecognized { Frame raw; bool operator==(const Unrecognized&) const = default; };
} // namespace event

using DeviceEvent = std::variant<
    event::Unrecognized,
    event::OutputChanged,
    event::EffectToggled,
    event::EffectValueChanged,
    event::ModeChanged,
    event::ButtonPressed,
    event::VolumeKnobTurned>;

} // namespace g6
