#include <cstdio>

#include "response_parser.hpp"
#include "util.hpp"

namespace g6
{

using namespace proto;

namespace
{

bool is_printable(uint8_t c)
{
    return c >= 0x20 && c <= 0x7e;
}

DecodedResponse decode_audio_control(const Frame& frame)
{
    if (frame[Offset::op] != AudioOp::report || frame[3] != AudioOp::sub) {
        return BinaryResponse{Family::AudioControl, frame};
    }
    uint8_t type = frame[Offset::report_type];
    if (!is_any_of(type, (uint8_t)Space::Sbx, (uint8_t)Space::Equalizer)) {
        return Unrecognized{frame};
    }
    return AudioValue{
        static_cast<Space>(type),
        frame[Offset::report_feature],
        get_f32_le(frame, Offset::report_value),
        get_f32_le(frame, Offset::report_value2),
    };
}

// Live-state replies carry the route at index 9 on current firmware and
// at the broadcast offset on older ones
DecodedResponse decode_routing(const Frame& frame)
{
    std::optional<Output> output;
    if (frame[Offset::op] == RoutingOp::query) {
        output = route_from_code(frame[Offset::route_query_value]);
    }
    if (!output) {
        output = route_from_code(frame[Offset::route_value]);
    }
    if (!output) {
        return Unrecognized{frame};
    }
    return Route{*output};
}

DecodedResponse decode_gaming(const Frame& frame)
{
    if (frame[Offset::op] == GamingOp::data && frame[3] == GamingOp::data_sub) {
        bool enabled = frame[Offset::gaming_value] != 0;
        switch (static_cast<GamingFeature>(frame[Offset::gaming_feature])) {
            case GamingFeature::Sbx:   return ModeReport{Mode::Sbx, enabled};
            case GamingFeature::Scout: return ModeReport{Mode::Scout, enabled};
            default:                   return Unrecognized{frame};
        }
    }
    uint8_t mask = frame[Offset::gaming_mask];
    return GamingModes{(mask & GamingMask::sbx) != 0, (mask & GamingMask::scout) != 0};
}

DecodedResponse decode_system_config(const Frame& frame)
{
    if (frame[Offset::op] != ButtonOp::broadcast) {
        return BinaryResponse{Family::SystemConfig, frame};
    }
    uint8_t raw = frame[Offset::button_code];
    ButtonCode code;
    switch (static_cast<ButtonCode>(raw)) {
        case ButtonCode::SbxButton:
        case ButtonCode::ScoutButton:
        case ButtonCode::OutputButton:
            code = static_cast<ButtonCode>(raw);
            break;
        default:
            code = ButtonCode::Unknown;
            break;
    }
    return ButtonState{code, raw};
}

const char* space_str(Space space)
{
    return space == Space::Sbx ? "SBX" : "EQ";
}

std::string describe_audio_code(Space space, uint8_t code)
{
    char buf[48];
    if (space == Space::Sbx) {
        if (auto slot = effect_slot(code)) {
            snprintf(buf, sizeof(buf), "SBX %s %s", effect_str(slot->effect), slot->is_toggle ? "toggle" : "level");
        } else if (code == SbxCode::smart_volume_preset) {
            snprintf(buf, sizeof(buf), "SBX SmartVolume preset");
        } else {
            snprintf(buf, sizeof(buf), "SBX param 0x%02x", code);
        }
    } else if (space == Space::Equalizer) {
        if (code == EqCode::toggle) {
            snprintf(buf, sizeof(buf), "EQ toggle");
        } else {
            snprintf(buf, sizeof(buf), "EQ band %u", (unsigned)code);
        }
    } else {
        snprintf(buf, sizeof(buf), "space 0x%02x code 0x%02x", (unsigned)space, code);
    }
    return buf;
}

} // namespace

std::optional<Output> route_from_code(uint8_t code)
{
    switch (static_cast<RouteCode>(code)) {
        case RouteCode::Speakers:   return Output::Speakers;
        case RouteCode::Headphones: return Output::Headphones;
        default:                    return std::nullopt;
    }
}

std::optional<std::string> ascii_payload(const Frame& frame)
{
    size_t end = Offset::ascii_start;
    while (end < frame.size() && is_printable(frame[end])) {
        ++end;
    }
    if (end == Offset::ascii_start || end >= frame.size() || frame[end] != 0x00) {
        return std::nullopt;
    }
    return std::string(frame.begin() + Offset::ascii_start, frame.begin() + end);
}

DecodedResponse decode(const Frame& frame)
{
    if (frame[Offset::prefix] != prefix) {
        return Unrecognized{frame};
    }
    Family family = to_family(frame[Offset::family]);
    switch (family) {
    case Family::Identification:
        if (frame[Offset::op] == 0x00) {
            return BinaryResponse{family, frame};
        }
        return Identification{frame[Offset::capabilities]};
    case Family::FirmwareQuery:
        if (frame[Offset::op] == FirmwareOp::reply) {
            if (auto version = ascii_payload(frame)) {
                return FirmwareVersion{*version};
            }
        }
        return BinaryResponse{family, frame};
    case Family::HardwareStatus:
        return HardwareStatus{frame};
    case Family::AudioControl:
        return decode_audio_control(frame);
    case Family::Routing:
        return decode_routing(frame);
    case Family::Gaming:
        return decode_gaming(frame);
    case Family::SystemConfig:
        return decode_system_config(frame);
    case Family::DataControl:
    case Family::BatchControl:
    case Family::Processing:
    case Family::DeviceConfig:
    case Family::DigitalFilter:
        return BinaryResponse{family, frame};
    default:
        return Unrecognized{frame};
    }
}

DecodedResponse decode_knob(const Frame& frame)
{
    if (used_len(frame) == 0) {
        return Unrecognized{frame};
    }
    for (size_t i = 1; i < frame.size(); ++i) {
        if (frame[i] != 0) {
            return Unrecognized{frame};
        }
    }
    return KnobDelta{static_cast<int8_t>(frame[0])};
}

std::string describe_frame(const Frame& frame)
{
    char buf[128];
    if (frame[Offset::prefix] != prefix) {
        return "Unknown frame";
    }
    Family family = to_family(frame[Offset::family]);
    uint8_t op = frame[Offset::op];

    // Outgoing frames first, they share families with the replies
    if (family == Family::DataControl && op == AudioOp::data) {
        Space space = static_cast<Space>(frame[Offset::data_type]);
        snprintf(buf, sizeof(buf), "DATA %s = %.3f",
                 describe_audio_code(space, frame[Offset::data_feature]).c_str(),
                 get_f32_le(frame, Offset::data_value));
        return buf;
    }
    if (family == Family::AudioControl && op == AudioOp::commit) {
        Space space = static_cast<Space>(frame[Offset::data_type]);
        snprintf(buf, sizeof(buf), "COMMIT %s", describe_audio_code(space, frame[Offset::data_feature]).c_str());
        return buf;
    }
    if (family == Family::Routing && op == RoutingOp::commit) {
        return "Routing commit";
    }

    DecodedResponse decoded = decode(frame);
    if (auto* v = std::get_if<AudioValue>(&decoded)) {
        snprintf(buf, sizeof(buf), "AudioControl %s = %.3f", describe_audio_code(v->space, v->feature).c_str(), v->value);
    } else if (auto* r = std::get_if<Route>(&decoded)) {
        snprintf(buf, sizeof(buf), "Routing %s %s", op == RoutingOp::set ? "route-set" : "report", output_str(r->output));
    } else if (auto* g = std::get_if<GamingModes>(&decoded)) {
        snprintf(buf, sizeof(buf), "Gaming modes SBX=%s Scout=%s", g->sbx ? "on" : "off", g->scout ? "on" : "off");
    } else if (auto* m = std::get_if<ModeReport>(&decoded)) {
        snprintf(buf, sizeof(buf), "Gaming %s = %s", mode_str(m->mode), m->enabled ? "on" : "off");
    } else if (auto* id = std::get_if<Identification>(&decoded)) {
        snprintf(buf, sizeof(buf), "Identification capabilities 0x%02x", id->capabilities);
    } else if (auto* fw = std::get_if<FirmwareVersion>(&decoded)) {
        snprintf(buf, sizeof(buf), "Firmware version \"%s\"", fw->version.c_str());
    } else if (auto* b = std::get_if<ButtonState>(&decoded)) {
        snprintf(buf, sizeof(buf), "Button state code 0x%02x", b->raw_code);
    } else {
        snprintf(buf, sizeof(buf), "%s op 0x%02x", family_str(family), op);
    }
    return buf;
}

} // namespace g6
