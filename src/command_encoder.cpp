#include <cmath>

#include "command_encoder.hpp"
#include "util.hpp"

namespace g6
{

using namespace proto;

namespace
{

Frame make_frame(std::initializer_list<uint8_t> header)
{
    Frame frame = {};
    size_t i = 0;
    for (uint8_t b : header) {
        frame[i++] = b;
    }
    return frame;
}

bool valid_level(int level)
{
    return level >= 0 && level <= 100;
}

bool valid_code(Space space, uint8_t code)
{
    return (space == Space::Sbx || space == Space::Equalizer) && code <= space_last_code(space);
}

struct FrameBuilder
{
    std::vector<Frame>& frames;

    void push_pair(Space space, uint8_t code, float value)
    {
        frames.push_back(data_frame(space, code, value));
        frames.push_back(commit_frame(space, code));
    }

    Error operator()(const op::SetToggle& o)
    {
        auto info = feature_info(o.feature);
        if (!info || info->kind != ValueKind::Toggle) {
            return Error::InvalidOperation;
        }
        push_pair(info->space, info->code, o.enabled ? 1.0f : 0.0f);
        return Error::Ok;
    }

    Error operator()(const op::SetLevel& o)
    {
        auto info = feature_info(o.feature);
        if (!info || info->kind != ValueKind::UnitFloat || !valid_level(o.level)) {
            return Error::InvalidOperation;
        }
        push_pair(info->space, info->code, level_to_unit(o.level));
        return Error::Ok;
    }

    Error operator()(const op::SetEffect& o)
    {
        auto toggle = toggle_feature(o.effect);
        auto level = level_feature(o.effect);
        if (!toggle || !level || !valid_level(o.level)) {
            return Error::InvalidOperation;
        }
        Error err = (*this)(op::SetToggle{*toggle, o.enabled});
        if (err != Error::Ok) {
            return err;
        }
        return (*this)(op::SetLevel{*level, o.level});
    }

    Error operator()(const op::SetSmartVolumePreset& o)
    {
        if (!is_any_of(o.preset, SmartVolumePreset::None, SmartVolumePreset::Night, SmartVolumePreset::Loud)) {
            return Error::InvalidOperation;
        }
        push_pair(Space::Sbx, SbxCode::smart_volume_preset, preset_to_unit(o.preset));
        return Error::Ok;
    }

    Error operator()(const op::SetEqBand& o)
    {
        if (o.band < EqCode::first_band || o.band > EqCode::last || !std::isfinite(o.value)) {
            return Error::InvalidOperation;
        }
        push_pair(Space::Equalizer, o.band, o.value);
        return Error::Ok;
    }

    Error operator()(const op::SetOutput& o)
    {
        RouteCode code;
        switch (o.output) {
            case Output::Speakers:   code = RouteCode::Speakers; break;
            case Output::Headphones: code = RouteCode::Headphones; break;
            default:                 return Error::InvalidOperation;
        }
        frames.push_back(make_frame({prefix, (uint8_t)Family::Routing, RoutingOp::set, 0x00, (uint8_t)code}));
        frames.push_back(make_frame({prefix, (uint8_t)Family::Routing, RoutingOp::commit, 0x01}));
        return Error::Ok;
    }

    Error operator()(const op::SetMode& o)
    {
        GamingFeature feature;
        switch (o.mode) {
            case Mode::Sbx:   feature = GamingFeature::Sbx; break;
            case Mode::Scout: feature = GamingFeature::Scout; break;
            default:          return Error::InvalidOperation;
        }
        frames.push_back(make_frame({prefix, (uint8_t)Family::Gaming, GamingOp::data, GamingOp::data_sub,
                                     (uint8_t)feature, 0x00, (uint8_t)(o.enabled ? 0x01 : 0x00), 0x00, 0x00}));
        frames.push_back(query_frame(op::QueryKind::Gaming));
        return Error::Ok;
    }

    Error operator()(const op::ReadFeature& o)
    {
        if (!valid_code(o.space, o.code)) {
            return Error::InvalidOperation;
        }
        frames.push_back(commit_frame(o.space, o.code));
        return Error::Ok;
    }

    Error operator()(const op::Query& o)
    {
        switch (o.kind) {
            case op::QueryKind::Identification:
            case op::QueryKind::HardwareStatus:
            case op::QueryKind::Routing:
            case op::QueryKind::Gaming:
            case op::QueryKind::FirmwareAscii:
            case op::QueryKind::FirmwareBinary:
            case op::QueryKind::DigitalFilter:
            case op::QueryKind::SystemConfigA:
            case op::QueryKind::SystemConfigB:
                frames.push_back(query_frame(o.kind));
                return Error::Ok;
            default:
                return Error::InvalidOperation;
        }
    }
};

} // namespace

Frame data_frame(Space space, uint8_t code, float value)
{
    Frame frame = make_frame({prefix, (uint8_t)Family::DataControl, AudioOp::data, AudioOp::sub, (uint8_t)space, code});
    put_f32_le(frame, Offset::data_value, value);
    return frame;
}

Frame commit_frame(Space space, uint8_t code)
{
    return make_frame({prefix, (uint8_t)Family::AudioControl, AudioOp::commit, AudioOp::sub, (uint8_t)space, code});
}

Frame query_frame(op::QueryKind kind)
{
    switch (kind) {
        case op::QueryKind::Identification:
            return make_frame({prefix, (uint8_t)Family::Identification});
        case op::QueryKind::HardwareStatus:
            return make_frame({prefix, (uint8_t)Family::HardwareStatus});
        case op::QueryKind::Routing:
            return make_frame({prefix, (uint8_t)Family::Routing, RoutingOp::query, 0x02, 0x82, 0x02});
        case op::QueryKind::Gaming:
            return make_frame({prefix, (uint8_t)Family::Gaming, GamingOp::commit, GamingOp::commit_sub,
                               GamingOp::all_mask, GamingOp::all_mask});
        case op::QueryKind::FirmwareAscii:
            return make_frame({prefix, (uint8_t)Family::FirmwareQuery, FirmwareOp::ascii, FirmwareOp::ascii_sub});
        case op::QueryKind::FirmwareBinary:
            return make_frame({prefix, (uint8_t)Family::FirmwareQuery, FirmwareOp::reply});
        case op::QueryKind::DigitalFilter:
            return make_frame({prefix, (uint8_t)Family::DigitalFilter, 0x01, 0x04});
        case op::QueryKind::SystemConfigA:
            return make_frame({prefix, (uint8_t)Family::SystemConfig, 0x02, 0x09});
        case op::QueryKind::SystemConfigB:
            return make_frame({prefix, (uint8_t)Family::SystemConfig, 0x01, 0x07});
        default:
            return Frame{};
    }
}

float preset_to_unit(SmartVolumePreset preset)
{
    switch (preset) {
        case SmartVolumePreset::Night: return preset_night;
        case SmartVolumePreset::Loud:  return preset_loud;
        default:                       return 0.0f;
    }
}

SmartVolumePreset unit_to_preset(float value)
{
    if (value == preset_night) {
        return SmartVolumePreset::Night;
    }
    if (value == preset_loud) {
        return SmartVolumePreset::Loud;
    }
    return SmartVolumePreset::None;
}

Error encode(const Operation& operation, std::vector<Frame>& frames)
{
    std::vector<Frame> out;
    Error err = std::visit(FrameBuilder{out}, operation);
    if (err == Error::Ok) {
        frames.insert(frames.end(), out.begin(), out.end());
    }
    return err;
}

} // namespace g6
