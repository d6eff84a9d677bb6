#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include <g6_errors.hpp>

#include "g6_types.hpp"

namespace g6
{

namespace op
{
    struct SetToggle { Feature feature; bool enabled; };
    struct SetLevel { Feature feature; int level; };
    struct SetEffect { Effect effect; bool enabled; int level; };
    struct SetSmartVolumePreset { SmartVolumePreset preset; };
    struct SetEqBand { uint8_t band; float value; };
    struct SetOutput { Output output; };
    struct SetMode { Mode mode; bool enabled; };
    struct ReadFeature { proto::Space space; uint8_t code; };

    enum class QueryKind : uint8_t
    {
        Identification,
        HardwareStatus,
        Routing,
        Gaming,
        FirmwareAscii,
        FirmwareBinary,
        DigitalFilter,
        SystemConfigA,
        SystemConfigB,
    };

    struct Query { QueryKind kind; };
} // namespace op

using Operation = std::variant<
    op::SetToggle,
    op::SetLevel,
    op::SetEffect,
    op::SetSmartVolumePreset,
    op::SetEqBand,
    op::SetOutput,
    op::SetMode,
    op::ReadFeature,
    op::Query>;

/* Maps a logical operation to the frames that perform it, in transmit
   order. Every DATA frame is followed by its COMMIT companion. Frames
   are bare 64 byte payloads, the transport adds the report id. */
Error encode(const Operation& operation, std::vector<Frame>& frames);

Frame data_frame(proto::Space space, uint8_t code, float value);
Frame commit_frame(proto::Space space, uint8_t code);
Frame query_frame(op::QueryKind kind);

constexpr uint8_t space_last_code(proto::Space space)
{
    return space == proto::Space::Sbx ? proto::SbxCode::last : proto::EqCode::last;
}

float preset_to_unit(SmartVolumePreset preset);
SmartVolumePreset unit_to_preset(float value);

} // namespace g6
