#pragma once

#include <cstddef>
#include <cstdint>

namespace g6
{

namespace proto
{
    constexpr uint16_t vendor_id = 0x041e;
    constexpr uint16_t product_id = 0x3256;
    constexpr int control_interface = 4;

    constexpr size_t payload_len = 64;
    // Payload plus the leading report id
    constexpr size_t report_len = payload_len + 1;
    constexpr uint8_t report_id = 0x00;

    constexpr uint8_t prefix = 0x5a;

    namespace Offset {
        constexpr size_t prefix = 0;
        constexpr size_t family = 1;
        constexpr size_t op = 2;
        // DATA frames: 5a 12 07 01 <type> <feature> <f32>
        constexpr size_t data_type = 4;
        constexpr size_t data_feature = 5;
        constexpr size_t data_value = 6;
        // AudioControl reports: 5a 11 08 01 00 <type> <feature> <f32> <f32>
        constexpr size_t report_type = 5;
        constexpr size_t report_feature = 6;
        constexpr size_t report_value = 7;
        constexpr size_t report_value2 = 11;
        constexpr size_t route_value = 4;
        constexpr size_t route_query_value = 9;
        constexpr size_t gaming_feature = 4;
        constexpr size_t gaming_value = 6;
        constexpr size_t gaming_mask = 6;
        constexpr size_t capabilities = 3;
        constexpr size_t ascii_start = 3;
        constexpr size_t button_code = 10;
    }

    enum class Family : uint8_t
    {
        Identification = 0x05,
        FirmwareQuery = 0x07,
        HardwareStatus = 0x10,
        AudioControl = 0x11,
        DataControl = 0x12,
        BatchControl = 0x15,
        Processing = 0x20,
        Gaming = 0x26,
        Routing = 0x2c,
        DeviceConfig = 0x30,
        DigitalFilter = 0x39,
        SystemConfig = 0x3a,
        Unknown = 0xff,
    };

    // Intermediate type byte selecting the parameter space
    enum class Space : uint8_t
    {
        Equalizer = 0x95,
        Sbx = 0x96,
    };

    namespace AudioOp {
        constexpr uint8_t data = 0x07;     // DataControl write
        constexpr uint8_t commit = 0x03;   // AudioControl read/commit
        constexpr uint8_t report = 0x08;   // AudioControl value report
        constexpr uint8_t sub = 0x01;
    }

    namespace RoutingOp {
        constexpr uint8_t set = 0x05;
        constexpr uint8_t commit = 0x01;
        constexpr uint8_t query = 0x0a;
    }

    namespace GamingOp {
        constexpr uint8_t data = 0x05;
        constexpr uint8_t data_sub = 0x07;
        constexpr uint8_t commit = 0x03;
        constexpr uint8_t commit_sub = 0x08;
        constexpr uint8_t all_mask = 0xff;
    }

    namespace FirmwareOp {
        constexpr uint8_t ascii = 0x01;
        constexpr uint8_t ascii_sub = 0x02;
        constexpr uint8_t reply = 0x10;
    }

    namespace ButtonOp {
        constexpr uint8_t broadcast = 0x08;
        constexpr size_t header_len = 10;
    }

    enum class RouteCode : uint8_t
    {
        Speakers = 0x02,
        Headphones = 0x04,
    };

    enum class GamingFeature : uint8_t
    {
        Sbx = 0x01,
        Scout = 0x02,
    };

    namespace GamingMask {
        constexpr uint8_t sbx = 1 << 0u;
        constexpr uint8_t scout = 1 << 1u;
    }

    namespace CapabilityFlags {
        constexpr uint8_t surround = 1 << 0u;
        constexpr uint8_t crystalizer = 1 << 1u;
        constexpr uint8_t bass = 1 << 2u;
        constexpr uint8_t smart_volume = 1 << 3u;
        constexpr uint8_t dialog_plus = 1 << 4u;
    }

    enum class ButtonCode : uint8_t
    {
        SbxButton = 0x01,
        ScoutButton = 0x02,
        OutputButton = 0x03,
        Unknown = 0xff,
    };

    namespace SbxCode {
        constexpr uint8_t surround_toggle = 0x00;
        constexpr uint8_t surround_level = 0x01;
        constexpr uint8_t dialog_plus_toggle = 0x02;
        constexpr uint8_t dialog_plus_level = 0x03;
        constexpr uint8_t smart_volume_toggle = 0x04;
        constexpr uint8_t smart_volume_level = 0x05;
        constexpr uint8_t smart_volume_preset = 0x06;
        constexpr uint8_t crystalizer_toggle = 0x07;
        constexpr uint8_t crystalizer_level = 0x08;
        constexpr uint8_t bass_toggle = 0x18;
        constexpr uint8_t bass_level = 0x19;
        constexpr uint8_t last = 0x1d;
    }

    namespace EqCode {
        constexpr uint8_t toggle = 0x00;
        constexpr uint8_t first_band = 0x01;
        constexpr uint8_t last = 0x1b;
    }

    constexpr uint32_t toggle_on_bits = 0x3f800000;
    constexpr uint32_t toggle_off_bits = 0x00000000;

    constexpr float preset_night = 0.5f;
    constexpr float preset_loud = 1.0f;

    constexpr bool is_known_family(uint8_t b)
    {
        switch (static_cast<Family>(b)) {
        case Family::Identification:
        case Family::FirmwareQuery:
        case Family::HardwareStatus:
        case Family::AudioControl:
        case Family::DataControl:
        case Family::BatchControl:
        case Family::Processing:
        case Family::Gaming:
        case Family::Routing:
        case Family::DeviceConfig:
        case Family::DigitalFilter:
        case Family::SystemConfig:
            return true;
        default:
            return false;
        }
    }

    constexpr Family to_family(uint8_t b)
    {
        return is_known_family(b) ? static_cast<Family>(b) : Family::Unknown;
    }

    constexpr const char* family_str(Family f)
    {
        switch (f) {
            case Family::Identification: return "Identification";
            case Family::FirmwareQuery:  return "FirmwareQuery";
            case Family::HardwareStatus: return "HardwareStatus";
            case Family::AudioControl:   return "AudioControl";
            case Family::DataControl:    return "DataControl";
            case Family::BatchControl:   return "BatchControl";
            case Family::Processing:     return "Processing";
            case Family::Gaming:         return "Gaming";
            case Family::Routing:        return "Routing";
            case Family::DeviceConfig:   return "DeviceConfig";
            case Family::DigitalFilter:  return "DigitalFilter";
            case Family::SystemConfig:   return "SystemConfig";
            default:                     return "Unknown";
        }
    }

    static_assert(report_len == 65);

} // namespace proto

} // namespace g6
