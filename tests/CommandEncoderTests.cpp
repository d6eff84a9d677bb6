#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "command_encoder.hpp"
#include "util.hpp"

using namespace g6;

namespace {

std::vector<Frame> encode_ok(const Operation& operation) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(operation, frames), Error::Ok);
    return frames;
}

} // namespace

// ============================================================================
// Toggles and levels
// ============================================================================

TEST(CommandEncoder, SetToggle_On_DataThenCommit) {
    auto frames = encode_ok(op::SetToggle{Feature::SurroundToggle, true});
    ASSERT_EQ(frames.size(), 2u);

    const Frame& data = frames[0];
    EXPECT_EQ(data[0], 0x5a);
    EXPECT_EQ(data[1], 0x12);
    EXPECT_EQ(data[2], 0x07);
    EXPECT_EQ(data[3], 0x01);
    EXPECT_EQ(data[4], 0x96);
    EXPECT_EQ(data[5], 0x00);
    EXPECT_EQ(get_u32_le(data, 6), proto::toggle_on_bits);

    const Frame& commit = frames[1];
    EXPECT_EQ(commit[0], 0x5a);
    EXPECT_EQ(commit[1], 0x11);
    EXPECT_EQ(commit[2], 0x03);
    EXPECT_EQ(commit[3], 0x01);
    EXPECT_EQ(commit[4], 0x96);
    EXPECT_EQ(commit[5], 0x00);
    EXPECT_EQ(used_len(commit), 5u);
}

TEST(CommandEncoder, SetToggle_Off_AllZeroValue) {
    auto frames = encode_ok(op::SetToggle{Feature::BassToggle, false});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][5], proto::SbxCode::bass_toggle);
    EXPECT_EQ(get_u32_le(frames[0], 6), proto::toggle_off_bits);
}

TEST(CommandEncoder, SetLevel_Zero_Allowed) {
    auto frames = encode_ok(op::SetLevel{Feature::DialogPlusLevel, 0});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][5], proto::SbxCode::dialog_plus_level);
    EXPECT_FLOAT_EQ(get_f32_le(frames[0], 6), 0.0f);
}

TEST(CommandEncoder, SetLevel_OutOfRange_Rejected) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::SetLevel{Feature::SurroundLevel, 101}, frames), Error::InvalidOperation);
    EXPECT_EQ(encode(op::SetLevel{Feature::SurroundLevel, -1}, frames), Error::InvalidOperation);
    EXPECT_TRUE(frames.empty());
}

TEST(CommandEncoder, SetLevel_OnToggleFeature_Rejected) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::SetLevel{Feature::CrystalizerToggle, 50}, frames), Error::InvalidOperation);
    EXPECT_EQ(encode(op::SetToggle{Feature::CrystalizerLevel, true}, frames), Error::InvalidOperation);
    EXPECT_TRUE(frames.empty());
}

TEST(CommandEncoder, SetEffect_Crystalizer75_FourFramesInOrder) {
    auto frames = encode_ok(op::SetEffect{Effect::Crystalizer, true, 75});
    ASSERT_EQ(frames.size(), 4u);

    // 5a 12 07 01 96 07 00 00 80 3f
    EXPECT_EQ(hex_dump(frames[0], used_len(frames[0])), "5a 12 07 01 96 07 00 00 80 3f");
    EXPECT_EQ(hex_dump(frames[1], used_len(frames[1])), "5a 11 03 01 96 07");
    // 0.75f is 0x3f400000
    EXPECT_EQ(hex_dump(frames[2], used_len(frames[2])), "5a 12 07 01 96 08 00 00 40 3f");
    EXPECT_EQ(hex_dump(frames[3], used_len(frames[3])), "5a 11 03 01 96 08");
}

TEST(CommandEncoder, SetEffect_BadLevel_NoPartialFrames) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::SetEffect{Effect::Bass, true, 150}, frames), Error::InvalidOperation);
    EXPECT_TRUE(frames.empty());
}

TEST(CommandEncoder, SetSmartVolumePreset_Night) {
    auto frames = encode_ok(op::SetSmartVolumePreset{SmartVolumePreset::Night});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][5], proto::SbxCode::smart_volume_preset);
    EXPECT_FLOAT_EQ(get_f32_le(frames[0], 6), proto::preset_night);
}

TEST(CommandEncoder, PresetMapping_RoundTrips) {
    for (auto p : {SmartVolumePreset::None, SmartVolumePreset::Night, SmartVolumePreset::Loud}) {
        EXPECT_EQ(unit_to_preset(preset_to_unit(p)), p);
    }
}

// ============================================================================
// Equalizer
// ============================================================================

TEST(CommandEncoder, SetEqBand_UsesEqualizerSpace) {
    auto frames = encode_ok(op::SetEqBand{0x05, -3.5f});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][4], 0x95);
    EXPECT_EQ(frames[0][5], 0x05);
    EXPECT_FLOAT_EQ(get_f32_le(frames[0], 6), -3.5f);
    EXPECT_EQ(frames[1][4], 0x95);
}

TEST(CommandEncoder, SetEqBand_InvalidBand_Rejected) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::SetEqBand{0x00, 1.0f}, frames), Error::InvalidOperation);
    EXPECT_EQ(encode(op::SetEqBand{0x1c, 1.0f}, frames), Error::InvalidOperation);
    EXPECT_EQ(encode(op::SetEqBand{0x02, std::numeric_limits<float>::infinity()}, frames), Error::InvalidOperation);
    EXPECT_TRUE(frames.empty());
}

// ============================================================================
// Output and gaming modes
// ============================================================================

TEST(CommandEncoder, SetOutput_Speakers_RouteSetThenCommit) {
    auto frames = encode_ok(op::SetOutput{Output::Speakers});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(hex_dump(frames[0], used_len(frames[0])), "5a 2c 05 00 02");
    EXPECT_EQ(hex_dump(frames[1], used_len(frames[1])), "5a 2c 01 01");
}

TEST(CommandEncoder, SetOutput_Headphones) {
    auto frames = encode_ok(op::SetOutput{Output::Headphones});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][4], 0x04);
}

TEST(CommandEncoder, SetMode_Scout_DataThenStateQuery) {
    auto frames = encode_ok(op::SetMode{Mode::Scout, true});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(hex_dump(frames[0], 9), "5a 26 05 07 02 00 01 00 00");
    EXPECT_EQ(hex_dump(frames[1], used_len(frames[1])), "5a 26 03 08 ff ff");
}

TEST(CommandEncoder, SetMode_SbxOff) {
    auto frames = encode_ok(op::SetMode{Mode::Sbx, false});
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0][4], 0x01);
    EXPECT_EQ(frames[0][6], 0x00);
}

// ============================================================================
// Reads and queries
// ============================================================================

TEST(CommandEncoder, ReadFeature_CommitOnly) {
    auto frames = encode_ok(op::ReadFeature{proto::Space::Sbx, proto::SbxCode::last});
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(hex_dump(frames[0], 6), "5a 11 03 01 96 1d");
}

TEST(CommandEncoder, ReadFeature_PastLastCode_Rejected) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::ReadFeature{proto::Space::Sbx, 0x1e}, frames), Error::InvalidOperation);
    EXPECT_EQ(encode(op::ReadFeature{proto::Space::Equalizer, 0x1c}, frames), Error::InvalidOperation);
}

TEST(CommandEncoder, Query_Frames) {
    auto hex = [](op::QueryKind kind) {
        Frame f = query_frame(kind);
        return hex_dump(f, used_len(f));
    };
    EXPECT_EQ(hex(op::QueryKind::Identification), "5a 05");
    EXPECT_EQ(hex(op::QueryKind::HardwareStatus), "5a 10");
    EXPECT_EQ(hex(op::QueryKind::Routing), "5a 2c 0a 02 82 02");
    EXPECT_EQ(hex(op::QueryKind::Gaming), "5a 26 03 08 ff ff");
    EXPECT_EQ(hex(op::QueryKind::FirmwareAscii), "5a 07 01 02");
    EXPECT_EQ(hex(op::QueryKind::FirmwareBinary), "5a 07 10");
    EXPECT_EQ(hex(op::QueryKind::DigitalFilter), "5a 39 01 04");
    EXPECT_EQ(hex(op::QueryKind::SystemConfigA), "5a 3a 02 09");
    EXPECT_EQ(hex(op::QueryKind::SystemConfigB), "5a 3a 01 07");
}

TEST(CommandEncoder, Query_UnknownKind_Rejected) {
    std::vector<Frame> frames;
    EXPECT_EQ(encode(op::Query{static_cast<op::QueryKind>(0x7f)}, frames), Error::InvalidOperation);
    EXPECT_TRUE(frames.empty());
}

TEST(CommandEncoder, Encode_AppendsToExistingFrames) {
    std::vector<Frame> frames;
    ASSERT_EQ(encode(op::Query{op::QueryKind::Identification}, frames), Error::Ok);
    ASSERT_EQ(encode(op::SetOutput{Output::Speakers}, frames), Error::Ok);
    EXPECT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0][1], 0x05);
    EXPECT_EQ(frames[1][1], 0x2c);
}
