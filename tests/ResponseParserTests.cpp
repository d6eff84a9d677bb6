#include <gtest/gtest.h>

#include "FakeG6Device.hpp"
#include "command_encoder.hpp"
#include "response_parser.hpp"
#include "util.hpp"

using namespace g6;
using g6::tests::audio_report;
using g6::tests::button_broadcast;
using g6::tests::frame_of;

// ============================================================================
// Identification and firmware
// ============================================================================

TEST(ResponseParser, Identification_CapabilityByte) {
    auto decoded = decode(frame_of({0x5a, 0x05, 0x04, 0x1f}));
    auto* id = std::get_if<Identification>(&decoded);
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->capabilities, 0x1f);

    Capabilities caps{id->capabilities};
    EXPECT_TRUE(caps.has_surround());
    EXPECT_TRUE(caps.has_dialog_plus());
    EXPECT_TRUE(caps.supports(Effect::Bass));
    EXPECT_FALSE(Capabilities{proto::CapabilityFlags::surround}.supports(Effect::Bass));
}

TEST(ResponseParser, Identification_ZeroOp_IsBinary) {
    auto decoded = decode(frame_of({0x5a, 0x05, 0x00, 0x1f}));
    auto* bin = std::get_if<BinaryResponse>(&decoded);
    ASSERT_NE(bin, nullptr);
    EXPECT_EQ(bin->family, proto::Family::Identification);
}

TEST(ResponseParser, Firmware_AsciiReply) {
    Frame f = frame_of({0x5a, 0x07, 0x10, '2', '.', '1', '.', '0', 0x00});
    auto decoded = decode(f);
    auto* fw = std::get_if<FirmwareVersion>(&decoded);
    ASSERT_NE(fw, nullptr);
    EXPECT_EQ(fw->version, "2.1.0");
}

TEST(ResponseParser, Firmware_BinaryReply_NotAscii) {
    Frame f = frame_of({0x5a, 0x07, 0x10, 0x02, 0x01, 0xc8});
    auto decoded = decode(f);
    auto* bin = std::get_if<BinaryResponse>(&decoded);
    ASSERT_NE(bin, nullptr);
    EXPECT_EQ(bin->family, proto::Family::FirmwareQuery);
}

TEST(ResponseParser, AsciiPayload_EmptyRun) {
    EXPECT_FALSE(ascii_payload(frame_of({0x5a, 0x07, 0x10})).has_value());
}

// ============================================================================
// Audio values
// ============================================================================

TEST(ResponseParser, AudioValue_SbxCrystalizerLevel) {
    auto decoded = decode(audio_report(proto::Space::Sbx, proto::SbxCode::crystalizer_level, 0.75f, 1.5f));
    auto* v = std::get_if<AudioValue>(&decoded);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->space, proto::Space::Sbx);
    EXPECT_EQ(v->feature, proto::SbxCode::crystalizer_level);
    EXPECT_FLOAT_EQ(v->value, 0.75f);
    EXPECT_FLOAT_EQ(v->secondary, 1.5f);
}

TEST(ResponseParser, AudioValue_UnknownSpace_Unrecognized) {
    Frame f = audio_report(proto::Space::Sbx, 0x01, 1.0f);
    f[proto::Offset::report_type] = 0x42;
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode(f)));
}

TEST(ResponseParser, AudioControl_OtherOp_IsBinary) {
    auto decoded = decode(frame_of({0x5a, 0x11, 0x03, 0x01, 0x96, 0x07}));
    ASSERT_TRUE(std::holds_alternative<BinaryResponse>(decoded));
}

// ============================================================================
// Routing
// ============================================================================

TEST(ResponseParser, Route_Broadcast_Headphones) {
    auto decoded = decode(frame_of({0x5a, 0x2c, 0x05, 0x00, 0x04}));
    auto* r = std::get_if<Route>(&decoded);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->output, Output::Headphones);
}

TEST(ResponseParser, Route_QueryReply_ReadsLaterIndex) {
    Frame f = frame_of({0x5a, 0x2c, 0x0a, 0x02, 0x82, 0x02, 0x00, 0x00, 0x00, 0x02});
    auto decoded = decode(f);
    auto* r = std::get_if<Route>(&decoded);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->output, Output::Speakers);
}

TEST(ResponseParser, Route_QueryReply_ValueAtBroadcastOffset) {
    auto decoded = decode(frame_of({0x5a, 0x2c, 0x0a, 0x02, 0x04}));
    auto* r = std::get_if<Route>(&decoded);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->output, Output::Headphones);
}

TEST(ResponseParser, Route_QueryReply_NoRouteCode_Unrecognized) {
    Frame f = frame_of({0x5a, 0x2c, 0x0a, 0x02, 0x82, 0x02, 0x00, 0x00, 0x00, 0x07});
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode(f)));
}

TEST(ResponseParser, Route_UnknownCode_Unrecognized) {
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode(frame_of({0x5a, 0x2c, 0x05, 0x00, 0x07}))));
}

// ============================================================================
// Gaming modes
// ============================================================================

TEST(ResponseParser, Gaming_Mask) {
    auto decoded = decode(frame_of({0x5a, 0x26, 0x03, 0x08, 0xff, 0xff, 0x02}));
    auto* g = std::get_if<GamingModes>(&decoded);
    ASSERT_NE(g, nullptr);
    EXPECT_FALSE(g->sbx);
    EXPECT_TRUE(g->scout);
}

TEST(ResponseParser, Gaming_ModeReport) {
    auto decoded = decode(frame_of({0x5a, 0x26, 0x05, 0x07, 0x01, 0x00, 0x01}));
    auto* m = std::get_if<ModeReport>(&decoded);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->mode, Mode::Sbx);
    EXPECT_TRUE(m->enabled);
}

// ============================================================================
// Buttons and the volume knob
// ============================================================================

TEST(ResponseParser, Button_OutputPress) {
    auto decoded = decode(button_broadcast(proto::ButtonCode::OutputButton));
    auto* b = std::get_if<ButtonState>(&decoded);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->code, proto::ButtonCode::OutputButton);
    EXPECT_EQ(b->raw_code, 0x03);
}

TEST(ResponseParser, Button_UnknownCode_KeepsRaw) {
    Frame f = button_broadcast(proto::ButtonCode::Unknown);
    f[proto::Offset::button_code] = 0x09;
    auto decoded = decode(f);
    auto* b = std::get_if<ButtonState>(&decoded);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->code, proto::ButtonCode::Unknown);
    EXPECT_EQ(b->raw_code, 0x09);
}

TEST(ResponseParser, Knob_SignedDelta) {
    auto up = decode_knob(frame_of({0x01}));
    ASSERT_TRUE(std::holds_alternative<KnobDelta>(up));
    EXPECT_EQ(std::get<KnobDelta>(up).delta, 1);

    auto down = decode_knob(frame_of({0xff}));
    ASSERT_TRUE(std::holds_alternative<KnobDelta>(down));
    EXPECT_EQ(std::get<KnobDelta>(down).delta, -1);
}

TEST(ResponseParser, Knob_IdleOrNoisy_Unrecognized) {
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode_knob(Frame{})));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode_knob(frame_of({0x01, 0x00, 0x05}))));
}

// ============================================================================
// Unknown input
// ============================================================================

TEST(ResponseParser, MissingPrefix_Unrecognized) {
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decode(frame_of({0x00, 0x05, 0x04, 0x1f}))));
}

TEST(ResponseParser, UnknownFamily_Unrecognized) {
    auto decoded = decode(frame_of({0x5a, 0x77, 0x01}));
    auto* u = std::get_if<Unrecognized>(&decoded);
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->raw[1], 0x77);
}

TEST(ResponseParser, KnownFamilyWithoutDecoder_IsBinary) {
    auto decoded = decode(frame_of({0x5a, 0x39, 0x01, 0x04}));
    auto* bin = std::get_if<BinaryResponse>(&decoded);
    ASSERT_NE(bin, nullptr);
    EXPECT_EQ(bin->family, proto::Family::DigitalFilter);
}

// ============================================================================
// Console descriptions
// ============================================================================

TEST(ResponseParser, DescribeFrame_OutgoingData) {
    Frame f = data_frame(proto::Space::Sbx, proto::SbxCode::crystalizer_level, 0.75f);
    EXPECT_EQ(describe_frame(f), "DATA SBX Crystalizer level = 0.750");
    EXPECT_EQ(describe_frame(commit_frame(proto::Space::Equalizer, 0x03)), "COMMIT EQ band 3");
}

TEST(ResponseParser, DescribeFrame_RouteSet) {
    EXPECT_EQ(describe_frame(frame_of({0x5a, 0x2c, 0x05, 0x00, 0x04})), "Routing route-set Headphones");
}
