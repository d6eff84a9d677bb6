#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>

#include <QMutex>
#include <QMutexLocker>
#include <QThread>

#include "FakeG6Device.hpp"
#include "event_listener.hpp"
#include "mocks/MockTransport.hpp"
#include "runtime_settings.hpp"

using namespace g6;
using g6::tests::MockTransport;
using g6::tests::audio_report;
using g6::tests::button_broadcast;
using g6::tests::frame_of;
using g6::tests::route_broadcast;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

// Collects from the listener thread
struct Recorder {
    QMutex mtx;
    std::vector<DeviceEvent> events;
    std::optional<Error> stopped;

    void attach(EventListener& listener) {
        QObject::connect(&listener, &EventListener::deviceEvent, &listener, [this](g6::DeviceEvent ev) {
            QMutexLocker lock(&mtx);
            events.push_back(ev);
        }, Qt::DirectConnection);
        QObject::connect(&listener, &EventListener::listenerStopped, &listener, [this](g6::Error reason) {
            QMutexLocker lock(&mtx);
            stopped = reason;
        }, Qt::DirectConnection);
    }

    std::vector<DeviceEvent> snapshot() {
        QMutexLocker lock(&mtx);
        return events;
    }
};

Error idle_read(Frame&, int timeout_ms) {
    QThread::msleep(timeout_ms < 5 ? timeout_ms : 5);
    return Error::Timeout;
}

} // namespace

// ============================================================================
// Event mapping
// ============================================================================

TEST(EventMapping, Route_OutputChanged) {
    Frame raw = route_broadcast(Output::Speakers);
    auto events = events_from(DecodedResponse{Route{Output::Speakers}}, raw);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], DeviceEvent{event::OutputChanged{Output::Speakers}});
}

TEST(EventMapping, SbxToggleAndLevel) {
    Frame raw = {};
    auto toggled = events_from(DecodedResponse{AudioValue{proto::Space::Sbx, proto::SbxCode::bass_toggle, 1.0f, 0.0f}}, raw);
    ASSERT_EQ(toggled.size(), 1u);
    EXPECT_EQ(toggled[0], DeviceEvent{event::EffectToggled{Effect::Bass, true}});

    auto level = events_from(DecodedResponse{AudioValue{proto::Space::Sbx, proto::SbxCode::surround_level, 0.5f, 0.0f}}, raw);
    ASSERT_EQ(level.size(), 1u);
    EXPECT_EQ(level[0], DeviceEvent{event::EffectValueChanged{Effect::Surround, 50}});
}

TEST(EventMapping, EqValue_Unrecognized) {
    Frame raw = audio_report(proto::Space::Equalizer, 0x03, 2.0f);
    auto events = events_from(DecodedResponse{AudioValue{proto::Space::Equalizer, 0x03, 2.0f, 0.0f}}, raw);
    ASSERT_EQ(events.size(), 1u);
    auto* u = std::get_if<event::Unrecognized>(&events[0]);
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->raw, raw);
}

TEST(EventMapping, GamingMask_BothModes) {
    auto events = events_from(DecodedResponse{GamingModes{true, false}}, Frame{});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], DeviceEvent{event::ModeChanged{Mode::Sbx, true}});
    EXPECT_EQ(events[1], DeviceEvent{event::ModeChanged{Mode::Scout, false}});
}

TEST(EventMapping, ButtonAndKnob) {
    auto button = events_from(DecodedResponse{ButtonState{proto::ButtonCode::ScoutButton, 0x02}}, Frame{});
    ASSERT_EQ(button.size(), 1u);
    EXPECT_EQ(button[0], DeviceEvent{event::ButtonPressed{proto::ButtonCode::ScoutButton}});

    auto knob = events_from(DecodedResponse{KnobDelta{-2}}, Frame{});
    ASSERT_EQ(knob.size(), 1u);
    EXPECT_EQ(knob[0], DeviceEvent{event::VolumeKnobTurned{-2}});
}

TEST(EventMapping, IdleFrame_NoEvent) {
    EXPECT_TRUE(events_from(DecodedResponse{Unrecognized{Frame{}}}, Frame{}).empty());
}

TEST(EventMapping, CommandResponses) {
    EXPECT_TRUE(is_command_response(DecodedResponse{Route{Output::Speakers}}));
    EXPECT_TRUE(is_command_response(DecodedResponse{Identification{0x1f}}));
    EXPECT_FALSE(is_command_response(DecodedResponse{ButtonState{proto::ButtonCode::OutputButton, 0x03}}));
    EXPECT_FALSE(is_command_response(DecodedResponse{KnobDelta{1}}));
}

// ============================================================================
// Listener thread
// ============================================================================

class EventListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_settings.reset();
        runtime_settings.set_listener_poll_ms(10);
        runtime_settings.set_quiet_window_ms(0);
        qRegisterMetaType<g6::DeviceEvent>();
        qRegisterMetaType<g6::Error>();
    }

    void TearDown() override {
        runtime_settings.reset();
    }
};

TEST_F(EventListenerTest, Knob_PublishesDeltaThenStopsOnRemoval) {
    auto knob = std::make_unique<MockTransport>();
    EXPECT_CALL(*knob, write(_)).Times(0);
    EXPECT_CALL(*knob, read(_, _))
        .WillOnce(DoAll(SetArgReferee<0>(frame_of({0x01})), Return(Error::Ok)))
        .WillOnce(DoAll(SetArgReferee<0>(frame_of({0xff})), Return(Error::Ok)))
        .WillRepeatedly(Return(Error::DeviceGone));

    EventListener listener(std::unique_ptr<Transport>(std::move(knob)));
    EXPECT_TRUE(listener.isKnobChannel());
    Recorder rec;
    rec.attach(listener);
    listener.start();
    ASSERT_TRUE(listener.wait(2000));

    auto events = rec.snapshot();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], DeviceEvent{event::VolumeKnobTurned{1}});
    EXPECT_EQ(events[1], DeviceEvent{event::VolumeKnobTurned{-1}});
    ASSERT_TRUE(rec.stopped.has_value());
    EXPECT_EQ(*rec.stopped, Error::DeviceGone);
}

TEST_F(EventListenerTest, RepeatedIoErrors_StopListener) {
    auto knob = std::make_unique<MockTransport>();
    EXPECT_CALL(*knob, read(_, _)).WillRepeatedly(Return(Error::IoError));

    EventListener listener(std::unique_ptr<Transport>(std::move(knob)));
    Recorder rec;
    rec.attach(listener);
    listener.start();
    ASSERT_TRUE(listener.wait(2000));
    ASSERT_TRUE(rec.stopped.has_value());
    EXPECT_EQ(*rec.stopped, Error::IoError);
}

TEST_F(EventListenerTest, Stop_EndsIdleListener) {
    auto knob = std::make_unique<MockTransport>();
    EXPECT_CALL(*knob, read(_, _)).WillRepeatedly(Invoke(idle_read));

    EventListener listener(std::unique_ptr<Transport>(std::move(knob)));
    Recorder rec;
    rec.attach(listener);
    listener.start();
    QThread::msleep(20);
    EXPECT_TRUE(listener.stop());
    ASSERT_TRUE(rec.stopped.has_value());
    EXPECT_EQ(*rec.stopped, Error::Ok);
    EXPECT_TRUE(rec.snapshot().empty());
}

TEST_F(EventListenerTest, Broadcast_DropsReplayedResponsesInQuietWindow) {
    runtime_settings.set_quiet_window_ms(10000);
    auto mock = std::make_unique<MockTransport>();
    EXPECT_CALL(*mock, write(_)).Times(0);
    EXPECT_CALL(*mock, read(_, _))
        .WillOnce(DoAll(SetArgReferee<0>(route_broadcast(Output::Speakers)), Return(Error::Ok)))
        .WillOnce(DoAll(SetArgReferee<0>(button_broadcast(proto::ButtonCode::OutputButton)), Return(Error::Ok)))
        .WillRepeatedly(Return(Error::DeviceGone));

    auto shared = std::make_shared<SharedTransport>(std::move(mock));
    shared->mark_command_end();

    EventListener listener(shared);
    EXPECT_FALSE(listener.isKnobChannel());
    Recorder rec;
    rec.attach(listener);
    listener.start();
    ASSERT_TRUE(listener.wait(2000));

    // The route reply is a replay, the button press is a real broadcast
    auto events = rec.snapshot();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], DeviceEvent{event::ButtonPressed{proto::ButtonCode::OutputButton}});
}

TEST_F(EventListenerTest, Broadcast_OutsideQuietWindow_Published) {
    auto mock = std::make_unique<MockTransport>();
    EXPECT_CALL(*mock, read(_, _))
        .WillOnce(DoAll(SetArgReferee<0>(audio_report(proto::Space::Sbx, proto::SbxCode::crystalizer_toggle, 0.0f)),
                        Return(Error::Ok)))
        .WillRepeatedly(Return(Error::DeviceGone));

    auto shared = std::make_shared<SharedTransport>(std::move(mock));
    EventListener listener(shared);
    Recorder rec;
    rec.attach(listener);
    listener.start();
    ASSERT_TRUE(listener.wait(2000));

    auto events = rec.snapshot();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], DeviceEvent{event::EffectToggled{Effect::Crystalizer, false}});
}

TEST_F(EventListenerTest, Broadcast_ReleasesControlChannelOnEveryExit) {
    auto mock = std::make_unique<MockTransport>();
    EXPECT_CALL(*mock, read(_, _))
        .WillOnce(Return(Error::IoError))
        .WillOnce(DoAll(SetArgReferee<0>(button_broadcast(proto::ButtonCode::SbxButton)), Return(Error::Ok)))
        .WillOnce(Return(Error::Timeout))
        .WillRepeatedly(Return(Error::DeviceGone));

    auto shared = std::make_shared<SharedTransport>(std::move(mock));
    EventListener listener(shared);
    Recorder rec;
    rec.attach(listener);
    listener.start();
    ASSERT_TRUE(listener.wait(2000));
    ASSERT_TRUE(rec.stopped.has_value());
    EXPECT_EQ(*rec.stopped, Error::DeviceGone);

    // A command can take the pipe once the listener is gone
    ASSERT_TRUE(shared->mutex().tryLock(100));
    shared->mutex().unlock();
}
