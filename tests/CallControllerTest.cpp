#include <gtest/gtest.h>

#include "CallController.h"
#include "Fakes.h"

using namespace TestFakes;
using Session::CallMode;
using Session::CallStatus;

class CallControllerTest : public ::testing::Test {
protected:
    boost::asio::io_context io;
    Session::SessionStore store;
    FakeChannelFactory channels;
    std::shared_ptr<FakeInputState> mic = std::make_shared<FakeInputState>();
    std::shared_ptr<FakeOutputState> speaker = std::make_shared<FakeOutputState>();
    std::shared_ptr<FakeDecoderState> decoder = std::make_shared<FakeDecoderState>();

    std::unique_ptr<TransportSession> transport;
    std::unique_ptr<AudioCapture> capture;
    std::unique_ptr<AudioPlayback> playback;
    std::unique_ptr<CallController> controller;

    void SetUp() override {
        ClientConfig::Configuration config;
        config.reconnect.delays = {std::chrono::milliseconds(5)};
        config.capture.frameSamples = 4;

        transport = std::make_unique<TransportSession>(io, store, channels.Factory(), config.server, config.reconnect);
        capture = std::make_unique<AudioCapture>(io, config.capture, MakeInputFactory(mic));
        playback = std::make_unique<AudioPlayback>(io, config.playback,
                                                   std::make_unique<FakeDecoder>(decoder),
                                                   MakeOutputFactory(speaker));
        controller = std::make_unique<CallController>(store, *transport, *capture, *playback);
    }

    void TearDown() override {
        controller.reset();
        playback.reset();
        capture.reset();
        transport.reset();
    }

    void Speak(size_t samples) {
        mic->Deliver(std::vector<float>(samples, 0.1f));
    }
};

TEST_F(CallControllerTest, TextCallSendsTypedMessages)
{
    controller->StartCall(CallMode::TEXT);
    EXPECT_EQ(controller->Mode(), CallMode::TEXT);
    EXPECT_EQ(transport->GetMode(), CallMode::TEXT);
    ASSERT_EQ(channels.Count(), 1u);
    EXPECT_EQ(mic->openCalls, 0);
    channels.Last().Accept();
    EXPECT_EQ(store.GetCallStatus(), CallStatus::ACTIVE);

    EXPECT_TRUE(controller->SendText("  balance \n"));
    ASSERT_EQ(channels.Last().sentText.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(channels.Last().sentText[0])["content"], "balance");

    Session::SessionSnapshot s = store.Snapshot();
    ASSERT_EQ(s.messages.size(), 1u);
    EXPECT_EQ(s.messages[0].speaker, Session::Speaker::USER);
    EXPECT_EQ(s.messages[0].text, "balance");
    EXPECT_TRUE(s.messages[0].isFinal);

    EXPECT_FALSE(controller->SendText("   "));
    EXPECT_EQ(channels.Last().sentText.size(), 1u);
    EXPECT_EQ(store.Snapshot().messages.size(), 1u);
}

TEST_F(CallControllerTest, VoiceCallStreamsMicrophoneFrames)
{
    controller->StartCall(CallMode::VOICE);
    EXPECT_TRUE(capture->IsRecording());
    channels.Last().Accept();

    Speak(8);
    ASSERT_TRUE(RunUntil(io, [&] { return channels.Last().sentBinary.size() == 2; }));
    EXPECT_EQ(channels.Last().sentBinary[0].size(), 8u);
}

TEST_F(CallControllerTest, VoiceTextInputIsNotEchoedLocally)
{
    controller->StartCall(CallMode::VOICE);
    channels.Last().Accept();
    EXPECT_TRUE(controller->SendText("hello"));
    EXPECT_EQ(channels.Last().sentText.size(), 1u);
    EXPECT_TRUE(store.Snapshot().messages.empty());
}

TEST_F(CallControllerTest, MutedFramesAreNotSent)
{
    controller->StartCall(CallMode::VOICE);
    channels.Last().Accept();

    controller->ToggleMute();
    EXPECT_TRUE(store.IsMuted());
    Speak(8);
    RunFor(io, std::chrono::milliseconds(20));
    EXPECT_TRUE(channels.Last().sentBinary.empty());

    controller->ToggleMute();
    Speak(4);
    ASSERT_TRUE(RunUntil(io, [&] { return channels.Last().sentBinary.size() == 1; }));
}

TEST_F(CallControllerTest, MicrophoneFailureKeepsTheCallReceiveOnly)
{
    mic->failOpen = true;
    controller->StartCall(CallMode::VOICE);
    EXPECT_TRUE(controller->InCall());
    EXPECT_FALSE(capture->IsRecording());
    ASSERT_EQ(channels.Count(), 1u);

    channels.Last().Accept();
    channels.Last().Deliver(R"({"type":"session","session_id":"s-9"})");
    EXPECT_EQ(store.GetCallStatus(), CallStatus::ACTIVE);
}

TEST_F(CallControllerTest, AgentAudioIsPlayed)
{
    controller->StartCall(CallMode::VOICE);
    channels.Last().Accept();

    channels.Last().Deliver(R"({"type":"audio","data":"DAAA"})");   // {12, 0, 0}
    ASSERT_TRUE(RunUntil(io, [&] { return speaker->HasActive(); }));
    EXPECT_EQ(decoder->Decoded(), std::vector<int>{12});

    channels.Last().Deliver(R"({"type":"audio"})");
    RunFor(io, std::chrono::milliseconds(10));
    EXPECT_EQ(decoder->Decoded().size(), 1u);
}

TEST_F(CallControllerTest, EndCallStopsEverything)
{
    controller->StartCall(CallMode::VOICE);
    channels.Last().Accept();
    channels.Last().Deliver(R"({"type":"audio","data":"DAAA"})");
    ASSERT_TRUE(RunUntil(io, [&] { return speaker->HasActive(); }));

    FakeChannelState& channel = channels.Last();
    controller->EndCall();

    EXPECT_FALSE(controller->InCall());
    EXPECT_FALSE(capture->IsRecording());
    EXPECT_EQ(mic->closeCalls, 1);
    EXPECT_FALSE(playback->IsPlaying());
    EXPECT_EQ(speaker->closeCalls, 1);
    ASSERT_EQ(channel.sentText.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(channel.sentText[0])["type"], "stop");
    EXPECT_EQ(channel.closeCodes, std::vector<uint16_t>{kCloseNormal});
    EXPECT_EQ(store.GetCallStatus(), CallStatus::ENDED);

    controller->EndCall();
    EXPECT_EQ(channel.sentText.size(), 1u);
}

TEST_F(CallControllerTest, StartingAgainResetsTheSession)
{
    controller->StartCall(CallMode::TEXT);
    channels.Last().Accept();
    controller->SendText("first call");
    controller->SetVolume(0.3f);
    ASSERT_EQ(store.Snapshot().messages.size(), 1u);

    controller->StartCall(CallMode::TEXT);
    Session::SessionSnapshot s = store.Snapshot();
    EXPECT_TRUE(s.messages.empty());
    EXPECT_FLOAT_EQ(s.volume, 1.0f);
    EXPECT_FLOAT_EQ(playback->GetVolume(), 1.0f);
    EXPECT_EQ(s.callStatus, CallStatus::CONNECTING);
    EXPECT_EQ(channels.Count(), 2u);
    EXPECT_EQ(channels.channels[0]->sentText.size(), 2u);
}

TEST_F(CallControllerTest, VolumeReachesStoreAndPlayback)
{
    controller->SetVolume(2.0f);
    EXPECT_FLOAT_EQ(store.Snapshot().volume, 1.0f);
    EXPECT_FLOAT_EQ(playback->GetVolume(), 1.0f);

    controller->SetVolume(0.25f);
    EXPECT_FLOAT_EQ(store.Snapshot().volume, 0.25f);
    EXPECT_FLOAT_EQ(playback->GetVolume(), 0.25f);
}
