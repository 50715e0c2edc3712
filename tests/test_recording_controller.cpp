#include <gtest/gtest.h>
#include "daemon/RecordingController.hpp"
#include "FakeAudioCapture.hpp"
#include "FakeSoundOutput.hpp"
#include "FakeTranscriber.hpp"
#include <cmath>
#include <future>

static std::vector<float> tone(size_t n) {
    std::vector<float> out(n);
    for (size_t i = 0; i < n; i++)
        out[i] = 0.1732f * (float)std::sin(2.0 * 3.14159265358979 * 200.0 * i / 16000.0);
    return out;
}

// Holds every call until release()
class GatedTranscriber : public FakeTranscriber {
public:
    TranscriptionResult transcribe(const std::vector<float>& pcm,
                                   int sampleRate) override {
        gate_.wait();
        return FakeTranscriber::transcribe(pcm, sampleRate);
    }
    void release() { open_.set_value(); }

private:
    std::promise<void>       open_;
    std::shared_future<void> gate_ = open_.get_future().share();
};

class RecordingControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        micBank = std::make_shared<FakeDeviceBank>();
        micBank->addDevice(0, "Built-in Audio Analog Stereo");

        loopBank = std::make_shared<FakeDeviceBank>();
        loopBank->addDevice(5, "Monitor of Built-in Audio Speaker");
    }

    std::unique_ptr<RecordingController> make(
        std::shared_ptr<ITranscriber> t, bool withLoopback = true)
    {
        pipeline = std::make_shared<ProcessingPipeline>(
            PipelineConfig{}, t,
            std::make_unique<EchoCanceller>(),
            std::make_unique<VoiceActivityDetector>());
        pipeline->setOutcomeListener([this](PipelineOutcome o) {
            std::lock_guard lock(outcomeMtx);
            outcomes.push_back(o);
        });

        auto mic = std::make_unique<Recorder>(fakeFactory(micBank), RecorderConfig{});
        std::unique_ptr<LoopbackRecorder> loopback;
        if (withLoopback)
            loopback = std::make_unique<LoopbackRecorder>(fakeFactory(loopBank),
                                                          RecorderConfig{});
        return std::make_unique<RecordingController>(
            std::move(mic), std::move(loopback), pipeline, std::move(feedback));
    }

    // Installs a cue player for the next make(); returns it for waitIdle()
    FeedbackPlayer* withFeedback() {
        assets = makeAssetDir("controller");
        FeedbackConfig fc;
        fc.assetDirs = {assets};
        feedback = std::make_unique<FeedbackPlayer>(
            fc, std::make_unique<FakeSoundOutput>(sounds), &fakeClipLoader);
        return feedback.get();
    }

    void TearDown() override {
        if (!assets.empty()) std::filesystem::remove_all(assets);
    }

    std::vector<PipelineOutcome> lastOutcomes() {
        std::lock_guard lock(outcomeMtx);
        return outcomes;
    }

    std::shared_ptr<FakeDeviceBank>     micBank;
    std::shared_ptr<FakeDeviceBank>     loopBank;
    std::shared_ptr<FakeTranscriber>    transcriber = std::make_shared<FakeTranscriber>();
    std::shared_ptr<ProcessingPipeline> pipeline;
    std::unique_ptr<FeedbackPlayer>     feedback;
    std::shared_ptr<SoundLog>           sounds = std::make_shared<SoundLog>();
    std::string                         assets;

    std::mutex                   outcomeMtx;
    std::vector<PipelineOutcome> outcomes;
};

TEST_F(RecordingControllerTest, StartAndStopTransitions) {
    auto c = make(transcriber);
    EXPECT_EQ(c->status(), RecordingState::Idle);

    auto r = c->start();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Recording started");
    EXPECT_EQ(c->status(), RecordingState::Recording);

    r = c->stop();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Recording stopped");
    EXPECT_EQ(c->status(), RecordingState::Idle);
    EXPECT_TRUE(c->waitForProcessing(2000));
}

TEST_F(RecordingControllerTest, SecondStartIsAlreadyRecording) {
    auto c = make(transcriber);
    ASSERT_TRUE(c->start().success);

    auto r = c->start();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ControlError::AlreadyRecording);
    EXPECT_EQ(c->status(), RecordingState::Recording);
    EXPECT_EQ(micBank->created, 1);
}

TEST_F(RecordingControllerTest, StopWhileIdleIsNotRecording) {
    auto c = make(transcriber);
    auto r = c->stop();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ControlError::NotRecording);
    EXPECT_EQ(r.message, "Not recording");
    EXPECT_EQ(pipeline->activeTasks(), 0);
}

TEST_F(RecordingControllerTest, ToggleAlternates) {
    auto c = make(transcriber);
    EXPECT_EQ(c->toggle().message, "Recording started");
    EXPECT_EQ(c->status(), RecordingState::Recording);
    EXPECT_EQ(c->toggle().message, "Recording stopped");
    EXPECT_EQ(c->status(), RecordingState::Idle);
    EXPECT_TRUE(c->waitForProcessing(2000));
}

TEST_F(RecordingControllerTest, LoopbackStartsWithEchoCancellation) {
    auto c = make(transcriber);
    ASSERT_TRUE(c->start().success);
    EXPECT_TRUE(c->echoCancellationActive());
    ASSERT_EQ(loopBank->openedIds.size(), 1u);
    EXPECT_EQ(loopBank->openedIds[0], 5);
}

TEST_F(RecordingControllerTest, LoopbackFailureOnlyDisablesEchoCancellation) {
    loopBank->devices.clear();
    auto c = make(transcriber);

    auto r = c->start();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(c->status(), RecordingState::Recording);
    EXPECT_FALSE(c->echoCancellationActive());
}

TEST_F(RecordingControllerTest, MicrophoneFailureAbortsStart) {
    micBank->failOpen.insert(-1);
    auto c = make(transcriber);

    auto r = c->start();
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ControlError::DeviceError);
    EXPECT_EQ(c->status(), RecordingState::Idle);
    EXPECT_FALSE(c->echoCancellationActive());
    EXPECT_EQ(loopBank->stopped, 1);  // reference session torn down
}

TEST_F(RecordingControllerTest, SilentUtteranceNeverReachesTranscriber) {
    auto c = make(transcriber);
    ASSERT_TRUE(c->start().success);
    micBank->emit(std::vector<float>(48000, 0.0f));
    loopBank->emit(std::vector<float>(48000, 0.0f));

    ASSERT_TRUE(c->stop().success);
    ASSERT_TRUE(c->waitForProcessing(5000));

    EXPECT_EQ(transcriber->callCount(), 0);
    auto o = lastOutcomes();
    ASSERT_EQ(o.size(), 1u);
    EXPECT_EQ(o[0], PipelineOutcome::NoSpeech);
}

TEST_F(RecordingControllerTest, TranscriptionFailureLeavesControllerReady) {
    transcriber->reply = {false, "", "model not loaded"};
    auto c = make(transcriber, false);

    ASSERT_TRUE(c->start().success);
    micBank->emit(tone(16000));
    ASSERT_TRUE(c->stop().success);
    ASSERT_TRUE(c->waitForProcessing(5000));

    EXPECT_EQ(transcriber->callCount(), 1);
    EXPECT_EQ(lastOutcomes().back(), PipelineOutcome::TranscriptionFailed);

    EXPECT_TRUE(c->start().success);
    EXPECT_EQ(c->status(), RecordingState::Recording);
}

TEST_F(RecordingControllerTest, NewSessionOverlapsPendingProcessing) {
    auto gated = std::make_shared<GatedTranscriber>();
    auto c = make(gated, false);

    ASSERT_TRUE(c->start().success);
    micBank->emit(tone(16000));
    ASSERT_TRUE(c->stop().success);

    // stop() returned while the task is still held in the transcriber
    EXPECT_EQ(c->status(), RecordingState::Idle);
    EXPECT_EQ(c->detailedStatus(), RecordingState::Processing);

    ASSERT_TRUE(c->start().success);
    EXPECT_EQ(c->detailedStatus(), RecordingState::Recording);
    micBank->emit(tone(8000));
    ASSERT_TRUE(c->stop().success);

    gated->release();
    ASSERT_TRUE(c->waitForProcessing(5000));
    EXPECT_EQ(gated->callCount(), 2);
    EXPECT_EQ(c->detailedStatus(), RecordingState::Idle);
}

TEST_F(RecordingControllerTest, ShutdownClosesOpenSession) {
    auto c = make(transcriber);
    ASSERT_TRUE(c->start().success);
    c->shutdown();

    EXPECT_EQ(c->status(), RecordingState::Idle);
    EXPECT_EQ(micBank->stopped, 1);
    EXPECT_EQ(loopBank->stopped, 1);
    EXPECT_EQ(pipeline->activeTasks(), 0);
}

TEST_F(RecordingControllerTest, CuesFollowSuccessfulTransitions) {
    auto* player = withFeedback();
    auto c = make(transcriber);

    ASSERT_TRUE(c->start().success);
    ASSERT_TRUE(player->waitIdle(2000));
    auto played = sounds->snapshot();
    ASSERT_EQ(played.size(), 1u);
    EXPECT_TRUE(isStartCue(played[0]));

    EXPECT_FALSE(c->start().success);  // already recording: no cue

    ASSERT_TRUE(c->stop().success);
    ASSERT_TRUE(player->waitIdle(2000));
    played = sounds->snapshot();
    ASSERT_EQ(played.size(), 2u);
    EXPECT_TRUE(isStopCue(played[1]));

    EXPECT_FALSE(c->stop().success);   // not recording: no cue
    ASSERT_TRUE(player->waitIdle(2000));
    EXPECT_EQ(sounds->snapshot().size(), 2u);
    ASSERT_TRUE(c->waitForProcessing(2000));
}

TEST_F(RecordingControllerTest, FailedStartPlaysNoCue) {
    micBank->failOpen.insert(-1);
    auto* player = withFeedback();
    auto c = make(transcriber);

    EXPECT_FALSE(c->start().success);
    ASSERT_TRUE(player->waitIdle(2000));
    EXPECT_TRUE(sounds->snapshot().empty());
}
