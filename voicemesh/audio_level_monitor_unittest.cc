/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include "audio_level_monitor.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_audio_track.h"
#include "test/fake_task_queue.h"

namespace {

const webrtc::TimeDelta kInterval = webrtc::TimeDelta::Millis(200);
const float kThreshold = 0.02f;

class RecordingDelegate : public AudioLevelMonitor::Delegate {
 public:
  bool BroadcastMute(bool muted) override {
    broadcasts.push_back(muted);
    return deliver;
  }
  std::vector<bool> broadcasts;
  bool deliver = true;
};

}  // namespace

TEST(AudioLevelMathTest, LevelFromRmsIsClamped) {
  EXPECT_FLOAT_EQ(AudioLevelMonitor::LevelFromRms(0.0f), 0.0f);
  EXPECT_FLOAT_EQ(AudioLevelMonitor::LevelFromRms(0.5f), 0.75f);
  EXPECT_FLOAT_EQ(AudioLevelMonitor::LevelFromRms(0.9f), 1.0f);
  EXPECT_FLOAT_EQ(AudioLevelMonitor::LevelFromRms(-0.1f), 0.0f);
}

TEST(AudioLevelMathTest, SmoothingConvergesMonotonically) {
  for (float target : {0.8f, 0.1f}) {
    float level = target > 0.5f ? 0.0f : 1.0f;
    for (int i = 0; i < 100; ++i) {
      const float next = AudioLevelMonitor::SmoothLevel(level, target);
      EXPECT_LE(next, std::max(level, target) + 1e-6f);
      EXPECT_GE(next, std::min(level, target) - 1e-6f);
      EXPECT_LE(std::abs(next - target), std::abs(level - target) + 1e-6f);
      level = next;
    }
    EXPECT_NEAR(level, target, 1e-3);
  }
}

class AudioLevelMonitorTest : public ::testing::Test {
 protected:
  AudioLevelMonitorTest()
      : clock_(1000000),
        queue_(&clock_),
        track_(FakeAudioTrack::Create("mic")),
        stream_(track_),
        monitor_(&queue_, &clock_, "alice", &state_, &registry_, &delegate_, kInterval,
                 kInterval, kThreshold) {}

  void TearDown() override {
    monitor_.Reset();
    registry_.DisposeAll();
    AudioAnalysisContext::Shutdown();
  }

  // Remote peer whose audio is fed directly into its analyser.
  LevelAnalyser* AddSpeaker(const std::string& peer_id) {
    auto record = std::make_unique<PeerConnectionRecord>();
    record->peer_id = peer_id;
    record->record_id = registry_.NextRecordId();
    record->remote_audio_sink =
        AudioAnalysisContext::Get()->CreateAnalyser("remote:" + peer_id, nullptr);
    return registry_.Upsert(std::move(record))->remote_audio_sink.get();
  }

  static void Feed(LevelAnalyser* analyser, float amplitude) {
    std::vector<float> samples(LevelAnalyser::kWindowSize);
    for (size_t i = 0; i < samples.size(); ++i)
      samples[i] = (i % 2) ? amplitude : -amplitude;
    analyser->AppendSamples(samples.data(), samples.size());
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  rtc::scoped_refptr<FakeAudioTrack> track_;
  TrackLocalAudioStream stream_;
  VoiceSessionState state_;
  PeerConnectionRegistry registry_;
  RecordingDelegate delegate_;
  AudioLevelMonitor monitor_;
};

TEST_F(AudioLevelMonitorTest, LocalLevelFollowsMicrophone) {
  state_.UpsertParticipant("alice", "Alice");
  monitor_.SetLocalStream(&stream_);
  track_->PushTone(0.5f);

  monitor_.SampleLevels();
  const VoiceParticipant* self = state_.FindParticipant("alice");
  EXPECT_NEAR(self->audio_level, 0.3f * 0.75f, 1e-3);
  EXPECT_FALSE(self->is_muted);

  monitor_.SampleLevels();
  EXPECT_NEAR(self->audio_level, 0.7f * 0.225f + 0.3f * 0.75f, 1e-3);
}

TEST_F(AudioLevelMonitorTest, DisabledTrackMarksSelfMuted) {
  state_.UpsertParticipant("alice", "Alice");
  monitor_.SetLocalStream(&stream_);
  stream_.Mute();
  monitor_.SampleLevels();
  EXPECT_TRUE(state_.FindParticipant("alice")->is_muted);

  monitor_.SetLocalStream(nullptr);
  stream_.Unmute();
  monitor_.SampleLevels();
  EXPECT_TRUE(state_.FindParticipant("alice")->is_muted);
}

TEST_F(AudioLevelMonitorTest, ExplicitMuteBeatsSilenceHeuristic) {
  state_.UpsertParticipant("bob", "Bob");
  state_.UpsertParticipant("carol", "Carol");
  state_.UpsertParticipant("dave", "Dave");
  AddSpeaker("bob");
  AddSpeaker("carol");
  Feed(AddSpeaker("dave"), 0.5f);

  // Quiet but said so explicitly.
  state_.SetExplicitMute("bob", false);

  monitor_.SampleLevels();
  EXPECT_FALSE(state_.FindParticipant("bob")->is_muted);
  EXPECT_TRUE(state_.FindParticipant("carol")->is_muted);
  EXPECT_FALSE(state_.FindParticipant("dave")->is_muted);

  state_.SetExplicitMute("dave", true);
  monitor_.SampleLevels();
  EXPECT_TRUE(state_.FindParticipant("dave")->is_muted);
  EXPECT_GT(state_.FindParticipant("dave")->audio_level, kThreshold);
}

TEST_F(AudioLevelMonitorTest, DepartedParticipantLosesHistory) {
  state_.UpsertParticipant("dave", "Dave");
  Feed(AddSpeaker("dave"), 0.5f);
  monitor_.SampleLevels();
  monitor_.SampleLevels();

  state_.RemoveParticipant("dave");
  monitor_.SampleLevels();
  state_.UpsertParticipant("dave", "Dave");
  monitor_.SampleLevels();

  EXPECT_NEAR(state_.FindParticipant("dave")->audio_level, 0.3f * 0.75f, 1e-3);
}

TEST_F(AudioLevelMonitorTest, PeriodicSampling) {
  state_.UpsertParticipant("dave", "Dave");
  Feed(AddSpeaker("dave"), 0.5f);
  monitor_.Start();
  ASSERT_TRUE(monitor_.running());

  queue_.AdvanceTime(kInterval);
  EXPECT_GT(state_.FindParticipant("dave")->audio_level, 0.0f);

  monitor_.Stop();
  const float level = state_.FindParticipant("dave")->audio_level;
  queue_.AdvanceTime(kInterval * 5);
  EXPECT_FLOAT_EQ(state_.FindParticipant("dave")->audio_level, level);
}

TEST_F(AudioLevelMonitorTest, MuteToggleBroadcastOnce) {
  monitor_.SetLocalStream(&stream_);
  monitor_.mute_detector().ResetBaseline();
  monitor_.Start();

  stream_.Mute();
  queue_.AdvanceTime(kInterval);
  ASSERT_EQ(delegate_.broadcasts.size(), 1u);
  EXPECT_TRUE(delegate_.broadcasts[0]);

  queue_.AdvanceTime(kInterval * 10);
  EXPECT_EQ(delegate_.broadcasts.size(), 1u);

  stream_.Unmute();
  queue_.AdvanceTime(kInterval);
  ASSERT_EQ(delegate_.broadcasts.size(), 2u);
  EXPECT_FALSE(delegate_.broadcasts[1]);
}

TEST_F(AudioLevelMonitorTest, UndeliveredMuteIsRetried) {
  monitor_.SetLocalStream(&stream_);
  monitor_.mute_detector().ResetBaseline();
  delegate_.deliver = false;

  stream_.Mute();
  monitor_.PollMute();
  monitor_.PollMute();
  EXPECT_EQ(delegate_.broadcasts.size(), 2u);

  delegate_.deliver = true;
  monitor_.PollMute();
  monitor_.PollMute();
  EXPECT_EQ(delegate_.broadcasts.size(), 3u);
}

TEST_F(AudioLevelMonitorTest, NoPollingWithoutLocalStream) {
  monitor_.PollMute();
  EXPECT_TRUE(delegate_.broadcasts.empty());
  EXPECT_FALSE(monitor_.HasEnabledLocalTrack());
}
