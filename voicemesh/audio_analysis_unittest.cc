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

#include "audio_analysis.h"

#include <vector>

#include <gtest/gtest.h>

#include "test/fake_audio_track.h"

class AudioAnalysisTest : public ::testing::Test {
 protected:
  void TearDown() override { AudioAnalysisContext::Shutdown(); }
};

TEST_F(AudioAnalysisTest, ContextIsSharedAndLazy) {
  AudioAnalysisContext::Shutdown();
  EXPECT_EQ(AudioAnalysisContext::GetIfExists(), nullptr);
  AudioAnalysisContext* context = AudioAnalysisContext::Get();
  ASSERT_NE(context, nullptr);
  EXPECT_EQ(AudioAnalysisContext::Get(), context);
  EXPECT_EQ(AudioAnalysisContext::GetIfExists(), context);
}

TEST_F(AudioAnalysisTest, RmsOfSilenceAndTone) {
  auto analyser = AudioAnalysisContext::Get()->CreateAnalyser("test", nullptr);
  EXPECT_FLOAT_EQ(analyser->Rms(), 0.0f);

  std::vector<float> tone(LevelAnalyser::kWindowSize);
  for (size_t i = 0; i < tone.size(); ++i)
    tone[i] = (i % 2) ? 0.25f : -0.25f;
  analyser->AppendSamples(tone.data(), tone.size());
  EXPECT_NEAR(analyser->Rms(), 0.25f, 1e-5);

  std::vector<float> silence(LevelAnalyser::kWindowSize, 0.0f);
  analyser->AppendSamples(silence.data(), silence.size());
  EXPECT_NEAR(analyser->Rms(), 0.0f, 1e-6);
}

TEST_F(AudioAnalysisTest, TrackSamplesReachAnalyser) {
  auto track = FakeAudioTrack::Create("mic");
  auto analyser = AudioAnalysisContext::Get()->CreateAnalyser("local", track);
  ASSERT_EQ(track->sink_count(), 1u);

  track->PushTone(0.5f);
  EXPECT_NEAR(analyser->Rms(), 0.5f, 1e-3);
}

TEST_F(AudioAnalysisTest, DisconnectIsIdempotent) {
  auto track = FakeAudioTrack::Create("mic");
  auto analyser = AudioAnalysisContext::Get()->CreateAnalyser("local", track);
  EXPECT_EQ(AudioAnalysisContext::Get()->live_analysers(), 1u);

  analyser->Disconnect();
  analyser->Disconnect();
  EXPECT_FALSE(analyser->connected());
  EXPECT_EQ(track->sink_count(), 0u);
  EXPECT_EQ(AudioAnalysisContext::Get()->live_analysers(), 0u);
}

TEST_F(AudioAnalysisTest, ShutdownDetachesSurvivors) {
  auto track = FakeAudioTrack::Create("mic");
  auto analyser = AudioAnalysisContext::Get()->CreateAnalyser("local", track);

  AudioAnalysisContext::Shutdown();
  EXPECT_EQ(AudioAnalysisContext::GetIfExists(), nullptr);
  EXPECT_FALSE(analyser->connected());
  EXPECT_EQ(track->sink_count(), 0u);

  // Destroying the survivor after shutdown must not touch the old context.
  analyser.reset();
  AudioAnalysisContext::Shutdown();
}
