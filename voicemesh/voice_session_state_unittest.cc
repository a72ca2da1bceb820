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

#include "voice_session_state.h"

#include <gtest/gtest.h>

TEST(VoiceSessionStateTest, ParticipantsKeepAnnouncementOrder) {
  VoiceSessionState state;
  state.UpsertParticipant("carol", "Carol");
  state.UpsertParticipant("alice", "");
  state.UpsertParticipant("bob", "Bob");

  ASSERT_EQ(state.participants().size(), 3u);
  EXPECT_EQ(state.participants()[0].user_id, "carol");
  EXPECT_EQ(state.participants()[1].username, "alice");
  EXPECT_TRUE(state.participants()[2].is_muted);
  EXPECT_FLOAT_EQ(state.participants()[2].audio_level, 0.0f);
}

TEST(VoiceSessionStateTest, UpsertKeepsLevelAndMute) {
  VoiceSessionState state;
  state.UpsertParticipant("bob", "Bob");
  state.SetParticipantAudio("bob", 0.4f, false);
  state.UpsertParticipant("bob", "");
  state.UpsertParticipant("bob", "Robert");

  const VoiceParticipant* bob = state.FindParticipant("bob");
  ASSERT_NE(bob, nullptr);
  EXPECT_EQ(bob->username, "Robert");
  EXPECT_FLOAT_EQ(bob->audio_level, 0.4f);
  EXPECT_FALSE(bob->is_muted);
  EXPECT_EQ(state.participants().size(), 1u);
}

TEST(VoiceSessionStateTest, ChangeCallbackOnlyOnRealChanges) {
  VoiceSessionState state;
  int changes = 0;
  state.SetChangeCallback([&changes]() { changes++; });

  state.UpsertParticipant("bob", "Bob");
  state.UpsertParticipant("bob", "Bob");
  EXPECT_EQ(changes, 1);

  state.SetParticipantMuted("bob", true);
  EXPECT_EQ(changes, 1);
  state.SetParticipantMuted("bob", false);
  EXPECT_EQ(changes, 2);

  state.SetConnectionError("oops");
  state.SetConnectionError("oops");
  state.ClearConnectionError();
  state.ClearConnectionError();
  EXPECT_EQ(changes, 4);

  EXPECT_FALSE(state.RemoveParticipant("nobody"));
  EXPECT_EQ(changes, 4);
}

TEST(VoiceSessionStateTest, ExplicitMuteCache) {
  VoiceSessionState state;
  EXPECT_FALSE(state.ExplicitMute("bob").has_value());
  state.SetExplicitMute("bob", true);
  EXPECT_EQ(state.ExplicitMute("bob"), true);
  state.ForgetExplicitMute("bob");
  EXPECT_FALSE(state.ExplicitMute("bob").has_value());
}

TEST(VoiceSessionStateTest, ClearKeepsTransmitCapability) {
  VoiceSessionState state;
  state.set_can_transmit(false);
  state.set_audio_enabled(true);
  state.set_has_local_stream(true);
  state.set_connecting(true);
  state.SetConnectionError("oops");
  state.UpsertParticipant("bob", "Bob");
  state.SetExplicitMute("bob", false);

  state.Clear();
  EXPECT_TRUE(state.participants().empty());
  EXPECT_FALSE(state.ExplicitMute("bob").has_value());
  EXPECT_FALSE(state.is_audio_enabled());
  EXPECT_FALSE(state.has_local_stream());
  EXPECT_FALSE(state.is_connecting());
  EXPECT_FALSE(state.connection_error().has_value());
  EXPECT_FALSE(state.can_transmit());
}
