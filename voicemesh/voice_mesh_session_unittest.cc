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

#include "voice_mesh_session.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "audio_analysis.h"
#include "signaling_events.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_audio_track.h"
#include "test/fake_peer_link.h"
#include "test/fake_signaling.h"
#include "test/fake_task_queue.h"

namespace {

SignalingMessage UserJoined(const std::string& user_id, const std::string& username) {
  SignalingMessage message;
  message.type = SignalingType::kUserJoinedVoice;
  message.room_id = "room101";
  message.user_id = user_id;
  message.username = username;
  return message;
}

SignalingMessage UserLeft(const std::string& user_id) {
  SignalingMessage message;
  message.type = SignalingType::kUserLeftVoice;
  message.room_id = "room101";
  message.user_id = user_id;
  return message;
}

SignalingMessage Offer(const std::string& from, const std::string& target) {
  SignalingMessage message;
  message.type = SignalingType::kVoiceOffer;
  message.room_id = "room101";
  message.from_user_id = from;
  message.target_user_id = target;
  message.sdp = "remote-offer-from-" + from;
  return message;
}

SignalingMessage Participants(const std::vector<std::string>& user_ids) {
  SignalingMessage message;
  message.type = SignalingType::kVoiceParticipants;
  message.room_id = "room101";
  for (const std::string& user_id : user_ids)
    message.participants.push_back({user_id, user_id, false});
  return message;
}

SignalingMessage RelayError(const std::string& text, int retry_after) {
  SignalingMessage message;
  message.type = SignalingType::kError;
  message.error_message = text;
  message.retry_after_seconds = retry_after;
  return message;
}

}  // namespace

class VoiceMeshSessionTest : public ::testing::Test {
 protected:
  VoiceMeshSessionTest()
      : clock_(1000000),
        queue_(&clock_),
        factory_(&queue_),
        track_(FakeAudioTrack::Create("mic")),
        stream_(track_) {
    config_.room_id = "room101";
    config_.user_id = "alice";
    config_.username = "Alice";
  }

  void SetUp() override { Build(); }

  void TearDown() override {
    session_.reset();
    AudioAnalysisContext::Shutdown();
  }

  void Build() {
    session_.reset();
    session_ = std::make_unique<VoiceMeshSession>(config_, &queue_, &clock_, &signaling_,
                                                  &factory_);
  }

  // Joins with the microphone and gets a connected link to |peer_id|.
  std::shared_ptr<FakePeerLinkState> ConnectPeer(const std::string& peer_id,
                                                 const std::string& username) {
    signaling_.Deliver(UserJoined(peer_id, username));
    queue_.RunReady();
    auto link = factory_.Latest(peer_id);
    if (link)
      link->Connect();
    return link;
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  FakeSignaling signaling_;
  FakePeerLinkFactory factory_;
  rtc::scoped_refptr<FakeAudioTrack> track_;
  TrackLocalAudioStream stream_;
  VoiceMeshConfig config_;
  std::unique_ptr<VoiceMeshSession> session_;
};

TEST_F(VoiceMeshSessionTest, AddLocalStreamAnnouncesPresence) {
  ASSERT_TRUE(session_->AddLocalStream(&stream_));

  const SignalingMessage* join = signaling_.Last(SignalingType::kJoinVoice);
  ASSERT_NE(join, nullptr);
  EXPECT_EQ(join->room_id, "room101");
  EXPECT_EQ(join->user_id, "alice");
  EXPECT_EQ(join->username, "Alice");
  const SignalingMessage* mute = signaling_.Last(SignalingType::kVoiceMuteChanged);
  ASSERT_NE(mute, nullptr);
  EXPECT_FALSE(mute->is_muted);
  EXPECT_EQ(signaling_.Count(SignalingType::kRequestVoiceParticipants), 1);

  EXPECT_TRUE(session_->state().has_local_stream());
  const VoiceParticipant* self = session_->state().FindParticipant("alice");
  ASSERT_NE(self, nullptr);
  EXPECT_FALSE(self->is_muted);
  EXPECT_TRUE(session_->health_monitor().running());
  EXPECT_TRUE(session_->heartbeat().running());
  EXPECT_TRUE(session_->level_monitor().running());
}

TEST_F(VoiceMeshSessionTest, NullStreamIsRefused) {
  EXPECT_FALSE(session_->AddLocalStream(nullptr));
  EXPECT_TRUE(signaling_.sent().empty());
}

TEST_F(VoiceMeshSessionTest, ExistingParticipantInitiatesToNewcomer) {
  session_->AddLocalStream(&stream_);
  signaling_.Deliver(UserJoined("bob", "Bob"));
  queue_.RunReady();

  const SignalingMessage* offer = signaling_.Last(SignalingType::kVoiceOffer);
  ASSERT_NE(offer, nullptr);
  EXPECT_EQ(offer->target_user_id, "bob");
  EXPECT_TRUE(factory_.Latest("bob")->audio_attached);
  EXPECT_EQ(session_->state().FindParticipant("bob")->username, "Bob");
}

TEST_F(VoiceMeshSessionTest, JoinerWaitsForOffers) {
  session_->AddLocalStream(&stream_);

  SignalingMessage list;
  list.type = SignalingType::kVoiceParticipants;
  list.room_id = "room101";
  list.participants.push_back({"alice", "Alice", false});
  list.participants.push_back({"bob", "Bob", true});
  list.participants.push_back({"carol", "Carol", false});
  signaling_.Deliver(list);
  queue_.RunReady();

  EXPECT_TRUE(session_->registry().empty());
  EXPECT_EQ(session_->state().participants().size(), 3u);
  EXPECT_TRUE(session_->state().FindParticipant("bob")->is_muted);
  EXPECT_EQ(session_->state().ExplicitMute("carol"), false);
}

TEST_F(VoiceMeshSessionTest, OfferIsAnswered) {
  session_->AddLocalStream(&stream_);
  signaling_.Deliver(Offer("bob", "alice"));

  ASSERT_NE(session_->registry().Get("bob"), nullptr);
  EXPECT_EQ(session_->registry().Get("bob")->connection_state, PeerConnectionState::kConnecting);

  queue_.RunReady();
  const SignalingMessage* answer = signaling_.Last(SignalingType::kVoiceAnswer);
  ASSERT_NE(answer, nullptr);
  EXPECT_EQ(answer->target_user_id, "bob");
  EXPECT_EQ(factory_.Latest("bob")->remote_sdp, "remote-offer-from-bob");
}

TEST_F(VoiceMeshSessionTest, OfferIgnoredWhileInactive) {
  signaling_.Deliver(Offer("bob", "alice"));
  queue_.RunReady();
  EXPECT_TRUE(session_->registry().empty());
  EXPECT_EQ(factory_.CreatedCount("bob"), 0);
}

TEST_F(VoiceMeshSessionTest, ForeignRoomAndTargetAreDropped) {
  session_->AddLocalStream(&stream_);

  SignalingMessage other_room = Offer("bob", "alice");
  other_room.room_id = "room202";
  signaling_.Deliver(other_room);
  signaling_.Deliver(Offer("bob", "carol"));
  SignalingMessage joined = UserJoined("dave", "Dave");
  joined.room_id = "room202";
  signaling_.Deliver(joined);
  queue_.RunReady();

  EXPECT_TRUE(session_->registry().empty());
  EXPECT_EQ(session_->state().FindParticipant("dave"), nullptr);
}

TEST_F(VoiceMeshSessionTest, ListenOnlyNodeAnnouncesOnReception) {
  config_.can_transmit = false;
  Build();

  ASSERT_TRUE(session_->EnableAudioReception());
  EXPECT_EQ(signaling_.Count(SignalingType::kJoinVoice), 1);
  const SignalingMessage* mute = signaling_.Last(SignalingType::kVoiceMuteChanged);
  ASSERT_NE(mute, nullptr);
  EXPECT_TRUE(mute->is_muted);
  EXPECT_FALSE(session_->state().can_transmit());

  signaling_.Deliver(Offer("bob", "alice"));
  queue_.RunReady();
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 1);
  EXPECT_FALSE(factory_.Latest("bob")->audio_attached);
}

TEST_F(VoiceMeshSessionTest, AddingStreamRenegotiatesExistingPeers) {
  ASSERT_TRUE(session_->EnableAudioReception());
  signaling_.Deliver(UserJoined("bob", "Bob"));
  queue_.RunReady();
  auto first = factory_.Latest("bob");
  ASSERT_FALSE(first->audio_attached);

  session_->AddLocalStream(&stream_);
  queue_.RunReady();
  EXPECT_TRUE(first->closed);
  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_TRUE(factory_.Latest("bob")->audio_attached);
}

TEST_F(VoiceMeshSessionTest, RemoveLocalStreamDetachesAudio) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");
  ASSERT_TRUE(link->audio_attached);

  session_->RemoveLocalStream();
  EXPECT_FALSE(link->audio_attached);
  EXPECT_FALSE(session_->state().has_local_stream());
  EXPECT_TRUE(session_->state().FindParticipant("alice")->is_muted);
}

TEST_F(VoiceMeshSessionTest, MuteToggleBroadcastOnce) {
  session_->AddLocalStream(&stream_);
  signaling_.ClearSent();

  stream_.Mute();
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(200));
  ASSERT_EQ(signaling_.Count(SignalingType::kVoiceMuteChanged), 1);
  EXPECT_TRUE(signaling_.Last(SignalingType::kVoiceMuteChanged)->is_muted);

  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(2));
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceMuteChanged), 1);
  EXPECT_TRUE(session_->state().FindParticipant("alice")->is_muted);
}

TEST_F(VoiceMeshSessionTest, RemoteMuteMessagesUpdateParticipants) {
  session_->AddLocalStream(&stream_);
  SignalingMessage mute;
  mute.type = SignalingType::kVoiceMuteChanged;
  mute.room_id = "room101";
  mute.user_id = "bob";
  mute.username = "Bob";
  mute.is_muted = true;
  signaling_.Deliver(mute);

  EXPECT_TRUE(session_->state().FindParticipant("bob")->is_muted);
  EXPECT_EQ(session_->state().ExplicitMute("bob"), true);

  mute.user_id = "alice";
  signaling_.Deliver(mute);
  EXPECT_FALSE(session_->state().FindParticipant("alice")->is_muted);
}

TEST_F(VoiceMeshSessionTest, UserLeftDisposesConnection) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");

  signaling_.Deliver(UserLeft("bob"));
  EXPECT_TRUE(link->closed);
  EXPECT_FALSE(session_->registry().Contains("bob"));
  EXPECT_EQ(session_->state().FindParticipant("bob"), nullptr);
  EXPECT_FALSE(session_->state().ExplicitMute("bob").has_value());
}

TEST_F(VoiceMeshSessionTest, ReconnectionRequestRestartsPeer) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");

  SignalingMessage request;
  request.type = SignalingType::kVoiceReconnectionRequested;
  request.room_id = "room101";
  request.from_user_id = "bob";
  request.target_user_id = "alice";
  signaling_.Deliver(request);
  queue_.RunReady();

  EXPECT_TRUE(link->closed);
  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_EQ(factory_.LiveCount("bob"), 1);
}

TEST_F(VoiceMeshSessionTest, RelayReportedFailureIsChecked) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");
  link->SetIceConnectionState(IceConnectionState::kDisconnected);
  queue_.RunReady();
  ASSERT_TRUE(session_->registry().Contains("bob"));

  SignalingMessage failed;
  failed.type = SignalingType::kVoiceConnectionFailed;
  failed.room_id = "room101";
  failed.from_user_id = "bob";
  signaling_.Deliver(failed);

  EXPECT_FALSE(session_->registry().Contains("bob"));
  EXPECT_EQ(session_->health_monitor().reconnect_attempts("bob"), 1);
}

TEST_F(VoiceMeshSessionTest, FailedPeerIsRetriedThenGivenUp) {
  session_->AddLocalStream(&stream_);
  signaling_.Deliver(UserJoined("bob", "Bob"));
  queue_.RunReady();

  for (int attempt = 1; attempt <= MeshDefaults::kMaxReconnectAttempts; ++attempt) {
    factory_.Latest("bob")->SetIceConnectionState(IceConnectionState::kFailed);
    queue_.RunReady();
    ASSERT_FALSE(session_->registry().Contains("bob"));
    EXPECT_EQ(session_->health_monitor().reconnect_attempts("bob"), attempt);

    queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kReconnectDelayMs));
    ASSERT_TRUE(session_->registry().Contains("bob"));
  }

  factory_.Latest("bob")->SetIceConnectionState(IceConnectionState::kFailed);
  queue_.RunReady();
  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(5));

  EXPECT_FALSE(session_->registry().Contains("bob"));
  EXPECT_EQ(factory_.CreatedCount("bob"), MeshDefaults::kMaxReconnectAttempts + 1);
  ASSERT_TRUE(session_->state().connection_error().has_value());
  EXPECT_EQ(*session_->state().connection_error(), "Connection with Bob failed after 3 attempts");
  EXPECT_TRUE(session_->health_monitor().gave_up("bob"));

  // The roster still lists bob, the sweep leaves a given up peer alone.
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs * 3));
  EXPECT_EQ(factory_.CreatedCount("bob"), MeshDefaults::kMaxReconnectAttempts + 1);
}

TEST_F(VoiceMeshSessionTest, RosterPeerWithoutOfferIsInitiated) {
  session_->AddLocalStream(&stream_);
  EXPECT_TRUE(session_->sweep_running());
  signaling_.Deliver(Participants({"alice", "bob"}));
  queue_.RunReady();

  // One interval for bob's offer to arrive.
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs));
  EXPECT_TRUE(session_->registry().empty());

  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs));
  ASSERT_TRUE(session_->registry().Contains("bob"));
  const SignalingMessage* offer = signaling_.Last(SignalingType::kVoiceOffer);
  ASSERT_NE(offer, nullptr);
  EXPECT_EQ(offer->target_user_id, "bob");
  EXPECT_EQ(factory_.CreatedCount("alice"), 0);
}

TEST_F(VoiceMeshSessionTest, OfferInFlightBeatsSweep) {
  session_->AddLocalStream(&stream_);
  signaling_.Deliver(Participants({"alice", "bob"}));
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs));

  signaling_.Deliver(Offer("bob", "alice"));
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs * 2));

  EXPECT_EQ(factory_.CreatedCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceOffer), 0);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 1);
}

TEST_F(VoiceMeshSessionTest, ListenOnlyNodeDoesNotSweep) {
  config_.can_transmit = false;
  Build();
  ASSERT_TRUE(session_->EnableAudioReception());
  signaling_.Deliver(Participants({"alice", "bob"}));

  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs * 3));
  EXPECT_TRUE(session_->registry().empty());
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceOffer), 0);
}

TEST_F(VoiceMeshSessionTest, RaceForOnePeerKeepsOneLink) {
  session_->AddLocalStream(&stream_);
  ConnectPeer("bob", "Bob");
  factory_.Latest("bob")->SetIceConnectionState(IceConnectionState::kFailed);
  queue_.RunReady();
  ASSERT_TRUE(session_->health_monitor().reconnect_pending("bob"));

  // The scheduled reconnect offers first, bob's own offer glares with it.
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kReconnectDelayMs));
  ASSERT_EQ(factory_.CreatedCount("bob"), 2);
  ASSERT_TRUE(factory_.Latest("bob")->has_pending_local_offer);
  signaling_.Deliver(Offer("bob", "alice"));
  signaling_.Deliver(UserJoined("bob", "Bob"));
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs * 3));

  EXPECT_EQ(session_->registry().size(), 1u);
  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_EQ(factory_.LiveCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 0);
}

TEST_F(VoiceMeshSessionTest, OfferDuringPendingReconnectWins) {
  session_->AddLocalStream(&stream_);
  ConnectPeer("bob", "Bob");
  factory_.Latest("bob")->SetIceConnectionState(IceConnectionState::kFailed);
  queue_.RunReady();
  ASSERT_TRUE(session_->health_monitor().reconnect_pending("bob"));

  signaling_.Deliver(Offer("bob", "alice"));
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kReconnectDelayMs * 3));

  EXPECT_EQ(session_->registry().size(), 1u);
  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_EQ(factory_.LiveCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 1);
  EXPECT_FALSE(session_->health_monitor().reconnect_pending("bob"));
}

TEST_F(VoiceMeshSessionTest, HeartbeatReportsConnections) {
  session_->AddLocalStream(&stream_);
  ConnectPeer("bob", "Bob");

  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kHeartbeatIntervalMs));
  const SignalingMessage* heartbeat = signaling_.Last(SignalingType::kVoiceHeartbeat);
  ASSERT_NE(heartbeat, nullptr);
  ASSERT_EQ(heartbeat->connection_states.count("bob"), 1u);
  EXPECT_EQ(heartbeat->connection_states.at("bob").connection_state,
            PeerConnectionState::kConnected);
}

TEST_F(VoiceMeshSessionTest, ShortOutageKeepsConnections) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");
  const uint64_t record_id = session_->registry().Get("bob")->record_id;

  signaling_.SimulateDown(DisconnectKind::kAccidental);
  EXPECT_FALSE(session_->health_monitor().running());
  EXPECT_FALSE(session_->heartbeat().running());
  EXPECT_TRUE(session_->registry().Contains("bob"));
  EXPECT_FALSE(session_->BroadcastMute(true));

  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(10));
  signaling_.SimulateUp();

  EXPECT_EQ(session_->grace_period().state(), GracePeriodController::State::kUp);
  EXPECT_TRUE(session_->health_monitor().running());
  EXPECT_TRUE(session_->heartbeat().running());
  EXPECT_EQ(signaling_.Count(SignalingType::kJoinVoice), 2);
  EXPECT_FALSE(link->closed);
  EXPECT_EQ(session_->registry().Get("bob")->record_id, record_id);

  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(120));
  EXPECT_TRUE(session_->registry().Contains("bob"));
}

TEST_F(VoiceMeshSessionTest, ReconnectHeldDuringOutageRunsAfterRecovery) {
  session_->AddLocalStream(&stream_);
  ConnectPeer("bob", "Bob");
  factory_.Latest("bob")->SetIceConnectionState(IceConnectionState::kFailed);
  queue_.RunReady();
  ASSERT_FALSE(session_->registry().Contains("bob"));
  ASSERT_EQ(session_->health_monitor().reconnect_attempts("bob"), 1);

  signaling_.SimulateDown(DisconnectKind::kAccidental);
  EXPECT_TRUE(session_->health_monitor().reconnect_pending("bob"));
  EXPECT_FALSE(session_->sweep_running());
  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(10));
  EXPECT_EQ(factory_.CreatedCount("bob"), 1);

  signaling_.SimulateUp();
  EXPECT_TRUE(session_->sweep_running());
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kReconnectDelayMs));

  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_TRUE(session_->registry().Contains("bob"));
  EXPECT_EQ(session_->health_monitor().reconnect_attempts("bob"), 1);
  EXPECT_EQ(session_->registry().Get("bob")->reconnect_attempts, 1);
}

TEST_F(VoiceMeshSessionTest, InactiveDropStartsNoGracePeriod) {
  signaling_.SimulateDown(DisconnectKind::kAccidental);
  EXPECT_EQ(session_->grace_period().state(), GracePeriodController::State::kUp);
  EXPECT_FALSE(session_->grace_period().timer_pending());

  ASSERT_TRUE(session_->AddLocalStream(&stream_));
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kGracePeriodMs * 2));
  EXPECT_TRUE(session_->state().has_local_stream());
  EXPECT_NE(session_->grace_period().state(), GracePeriodController::State::kTornDown);

  signaling_.SimulateUp();
  EXPECT_EQ(signaling_.Count(SignalingType::kJoinVoice), 1);
  EXPECT_TRUE(session_->health_monitor().running());
}

TEST_F(VoiceMeshSessionTest, LongOutageTearsDownSession) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");

  signaling_.SimulateDown(DisconnectKind::kAccidental);
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(MeshDefaults::kGracePeriodMs));

  EXPECT_TRUE(link->closed);
  EXPECT_TRUE(session_->registry().empty());
  EXPECT_TRUE(session_->state().participants().empty());
  EXPECT_FALSE(session_->state().has_local_stream());
  EXPECT_EQ(session_->grace_period().state(), GracePeriodController::State::kTornDown);
  EXPECT_EQ(AudioAnalysisContext::GetIfExists(), nullptr);

  signaling_.SimulateUp();
  EXPECT_EQ(signaling_.Count(SignalingType::kJoinVoice), 1);
}

TEST_F(VoiceMeshSessionTest, IntentionalCleanupLeavesRoom) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");

  session_->PerformIntentionalCleanup();
  const SignalingMessage* leave = signaling_.Last(SignalingType::kLeaveVoice);
  ASSERT_NE(leave, nullptr);
  EXPECT_EQ(leave->user_id, "alice");
  EXPECT_TRUE(link->closed);
  EXPECT_TRUE(session_->registry().empty());
  EXPECT_TRUE(session_->state().participants().empty());
  EXPECT_FALSE(session_->level_monitor().running());
}

TEST_F(VoiceMeshSessionTest, IntentionalDisconnectTearsDownAtOnce) {
  session_->AddLocalStream(&stream_);
  auto link = ConnectPeer("bob", "Bob");

  signaling_.SimulateDown(DisconnectKind::kIntentional);
  EXPECT_TRUE(link->closed);
  EXPECT_TRUE(session_->registry().empty());

  // A new stream starts a new session.
  ASSERT_TRUE(session_->AddLocalStream(&stream_));
  EXPECT_EQ(session_->grace_period().state(), GracePeriodController::State::kUp);
  EXPECT_TRUE(session_->state().has_local_stream());
}

TEST_F(VoiceMeshSessionTest, ReceptionAfterTeardownRecreatesAnalysis) {
  ASSERT_TRUE(session_->EnableAudioReception());
  session_->PerformIntentionalCleanup();
  ASSERT_EQ(AudioAnalysisContext::GetIfExists(), nullptr);

  ASSERT_TRUE(session_->EnableAudioReception());
  EXPECT_NE(AudioAnalysisContext::GetIfExists(), nullptr);
  EXPECT_TRUE(session_->state().is_audio_enabled());
  EXPECT_FALSE(session_->state().connection_error().has_value());
  EXPECT_EQ(session_->grace_period().state(), GracePeriodController::State::kUp);
}

TEST_F(VoiceMeshSessionTest, RateLimitMessageClearsAfterRetryWindow) {
  signaling_.Deliver(RelayError("Rate limit exceeded", 5));
  ASSERT_TRUE(session_->state().connection_error().has_value());
  EXPECT_EQ(*session_->state().connection_error(),
            "Rate limit exceeded. Please wait 5 seconds before trying again.");

  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(5));
  EXPECT_FALSE(session_->state().connection_error().has_value());
}

TEST_F(VoiceMeshSessionTest, RateLimitWithoutRetryUsesDefault) {
  signaling_.Deliver(RelayError("Rate limit exceeded for join_voice", 0));
  EXPECT_EQ(*session_->state().connection_error(),
            "Rate limit exceeded. Please wait 15 seconds before trying again.");
}

TEST_F(VoiceMeshSessionTest, OtherRelayErrorsAreSurfaced) {
  signaling_.Deliver(RelayError("Room is full", 0));
  EXPECT_EQ(*session_->state().connection_error(), "Room is full");
  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(60));
  EXPECT_EQ(*session_->state().connection_error(), "Room is full");
}

TEST_F(VoiceMeshSessionTest, MeshLimitSurfacesError) {
  config_.max_mesh_connections = 1;
  Build();
  session_->AddLocalStream(&stream_);
  signaling_.Deliver(UserJoined("bob", "Bob"));
  signaling_.Deliver(UserJoined("carol", "Carol"));

  EXPECT_EQ(session_->registry().size(), 1u);
  EXPECT_EQ(*session_->state().connection_error(), "Maximum mesh connections reached (1)");
}

TEST_F(VoiceMeshSessionTest, ChangeCallbackFires) {
  int changes = 0;
  session_->SetChangeCallback([&changes]() { changes++; });
  session_->AddLocalStream(&stream_);
  EXPECT_GT(changes, 0);
}
