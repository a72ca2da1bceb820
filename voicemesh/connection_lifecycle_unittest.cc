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

#include "connection_lifecycle.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "audio_analysis.h"
#include "signaling_events.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_audio_track.h"
#include "test/fake_peer_link.h"
#include "test/fake_signaling.h"
#include "test/fake_task_queue.h"

namespace {

class RecordingListener : public ConnectionLifecycleManager::StateListener {
 public:
  void OnPeerStateChanged(const std::string& peer_id) override { changes.push_back(peer_id); }
  std::vector<std::string> changes;
};

VoiceMeshConfig MakeConfig(const std::string& user_id) {
  VoiceMeshConfig config;
  config.room_id = "room101";
  config.user_id = user_id;
  config.username = user_id;
  return config;
}

}  // namespace

class ConnectionLifecycleTest : public ::testing::Test {
 protected:
  explicit ConnectionLifecycleTest(const std::string& self = "alice")
      : clock_(1000000),
        queue_(&clock_),
        factory_(&queue_),
        config_(MakeConfig(self)) {}

  void SetUp() override { Build(); }

  void TearDown() override {
    lifecycle_.reset();
    AudioAnalysisContext::Shutdown();
  }

  void Build() {
    lifecycle_ = std::make_unique<ConnectionLifecycleManager>(config_, &registry_, &factory_,
                                                               &signaling_, &state_);
    lifecycle_->SetStateListener(&listener_);
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  FakePeerLinkFactory factory_;
  FakeSignaling signaling_;
  VoiceSessionState state_;
  PeerConnectionRegistry registry_;
  RecordingListener listener_;
  VoiceMeshConfig config_;
  std::unique_ptr<ConnectionLifecycleManager> lifecycle_;
};

TEST_F(ConnectionLifecycleTest, OfferFromUnknownPeerIsAnswered) {
  ASSERT_TRUE(lifecycle_->AcceptOffer("bob", "remote-offer"));

  const PeerConnectionRecord* record = registry_.Get("bob");
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->connection_state, PeerConnectionState::kConnecting);
  EXPECT_TRUE(state_.is_connecting());

  queue_.RunReady();

  const SignalingMessage* answer = signaling_.Last(SignalingType::kVoiceAnswer);
  ASSERT_NE(answer, nullptr);
  EXPECT_EQ(answer->target_user_id, "bob");
  EXPECT_EQ(answer->from_user_id, "alice");
  EXPECT_EQ(answer->room_id, "room101");
  EXPECT_EQ(answer->sdp, "answer-sdp-for-bob");
  EXPECT_EQ(factory_.Latest("bob")->remote_sdp, "remote-offer");
  EXPECT_FALSE(registry_.Get("bob")->negotiating);
  EXPECT_FALSE(state_.is_connecting());
}

TEST_F(ConnectionLifecycleTest, LocalTrackIsAttachedToNewLinks) {
  auto track = FakeAudioTrack::Create("mic");
  lifecycle_->SetLocalAudioTrack(track);
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  EXPECT_TRUE(factory_.Latest("bob")->audio_attached);

  lifecycle_->DetachLocalAudioFromAll();
  EXPECT_FALSE(factory_.Latest("bob")->audio_attached);
}

TEST_F(ConnectionLifecycleTest, InitiateSendsOfferOnce) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();

  EXPECT_EQ(factory_.CreatedCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceOffer), 1);
  const SignalingMessage* offer = signaling_.Last(SignalingType::kVoiceOffer);
  EXPECT_EQ(offer->sdp, "offer-sdp-for-bob");
  EXPECT_EQ(offer->target_user_id, "bob");
}

TEST_F(ConnectionLifecycleTest, InitiateRefusesSelfAndEmpty) {
  EXPECT_FALSE(lifecycle_->Initiate("alice"));
  EXPECT_FALSE(lifecycle_->Initiate(""));
  EXPECT_TRUE(registry_.empty());
}

TEST_F(ConnectionLifecycleTest, MeshLimitIsEnforced) {
  config_.max_mesh_connections = 2;
  Build();

  EXPECT_TRUE(lifecycle_->Initiate("bob"));
  EXPECT_TRUE(lifecycle_->Initiate("carol"));
  EXPECT_FALSE(lifecycle_->Initiate("dave"));
  EXPECT_FALSE(lifecycle_->AcceptOffer("erin", "remote-offer"));

  EXPECT_EQ(registry_.size(), 2u);
  ASSERT_TRUE(state_.connection_error().has_value());
  EXPECT_EQ(*state_.connection_error(), "Maximum mesh connections reached (2)");
}

TEST_F(ConnectionLifecycleTest, GlareKeepsOwnOfferWhenOurIdIsLower) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();
  ASSERT_TRUE(factory_.Latest("bob")->has_pending_local_offer);

  EXPECT_TRUE(lifecycle_->AcceptOffer("bob", "remote-offer"));
  queue_.RunReady();

  EXPECT_EQ(factory_.CreatedCount("bob"), 1);
  EXPECT_EQ(factory_.Latest("bob")->answers_created, 0);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 0);
}

class ConnectionLifecycleHighIdTest : public ConnectionLifecycleTest {
 protected:
  ConnectionLifecycleHighIdTest() : ConnectionLifecycleTest("zed") {}
};

TEST_F(ConnectionLifecycleHighIdTest, GlareYieldsWhenOurIdIsHigher) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();
  auto first = factory_.Latest("bob");

  EXPECT_TRUE(lifecycle_->AcceptOffer("bob", "remote-offer"));
  queue_.RunReady();

  EXPECT_TRUE(first->closed);
  EXPECT_EQ(factory_.CreatedCount("bob"), 2);
  EXPECT_EQ(factory_.LiveCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 1);
}

TEST_F(ConnectionLifecycleTest, AnswerCompletesNegotiation) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();
  ASSERT_TRUE(state_.is_connecting());

  lifecycle_->ApplyAnswer("bob", "remote-answer");
  queue_.RunReady();

  auto link = factory_.Latest("bob");
  EXPECT_TRUE(link->remote_description_set);
  EXPECT_FALSE(link->has_pending_local_offer);
  EXPECT_FALSE(state_.is_connecting());
}

TEST_F(ConnectionLifecycleTest, StrayAnswersAreIgnored) {
  lifecycle_->ApplyAnswer("nobody", "remote-answer");
  queue_.RunReady();
  EXPECT_TRUE(registry_.empty());

  // Offer still being created, nothing outstanding yet.
  ASSERT_TRUE(lifecycle_->AcceptOffer("bob", "remote-offer"));
  lifecycle_->ApplyAnswer("bob", "remote-answer");
  queue_.RunReady();
  EXPECT_EQ(factory_.Latest("bob")->remote_sdp, "remote-offer");
  EXPECT_FALSE(state_.connection_error().has_value());
}

TEST_F(ConnectionLifecycleTest, OfferFailureSurfacesErrorAndDisposes) {
  factory_.behavior.fail_offer = true;
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();

  EXPECT_FALSE(registry_.Contains("bob"));
  EXPECT_TRUE(factory_.Latest("bob")->closed);
  ASSERT_TRUE(state_.connection_error().has_value());
  EXPECT_EQ(*state_.connection_error(), ErrorText::kInitiateFailed);
  EXPECT_FALSE(state_.is_connecting());
}

TEST_F(ConnectionLifecycleTest, CreateFailureSurfacesError) {
  factory_.behavior.fail_create = true;
  EXPECT_FALSE(lifecycle_->Initiate("bob"));
  EXPECT_TRUE(registry_.empty());
  EXPECT_EQ(*state_.connection_error(), ErrorText::kInitiateFailed);
}

TEST_F(ConnectionLifecycleTest, AttachFailureRejectsOffer) {
  lifecycle_->SetLocalAudioTrack(FakeAudioTrack::Create("mic"));
  factory_.behavior.fail_attach = true;

  EXPECT_FALSE(lifecycle_->AcceptOffer("bob", "remote-offer"));
  EXPECT_TRUE(registry_.empty());
  EXPECT_EQ(factory_.LiveCount("bob"), 0);
  EXPECT_EQ(*state_.connection_error(), ErrorText::kAcceptFailed);
}

TEST_F(ConnectionLifecycleTest, BadRemoteOfferSurfacesError) {
  factory_.behavior.fail_remote_description = true;
  ASSERT_TRUE(lifecycle_->AcceptOffer("bob", "garbage"));
  queue_.RunReady();

  EXPECT_FALSE(registry_.Contains("bob"));
  EXPECT_EQ(*state_.connection_error(), ErrorText::kAcceptFailed);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceAnswer), 0);
}

TEST_F(ConnectionLifecycleTest, DisposedLinkCompletesNothing) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  ASSERT_TRUE(lifecycle_->Dispose("bob"));
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  queue_.RunReady();

  EXPECT_EQ(factory_.LiveCount("bob"), 1);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceOffer), 1);
}

TEST_F(ConnectionLifecycleTest, CandidatesFlowBothWays) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  auto link = factory_.Latest("bob");

  link->EmitLocalCandidate("candidate:local");
  const SignalingMessage* sent = signaling_.Last(SignalingType::kVoiceIceCandidate);
  ASSERT_NE(sent, nullptr);
  EXPECT_EQ(sent->target_user_id, "bob");
  EXPECT_EQ(sent->candidate.candidate, "candidate:local");

  lifecycle_->ApplyIceCandidate("bob", {"candidate:remote", "0", 0});
  lifecycle_->ApplyIceCandidate("nobody", {"candidate:stray", "0", 0});
  ASSERT_EQ(link->remote_candidates.size(), 1u);
  EXPECT_EQ(link->remote_candidates[0].candidate, "candidate:remote");
}

TEST_F(ConnectionLifecycleTest, ConnectedClearsErrorAndNotifies) {
  state_.SetConnectionError("old trouble");
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  factory_.Latest("bob")->Connect();

  const PeerConnectionRecord* record = registry_.Get("bob");
  EXPECT_EQ(record->connection_state, PeerConnectionState::kConnected);
  EXPECT_EQ(record->ice_connection_state, IceConnectionState::kConnected);
  EXPECT_FALSE(state_.connection_error().has_value());
  EXPECT_FALSE(state_.is_connecting());
  EXPECT_EQ(listener_.changes.size(), 2u);
}

TEST_F(ConnectionLifecycleTest, RemoteTrackGetsAnalyser) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  auto track = FakeAudioTrack::Create("remote");
  factory_.Latest("bob")->EmitRemoteTrack(track);

  ASSERT_NE(registry_.Get("bob")->remote_audio_sink, nullptr);
  EXPECT_EQ(track->sink_count(), 1u);

  lifecycle_->Dispose("bob");
  EXPECT_EQ(track->sink_count(), 0u);
}

TEST_F(ConnectionLifecycleTest, RestartBuildsFreshLink) {
  ASSERT_TRUE(lifecycle_->Initiate("bob"));
  auto first = factory_.Latest("bob");
  const uint64_t first_id = registry_.Get("bob")->record_id;

  ASSERT_TRUE(lifecycle_->Restart("bob"));
  EXPECT_TRUE(first->closed);
  EXPECT_EQ(factory_.LiveCount("bob"), 1);
  EXPECT_NE(registry_.Get("bob")->record_id, first_id);
}
