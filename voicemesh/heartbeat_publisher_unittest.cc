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

#include "heartbeat_publisher.h"

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_signaling.h"
#include "test/fake_task_queue.h"

namespace {

const webrtc::TimeDelta kInterval = webrtc::TimeDelta::Seconds(30);

}  // namespace

class HeartbeatPublisherTest : public ::testing::Test {
 protected:
  HeartbeatPublisherTest()
      : clock_(1000000),
        queue_(&clock_),
        heartbeat_(&queue_, &clock_, &registry_, &signaling_, "room101", "alice", kInterval) {}

  void AddRecord(const std::string& peer_id,
                 PeerConnectionState state,
                 IceConnectionState ice_state) {
    auto record = std::make_unique<PeerConnectionRecord>();
    record->peer_id = peer_id;
    record->record_id = registry_.NextRecordId();
    record->connection_state = state;
    record->ice_connection_state = ice_state;
    registry_.Upsert(std::move(record));
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  FakeSignaling signaling_;
  PeerConnectionRegistry registry_;
  HeartbeatPublisher heartbeat_;
};

TEST_F(HeartbeatPublisherTest, NothingSentWithoutConnections) {
  EXPECT_FALSE(heartbeat_.PublishNow());
  heartbeat_.Start();
  queue_.AdvanceTime(kInterval * 3);
  EXPECT_TRUE(signaling_.sent().empty());
}

TEST_F(HeartbeatPublisherTest, SnapshotCoversEveryPeer) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kCompleted);
  AddRecord("carol", PeerConnectionState::kConnecting, IceConnectionState::kChecking);

  HealthSnapshot snapshot = heartbeat_.BuildSnapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot["bob"].connection_state, PeerConnectionState::kConnected);
  EXPECT_EQ(snapshot["bob"].ice_connection_state, IceConnectionState::kCompleted);
  EXPECT_EQ(snapshot["carol"].ice_connection_state, IceConnectionState::kChecking);

  ASSERT_TRUE(heartbeat_.PublishNow());
  const SignalingMessage* sent = signaling_.Last(SignalingType::kVoiceHeartbeat);
  ASSERT_NE(sent, nullptr);
  EXPECT_EQ(sent->room_id, "room101");
  EXPECT_EQ(sent->user_id, "alice");
  EXPECT_EQ(sent->connection_states.size(), 2u);
}

TEST_F(HeartbeatPublisherTest, PublishesEveryInterval) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);
  heartbeat_.Start();

  queue_.AdvanceTime(kInterval - webrtc::TimeDelta::Millis(1));
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceHeartbeat), 0);
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(1));
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceHeartbeat), 1);
  queue_.AdvanceTime(kInterval);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceHeartbeat), 2);

  heartbeat_.Stop();
  EXPECT_FALSE(heartbeat_.running());
  queue_.AdvanceTime(kInterval * 2);
  EXPECT_EQ(signaling_.Count(SignalingType::kVoiceHeartbeat), 2);
}

TEST_F(HeartbeatPublisherTest, FailedSendIsReported) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);
  signaling_.set_connected(false);
  EXPECT_FALSE(heartbeat_.PublishNow());
}
