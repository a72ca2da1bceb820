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

#include "health_monitor.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_task_queue.h"

namespace {

const webrtc::TimeDelta kCheckInterval = webrtc::TimeDelta::Seconds(15);
const webrtc::TimeDelta kReconnectDelay = webrtc::TimeDelta::Seconds(2);
const int kMaxAttempts = 3;

// Plays the session: disposes through the registry and re-initiates by
// storing a fresh connecting record.
class RecordingDelegate : public HealthMonitor::Delegate {
 public:
  explicit RecordingDelegate(PeerConnectionRegistry* registry) : registry_(registry) {}

  void DisposePeer(const std::string& peer_id) override {
    disposed.push_back(peer_id);
    registry_->RemoveAndDispose(peer_id);
  }
  void ReconnectPeer(const std::string& peer_id) override {
    reconnected.push_back(peer_id);
    auto record = std::make_unique<PeerConnectionRecord>();
    record->peer_id = peer_id;
    record->record_id = registry_->NextRecordId();
    record->connection_state = PeerConnectionState::kConnecting;
    registry_->Upsert(std::move(record));
  }
  void OnPeerConnectionLost(const std::string& peer_id, int attempts) override {
    lost.push_back(peer_id);
    lost_attempts = attempts;
  }

  std::vector<std::string> disposed;
  std::vector<std::string> reconnected;
  std::vector<std::string> lost;
  int lost_attempts = 0;

 private:
  PeerConnectionRegistry* const registry_;
};

}  // namespace

class HealthMonitorTest : public ::testing::Test {
 protected:
  HealthMonitorTest()
      : clock_(1000000),
        queue_(&clock_),
        delegate_(&registry_),
        monitor_(&queue_, &clock_, &registry_, &delegate_, kCheckInterval, kReconnectDelay,
                 kMaxAttempts) {}

  PeerConnectionRecord* AddRecord(const std::string& peer_id,
                                  PeerConnectionState state,
                                  IceConnectionState ice_state) {
    auto record = std::make_unique<PeerConnectionRecord>();
    record->peer_id = peer_id;
    record->record_id = registry_.NextRecordId();
    record->connection_state = state;
    record->ice_connection_state = ice_state;
    return registry_.Upsert(std::move(record));
  }

  void Fail(const std::string& peer_id) {
    PeerConnectionRecord* record = registry_.Get(peer_id);
    ASSERT_NE(record, nullptr);
    record->connection_state = PeerConnectionState::kFailed;
    record->ice_connection_state = IceConnectionState::kFailed;
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  PeerConnectionRegistry registry_;
  RecordingDelegate delegate_;
  HealthMonitor monitor_;
};

TEST_F(HealthMonitorTest, FailedIceTriggersDelayedReconnect) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kFailed);
  monitor_.Start();

  queue_.AdvanceTime(kCheckInterval);
  EXPECT_EQ(monitor_.reconnect_attempts("bob"), 1);
  EXPECT_FALSE(registry_.Contains("bob"));
  ASSERT_EQ(delegate_.disposed.size(), 1u);
  EXPECT_TRUE(monitor_.reconnect_pending("bob"));

  queue_.AdvanceTime(kReconnectDelay - webrtc::TimeDelta::Millis(1));
  EXPECT_TRUE(delegate_.reconnected.empty());

  queue_.AdvanceTime(webrtc::TimeDelta::Millis(1));
  ASSERT_EQ(delegate_.reconnected.size(), 1u);
  ASSERT_TRUE(registry_.Contains("bob"));
  EXPECT_EQ(registry_.Get("bob")->reconnect_attempts, 1);
  EXPECT_FALSE(monitor_.reconnect_pending("bob"));
}

TEST_F(HealthMonitorTest, ReconnectSkippedWhenPeerCameBack) {
  AddRecord("bob", PeerConnectionState::kDisconnected, IceConnectionState::kDisconnected);
  monitor_.CheckPeer("bob");
  ASSERT_FALSE(registry_.Contains("bob"));

  // The peer offered again in the meantime.
  AddRecord("bob", PeerConnectionState::kConnecting, IceConnectionState::kChecking);
  queue_.AdvanceTime(kReconnectDelay);

  EXPECT_TRUE(delegate_.reconnected.empty());
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(HealthMonitorTest, GivesUpAfterMaxAttempts) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);

  for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    Fail("bob");
    monitor_.CheckPeer("bob");
    EXPECT_EQ(monitor_.reconnect_attempts("bob"), attempt);
    queue_.AdvanceTime(kReconnectDelay);
    ASSERT_TRUE(registry_.Contains("bob"));
  }
  EXPECT_EQ(delegate_.reconnected.size(), static_cast<size_t>(kMaxAttempts));

  Fail("bob");
  monitor_.CheckPeer("bob");
  queue_.AdvanceTime(kReconnectDelay * 2);

  EXPECT_EQ(delegate_.reconnected.size(), static_cast<size_t>(kMaxAttempts));
  ASSERT_EQ(delegate_.lost.size(), 1u);
  EXPECT_EQ(delegate_.lost_attempts, kMaxAttempts);
  EXPECT_FALSE(registry_.Contains("bob"));
  EXPECT_FALSE(monitor_.reconnect_pending("bob"));
}

TEST_F(HealthMonitorTest, HealthyCheckResetsAttempts) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.CheckPeer("bob");
  queue_.AdvanceTime(kReconnectDelay);
  ASSERT_EQ(monitor_.reconnect_attempts("bob"), 1);

  PeerConnectionRecord* record = registry_.Get("bob");
  record->connection_state = PeerConnectionState::kConnected;
  record->ice_connection_state = IceConnectionState::kCompleted;
  monitor_.CheckPeer("bob");

  EXPECT_EQ(monitor_.reconnect_attempts("bob"), 0);
  EXPECT_EQ(record->reconnect_attempts, 0);
  EXPECT_EQ(record->last_health_check, clock_.CurrentTime());
}

TEST_F(HealthMonitorTest, ConnectingPeersAreLeftAlone) {
  AddRecord("bob", PeerConnectionState::kConnecting, IceConnectionState::kChecking);
  monitor_.Start();
  queue_.AdvanceTime(kCheckInterval * 3);

  EXPECT_TRUE(delegate_.disposed.empty());
  EXPECT_TRUE(registry_.Contains("bob"));
}

TEST_F(HealthMonitorTest, PushedFailureIsCheckedWithoutWaitingForTick) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);
  monitor_.Start();

  Fail("bob");
  monitor_.OnPeerStateChanged("bob");
  // Never inline, the caller may be the link itself.
  EXPECT_TRUE(registry_.Contains("bob"));

  queue_.RunReady();
  EXPECT_FALSE(registry_.Contains("bob"));
  EXPECT_EQ(monitor_.reconnect_attempts("bob"), 1);
}

TEST_F(HealthMonitorTest, PushedDisconnectWaitsForTick) {
  PeerConnectionRecord* record =
      AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);
  monitor_.Start();

  record->ice_connection_state = IceConnectionState::kDisconnected;
  monitor_.OnPeerStateChanged("bob");
  queue_.RunReady();
  EXPECT_TRUE(registry_.Contains("bob"));

  queue_.AdvanceTime(kCheckInterval);
  EXPECT_FALSE(registry_.Contains("bob"));
}

TEST_F(HealthMonitorTest, PushIgnoredWhileStopped) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.OnPeerStateChanged("bob");
  queue_.RunReady();
  EXPECT_TRUE(registry_.Contains("bob"));
}

TEST_F(HealthMonitorTest, CancelledReconnectNeverFires) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.CheckPeer("bob");
  ASSERT_TRUE(monitor_.reconnect_pending("bob"));

  monitor_.CancelPendingReconnects();
  queue_.AdvanceTime(kReconnectDelay * 2);

  EXPECT_TRUE(delegate_.reconnected.empty());
  EXPECT_FALSE(monitor_.reconnect_pending("bob"));
}

TEST_F(HealthMonitorTest, SuspendedReconnectRunsAfterResume) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.CheckPeer("bob");
  queue_.AdvanceTime(kReconnectDelay / 2);

  monitor_.SuspendPendingReconnects();
  queue_.AdvanceTime(kReconnectDelay * 5);
  EXPECT_TRUE(delegate_.reconnected.empty());
  EXPECT_TRUE(monitor_.reconnect_pending("bob"));

  monitor_.ResumePendingReconnects();
  queue_.AdvanceTime(kReconnectDelay - webrtc::TimeDelta::Millis(1));
  EXPECT_TRUE(delegate_.reconnected.empty());
  queue_.AdvanceTime(webrtc::TimeDelta::Millis(1));

  ASSERT_EQ(delegate_.reconnected.size(), 1u);
  EXPECT_TRUE(registry_.Contains("bob"));
  EXPECT_FALSE(monitor_.reconnect_pending("bob"));
  EXPECT_EQ(monitor_.reconnect_attempts("bob"), 1);
}

TEST_F(HealthMonitorTest, ForgetDropsSuspendedReconnect) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.CheckPeer("bob");
  monitor_.SuspendPendingReconnects();
  monitor_.Forget("bob");
  monitor_.ResumePendingReconnects();
  queue_.AdvanceTime(kReconnectDelay * 2);

  EXPECT_TRUE(delegate_.reconnected.empty());
}

TEST_F(HealthMonitorTest, GivenUpPeerIsRememberedUntilForgotten) {
  AddRecord("bob", PeerConnectionState::kConnected, IceConnectionState::kConnected);
  for (int attempt = 0; attempt <= kMaxAttempts; ++attempt) {
    Fail("bob");
    monitor_.CheckPeer("bob");
    queue_.AdvanceTime(kReconnectDelay);
  }
  ASSERT_EQ(delegate_.lost.size(), 1u);
  EXPECT_TRUE(monitor_.gave_up("bob"));

  monitor_.Forget("bob");
  EXPECT_FALSE(monitor_.gave_up("bob"));
}

TEST_F(HealthMonitorTest, ForgetDropsCounterAndReconnect) {
  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  monitor_.CheckPeer("bob");
  monitor_.Forget("bob");
  queue_.AdvanceTime(kReconnectDelay);

  EXPECT_EQ(monitor_.reconnect_attempts("bob"), 0);
  EXPECT_TRUE(delegate_.reconnected.empty());
}

TEST_F(HealthMonitorTest, StopHaltsPeriodicChecks) {
  monitor_.Start();
  ASSERT_TRUE(monitor_.running());
  monitor_.Stop();
  EXPECT_FALSE(monitor_.running());

  AddRecord("bob", PeerConnectionState::kFailed, IceConnectionState::kFailed);
  queue_.AdvanceTime(kCheckInterval * 2);
  EXPECT_TRUE(registry_.Contains("bob"));
}
