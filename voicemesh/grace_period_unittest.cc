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

#include "grace_period.h"

#include <gtest/gtest.h>

#include "api/units/time_delta.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_task_queue.h"

namespace {

const webrtc::TimeDelta kGrace = webrtc::TimeDelta::Seconds(60);

class CountingDelegate : public GracePeriodController::Delegate {
 public:
  void SuspendMonitoring() override { suspended++; }
  void ResumeMonitoring() override { resumed++; }
  void ReannouncePresence() override { reannounced++; }
  void TearDownSession() override { torn_down++; }

  int suspended = 0;
  int resumed = 0;
  int reannounced = 0;
  int torn_down = 0;
};

}  // namespace

class GracePeriodTest : public ::testing::Test {
 protected:
  GracePeriodTest() : clock_(1000000), queue_(&clock_), grace_(&queue_, &delegate_, kGrace) {}

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  CountingDelegate delegate_;
  GracePeriodController grace_;
};

TEST_F(GracePeriodTest, ReturnWithinGraceKeepsSession) {
  grace_.OnTransportDown(DisconnectKind::kAccidental);
  EXPECT_EQ(grace_.state(), GracePeriodController::State::kDownGrace);
  EXPECT_EQ(delegate_.suspended, 1);
  EXPECT_TRUE(grace_.timer_pending());

  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(10));
  EXPECT_TRUE(grace_.OnTransportUp());
  EXPECT_EQ(grace_.state(), GracePeriodController::State::kUp);
  EXPECT_EQ(delegate_.resumed, 1);
  EXPECT_EQ(delegate_.reannounced, 1);

  queue_.AdvanceTime(kGrace * 2);
  EXPECT_EQ(delegate_.torn_down, 0);
  EXPECT_EQ(queue_.pending_tasks(), 0u);
}

TEST_F(GracePeriodTest, ExpiryTearsDownOnce) {
  grace_.OnTransportDown(DisconnectKind::kAccidental);
  queue_.AdvanceTime(kGrace - webrtc::TimeDelta::Millis(1));
  EXPECT_EQ(delegate_.torn_down, 0);

  queue_.AdvanceTime(webrtc::TimeDelta::Millis(1));
  EXPECT_EQ(delegate_.torn_down, 1);
  EXPECT_EQ(grace_.state(), GracePeriodController::State::kTornDown);
  EXPECT_FALSE(grace_.timer_pending());

  // Late return after teardown changes nothing.
  EXPECT_FALSE(grace_.OnTransportUp());
  EXPECT_EQ(delegate_.resumed, 0);
}

TEST_F(GracePeriodTest, SecondDropDoesNotStartAnotherTimer) {
  grace_.OnTransportDown(DisconnectKind::kAccidental);
  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(30));
  grace_.OnTransportDown(DisconnectKind::kAccidental);

  EXPECT_EQ(delegate_.suspended, 1);
  EXPECT_EQ(queue_.pending_tasks(), 1u);

  // Measured from the first drop.
  queue_.AdvanceTime(webrtc::TimeDelta::Seconds(30));
  EXPECT_EQ(delegate_.torn_down, 1);
  queue_.AdvanceTime(kGrace);
  EXPECT_EQ(delegate_.torn_down, 1);
}

TEST_F(GracePeriodTest, UpWhileUpIsNotARecovery) {
  EXPECT_FALSE(grace_.OnTransportUp());
  EXPECT_EQ(delegate_.resumed, 0);
  EXPECT_EQ(delegate_.reannounced, 0);
}

TEST_F(GracePeriodTest, IntentionalDisconnectTearsDownImmediately) {
  grace_.OnTransportDown(DisconnectKind::kIntentional);
  EXPECT_EQ(delegate_.torn_down, 1);
  EXPECT_EQ(delegate_.suspended, 0);
  EXPECT_EQ(queue_.pending_tasks(), 0u);
}

TEST_F(GracePeriodTest, IntentionalDisconnectDuringGraceCancelsTimer) {
  grace_.OnTransportDown(DisconnectKind::kAccidental);
  grace_.OnTransportDown(DisconnectKind::kIntentional);
  EXPECT_EQ(delegate_.torn_down, 1);

  queue_.AdvanceTime(kGrace * 2);
  EXPECT_EQ(delegate_.torn_down, 1);
}

TEST_F(GracePeriodTest, TearDownNowIsIdempotent) {
  grace_.TearDownNow();
  grace_.TearDownNow();
  EXPECT_EQ(delegate_.torn_down, 1);

  grace_.OnTransportDown(DisconnectKind::kAccidental);
  EXPECT_EQ(delegate_.suspended, 0);
}

TEST_F(GracePeriodTest, RearmAllowsANewSession) {
  grace_.TearDownNow();
  grace_.Rearm();
  EXPECT_EQ(grace_.state(), GracePeriodController::State::kUp);
  EXPECT_STREQ(GraceStateName(grace_.state()), "transport-up");

  grace_.OnTransportDown(DisconnectKind::kAccidental);
  EXPECT_EQ(delegate_.suspended, 1);
  grace_.Rearm();
  EXPECT_EQ(grace_.state(), GracePeriodController::State::kDownGrace);
}
