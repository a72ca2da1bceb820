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

#include "peer_registry.h"

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "system_wrappers/include/clock.h"
#include "test/fake_audio_track.h"
#include "test/fake_peer_link.h"
#include "test/fake_task_queue.h"

class PeerRegistryTest : public ::testing::Test {
 protected:
  PeerRegistryTest() : clock_(1000000), queue_(&clock_) {}

  void TearDown() override {
    registry_.DisposeAll();
    AudioAnalysisContext::Shutdown();
  }

  std::unique_ptr<PeerConnectionRecord> MakeRecord(const std::string& peer_id,
                                                   std::shared_ptr<FakePeerLinkState>* out) {
    auto state = std::make_shared<FakePeerLinkState>();
    state->peer_id = peer_id;
    auto record = std::make_unique<PeerConnectionRecord>();
    record->peer_id = peer_id;
    record->record_id = registry_.NextRecordId();
    record->link = std::make_unique<FakePeerLink>(&queue_, state, &behavior_);
    if (out)
      *out = state;
    return record;
  }

  webrtc::SimulatedClock clock_;
  FakeTaskQueue queue_;
  FakePeerLinkBehavior behavior_;
  PeerConnectionRegistry registry_;
};

TEST_F(PeerRegistryTest, UpsertDisposesPreviousRecord) {
  std::shared_ptr<FakePeerLinkState> first;
  std::shared_ptr<FakePeerLinkState> second;
  registry_.Upsert(MakeRecord("bob", &first));
  const uint64_t first_id = registry_.Get("bob")->record_id;
  registry_.Upsert(MakeRecord("bob", &second));

  EXPECT_TRUE(first->closed);
  EXPECT_FALSE(second->closed);
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(registry_.GetIfCurrent("bob", first_id), nullptr);
  EXPECT_NE(registry_.GetIfCurrent("bob", registry_.Get("bob")->record_id), nullptr);
}

TEST_F(PeerRegistryTest, UpsertRefusesAnonymousRecords) {
  EXPECT_EQ(registry_.Upsert(std::make_unique<PeerConnectionRecord>()), nullptr);
  EXPECT_EQ(registry_.Upsert(nullptr), nullptr);
  EXPECT_TRUE(registry_.empty());
}

TEST_F(PeerRegistryTest, RemoveAndDisposeReleasesEverything) {
  std::shared_ptr<FakePeerLinkState> link;
  PeerConnectionRecord* record = registry_.Upsert(MakeRecord("bob", &link));
  auto track = FakeAudioTrack::Create("remote");
  record->remote_audio_sink = AudioAnalysisContext::Get()->CreateAnalyser("remote:bob", track);
  ASSERT_EQ(track->sink_count(), 1u);

  EXPECT_TRUE(registry_.RemoveAndDispose("bob"));
  EXPECT_TRUE(link->closed);
  EXPECT_EQ(track->sink_count(), 0u);
  EXPECT_EQ(AudioAnalysisContext::Get()->live_analysers(), 0u);
  EXPECT_FALSE(registry_.Contains("bob"));
  EXPECT_FALSE(registry_.RemoveAndDispose("bob"));
}

TEST_F(PeerRegistryTest, DisposeAllClosesEveryLink) {
  std::shared_ptr<FakePeerLinkState> bob;
  std::shared_ptr<FakePeerLinkState> carol;
  registry_.Upsert(MakeRecord("bob", &bob));
  registry_.Upsert(MakeRecord("carol", &carol));
  ASSERT_EQ(registry_.PeerIds().size(), 2u);

  registry_.DisposeAll();
  EXPECT_TRUE(bob->closed);
  EXPECT_TRUE(carol->closed);
  EXPECT_TRUE(registry_.empty());
}

TEST_F(PeerRegistryTest, RecordIdsNeverRepeat) {
  const uint64_t a = registry_.NextRecordId();
  const uint64_t b = registry_.NextRecordId();
  EXPECT_LT(a, b);
}
