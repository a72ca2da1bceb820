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

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "api/rtc_error.h"
#include "api/task_queue/task_queue_base.h"

#include "peer_link.h"

// What a FakePeerLink did and what it is. Outlives the link so tests can
// inspect disposed connections.
struct FakePeerLinkState {
  std::string peer_id;
  PeerLinkObserver* observer = nullptr;
  bool closed = false;

  bool audio_attached = false;
  bool has_pending_local_offer = false;
  bool remote_description_set = false;
  std::string remote_sdp;
  int offers_created = 0;
  int answers_created = 0;
  std::vector<IceCandidateInit> remote_candidates;

  PeerConnectionState connection_state = PeerConnectionState::kNew;
  IceConnectionState ice_connection_state = IceConnectionState::kNew;

  void SetConnectionState(PeerConnectionState state) {
    connection_state = state;
    if (!closed && observer)
      observer->OnConnectionStateChange(state);
  }
  void SetIceConnectionState(IceConnectionState state) {
    ice_connection_state = state;
    if (!closed && observer)
      observer->OnIceConnectionStateChange(state);
  }
  void Connect() {
    SetIceConnectionState(IceConnectionState::kConnected);
    SetConnectionState(PeerConnectionState::kConnected);
  }
  void EmitLocalCandidate(const std::string& candidate) {
    if (!closed && observer)
      observer->OnLocalIceCandidate({candidate, "0", 0});
  }
  void EmitRemoteTrack(rtc::scoped_refptr<webrtc::AudioTrackInterface> track) {
    if (!closed && observer)
      observer->OnRemoteAudioTrack(std::move(track));
  }
};

// Knobs shared by the factory and its links.
struct FakePeerLinkBehavior {
  bool fail_create = false;
  bool fail_attach = false;
  bool fail_offer = false;
  bool fail_answer = false;
  bool fail_remote_description = false;
};

// Completes every asynchronous step on |task_queue|, never inline.
class FakePeerLink : public PeerLink {
 public:
  FakePeerLink(webrtc::TaskQueueBase* task_queue,
               std::shared_ptr<FakePeerLinkState> state,
               const FakePeerLinkBehavior* behavior)
      : task_queue_(task_queue), state_(std::move(state)), behavior_(behavior) {}
  ~FakePeerLink() override { Close(); }

  void CreateOffer(SdpCallback callback) override {
    if (state_->closed)
      return;
    state_->offers_created++;
    const bool fail = behavior_->fail_offer;
    auto state = state_;
    task_queue_->PostTask([state, callback, fail]() {
      if (state->closed)
        return;
      if (fail) {
        callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "offer failed"));
        return;
      }
      state->has_pending_local_offer = true;
      callback(std::string("offer-sdp-for-" + state->peer_id));
    });
  }

  void CreateAnswer(SdpCallback callback) override {
    if (state_->closed)
      return;
    state_->answers_created++;
    const bool fail = behavior_->fail_answer;
    auto state = state_;
    task_queue_->PostTask([state, callback, fail]() {
      if (state->closed)
        return;
      if (fail) {
        callback(webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "answer failed"));
        return;
      }
      callback(std::string("answer-sdp-for-" + state->peer_id));
    });
  }

  void SetRemoteDescription(bool is_offer,
                            const std::string& sdp,
                            DoneCallback callback) override {
    if (state_->closed)
      return;
    const bool fail = behavior_->fail_remote_description;
    auto state = state_;
    task_queue_->PostTask([state, callback, fail, is_offer, sdp]() {
      if (state->closed)
        return;
      if (fail) {
        callback(webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "bad sdp"));
        return;
      }
      state->remote_description_set = true;
      state->remote_sdp = sdp;
      if (!is_offer)
        state->has_pending_local_offer = false;
      callback(webrtc::RTCError::OK());
    });
  }

  webrtc::RTCError AddIceCandidate(const IceCandidateInit& candidate) override {
    if (state_->closed)
      return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "closed");
    state_->remote_candidates.push_back(candidate);
    return webrtc::RTCError::OK();
  }

  webrtc::RTCError AttachLocalAudio(
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track) override {
    if (behavior_->fail_attach)
      return webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "attach failed");
    state_->audio_attached = track != nullptr;
    return webrtc::RTCError::OK();
  }

  void DetachLocalAudio() override { state_->audio_attached = false; }

  bool HasPendingLocalOffer() const override { return state_->has_pending_local_offer; }
  PeerConnectionState connection_state() const override { return state_->connection_state; }
  IceConnectionState ice_connection_state() const override {
    return state_->ice_connection_state;
  }

  void Close() override {
    state_->closed = true;
    state_->observer = nullptr;
  }

 private:
  webrtc::TaskQueueBase* const task_queue_;
  std::shared_ptr<FakePeerLinkState> state_;
  const FakePeerLinkBehavior* const behavior_;
};

class FakePeerLinkFactory : public PeerLinkFactory {
 public:
  explicit FakePeerLinkFactory(webrtc::TaskQueueBase* task_queue) : task_queue_(task_queue) {}

  std::unique_ptr<PeerLink> CreatePeerLink(const std::string& peer_id,
                                           PeerLinkObserver* observer) override {
    if (behavior.fail_create)
      return nullptr;
    auto state = std::make_shared<FakePeerLinkState>();
    state->peer_id = peer_id;
    state->observer = observer;
    links_.push_back(state);
    return std::make_unique<FakePeerLink>(task_queue_, state, &behavior);
  }

  const std::vector<std::shared_ptr<FakePeerLinkState>>& links() const { return links_; }

  // Most recent link built for |peer_id|, null when none.
  std::shared_ptr<FakePeerLinkState> Latest(const std::string& peer_id) const {
    for (auto it = links_.rbegin(); it != links_.rend(); ++it) {
      if ((*it)->peer_id == peer_id)
        return *it;
    }
    return nullptr;
  }

  int LiveCount(const std::string& peer_id) const {
    int count = 0;
    for (const auto& link : links_) {
      if (link->peer_id == peer_id && !link->closed)
        count++;
    }
    return count;
  }

  int CreatedCount(const std::string& peer_id) const {
    int count = 0;
    for (const auto& link : links_) {
      if (link->peer_id == peer_id)
        count++;
    }
    return count;
  }

  FakePeerLinkBehavior behavior;

 private:
  webrtc::TaskQueueBase* const task_queue_;
  std::vector<std::shared_ptr<FakePeerLinkState>> links_;
};
