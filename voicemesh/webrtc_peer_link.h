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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "api/jsep.h"
#include "api/peer_connection_interface.h"
#include "api/rtp_sender_interface.h"
#include "api/scoped_refptr.h"
#include "api/set_local_description_observer_interface.h"
#include "api/set_remote_description_observer_interface.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"

#include "options.h"
#include "peer_link.h"

class LambdaCreateSessionDescriptionObserver
    : public webrtc::CreateSessionDescriptionObserver {
 public:
  LambdaCreateSessionDescriptionObserver(
      std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)> on_success,
      std::function<void(webrtc::RTCError)> on_failure)
      : on_success_(on_success), on_failure_(on_failure) {}
  void OnSuccess(webrtc::SessionDescriptionInterface* desc) override {
    // Takes ownership of |desc|, CreateSessionDescriptionObserver convention.
    on_success_(std::unique_ptr<webrtc::SessionDescriptionInterface>(desc));
  }
  void OnFailure(webrtc::RTCError error) override {
    on_failure_(std::move(error));
  }

 private:
  std::function<void(std::unique_ptr<webrtc::SessionDescriptionInterface> desc)> on_success_;
  std::function<void(webrtc::RTCError)> on_failure_;
};

class LambdaSetLocalDescriptionObserver
    : public webrtc::SetLocalDescriptionObserverInterface {
 public:
  explicit LambdaSetLocalDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetLocalDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

class LambdaSetRemoteDescriptionObserver
    : public webrtc::SetRemoteDescriptionObserverInterface {
 public:
  explicit LambdaSetRemoteDescriptionObserver(
      std::function<void(webrtc::RTCError)> on_complete)
      : on_complete_(on_complete) {}
  void OnSetRemoteDescriptionComplete(webrtc::RTCError error) override {
    on_complete_(error);
  }

 private:
  std::function<void(webrtc::RTCError)> on_complete_;
};

// PeerLink over a libwebrtc PeerConnection. The session queue is expected
// to be the signaling thread of the factory; every result is re-posted to it
// so callers never run inside a libwebrtc callback.
class VOICEMESH_API WebRtcPeerLink : public PeerLink,
                                     public webrtc::PeerConnectionObserver {
 public:
  static std::unique_ptr<WebRtcPeerLink> Create(
      webrtc::TaskQueueBase* session_queue,
      webrtc::PeerConnectionFactoryInterface* factory,
      const webrtc::PeerConnectionInterface::RTCConfiguration& config,
      const std::string& peer_id,
      PeerLinkObserver* observer);

  ~WebRtcPeerLink() override;

  // PeerLink
  void CreateOffer(SdpCallback callback) override;
  void CreateAnswer(SdpCallback callback) override;
  void SetRemoteDescription(bool is_offer,
                            const std::string& sdp,
                            DoneCallback callback) override;
  webrtc::RTCError AddIceCandidate(const IceCandidateInit& candidate) override;
  webrtc::RTCError AttachLocalAudio(
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track) override;
  void DetachLocalAudio() override;
  bool HasPendingLocalOffer() const override;
  PeerConnectionState connection_state() const override { return connection_state_; }
  IceConnectionState ice_connection_state() const override { return ice_connection_state_; }
  void Close() override;

  // webrtc::PeerConnectionObserver, signaling thread.
  void OnSignalingChange(
      webrtc::PeerConnectionInterface::SignalingState new_state) override;
  void OnDataChannel(
      rtc::scoped_refptr<webrtc::DataChannelInterface> channel) override;
  void OnIceGatheringChange(
      webrtc::PeerConnectionInterface::IceGatheringState new_state) override;
  void OnIceCandidate(const webrtc::IceCandidateInterface* candidate) override;
  void OnConnectionChange(
      webrtc::PeerConnectionInterface::PeerConnectionState new_state) override;
  void OnStandardizedIceConnectionChange(
      webrtc::PeerConnectionInterface::IceConnectionState new_state) override;
  void OnTrack(
      rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) override;

 private:
  WebRtcPeerLink(webrtc::TaskQueueBase* session_queue,
                 const std::string& peer_id,
                 PeerLinkObserver* observer);

  void CreateDescription(bool offer, SdpCallback callback);
  void ApplyLocalDescription(std::unique_ptr<webrtc::SessionDescriptionInterface> desc,
                             SdpCallback callback);
  void EnsureAudioTransceiver();
  void DrainPendingIceCandidates();

  webrtc::TaskQueueBase* const session_queue_;
  const std::string peer_id_;
  PeerLinkObserver* observer_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;

  rtc::scoped_refptr<webrtc::PeerConnectionInterface> peer_connection_;
  rtc::scoped_refptr<webrtc::RtpSenderInterface> audio_sender_;
  std::vector<IceCandidateInit> pending_ice_candidates_;

  PeerConnectionState connection_state_ = PeerConnectionState::kNew;
  IceConnectionState ice_connection_state_ = IceConnectionState::kNew;
};

class VOICEMESH_API WebRtcPeerLinkFactory : public PeerLinkFactory {
 public:
  WebRtcPeerLinkFactory(
      webrtc::TaskQueueBase* session_queue,
      rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
      webrtc::PeerConnectionInterface::RTCConfiguration config);

  // Unified plan, max-bundle, rtcp-mux required, STUN and TURN from |opts|.
  static webrtc::PeerConnectionInterface::RTCConfiguration BuildRtcConfiguration(
      const Options& opts);

  std::unique_ptr<PeerLink> CreatePeerLink(const std::string& peer_id,
                                           PeerLinkObserver* observer) override;

 private:
  webrtc::TaskQueueBase* const session_queue_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory_;
  const webrtc::PeerConnectionInterface::RTCConfiguration config_;
};
