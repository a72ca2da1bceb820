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

#include "webrtc_peer_link.h"

#include <utility>

#include "api/media_types.h"
#include "api/rtp_transceiver_interface.h"
#include "rtc_base/ref_counted_object.h"

// String split from options.cc
std::vector<std::string> stringSplit(std::string input, std::string delimiter);

namespace {

PeerConnectionState FromWebRtc(webrtc::PeerConnectionInterface::PeerConnectionState state) {
  using State = webrtc::PeerConnectionInterface::PeerConnectionState;
  switch (state) {
    case State::kNew:
      return PeerConnectionState::kNew;
    case State::kConnecting:
      return PeerConnectionState::kConnecting;
    case State::kConnected:
      return PeerConnectionState::kConnected;
    case State::kDisconnected:
      return PeerConnectionState::kDisconnected;
    case State::kFailed:
      return PeerConnectionState::kFailed;
    case State::kClosed:
      return PeerConnectionState::kClosed;
  }
  return PeerConnectionState::kFailed;
}

IceConnectionState FromWebRtc(webrtc::PeerConnectionInterface::IceConnectionState state) {
  switch (state) {
    case webrtc::PeerConnectionInterface::kIceConnectionNew:
      return IceConnectionState::kNew;
    case webrtc::PeerConnectionInterface::kIceConnectionChecking:
      return IceConnectionState::kChecking;
    case webrtc::PeerConnectionInterface::kIceConnectionConnected:
      return IceConnectionState::kConnected;
    case webrtc::PeerConnectionInterface::kIceConnectionCompleted:
      return IceConnectionState::kCompleted;
    case webrtc::PeerConnectionInterface::kIceConnectionFailed:
      return IceConnectionState::kFailed;
    case webrtc::PeerConnectionInterface::kIceConnectionDisconnected:
      return IceConnectionState::kDisconnected;
    case webrtc::PeerConnectionInterface::kIceConnectionClosed:
    case webrtc::PeerConnectionInterface::kIceConnectionMax:
      return IceConnectionState::kClosed;
  }
  return IceConnectionState::kFailed;
}

}  // namespace

std::unique_ptr<WebRtcPeerLink> WebRtcPeerLink::Create(
    webrtc::TaskQueueBase* session_queue,
    webrtc::PeerConnectionFactoryInterface* factory,
    const webrtc::PeerConnectionInterface::RTCConfiguration& config,
    const std::string& peer_id,
    PeerLinkObserver* observer) {
  std::unique_ptr<WebRtcPeerLink> link(new WebRtcPeerLink(session_queue, peer_id, observer));

  webrtc::PeerConnectionDependencies dependencies(link.get());
  auto result = factory->CreatePeerConnectionOrError(config, std::move(dependencies));
  if (!result.ok()) {
    APP_LOG(AS_ERROR) << "Failed to create peer connection for " << peer_id << ": "
                      << result.error().message();
    return nullptr;
  }
  link->peer_connection_ = result.MoveValue();
  return link;
}

WebRtcPeerLink::WebRtcPeerLink(webrtc::TaskQueueBase* session_queue,
                               const std::string& peer_id,
                               PeerLinkObserver* observer)
    : session_queue_(session_queue),
      peer_id_(peer_id),
      observer_(observer),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

WebRtcPeerLink::~WebRtcPeerLink() {
  Close();
}

void WebRtcPeerLink::CreateOffer(SdpCallback callback) {
  EnsureAudioTransceiver();
  CreateDescription(true, std::move(callback));
}

void WebRtcPeerLink::CreateAnswer(SdpCallback callback) {
  CreateDescription(false, std::move(callback));
}

void WebRtcPeerLink::CreateDescription(bool offer, SdpCallback callback) {
  if (!peer_connection_) {
    APP_LOG(AS_WARNING) << "CreateDescription on closed link to " << peer_id_;
    return;
  }

  webrtc::TaskQueueBase* queue = session_queue_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> flag = safety_;

  auto observer = rtc::make_ref_counted<LambdaCreateSessionDescriptionObserver>(
      [this, queue, flag, callback](std::unique_ptr<webrtc::SessionDescriptionInterface> desc) {
        queue->PostTask(webrtc::SafeTask(
            flag, [this, desc = std::move(desc), callback]() mutable {
              ApplyLocalDescription(std::move(desc), callback);
            }));
      },
      [queue, flag, callback](webrtc::RTCError error) {
        queue->PostTask(webrtc::SafeTask(
            flag, [callback, error = std::move(error)]() mutable { callback(std::move(error)); }));
      });

  webrtc::PeerConnectionInterface::RTCOfferAnswerOptions options;
  if (offer) {
    peer_connection_->CreateOffer(observer.get(), options);
  } else {
    peer_connection_->CreateAnswer(observer.get(), options);
  }
}

void WebRtcPeerLink::ApplyLocalDescription(
    std::unique_ptr<webrtc::SessionDescriptionInterface> desc,
    SdpCallback callback) {
  if (!peer_connection_)
    return;

  std::string sdp;
  desc->ToString(&sdp);

  webrtc::TaskQueueBase* queue = session_queue_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> flag = safety_;
  auto observer = rtc::make_ref_counted<LambdaSetLocalDescriptionObserver>(
      [this, queue, flag, sdp, callback](webrtc::RTCError error) {
        queue->PostTask(webrtc::SafeTask(flag, [this, sdp, callback, error]() {
          if (!error.ok()) {
            APP_LOG(AS_ERROR) << "Failed to set local description for " << peer_id_ << ": "
                              << error.message();
            callback(webrtc::RTCError(error));
            return;
          }
          APP_LOG(AS_VERBOSE) << "Local description set for " << peer_id_;
          DrainPendingIceCandidates();
          callback(sdp);
        }));
      });
  peer_connection_->SetLocalDescription(std::move(desc), observer);
}

void WebRtcPeerLink::SetRemoteDescription(bool is_offer,
                                          const std::string& sdp,
                                          DoneCallback callback) {
  if (!peer_connection_) {
    APP_LOG(AS_WARNING) << "SetRemoteDescription on closed link to " << peer_id_;
    return;
  }

  webrtc::SdpParseError parse_error;
  std::unique_ptr<webrtc::SessionDescriptionInterface> desc = webrtc::CreateSessionDescription(
      is_offer ? webrtc::SdpType::kOffer : webrtc::SdpType::kAnswer, sdp, &parse_error);
  if (!desc) {
    APP_LOG(AS_ERROR) << "Failed to parse remote SDP from " << peer_id_ << ": "
                      << parse_error.description;
    webrtc::RTCError error(webrtc::RTCErrorType::INVALID_PARAMETER, parse_error.description);
    session_queue_->PostTask(
        webrtc::SafeTask(safety_, [callback, error]() { callback(error); }));
    return;
  }

  webrtc::TaskQueueBase* queue = session_queue_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> flag = safety_;
  auto observer = rtc::make_ref_counted<LambdaSetRemoteDescriptionObserver>(
      [this, queue, flag, callback](webrtc::RTCError error) {
        queue->PostTask(webrtc::SafeTask(flag, [this, callback, error]() {
          if (error.ok()) {
            APP_LOG(AS_VERBOSE) << "Remote description set for " << peer_id_;
            DrainPendingIceCandidates();
          }
          callback(error);
        }));
      });
  peer_connection_->SetRemoteDescription(std::move(desc), observer);
}

webrtc::RTCError WebRtcPeerLink::AddIceCandidate(const IceCandidateInit& candidate) {
  if (!peer_connection_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "link closed");
  }
  if (!peer_connection_->remote_description()) {
    APP_LOG(AS_VERBOSE) << "Queuing ICE candidate from " << peer_id_
                        << " until the remote description is set";
    pending_ice_candidates_.push_back(candidate);
    return webrtc::RTCError::OK();
  }

  webrtc::SdpParseError error;
  std::unique_ptr<webrtc::IceCandidateInterface> ice(webrtc::CreateIceCandidate(
      candidate.sdp_mid, candidate.sdp_mline_index, candidate.candidate, &error));
  if (!ice) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, error.description);
  }
  if (!peer_connection_->AddIceCandidate(ice.get())) {
    return webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "AddIceCandidate failed");
  }
  return webrtc::RTCError::OK();
}

void WebRtcPeerLink::DrainPendingIceCandidates() {
  if (!peer_connection_ || !peer_connection_->remote_description())
    return;

  std::vector<IceCandidateInit> pending;
  pending.swap(pending_ice_candidates_);
  for (const IceCandidateInit& candidate : pending) {
    webrtc::RTCError error = AddIceCandidate(candidate);
    if (!error.ok()) {
      APP_LOG(AS_WARNING) << "Dropping queued ICE candidate from " << peer_id_ << ": "
                          << error.message();
    }
  }
}

webrtc::RTCError WebRtcPeerLink::AttachLocalAudio(
    rtc::scoped_refptr<webrtc::AudioTrackInterface> track) {
  if (!peer_connection_) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_STATE, "link closed");
  }
  if (!track) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER, "no audio track");
  }

  if (audio_sender_) {
    if (!audio_sender_->SetTrack(track.get())) {
      return webrtc::RTCError(webrtc::RTCErrorType::INTERNAL_ERROR, "SetTrack failed");
    }
    return webrtc::RTCError::OK();
  }

  auto result = peer_connection_->AddTrack(track, {"voicemesh"});
  if (!result.ok()) {
    return result.MoveError();
  }
  audio_sender_ = result.MoveValue();
  return webrtc::RTCError::OK();
}

void WebRtcPeerLink::DetachLocalAudio() {
  if (audio_sender_ && !audio_sender_->SetTrack(nullptr)) {
    APP_LOG(AS_WARNING) << "Failed to detach local audio from " << peer_id_;
  }
}

void WebRtcPeerLink::EnsureAudioTransceiver() {
  if (!peer_connection_ || audio_sender_)
    return;
  for (const auto& transceiver : peer_connection_->GetTransceivers()) {
    if (transceiver->media_type() == cricket::MEDIA_TYPE_AUDIO)
      return;
  }

  // Receive-only nodes still need an audio m-line in their offer.
  webrtc::RtpTransceiverInit init;
  init.direction = webrtc::RtpTransceiverDirection::kRecvOnly;
  auto result = peer_connection_->AddTransceiver(cricket::MEDIA_TYPE_AUDIO, init);
  if (!result.ok()) {
    APP_LOG(AS_ERROR) << "AddTransceiver failed: " << result.error().message();
  }
}

bool WebRtcPeerLink::HasPendingLocalOffer() const {
  return peer_connection_ &&
         peer_connection_->signaling_state() ==
             webrtc::PeerConnectionInterface::kHaveLocalOffer;
}

void WebRtcPeerLink::Close() {
  if (!peer_connection_)
    return;

  // Close() fires state callbacks, nobody may hear them.
  observer_ = nullptr;
  safety_->SetNotAlive();
  pending_ice_candidates_.clear();
  audio_sender_ = nullptr;

  auto pc = std::move(peer_connection_);
  pc->Close();
  APP_LOG(AS_INFO) << "Peer connection to " << peer_id_ << " closed";
}

void WebRtcPeerLink::OnSignalingChange(
    webrtc::PeerConnectionInterface::SignalingState new_state) {
  APP_LOG(AS_VERBOSE) << "Signaling state of " << peer_id_ << " is now "
                      << webrtc::PeerConnectionInterface::AsString(new_state);
}

void WebRtcPeerLink::OnDataChannel(
    rtc::scoped_refptr<webrtc::DataChannelInterface> channel) {
  APP_LOG(AS_WARNING) << "Ignoring data channel from " << peer_id_;
}

void WebRtcPeerLink::OnIceGatheringChange(
    webrtc::PeerConnectionInterface::IceGatheringState new_state) {
  APP_LOG(AS_VERBOSE) << "ICE gathering of " << peer_id_ << " is now "
                      << webrtc::PeerConnectionInterface::AsString(new_state);
}

void WebRtcPeerLink::OnIceCandidate(const webrtc::IceCandidateInterface* candidate) {
  IceCandidateInit init;
  if (!candidate->ToString(&init.candidate)) {
    APP_LOG(AS_ERROR) << "Failed to serialize candidate";
    return;
  }
  init.sdp_mid = candidate->sdp_mid();
  init.sdp_mline_index = candidate->sdp_mline_index();

  session_queue_->PostTask(webrtc::SafeTask(safety_, [this, init]() {
    if (observer_)
      observer_->OnLocalIceCandidate(init);
  }));
}

void WebRtcPeerLink::OnConnectionChange(
    webrtc::PeerConnectionInterface::PeerConnectionState new_state) {
  const PeerConnectionState state = FromWebRtc(new_state);
  session_queue_->PostTask(webrtc::SafeTask(safety_, [this, state]() {
    connection_state_ = state;
    if (observer_)
      observer_->OnConnectionStateChange(state);
  }));
}

void WebRtcPeerLink::OnStandardizedIceConnectionChange(
    webrtc::PeerConnectionInterface::IceConnectionState new_state) {
  const IceConnectionState state = FromWebRtc(new_state);
  session_queue_->PostTask(webrtc::SafeTask(safety_, [this, state]() {
    ice_connection_state_ = state;
    if (observer_)
      observer_->OnIceConnectionStateChange(state);
  }));
}

void WebRtcPeerLink::OnTrack(
    rtc::scoped_refptr<webrtc::RtpTransceiverInterface> transceiver) {
  rtc::scoped_refptr<webrtc::MediaStreamTrackInterface> track = transceiver->receiver()->track();
  if (!track || track->kind() != webrtc::MediaStreamTrackInterface::kAudioKind) {
    return;
  }
  rtc::scoped_refptr<webrtc::AudioTrackInterface> audio(
      static_cast<webrtc::AudioTrackInterface*>(track.get()));
  APP_LOG(AS_INFO) << "Remote audio track " << audio->id() << " from " << peer_id_;

  session_queue_->PostTask(webrtc::SafeTask(safety_, [this, audio]() {
    if (observer_)
      observer_->OnRemoteAudioTrack(audio);
  }));
}

WebRtcPeerLinkFactory::WebRtcPeerLinkFactory(
    webrtc::TaskQueueBase* session_queue,
    rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory,
    webrtc::PeerConnectionInterface::RTCConfiguration config)
    : session_queue_(session_queue), factory_(std::move(factory)), config_(std::move(config)) {}

webrtc::PeerConnectionInterface::RTCConfiguration WebRtcPeerLinkFactory::BuildRtcConfiguration(
    const Options& opts) {
  webrtc::PeerConnectionInterface::RTCConfiguration config;
  config.sdp_semantics = webrtc::SdpSemantics::kUnifiedPlan;
  config.bundle_policy = webrtc::PeerConnectionInterface::kBundlePolicyMaxBundle;
  config.rtcp_mux_policy = webrtc::PeerConnectionInterface::kRtcpMuxPolicyRequire;

  if (!opts.stun.empty()) {
    webrtc::PeerConnectionInterface::IceServer stun;
    stun.uri = opts.stun;
    config.servers.push_back(stun);
  }

  if (!opts.turns.empty()) {
    std::vector<std::string> turnsParams = stringSplit(opts.turns, ",");
    if (turnsParams.size() == 3) {
      webrtc::PeerConnectionInterface::IceServer turn;
      turn.uri = turnsParams[0];
      turn.username = turnsParams[1];
      turn.password = turnsParams[2];
      turn.tls_cert_policy = webrtc::PeerConnectionInterface::kTlsCertPolicyInsecureNoCheck;
      config.servers.push_back(turn);
    } else {
      APP_LOG(AS_WARNING) << "Ignoring malformed turns option, expected uri,username,password";
    }
  }
  return config;
}

std::unique_ptr<PeerLink> WebRtcPeerLinkFactory::CreatePeerLink(const std::string& peer_id,
                                                                 PeerLinkObserver* observer) {
  if (!factory_) {
    APP_LOG(AS_ERROR) << "No peer connection factory";
    return nullptr;
  }
  return WebRtcPeerLink::Create(session_queue_, factory_.get(), config_, peer_id, observer);
}
