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

#include "api/media_stream_interface.h"
#include "api/rtc_error.h"
#include "api/scoped_refptr.h"

enum class PeerConnectionState {
  kNew,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

enum class IceConnectionState {
  kNew,
  kChecking,
  kConnected,
  kCompleted,
  kFailed,
  kDisconnected,
  kClosed,
};

const char* PeerConnectionStateName(PeerConnectionState state);
const char* IceConnectionStateName(IceConnectionState state);
bool ParsePeerConnectionState(const std::string& name, PeerConnectionState& out);
bool ParseIceConnectionState(const std::string& name, IceConnectionState& out);

struct IceCandidateInit {
  std::string candidate;
  std::string sdp_mid;
  int sdp_mline_index = 0;
};

class PeerLinkObserver {
 public:
  virtual ~PeerLinkObserver() = default;

  virtual void OnConnectionStateChange(PeerConnectionState state) = 0;
  virtual void OnIceConnectionStateChange(IceConnectionState state) = 0;
  virtual void OnLocalIceCandidate(const IceCandidateInit& candidate) = 0;
  // |track| may be null when the link cannot expose one (tests).
  virtual void OnRemoteAudioTrack(
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track) = 0;
};

// One peer-to-peer audio connection. Every completion callback runs on the
// session task queue and is dropped once the link is closed.
class PeerLink {
 public:
  using SdpCallback = std::function<void(webrtc::RTCErrorOr<std::string>)>;
  using DoneCallback = std::function<void(webrtc::RTCError)>;

  virtual ~PeerLink() = default;

  // Creates an offer/answer, applies it as the local description and hands
  // back its SDP.
  virtual void CreateOffer(SdpCallback callback) = 0;
  virtual void CreateAnswer(SdpCallback callback) = 0;

  // |is_offer| selects the description type of |sdp|.
  virtual void SetRemoteDescription(bool is_offer,
                                    const std::string& sdp,
                                    DoneCallback callback) = 0;

  // Buffered until the remote description is known.
  virtual webrtc::RTCError AddIceCandidate(const IceCandidateInit& candidate) = 0;

  virtual webrtc::RTCError AttachLocalAudio(
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track) = 0;
  virtual void DetachLocalAudio() = 0;

  // True between CreateOffer completing and the answer being applied.
  virtual bool HasPendingLocalOffer() const = 0;

  virtual PeerConnectionState connection_state() const = 0;
  virtual IceConnectionState ice_connection_state() const = 0;

  virtual void Close() = 0;
};

class PeerLinkFactory {
 public:
  virtual ~PeerLinkFactory() = default;

  // Returns null when the platform refuses to build a connection.
  virtual std::unique_ptr<PeerLink> CreatePeerLink(const std::string& peer_id,
                                                   PeerLinkObserver* observer) = 0;
};
