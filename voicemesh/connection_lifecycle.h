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

#include <cstdint>
#include <memory>
#include <string>

#include "api/media_stream_interface.h"
#include "api/rtc_error.h"
#include "api/scoped_refptr.h"

#include "peer_link.h"
#include "peer_registry.h"
#include "signaling_adapter.h"
#include "voice_mesh_config.h"
#include "voice_session_state.h"

// Builds and tears down peer links and drives the offer/answer exchange.
// Everything runs on the session task queue.
class ConnectionLifecycleManager {
 public:
  // Told after any connection or ICE state change of a live record.
  class StateListener {
   public:
    virtual ~StateListener() = default;
    virtual void OnPeerStateChanged(const std::string& peer_id) = 0;
  };

  ConnectionLifecycleManager(const VoiceMeshConfig& config,
                             PeerConnectionRegistry* registry,
                             PeerLinkFactory* link_factory,
                             SignalingAdapter* signaling,
                             VoiceSessionState* state);
  ~ConnectionLifecycleManager();

  void SetStateListener(StateListener* listener) { listener_ = listener; }

  // Track attached to links built from now on. Null for receive-only.
  void SetLocalAudioTrack(rtc::scoped_refptr<webrtc::AudioTrackInterface> track);

  // No-op when a record for |peer_id| exists. False when refused or failed.
  bool Initiate(const std::string& peer_id);

  // Replaces any record of |peer_id| unless we win offer glare.
  bool AcceptOffer(const std::string& peer_id, const std::string& sdp);

  // Late or unknown peers are logged and ignored.
  void ApplyAnswer(const std::string& peer_id, const std::string& sdp);
  void ApplyIceCandidate(const std::string& peer_id, const IceCandidateInit& candidate);

  void DetachLocalAudioFromAll();

  // Dispose and initiate afresh.
  bool Restart(const std::string& peer_id);

  bool Dispose(const std::string& peer_id);
  void DisposeAll();

 private:
  class RecordObserver;

  std::unique_ptr<PeerConnectionRecord> BuildRecord(const std::string& peer_id,
                                                    const char* failure_text);

  void SendDescription(SignalingType type, const std::string& peer_id, const std::string& sdp);
  void FailNegotiation(const std::string& peer_id,
                       uint64_t record_id,
                       const char* failure_text,
                       const webrtc::RTCError& error);
  void FinishNegotiation(PeerConnectionRecord* record);
  void UpdateConnecting();

  // RecordObserver entry points; dropped when |record_id| is stale.
  void OnConnectionState(const std::string& peer_id, uint64_t record_id, PeerConnectionState state);
  void OnIceState(const std::string& peer_id, uint64_t record_id, IceConnectionState state);
  void OnLocalCandidate(const std::string& peer_id,
                        uint64_t record_id,
                        const IceCandidateInit& candidate);
  void OnRemoteTrack(const std::string& peer_id,
                     uint64_t record_id,
                     rtc::scoped_refptr<webrtc::AudioTrackInterface> track);

  const VoiceMeshConfig config_;
  PeerConnectionRegistry* const registry_;
  PeerLinkFactory* const link_factory_;
  SignalingAdapter* const signaling_;
  VoiceSessionState* const state_;
  StateListener* listener_ = nullptr;

  rtc::scoped_refptr<webrtc::AudioTrackInterface> local_track_;
};
