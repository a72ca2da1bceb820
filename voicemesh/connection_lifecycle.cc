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

#include <utility>

#include "audio_analysis.h"
#include "options.h"
#include "signaling_events.h"

// Forwards link events of one record, tagged with its identity.
class ConnectionLifecycleManager::RecordObserver : public PeerLinkObserver {
 public:
  RecordObserver(ConnectionLifecycleManager* manager, std::string peer_id, uint64_t record_id)
      : manager_(manager), peer_id_(std::move(peer_id)), record_id_(record_id) {}

  void OnConnectionStateChange(PeerConnectionState state) override {
    manager_->OnConnectionState(peer_id_, record_id_, state);
  }
  void OnIceConnectionStateChange(IceConnectionState state) override {
    manager_->OnIceState(peer_id_, record_id_, state);
  }
  void OnLocalIceCandidate(const IceCandidateInit& candidate) override {
    manager_->OnLocalCandidate(peer_id_, record_id_, candidate);
  }
  void OnRemoteAudioTrack(rtc::scoped_refptr<webrtc::AudioTrackInterface> track) override {
    manager_->OnRemoteTrack(peer_id_, record_id_, std::move(track));
  }

 private:
  ConnectionLifecycleManager* const manager_;
  const std::string peer_id_;
  const uint64_t record_id_;
};

ConnectionLifecycleManager::ConnectionLifecycleManager(const VoiceMeshConfig& config,
                                                       PeerConnectionRegistry* registry,
                                                       PeerLinkFactory* link_factory,
                                                       SignalingAdapter* signaling,
                                                       VoiceSessionState* state)
    : config_(config),
      registry_(registry),
      link_factory_(link_factory),
      signaling_(signaling),
      state_(state) {}

ConnectionLifecycleManager::~ConnectionLifecycleManager() {
  DisposeAll();
}

void ConnectionLifecycleManager::SetLocalAudioTrack(
    rtc::scoped_refptr<webrtc::AudioTrackInterface> track) {
  local_track_ = std::move(track);
}

std::unique_ptr<PeerConnectionRecord> ConnectionLifecycleManager::BuildRecord(
    const std::string& peer_id,
    const char* failure_text) {
  auto record = std::make_unique<PeerConnectionRecord>();
  record->peer_id = peer_id;
  record->record_id = registry_->NextRecordId();
  record->observer = std::make_unique<RecordObserver>(this, peer_id, record->record_id);

  record->link = link_factory_->CreatePeerLink(peer_id, record->observer.get());
  if (!record->link) {
    APP_LOG(AS_ERROR) << "Failed to create peer connection for " << peer_id;
    state_->SetConnectionError(failure_text);
    return nullptr;
  }

  if (config_.can_transmit && local_track_) {
    webrtc::RTCError error = record->link->AttachLocalAudio(local_track_);
    if (!error.ok()) {
      APP_LOG(AS_ERROR) << "Failed to attach local audio for " << peer_id << ": "
                        << error.message();
      record->link->Close();
      state_->SetConnectionError(failure_text);
      return nullptr;
    }
  }

  record->connection_state = PeerConnectionState::kConnecting;
  record->negotiating = true;
  return record;
}

bool ConnectionLifecycleManager::Initiate(const std::string& peer_id) {
  if (peer_id.empty() || peer_id == config_.user_id)
    return false;

  if (registry_->Contains(peer_id)) {
    APP_LOG(AS_INFO) << "Connection to " << peer_id << " already exists, not initiating";
    return true;
  }

  if (static_cast<int>(registry_->size()) >= config_.max_mesh_connections) {
    APP_LOG(AS_WARNING) << "Mesh connection limit reached (" << registry_->size() << "/"
                        << config_.max_mesh_connections << "), not connecting to " << peer_id;
    state_->SetConnectionError("Maximum mesh connections reached (" +
                               std::to_string(config_.max_mesh_connections) + ")");
    return false;
  }

  auto record = BuildRecord(peer_id, ErrorText::kInitiateFailed);
  if (!record)
    return false;

  const uint64_t record_id = record->record_id;
  PeerConnectionRecord* stored = registry_->Upsert(std::move(record));
  UpdateConnecting();
  APP_LOG(AS_INFO) << "Initiating voice connection to " << peer_id;

  stored->link->CreateOffer([this, peer_id, record_id](webrtc::RTCErrorOr<std::string> result) {
    if (!registry_->GetIfCurrent(peer_id, record_id)) {
      APP_LOG(AS_INFO) << "Offer for " << peer_id << " completed after its record was replaced";
      return;
    }
    if (!result.ok()) {
      FailNegotiation(peer_id, record_id, ErrorText::kInitiateFailed, result.error());
      return;
    }
    SendDescription(SignalingType::kVoiceOffer, peer_id, result.value());
  });
  return true;
}

bool ConnectionLifecycleManager::AcceptOffer(const std::string& peer_id, const std::string& sdp) {
  if (peer_id.empty() || peer_id == config_.user_id)
    return false;

  PeerConnectionRecord* existing = registry_->Get(peer_id);
  if (existing && existing->link && existing->link->HasPendingLocalOffer() &&
      config_.user_id < peer_id) {
    APP_LOG(AS_INFO) << "Offer glare with " << peer_id << ", keeping our own offer";
    return true;
  }

  if (!existing &&
      static_cast<int>(registry_->size()) >= config_.max_mesh_connections) {
    APP_LOG(AS_WARNING) << "Mesh connection limit reached, rejecting offer from " << peer_id;
    state_->SetConnectionError("Maximum mesh connections reached (" +
                               std::to_string(config_.max_mesh_connections) + ")");
    return false;
  }

  if (existing) {
    APP_LOG(AS_INFO) << "Connection to " << peer_id << " exists, replacing it for the new offer";
    registry_->RemoveAndDispose(peer_id);
  }

  auto record = BuildRecord(peer_id, ErrorText::kAcceptFailed);
  if (!record) {
    UpdateConnecting();
    return false;
  }

  const uint64_t record_id = record->record_id;
  PeerConnectionRecord* stored = registry_->Upsert(std::move(record));
  UpdateConnecting();
  APP_LOG(AS_INFO) << "Accepting voice offer from " << peer_id;

  stored->link->SetRemoteDescription(
      true, sdp, [this, peer_id, record_id](webrtc::RTCError error) {
        PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
        if (!record)
          return;
        if (!error.ok()) {
          FailNegotiation(peer_id, record_id, ErrorText::kAcceptFailed, error);
          return;
        }
        record->link->CreateAnswer(
            [this, peer_id, record_id](webrtc::RTCErrorOr<std::string> result) {
              PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
              if (!record)
                return;
              if (!result.ok()) {
                FailNegotiation(peer_id, record_id, ErrorText::kAcceptFailed, result.error());
                return;
              }
              SendDescription(SignalingType::kVoiceAnswer, peer_id, result.value());
              FinishNegotiation(record);
            });
      });
  return true;
}

void ConnectionLifecycleManager::ApplyAnswer(const std::string& peer_id, const std::string& sdp) {
  PeerConnectionRecord* record = registry_->Get(peer_id);
  if (!record || !record->link) {
    APP_LOG(AS_INFO) << "Ignoring answer from " << peer_id << ", no connection";
    return;
  }
  if (!record->link->HasPendingLocalOffer()) {
    APP_LOG(AS_WARNING) << "Ignoring answer from " << peer_id << ", no offer outstanding";
    return;
  }

  const uint64_t record_id = record->record_id;
  record->link->SetRemoteDescription(
      false, sdp, [this, peer_id, record_id](webrtc::RTCError error) {
        PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
        if (!record)
          return;
        if (!error.ok()) {
          FailNegotiation(peer_id, record_id, ErrorText::kAcceptFailed, error);
          return;
        }
        APP_LOG(AS_INFO) << "Answer from " << peer_id << " applied";
        FinishNegotiation(record);
      });
}

void ConnectionLifecycleManager::ApplyIceCandidate(const std::string& peer_id,
                                                   const IceCandidateInit& candidate) {
  PeerConnectionRecord* record = registry_->Get(peer_id);
  if (!record || !record->link) {
    APP_LOG(AS_INFO) << "Ignoring ICE candidate from " << peer_id << ", no connection";
    return;
  }
  webrtc::RTCError error = record->link->AddIceCandidate(candidate);
  if (!error.ok()) {
    APP_LOG(AS_WARNING) << "Failed to add ICE candidate from " << peer_id << ": "
                        << error.message();
  }
}

void ConnectionLifecycleManager::DetachLocalAudioFromAll() {
  registry_->ForEach([](PeerConnectionRecord& record) {
    if (record.link)
      record.link->DetachLocalAudio();
  });
}

bool ConnectionLifecycleManager::Restart(const std::string& peer_id) {
  Dispose(peer_id);
  return Initiate(peer_id);
}

bool ConnectionLifecycleManager::Dispose(const std::string& peer_id) {
  bool removed = registry_->RemoveAndDispose(peer_id);
  if (removed)
    UpdateConnecting();
  return removed;
}

void ConnectionLifecycleManager::DisposeAll() {
  registry_->DisposeAll();
  UpdateConnecting();
}

void ConnectionLifecycleManager::SendDescription(SignalingType type,
                                                 const std::string& peer_id,
                                                 const std::string& sdp) {
  SignalingMessage message;
  message.type = type;
  message.room_id = config_.room_id;
  message.from_user_id = config_.user_id;
  message.target_user_id = peer_id;
  message.sdp = sdp;
  if (!signaling_->Send(message)) {
    APP_LOG(AS_WARNING) << "Could not send " << SignalingTypeName(type) << " to " << peer_id;
  }
}

void ConnectionLifecycleManager::FailNegotiation(const std::string& peer_id,
                                                 uint64_t record_id,
                                                 const char* failure_text,
                                                 const webrtc::RTCError& error) {
  APP_LOG(AS_ERROR) << "Negotiation with " << peer_id << " failed: " << error.message();
  state_->SetConnectionError(failure_text);
  if (registry_->GetIfCurrent(peer_id, record_id)) {
    Dispose(peer_id);
  }
}

void ConnectionLifecycleManager::FinishNegotiation(PeerConnectionRecord* record) {
  record->negotiating = false;
  UpdateConnecting();
}

void ConnectionLifecycleManager::UpdateConnecting() {
  bool connecting = false;
  registry_->ForEach([&connecting](PeerConnectionRecord& record) {
    connecting = connecting || record.negotiating;
  });
  state_->set_connecting(connecting);
}

void ConnectionLifecycleManager::OnConnectionState(const std::string& peer_id,
                                                   uint64_t record_id,
                                                   PeerConnectionState state) {
  PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
  if (!record)
    return;

  APP_LOG(AS_INFO) << "Connection state for " << peer_id << ": "
                   << PeerConnectionStateName(state);
  record->connection_state = state;
  if (state == PeerConnectionState::kConnected) {
    state_->ClearConnectionError();
    FinishNegotiation(record);
  } else if (state == PeerConnectionState::kFailed || state == PeerConnectionState::kClosed) {
    FinishNegotiation(record);
  }

  if (listener_)
    listener_->OnPeerStateChanged(peer_id);
}

void ConnectionLifecycleManager::OnIceState(const std::string& peer_id,
                                            uint64_t record_id,
                                            IceConnectionState state) {
  PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
  if (!record)
    return;

  APP_LOG(AS_INFO) << "ICE state for " << peer_id << ": " << IceConnectionStateName(state);
  record->ice_connection_state = state;
  if (listener_)
    listener_->OnPeerStateChanged(peer_id);
}

void ConnectionLifecycleManager::OnLocalCandidate(const std::string& peer_id,
                                                  uint64_t record_id,
                                                  const IceCandidateInit& candidate) {
  if (!registry_->GetIfCurrent(peer_id, record_id))
    return;

  SignalingMessage message;
  message.type = SignalingType::kVoiceIceCandidate;
  message.room_id = config_.room_id;
  message.from_user_id = config_.user_id;
  message.target_user_id = peer_id;
  message.candidate = candidate;
  if (!signaling_->Send(message)) {
    APP_LOG(AS_WARNING) << "Could not send ICE candidate to " << peer_id;
  }
}

void ConnectionLifecycleManager::OnRemoteTrack(
    const std::string& peer_id,
    uint64_t record_id,
    rtc::scoped_refptr<webrtc::AudioTrackInterface> track) {
  PeerConnectionRecord* record = registry_->GetIfCurrent(peer_id, record_id);
  if (!record)
    return;

  APP_LOG(AS_INFO) << "Remote audio track from " << peer_id;
  if (record->remote_audio_sink) {
    record->remote_audio_sink->Disconnect();
  }
  record->remote_audio_sink =
      AudioAnalysisContext::Get()->CreateAnalyser("remote:" + peer_id, std::move(track));
}
