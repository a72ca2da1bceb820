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

#include "voice_mesh_session.h"

#include <utility>

#include "api/units/time_delta.h"

#include "audio_analysis.h"
#include "signaling_events.h"

VoiceMeshSession::VoiceMeshSession(const VoiceMeshConfig& config,
                                   webrtc::TaskQueueBase* task_queue,
                                   webrtc::Clock* clock,
                                   SignalingAdapter* signaling,
                                   PeerLinkFactory* link_factory)
    : config_(config),
      task_queue_(task_queue),
      clock_(clock),
      signaling_(signaling),
      lifecycle_(config_, &registry_, link_factory, signaling, &state_),
      health_(task_queue,
              clock,
              &registry_,
              this,
              config_.health_check_interval,
              config_.reconnect_delay,
              config_.max_reconnect_attempts),
      heartbeat_(task_queue,
                 clock,
                 &registry_,
                 signaling,
                 config_.room_id,
                 config_.user_id,
                 config_.heartbeat_interval),
      grace_(task_queue, this, config_.grace_period),
      levels_(task_queue,
              clock,
              config_.user_id,
              &state_,
              &registry_,
              this,
              config_.level_sample_interval,
              config_.mute_poll_interval,
              config_.silence_threshold),
      rate_limit_safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  state_.set_can_transmit(config_.can_transmit);
  lifecycle_.SetStateListener(this);
  signaling_->SetObserver(this);
}

VoiceMeshSession::~VoiceMeshSession() {
  signaling_->SetObserver(nullptr);
  state_.SetChangeCallback(nullptr);
  rate_limit_safety_->SetNotAlive();
  TearDownSession();
  lifecycle_.SetStateListener(nullptr);
}

void VoiceMeshSession::SetChangeCallback(VoiceSessionState::ChangeCallback callback) {
  state_.SetChangeCallback(std::move(callback));
}

const std::string& VoiceMeshSession::self_name() const {
  return config_.username.empty() ? config_.user_id : config_.username;
}

bool VoiceMeshSession::AddLocalStream(LocalAudioStream* stream) {
  if (!stream) {
    APP_LOG(AS_ERROR) << "AddLocalStream without a stream";
    return false;
  }

  grace_.Rearm();
  local_stream_ = stream;
  state_.set_has_local_stream(true);
  lifecycle_.SetLocalAudioTrack(stream->audio_track());
  levels_.SetLocalStream(stream);

  state_.UpsertParticipant(config_.user_id, self_name());
  state_.SetParticipantMuted(config_.user_id, !stream->HasEnabledAudioTrack());

  // Links negotiated without a track must be renegotiated to carry it.
  if (config_.can_transmit) {
    for (const std::string& peer_id : registry_.PeerIds()) {
      APP_LOG(AS_INFO) << "Renegotiating " << peer_id << " with local audio";
      lifecycle_.Restart(peer_id);
    }
  }

  StartMonitoring();
  AnnouncePresence();
  RequestParticipants();
  return true;
}

void VoiceMeshSession::RemoveLocalStream() {
  if (!local_stream_)
    return;

  APP_LOG(AS_INFO) << "Removing local audio stream";
  lifecycle_.DetachLocalAudioFromAll();
  lifecycle_.SetLocalAudioTrack(nullptr);
  levels_.SetLocalStream(nullptr);
  local_stream_ = nullptr;
  state_.set_has_local_stream(false);
  state_.SetParticipantMuted(config_.user_id, true);
}

bool VoiceMeshSession::EnableAudioReception() {
  // Remote analysers attach to this context as links come up.
  AudioAnalysisContext::Get();

  grace_.Rearm();
  state_.set_audio_enabled(true);
  StartMonitoring();

  // Transmitting nodes announce themselves with their stream.
  if (!config_.can_transmit) {
    state_.UpsertParticipant(config_.user_id, self_name());
    AnnouncePresence();
  }
  RequestParticipants();
  return true;
}

void VoiceMeshSession::PerformIntentionalCleanup() {
  APP_LOG(AS_INFO) << "Leaving voice room " << config_.room_id;
  if (presence_announced_) {
    SignalingMessage leave;
    leave.type = SignalingType::kLeaveVoice;
    leave.user_id = config_.user_id;
    SendToRoom(std::move(leave));
  }

  if (grace_.state() == GracePeriodController::State::kTornDown) {
    TearDownSession();
  } else {
    grace_.TearDownNow();
  }
}

void VoiceMeshSession::StartMonitoring() {
  levels_.Start();
  if (grace_.state() != GracePeriodController::State::kUp)
    return;
  health_.Start();
  heartbeat_.Start();
  StartSweep();
}

void VoiceMeshSession::StartSweep() {
  if (sweep_task_.Running())
    return;
  missing_since_last_sweep_.clear();
  sweep_task_ = webrtc::RepeatingTaskHandle::DelayedStart(
      task_queue_, config_.missing_connection_interval,
      [this]() {
        SweepMissingConnections();
        return config_.missing_connection_interval;
      },
      webrtc::TaskQueueBase::DelayPrecision::kLow, clock_);
}

void VoiceMeshSession::StopSweep() {
  sweep_task_.Stop();
  missing_since_last_sweep_.clear();
}

void VoiceMeshSession::SweepMissingConnections() {
  if (!config_.can_transmit || !local_stream_ || !signaling_->IsConnected()) {
    missing_since_last_sweep_.clear();
    return;
  }

  std::set<std::string> missing;
  for (const VoiceParticipant& participant : state_.participants()) {
    const std::string& peer_id = participant.user_id;
    if (peer_id == config_.user_id || registry_.Contains(peer_id) ||
        health_.reconnect_pending(peer_id) || health_.gave_up(peer_id)) {
      continue;
    }
    if (missing_since_last_sweep_.count(peer_id) == 0) {
      missing.insert(peer_id);
      continue;
    }
    if (static_cast<int>(registry_.size()) >= config_.max_mesh_connections)
      break;
    APP_LOG(AS_INFO) << "No connection to " << peer_id << ", initiating";
    lifecycle_.Initiate(peer_id);
  }
  missing_since_last_sweep_ = std::move(missing);
}

bool VoiceMeshSession::SendToRoom(SignalingMessage message) {
  message.room_id = config_.room_id;
  if (!signaling_->Send(message)) {
    APP_LOG(AS_WARNING) << "Could not send " << SignalingTypeName(message.type);
    return false;
  }
  return true;
}

void VoiceMeshSession::AnnouncePresence() {
  SignalingMessage join;
  join.type = SignalingType::kJoinVoice;
  join.user_id = config_.user_id;
  join.username = self_name();
  presence_announced_ = SendToRoom(std::move(join));

  const bool muted = !levels_.HasEnabledLocalTrack();
  if (BroadcastMute(muted)) {
    levels_.mute_detector().MarkBroadcast(muted);
  } else if (local_stream_) {
    levels_.mute_detector().ResetBaseline();
  }
}

void VoiceMeshSession::RequestParticipants() {
  SignalingMessage request;
  request.type = SignalingType::kRequestVoiceParticipants;
  SendToRoom(std::move(request));
}

void VoiceMeshSession::OnSignalingMessage(const SignalingMessage& message) {
  if (!message.room_id.empty() && message.room_id != config_.room_id) {
    APP_LOG(AS_VERBOSE) << "Dropping " << SignalingTypeName(message.type) << " for room "
                        << message.room_id;
    return;
  }
  if (!message.target_user_id.empty() && message.target_user_id != config_.user_id) {
    return;
  }

  switch (message.type) {
    case SignalingType::kVoiceParticipants:
      HandleParticipants(message);
      break;
    case SignalingType::kUserJoinedVoice:
      HandleUserJoined(message);
      break;
    case SignalingType::kUserLeftVoice:
      HandleUserLeft(message);
      break;
    case SignalingType::kVoiceOffer:
      if (!is_active()) {
        APP_LOG(AS_INFO) << "Ignoring offer from " << message.from_user_id
                         << ", voice is not active";
        break;
      }
      lifecycle_.AcceptOffer(message.from_user_id, message.sdp);
      break;
    case SignalingType::kVoiceAnswer:
      lifecycle_.ApplyAnswer(message.from_user_id, message.sdp);
      break;
    case SignalingType::kVoiceIceCandidate:
      lifecycle_.ApplyIceCandidate(message.from_user_id, message.candidate);
      break;
    case SignalingType::kVoiceMuteChanged:
      HandleMuteChanged(message);
      break;
    case SignalingType::kVoiceConnectionFailed:
      APP_LOG(AS_WARNING) << "Relay reports failed connection with " << message.from_user_id;
      health_.CheckPeer(message.from_user_id);
      break;
    case SignalingType::kVoiceReconnectionRequested:
      HandleReconnectionRequest(message);
      break;
    case SignalingType::kError:
      HandleRelayError(message);
      break;
    case SignalingType::kVoiceHeartbeat:
    case SignalingType::kJoinVoice:
    case SignalingType::kLeaveVoice:
    case SignalingType::kRequestVoiceParticipants:
      break;
  }
}

void VoiceMeshSession::HandleParticipants(const SignalingMessage& message) {
  for (const ParticipantInfo& participant : message.participants) {
    if (participant.user_id.empty())
      continue;
    state_.UpsertParticipant(participant.user_id, participant.username);
    if (participant.user_id == config_.user_id)
      continue;
    state_.SetExplicitMute(participant.user_id, participant.is_muted);
    state_.SetParticipantMuted(participant.user_id, participant.is_muted);
  }
}

void VoiceMeshSession::HandleUserJoined(const SignalingMessage& message) {
  if (message.user_id.empty() || message.user_id == config_.user_id)
    return;

  APP_LOG(AS_INFO) << "User joined voice: " << message.user_id;
  state_.UpsertParticipant(message.user_id, message.username);
  health_.Forget(message.user_id);
  if (is_active()) {
    lifecycle_.Initiate(message.user_id);
  }
}

void VoiceMeshSession::HandleUserLeft(const SignalingMessage& message) {
  if (message.user_id.empty() || message.user_id == config_.user_id)
    return;

  APP_LOG(AS_INFO) << "User left voice: " << message.user_id;
  health_.Forget(message.user_id);
  lifecycle_.Dispose(message.user_id);
  state_.RemoveParticipant(message.user_id);
  state_.ForgetExplicitMute(message.user_id);
}

void VoiceMeshSession::HandleMuteChanged(const SignalingMessage& message) {
  if (message.user_id == config_.user_id)
    return;
  state_.SetExplicitMute(message.user_id, message.is_muted);
  state_.UpsertParticipant(message.user_id, message.username);
  state_.SetParticipantMuted(message.user_id, message.is_muted);
}

void VoiceMeshSession::HandleReconnectionRequest(const SignalingMessage& message) {
  if (message.target_user_id != config_.user_id || message.from_user_id.empty())
    return;
  if (!is_active()) {
    APP_LOG(AS_INFO) << "Reconnection requested by " << message.from_user_id
                     << " while voice is not active";
    return;
  }
  APP_LOG(AS_INFO) << "Reconnection requested by " << message.from_user_id;
  health_.Forget(message.from_user_id);
  lifecycle_.Restart(message.from_user_id);
}

void VoiceMeshSession::HandleRelayError(const SignalingMessage& message) {
  if (message.error_message.find(ErrorText::kRateLimitMarker) == std::string::npos) {
    if (!message.error_message.empty()) {
      APP_LOG(AS_ERROR) << "Relay error: " << message.error_message;
      state_.SetConnectionError(message.error_message);
    }
    return;
  }

  const int wait_seconds = message.retry_after_seconds > 0
                               ? message.retry_after_seconds
                               : MeshDefaults::kRateLimitRetrySeconds;
  const std::string text = std::string(ErrorText::kRateLimitMarker) + ". Please wait " +
                           std::to_string(wait_seconds) + " seconds before trying again.";
  APP_LOG(AS_WARNING) << text;
  state_.SetConnectionError(text);

  rate_limit_safety_->SetNotAlive();
  rate_limit_safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  task_queue_->PostDelayedTask(webrtc::SafeTask(rate_limit_safety_,
                                                [this, text]() {
                                                  if (state_.connection_error() == text)
                                                    state_.ClearConnectionError();
                                                }),
                               webrtc::TimeDelta::Seconds(wait_seconds));
}

void VoiceMeshSession::OnTransportUp() {
  APP_LOG(AS_INFO) << "Signaling transport up";
  const bool recovered = grace_.OnTransportUp();
  if (!is_active())
    return;
  RequestParticipants();
  if (!recovered && !presence_announced_) {
    AnnouncePresence();
  }
}

void VoiceMeshSession::OnTransportDown(DisconnectKind kind) {
  APP_LOG(AS_WARNING) << "Signaling transport down ("
                      << (kind == DisconnectKind::kIntentional ? "intentional" : "accidental")
                      << ")";
  if (kind == DisconnectKind::kAccidental && !is_active()) {
    APP_LOG(AS_INFO) << "Voice is not active, no grace period";
    return;
  }
  grace_.OnTransportDown(kind);
}

void VoiceMeshSession::DisposePeer(const std::string& peer_id) {
  lifecycle_.Dispose(peer_id);
}

void VoiceMeshSession::ReconnectPeer(const std::string& peer_id) {
  if (!is_active())
    return;
  lifecycle_.Initiate(peer_id);
}

void VoiceMeshSession::OnPeerConnectionLost(const std::string& peer_id, int attempts) {
  const VoiceParticipant* participant = state_.FindParticipant(peer_id);
  const std::string& name = participant ? participant->username : peer_id;
  state_.SetConnectionError("Connection with " + name + " failed after " +
                            std::to_string(attempts) + " attempts");
}

void VoiceMeshSession::SuspendMonitoring() {
  health_.Stop();
  heartbeat_.Stop();
  StopSweep();
  health_.SuspendPendingReconnects();
}

void VoiceMeshSession::ResumeMonitoring() {
  if (!is_active()) {
    health_.ForgetAll();
    return;
  }
  health_.Start();
  heartbeat_.Start();
  StartSweep();
  health_.ResumePendingReconnects();
}

void VoiceMeshSession::ReannouncePresence() {
  if (!is_active())
    return;
  APP_LOG(AS_INFO) << "Re-announcing voice presence";
  AnnouncePresence();
}

void VoiceMeshSession::TearDownSession() {
  APP_LOG(AS_INFO) << "Tearing down voice session (" << registry_.size() << " connection(s))";
  health_.Stop();
  heartbeat_.Stop();
  levels_.Stop();
  StopSweep();
  health_.ForgetAll();

  lifecycle_.DisposeAll();
  lifecycle_.SetLocalAudioTrack(nullptr);
  levels_.Reset();
  local_stream_ = nullptr;
  AudioAnalysisContext::Shutdown();

  rate_limit_safety_->SetNotAlive();
  rate_limit_safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  presence_announced_ = false;
  state_.Clear();
}

bool VoiceMeshSession::BroadcastMute(bool muted) {
  if (!signaling_->IsConnected())
    return false;
  SignalingMessage message;
  message.type = SignalingType::kVoiceMuteChanged;
  message.user_id = config_.user_id;
  message.is_muted = muted;
  return SendToRoom(std::move(message));
}

void VoiceMeshSession::OnPeerStateChanged(const std::string& peer_id) {
  health_.OnPeerStateChanged(peer_id);
}
