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

#include <set>
#include <string>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "system_wrappers/include/clock.h"

#include "audio_level_monitor.h"
#include "connection_lifecycle.h"
#include "grace_period.h"
#include "health_monitor.h"
#include "heartbeat_publisher.h"
#include "local_audio_stream.h"
#include "options.h"
#include "peer_link.h"
#include "peer_registry.h"
#include "signaling_adapter.h"
#include "voice_mesh_config.h"
#include "voice_session_state.h"

// One node of the voice mesh. Owns every reliability component and routes
// relay traffic between them. Not thread safe: construct, call and destroy
// on |task_queue|.
class VOICEMESH_API VoiceMeshSession : public SignalingObserver,
                                       public HealthMonitor::Delegate,
                                       public GracePeriodController::Delegate,
                                       public AudioLevelMonitor::Delegate,
                                       public ConnectionLifecycleManager::StateListener {
 public:
  VoiceMeshSession(const VoiceMeshConfig& config,
                   webrtc::TaskQueueBase* task_queue,
                   webrtc::Clock* clock,
                   SignalingAdapter* signaling,
                   PeerLinkFactory* link_factory);
  ~VoiceMeshSession() override;

  VoiceMeshSession(const VoiceMeshSession&) = delete;
  VoiceMeshSession& operator=(const VoiceMeshSession&) = delete;

  // |stream| is not owned and must outlive the session or RemoveLocalStream().
  bool AddLocalStream(LocalAudioStream* stream);
  void RemoveLocalStream();
  bool EnableAudioReception();

  // Leaves the room and releases everything before returning.
  void PerformIntentionalCleanup();

  const VoiceSessionState& state() const { return state_; }
  void SetChangeCallback(VoiceSessionState::ChangeCallback callback);

  const VoiceMeshConfig& config() const { return config_; }
  const PeerConnectionRegistry& registry() const { return registry_; }
  HealthMonitor& health_monitor() { return health_; }
  HeartbeatPublisher& heartbeat() { return heartbeat_; }
  GracePeriodController& grace_period() { return grace_; }
  AudioLevelMonitor& level_monitor() { return levels_; }
  bool sweep_running() const { return sweep_task_.Running(); }

  // SignalingObserver
  void OnSignalingMessage(const SignalingMessage& message) override;
  void OnTransportUp() override;
  void OnTransportDown(DisconnectKind kind) override;

  // HealthMonitor::Delegate
  void DisposePeer(const std::string& peer_id) override;
  void ReconnectPeer(const std::string& peer_id) override;
  void OnPeerConnectionLost(const std::string& peer_id, int attempts) override;

  // GracePeriodController::Delegate
  void SuspendMonitoring() override;
  void ResumeMonitoring() override;
  void ReannouncePresence() override;
  void TearDownSession() override;

  // AudioLevelMonitor::Delegate
  bool BroadcastMute(bool muted) override;

  // ConnectionLifecycleManager::StateListener
  void OnPeerStateChanged(const std::string& peer_id) override;

 private:
  bool is_active() const { return state_.has_local_stream() || state_.is_audio_enabled(); }
  const std::string& self_name() const;

  void StartMonitoring();
  void StartSweep();
  void StopSweep();
  // Initiates to roster participants that stayed without a link for two
  // consecutive sweeps.
  void SweepMissingConnections();
  void AnnouncePresence();
  void RequestParticipants();
  bool SendToRoom(SignalingMessage message);

  void HandleParticipants(const SignalingMessage& message);
  void HandleUserJoined(const SignalingMessage& message);
  void HandleUserLeft(const SignalingMessage& message);
  void HandleMuteChanged(const SignalingMessage& message);
  void HandleReconnectionRequest(const SignalingMessage& message);
  void HandleRelayError(const SignalingMessage& message);

  const VoiceMeshConfig config_;
  webrtc::TaskQueueBase* const task_queue_;
  webrtc::Clock* const clock_;
  SignalingAdapter* const signaling_;

  VoiceSessionState state_;
  PeerConnectionRegistry registry_;
  ConnectionLifecycleManager lifecycle_;
  HealthMonitor health_;
  HeartbeatPublisher heartbeat_;
  GracePeriodController grace_;
  AudioLevelMonitor levels_;

  LocalAudioStream* local_stream_ = nullptr;
  bool presence_announced_ = false;
  webrtc::RepeatingTaskHandle sweep_task_;
  std::set<std::string> missing_since_last_sweep_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> rate_limit_safety_;
};
