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

#include <string>

#include "api/units/time_delta.h"

// Default timings and limits of the voice mesh.
namespace MeshDefaults {

inline constexpr int kHealthCheckIntervalMs   = 15000;
inline constexpr int kHeartbeatIntervalMs     = 30000;
inline constexpr int kReconnectDelayMs        = 2000;
inline constexpr int kMaxReconnectAttempts    = 3;
inline constexpr int kGracePeriodMs           = 60000;
inline constexpr int kLevelSampleIntervalMs   = 200;
inline constexpr int kMutePollIntervalMs      = 200;
inline constexpr int kMissingConnectionIntervalMs = 2000;
inline constexpr int kMaxMeshConnections      = 9;
inline constexpr int kRateLimitRetrySeconds   = 15;

// Smoothed level under which a remote participant without an explicit mute
// message is reported as muted. Tunable, not a calibrated value.
inline constexpr float kSilenceThreshold      = 0.02f;

inline constexpr const char kDefaultRoom[]    = "room101";

} // namespace MeshDefaults

struct VoiceMeshConfig {
  std::string room_id = MeshDefaults::kDefaultRoom;
  std::string user_id;
  std::string username;
  bool can_transmit = true;

  webrtc::TimeDelta health_check_interval =
      webrtc::TimeDelta::Millis(MeshDefaults::kHealthCheckIntervalMs);
  webrtc::TimeDelta heartbeat_interval =
      webrtc::TimeDelta::Millis(MeshDefaults::kHeartbeatIntervalMs);
  webrtc::TimeDelta reconnect_delay =
      webrtc::TimeDelta::Millis(MeshDefaults::kReconnectDelayMs);
  int max_reconnect_attempts = MeshDefaults::kMaxReconnectAttempts;
  webrtc::TimeDelta grace_period =
      webrtc::TimeDelta::Millis(MeshDefaults::kGracePeriodMs);
  webrtc::TimeDelta level_sample_interval =
      webrtc::TimeDelta::Millis(MeshDefaults::kLevelSampleIntervalMs);
  webrtc::TimeDelta mute_poll_interval =
      webrtc::TimeDelta::Millis(MeshDefaults::kMutePollIntervalMs);
  webrtc::TimeDelta missing_connection_interval =
      webrtc::TimeDelta::Millis(MeshDefaults::kMissingConnectionIntervalMs);
  float silence_threshold = MeshDefaults::kSilenceThreshold;
  int max_mesh_connections = MeshDefaults::kMaxMeshConnections;
};
