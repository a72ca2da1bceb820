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

#include <map>
#include <string>
#include <vector>

#include <json/json.h>

#include "peer_link.h"

enum class SignalingType {
  kJoinVoice,
  kLeaveVoice,
  kRequestVoiceParticipants,
  kVoiceParticipants,
  kUserJoinedVoice,
  kUserLeftVoice,
  kVoiceOffer,
  kVoiceAnswer,
  kVoiceIceCandidate,
  kVoiceMuteChanged,
  kVoiceHeartbeat,
  kVoiceConnectionFailed,
  kVoiceReconnectionRequested,
  kError,
};

struct ParticipantInfo {
  std::string user_id;
  std::string username;
  bool is_muted = false;
};

struct PeerStateReport {
  PeerConnectionState connection_state = PeerConnectionState::kNew;
  IceConnectionState ice_connection_state = IceConnectionState::kNew;
};

// Map of peer id to its states, sent wholesale with every heartbeat.
using HealthSnapshot = std::map<std::string, PeerStateReport>;

// One relay message. Only the fields of |type| are meaningful.
struct SignalingMessage {
  SignalingType type = SignalingType::kError;

  std::string room_id;
  std::string user_id;
  std::string username;
  std::string from_user_id;
  std::string target_user_id;

  std::string sdp;             // voice_offer / voice_answer
  IceCandidateInit candidate;  // voice_ice_candidate
  bool is_muted = false;       // voice_mute_changed

  std::vector<ParticipantInfo> participants;  // voice_participants
  HealthSnapshot connection_states;           // voice_heartbeat

  std::string error_message;  // error
  int retry_after_seconds = 0;
};

const char* SignalingTypeName(SignalingType type);
bool SignalingTypeFromName(const std::string& name, SignalingType& out);

// "<event>:{json}". False when a mandatory field is missing.
bool EncodeSignalingMessage(const SignalingMessage& message, std::string* line);

// False for unknown events, malformed JSON or missing mandatory fields.
bool DecodeSignalingMessage(const std::string& line, SignalingMessage* message);

// Splits "COMMAND" or "COMMAND:{json}" into its parts. False when JSON is
// present but malformed.
bool ParseMessageLine(const std::string& message,
                      std::string& out_command,
                      Json::Value& out_params);
