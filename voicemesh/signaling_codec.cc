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

#include "signaling_codec.h"

#include <memory>
#include <utility>

#include "options.h"
#include "signaling_events.h"

namespace {

struct EventName {
  SignalingType type;
  const char* name;
};

const EventName kEventNames[] = {
    {SignalingType::kJoinVoice, Msg::kJoinVoice},
    {SignalingType::kLeaveVoice, Msg::kLeaveVoice},
    {SignalingType::kRequestVoiceParticipants, Msg::kRequestVoiceParticipants},
    {SignalingType::kVoiceParticipants, Msg::kVoiceParticipants},
    {SignalingType::kUserJoinedVoice, Msg::kUserJoinedVoice},
    {SignalingType::kUserLeftVoice, Msg::kUserLeftVoice},
    {SignalingType::kVoiceOffer, Msg::kVoiceOffer},
    {SignalingType::kVoiceAnswer, Msg::kVoiceAnswer},
    {SignalingType::kVoiceIceCandidate, Msg::kVoiceIceCandidate},
    {SignalingType::kVoiceMuteChanged, Msg::kVoiceMuteChanged},
    {SignalingType::kVoiceHeartbeat, Msg::kVoiceHeartbeat},
    {SignalingType::kVoiceConnectionFailed, Msg::kVoiceConnectionFailed},
    {SignalingType::kVoiceReconnectionRequested, Msg::kVoiceReconnectionRequested},
    {SignalingType::kError, Msg::kError},
};

std::string getString(const Json::Value& params, const char* key) {
  if (params.isObject() && params.isMember(key) && params[key].isString())
    return params[key].asString();
  return std::string();
}

void trim(std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  size_t end = s.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
  } else {
    s = s.substr(start, end - start + 1);
  }
}

Json::Value descriptionToJson(const char* type, const std::string& sdp) {
  Json::Value desc;
  desc["type"] = type;
  desc["sdp"] = sdp;
  return desc;
}

// Accepts {type, sdp} objects as well as a bare SDP string.
std::string descriptionFromJson(const Json::Value& value) {
  if (value.isString())
    return value.asString();
  return getString(value, "sdp");
}

bool candidateFromJson(const Json::Value& value, IceCandidateInit* out) {
  if (!value.isObject() || !value.isMember("candidate") ||
      !value["candidate"].isString()) {
    return false;
  }
  out->candidate = value["candidate"].asString();
  out->sdp_mid = getString(value, "sdpMid");
  out->sdp_mline_index =
      value.isMember("sdpMLineIndex") && value["sdpMLineIndex"].isInt()
          ? value["sdpMLineIndex"].asInt()
          : 0;
  return true;
}

}  // namespace

const char* SignalingTypeName(SignalingType type) {
  for (const auto& entry : kEventNames) {
    if (entry.type == type)
      return entry.name;
  }
  return "unknown";
}

bool SignalingTypeFromName(const std::string& name, SignalingType& out) {
  for (const auto& entry : kEventNames) {
    if (name == entry.name) {
      out = entry.type;
      return true;
    }
  }
  return false;
}

bool ParseMessageLine(const std::string& message,
                      std::string& out_command,
                      Json::Value& out_params) {
  out_command.clear();
  out_params = Json::Value();

  // Event names never contain a colon; the payload starts after the first one.
  size_t idx = message.find(':');
  if (idx == std::string::npos) {
    out_command = message;
    trim(out_command);
    return true;
  }

  out_command = message.substr(0, idx);
  trim(out_command);
  std::string payload = message.substr(idx + 1);
  trim(payload);
  if (payload.empty())
    return true;
  if (payload.front() != '{')
    return false;

  Json::CharReaderBuilder builder;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(payload.data(), payload.data() + payload.size(),
                     &out_params, &errs)) {
    APP_LOG(AS_WARNING) << "Malformed signaling payload for " << out_command
                        << ": " << errs;
    return false;
  }
  return true;
}

bool EncodeSignalingMessage(const SignalingMessage& message, std::string* line) {
  Json::Value params(Json::objectValue);

  switch (message.type) {
    case SignalingType::kJoinVoice:
      if (message.room_id.empty() || message.user_id.empty())
        return false;
      params["roomId"] = message.room_id;
      params["userId"] = message.user_id;
      params["username"] = message.username;
      break;
    case SignalingType::kLeaveVoice:
      if (message.room_id.empty() || message.user_id.empty())
        return false;
      params["roomId"] = message.room_id;
      params["userId"] = message.user_id;
      break;
    case SignalingType::kRequestVoiceParticipants:
      if (message.room_id.empty())
        return false;
      params["roomId"] = message.room_id;
      break;
    case SignalingType::kVoiceParticipants: {
      Json::Value list(Json::arrayValue);
      for (const auto& participant : message.participants) {
        Json::Value entry;
        entry["userId"] = participant.user_id;
        entry["username"] = participant.username;
        entry["isMuted"] = participant.is_muted;
        list.append(entry);
      }
      params["participants"] = list;
      break;
    }
    case SignalingType::kUserJoinedVoice:
    case SignalingType::kUserLeftVoice:
      if (message.user_id.empty())
        return false;
      params["userId"] = message.user_id;
      params["username"] = message.username;
      break;
    case SignalingType::kVoiceOffer:
    case SignalingType::kVoiceAnswer: {
      if (message.sdp.empty() || message.target_user_id.empty())
        return false;
      bool is_offer = message.type == SignalingType::kVoiceOffer;
      params[is_offer ? "offer" : "answer"] =
          descriptionToJson(is_offer ? "offer" : "answer", message.sdp);
      params["targetUserId"] = message.target_user_id;
      params["fromUserId"] = message.from_user_id;
      params["roomId"] = message.room_id;
      break;
    }
    case SignalingType::kVoiceIceCandidate: {
      if (message.candidate.candidate.empty() || message.target_user_id.empty())
        return false;
      Json::Value candidate;
      candidate["candidate"] = message.candidate.candidate;
      candidate["sdpMid"] = message.candidate.sdp_mid;
      candidate["sdpMLineIndex"] = message.candidate.sdp_mline_index;
      params["candidate"] = candidate;
      params["targetUserId"] = message.target_user_id;
      params["fromUserId"] = message.from_user_id;
      params["roomId"] = message.room_id;
      break;
    }
    case SignalingType::kVoiceMuteChanged:
      if (message.user_id.empty())
        return false;
      params["roomId"] = message.room_id;
      params["userId"] = message.user_id;
      params["isMuted"] = message.is_muted;
      break;
    case SignalingType::kVoiceHeartbeat: {
      if (message.user_id.empty())
        return false;
      Json::Value states(Json::objectValue);
      for (const auto& [peer_id, report] : message.connection_states) {
        Json::Value state;
        state["connectionState"] = PeerConnectionStateName(report.connection_state);
        state["iceConnectionState"] = IceConnectionStateName(report.ice_connection_state);
        states[peer_id] = state;
      }
      params["roomId"] = message.room_id;
      params["userId"] = message.user_id;
      params["connectionStates"] = states;
      break;
    }
    case SignalingType::kVoiceConnectionFailed:
      if (message.from_user_id.empty())
        return false;
      params["fromUserId"] = message.from_user_id;
      params["roomId"] = message.room_id;
      break;
    case SignalingType::kVoiceReconnectionRequested:
      if (message.from_user_id.empty() || message.target_user_id.empty())
        return false;
      params["fromUserId"] = message.from_user_id;
      params["targetUserId"] = message.target_user_id;
      params["roomId"] = message.room_id;
      break;
    case SignalingType::kError:
      params["message"] = message.error_message;
      if (message.retry_after_seconds > 0)
        params["retryAfter"] = message.retry_after_seconds;
      break;
  }

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  *line = std::string(SignalingTypeName(message.type)) + ":" +
          Json::writeString(writer, params);
  return true;
}

bool DecodeSignalingMessage(const std::string& line, SignalingMessage* message) {
  std::string command;
  Json::Value params;
  if (!ParseMessageLine(line, command, params))
    return false;

  SignalingMessage out;
  if (!SignalingTypeFromName(command, out.type)) {
    APP_LOG(AS_VERBOSE) << "Ignoring unknown relay event: " << command;
    return false;
  }

  out.room_id = getString(params, "roomId");
  out.user_id = getString(params, "userId");
  out.username = getString(params, "username");
  out.from_user_id = getString(params, "fromUserId");
  out.target_user_id = getString(params, "targetUserId");

  switch (out.type) {
    case SignalingType::kJoinVoice:
    case SignalingType::kLeaveVoice:
    case SignalingType::kUserJoinedVoice:
    case SignalingType::kUserLeftVoice:
      if (out.user_id.empty())
        return false;
      break;
    case SignalingType::kRequestVoiceParticipants:
      break;
    case SignalingType::kVoiceParticipants: {
      if (!params.isMember("participants") || !params["participants"].isArray())
        return false;
      for (const auto& entry : params["participants"]) {
        ParticipantInfo participant;
        participant.user_id = getString(entry, "userId");
        if (!entry.isObject() || participant.user_id.empty()) {
          APP_LOG(AS_WARNING) << "Skipping participant entry without userId";
          continue;
        }
        participant.username = getString(entry, "username");
        participant.is_muted = entry.isMember("isMuted") && entry["isMuted"].isBool() &&
                               entry["isMuted"].asBool();
        out.participants.push_back(participant);
      }
      break;
    }
    case SignalingType::kVoiceOffer:
    case SignalingType::kVoiceAnswer: {
      const char* key = out.type == SignalingType::kVoiceOffer ? "offer" : "answer";
      if (!params.isMember(key) || out.from_user_id.empty())
        return false;
      out.sdp = descriptionFromJson(params[key]);
      if (out.sdp.empty())
        return false;
      break;
    }
    case SignalingType::kVoiceIceCandidate:
      if (out.from_user_id.empty() || !params.isMember("candidate") ||
          !candidateFromJson(params["candidate"], &out.candidate)) {
        return false;
      }
      break;
    case SignalingType::kVoiceMuteChanged:
      if (out.user_id.empty() || !params.isMember("isMuted") ||
          !params["isMuted"].isBool()) {
        return false;
      }
      out.is_muted = params["isMuted"].asBool();
      break;
    case SignalingType::kVoiceHeartbeat: {
      if (out.user_id.empty() || !params.isMember("connectionStates") ||
          !params["connectionStates"].isObject()) {
        return false;
      }
      const Json::Value& states = params["connectionStates"];
      for (const auto& peer_id : states.getMemberNames()) {
        PeerStateReport report;
        ParsePeerConnectionState(getString(states[peer_id], "connectionState"),
                                 report.connection_state);
        ParseIceConnectionState(getString(states[peer_id], "iceConnectionState"),
                                report.ice_connection_state);
        out.connection_states[peer_id] = report;
      }
      break;
    }
    case SignalingType::kVoiceConnectionFailed:
      if (out.from_user_id.empty())
        return false;
      break;
    case SignalingType::kVoiceReconnectionRequested:
      if (out.from_user_id.empty() || out.target_user_id.empty())
        return false;
      break;
    case SignalingType::kError:
      out.error_message = getString(params, "message");
      if (params.isObject() && params.isMember("retryAfter") && params["retryAfter"].isInt())
        out.retry_after_seconds = params["retryAfter"].asInt();
      break;
  }

  *message = std::move(out);
  return true;
}
