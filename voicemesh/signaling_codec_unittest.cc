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

#include <string>

#include <gtest/gtest.h>
#include <json/json.h>

#include "signaling_events.h"

namespace {

Json::Value PayloadOf(const std::string& line) {
  std::string command;
  Json::Value params;
  EXPECT_TRUE(ParseMessageLine(line, command, params));
  return params;
}

std::string CommandOf(const std::string& line) {
  std::string command;
  Json::Value params;
  ParseMessageLine(line, command, params);
  return command;
}

}  // namespace

TEST(SignalingCodecTest, EventNamesRoundTrip) {
  SignalingType type;
  ASSERT_TRUE(SignalingTypeFromName("voice_reconnection_requested", type));
  EXPECT_EQ(type, SignalingType::kVoiceReconnectionRequested);
  EXPECT_STREQ(SignalingTypeName(SignalingType::kVoiceHeartbeat), Msg::kVoiceHeartbeat);
  EXPECT_FALSE(SignalingTypeFromName("voice_dance", type));
}

TEST(SignalingCodecTest, ParseMessageLineSplitsAtFirstColon) {
  std::string command;
  Json::Value params;
  ASSERT_TRUE(ParseMessageLine("voice_offer:{\"sdp\":\"v=0 a:b\"}", command, params));
  EXPECT_EQ(command, "voice_offer");
  EXPECT_EQ(params["sdp"].asString(), "v=0 a:b");

  ASSERT_TRUE(ParseMessageLine("request_voice_participants", command, params));
  EXPECT_EQ(command, "request_voice_participants");
  EXPECT_TRUE(params.isNull());

  EXPECT_FALSE(ParseMessageLine("voice_offer:not-json", command, params));
  EXPECT_FALSE(ParseMessageLine("voice_offer:{\"sdp\":", command, params));
}

TEST(SignalingCodecTest, EncodeJoinVoice) {
  SignalingMessage message;
  message.type = SignalingType::kJoinVoice;
  message.room_id = "room101";
  message.user_id = "alice";
  message.username = "Alice";

  std::string line;
  ASSERT_TRUE(EncodeSignalingMessage(message, &line));
  EXPECT_EQ(CommandOf(line), "join_voice");
  Json::Value params = PayloadOf(line);
  EXPECT_EQ(params["roomId"].asString(), "room101");
  EXPECT_EQ(params["userId"].asString(), "alice");
  EXPECT_EQ(params["username"].asString(), "Alice");
}

TEST(SignalingCodecTest, EncodeRefusesMissingMandatoryFields) {
  std::string line;

  SignalingMessage join;
  join.type = SignalingType::kJoinVoice;
  join.room_id = "room101";
  EXPECT_FALSE(EncodeSignalingMessage(join, &line));

  SignalingMessage offer;
  offer.type = SignalingType::kVoiceOffer;
  offer.sdp = "v=0";
  EXPECT_FALSE(EncodeSignalingMessage(offer, &line));

  SignalingMessage candidate;
  candidate.type = SignalingType::kVoiceIceCandidate;
  candidate.target_user_id = "bob";
  EXPECT_FALSE(EncodeSignalingMessage(candidate, &line));

  SignalingMessage request;
  request.type = SignalingType::kRequestVoiceParticipants;
  EXPECT_FALSE(EncodeSignalingMessage(request, &line));

  SignalingMessage reconnect;
  reconnect.type = SignalingType::kVoiceReconnectionRequested;
  reconnect.from_user_id = "alice";
  EXPECT_FALSE(EncodeSignalingMessage(reconnect, &line));
}

TEST(SignalingCodecTest, OfferCarriesTypedDescription) {
  SignalingMessage message;
  message.type = SignalingType::kVoiceOffer;
  message.room_id = "room101";
  message.from_user_id = "alice";
  message.target_user_id = "bob";
  message.sdp = "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\n";

  std::string line;
  ASSERT_TRUE(EncodeSignalingMessage(message, &line));
  Json::Value params = PayloadOf(line);
  EXPECT_EQ(params["offer"]["type"].asString(), "offer");
  EXPECT_EQ(params["offer"]["sdp"].asString(), message.sdp);
  EXPECT_EQ(params["targetUserId"].asString(), "bob");

  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(line, &decoded));
  EXPECT_EQ(decoded.type, SignalingType::kVoiceOffer);
  EXPECT_EQ(decoded.sdp, message.sdp);
  EXPECT_EQ(decoded.from_user_id, "alice");
  EXPECT_EQ(decoded.target_user_id, "bob");
}

TEST(SignalingCodecTest, DecodeAnswerAcceptsBareSdpString) {
  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(
      "voice_answer:{\"answer\":\"v=0\",\"fromUserId\":\"bob\",\"targetUserId\":\"alice\"}",
      &decoded));
  EXPECT_EQ(decoded.type, SignalingType::kVoiceAnswer);
  EXPECT_EQ(decoded.sdp, "v=0");

  EXPECT_FALSE(DecodeSignalingMessage("voice_answer:{\"answer\":\"v=0\"}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("voice_answer:{\"fromUserId\":\"bob\"}", &decoded));
}

TEST(SignalingCodecTest, IceCandidateFields) {
  SignalingMessage message;
  message.type = SignalingType::kVoiceIceCandidate;
  message.from_user_id = "alice";
  message.target_user_id = "bob";
  message.candidate.candidate = "candidate:1 1 udp 2122260223 10.0.0.2 50000 typ host";
  message.candidate.sdp_mid = "0";
  message.candidate.sdp_mline_index = 0;

  std::string line;
  ASSERT_TRUE(EncodeSignalingMessage(message, &line));
  Json::Value params = PayloadOf(line);
  EXPECT_EQ(params["candidate"]["sdpMid"].asString(), "0");
  EXPECT_EQ(params["candidate"]["sdpMLineIndex"].asInt(), 0);

  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(line, &decoded));
  EXPECT_EQ(decoded.candidate.candidate, message.candidate.candidate);

  EXPECT_FALSE(DecodeSignalingMessage(
      "voice_ice_candidate:{\"fromUserId\":\"alice\",\"candidate\":\"raw\"}", &decoded));
}

TEST(SignalingCodecTest, DecodeParticipantsSkipsEntriesWithoutUserId) {
  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(
      "voice_participants:{\"roomId\":\"room101\",\"participants\":["
      "{\"userId\":\"alice\",\"username\":\"Alice\",\"isMuted\":true},"
      "{\"username\":\"ghost\"},"
      "{\"userId\":\"bob\"}]}",
      &decoded));
  ASSERT_EQ(decoded.participants.size(), 2u);
  EXPECT_EQ(decoded.participants[0].user_id, "alice");
  EXPECT_TRUE(decoded.participants[0].is_muted);
  EXPECT_EQ(decoded.participants[1].user_id, "bob");
  EXPECT_FALSE(decoded.participants[1].is_muted);

  EXPECT_FALSE(DecodeSignalingMessage("voice_participants:{\"roomId\":\"room101\"}", &decoded));
}

TEST(SignalingCodecTest, MuteChangedNeedsBooleanFlag) {
  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(
      "voice_mute_changed:{\"userId\":\"bob\",\"isMuted\":false}", &decoded));
  EXPECT_FALSE(decoded.is_muted);
  EXPECT_FALSE(DecodeSignalingMessage(
      "voice_mute_changed:{\"userId\":\"bob\",\"isMuted\":\"yes\"}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("voice_mute_changed:{\"isMuted\":true}", &decoded));
}

TEST(SignalingCodecTest, HeartbeatReportsEveryPeer) {
  SignalingMessage message;
  message.type = SignalingType::kVoiceHeartbeat;
  message.room_id = "room101";
  message.user_id = "alice";
  message.connection_states["bob"] = {PeerConnectionState::kConnected,
                                      IceConnectionState::kCompleted};
  message.connection_states["carol"] = {PeerConnectionState::kFailed,
                                        IceConnectionState::kFailed};

  std::string line;
  ASSERT_TRUE(EncodeSignalingMessage(message, &line));
  Json::Value params = PayloadOf(line);
  EXPECT_EQ(params["connectionStates"]["bob"]["connectionState"].asString(), "connected");
  EXPECT_EQ(params["connectionStates"]["carol"]["iceConnectionState"].asString(), "failed");

  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(line, &decoded));
  ASSERT_EQ(decoded.connection_states.size(), 2u);
  EXPECT_EQ(decoded.connection_states["bob"].ice_connection_state,
            IceConnectionState::kCompleted);
  EXPECT_EQ(decoded.connection_states["carol"].connection_state, PeerConnectionState::kFailed);
}

TEST(SignalingCodecTest, ErrorWithRetryAfter) {
  SignalingMessage decoded;
  ASSERT_TRUE(DecodeSignalingMessage(
      "error:{\"message\":\"Rate limit exceeded\",\"retryAfter\":30}", &decoded));
  EXPECT_EQ(decoded.type, SignalingType::kError);
  EXPECT_EQ(decoded.error_message, "Rate limit exceeded");
  EXPECT_EQ(decoded.retry_after_seconds, 30);

  ASSERT_TRUE(DecodeSignalingMessage("error:{\"message\":\"nope\"}", &decoded));
  EXPECT_EQ(decoded.retry_after_seconds, 0);
}

TEST(SignalingCodecTest, DecodeRejectsUnknownAndIncomplete) {
  SignalingMessage decoded;
  EXPECT_FALSE(DecodeSignalingMessage("voice_dance:{\"userId\":\"a\"}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("user_joined_voice:{}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("user_left_voice", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("voice_connection_failed:{\"roomId\":\"r\"}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage(
      "voice_reconnection_requested:{\"fromUserId\":\"a\"}", &decoded));
  EXPECT_FALSE(DecodeSignalingMessage("voice_heartbeat:{\"userId\":\"a\"}", &decoded));
}
