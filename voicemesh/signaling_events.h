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

// -----------------------------------------------------------------------------
// Relay event names. A frame on the wire is "<event>:{json-payload}".
// -----------------------------------------------------------------------------
namespace Msg {

// Presence
inline constexpr const char kJoinVoice[]                 = "join_voice";
inline constexpr const char kLeaveVoice[]                = "leave_voice";
inline constexpr const char kRequestVoiceParticipants[]  = "request_voice_participants";
inline constexpr const char kVoiceParticipants[]         = "voice_participants";
inline constexpr const char kUserJoinedVoice[]           = "user_joined_voice";
inline constexpr const char kUserLeftVoice[]             = "user_left_voice";

// SDP / ICE negotiation
inline constexpr const char kVoiceOffer[]                = "voice_offer";
inline constexpr const char kVoiceAnswer[]               = "voice_answer";
inline constexpr const char kVoiceIceCandidate[]         = "voice_ice_candidate";

// State and health
inline constexpr const char kVoiceMuteChanged[]          = "voice_mute_changed";
inline constexpr const char kVoiceHeartbeat[]            = "voice_heartbeat";
inline constexpr const char kVoiceConnectionFailed[]     = "voice_connection_failed";
inline constexpr const char kVoiceReconnectionRequested[]= "voice_reconnection_requested";

// Relay errors (rate limiting and friends)
inline constexpr const char kError[]                     = "error";

// Pseudo message the websocket layer emits when the socket drops
inline constexpr const char kDisconnected[]              = "DISCONNECTED";

} // namespace Msg

namespace ErrorText {

inline constexpr const char kInitiateFailed[]     = "Failed to initiate voice call";
inline constexpr const char kAcceptFailed[]       = "Failed to establish voice connection";
inline constexpr const char kRateLimitMarker[]    = "Rate limit exceeded";

} // namespace ErrorText
