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
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct VoiceParticipant {
  std::string user_id;
  std::string username;
  bool is_muted = true;
  float audio_level = 0.0f;  // [0, 1]
};

// Read model of the voice session. Participants keep announcement order.
class VoiceSessionState {
 public:
  using ChangeCallback = std::function<void()>;

  const std::vector<VoiceParticipant>& participants() const { return participants_; }
  const VoiceParticipant* FindParticipant(const std::string& user_id) const;

  // Adds |user_id| or refreshes its name. An empty |username| keeps the
  // known one; level and mute flag are never touched.
  void UpsertParticipant(const std::string& user_id, const std::string& username);
  bool RemoveParticipant(const std::string& user_id);
  void SetParticipantMuted(const std::string& user_id, bool muted);
  void SetParticipantAudio(const std::string& user_id, float level, bool muted);

  // Mute states received from the relay, per remote user.
  void SetExplicitMute(const std::string& user_id, bool muted);
  std::optional<bool> ExplicitMute(const std::string& user_id) const;
  void ForgetExplicitMute(const std::string& user_id);

  bool is_connecting() const { return is_connecting_; }
  void set_connecting(bool connecting);

  const std::optional<std::string>& connection_error() const { return connection_error_; }
  void SetConnectionError(const std::string& error);
  void ClearConnectionError();

  bool can_transmit() const { return can_transmit_; }
  void set_can_transmit(bool can_transmit) { can_transmit_ = can_transmit; }

  bool is_audio_enabled() const { return is_audio_enabled_; }
  void set_audio_enabled(bool enabled);

  bool has_local_stream() const { return has_local_stream_; }
  void set_has_local_stream(bool has_stream);

  void SetChangeCallback(ChangeCallback callback) { on_change_ = std::move(callback); }

  // Participants, mute cache, error and local flags. |can_transmit| is a
  // property of the node and survives.
  void Clear();

 private:
  VoiceParticipant* MutableParticipant(const std::string& user_id);
  void NotifyChanged();

  std::vector<VoiceParticipant> participants_;
  std::map<std::string, bool> explicit_mutes_;

  bool is_connecting_ = false;
  std::optional<std::string> connection_error_;
  bool can_transmit_ = true;
  bool is_audio_enabled_ = false;
  bool has_local_stream_ = false;

  ChangeCallback on_change_;
};
