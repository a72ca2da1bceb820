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

#include "voice_session_state.h"

#include <algorithm>

const VoiceParticipant* VoiceSessionState::FindParticipant(const std::string& user_id) const {
  for (const auto& participant : participants_) {
    if (participant.user_id == user_id)
      return &participant;
  }
  return nullptr;
}

VoiceParticipant* VoiceSessionState::MutableParticipant(const std::string& user_id) {
  for (auto& participant : participants_) {
    if (participant.user_id == user_id)
      return &participant;
  }
  return nullptr;
}

void VoiceSessionState::UpsertParticipant(const std::string& user_id,
                                          const std::string& username) {
  if (user_id.empty())
    return;

  if (VoiceParticipant* existing = MutableParticipant(user_id)) {
    if (username.empty() || existing->username == username)
      return;
    existing->username = username;
  } else {
    VoiceParticipant participant;
    participant.user_id = user_id;
    participant.username = username.empty() ? user_id : username;
    participants_.push_back(participant);
  }
  NotifyChanged();
}

bool VoiceSessionState::RemoveParticipant(const std::string& user_id) {
  auto it = std::remove_if(participants_.begin(), participants_.end(),
                           [&user_id](const VoiceParticipant& p) { return p.user_id == user_id; });
  if (it == participants_.end())
    return false;
  participants_.erase(it, participants_.end());
  NotifyChanged();
  return true;
}

void VoiceSessionState::SetParticipantMuted(const std::string& user_id, bool muted) {
  VoiceParticipant* participant = MutableParticipant(user_id);
  if (!participant || participant->is_muted == muted)
    return;
  participant->is_muted = muted;
  NotifyChanged();
}

void VoiceSessionState::SetParticipantAudio(const std::string& user_id, float level, bool muted) {
  VoiceParticipant* participant = MutableParticipant(user_id);
  if (!participant)
    return;
  if (participant->audio_level == level && participant->is_muted == muted)
    return;
  participant->audio_level = level;
  participant->is_muted = muted;
  NotifyChanged();
}

void VoiceSessionState::SetExplicitMute(const std::string& user_id, bool muted) {
  explicit_mutes_[user_id] = muted;
}

std::optional<bool> VoiceSessionState::ExplicitMute(const std::string& user_id) const {
  auto it = explicit_mutes_.find(user_id);
  if (it == explicit_mutes_.end())
    return std::nullopt;
  return it->second;
}

void VoiceSessionState::ForgetExplicitMute(const std::string& user_id) {
  explicit_mutes_.erase(user_id);
}

void VoiceSessionState::set_connecting(bool connecting) {
  if (is_connecting_ == connecting)
    return;
  is_connecting_ = connecting;
  NotifyChanged();
}

void VoiceSessionState::SetConnectionError(const std::string& error) {
  if (connection_error_ && *connection_error_ == error)
    return;
  connection_error_ = error;
  NotifyChanged();
}

void VoiceSessionState::ClearConnectionError() {
  if (!connection_error_)
    return;
  connection_error_.reset();
  NotifyChanged();
}

void VoiceSessionState::set_audio_enabled(bool enabled) {
  if (is_audio_enabled_ == enabled)
    return;
  is_audio_enabled_ = enabled;
  NotifyChanged();
}

void VoiceSessionState::set_has_local_stream(bool has_stream) {
  if (has_local_stream_ == has_stream)
    return;
  has_local_stream_ = has_stream;
  NotifyChanged();
}

void VoiceSessionState::Clear() {
  participants_.clear();
  explicit_mutes_.clear();
  is_connecting_ = false;
  connection_error_.reset();
  is_audio_enabled_ = false;
  has_local_stream_ = false;
  NotifyChanged();
}

void VoiceSessionState::NotifyChanged() {
  if (on_change_)
    on_change_();
}
