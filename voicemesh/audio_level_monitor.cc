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

#include "audio_level_monitor.h"

#include <algorithm>
#include <vector>

#include "options.h"

namespace {

const float kHeadroomScale = 1.5f;
const float kSmoothingPrevious = 0.7f;
const float kSmoothingInstant = 0.3f;

}  // namespace

AudioLevelMonitor::AudioLevelMonitor(webrtc::TaskQueueBase* task_queue,
                                     webrtc::Clock* clock,
                                     const std::string& self_user_id,
                                     VoiceSessionState* state,
                                     const PeerConnectionRegistry* registry,
                                     Delegate* delegate,
                                     webrtc::TimeDelta level_interval,
                                     webrtc::TimeDelta mute_interval,
                                     float silence_threshold)
    : task_queue_(task_queue),
      clock_(clock),
      self_user_id_(self_user_id),
      state_(state),
      registry_(registry),
      delegate_(delegate),
      level_interval_(level_interval),
      mute_interval_(mute_interval),
      silence_threshold_(silence_threshold),
      mute_detector_([this]() { return HasEnabledLocalTrack(); }) {}

AudioLevelMonitor::~AudioLevelMonitor() {
  Stop();
}

float AudioLevelMonitor::LevelFromRms(float rms) {
  return std::min(1.0f, std::max(0.0f, rms * kHeadroomScale));
}

float AudioLevelMonitor::SmoothLevel(float previous, float instant) {
  return kSmoothingPrevious * previous + kSmoothingInstant * instant;
}

void AudioLevelMonitor::Start() {
  if (!level_task_.Running()) {
    level_task_ = webrtc::RepeatingTaskHandle::DelayedStart(
        task_queue_, level_interval_,
        [this]() {
          SampleLevels();
          return level_interval_;
        },
        webrtc::TaskQueueBase::DelayPrecision::kLow, clock_);
  }
  if (!mute_task_.Running()) {
    mute_task_ = webrtc::RepeatingTaskHandle::DelayedStart(
        task_queue_, mute_interval_,
        [this]() {
          PollMute();
          return mute_interval_;
        },
        webrtc::TaskQueueBase::DelayPrecision::kLow, clock_);
  }
}

void AudioLevelMonitor::Stop() {
  level_task_.Stop();
  mute_task_.Stop();
}

void AudioLevelMonitor::SetLocalStream(LocalAudioStream* stream) {
  local_analyser_.reset();
  smoothed_.erase(self_user_id_);
  local_stream_ = stream;
  if (!local_stream_) {
    mute_detector_.ClearBaseline();
    return;
  }
  local_analyser_ =
      AudioAnalysisContext::Get()->CreateAnalyser("local", local_stream_->audio_track());
}

bool AudioLevelMonitor::HasEnabledLocalTrack() const {
  return local_stream_ && local_stream_->HasEnabledAudioTrack();
}

float AudioLevelMonitor::InstantLevel(const std::string& user_id) const {
  if (user_id == self_user_id_) {
    return local_analyser_ ? LevelFromRms(local_analyser_->Rms()) : 0.0f;
  }
  const PeerConnectionRecord* record = registry_->Get(user_id);
  if (!record || !record->remote_audio_sink)
    return 0.0f;
  return LevelFromRms(record->remote_audio_sink->Rms());
}

void AudioLevelMonitor::SampleLevels() {
  std::vector<std::string> user_ids;
  for (const VoiceParticipant& participant : state_->participants())
    user_ids.push_back(participant.user_id);

  std::map<std::string, float> smoothed;
  for (const std::string& user_id : user_ids) {
    auto it = smoothed_.find(user_id);
    const float previous = it == smoothed_.end() ? 0.0f : it->second;
    const float level = SmoothLevel(previous, InstantLevel(user_id));
    smoothed[user_id] = level;

    bool muted;
    if (user_id == self_user_id_) {
      muted = !HasEnabledLocalTrack();
    } else if (std::optional<bool> explicit_mute = state_->ExplicitMute(user_id)) {
      muted = *explicit_mute;
    } else {
      muted = level < silence_threshold_;
    }
    state_->SetParticipantAudio(user_id, level, muted);
  }
  // Participants that left lose their history.
  smoothed_.swap(smoothed);
}

void AudioLevelMonitor::PollMute() {
  if (!local_stream_)
    return;
  std::optional<bool> muted = mute_detector_.Poll();
  if (!muted)
    return;
  if (mute_detector_.Observe(*muted))
    APP_LOG(AS_INFO) << "Local audio " << (*muted ? "muted" : "unmuted");
  if (delegate_->BroadcastMute(*muted)) {
    mute_detector_.MarkBroadcast(*muted);
  }
}

void AudioLevelMonitor::Reset() {
  local_analyser_.reset();
  local_stream_ = nullptr;
  smoothed_.clear();
  mute_detector_.ClearBaseline();
}
