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
#include <memory>
#include <string>

#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "system_wrappers/include/clock.h"

#include "audio_analysis.h"
#include "local_audio_stream.h"
#include "mute_change_detector.h"
#include "peer_registry.h"
#include "voice_session_state.h"

// Samples speaking levels of every participant into VoiceSessionState and
// reports local mute transitions.
class AudioLevelMonitor {
 public:
  class Delegate {
   public:
    virtual ~Delegate() = default;
    // True once the new state reached the relay.
    virtual bool BroadcastMute(bool muted) = 0;
  };

  AudioLevelMonitor(webrtc::TaskQueueBase* task_queue,
                    webrtc::Clock* clock,
                    const std::string& self_user_id,
                    VoiceSessionState* state,
                    const PeerConnectionRegistry* registry,
                    Delegate* delegate,
                    webrtc::TimeDelta level_interval,
                    webrtc::TimeDelta mute_interval,
                    float silence_threshold);
  ~AudioLevelMonitor();

  // min(1, rms * 1.5)
  static float LevelFromRms(float rms);
  // 0.7 * previous + 0.3 * instant
  static float SmoothLevel(float previous, float instant);

  void Start();
  void Stop();
  bool running() const { return level_task_.Running(); }

  // Not owned. Null drops the local analyser.
  void SetLocalStream(LocalAudioStream* stream);
  LocalAudioStream* local_stream() const { return local_stream_; }
  bool HasEnabledLocalTrack() const;

  void SampleLevels();
  void PollMute();

  MuteChangeDetector& mute_detector() { return mute_detector_; }

  // Drops smoothing history, the local analyser and the mute baseline.
  void Reset();

 private:
  float InstantLevel(const std::string& user_id) const;

  webrtc::TaskQueueBase* const task_queue_;
  webrtc::Clock* const clock_;
  const std::string self_user_id_;
  VoiceSessionState* const state_;
  const PeerConnectionRegistry* const registry_;
  Delegate* const delegate_;
  const webrtc::TimeDelta level_interval_;
  const webrtc::TimeDelta mute_interval_;
  const float silence_threshold_;

  LocalAudioStream* local_stream_ = nullptr;
  std::unique_ptr<LevelAnalyser> local_analyser_;
  MuteChangeDetector mute_detector_;
  std::map<std::string, float> smoothed_;

  webrtc::RepeatingTaskHandle level_task_;
  webrtc::RepeatingTaskHandle mute_task_;
};
