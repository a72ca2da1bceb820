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

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "api/media_stream_interface.h"
#include "api/scoped_refptr.h"

#include "options.h"

class AudioAnalysisContext;

// Taps one audio track and keeps its most recent samples for level
// measurement. Created only through AudioAnalysisContext::CreateAnalyser().
class VOICEMESH_API LevelAnalyser : public webrtc::AudioTrackSinkInterface {
 public:
  static constexpr size_t kWindowSize = 512;

  ~LevelAnalyser() override;

  // webrtc::AudioTrackSinkInterface, audio thread.
  void OnData(const void* audio_data,
              int bits_per_sample,
              int sample_rate,
              size_t number_of_channels,
              size_t number_of_frames,
              std::optional<int64_t> absolute_capture_timestamp_ms) override;

  // Samples normalized to [-1, 1].
  void AppendSamples(const float* samples, size_t count);

  // Root mean square over the current window, 0 before any audio arrived.
  float Rms() const;

  // Stops receiving audio and leaves the context. Idempotent.
  void Disconnect();
  bool connected() const { return context_ != nullptr; }

  const std::string& label() const { return label_; }

 private:
  friend class AudioAnalysisContext;

  LevelAnalyser(AudioAnalysisContext* context,
                std::string label,
                rtc::scoped_refptr<webrtc::AudioTrackInterface> track);

  // Context teardown path; the context already forgot us.
  void DetachFromContext();

  AudioAnalysisContext* context_;
  const std::string label_;
  rtc::scoped_refptr<webrtc::AudioTrackInterface> track_;

  mutable std::mutex mutex_;
  std::vector<float> window_;
  size_t write_pos_ = 0;
  size_t filled_ = 0;
};

// The one audio processing context of the process. Lazily created on first
// Get(), destroyed by Shutdown(); every analyser is its child.
class VOICEMESH_API AudioAnalysisContext {
 public:
  static AudioAnalysisContext* Get();
  static AudioAnalysisContext* GetIfExists();

  // Disconnects analysers still alive, then destroys the context.
  static void Shutdown();

  // |track| may be null; samples are then fed with AppendSamples().
  std::unique_ptr<LevelAnalyser> CreateAnalyser(
      const std::string& label,
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track);

  size_t live_analysers() const;

 private:
  friend class LevelAnalyser;

  AudioAnalysisContext();
  ~AudioAnalysisContext();

  AudioAnalysisContext(const AudioAnalysisContext&) = delete;
  AudioAnalysisContext& operator=(const AudioAnalysisContext&) = delete;

  void Unregister(LevelAnalyser* analyser);

  mutable std::mutex mutex_;
  std::set<LevelAnalyser*> analysers_;

  static std::mutex instance_mutex_;
  static AudioAnalysisContext* instance_;
};
