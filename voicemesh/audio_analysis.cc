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

#include "audio_analysis.h"

#include <algorithm>
#include <cmath>
#include <utility>

std::mutex AudioAnalysisContext::instance_mutex_;
AudioAnalysisContext* AudioAnalysisContext::instance_ = nullptr;

LevelAnalyser::LevelAnalyser(AudioAnalysisContext* context,
                             std::string label,
                             rtc::scoped_refptr<webrtc::AudioTrackInterface> track)
    : context_(context),
      label_(std::move(label)),
      track_(std::move(track)),
      window_(kWindowSize, 0.0f) {
  if (track_) {
    track_->AddSink(this);
  }
}

LevelAnalyser::~LevelAnalyser() {
  Disconnect();
}

void LevelAnalyser::OnData(const void* audio_data,
                           int bits_per_sample,
                           int sample_rate,
                           size_t number_of_channels,
                           size_t number_of_frames,
                           std::optional<int64_t> /* absolute_capture_timestamp_ms */) {
  if (!audio_data || bits_per_sample != 16) {
    return;
  }

  const int16_t* samples = static_cast<const int16_t*>(audio_data);
  const size_t count = number_of_frames * number_of_channels;
  std::vector<float> converted(count);
  for (size_t i = 0; i < count; ++i) {
    converted[i] = samples[i] / 32768.0f;
  }
  AppendSamples(converted.data(), converted.size());
}

void LevelAnalyser::AppendSamples(const float* samples, size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < count; ++i) {
    window_[write_pos_] = samples[i];
    write_pos_ = (write_pos_ + 1) % kWindowSize;
  }
  filled_ = std::min(kWindowSize, filled_ + count);
}

float LevelAnalyser::Rms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (filled_ == 0)
    return 0.0f;

  double sum = 0.0;
  for (size_t i = 0; i < filled_; ++i) {
    sum += static_cast<double>(window_[i]) * window_[i];
  }
  return static_cast<float>(std::sqrt(sum / filled_));
}

void LevelAnalyser::Disconnect() {
  if (track_) {
    track_->RemoveSink(this);
    track_ = nullptr;
  }
  if (context_) {
    context_->Unregister(this);
    context_ = nullptr;
    APP_LOG(AS_VERBOSE) << "Level analyser disconnected: " << label_;
  }
}

void LevelAnalyser::DetachFromContext() {
  if (track_) {
    track_->RemoveSink(this);
    track_ = nullptr;
  }
  context_ = nullptr;
}

AudioAnalysisContext::AudioAnalysisContext() {
  APP_LOG(AS_INFO) << "Audio analysis context created";
}

AudioAnalysisContext::~AudioAnalysisContext() {
  APP_LOG(AS_INFO) << "Audio analysis context destroyed";
}

AudioAnalysisContext* AudioAnalysisContext::Get() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) {
    instance_ = new AudioAnalysisContext();
  }
  return instance_;
}

AudioAnalysisContext* AudioAnalysisContext::GetIfExists() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_;
}

void AudioAnalysisContext::Shutdown() {
  AudioAnalysisContext* context = nullptr;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    std::swap(context, instance_);
  }
  if (!context)
    return;

  std::set<LevelAnalyser*> survivors;
  {
    std::lock_guard<std::mutex> lock(context->mutex_);
    survivors.swap(context->analysers_);
  }
  if (!survivors.empty()) {
    APP_LOG(AS_WARNING) << "Disconnecting " << survivors.size()
                        << " analyser(s) left at shutdown";
  }
  for (LevelAnalyser* analyser : survivors) {
    analyser->DetachFromContext();
  }
  delete context;
}

std::unique_ptr<LevelAnalyser> AudioAnalysisContext::CreateAnalyser(
    const std::string& label,
    rtc::scoped_refptr<webrtc::AudioTrackInterface> track) {
  std::unique_ptr<LevelAnalyser> analyser(
      new LevelAnalyser(this, label, std::move(track)));
  std::lock_guard<std::mutex> lock(mutex_);
  analysers_.insert(analyser.get());
  return analyser;
}

size_t AudioAnalysisContext::live_analysers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return analysers_.size();
}

void AudioAnalysisContext::Unregister(LevelAnalyser* analyser) {
  std::lock_guard<std::mutex> lock(mutex_);
  analysers_.erase(analyser);
}
