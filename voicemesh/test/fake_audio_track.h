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

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "api/media_stream_interface.h"
#include "api/scoped_refptr.h"
#include "rtc_base/ref_counted_object.h"

// Audio track without a source. Samples are pushed by the test.
class FakeAudioTrack : public webrtc::AudioTrackInterface {
 public:
  static rtc::scoped_refptr<FakeAudioTrack> Create(const std::string& id) {
    return rtc::make_ref_counted<FakeAudioTrack>(id);
  }

  explicit FakeAudioTrack(const std::string& id) : id_(id) {}

  std::string kind() const override { return kAudioKind; }
  std::string id() const override { return id_; }
  bool enabled() const override { return enabled_; }
  bool set_enabled(bool enable) override {
    enabled_ = enable;
    return true;
  }
  TrackState state() const override { return state_; }
  void End() { state_ = kEnded; }

  void RegisterObserver(webrtc::ObserverInterface* /* observer */) override {}
  void UnregisterObserver(webrtc::ObserverInterface* /* observer */) override {}

  webrtc::AudioSourceInterface* GetSource() const override { return nullptr; }
  void AddSink(webrtc::AudioTrackSinkInterface* sink) override { sinks_.insert(sink); }
  void RemoveSink(webrtc::AudioTrackSinkInterface* sink) override { sinks_.erase(sink); }
  size_t sink_count() const { return sinks_.size(); }

  // 16 bit mono at 48kHz.
  void PushSamples(const std::vector<int16_t>& samples) {
    for (webrtc::AudioTrackSinkInterface* sink : sinks_) {
      sink->OnData(samples.data(), 16, 48000, 1, samples.size(), std::nullopt);
    }
  }

  // A square wave of |amplitude| in [0, 1], its RMS equals |amplitude|.
  void PushTone(float amplitude, size_t count = 512) {
    std::vector<int16_t> samples(count);
    const int16_t peak = static_cast<int16_t>(amplitude * 32767.0f);
    for (size_t i = 0; i < count; ++i)
      samples[i] = (i % 2) ? peak : static_cast<int16_t>(-peak);
    PushSamples(samples);
  }

 private:
  const std::string id_;
  bool enabled_ = true;
  TrackState state_ = kLive;
  std::set<webrtc::AudioTrackSinkInterface*> sinks_;
};
