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

#include "api/media_stream_interface.h"
#include "api/scoped_refptr.h"

// Handle to the microphone capture, acquired and released by the host.
class LocalAudioStream {
 public:
  virtual ~LocalAudioStream() = default;

  virtual rtc::scoped_refptr<webrtc::AudioTrackInterface> audio_track() const = 0;

  // False when there is no track, the track ended or the user disabled it.
  virtual bool HasEnabledAudioTrack() const = 0;
};

class TrackLocalAudioStream : public LocalAudioStream {
 public:
  explicit TrackLocalAudioStream(
      rtc::scoped_refptr<webrtc::AudioTrackInterface> track);

  rtc::scoped_refptr<webrtc::AudioTrackInterface> audio_track() const override {
    return track_;
  }
  bool HasEnabledAudioTrack() const override;

  // Mute and Unmute toggle the track, the same switch the host UI flips.
  void Mute();
  void Unmute();

 private:
  rtc::scoped_refptr<webrtc::AudioTrackInterface> track_;
};
