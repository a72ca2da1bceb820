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

#include "local_audio_stream.h"

#include <utility>

TrackLocalAudioStream::TrackLocalAudioStream(
    rtc::scoped_refptr<webrtc::AudioTrackInterface> track)
    : track_(std::move(track)) {}

bool TrackLocalAudioStream::HasEnabledAudioTrack() const {
  return track_ && track_->enabled() &&
         track_->state() == webrtc::MediaStreamTrackInterface::kLive;
}

void TrackLocalAudioStream::Mute() {
  if (track_) {
    track_->set_enabled(false);
  }
}

void TrackLocalAudioStream::Unmute() {
  if (track_) {
    track_->set_enabled(true);
  }
}
