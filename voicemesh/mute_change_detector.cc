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

#include "mute_change_detector.h"

#include <utility>

MuteChangeDetector::MuteChangeDetector(EnabledQuery track_enabled)
    : track_enabled_(std::move(track_enabled)) {}

std::optional<bool> MuteChangeDetector::Poll() const {
  if (!last_broadcast_)
    return std::nullopt;
  const bool muted = !track_enabled_();
  if (muted == *last_broadcast_)
    return std::nullopt;
  return muted;
}

void MuteChangeDetector::ResetBaseline() {
  last_broadcast_ = !track_enabled_();
}

bool MuteChangeDetector::Observe(bool muted) {
  if (last_observed_ == muted)
    return false;
  last_observed_ = muted;
  return true;
}
