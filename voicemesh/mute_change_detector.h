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
#include <optional>

// Turns a polled "local track enabled" flag into mute transitions. There is
// no native enabled-changed event, callers that get one can drop the polling
// and call MarkBroadcast() directly.
class MuteChangeDetector {
 public:
  // Returns true while an enabled local audio track exists.
  using EnabledQuery = std::function<bool()>;

  explicit MuteChangeDetector(EnabledQuery track_enabled);

  // The new mute state when it differs from the last broadcast one.
  // Nothing is reported until a baseline exists.
  std::optional<bool> Poll() const;

  void MarkBroadcast(bool muted) { last_broadcast_ = muted; }

  // Takes the current state as already broadcast.
  void ResetBaseline();
  void ClearBaseline() {
    last_broadcast_.reset();
    last_observed_.reset();
  }

  // True when |muted| differs from the value passed last time.
  bool Observe(bool muted);

  const std::optional<bool>& last_broadcast() const { return last_broadcast_; }

 private:
  EnabledQuery track_enabled_;
  std::optional<bool> last_broadcast_;
  std::optional<bool> last_observed_;
};
