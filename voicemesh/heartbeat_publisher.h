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

#include <string>

#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "system_wrappers/include/clock.h"

#include "peer_registry.h"
#include "signaling_adapter.h"

// Reports the state of every connection to the relay at a fixed period so
// peers can corroborate failures from both ends.
class HeartbeatPublisher {
 public:
  HeartbeatPublisher(webrtc::TaskQueueBase* task_queue,
                     webrtc::Clock* clock,
                     const PeerConnectionRegistry* registry,
                     SignalingAdapter* signaling,
                     std::string room_id,
                     std::string user_id,
                     webrtc::TimeDelta interval);
  ~HeartbeatPublisher();

  void Start();
  void Stop();
  bool running() const { return task_.Running(); }

  // False when there is nothing to report or the send failed.
  bool PublishNow();

  HealthSnapshot BuildSnapshot() const;

 private:
  webrtc::TaskQueueBase* const task_queue_;
  webrtc::Clock* const clock_;
  const PeerConnectionRegistry* const registry_;
  SignalingAdapter* const signaling_;
  const std::string room_id_;
  const std::string user_id_;
  const webrtc::TimeDelta interval_;

  webrtc::RepeatingTaskHandle task_;
};
