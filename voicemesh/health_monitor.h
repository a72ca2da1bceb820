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
#include <map>
#include <set>
#include <string>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "rtc_base/task_utils/repeating_task.h"
#include "system_wrappers/include/clock.h"

#include "peer_registry.h"

// Watchdog over every record of the registry. A failed or disconnected peer
// is disposed and re-initiated after |reconnect_delay|, at most
// |max_attempts| times in a row; then it is given up for good.
class HealthMonitor {
 public:
  class Delegate {
   public:
    virtual ~Delegate() = default;
    virtual void DisposePeer(const std::string& peer_id) = 0;
    virtual void ReconnectPeer(const std::string& peer_id) = 0;
    // Terminal failure, the record is already gone.
    virtual void OnPeerConnectionLost(const std::string& peer_id, int attempts) = 0;
  };

  HealthMonitor(webrtc::TaskQueueBase* task_queue,
                webrtc::Clock* clock,
                PeerConnectionRegistry* registry,
                Delegate* delegate,
                webrtc::TimeDelta check_interval,
                webrtc::TimeDelta reconnect_delay,
                int max_attempts);
  ~HealthMonitor();

  void Start();
  void Stop();
  bool running() const { return task_.Running(); }

  void CheckAll();
  void CheckPeer(const std::string& peer_id);

  // Push path. A terminal "failed" is checked right away, anything else
  // waits for the next tick.
  void OnPeerStateChanged(const std::string& peer_id);

  void CancelPendingReconnects();

  // Holds scheduled reconnects back while the relay is unreachable. Resume
  // schedules each of them again with a full |reconnect_delay|.
  void SuspendPendingReconnects();
  void ResumePendingReconnects();

  // Drops the attempt counter and any scheduled reconnect of |peer_id|.
  void Forget(const std::string& peer_id);
  void ForgetAll();

  int reconnect_attempts(const std::string& peer_id) const;
  // Scheduled or suspended.
  bool reconnect_pending(const std::string& peer_id) const;
  bool gave_up(const std::string& peer_id) const { return given_up_.count(peer_id) != 0; }

 private:
  void ScheduleReconnect(const std::string& peer_id);
  void RunReconnect(const std::string& peer_id, uint64_t generation);

  webrtc::TaskQueueBase* const task_queue_;
  webrtc::Clock* const clock_;
  PeerConnectionRegistry* const registry_;
  Delegate* const delegate_;
  const webrtc::TimeDelta check_interval_;
  const webrtc::TimeDelta reconnect_delay_;
  const int max_attempts_;

  webrtc::RepeatingTaskHandle task_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> reconnect_safety_;

  // Outlive the records, which are disposed between attempts.
  std::map<std::string, int> attempts_;
  std::map<std::string, uint64_t> pending_reconnects_;
  std::set<std::string> suspended_reconnects_;
  // No automatic attempt until the peer rejoins or recovers on its own.
  std::set<std::string> given_up_;
  uint64_t next_generation_ = 0;
};
