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

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"

#include "signaling_adapter.h"

// Decides what a relay outage means for the live peer connections.
//
//   kUp --accidental down--> kDownGrace --timer--> kTornDown
//    ^                           |
//    +-------- transport up -----+
//
// An intentional down goes straight to kTornDown. At most one grace timer
// exists at a time.
class GracePeriodController {
 public:
  enum class State {
    kUp,
    kDownGrace,
    kTornDown,
  };

  class Delegate {
   public:
    virtual ~Delegate() = default;
    virtual void SuspendMonitoring() = 0;
    virtual void ResumeMonitoring() = 0;
    virtual void ReannouncePresence() = 0;
    // Must release every connection before returning.
    virtual void TearDownSession() = 0;
  };

  GracePeriodController(webrtc::TaskQueueBase* task_queue,
                        Delegate* delegate,
                        webrtc::TimeDelta grace_period);
  ~GracePeriodController();

  void OnTransportDown(DisconnectKind kind);

  // True when this ended a grace period.
  bool OnTransportUp();

  void TearDownNow();

  // Leaves kTornDown when a new session starts.
  void Rearm();

  State state() const { return state_; }
  bool timer_pending() const { return state_ == State::kDownGrace; }

 private:
  void CancelTimer();
  void OnGraceExpired();

  webrtc::TaskQueueBase* const task_queue_;
  Delegate* const delegate_;
  const webrtc::TimeDelta grace_period_;

  State state_ = State::kUp;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> timer_safety_;
};

const char* GraceStateName(GracePeriodController::State state);
