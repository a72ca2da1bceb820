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

#include "grace_period.h"

#include "options.h"

const char* GraceStateName(GracePeriodController::State state) {
  switch (state) {
    case GracePeriodController::State::kUp:
      return "transport-up";
    case GracePeriodController::State::kDownGrace:
      return "transport-down-grace";
    case GracePeriodController::State::kTornDown:
      return "torn-down";
  }
  return "unknown";
}

GracePeriodController::GracePeriodController(webrtc::TaskQueueBase* task_queue,
                                             Delegate* delegate,
                                             webrtc::TimeDelta grace_period)
    : task_queue_(task_queue), delegate_(delegate), grace_period_(grace_period) {}

GracePeriodController::~GracePeriodController() {
  CancelTimer();
}

void GracePeriodController::OnTransportDown(DisconnectKind kind) {
  if (kind == DisconnectKind::kIntentional) {
    APP_LOG(AS_INFO) << "Intentional disconnect, tearing down voice session";
    TearDownNow();
    return;
  }

  switch (state_) {
    case State::kDownGrace:
      APP_LOG(AS_INFO) << "Transport down again during grace period, timer keeps running";
      return;
    case State::kTornDown:
      return;
    case State::kUp:
      break;
  }

  APP_LOG(AS_WARNING) << "Signaling transport lost, keeping peer connections for "
                      << grace_period_.ms() << "ms";
  state_ = State::kDownGrace;
  delegate_->SuspendMonitoring();

  timer_safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  task_queue_->PostDelayedTask(webrtc::SafeTask(timer_safety_, [this]() { OnGraceExpired(); }),
                               grace_period_);
}

bool GracePeriodController::OnTransportUp() {
  if (state_ != State::kDownGrace)
    return false;

  APP_LOG(AS_INFO) << "Signaling transport back within grace period";
  CancelTimer();
  state_ = State::kUp;
  delegate_->ResumeMonitoring();
  delegate_->ReannouncePresence();
  return true;
}

void GracePeriodController::TearDownNow() {
  CancelTimer();
  if (state_ == State::kTornDown)
    return;
  state_ = State::kTornDown;
  delegate_->TearDownSession();
}

void GracePeriodController::Rearm() {
  if (state_ == State::kTornDown) {
    state_ = State::kUp;
  }
}

void GracePeriodController::CancelTimer() {
  if (timer_safety_) {
    timer_safety_->SetNotAlive();
    timer_safety_ = nullptr;
  }
}

void GracePeriodController::OnGraceExpired() {
  timer_safety_ = nullptr;
  if (state_ != State::kDownGrace)
    return;
  APP_LOG(AS_WARNING) << "Grace period expired, tearing down voice session";
  state_ = State::kTornDown;
  delegate_->TearDownSession();
}
