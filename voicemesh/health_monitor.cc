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

#include "health_monitor.h"

#include "options.h"

namespace {

bool IsHealthy(const PeerConnectionRecord& record) {
  return record.connection_state == PeerConnectionState::kConnected &&
         (record.ice_connection_state == IceConnectionState::kConnected ||
          record.ice_connection_state == IceConnectionState::kCompleted);
}

bool IsFailing(const PeerConnectionRecord& record) {
  return record.connection_state == PeerConnectionState::kFailed ||
         record.connection_state == PeerConnectionState::kDisconnected ||
         record.ice_connection_state == IceConnectionState::kFailed ||
         record.ice_connection_state == IceConnectionState::kDisconnected;
}

}  // namespace

HealthMonitor::HealthMonitor(webrtc::TaskQueueBase* task_queue,
                             webrtc::Clock* clock,
                             PeerConnectionRegistry* registry,
                             Delegate* delegate,
                             webrtc::TimeDelta check_interval,
                             webrtc::TimeDelta reconnect_delay,
                             int max_attempts)
    : task_queue_(task_queue),
      clock_(clock),
      registry_(registry),
      delegate_(delegate),
      check_interval_(check_interval),
      reconnect_delay_(reconnect_delay),
      max_attempts_(max_attempts),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()),
      reconnect_safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

HealthMonitor::~HealthMonitor() {
  Stop();
  safety_->SetNotAlive();
  reconnect_safety_->SetNotAlive();
}

void HealthMonitor::Start() {
  if (task_.Running())
    return;
  APP_LOG(AS_INFO) << "Health monitoring started, every " << check_interval_.ms() << "ms";
  task_ = webrtc::RepeatingTaskHandle::DelayedStart(
      task_queue_, check_interval_,
      [this]() {
        CheckAll();
        return check_interval_;
      },
      webrtc::TaskQueueBase::DelayPrecision::kLow, clock_);
}

void HealthMonitor::Stop() {
  if (!task_.Running())
    return;
  task_.Stop();
  APP_LOG(AS_INFO) << "Health monitoring stopped";
}

void HealthMonitor::CheckAll() {
  // Checks may dispose records, walk a snapshot of the ids.
  for (const std::string& peer_id : registry_->PeerIds()) {
    CheckPeer(peer_id);
  }
}

void HealthMonitor::CheckPeer(const std::string& peer_id) {
  PeerConnectionRecord* record = registry_->Get(peer_id);
  if (!record)
    return;

  record->last_health_check = clock_->CurrentTime();

  if (IsHealthy(*record)) {
    given_up_.erase(peer_id);
    if (attempts_.erase(peer_id)) {
      APP_LOG(AS_INFO) << "Connection to " << peer_id << " healthy again";
    }
    record->reconnect_attempts = 0;
    return;
  }
  if (!IsFailing(*record))
    return;

  const int attempts = attempts_[peer_id];
  APP_LOG(AS_WARNING) << "Connection issue with " << peer_id << " ("
                      << PeerConnectionStateName(record->connection_state) << "/"
                      << IceConnectionStateName(record->ice_connection_state) << ")";

  if (attempts < max_attempts_) {
    attempts_[peer_id] = attempts + 1;
    record->reconnect_attempts = attempts + 1;
    APP_LOG(AS_INFO) << "Reconnecting to " << peer_id << " (attempt " << attempts + 1 << "/"
                     << max_attempts_ << ") in " << reconnect_delay_.ms() << "ms";
    delegate_->DisposePeer(peer_id);
    ScheduleReconnect(peer_id);
    return;
  }

  APP_LOG(AS_ERROR) << "Max reconnection attempts exceeded for " << peer_id;
  attempts_.erase(peer_id);
  pending_reconnects_.erase(peer_id);
  suspended_reconnects_.erase(peer_id);
  given_up_.insert(peer_id);
  delegate_->DisposePeer(peer_id);
  delegate_->OnPeerConnectionLost(peer_id, attempts);
}

void HealthMonitor::OnPeerStateChanged(const std::string& peer_id) {
  const PeerConnectionRecord* record = registry_->Get(peer_id);
  if (!record || !running())
    return;
  if (record->connection_state != PeerConnectionState::kFailed &&
      record->ice_connection_state != IceConnectionState::kFailed) {
    return;
  }
  // Never dispose a link from inside its own callback.
  task_queue_->PostTask(webrtc::SafeTask(safety_, [this, peer_id]() {
    if (running())
      CheckPeer(peer_id);
  }));
}

void HealthMonitor::ScheduleReconnect(const std::string& peer_id) {
  const uint64_t generation = ++next_generation_;
  pending_reconnects_[peer_id] = generation;
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(reconnect_safety_,
                       [this, peer_id, generation]() { RunReconnect(peer_id, generation); }),
      reconnect_delay_);
}

void HealthMonitor::RunReconnect(const std::string& peer_id, uint64_t generation) {
  auto it = pending_reconnects_.find(peer_id);
  if (it == pending_reconnects_.end() || it->second != generation)
    return;
  pending_reconnects_.erase(it);

  if (registry_->Contains(peer_id)) {
    APP_LOG(AS_INFO) << "Connection to " << peer_id << " was repaired meanwhile, skipping reconnect";
    return;
  }

  delegate_->ReconnectPeer(peer_id);
  if (PeerConnectionRecord* record = registry_->Get(peer_id)) {
    record->reconnect_attempts = reconnect_attempts(peer_id);
  }
}

void HealthMonitor::CancelPendingReconnects() {
  if (!pending_reconnects_.empty()) {
    APP_LOG(AS_INFO) << "Cancelling " << pending_reconnects_.size() << " pending reconnect(s)";
  }
  pending_reconnects_.clear();
  reconnect_safety_->SetNotAlive();
  reconnect_safety_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
}

void HealthMonitor::SuspendPendingReconnects() {
  for (const auto& pending : pending_reconnects_)
    suspended_reconnects_.insert(pending.first);
  if (!suspended_reconnects_.empty()) {
    APP_LOG(AS_INFO) << "Holding " << suspended_reconnects_.size() << " reconnect(s) back";
  }
  CancelPendingReconnects();
}

void HealthMonitor::ResumePendingReconnects() {
  std::set<std::string> suspended;
  suspended.swap(suspended_reconnects_);
  for (const std::string& peer_id : suspended) {
    APP_LOG(AS_INFO) << "Rescheduling reconnect to " << peer_id;
    ScheduleReconnect(peer_id);
  }
}

void HealthMonitor::Forget(const std::string& peer_id) {
  attempts_.erase(peer_id);
  pending_reconnects_.erase(peer_id);
  suspended_reconnects_.erase(peer_id);
  given_up_.erase(peer_id);
}

void HealthMonitor::ForgetAll() {
  attempts_.clear();
  suspended_reconnects_.clear();
  given_up_.clear();
  CancelPendingReconnects();
}

int HealthMonitor::reconnect_attempts(const std::string& peer_id) const {
  auto it = attempts_.find(peer_id);
  return it == attempts_.end() ? 0 : it->second;
}

bool HealthMonitor::reconnect_pending(const std::string& peer_id) const {
  return pending_reconnects_.count(peer_id) != 0 || suspended_reconnects_.count(peer_id) != 0;
}
