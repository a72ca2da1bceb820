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

#include "heartbeat_publisher.h"

#include <utility>

#include "options.h"

HeartbeatPublisher::HeartbeatPublisher(webrtc::TaskQueueBase* task_queue,
                                       webrtc::Clock* clock,
                                       const PeerConnectionRegistry* registry,
                                       SignalingAdapter* signaling,
                                       std::string room_id,
                                       std::string user_id,
                                       webrtc::TimeDelta interval)
    : task_queue_(task_queue),
      clock_(clock),
      registry_(registry),
      signaling_(signaling),
      room_id_(std::move(room_id)),
      user_id_(std::move(user_id)),
      interval_(interval) {}

HeartbeatPublisher::~HeartbeatPublisher() {
  Stop();
}

void HeartbeatPublisher::Start() {
  if (task_.Running())
    return;
  task_ = webrtc::RepeatingTaskHandle::DelayedStart(
      task_queue_, interval_,
      [this]() {
        PublishNow();
        return interval_;
      },
      webrtc::TaskQueueBase::DelayPrecision::kLow, clock_);
}

void HeartbeatPublisher::Stop() {
  task_.Stop();
}

HealthSnapshot HeartbeatPublisher::BuildSnapshot() const {
  HealthSnapshot snapshot;
  for (const std::string& peer_id : registry_->PeerIds()) {
    const PeerConnectionRecord* record = registry_->Get(peer_id);
    PeerStateReport report;
    report.connection_state = record->connection_state;
    report.ice_connection_state = record->ice_connection_state;
    snapshot[peer_id] = report;
  }
  return snapshot;
}

bool HeartbeatPublisher::PublishNow() {
  if (registry_->empty())
    return false;

  SignalingMessage message;
  message.type = SignalingType::kVoiceHeartbeat;
  message.room_id = room_id_;
  message.user_id = user_id_;
  message.connection_states = BuildSnapshot();

  if (!signaling_->Send(message)) {
    APP_LOG(AS_WARNING) << "Heartbeat not delivered";
    return false;
  }
  APP_LOG(AS_VERBOSE) << "Heartbeat sent for " << message.connection_states.size() << " peer(s)";
  return true;
}
