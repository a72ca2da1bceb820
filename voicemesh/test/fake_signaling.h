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
#include <vector>

#include "signaling_adapter.h"

// In-memory relay. Every sent message must encode, like on the wire.
class FakeSignaling : public SignalingAdapter {
 public:
  bool Send(const SignalingMessage& message) override {
    if (!connected_)
      return false;
    std::string line;
    if (!EncodeSignalingMessage(message, &line))
      return false;
    sent_.push_back(message);
    return true;
  }
  bool IsConnected() const override { return connected_; }
  void SetObserver(SignalingObserver* observer) override { observer_ = observer; }

  void set_connected(bool connected) { connected_ = connected; }

  void SimulateUp() {
    connected_ = true;
    if (observer_)
      observer_->OnTransportUp();
  }
  void SimulateDown(DisconnectKind kind) {
    connected_ = false;
    if (observer_)
      observer_->OnTransportDown(kind);
  }
  void Deliver(const SignalingMessage& message) {
    if (observer_)
      observer_->OnSignalingMessage(message);
  }

  const std::vector<SignalingMessage>& sent() const { return sent_; }
  void ClearSent() { sent_.clear(); }

  int Count(SignalingType type) const {
    int count = 0;
    for (const SignalingMessage& message : sent_) {
      if (message.type == type)
        count++;
    }
    return count;
  }

  const SignalingMessage* Last(SignalingType type) const {
    for (auto it = sent_.rbegin(); it != sent_.rend(); ++it) {
      if (it->type == type)
        return &*it;
    }
    return nullptr;
  }

  SignalingObserver* observer() const { return observer_; }

 private:
  bool connected_ = true;
  SignalingObserver* observer_ = nullptr;
  std::vector<SignalingMessage> sent_;
};
