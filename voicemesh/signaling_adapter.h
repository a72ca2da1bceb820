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

#include "signaling_codec.h"

enum class DisconnectKind {
  kAccidental,
  kIntentional,
};

// Everything is delivered on the session task queue.
class SignalingObserver {
 public:
  virtual ~SignalingObserver() = default;

  virtual void OnSignalingMessage(const SignalingMessage& message) = 0;
  virtual void OnTransportUp() = 0;
  virtual void OnTransportDown(DisconnectKind kind) = 0;
};

// Room scoped pub/sub channel to the relay. Never carries media.
class SignalingAdapter {
 public:
  virtual ~SignalingAdapter() = default;

  // False when the message could not be encoded or the transport is down.
  virtual bool Send(const SignalingMessage& message) = 0;
  virtual bool IsConnected() const = 0;
  virtual void SetObserver(SignalingObserver* observer) = 0;
};
