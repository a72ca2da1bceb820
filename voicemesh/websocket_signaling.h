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

#include <atomic>
#include <memory>
#include <string>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "rtc_base/thread.h"

#include "options.h"
#include "signaling_adapter.h"
#include "websocket_client.h"

// Relay connection over a WebSocket. Socket I/O happens on a private network
// thread; decoded messages and transport events are re-posted to
// |session_queue| before the observer sees them.
class VOICEMESH_API WebSocketSignaling : public SignalingAdapter {
 public:
  explicit WebSocketSignaling(webrtc::TaskQueueBase* session_queue);
  ~WebSocketSignaling() override;

  // Blocking connect + upgrade. Reports transport-up on success; later drops
  // are retried by the client every |reconnect_interval_ms|.
  bool Connect(const WebSocketClient::Config& config);

  // Intentional disconnect, no reconnect afterwards.
  void Close();

  // SignalingAdapter
  bool Send(const SignalingMessage& message) override;
  bool IsConnected() const override;
  void SetObserver(SignalingObserver* observer) override;

  static WebSocketClient::Config ConfigFromOptions(const Options& opts);

 private:
  // Network thread.
  void HandleFrame(const std::string& frame);
  void HandleReconnected();

  void PostTransportDown(DisconnectKind kind);

  webrtc::TaskQueueBase* const session_queue_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> safety_;

  std::unique_ptr<rtc::Thread> network_thread_;
  std::shared_ptr<WebSocketClient> ws_client_;
  std::atomic<bool> connected_{false};

  SignalingObserver* observer_ = nullptr;  // session queue only
};
