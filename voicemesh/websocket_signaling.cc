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

#include "websocket_signaling.h"

#include <utility>

#include "rtc_base/event.h"

#include "signaling_events.h"

WebSocketSignaling::WebSocketSignaling(webrtc::TaskQueueBase* session_queue)
    : session_queue_(session_queue),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {
  // Dedicated network thread for WebSocket operations
  network_thread_ = rtc::Thread::CreateWithSocketServer();
  VoiceMeshThreadSetName(network_thread_.get(), "WebSocketNetworkThread");
  network_thread_->Start();

  ws_client_ = std::make_shared<WebSocketClient>();
  ws_client_->set_network_thread(network_thread_.get());
  ws_client_->set_reconnect_callback([this]() { HandleReconnected(); });
}

WebSocketSignaling::~WebSocketSignaling() {
  safety_->SetNotAlive();

  if (network_thread_ && ws_client_) {
    rtc::Event done;
    network_thread_->PostTask([this, &done]() {
      ws_client_->set_allow_reconnect(false);
      ws_client_->disconnect();
      done.Set();
    });
    // Wait up to 5s for the disconnect task to execute.
    done.Wait(webrtc::TimeDelta::Seconds(5));
  }

  // Allow remaining tasks through the normal Stop() flush.
  if (network_thread_) {
    network_thread_->Stop();
    network_thread_.reset();
  }
  ws_client_.reset();
}

WebSocketClient::Config WebSocketSignaling::ConfigFromOptions(const Options& opts) {
  WebSocketClient::Config cfg;
  int port = 0;
  ParseIpAndPort(opts.address, cfg.host, port);
  cfg.port = std::to_string(port);
  cfg.path = opts.ws_path;
  cfg.use_ssl = opts.ssl;
  cfg.reconnect_interval_ms = MeshDefaults::kReconnectDelayMs;
  return cfg;
}

bool WebSocketSignaling::Connect(const WebSocketClient::Config& config) {
  if (connected_) return true;

  ws_client_->set_allow_reconnect(true);
  ws_client_->set_message_callback(
      [this](const std::string& frame) { HandleFrame(frame); });

  if (!ws_client_->connect(config)) {
    APP_LOG(AS_ERROR) << "Failed to connect to signaling relay " << config.host << ":"
                      << config.port;
    return false;
  }

  ws_client_->start_listening();
  connected_ = true;
  APP_LOG(AS_INFO) << "Connected to signaling relay: " << config.host << ":" << config.port;

  session_queue_->PostTask(webrtc::SafeTask(safety_, [this]() {
    if (observer_)
      observer_->OnTransportUp();
  }));
  return true;
}

void WebSocketSignaling::Close() {
  if (!ws_client_)
    return;

  rtc::Event done;
  network_thread_->PostTask([this, &done]() {
    ws_client_->set_allow_reconnect(false);
    ws_client_->disconnect();
    done.Set();
  });
  done.Wait(webrtc::TimeDelta::Seconds(5));

  if (connected_.exchange(false)) {
    APP_LOG(AS_INFO) << "Signaling relay closed";
  }
  PostTransportDown(DisconnectKind::kIntentional);
}

bool WebSocketSignaling::Send(const SignalingMessage& message) {
  std::string line;
  if (!EncodeSignalingMessage(message, &line)) {
    APP_LOG(AS_ERROR) << "Refusing to send incomplete " << SignalingTypeName(message.type);
    return false;
  }
  if (!connected_) {
    APP_LOG(AS_WARNING) << "Relay down, dropping " << SignalingTypeName(message.type);
    return false;
  }
  return ws_client_->send_message(line);
}

bool WebSocketSignaling::IsConnected() const {
  return connected_;
}

void WebSocketSignaling::SetObserver(SignalingObserver* observer) {
  observer_ = observer;
}

void WebSocketSignaling::HandleFrame(const std::string& frame) {
  if (frame == Msg::kDisconnected) {
    if (connected_.exchange(false)) {
      APP_LOG(AS_WARNING) << "Signaling relay connection lost";
      PostTransportDown(DisconnectKind::kAccidental);
    }
    return;
  }

  SignalingMessage message;
  if (!DecodeSignalingMessage(frame, &message)) {
    APP_LOG(AS_INFO) << "Dropping relay frame: " << frame.substr(0, 100);
    return;
  }

  session_queue_->PostTask(
      webrtc::SafeTask(safety_, [this, message = std::move(message)]() {
        if (observer_)
          observer_->OnSignalingMessage(message);
      }));
}

void WebSocketSignaling::HandleReconnected() {
  connected_ = true;
  APP_LOG(AS_INFO) << "Signaling relay reconnected";
  session_queue_->PostTask(webrtc::SafeTask(safety_, [this]() {
    if (observer_)
      observer_->OnTransportUp();
  }));
}

void WebSocketSignaling::PostTransportDown(DisconnectKind kind) {
  session_queue_->PostTask(webrtc::SafeTask(safety_, [this, kind]() {
    if (observer_)
      observer_->OnTransportDown(kind);
  }));
}
