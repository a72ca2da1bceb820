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

#include "peer_link.h"

namespace {

struct ConnectionStateName {
  PeerConnectionState state;
  const char* name;
};

struct IceStateName {
  IceConnectionState state;
  const char* name;
};

// Names match the W3C RTCPeerConnection enums used on the wire.
const ConnectionStateName kConnectionStateNames[] = {
    {PeerConnectionState::kNew, "new"},
    {PeerConnectionState::kConnecting, "connecting"},
    {PeerConnectionState::kConnected, "connected"},
    {PeerConnectionState::kDisconnected, "disconnected"},
    {PeerConnectionState::kFailed, "failed"},
    {PeerConnectionState::kClosed, "closed"},
};

const IceStateName kIceStateNames[] = {
    {IceConnectionState::kNew, "new"},
    {IceConnectionState::kChecking, "checking"},
    {IceConnectionState::kConnected, "connected"},
    {IceConnectionState::kCompleted, "completed"},
    {IceConnectionState::kFailed, "failed"},
    {IceConnectionState::kDisconnected, "disconnected"},
    {IceConnectionState::kClosed, "closed"},
};

}  // namespace

const char* PeerConnectionStateName(PeerConnectionState state) {
  for (const auto& entry : kConnectionStateNames) {
    if (entry.state == state)
      return entry.name;
  }
  return "unknown";
}

const char* IceConnectionStateName(IceConnectionState state) {
  for (const auto& entry : kIceStateNames) {
    if (entry.state == state)
      return entry.name;
  }
  return "unknown";
}

bool ParsePeerConnectionState(const std::string& name, PeerConnectionState& out) {
  for (const auto& entry : kConnectionStateNames) {
    if (name == entry.name) {
      out = entry.state;
      return true;
    }
  }
  return false;
}

bool ParseIceConnectionState(const std::string& name, IceConnectionState& out) {
  for (const auto& entry : kIceStateNames) {
    if (name == entry.name) {
      out = entry.state;
      return true;
    }
  }
  return false;
}
