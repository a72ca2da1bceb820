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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "signaling_events.h"
#include "system_wrappers/include/clock.h"
#include "test/fake_task_queue.h"
#include "websocket_client.h"

namespace {

const unsigned char kText = 0x1;
const unsigned char kClose = 0x8;
const unsigned char kPing = 0x9;

std::string AsString(const std::vector<unsigned char>& frame) {
  return std::string(frame.begin(), frame.end());
}

class RecordingObserver : public SignalingObserver {
 public:
  void OnSignalingMessage(const SignalingMessage& /* message */) override { messages++; }
  void OnTransportUp() override { ups++; }
  void OnTransportDown(DisconnectKind kind) override { downs.push_back(kind); }

  int messages = 0;
  int ups = 0;
  std::vector<DisconnectKind> downs;
};

}  // namespace

TEST(WebSocketClientTest, Base64) {
  EXPECT_EQ(WebSocketClient::base64_encode(""), "");
  EXPECT_EQ(WebSocketClient::base64_encode("f"), "Zg==");
  EXPECT_EQ(WebSocketClient::base64_encode("foob"), "Zm9vYg==");
  EXPECT_EQ(WebSocketClient::generate_websocket_key().size(), 24u);
}

TEST(WebSocketClientTest, ClientFramesAreMasked) {
  std::vector<unsigned char> frame = WebSocketClient::build_frame(kText, "hello", true);
  ASSERT_EQ(frame.size(), 2u + 4u + 5u);
  EXPECT_EQ(frame[0], 0x81);
  EXPECT_EQ(frame[1], 0x80 | 5);

  std::string buffer = AsString(frame);
  std::vector<std::string> messages;
  std::vector<std::string> pings;
  WebSocketClient::parse_frames(buffer, messages, pings);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0], "hello");
  EXPECT_TRUE(buffer.empty());
}

TEST(WebSocketClientTest, ExtendedLengthHeader) {
  const std::string payload(300, 'x');
  std::vector<unsigned char> frame = WebSocketClient::build_frame(kText, payload, false);
  EXPECT_EQ(frame[1], 126);
  EXPECT_EQ((frame[2] << 8) | frame[3], 300);
}

TEST(WebSocketClientTest, PartialFrameWaitsForRest) {
  std::string whole = AsString(WebSocketClient::build_frame(kText, "join_voice:{}", false));
  std::string buffer = whole.substr(0, 5);
  std::vector<std::string> messages;
  std::vector<std::string> pings;

  WebSocketClient::parse_frames(buffer, messages, pings);
  EXPECT_TRUE(messages.empty());
  EXPECT_EQ(buffer.size(), 5u);

  buffer += whole.substr(5);
  WebSocketClient::parse_frames(buffer, messages, pings);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0], "join_voice:{}");
}

TEST(WebSocketClientTest, FragmentedMessageIsReassembled) {
  std::string buffer;
  buffer.push_back(static_cast<char>(kText));  // no FIN
  buffer.push_back(3);
  buffer += "voi";
  buffer.push_back(static_cast<char>(0x80));  // FIN continuation
  buffer.push_back(4);
  buffer += "ce_x";

  std::vector<std::string> messages;
  std::vector<std::string> pings;
  WebSocketClient::parse_frames(buffer, messages, pings);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0], "voice_x");
}

TEST(WebSocketClientTest, PingAndClose) {
  std::string buffer = AsString(WebSocketClient::build_frame(kPing, "p1", false)) +
                       AsString(WebSocketClient::build_frame(kClose, "", false));
  std::vector<std::string> messages;
  std::vector<std::string> pings;
  WebSocketClient::parse_frames(buffer, messages, pings);
  ASSERT_EQ(pings.size(), 1u);
  EXPECT_EQ(pings[0], "p1");
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0], Msg::kDisconnected);
}

TEST(WebSocketSignalingTest, ConfigFromOptions) {
  Options opts;
  opts.address = "relay.example.com:443";
  opts.ssl = true;
  opts.ws_path = "/voice";

  WebSocketClient::Config config = WebSocketSignaling::ConfigFromOptions(opts);
  EXPECT_EQ(config.host, "relay.example.com");
  EXPECT_EQ(config.port, "443");
  EXPECT_EQ(config.path, "/voice");
  EXPECT_TRUE(config.use_ssl);
  EXPECT_EQ(config.reconnect_interval_ms, MeshDefaults::kReconnectDelayMs);
}

TEST(WebSocketSignalingTest, SendFailsUntilConnected) {
  webrtc::SimulatedClock clock(1000000);
  FakeTaskQueue queue(&clock);
  WebSocketSignaling signaling(&queue);
  EXPECT_FALSE(signaling.IsConnected());

  SignalingMessage join;
  join.type = SignalingType::kJoinVoice;
  join.room_id = "room101";
  join.user_id = "alice";
  EXPECT_FALSE(signaling.Send(join));

  // Incomplete messages are refused before the transport is looked at.
  join.user_id.clear();
  EXPECT_FALSE(signaling.Send(join));
}

TEST(WebSocketSignalingTest, CloseReportsIntentionalDown) {
  webrtc::SimulatedClock clock(1000000);
  FakeTaskQueue queue(&clock);
  RecordingObserver observer;
  WebSocketSignaling signaling(&queue);
  signaling.SetObserver(&observer);

  signaling.Close();
  EXPECT_TRUE(observer.downs.empty());
  queue.RunReady();
  ASSERT_EQ(observer.downs.size(), 1u);
  EXPECT_EQ(observer.downs[0], DisconnectKind::kIntentional);
  EXPECT_FALSE(signaling.IsConnected());
}
