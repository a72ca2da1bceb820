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

#include "options.h"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

std::string WriteConfig(const std::string& name, const std::string& contents) {
  const std::string path = ::testing::TempDir() + name;
  FILE* fp = fopen(path.c_str(), "wb");
  EXPECT_NE(fp, nullptr);
  if (fp) {
    fwrite(contents.data(), 1, contents.size(), fp);
    fclose(fp);
  }
  return path;
}

}  // namespace

TEST(OptionsTest, DefaultsMatchMeshDefaults) {
  Options opts = parseOptions(std::vector<std::string>{"--user_id=alice", "relay.local:3456"});
  EXPECT_EQ(opts.address, "relay.local:3456");
  EXPECT_EQ(opts.room_id, "room101");
  EXPECT_EQ(opts.user_id, "alice");
  EXPECT_EQ(opts.user_name, "alice");
  EXPECT_TRUE(opts.can_transmit);
  EXPECT_FALSE(opts.ssl);
  EXPECT_EQ(opts.stun, "stun:stun.l.google.com:19302");
  EXPECT_EQ(opts.health_check_interval_ms, 15000);
  EXPECT_EQ(opts.heartbeat_interval_ms, 30000);
  EXPECT_EQ(opts.reconnect_delay_ms, 2000);
  EXPECT_EQ(opts.max_reconnect_attempts, 3);
  EXPECT_EQ(opts.grace_period_ms, 60000);
  EXPECT_EQ(opts.max_mesh_connections, 9);
  EXPECT_FLOAT_EQ(opts.silence_threshold, 0.02f);
}

TEST(OptionsTest, CommandLineFlags) {
  Options opts = parseOptions(
      "--ssl --room_id=jam1 --user_id=bob --user_name=Bob --no-can_transmit "
      "--grace_period_ms=5000 --silence_threshold=0.05 --log_level=warning "
      "--turns='turns:relay.example.com:443?transport=tcp,user,secret' "
      "relay.example.com:443");
  EXPECT_TRUE(opts.ssl);
  EXPECT_EQ(opts.room_id, "jam1");
  EXPECT_EQ(opts.user_id, "bob");
  EXPECT_EQ(opts.user_name, "Bob");
  EXPECT_FALSE(opts.can_transmit);
  EXPECT_EQ(opts.grace_period_ms, 5000);
  EXPECT_FLOAT_EQ(opts.silence_threshold, 0.05f);
  EXPECT_EQ(opts.log_level, LS_WARNING);
  EXPECT_EQ(opts.turns, "turns:relay.example.com:443?transport=tcp,user,secret");
  EXPECT_EQ(opts.address, "relay.example.com:443");
}

TEST(OptionsTest, HelpStopsParsing) {
  Options opts = parseOptions("--help --room_id=jam1");
  EXPECT_TRUE(opts.help);
  EXPECT_FALSE(opts.help_string.empty());
}

TEST(OptionsTest, GeneratesUserIdWhenMissing) {
  unsetenv("VOICEMESH_USER_ID");
  Options first = parseOptions("relay.local:3456");
  Options second = parseOptions("relay.local:3456");
  EXPECT_FALSE(first.user_id.empty());
  EXPECT_NE(first.user_id, second.user_id);
  EXPECT_EQ(first.user_name, first.user_id);
}

TEST(OptionsTest, ConfigFileIsOverriddenByCommandLine) {
  const std::string path = WriteConfig(
      "voicemesh_options.json",
      "{\"server\":\"relay.local:3456\",\"room_id\":\"from-file\",\"user_id\":\"carol\","
      "\"ssl\":true,\"can_transmit\":false,\"max_reconnect_attempts\":5,"
      "\"turns\":[\"turn:relay.local:3478\",\"u\",\"p\"]}");

  Options opts = parseOptions(std::vector<std::string>{"--config", path, "--room_id=cli"});
  EXPECT_EQ(opts.config_path, path);
  EXPECT_EQ(opts.address, "relay.local:3456");
  EXPECT_EQ(opts.room_id, "cli");
  EXPECT_EQ(opts.user_id, "carol");
  EXPECT_TRUE(opts.ssl);
  EXPECT_FALSE(opts.can_transmit);
  EXPECT_EQ(opts.max_reconnect_attempts, 5);
  EXPECT_EQ(opts.turns, "turn:relay.local:3478,u,p");
}

TEST(OptionsTest, BrokenConfigFileKeepsDefaults) {
  const std::string path = WriteConfig("voicemesh_broken.json", "{ not json");
  Options opts = parseOptions(std::vector<std::string>{"--config=" + path, "--user_id=dave"});
  EXPECT_EQ(opts.room_id, "room101");
  EXPECT_EQ(opts.max_reconnect_attempts, 3);
}

TEST(OptionsTest, MeshConfigUsesTimeDeltas) {
  Options opts = parseOptions(std::vector<std::string>{
      "--user_id=erin", "--user_name=Erin", "--reconnect_delay_ms=1500",
      "--max_reconnect_attempts=-2", "--mute_poll_interval_ms=100"});
  VoiceMeshConfig config = MeshConfigFromOptions(opts);
  EXPECT_EQ(config.user_id, "erin");
  EXPECT_EQ(config.username, "Erin");
  EXPECT_EQ(config.reconnect_delay.ms(), 1500);
  EXPECT_EQ(config.max_reconnect_attempts, 0);
  EXPECT_EQ(config.mute_poll_interval.ms(), 100);
  EXPECT_EQ(config.grace_period.ms(), 60000);
  EXPECT_EQ(config.room_id, "room101");
}

TEST(OptionsTest, MissingConnectionIntervalFromCommandLine) {
  Options opts = parseOptions(std::vector<std::string>{
      "--user_id=finn", "--missing_connection_interval_ms=500"});
  EXPECT_EQ(opts.missing_connection_interval_ms, 500);
  VoiceMeshConfig config = MeshConfigFromOptions(opts);
  EXPECT_EQ(config.missing_connection_interval.ms(), 500);
  EXPECT_EQ(MeshConfigFromOptions(Options()).missing_connection_interval.ms(), 2000);
}

TEST(OptionsTest, LoggingSeverityNames) {
  LoggingSeverity severity = LS_INFO;
  EXPECT_TRUE(ParseLoggingSeverity("verbose", severity));
  EXPECT_EQ(severity, LS_VERBOSE);
  EXPECT_FALSE(ParseLoggingSeverity("loud", severity));
  EXPECT_EQ(severity, LS_VERBOSE);
}

TEST(OptionsTest, IpAndPort) {
  std::string ip;
  int port = 0;
  ASSERT_TRUE(ParseIpAndPort("192.168.1.10:3456", ip, port));
  EXPECT_EQ(ip, "192.168.1.10");
  EXPECT_EQ(port, 3456);
  EXPECT_FALSE(ParseIpAndPort("no-port", ip, port));
  EXPECT_FALSE(ParseIpAndPort("host:99999", ip, port));
}
