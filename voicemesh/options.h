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

#include "rtc_base/logging.h"
#include "rtc_base/thread.h"

#include "voice_mesh_config.h"

#ifndef VOICEMESH_EXPORT_H
#define VOICEMESH_EXPORT_H

#if defined(_MSC_VER)
    #define VOICEMESH_EXPORT __declspec(dllexport)
    #define VOICEMESH_IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
    #define VOICEMESH_EXPORT __attribute__((visibility("default")))
    #define VOICEMESH_IMPORT __attribute__((visibility("default")))
#else
    #define VOICEMESH_EXPORT
    #define VOICEMESH_IMPORT
#endif

#ifdef VOICEMESH_BUILDING_DLL
    #define VOICEMESH_API VOICEMESH_EXPORT
#else
    #define VOICEMESH_API VOICEMESH_IMPORT
#endif

enum LoggingSeverity {
  LS_VERBOSE,
  LS_INFO,
  LS_WARNING,
  LS_ERROR,
  LS_NONE,
};

#define AS_VERBOSE LS_VERBOSE
#define AS_INFO LS_INFO
#define AS_WARNING LS_WARNING
#define AS_ERROR LS_ERROR
#define AS_NONE LS_NONE
#define APP_LOG(x) RTC_LOG(x)

#endif // VOICEMESH_EXPORT_H

// Command line options
struct Options {
    bool help = false;
    std::string help_string;
    std::string config_path = ""; // Path to JSON config file

    // Signaling relay, host:port
    std::string address = "";
    bool ssl = false;
    std::string ws_path = "/";

    std::string room_id = MeshDefaults::kDefaultRoom;
    std::string user_id = "";
    std::string user_name = "";
    bool can_transmit = true;

    std::string stun = "stun:stun.l.google.com:19302";
    std::string turns = "";  // uri,username,password

    int health_check_interval_ms = MeshDefaults::kHealthCheckIntervalMs;
    int heartbeat_interval_ms = MeshDefaults::kHeartbeatIntervalMs;
    int reconnect_delay_ms = MeshDefaults::kReconnectDelayMs;
    int max_reconnect_attempts = MeshDefaults::kMaxReconnectAttempts;
    int grace_period_ms = MeshDefaults::kGracePeriodMs;
    int level_sample_interval_ms = MeshDefaults::kLevelSampleIntervalMs;
    int mute_poll_interval_ms = MeshDefaults::kMutePollIntervalMs;
    int missing_connection_interval_ms = MeshDefaults::kMissingConnectionIntervalMs;
    float silence_threshold = MeshDefaults::kSilenceThreshold;
    int max_mesh_connections = MeshDefaults::kMaxMeshConnections;

    LoggingSeverity log_level = LS_INFO;
};

// Function to parse command line string to above options
VOICEMESH_API Options parseOptions(const char* argString);
Options parseOptions(const std::vector<std::string>& args);

bool ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port);

// Function to get command line options to a string, to print
VOICEMESH_API std::string getUsage(const Options opts);

VOICEMESH_API VoiceMeshConfig MeshConfigFromOptions(const Options& opts);

VOICEMESH_API bool ParseLoggingSeverity(const std::string& name, LoggingSeverity& out);

VOICEMESH_API void VoiceMeshSetLoggingLevel(LoggingSeverity level);

VOICEMESH_API std::string VoiceMeshCreateRandomUuid();

VOICEMESH_API void VoiceMeshThreadSetName(rtc::Thread* thread, const char* name);
