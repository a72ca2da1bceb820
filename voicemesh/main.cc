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

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "system_wrappers/include/clock.h"

#include "application.h"
#include "local_audio_stream.h"
#include "options.h"
#include "voice_mesh_session.h"
#include "webrtc_peer_link.h"
#include "websocket_signaling.h"

static volatile bool g_shutdown = false;
static volatile int g_shutdown_count = 0;

// Signal handler for Ctrl+C
void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_shutdown_count++;
        std::cout << "\nCtrl+C received (" << g_shutdown_count << "/3), leaving voice room...\n";
        g_shutdown = true;

        if (g_shutdown_count >= 3) {
            std::cout << "Force exit after multiple Ctrl+C signals\n";
            std::cout.flush();
            _exit(1);
        }
    }
}

static std::string describeParticipants(const VoiceSessionState& state) {
  std::stringstream out;
  out << state.participants().size() << " participant(s)";
  for (const VoiceParticipant& participant : state.participants()) {
    out << "\n  " << participant.username << " (" << participant.user_id << ")"
        << (participant.is_muted ? " muted" : "") << " level=" << participant.audio_level;
  }
  if (state.is_connecting())
    out << "\n  negotiating...";
  if (state.connection_error())
    out << "\n  error: " << *state.connection_error();
  return out.str();
}

int main(int argc, char* argv[]) {

  Options opts;
  std::string options;
  if (argc == 1) {
    opts.help = true;
  } else {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& piece : args)
      options += (piece + " ");
    opts = parseOptions(options.c_str());
  }

  if (opts.help) {
    fprintf(stderr, "%s\n", opts.help_string.c_str());
    return 1;
  }

  if (opts.address.empty()) {
    fprintf(stderr, "Error: relay address host:port is required\n");
    return 1;
  }

  signal(SIGINT, signalHandler);

  VoiceMeshSetLoggingLevel(opts.log_level);
  fprintf(stderr, "%s", getUsage(opts).c_str());
  VoiceMeshApplication::rtcInitialize();

  int exit_code = 0;
  {
    VoiceMeshApplication app(opts);
    if (!app.Initialize()) {
      fprintf(stderr, "Failed to initialize WebRTC\n");
      VoiceMeshApplication::rtcCleanup();
      return 1;
    }
    rtc::Thread* session_thread = app.signaling_thread();

    WebSocketSignaling signaling(session_thread);
    WebRtcPeerLinkFactory link_factory(session_thread, app.peer_connection_factory(),
                                       WebRtcPeerLinkFactory::BuildRtcConfiguration(opts));

    std::unique_ptr<TrackLocalAudioStream> local_stream;
    if (opts.can_transmit) {
      auto track = app.CreateLocalAudioTrack();
      if (track) {
        local_stream = std::make_unique<TrackLocalAudioStream>(track);
      } else {
        fprintf(stderr, "No microphone track, continuing listen only\n");
      }
    }

    const VoiceMeshConfig config = MeshConfigFromOptions(opts);
    std::unique_ptr<VoiceMeshSession> session;
    session_thread->BlockingCall([&]() {
      session = std::make_unique<VoiceMeshSession>(
          config, session_thread, webrtc::Clock::GetRealTimeClock(), &signaling, &link_factory);
    });

    if (!signaling.Connect(WebSocketSignaling::ConfigFromOptions(opts))) {
      fprintf(stderr, "Failed to connect to relay %s\n", opts.address.c_str());
      exit_code = 1;
    } else {
      bool started = false;
      session_thread->BlockingCall([&]() {
        if (local_stream)
          session->AddLocalStream(local_stream.get());
        started = session->EnableAudioReception();
      });
      if (!started) {
        fprintf(stderr, "Failed to enable audio reception\n");
        exit_code = 1;
      }

      fprintf(stderr, "Joined voice room %s as %s\n", config.room_id.c_str(),
              config.user_id.c_str());

      int ticks = 0;
      while (!g_shutdown && exit_code == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (++ticks % 25 == 0) {
          std::string report;
          session_thread->BlockingCall(
              [&]() { report = describeParticipants(session->state()); });
          APP_LOG(AS_INFO) << report;
        }
      }

      session_thread->BlockingCall([&]() { session->PerformIntentionalCleanup(); });
    }

    signaling.Close();
    session_thread->BlockingCall([&]() { session.reset(); });
    local_stream.reset();
    app.Cleanup();
  }

  VoiceMeshApplication::rtcCleanup();
  return exit_code;
}
