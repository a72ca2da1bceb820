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

#include <memory>

#include "api/media_stream_interface.h"
#include "api/peer_connection_interface.h"
#include "api/scoped_refptr.h"
#include "api/task_queue/task_queue_factory.h"
#include "modules/audio_device/include/audio_device.h"
#include "rtc_base/thread.h"

#include "options.h"

// libwebrtc plumbing of a voice mesh node: the network, worker and signaling
// threads, the audio device module and the peer connection factory. The
// session runs on the signaling thread.
class VOICEMESH_API VoiceMeshApplication {
 public:
  explicit VoiceMeshApplication(Options opts);
  ~VoiceMeshApplication();

  static void rtcInitialize();
  static void rtcCleanup();

  bool Initialize();

  // Microphone track, null on failure.
  rtc::scoped_refptr<webrtc::AudioTrackInterface> CreateLocalAudioTrack();

  // Releases the factory and the audio device, then stops the threads.
  void Cleanup();

  rtc::Thread* network_thread() { return network_thread_.get(); }
  rtc::Thread* worker_thread() { return worker_thread_.get(); }
  rtc::Thread* signaling_thread() { return signaling_thread_.get(); }

  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> peer_connection_factory() {
    return peer_connection_factory_;
  }

  const Options& options() const { return opts_; }

 private:
  bool CreateAudioDeviceModule();

  Options opts_;

  std::unique_ptr<rtc::Thread> network_thread_;
  std::unique_ptr<rtc::Thread> worker_thread_;
  std::unique_ptr<rtc::Thread> signaling_thread_;

  std::unique_ptr<webrtc::TaskQueueFactory> task_queue_factory_;
  rtc::scoped_refptr<webrtc::AudioDeviceModule> audio_device_module_;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> peer_connection_factory_;
};
