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

#include "application.h"

#include <utility>

#include "api/audio_codecs/builtin_audio_decoder_factory.h"
#include "api/audio_codecs/builtin_audio_encoder_factory.h"
#include "api/create_peerconnection_factory.h"
#include "api/task_queue/default_task_queue_factory.h"
#include "api/video_codecs/video_decoder_factory.h"
#include "api/video_codecs/video_encoder_factory.h"
#include "rtc_base/ssl_adapter.h"

void VoiceMeshApplication::rtcInitialize() {
  rtc::InitializeSSL();
}

void VoiceMeshApplication::rtcCleanup() {
  rtc::CleanupSSL();
}

VoiceMeshApplication::VoiceMeshApplication(Options opts) : opts_(std::move(opts)) {}

VoiceMeshApplication::~VoiceMeshApplication() {
  Cleanup();
}

bool VoiceMeshApplication::Initialize() {
  network_thread_ = rtc::Thread::CreateWithSocketServer();
  worker_thread_ = rtc::Thread::Create();
  signaling_thread_ = rtc::Thread::Create();
  VoiceMeshThreadSetName(network_thread_.get(), "Network");
  VoiceMeshThreadSetName(worker_thread_.get(), "Worker");
  VoiceMeshThreadSetName(signaling_thread_.get(), "Signaling");

  if (!network_thread_->Start() || !worker_thread_->Start() || !signaling_thread_->Start()) {
    APP_LOG(AS_ERROR) << "Failed to start threads";
    return false;
  }

  task_queue_factory_ = webrtc::CreateDefaultTaskQueueFactory();
  if (!CreateAudioDeviceModule())
    return false;

  peer_connection_factory_ = webrtc::CreatePeerConnectionFactory(
      network_thread_.get(),
      worker_thread_.get(),
      signaling_thread_.get(),
      audio_device_module_,
      webrtc::CreateBuiltinAudioEncoderFactory(),
      webrtc::CreateBuiltinAudioDecoderFactory(),
      nullptr,  // video_encoder_factory, audio only
      nullptr,  // video_decoder_factory
      nullptr,  // audio_mixer
      nullptr   // audio_processing
  );
  if (!peer_connection_factory_) {
    APP_LOG(AS_ERROR) << "Failed to create PeerConnectionFactory";
    return false;
  }

  APP_LOG(AS_INFO) << "Voice mesh application initialized";
  return true;
}

bool VoiceMeshApplication::CreateAudioDeviceModule() {
  // The ADM lives on the worker thread.
  worker_thread_->BlockingCall([this]() {
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kPlatformDefaultAudio, task_queue_factory_.get());
    if (audio_device_module_ && audio_device_module_->Init() == 0) {
      APP_LOG(AS_INFO) << "Audio device module created on " << rtc::Thread::Current();
      return;
    }

    // Head-less hosts have no sound server, keep signaling alive without audio.
    APP_LOG(AS_ERROR) << "Audio device module init failed, switching to DummyAudio layer";
    audio_device_module_ = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kDummyAudio, task_queue_factory_.get());
    if (audio_device_module_ && audio_device_module_->Init() != 0) {
      APP_LOG(AS_ERROR) << "Dummy audio device module init failed";
      audio_device_module_ = nullptr;
    }
  });

  if (!audio_device_module_) {
    APP_LOG(AS_ERROR) << "Audio device module creation failed";
    return false;
  }
  return true;
}

rtc::scoped_refptr<webrtc::AudioTrackInterface> VoiceMeshApplication::CreateLocalAudioTrack() {
  if (!peer_connection_factory_) {
    APP_LOG(AS_ERROR) << "CreateLocalAudioTrack before Initialize";
    return nullptr;
  }
  cricket::AudioOptions audio_options;
  auto audio_source = peer_connection_factory_->CreateAudioSource(audio_options);
  if (!audio_source) {
    APP_LOG(AS_ERROR) << "Failed to create audio source";
    return nullptr;
  }
  return peer_connection_factory_->CreateAudioTrack("voicemesh_audio", audio_source.get());
}

void VoiceMeshApplication::Cleanup() {
  if (signaling_thread_ && peer_connection_factory_) {
    signaling_thread_->BlockingCall([this]() { peer_connection_factory_ = nullptr; });
  }
  peer_connection_factory_ = nullptr;

  if (worker_thread_ && audio_device_module_) {
    worker_thread_->BlockingCall([this]() {
      audio_device_module_->StopPlayout();
      audio_device_module_->StopRecording();
      audio_device_module_->Terminate();
      audio_device_module_ = nullptr;
    });
  }
  audio_device_module_ = nullptr;

  if (signaling_thread_)
    signaling_thread_->Stop();
  if (worker_thread_)
    worker_thread_->Stop();
  if (network_thread_)
    network_thread_->Stop();
  signaling_thread_.reset();
  worker_thread_.reset();
  network_thread_.reset();
  task_queue_factory_.reset();
}
