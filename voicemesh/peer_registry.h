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

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "api/units/timestamp.h"

#include "audio_analysis.h"
#include "peer_link.h"

// One remote participant we believe is reachable.
struct PeerConnectionRecord {
  std::string peer_id;
  // Distinguishes successive records of the same peer; async completions
  // carry it and give up when it no longer matches.
  uint64_t record_id = 0;

  PeerConnectionState connection_state = PeerConnectionState::kNew;
  IceConnectionState ice_connection_state = IceConnectionState::kNew;
  int reconnect_attempts = 0;
  webrtc::Timestamp last_health_check = webrtc::Timestamp::MinusInfinity();

  // Offer/answer exchange still in flight.
  bool negotiating = false;

  // Declaration order matters: the link must die before its observer.
  std::unique_ptr<PeerLinkObserver> observer;
  std::unique_ptr<PeerLink> link;
  std::unique_ptr<LevelAnalyser> remote_audio_sink;
};

// Authoritative peer id -> record map. Single writer, the session queue.
class PeerConnectionRegistry {
 public:
  using RecordVisitor = std::function<void(PeerConnectionRecord&)>;

  PeerConnectionRegistry() = default;
  ~PeerConnectionRegistry();

  PeerConnectionRegistry(const PeerConnectionRegistry&) = delete;
  PeerConnectionRegistry& operator=(const PeerConnectionRegistry&) = delete;

  // Disposes a record already held for the same peer before storing.
  PeerConnectionRecord* Upsert(std::unique_ptr<PeerConnectionRecord> record);

  PeerConnectionRecord* Get(const std::string& peer_id);
  const PeerConnectionRecord* Get(const std::string& peer_id) const;

  // Null unless the live record of |peer_id| is |record_id|.
  PeerConnectionRecord* GetIfCurrent(const std::string& peer_id, uint64_t record_id);

  bool Contains(const std::string& peer_id) const;

  // Closes the link, disconnects the audio sink, then drops the entry.
  bool RemoveAndDispose(const std::string& peer_id);
  void DisposeAll();

  // |visitor| must not add or remove records.
  void ForEach(const RecordVisitor& visitor);

  std::vector<std::string> PeerIds() const;
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  uint64_t NextRecordId() { return ++last_record_id_; }

 private:
  static void Dispose(PeerConnectionRecord& record);

  std::map<std::string, std::unique_ptr<PeerConnectionRecord>> records_;
  uint64_t last_record_id_ = 0;
};
