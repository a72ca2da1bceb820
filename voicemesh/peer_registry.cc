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

#include "peer_registry.h"

#include <utility>

#include "options.h"

PeerConnectionRegistry::~PeerConnectionRegistry() {
  DisposeAll();
}

PeerConnectionRecord* PeerConnectionRegistry::Upsert(
    std::unique_ptr<PeerConnectionRecord> record) {
  if (!record || record->peer_id.empty()) {
    APP_LOG(AS_ERROR) << "Refusing to register a record without peer id";
    return nullptr;
  }

  const std::string peer_id = record->peer_id;
  if (RemoveAndDispose(peer_id)) {
    APP_LOG(AS_INFO) << "Replaced previous connection record for " << peer_id;
  }

  PeerConnectionRecord* raw = record.get();
  records_[peer_id] = std::move(record);
  return raw;
}

PeerConnectionRecord* PeerConnectionRegistry::Get(const std::string& peer_id) {
  auto it = records_.find(peer_id);
  return it == records_.end() ? nullptr : it->second.get();
}

const PeerConnectionRecord* PeerConnectionRegistry::Get(const std::string& peer_id) const {
  auto it = records_.find(peer_id);
  return it == records_.end() ? nullptr : it->second.get();
}

PeerConnectionRecord* PeerConnectionRegistry::GetIfCurrent(const std::string& peer_id,
                                                           uint64_t record_id) {
  PeerConnectionRecord* record = Get(peer_id);
  return record && record->record_id == record_id ? record : nullptr;
}

bool PeerConnectionRegistry::Contains(const std::string& peer_id) const {
  return records_.count(peer_id) != 0;
}

bool PeerConnectionRegistry::RemoveAndDispose(const std::string& peer_id) {
  auto it = records_.find(peer_id);
  if (it == records_.end())
    return false;

  Dispose(*it->second);
  records_.erase(it);
  APP_LOG(AS_INFO) << "Disposed connection record for " << peer_id;
  return true;
}

void PeerConnectionRegistry::DisposeAll() {
  for (auto& entry : records_) {
    Dispose(*entry.second);
  }
  if (!records_.empty()) {
    APP_LOG(AS_INFO) << "Disposed " << records_.size() << " connection record(s)";
  }
  records_.clear();
}

void PeerConnectionRegistry::ForEach(const RecordVisitor& visitor) {
  for (auto& entry : records_) {
    visitor(*entry.second);
  }
}

std::vector<std::string> PeerConnectionRegistry::PeerIds() const {
  std::vector<std::string> ids;
  ids.reserve(records_.size());
  for (const auto& entry : records_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void PeerConnectionRegistry::Dispose(PeerConnectionRecord& record) {
  if (record.link) {
    record.link->Close();
    record.link.reset();
  }
  if (record.remote_audio_sink) {
    record.remote_audio_sink->Disconnect();
    record.remote_audio_sink.reset();
  }
  record.observer.reset();
  record.connection_state = PeerConnectionState::kClosed;
  record.ice_connection_state = IceConnectionState::kClosed;
  record.negotiating = false;
}
