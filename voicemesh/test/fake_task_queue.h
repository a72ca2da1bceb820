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
#include <map>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "api/location.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "api/units/timestamp.h"
#include "system_wrappers/include/clock.h"

// Single threaded task queue on simulated time. It is the current queue of
// the test thread for its whole lifetime; tasks only run from RunReady() and
// AdvanceTime().
class FakeTaskQueue : public webrtc::TaskQueueBase {
 public:
  explicit FakeTaskQueue(webrtc::SimulatedClock* clock) : clock_(clock), current_(this) {}
  ~FakeTaskQueue() override { tasks_.clear(); }

  void Delete() override {}

  // Runs every task that is due, including tasks they post for now.
  void RunReady() {
    while (!tasks_.empty() && tasks_.begin()->first.due <= clock_->CurrentTime()) {
      auto task = std::move(tasks_.begin()->second);
      tasks_.erase(tasks_.begin());
      std::move(task)();
    }
  }

  // Moves the clock forward, stopping at every due task on the way.
  void AdvanceTime(webrtc::TimeDelta delta) {
    const webrtc::Timestamp end = clock_->CurrentTime() + delta;
    RunReady();
    while (!tasks_.empty() && tasks_.begin()->first.due <= end) {
      const webrtc::Timestamp due = tasks_.begin()->first.due;
      if (due > clock_->CurrentTime())
        clock_->AdvanceTime(due - clock_->CurrentTime());
      RunReady();
    }
    if (end > clock_->CurrentTime())
      clock_->AdvanceTime(end - clock_->CurrentTime());
    RunReady();
  }

  size_t pending_tasks() const { return tasks_.size(); }

 protected:
  void PostTaskImpl(absl::AnyInvocable<void() &&> task,
                    const PostTaskTraits& /* traits */,
                    const webrtc::Location& /* location */) override {
    Enqueue(clock_->CurrentTime(), std::move(task));
  }

  void PostDelayedTaskImpl(absl::AnyInvocable<void() &&> task,
                           webrtc::TimeDelta delay,
                           const PostDelayedTaskTraits& /* traits */,
                           const webrtc::Location& /* location */) override {
    Enqueue(clock_->CurrentTime() + delay, std::move(task));
  }

 private:
  struct Key {
    webrtc::Timestamp due;
    uint64_t order;
    bool operator<(const Key& other) const {
      return due < other.due || (due == other.due && order < other.order);
    }
  };

  void Enqueue(webrtc::Timestamp due, absl::AnyInvocable<void() &&> task) {
    tasks_.emplace(Key{due, next_order_++}, std::move(task));
  }

  webrtc::SimulatedClock* const clock_;
  std::map<Key, absl::AnyInvocable<void() &&>> tasks_;
  uint64_t next_order_ = 0;
  CurrentTaskQueueSetter current_;
};
