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

#include "mute_change_detector.h"

#include <gtest/gtest.h>

TEST(MuteChangeDetectorTest, SilentUntilBaseline) {
  bool enabled = true;
  MuteChangeDetector detector([&enabled]() { return enabled; });
  enabled = false;
  EXPECT_FALSE(detector.Poll().has_value());
}

TEST(MuteChangeDetectorTest, ReportsEachTransitionOnce) {
  bool enabled = true;
  MuteChangeDetector detector([&enabled]() { return enabled; });
  detector.ResetBaseline();
  ASSERT_EQ(detector.last_broadcast(), false);
  EXPECT_FALSE(detector.Poll().has_value());

  enabled = false;
  ASSERT_EQ(detector.Poll(), true);
  // Not broadcast yet, keeps reporting.
  EXPECT_EQ(detector.Poll(), true);

  detector.MarkBroadcast(true);
  EXPECT_FALSE(detector.Poll().has_value());

  enabled = true;
  EXPECT_EQ(detector.Poll(), false);
}

TEST(MuteChangeDetectorTest, ClearBaselineStopsReporting) {
  bool enabled = true;
  MuteChangeDetector detector([&enabled]() { return enabled; });
  detector.MarkBroadcast(false);
  detector.ClearBaseline();
  enabled = false;
  EXPECT_FALSE(detector.Poll().has_value());
}

TEST(MuteChangeDetectorTest, ObserveReportsOnlyChanges) {
  MuteChangeDetector detector([]() { return false; });
  EXPECT_TRUE(detector.Observe(true));
  // An undelivered change is polled again and again.
  EXPECT_FALSE(detector.Observe(true));
  EXPECT_FALSE(detector.Observe(true));
  EXPECT_TRUE(detector.Observe(false));

  detector.ClearBaseline();
  EXPECT_TRUE(detector.Observe(false));
}
