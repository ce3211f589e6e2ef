/**
 * @file scope_guard_test.cpp
 * @brief Unit tests for ScopeGuard
 */

#include "utils/scope_guard.h"

#include <gtest/gtest.h>

namespace annotate::utils {
namespace {

TEST(ScopeGuardTest, RunsCleanupOnScopeExit) {
  int calls = 0;
  {
    ScopeGuard guard([&calls]() { ++calls; });
    EXPECT_EQ(calls, 0);
  }
  EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, RunsCleanupOnEarlyReturn) {
  int calls = 0;
  auto body = [&calls](bool leave_early) {
    ScopeGuard guard([&calls]() { ++calls; });
    if (leave_early) {
      return 1;
    }
    return 2;
  };

  EXPECT_EQ(body(true), 1);
  EXPECT_EQ(body(false), 2);
  EXPECT_EQ(calls, 2);
}

}  // namespace
}  // namespace annotate::utils
