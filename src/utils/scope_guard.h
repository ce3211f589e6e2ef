/**
 * @file scope_guard.h
 * @brief RAII guard running a cleanup action on scope exit
 */

#pragma once

#include <utility>

namespace annotate::utils {

/**
 * @brief RAII guard for generic cleanup actions
 *
 * Executes a cleanup function when the guard goes out of scope.
 *
 * Usage:
 * @code
 * SCREEN* screen = newterm(nullptr, stdout, stdin);
 * ScopeGuard restore_terminal([screen]() { endwin(); delscreen(screen); });
 * // ... drawing that may return early ...
 * @endcode
 */
template <typename CleanupFunc>
class ScopeGuard {
 public:
  explicit ScopeGuard(CleanupFunc cleanup) : cleanup_(std::move(cleanup)) {}

  ~ScopeGuard() { cleanup_(); }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  CleanupFunc cleanup_;
};

}  // namespace annotate::utils
