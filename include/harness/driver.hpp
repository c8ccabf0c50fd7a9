// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "harness/liveness_gate.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace dropnet {

namespace network {
class InterceptFault;
} // namespace network

namespace harness {

enum class DriverState { STARTING, RUNNING, SUCCEEDED, FAILED };

const char *DriverStateName(DriverState state);

struct DriverConfig {
  std::chrono::milliseconds timeout{std::chrono::seconds(90)};
  std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};

  // Throws std::invalid_argument for a non-positive timeout or poll interval
  void Validate() const;
};

// The cluster did not reach the height target before the deadline
class LivenessTimeout : public std::runtime_error {
public:
  LivenessTimeout(std::chrono::milliseconds elapsed, uint64_t best_height);

  std::chrono::milliseconds elapsed() const noexcept { return elapsed_; }
  uint64_t best_height() const noexcept { return best_height_; }

private:
  std::chrono::milliseconds elapsed_;
  uint64_t best_height_;
};

struct DriverOutcome {
  std::chrono::milliseconds elapsed{0};
  uint64_t best_height{0};
};

/**
 * Driver - the outer polling loop.
 *
 * run() executes the start action (exceptions propagate, no retry), then
 * checks the gate every poll interval: success wins, a recorded intercept
 * fault is rethrown, and once the timeout has elapsed LivenessTimeout is
 * thrown. The elapsed clock starts after the start action returns, so run()
 * returns or throws within timeout + poll_interval of that point.
 */
class Driver {
public:
  using StartAction = std::function<void()>;

  // fault may be null when no proxy is involved
  Driver(const LivenessGate &gate, const network::InterceptFault *fault,
         DriverConfig config = DriverConfig{});

  DriverOutcome run(const StartAction &start);

  DriverState state() const { return state_.load(); }

private:
  const LivenessGate &gate_;
  const network::InterceptFault *fault_;
  DriverConfig config_;
  std::atomic<DriverState> state_{DriverState::STARTING};
};

} // namespace harness
} // namespace dropnet
