// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "harness/liveness_gate.hpp"
#include "network/proxy.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace dropnet {
namespace harness {

struct DropPolicyConfig {
  // Probability that any single message is discarded, in [0, 1]
  double drop_ratio = 0.05;
  // Block height that counts as "the cluster is live"
  uint64_t height_target = 10;
  // Fixed seed for reproducible runs; random_device when unset
  std::optional<uint64_t> seed;

  // Throws std::invalid_argument if drop_ratio is not a finite value in [0, 1]
  void Validate() const;
};

/**
 * DropHandler - per-link drop policy.
 *
 * Every message is counted in total() and discarded with probability
 * drop_ratio. Block messages additionally raise the gate's best height and,
 * once the height target is reached, latch success. finished() is set by
 * the first block at or above the target seen by this handler; the summary
 * for that event is logged once per handler.
 *
 * total is incremented before dropped, so dropped() <= total() holds for
 * any reader that loads dropped first (stats() does).
 */
class DropHandler : public network::ProxyHandler {
public:
  struct Stats {
    uint64_t dropped = 0;
    uint64_t total = 0;
    bool finished = false;
  };

  // stream_id selects an independent random stream when config.seed is set
  DropHandler(LivenessGate &gate, DropPolicyConfig config, uint64_t stream_id = 0);

  bool handle(const message::Message &msg, int from, int to) override;

  Stats stats() const;

  uint64_t dropped() const { return dropped_.load(std::memory_order_acquire); }
  uint64_t total() const { return total_.load(std::memory_order_acquire); }
  bool finished() const { return finished_.load(std::memory_order_acquire); }

private:
  double draw();

  LivenessGate &gate_;
  const DropPolicyConfig config_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> dist_{0.0, 1.0};

  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> total_{0};
  std::atomic<bool> finished_{false};
};

// Stream id for a link, stable across runs
uint64_t LinkStreamId(int from, int to);

// One DropHandler per link, all writing the same gate
network::ProxyHandlerFactory MakeDropHandlerFactory(LivenessGate &gate,
                                                    DropPolicyConfig config);

} // namespace harness
} // namespace dropnet
