// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <boost/interprocess/managed_shared_memory.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace dropnet {
namespace harness {

/**
 * LivenessGate - the one piece of state shared by every link handler and
 * the driver loop.
 *
 * success latches false -> true at most once; best_height never decreases.
 * Lock-free atomics only, so the object works in place inside a
 * shared-memory segment (see SharedLivenessGate).
 */
class LivenessGate {
public:
  LivenessGate() = default;

  LivenessGate(const LivenessGate &) = delete;
  LivenessGate &operator=(const LivenessGate &) = delete;

  // Returns true only for the caller that flipped the latch
  bool set_success() noexcept;

  bool is_success() const noexcept {
    return success_.load(std::memory_order_acquire);
  }

  // Raises best_height to h if h is strictly greater. Returns true if this
  // call raised it.
  bool update_best_height(uint64_t h) noexcept;

  uint64_t best_height() const noexcept {
    return best_height_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> success_{false};
  std::atomic<uint64_t> best_height_{0};

  static_assert(std::atomic<bool>::is_always_lock_free,
                "gate must be usable across processes");
  static_assert(std::atomic<uint64_t>::is_always_lock_free,
                "gate must be usable across processes");
};

/**
 * SharedLivenessGate - a LivenessGate placed in a named Boost.Interprocess
 * segment, for handlers running in a different process than the driver.
 *
 * Create() removes any stale segment of the same name, builds a fresh gate
 * and removes the segment again on destruction. Open() attaches to an
 * existing gate and leaves the segment alone.
 */
class SharedLivenessGate {
public:
  // Throws std::runtime_error if the segment cannot be created
  static std::unique_ptr<SharedLivenessGate> Create(const std::string &name);

  // Throws std::runtime_error if the segment or the gate inside it is missing
  static std::unique_ptr<SharedLivenessGate> Open(const std::string &name);

  ~SharedLivenessGate();

  SharedLivenessGate(const SharedLivenessGate &) = delete;
  SharedLivenessGate &operator=(const SharedLivenessGate &) = delete;

  LivenessGate &gate() { return *gate_; }
  const std::string &name() const { return name_; }

private:
  SharedLivenessGate(std::string name, bool owner);

  static constexpr const char *kObjectName = "dropnet.liveness_gate";
  static constexpr size_t kSegmentSize = 64 * 1024;

  std::string name_;
  bool owner_;
  boost::interprocess::managed_shared_memory segment_;
  LivenessGate *gate_{nullptr};
};

} // namespace harness
} // namespace dropnet
