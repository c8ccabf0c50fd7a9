// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "harness/liveness_gate.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace dropnet {
namespace harness {

namespace bip = boost::interprocess;

bool LivenessGate::set_success() noexcept {
  bool expected = false;
  return success_.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire);
}

bool LivenessGate::update_best_height(uint64_t h) noexcept {
  uint64_t current = best_height_.load(std::memory_order_acquire);
  while (h > current) {
    if (best_height_.compare_exchange_weak(current, h,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

SharedLivenessGate::SharedLivenessGate(std::string name, bool owner)
    : name_(std::move(name)), owner_(owner) {}

std::unique_ptr<SharedLivenessGate>
SharedLivenessGate::Create(const std::string &name) {
  bip::shared_memory_object::remove(name.c_str());

  std::unique_ptr<SharedLivenessGate> shared(new SharedLivenessGate(name, true));
  try {
    shared->segment_ =
        bip::managed_shared_memory(bip::create_only, name.c_str(), kSegmentSize);
    shared->gate_ = shared->segment_.construct<LivenessGate>(kObjectName)();
  } catch (const bip::interprocess_exception &e) {
    bip::shared_memory_object::remove(name.c_str());
    throw std::runtime_error("cannot create shared liveness gate '" + name +
                             "': " + e.what());
  }

  LOG_HARNESS_DEBUG("created shared liveness gate '{}'", name);
  return shared;
}

std::unique_ptr<SharedLivenessGate>
SharedLivenessGate::Open(const std::string &name) {
  std::unique_ptr<SharedLivenessGate> shared(new SharedLivenessGate(name, false));
  try {
    shared->segment_ = bip::managed_shared_memory(bip::open_only, name.c_str());
  } catch (const bip::interprocess_exception &e) {
    throw std::runtime_error("cannot open shared liveness gate '" + name +
                             "': " + e.what());
  }

  shared->gate_ = shared->segment_.find<LivenessGate>(kObjectName).first;
  if (!shared->gate_) {
    throw std::runtime_error("segment '" + name + "' holds no liveness gate");
  }
  return shared;
}

SharedLivenessGate::~SharedLivenessGate() {
  if (owner_) {
    bip::shared_memory_object::remove(name_.c_str());
  }
}

} // namespace harness
} // namespace dropnet
