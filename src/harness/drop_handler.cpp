// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "harness/drop_handler.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include <cmath>
#include <stdexcept>

namespace dropnet {
namespace harness {

void DropPolicyConfig::Validate() const {
  if (!std::isfinite(drop_ratio) || drop_ratio < 0.0 || drop_ratio > 1.0) {
    throw std::invalid_argument("drop ratio must be within [0, 1], got " +
                                std::to_string(drop_ratio));
  }
}

namespace {

std::mt19937_64 MakeRng(const std::optional<uint64_t> &seed, uint64_t stream_id) {
  if (!seed) {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }
  std::seed_seq seq{static_cast<uint32_t>(*seed), static_cast<uint32_t>(*seed >> 32),
                    static_cast<uint32_t>(stream_id),
                    static_cast<uint32_t>(stream_id >> 32)};
  return std::mt19937_64(seq);
}

} // namespace

DropHandler::DropHandler(LivenessGate &gate, DropPolicyConfig config,
                         uint64_t stream_id)
    : gate_(gate), config_(config), rng_(MakeRng(config.seed, stream_id)) {
  config_.Validate();
}

double DropHandler::draw() {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return dist_(rng_);
}

bool DropHandler::handle(const message::Message &msg, int from, int to) {
  if (const auto *block_msg = dynamic_cast<const message::BlockMessage *>(&msg)) {
    const uint64_t height = block_msg->block.header.inner_lite.height;

    if (gate_.update_best_height(height)) {
      LOG_HARNESS_INFO("Height: {}", height);
    }

    if (height >= config_.height_target && !finished_.exchange(true)) {
      const auto s = stats();
      if (gate_.set_success()) {
        LOG_HARNESS_INFO("SUCCESS DROP={} TOTAL={}", s.dropped, s.total);
      } else {
        LOG_HARNESS_DEBUG("link {}->{} reached height {}: DROP={} TOTAL={}", from,
                          to, height, s.dropped, s.total);
      }
    }
  }

  const bool drop = draw() < config_.drop_ratio;

  total_.fetch_add(1, std::memory_order_acq_rel);
  if (drop) {
    dropped_.fetch_add(1, std::memory_order_acq_rel);
  }
  return !drop;
}

DropHandler::Stats DropHandler::stats() const {
  Stats s;
  s.dropped = dropped();
  s.total = total();
  s.finished = finished();
  return s;
}

uint64_t LinkStreamId(int from, int to) {
  return (static_cast<uint64_t>(static_cast<uint32_t>(from)) << 32) |
         static_cast<uint32_t>(to);
}

network::ProxyHandlerFactory MakeDropHandlerFactory(LivenessGate &gate,
                                                    DropPolicyConfig config) {
  config.Validate();
  return [&gate, config](int from, int to) -> std::unique_ptr<network::ProxyHandler> {
    return std::make_unique<DropHandler>(gate, config, LinkStreamId(from, to));
  };
}

} // namespace harness
} // namespace dropnet
