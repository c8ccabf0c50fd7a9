// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cluster/validator_node.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace dropnet {
namespace cluster {

// Ping peers every N status rounds
static constexpr uint64_t PING_EVERY_STATUS_ROUNDS = 4;

ValidatorNode::ValidatorNode(int id, chain::GenesisConfig genesis,
                             chain::NodeConfig config, uint32_t magic)
    : id_(id), genesis_(std::move(genesis)), config_(config), magic_(magic),
      production_timer_(io_context_), status_timer_(io_context_) {
  auto genesis_block = chain::MakeGenesisBlock(genesis_);
  genesis_hash_ = genesis_block.GetHash();
  head_hash_.store(genesis_hash_);
  chain_.push_back(std::move(genesis_block));
  RegisterHandlers();
}

ValidatorNode::~ValidatorNode() { Stop(); }

void ValidatorNode::RegisterHandlers() {
  dispatcher_.RegisterHandler(protocol::commands::HANDSHAKE,
                              [this](int from, message::Message *m) {
                                return HandleHandshake(
                                    from, static_cast<message::HandshakeMessage &>(*m));
                              });
  dispatcher_.RegisterHandler(protocol::commands::STATUS,
                              [this](int from, message::Message *m) {
                                return HandleStatus(
                                    from, static_cast<message::StatusMessage &>(*m));
                              });
  dispatcher_.RegisterHandler(protocol::commands::BLOCK,
                              [this](int from, message::Message *m) {
                                return HandleBlock(
                                    from, static_cast<message::BlockMessage &>(*m));
                              });
  dispatcher_.RegisterHandler(protocol::commands::BLOCK_REQUEST,
                              [this](int from, message::Message *m) {
                                return HandleBlockRequest(
                                    from, static_cast<message::BlockRequestMessage &>(*m));
                              });
  dispatcher_.RegisterHandler(protocol::commands::PING,
                              [this](int from, message::Message *m) {
                                return HandlePing(
                                    from, static_cast<message::PingMessage &>(*m));
                              });
  dispatcher_.RegisterHandler(protocol::commands::PONG,
                              [this](int from, message::Message *m) {
                                return HandlePong(
                                    from, static_cast<message::PongMessage &>(*m));
                              });
}

void ValidatorNode::AddPeer(network::TransportConnectionPtr connection) {
  if (!connection) {
    return;
  }
  const int peer = connection->remote_node();
  PeerState state;
  state.connection = std::move(connection);
  peers_[peer] = std::move(state);
}

void ValidatorNode::Deliver(int from, const std::vector<uint8_t> &frame) {
  if (!started_.load(std::memory_order_acquire)) {
    return;
  }
  boost::asio::post(io_context_, [this, from, frame]() { OnFrame(from, frame); });
}

void ValidatorNode::Start() {
  if (started_.exchange(true)) {
    return;
  }
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  thread_ = std::thread([this]() { io_context_.run(); });
  boost::asio::post(io_context_, [this]() { OnStart(); });
}

void ValidatorNode::Stop() {
  running_.store(false, std::memory_order_release);

  work_guard_.reset();
  io_context_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

NodeStats ValidatorNode::stats() const {
  NodeStats s;
  s.produced = produced_.load();
  s.received = received_.load();
  s.relayed = relayed_.load();
  s.requested = requested_.load();
  s.served = served_.load();
  s.pings = pings_.load();
  s.pongs = pongs_.load();
  s.ignored = ignored_.load();
  return s;
}

std::optional<chain::BlockV1> ValidatorNode::GetBlock(uint64_t height) const {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  if (height >= chain_.size()) {
    return std::nullopt;
  }
  return chain_[height];
}

std::vector<int> ValidatorNode::peer_ids() const {
  std::vector<int> ids;
  for (const auto &[peer, _] : peers_) {
    ids.push_back(peer);
  }
  return ids;
}

// ============================================================================
// io thread
// ============================================================================

void ValidatorNode::OnStart() {
  running_.store(true, std::memory_order_release);
  LOG_CLUSTER_DEBUG("node {} running with {} peer(s)", id_, peers_.size());

  for (const auto &[peer, _] : peers_) {
    SendHandshake(peer);
  }
  ScheduleStatus();
  MaybeScheduleProduction();
}

void ValidatorNode::OnFrame(int from, const std::vector<uint8_t> &frame) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto it = peers_.find(from);
  if (it == peers_.end() || it->second.ignored) {
    ignored_.fetch_add(1);
    return;
  }

  auto decoded = message::decode_frame(frame, magic_);
  if (!decoded.valid) {
    ignored_.fetch_add(1);
    LOG_NET_TRACE("node {}: undecodable frame from node {} (command '{}')", id_,
                  from, decoded.command);
    return;
  }

  if (decoded.command != protocol::commands::HANDSHAKE &&
      !it->second.handshake_received) {
    ignored_.fetch_add(1);
    LOG_NET_TRACE("node {}: '{}' from node {} before handshake", id_,
                  decoded.command, from);
    return;
  }

  if (!dispatcher_.Dispatch(from, decoded.command, decoded.msg.get())) {
    LOG_NET_TRACE("node {}: '{}' from node {} not accepted", id_, decoded.command, from);
  }
}

bool ValidatorNode::HandleHandshake(int from, const message::HandshakeMessage &msg) {
  auto &peer = peers_[from];
  if (msg.genesis_hash != genesis_hash_) {
    peer.ignored = true;
    LOG_NET_WARN("node {}: peer {} has genesis {:08x}, expected {:08x}; ignoring it",
                 id_, from, msg.genesis_hash, genesis_hash_);
    return false;
  }

  if (peer.handshake_received) {
    // A repeated handshake means ours never arrived
    SendHandshake(from);
  } else {
    peer.handshake_received = true;
    LOG_NET_DEBUG("node {}: handshake from node {} ({}, head {})", id_, from,
                  msg.user_agent, msg.head_height);
  }

  peer.best_known = std::max(peer.best_known, msg.head_height);
  if (msg.head_height > head_height()) {
    RequestFrom(from, head_height() + 1);
  }
  return true;
}

bool ValidatorNode::HandleStatus(int from, const message::StatusMessage &msg) {
  auto &peer = peers_[from];
  peer.best_known = std::max(peer.best_known, msg.head_height);
  if (msg.head_height > head_height()) {
    RequestFrom(from, head_height() + 1);
  }
  return true;
}

bool ValidatorNode::HandleBlock(int from, const message::BlockMessage &msg) {
  const auto &block = msg.block;
  const uint64_t height = block.height();

  if (height == 0 || block.header.num_shards != genesis_.num_shards ||
      block.header.inner_lite.producer != genesis_.ProposerFor(height)) {
    ignored_.fetch_add(1);
    LOG_CHAIN_DEBUG("node {}: rejected block {} from node {}", id_,
                    block.header.ToString(), from);
    return false;
  }

  const uint64_t head = head_height();
  if (height <= head) {
    return true;
  }

  if (height > head + 1) {
    auto &peer = peers_[from];
    peer.best_known = std::max(peer.best_known, height);
    RequestFrom(from, head + 1);
    return true;
  }

  if (!AppendBlock(block)) {
    ignored_.fetch_add(1);
    return false;
  }
  received_.fetch_add(1);

  message::BlockMessage relay(block);
  Broadcast(relay, from);
  MaybeScheduleProduction();
  return true;
}

bool ValidatorNode::HandleBlockRequest(int from, const message::BlockRequestMessage &msg) {
  const uint64_t head = head_height();
  if (msg.height == 0 || msg.height > head) {
    return true;
  }

  const uint64_t last =
      std::min<uint64_t>(head, msg.height + config_.max_blocks_per_request - 1);
  for (uint64_t h = msg.height; h <= last; ++h) {
    auto block = GetBlock(h);
    if (!block) {
      break;
    }
    if (SendTo(from, message::BlockMessage(std::move(*block)))) {
      served_.fetch_add(1);
    }
  }
  LOG_NET_TRACE("node {}: served blocks {}..{} to node {}", id_, msg.height, last, from);
  return true;
}

bool ValidatorNode::HandlePing(int from, const message::PingMessage &msg) {
  pings_.fetch_add(1);
  SendTo(from, message::PongMessage(msg.nonce));
  return true;
}

bool ValidatorNode::HandlePong(int, const message::PongMessage &) {
  pongs_.fetch_add(1);
  return true;
}

bool ValidatorNode::AppendBlock(const chain::BlockV1 &block) {
  std::lock_guard<std::mutex> lock(chain_mutex_);
  const auto &tip = chain_.back();
  if (block.height() != tip.height() + 1 ||
      block.header.inner_lite.prev_hash != tip.GetHash()) {
    return false;
  }
  chain_.push_back(block);
  head_hash_.store(block.GetHash(), std::memory_order_release);
  head_height_.store(block.height(), std::memory_order_release);
  LOG_CHAIN_TRACE("node {}: new head {}", id_, block.header.ToString());
  return true;
}

chain::BlockV1 ValidatorNode::BuildNextBlock() const {
  chain::BlockV1 block;
  const uint64_t height = head_height() + 1;

  auto &inner = block.header.inner_lite;
  inner.height = height;
  inner.epoch_id = height / genesis_.epoch_length;
  inner.prev_hash = head_hash();
  inner.timestamp_ms = util::GetTimeMillis();
  inner.producer = static_cast<uint32_t>(id_);

  block.header.num_shards = genesis_.num_shards;
  block.header.chunk_mask = genesis_.num_shards >= chain::MAX_SHARDS
                                ? 0xffffffffu
                                : ((1u << genesis_.num_shards) - 1);
  for (uint32_t shard = 0; shard < genesis_.num_shards; ++shard) {
    block.chunks.push_back(chain::ChunkHeader{shard, height});
  }
  return block;
}

void ValidatorNode::MaybeScheduleProduction() {
  const uint64_t next = head_height() + 1;
  if (genesis_.ProposerFor(next) != static_cast<uint32_t>(id_)) {
    return;
  }
  if (production_scheduled_for_ == next) {
    return;
  }

  production_scheduled_for_ = next;
  production_timer_.expires_after(
      std::chrono::milliseconds(config_.block_production_interval_ms));
  production_timer_.async_wait([this, next](const boost::system::error_code &ec) {
    if (!ec) {
      OnProductionTimer(next);
    }
  });
}

void ValidatorNode::OnProductionTimer(uint64_t height) {
  production_scheduled_for_.reset();
  if (!running_.load(std::memory_order_acquire) || head_height() + 1 != height) {
    return;
  }

  auto block = BuildNextBlock();
  if (!AppendBlock(block)) {
    return;
  }
  produced_.fetch_add(1);
  LOG_CHAIN_DEBUG("node {} produced block {} at {}", id_, height,
                  util::FormatTimeMillis(block.header.inner_lite.timestamp_ms));

  Broadcast(message::BlockMessage(std::move(block)));
  MaybeScheduleProduction();
}

void ValidatorNode::ScheduleStatus() {
  status_timer_.expires_after(std::chrono::milliseconds(config_.status_interval_ms));
  status_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (!ec) {
      OnStatusTimer();
    }
  });
}

void ValidatorNode::OnStatusTimer() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  Broadcast(message::StatusMessage(head_height(), head_hash()));

  for (const auto &[peer, state] : peers_) {
    if (!state.handshake_received && !state.ignored) {
      SendHandshake(peer);
    }
  }

  if (++ping_nonce_ % PING_EVERY_STATUS_ROUNDS == 0) {
    Broadcast(message::PingMessage(ping_nonce_));
  }

  ScheduleStatus();
}

void ValidatorNode::RequestFrom(int peer, uint64_t from_height) {
  auto it = peers_.find(peer);
  if (it == peers_.end()) {
    return;
  }

  // One outstanding request per (peer, height) per status interval
  auto &state = it->second;
  const auto now = std::chrono::steady_clock::now();
  if (state.last_request_height == from_height &&
      now - state.last_request_time <
          std::chrono::milliseconds(config_.status_interval_ms)) {
    return;
  }

  if (SendTo(peer, message::BlockRequestMessage(from_height))) {
    state.last_request_height = from_height;
    state.last_request_time = now;
    requested_.fetch_add(1);
  }
}

bool ValidatorNode::SendTo(int peer, const message::Message &msg) {
  auto it = peers_.find(peer);
  if (it == peers_.end() || it->second.ignored || !it->second.connection) {
    return false;
  }
  return it->second.connection->send(message::encode_frame(magic_, msg));
}

void ValidatorNode::Broadcast(const message::Message &msg, int except) {
  const auto frame = message::encode_frame(magic_, msg);
  const bool is_block = msg.command() == protocol::commands::BLOCK;
  for (const auto &[peer, state] : peers_) {
    if (peer == except || state.ignored || !state.connection) {
      continue;
    }
    if (state.connection->send(frame) && is_block && except >= 0) {
      relayed_.fetch_add(1);
    }
  }
}

void ValidatorNode::SendHandshake(int peer) {
  message::HandshakeMessage handshake;
  handshake.node_id = static_cast<uint32_t>(id_);
  handshake.genesis_hash = genesis_hash_;
  handshake.head_height = head_height();
  SendTo(peer, handshake);
}

} // namespace cluster
} // namespace dropnet
