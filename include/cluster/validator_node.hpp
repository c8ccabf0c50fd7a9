// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "network/message_dispatcher.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>  // before asio: Boost 1.74 awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace dropnet {

namespace message {
class Message;
class HandshakeMessage;
class StatusMessage;
class BlockMessage;
class BlockRequestMessage;
class PingMessage;
class PongMessage;
} // namespace message

namespace cluster {

struct NodeStats {
  uint64_t produced = 0;
  uint64_t received = 0;      // blocks appended from peers
  uint64_t relayed = 0;       // block sends to peers after appending
  uint64_t requested = 0;     // blockreq messages sent
  uint64_t served = 0;        // blocks sent in answer to blockreq
  uint64_t pings = 0;
  uint64_t pongs = 0;
  uint64_t ignored = 0;       // frames dropped by the node itself
};

/**
 * ValidatorNode - an in-process validator running its own io_context.
 *
 * Block production is deterministic: the proposer of height h is
 * genesis.validators[h % size]; it produces h once its head is h-1 and
 * block_production_interval_ms has passed. Blocks are relayed on append.
 * Peers that fall behind catch up through status / blockreq, so a lost
 * block only delays the cluster.
 *
 * All chain and peer state is touched only on the node's io thread.
 * head_height(), head_hash() and stats() are safe from any thread.
 */
class ValidatorNode {
public:
  ValidatorNode(int id, chain::GenesisConfig genesis, chain::NodeConfig config,
                uint32_t magic);
  ~ValidatorNode();

  ValidatorNode(const ValidatorNode &) = delete;
  ValidatorNode &operator=(const ValidatorNode &) = delete;

  // Outbound connection to connection->remote_node(). Call before Start().
  void AddPeer(network::TransportConnectionPtr connection);

  // Entry point for frames arriving from node `from`; any thread
  void Deliver(int from, const std::vector<uint8_t> &frame);

  void Start();

  // Stops timers and joins the io thread. Idempotent.
  void Stop();

  // True once the io thread has run the start-up handler
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  int id() const { return id_; }
  uint64_t head_height() const { return head_height_.load(std::memory_order_acquire); }
  uint32_t head_hash() const { return head_hash_.load(std::memory_order_acquire); }
  uint32_t genesis_hash() const { return genesis_hash_; }
  const chain::NodeConfig &config() const { return config_; }

  NodeStats stats() const;

  std::optional<chain::BlockV1> GetBlock(uint64_t height) const;

  std::vector<int> peer_ids() const;

private:
  struct PeerState {
    network::TransportConnectionPtr connection;
    bool handshake_received = false;
    bool ignored = false;       // genesis mismatch
    uint64_t best_known = 0;
    uint64_t last_request_height = 0;
    std::chrono::steady_clock::time_point last_request_time{};
  };

  void RegisterHandlers();

  // io thread
  void OnStart();
  void OnFrame(int from, const std::vector<uint8_t> &frame);
  bool HandleHandshake(int from, const message::HandshakeMessage &msg);
  bool HandleStatus(int from, const message::StatusMessage &msg);
  bool HandleBlock(int from, const message::BlockMessage &msg);
  bool HandleBlockRequest(int from, const message::BlockRequestMessage &msg);
  bool HandlePing(int from, const message::PingMessage &msg);
  bool HandlePong(int from, const message::PongMessage &msg);

  bool AppendBlock(const chain::BlockV1 &block);
  chain::BlockV1 BuildNextBlock() const;
  void MaybeScheduleProduction();
  void OnProductionTimer(uint64_t height);
  void ScheduleStatus();
  void OnStatusTimer();
  void RequestFrom(int peer, uint64_t from_height);

  bool SendTo(int peer, const message::Message &msg);
  void Broadcast(const message::Message &msg, int except = -1);
  void SendHandshake(int peer);

  const int id_;
  const chain::GenesisConfig genesis_;
  const chain::NodeConfig config_;
  const uint32_t magic_;
  uint32_t genesis_hash_{0};

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread thread_;
  boost::asio::steady_timer production_timer_;
  boost::asio::steady_timer status_timer_;
  std::optional<uint64_t> production_scheduled_for_;
  uint64_t ping_nonce_{0};

  network::MessageDispatcher dispatcher_;
  std::map<int, PeerState> peers_;

  mutable std::mutex chain_mutex_;
  std::vector<chain::BlockV1> chain_; // index == height

  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> head_height_{0};
  std::atomic<uint32_t> head_hash_{0};

  std::atomic<uint64_t> produced_{0};
  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> relayed_{0};
  std::atomic<uint64_t> requested_{0};
  std::atomic<uint64_t> served_{0};
  std::atomic<uint64_t> pings_{0};
  std::atomic<uint64_t> pongs_{0};
  std::atomic<uint64_t> ignored_{0};
};

} // namespace cluster
} // namespace dropnet
