// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "network/protocol.hpp"
#include <atomic>
#include <utility>  // before asio: Boost 1.74 awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace dropnet {

namespace message {
class Message;
} // namespace message

namespace network {

/**
 * ProxyHandler - decides the fate of every message crossing one link.
 *
 * handle() returns true to forward the original frame unchanged, false to
 * discard it. It runs on the link's strand, so calls for one link never
 * overlap. An exception is a harness fault, not a drop.
 */
class ProxyHandler {
public:
  virtual ~ProxyHandler() = default;

  virtual bool handle(const message::Message &msg, int from, int to) = 0;
};

// Called once per link when the cluster creates it
using ProxyHandlerFactory =
    std::function<std::unique_ptr<ProxyHandler>(int from, int to)>;

// A handler threw while intercepting a message on link (from, to)
class InterceptError : public std::runtime_error {
public:
  InterceptError(int from, int to, const std::string &what);

  int from() const noexcept { return from_; }
  int to() const noexcept { return to_; }

private:
  int from_;
  int to_;
};

/**
 * InterceptFault - shared latch for the first handler failure.
 *
 * Written by proxy threads, read by the driver loop. Only the first
 * recorded exception is kept.
 */
class InterceptFault {
public:
  // Returns true if this call recorded the fault
  bool record(std::exception_ptr error);

  bool has_fault() const noexcept { return faulted_.load(std::memory_order_acquire); }

  std::exception_ptr get() const;

  // Rethrows the recorded exception, if any
  void rethrow_if_faulted() const;

private:
  std::atomic<bool> faulted_{false};
  mutable std::mutex mutex_;
  std::exception_ptr error_;
};

struct ProxyConfig {
  size_t threads = 2;
  uint32_t magic = protocol::magic::LOCALNET;
};

struct LinkStats {
  uint64_t intercepted = 0;
  uint64_t forwarded = 0;
  uint64_t dropped = 0;
  uint64_t undecodable = 0;

  LinkStats &operator+=(const LinkStats &other);
};

/**
 * ProxyLink - one direction of one node pair.
 *
 * send() posts the frame onto this link's strand; intercept() decodes it,
 * asks the handler, and hands the original bytes to the receive callback
 * when the handler says forward. Once the shared fault latch is set nothing
 * is forwarded on any link.
 */
class ProxyLink : public TransportConnection,
                  public std::enable_shared_from_this<ProxyLink> {
public:
  ProxyLink(boost::asio::io_context &io_context, int from, int to,
            std::unique_ptr<ProxyHandler> handler, InterceptFault &fault,
            uint32_t magic);

  ProxyLink(const ProxyLink &) = delete;
  ProxyLink &operator=(const ProxyLink &) = delete;

  // TransportConnection interface
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_.load(std::memory_order_acquire); }
  int local_node() const override { return from_; }
  int remote_node() const override { return to_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;

  LinkStats stats() const;

  // Runs the interception synchronously on the calling thread. send() calls
  // this on the strand; exposed so tests can drive a link without a pool.
  void intercept(const std::vector<uint8_t> &frame);

private:
  void deliver(const std::vector<uint8_t> &frame);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  const int from_;
  const int to_;
  const uint32_t magic_;
  const uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  std::unique_ptr<ProxyHandler> handler_;
  InterceptFault &fault_;

  std::atomic<bool> open_{true};

  mutable std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;

  std::atomic<uint64_t> intercepted_{0};
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> undecodable_{0};
};

using ProxyLinkPtr = std::shared_ptr<ProxyLink>;

/**
 * Proxy - owns the interception thread pool and every link.
 *
 * Links share one io_context run by config.threads threads; each link
 * serializes on its own strand, so different links run concurrently.
 */
class Proxy {
public:
  Proxy(ProxyConfig config, ProxyHandlerFactory factory, InterceptFault &fault);
  ~Proxy();

  Proxy(const Proxy &) = delete;
  Proxy &operator=(const Proxy &) = delete;

  // Builds the link and its handler. Throws std::invalid_argument for a
  // self-link and std::runtime_error if the factory returns no handler.
  ProxyLinkPtr create_link(int from, int to);

  void start();

  // Closes every link and joins the pool. Idempotent.
  void stop();

  bool is_running() const { return running_.load(); }

  std::vector<ProxyLinkPtr> links() const;

  LinkStats total_stats() const;

  void log_stats() const;

private:
  ProxyConfig config_;
  ProxyHandlerFactory factory_;
  InterceptFault &fault_;

  // Destroyed only in ~Proxy() so strands of surviving links stay valid
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};

  mutable std::mutex links_mutex_;
  std::vector<ProxyLinkPtr> links_;
};

} // namespace network
} // namespace dropnet
