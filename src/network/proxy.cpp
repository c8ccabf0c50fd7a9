// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/proxy.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"

namespace dropnet {
namespace network {

// ============================================================================
// InterceptError / InterceptFault
// ============================================================================

InterceptError::InterceptError(int from, int to, const std::string &what)
    : std::runtime_error("handler failed on link " + std::to_string(from) +
                         "->" + std::to_string(to) + ": " + what),
      from_(from), to_(to) {}

bool InterceptFault::record(std::exception_ptr error) {
  if (!error) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_) {
    return false;
  }
  error_ = std::move(error);
  faulted_.store(true, std::memory_order_release);
  return true;
}

std::exception_ptr InterceptFault::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void InterceptFault::rethrow_if_faulted() const {
  if (auto error = get()) {
    std::rethrow_exception(error);
  }
}

LinkStats &LinkStats::operator+=(const LinkStats &other) {
  intercepted += other.intercepted;
  forwarded += other.forwarded;
  dropped += other.dropped;
  undecodable += other.undecodable;
  return *this;
}

// ============================================================================
// ProxyLink
// ============================================================================

std::atomic<uint64_t> ProxyLink::next_id_{1};

ProxyLink::ProxyLink(boost::asio::io_context &io_context, int from, int to,
                     std::unique_ptr<ProxyHandler> handler,
                     InterceptFault &fault, uint32_t magic)
    : strand_(boost::asio::make_strand(io_context)), from_(from), to_(to),
      magic_(magic), id_(next_id_.fetch_add(1)), handler_(std::move(handler)),
      fault_(fault) {}

bool ProxyLink::send(const std::vector<uint8_t> &data) {
  if (!is_open()) {
    return false;
  }
  boost::asio::post(strand_, [self = shared_from_this(), data]() {
    self->intercept(data);
  });
  return true;
}

void ProxyLink::close() {
  if (!open_.exchange(false)) {
    return;
  }
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = {};
}

void ProxyLink::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

LinkStats ProxyLink::stats() const {
  LinkStats s;
  s.intercepted = intercepted_.load(std::memory_order_relaxed);
  s.forwarded = forwarded_.load(std::memory_order_relaxed);
  s.dropped = dropped_.load(std::memory_order_relaxed);
  s.undecodable = undecodable_.load(std::memory_order_relaxed);
  return s;
}

void ProxyLink::intercept(const std::vector<uint8_t> &frame) {
  // A faulted harness forwards nothing
  if (!is_open() || fault_.has_fault()) {
    return;
  }

  auto decoded = message::decode_frame(frame, magic_);
  intercepted_.fetch_add(1, std::memory_order_relaxed);
  if (!decoded.valid) {
    undecodable_.fetch_add(1, std::memory_order_relaxed);
    LOG_PROXY_TRACE("link {}->{}: undecodable frame ({} bytes, command '{}')",
                    from_, to_, frame.size(), decoded.command);
  }

  bool forward = false;
  try {
    forward = handler_->handle(*decoded.msg, from_, to_);
  } catch (const std::exception &e) {
    if (fault_.record(std::make_exception_ptr(InterceptError(from_, to_, e.what())))) {
      LOG_PROXY_ERROR("link {}->{}: handler threw on '{}': {}", from_, to_,
                      decoded.command, e.what());
    }
    return;
  } catch (...) {
    if (fault_.record(std::make_exception_ptr(
            InterceptError(from_, to_, "non-standard exception")))) {
      LOG_PROXY_ERROR("link {}->{}: handler threw a non-standard exception on '{}'",
                      from_, to_, decoded.command);
    }
    return;
  }

  if (!forward) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    LOG_PROXY_TRACE("link {}->{}: dropped '{}'", from_, to_, decoded.command);
    return;
  }

  forwarded_.fetch_add(1, std::memory_order_relaxed);
  deliver(frame);
}

void ProxyLink::deliver(const std::vector<uint8_t> &frame) {
  ReceiveCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = receive_callback_;
  }
  if (callback) {
    callback(frame);
  }
}

// ============================================================================
// Proxy
// ============================================================================

Proxy::Proxy(ProxyConfig config, ProxyHandlerFactory factory,
             InterceptFault &fault)
    : config_(config), factory_(std::move(factory)), fault_(fault),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  if (config_.threads == 0) {
    config_.threads = 1;
  }
}

Proxy::~Proxy() { stop(); }

ProxyLinkPtr Proxy::create_link(int from, int to) {
  if (from == to) {
    throw std::invalid_argument("proxy link from node " + std::to_string(from) +
                                " to itself");
  }
  if (!factory_) {
    throw std::runtime_error("proxy has no handler factory");
  }
  auto handler = factory_(from, to);
  if (!handler) {
    throw std::runtime_error("handler factory returned no handler for link " +
                             std::to_string(from) + "->" + std::to_string(to));
  }

  auto link = std::make_shared<ProxyLink>(*io_context_, from, to,
                                          std::move(handler), fault_,
                                          config_.magic);
  std::lock_guard<std::mutex> lock(links_mutex_);
  links_.push_back(link);
  LOG_PROXY_DEBUG("created link {}->{} (id {})", from, to, link->connection_id());
  return link;
}

void Proxy::start() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < config_.threads; i++) {
    threads_.emplace_back([this]() { io_context_->run(); });
  }
  LOG_PROXY_INFO("proxy started with {} thread(s), {} link(s)", config_.threads,
                 links().size());
}

void Proxy::stop() {
  running_.store(false);

  for (const auto &link : links()) {
    link->close();
  }

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

std::vector<ProxyLinkPtr> Proxy::links() const {
  std::lock_guard<std::mutex> lock(links_mutex_);
  return links_;
}

LinkStats Proxy::total_stats() const {
  LinkStats total;
  for (const auto &link : links()) {
    total += link->stats();
  }
  return total;
}

void Proxy::log_stats() const {
  for (const auto &link : links()) {
    auto s = link->stats();
    LOG_PROXY_DEBUG("link {}->{}: intercepted={} forwarded={} dropped={} undecodable={}",
                    link->local_node(), link->remote_node(), s.intercepted,
                    s.forwarded, s.dropped, s.undecodable);
  }
  auto total = total_stats();
  LOG_PROXY_INFO("proxy totals: intercepted={} forwarded={} dropped={} undecodable={}",
                 total.intercepted, total.forwarded, total.dropped,
                 total.undecodable);
}

} // namespace network
} // namespace dropnet
