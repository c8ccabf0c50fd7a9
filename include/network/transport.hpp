#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace dropnet {
namespace network {

// Abstract transport interface between validator nodes.
// A connection is one direction of one node pair: the owning node sends on
// it and the receive callback delivers frames at the remote node.
// - ProxyLink: in-process link that passes every frame through a
//   ProxyHandler before delivery (network/proxy.hpp)

class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;

class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Send data (returns true if accepted, false if the connection is closed).
  // Accepted is not delivered: the frame may still be discarded in flight.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Node indices at each end
  virtual int local_node() const = 0;
  virtual int remote_node() const = 0;
  virtual uint64_t connection_id() const = 0;

  // Invoked with each delivered frame, at the remote end
  virtual void set_receive_callback(ReceiveCallback callback) = 0;
};

} // namespace network
} // namespace dropnet
