#ifndef DROPNET_NETWORK_MESSAGE_DISPATCHER_HPP
#define DROPNET_NETWORK_MESSAGE_DISPATCHER_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dropnet {

namespace message {
class Message;
} // namespace message

namespace network {

/**
 * MessageDispatcher - routes decoded messages to per-command handlers
 *
 * A validator node registers one handler per command it understands and
 * feeds every frame it receives through Dispatch().
 *
 * Ownership Model:
 * - Handlers receive raw Message* pointer (borrowed, not owned)
 * - Message lifetime guaranteed only during handler execution
 * - Handlers must complete synchronously
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler("status",
 *     [this](int from, message::Message* m) {
 *       return HandleStatus(from, static_cast<message::StatusMessage&>(*m));
 *     });
 *   dispatcher.Dispatch(from, "status", msg);
 */
class MessageDispatcher {
public:
  // Handler signature: sending node index + message, returns success
  using MessageHandler = std::function<bool(int, ::dropnet::message::Message*)>;

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  MessageDispatcher(const MessageDispatcher&) = delete;
  MessageDispatcher& operator=(const MessageDispatcher&) = delete;

  /**
   * Register handler for a message command. Empty commands and empty
   * handlers are rejected (logged, not registered).
   */
  void RegisterHandler(const std::string& command, MessageHandler handler);

  void UnregisterHandler(const std::string& command);

  /**
   * Dispatch message to registered handler
   *
   * @return false if no handler found, the handler returned false or the
   *         handler threw (the exception is logged)
   */
  bool Dispatch(int from_peer, const std::string& command, ::dropnet::message::Message* msg);

  bool HasHandler(const std::string& command) const;

  // Sorted list of registered commands (for diagnostics)
  std::vector<std::string> GetRegisteredCommands() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, MessageHandler> handlers_;
};

} // namespace network
} // namespace dropnet

#endif // DROPNET_NETWORK_MESSAGE_DISPATCHER_HPP
