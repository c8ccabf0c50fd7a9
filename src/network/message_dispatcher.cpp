#include "network/message_dispatcher.hpp"
#include "network/message.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace dropnet {
namespace network {

void MessageDispatcher::RegisterHandler(const std::string& command,
                                        MessageHandler handler) {
  if (command.empty()) {
    LOG_NET_WARN("Attempted to register handler for empty command");
    return;
  }

  if (!handler) {
    LOG_NET_ERROR("Attempted to register empty handler for command: {}", command);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[command] = std::move(handler);
  LOG_NET_DEBUG("Registered handler for command: {}", command);
}

void MessageDispatcher::UnregisterHandler(const std::string& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(command) > 0) {
    LOG_NET_DEBUG("Unregistered handler for command: {}", command);
  }
}

bool MessageDispatcher::Dispatch(int from_peer,
                                 const std::string& command,
                                 ::dropnet::message::Message* msg) {
  if (command.empty()) {
    LOG_NET_WARN("MessageDispatcher::Dispatch called with empty command");
    return false;
  }

  if (!msg) {
    LOG_NET_WARN("MessageDispatcher::Dispatch called with null message");
    return false;
  }

  // Copy the handler out so it runs without the lock held
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      LOG_NET_TRACE("No handler for command: {} (from node {})", command, from_peer);
      return false;
    }
    handler = it->second;
  }

  try {
    return handler(from_peer, msg);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("Handler exception for command {} from node {}: {}", command,
                  from_peer, e.what());
    return false;
  }
}

bool MessageDispatcher::HasHandler(const std::string& command) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(command) > 0;
}

std::vector<std::string> MessageDispatcher::GetRegisteredCommands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(handlers_.size());
  for (const auto& [cmd, _] : handlers_) {
    result.push_back(cmd);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace network
} // namespace dropnet
