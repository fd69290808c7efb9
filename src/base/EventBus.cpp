#include "EventBus.hpp"

namespace mt {
EventBus::EventBus() : nextListenerId(1) {}

EventBus::ListenerId EventBus::listen(const string& channel,
                                      Listener listener) {
  ListenerId id = nextListenerId++;
  listeners[channel][id] = listener;
  channelForListener[id] = channel;
  VLOG(2) << "Listening on " << channel << " (" << id << ")";
  return id;
}

bool EventBus::unlisten(ListenerId id) {
  auto it = channelForListener.find(id);
  if (it == channelForListener.end()) {
    return false;
  }
  auto channelIt = listeners.find(it->second);
  if (channelIt != listeners.end()) {
    channelIt->second.erase(id);
    if (channelIt->second.empty()) {
      listeners.erase(channelIt);
    }
  }
  VLOG(2) << "Stopped listening on " << it->second << " (" << id << ")";
  channelForListener.erase(it);
  return true;
}

int EventBus::emit(const string& channel, const string& payload) {
  auto channelIt = listeners.find(channel);
  if (channelIt == listeners.end()) {
    VLOG(2) << "No listeners on " << channel;
    return 0;
  }
  // Copy the ids first, listeners may unlisten while we dispatch
  vector<ListenerId> ids;
  for (auto& it : channelIt->second) {
    ids.push_back(it.first);
  }
  int delivered = 0;
  for (auto id : ids) {
    auto current = listeners.find(channel);
    if (current == listeners.end()) {
      break;
    }
    auto listenerIt = current->second.find(id);
    if (listenerIt == current->second.end()) {
      continue;
    }
    Listener listener = listenerIt->second;
    listener(payload);
    delivered++;
  }
  return delivered;
}

int EventBus::numListeners(const string& channel) {
  auto it = listeners.find(channel);
  if (it == listeners.end()) {
    return 0;
  }
  return int(it->second.size());
}
}  // namespace mt
