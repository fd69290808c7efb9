#include "EventRouter.hpp"

#include "TerminalBackend.hpp"

namespace mt {
EventRouter::EventRouter(shared_ptr<EventBus> _bus)
    : bus(_bus), nextGeneration(1), staleEvents(0) {}

EventRouter::~EventRouter() {
  for (auto& it : subscriptions) {
    for (auto listenerId : it.second.listenerIds) {
      bus->unlisten(listenerId);
    }
  }
}

void EventRouter::subscribe(const string& connectionId,
                            const RouteTarget& target) {
  if (isSubscribed(connectionId)) {
    LOG(INFO) << "Replacing subscription for " << connectionId;
    unsubscribe(connectionId);
  }
  Subscription subscription;
  subscription.target = target;
  subscription.generation = nextGeneration++;
  int64_t generation = subscription.generation;

  subscription.listenerIds.push_back(bus->listen(
      outputChannel(connectionId),
      [this, connectionId, generation](const string& payload) {
        Subscription* s = lookup(connectionId, generation);
        if (s == NULL || !s->target.onOutput) {
          return;
        }
        auto output = stringToProto<TerminalOutput>(payload);
        // The target may unsubscribe while it runs
        auto callback = s->target.onOutput;
        callback(output.data());
      }));
  subscription.listenerIds.push_back(bus->listen(
      errorChannel(connectionId),
      [this, connectionId, generation](const string& payload) {
        Subscription* s = lookup(connectionId, generation);
        if (s == NULL || !s->target.onError) {
          return;
        }
        auto error = stringToProto<TerminalError>(payload);
        auto callback = s->target.onError;
        callback(error.error());
      }));
  subscription.listenerIds.push_back(bus->listen(
      closedChannel(connectionId),
      [this, connectionId, generation](const string& payload) {
        Subscription* s = lookup(connectionId, generation);
        if (s == NULL || !s->target.onClosed) {
          return;
        }
        auto closed = stringToProto<TerminalClosed>(payload);
        auto callback = s->target.onClosed;
        callback(closed.exit_status());
      }));

  subscriptions.insert(make_pair(connectionId, subscription));
  VLOG(1) << "Subscribed to events of " << connectionId;
}

bool EventRouter::unsubscribe(const string& connectionId) {
  auto it = subscriptions.find(connectionId);
  if (it == subscriptions.end()) {
    return false;
  }
  for (auto listenerId : it->second.listenerIds) {
    bus->unlisten(listenerId);
  }
  subscriptions.erase(it);
  VLOG(1) << "Unsubscribed from events of " << connectionId;
  return true;
}

EventRouter::Subscription* EventRouter::lookup(const string& connectionId,
                                               int64_t generation) {
  auto it = subscriptions.find(connectionId);
  if (it == subscriptions.end() || it->second.generation != generation) {
    staleEvents++;
    VLOG(1) << "Dropping stale event for " << connectionId;
    return NULL;
  }
  return &(it->second);
}
}  // namespace mt
