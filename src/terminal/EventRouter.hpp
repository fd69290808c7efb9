#ifndef __MT_EVENT_ROUTER_HPP__
#define __MT_EVENT_ROUTER_HPP__

#include "EventBus.hpp"
#include "Headers.hpp"

namespace mt {
/** @brief Where the events of one connection end up. */
struct RouteTarget {
  std::function<void(const string& data)> onOutput;
  std::function<void(const string& error)> onError;
  std::function<void(int exitStatus)> onClosed;
};

/**
 * @brief Fans per-connection bus channels out to terminal surfaces.
 *
 * Every delivery looks the connection up in the subscription table again,
 * so events that arrive after `unsubscribe()` never reach a surface.
 */
class EventRouter {
 public:
  explicit EventRouter(shared_ptr<EventBus> _bus);
  ~EventRouter();

  /**
   * @brief Listens on the output, error and closed channels of
   * `connectionId`.  An existing subscription for the id is replaced.
   */
  void subscribe(const string& connectionId, const RouteTarget& target);
  /** @brief Drops the subscription.  Returns false if there was none. */
  bool unsubscribe(const string& connectionId);
  bool isSubscribed(const string& connectionId) const {
    return subscriptions.find(connectionId) != subscriptions.end();
  }
  int size() const { return int(subscriptions.size()); }
  /** @brief Events dropped because their connection was unsubscribed. */
  int64_t numStaleEvents() const { return staleEvents; }

 protected:
  struct Subscription {
    RouteTarget target;
    vector<EventBus::ListenerId> listenerIds;
    int64_t generation;
  };

  /** @brief Returns the live subscription for a delivery, or null. */
  Subscription* lookup(const string& connectionId, int64_t generation);

  shared_ptr<EventBus> bus;
  map<string, Subscription> subscriptions;
  int64_t nextGeneration;
  int64_t staleEvents;
};
}  // namespace mt

#endif  // __MT_EVENT_ROUTER_HPP__
