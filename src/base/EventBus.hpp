#ifndef __MT_EVENT_BUS_HPP__
#define __MT_EVENT_BUS_HPP__

#include "Headers.hpp"

namespace mt {
/**
 * @brief Named event channels shared between backends and the UI side.
 *
 * Backends `emit()` serialized payloads on a channel name, listeners are
 * registered per channel and removed by the id returned from `listen()`.
 * Only the control loop touches the bus.
 */
class EventBus {
 public:
  typedef std::function<void(const string& payload)> Listener;
  typedef int64_t ListenerId;

  EventBus();

  /** @brief Registers a listener on `channel` and returns its id. */
  ListenerId listen(const string& channel, Listener listener);
  /** @brief Removes a listener. Unknown ids are ignored. */
  bool unlisten(ListenerId id);
  /**
   * @brief Delivers `payload` to every listener of `channel`.
   *
   * A listener removed by an earlier listener of the same emit is skipped.
   * @return The number of listeners that were invoked.
   */
  int emit(const string& channel, const string& payload);

  int numListeners(const string& channel);
  int numListeners() { return int(channelForListener.size()); }

 protected:
  map<string, map<ListenerId, Listener>> listeners;
  map<ListenerId, string> channelForListener;
  ListenerId nextListenerId;
};
}  // namespace mt

#endif  // __MT_EVENT_BUS_HPP__
