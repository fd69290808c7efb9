#ifndef __MT_RESIZE_RECONCILER_HPP__
#define __MT_RESIZE_RECONCILER_HPP__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "MountTarget.hpp"
#include "RenderEngine.hpp"

namespace mt {
/**
 * @brief Turns bursts of geometry changes into at most one backend resize.
 *
 * Every change on the mount target restarts a single debounce timer.  When
 * it fires the engine is refitted and, if the grid size differs from the
 * last one reported, the resize handler runs once.
 */
class ResizeReconciler {
 public:
  typedef std::function<void(int rows, int cols)> ResizeHandler;

  ResizeReconciler(shared_ptr<EventLoop> _loop,
                   std::chrono::milliseconds _debounce);
  ~ResizeReconciler();

  /** @brief Starts observing `target`.  Restarts if already running. */
  void start(MountTarget* _target, shared_ptr<RenderEngine> _engine,
             ResizeHandler _handler);
  /** @brief Cancels the pending timer and detaches from the target. */
  void stop();
  /** @brief Records a size that the backend already knows about. */
  void setReportedSize(int rows, int cols);
  /** @brief Called on every geometry change. */
  void geometryChanged();

  bool isRunning() { return target != NULL; }
  bool isPending() { return bool(pendingTimer); }

 protected:
  void reconcile();

  shared_ptr<EventLoop> loop;
  std::chrono::milliseconds debounce;
  MountTarget* target;
  shared_ptr<RenderEngine> engine;
  ResizeHandler handler;
  optional<MountTarget::ObserverId> observerId;
  optional<EventLoop::TimerId> pendingTimer;
  int reportedRows;
  int reportedCols;
};
}  // namespace mt

#endif  // __MT_RESIZE_RECONCILER_HPP__
