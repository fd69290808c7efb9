#ifndef __MT_MOUNT_TARGET_HPP__
#define __MT_MOUNT_TARGET_HPP__

#include "Headers.hpp"

namespace mt {
/**
 * @brief The on-screen box a terminal surface is attached to.
 *
 * Sizes are in pixels.  Observers are told whenever the geometry changes;
 * they measure the target themselves.
 */
class MountTarget {
 public:
  typedef int64_t ObserverId;
  typedef std::function<void()> GeometryObserver;

  virtual ~MountTarget() {}

  virtual int width() = 0;
  virtual int height() = 0;
  virtual ObserverId observe(GeometryObserver observer) = 0;
  virtual void unobserve(ObserverId id) = 0;
};
}  // namespace mt

#endif  // __MT_MOUNT_TARGET_HPP__
