#ifndef __MT_VIEWPORT_HPP__
#define __MT_VIEWPORT_HPP__

#include "Headers.hpp"
#include "MountTarget.hpp"

namespace mt {
/**
 * @brief A mount target whose size is set by the owner (the panel layout,
 * or a test).
 */
class Viewport : public MountTarget {
 public:
  Viewport(int _width = 0, int _height = 0);

  virtual int width() { return currentWidth; }
  virtual int height() { return currentHeight; }
  virtual ObserverId observe(GeometryObserver observer);
  virtual void unobserve(ObserverId id);

  /** @brief Changes the geometry and notifies observers if it differs. */
  void setSize(int _width, int _height);
  int numObservers() { return int(observers.size()); }

 protected:
  int currentWidth;
  int currentHeight;
  map<ObserverId, GeometryObserver> observers;
  ObserverId nextObserverId;
};
}  // namespace mt

#endif  // __MT_VIEWPORT_HPP__
