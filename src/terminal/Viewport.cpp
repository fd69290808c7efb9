#include "Viewport.hpp"

namespace mt {
Viewport::Viewport(int _width, int _height)
    : currentWidth(_width), currentHeight(_height), nextObserverId(1) {}

MountTarget::ObserverId Viewport::observe(GeometryObserver observer) {
  ObserverId id = nextObserverId++;
  observers[id] = observer;
  return id;
}

void Viewport::unobserve(ObserverId id) { observers.erase(id); }

void Viewport::setSize(int _width, int _height) {
  if (_width == currentWidth && _height == currentHeight) {
    return;
  }
  currentWidth = _width;
  currentHeight = _height;
  VLOG(2) << "Viewport resized to " << currentWidth << "x" << currentHeight;
  vector<ObserverId> ids;
  for (auto& it : observers) {
    ids.push_back(it.first);
  }
  for (auto id : ids) {
    auto it = observers.find(id);
    if (it != observers.end()) {
      auto observer = it->second;
      observer();
    }
  }
}
}  // namespace mt
