#include "ReorderController.hpp"

#include <cmath>

namespace mt {
constexpr double ReorderController::DRAG_THRESHOLD;
constexpr double ReorderController::VERTICAL_SLACK;

ReorderController::ReorderController(ReorderHandler _reorderHandler,
                                     DetachHandler _detachHandler)
    : reorderHandler(_reorderHandler),
      detachHandler(_detachHandler),
      state(DragIdle()) {}

void ReorderController::press(int index, const string& sessionId,
                              const string& payload, const Point& pointer) {
  DragPressed pressed;
  pressed.sourceIndex = index;
  pressed.sourceId = sessionId;
  pressed.payload = payload;
  pressed.start = pointer;
  state = pressed;
}

void ReorderController::beginDrag(int index, const string& sessionId,
                                  const string& payload, const Point& pointer) {
  Dragging dragging;
  dragging.sourceIndex = index;
  dragging.sourceId = sessionId;
  dragging.payload = payload;
  dragging.pointer = pointer;
  state = dragging;
  VLOG(1) << "Dragging tab " << index << " (" << sessionId << ")";
}

void ReorderController::dragOver(const Point& pointer, const Rect& strip,
                                 const vector<Rect>& tabs) {
  if (auto pressed = std::get_if<DragPressed>(&state)) {
    double dx = pointer.x - pressed->start.x;
    double dy = pointer.y - pressed->start.y;
    if (sqrt(dx * dx + dy * dy) <= DRAG_THRESHOLD) {
      return;
    }
    DragPressed copy = *pressed;
    beginDrag(copy.sourceIndex, copy.sourceId, copy.payload, pointer);
  }
  auto dragging = std::get_if<Dragging>(&state);
  if (dragging == NULL) {
    return;
  }

  dragging->pointer = pointer;
  double x = pointer.x - strip.x;
  double y = pointer.y - strip.y;
  dragging->outside = x < 0 || x > strip.width || y < -VERTICAL_SLACK ||
                      y > strip.height + VERTICAL_SLACK;
  if (dragging->outside) {
    dragging->dropTarget.reset();
    return;
  }

  optional<int> target;
  for (int i = 0; i < int(tabs.size()); i++) {
    double tabX = tabs[i].x - strip.x;
    double tabWidth = tabs[i].width;
    if (x >= tabX && x <= tabX + tabWidth) {
      target = (x - tabX < tabWidth / 2) ? i : i + 1;
      break;
    }
  }
  if (target) {
    target = max(0, min(int(tabs.size()), *target));
  }
  dragging->dropTarget = target;
}

bool ReorderController::drop() {
  bool reordered = false;
  if (auto dragging = std::get_if<Dragging>(&state)) {
    Dragging finished = *dragging;
    state = DragIdle();
    if (finished.outside) {
      if (detachHandler) {
        LOG(INFO) << "Tab " << finished.sourceId << " dropped outside the strip";
        detachHandler(finished.sourceId, finished.payload, finished.pointer);
      }
    } else if (finished.dropTarget &&
               *finished.dropTarget != finished.sourceIndex) {
      int target = *finished.dropTarget;
      // Removing the source shifts everything after it left by one
      if (finished.sourceIndex < target) {
        target--;
      }
      if (target != finished.sourceIndex) {
        VLOG(1) << "Reordering tab " << finished.sourceIndex << " -> "
                << target;
        reorderHandler(finished.sourceIndex, target);
        reordered = true;
      }
    }
  }
  state = DragIdle();
  return reordered;
}

void ReorderController::dragEnd() { state = DragIdle(); }

optional<int> ReorderController::getDropTarget() {
  if (auto dragging = std::get_if<Dragging>(&state)) {
    return dragging->dropTarget;
  }
  return nullopt;
}

bool ReorderController::isOutside() {
  if (auto dragging = std::get_if<Dragging>(&state)) {
    return dragging->outside;
  }
  return false;
}
}  // namespace mt
