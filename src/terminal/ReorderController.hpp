#ifndef __MT_REORDER_CONTROLLER_HPP__
#define __MT_REORDER_CONTROLLER_HPP__

#include <variant>

#include "Headers.hpp"

namespace mt {
struct Point {
  double x = 0;
  double y = 0;
};

struct Rect {
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;
};

/** @brief No gesture in progress. */
struct DragIdle {};

/** @brief Pointer is down on a tab but has not moved far enough. */
struct DragPressed {
  int sourceIndex;
  string sourceId;
  string payload;
  Point start;
};

/** @brief A tab is being dragged. */
struct Dragging {
  int sourceIndex;
  string sourceId;
  /** @brief What a drop outside the strip carries (the session name). */
  string payload;
  /** @brief Insertion point in [0, number of tabs]. */
  optional<int> dropTarget;
  bool outside = false;
  Point pointer;
};

typedef std::variant<DragIdle, DragPressed, Dragging> DragState;

/**
 * @brief Drag-to-reorder gesture for the tab strip.
 *
 * Coordinates are in window space.  A press turns into a drag once the
 * pointer travels more than DRAG_THRESHOLD pixels.
 */
class ReorderController {
 public:
  typedef std::function<void(int fromIndex, int toIndex)> ReorderHandler;
  typedef std::function<void(const string& sessionId, const string& payload,
                             const Point& pointer)>
      DetachHandler;

  static constexpr double DRAG_THRESHOLD = 5.0;
  /** @brief How far above or below the strip the pointer may stray. */
  static constexpr double VERTICAL_SLACK = 50.0;

  explicit ReorderController(ReorderHandler _reorderHandler,
                             DetachHandler _detachHandler = nullptr);

  /** @brief Pointer went down on tab `index`. */
  void press(int index, const string& sessionId, const string& payload,
             const Point& pointer);
  /** @brief Starts a drag right away, without the movement threshold. */
  void beginDrag(int index, const string& sessionId, const string& payload,
                 const Point& pointer);
  /**
   * @brief Pointer moved.  Updates the drop target from the strip and tab
   * rectangles.
   */
  void dragOver(const Point& pointer, const Rect& strip,
                const vector<Rect>& tabs);
  /**
   * @brief Pointer released.  Reorders when dropped inside the strip on a
   * different position.  Always returns to idle.
   * @return true if the reorder handler ran.
   */
  bool drop();
  /** @brief Abandons the gesture. */
  void dragEnd();

  const DragState& getState() { return state; }
  bool isIdle() { return std::holds_alternative<DragIdle>(state); }
  bool isDragging() { return std::holds_alternative<Dragging>(state); }
  optional<int> getDropTarget();
  bool isOutside();

 protected:
  ReorderHandler reorderHandler;
  DetachHandler detachHandler;
  DragState state;
};
}  // namespace mt

#endif  // __MT_REORDER_CONTROLLER_HPP__
