#ifndef __MT_KEYBOARD_DISPATCHER_HPP__
#define __MT_KEYBOARD_DISPATCHER_HPP__

#include "Headers.hpp"

namespace mt {
/** @brief A key press as reported by the windowing layer. */
struct KeyEvent {
  /** @brief Key name: a printable character, "Tab" or "Escape". */
  string key;
  bool ctrl = false;
  bool meta = false;
  bool shift = false;
  bool alt = false;

  KeyEvent() {}
  KeyEvent(const string& _key, bool _ctrl = false, bool _meta = false,
           bool _shift = false)
      : key(_key), ctrl(_ctrl), meta(_meta), shift(_shift) {}
};

/**
 * @brief The panel the dispatcher drives: focus queries plus the actions a
 * shortcut can trigger.
 */
class KeyboardTarget {
 public:
  virtual ~KeyboardTarget() {}

  /** @brief True when keyboard focus is inside the active surface. */
  virtual bool isTerminalFocused() = 0;
  virtual bool isSearchOpen() = 0;

  virtual void nextSession() = 0;
  virtual void previousSession() = 0;
  /** @brief Opens a session in the current directory. */
  virtual void newSession() = 0;
  virtual void closeActiveSession() = 0;
  virtual void openSearch() = 0;
  /** @brief Hides the search overlay and focuses the active surface. */
  virtual void closeSearch() = 0;
  virtual void zoomIn() = 0;
  virtual void zoomOut() = 0;
  virtual void resetZoom() = 0;
  /** @brief Activates the tab at a zero-based index if it exists. */
  virtual void activateIndex(int index) = 0;
};

/**
 * @brief Routes panel-wide shortcuts to the keyboard target.
 *
 * Ctrl and Meta are interchangeable.  The first matching shortcut wins;
 * nothing is dispatched while detached.
 */
class KeyboardDispatcher {
 public:
  /** @brief `_target` must outlive the dispatcher. */
  explicit KeyboardDispatcher(KeyboardTarget* _target);

  void attach();
  void detach();
  bool isAttached() { return attached; }

  /**
   * @brief Handles one key press.
   * @return true if a shortcut matched and the default action should be
   * suppressed.
   */
  bool dispatch(const KeyEvent& event);

 protected:
  KeyboardTarget* target;
  bool attached;
};
}  // namespace mt

#endif  // __MT_KEYBOARD_DISPATCHER_HPP__
