#include "KeyboardDispatcher.hpp"

namespace mt {
KeyboardDispatcher::KeyboardDispatcher(KeyboardTarget* _target)
    : target(_target), attached(false) {}

void KeyboardDispatcher::attach() {
  VLOG(1) << "Keyboard dispatcher attached";
  attached = true;
}

void KeyboardDispatcher::detach() {
  VLOG(1) << "Keyboard dispatcher detached";
  attached = false;
}

bool KeyboardDispatcher::dispatch(const KeyEvent& event) {
  if (!attached) {
    return false;
  }
  bool mod = event.ctrl || event.meta;
  const string& key = event.key;

  if (mod && key == "Tab") {
    if (event.shift) {
      target->previousSession();
    } else {
      target->nextSession();
    }
    return true;
  }
  if (mod && key == "t" && !event.shift) {
    target->newSession();
    return true;
  }
  if (mod && key == "w" && !event.shift && target->isTerminalFocused()) {
    target->closeActiveSession();
    return true;
  }
  if (mod && key == "f" &&
      (target->isTerminalFocused() || target->isSearchOpen())) {
    target->openSearch();
    return true;
  }
  if (mod && (key == "+" || key == "=") && target->isTerminalFocused()) {
    target->zoomIn();
    return true;
  }
  if (mod && key == "-" && target->isTerminalFocused()) {
    target->zoomOut();
    return true;
  }
  if (mod && key == "0" && target->isTerminalFocused()) {
    target->resetZoom();
    return true;
  }
  if (key == "Escape" && target->isSearchOpen()) {
    target->closeSearch();
    return true;
  }
  if (mod && key.length() == 1 && key[0] >= '1' && key[0] <= '9') {
    target->activateIndex(key[0] - '1');
    return true;
  }
  return false;
}
}  // namespace mt
