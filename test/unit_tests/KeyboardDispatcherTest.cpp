#include "KeyboardDispatcher.hpp"

#include "TestHeaders.hpp"

using namespace mt;

namespace {
class RecordingTarget : public KeyboardTarget {
 public:
  RecordingTarget() : focused(true), searchOpen(false) {}

  virtual bool isTerminalFocused() { return focused; }
  virtual bool isSearchOpen() { return searchOpen; }
  virtual void nextSession() { actions.push_back("next"); }
  virtual void previousSession() { actions.push_back("previous"); }
  virtual void newSession() { actions.push_back("new"); }
  virtual void closeActiveSession() { actions.push_back("close"); }
  virtual void openSearch() { actions.push_back("search"); }
  virtual void closeSearch() { actions.push_back("closeSearch"); }
  virtual void zoomIn() { actions.push_back("zoomIn"); }
  virtual void zoomOut() { actions.push_back("zoomOut"); }
  virtual void resetZoom() { actions.push_back("resetZoom"); }
  virtual void activateIndex(int index) {
    actions.push_back("tab" + to_string(index));
  }

  bool focused;
  bool searchOpen;
  vector<string> actions;
};

KeyEvent ctrl(const string& key, bool shift = false) {
  return KeyEvent(key, true, false, shift);
}
}  // namespace

TEST_CASE("KeyboardDispatcher ignores keys while detached",
          "[KeyboardDispatcher]") {
  RecordingTarget target;
  KeyboardDispatcher dispatcher(&target);
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("t")));
  dispatcher.attach();
  REQUIRE(dispatcher.dispatch(ctrl("t")));
  dispatcher.detach();
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("t")));
  REQUIRE(target.actions == vector<string>({"new"}));
}

TEST_CASE("KeyboardDispatcher session shortcuts", "[KeyboardDispatcher]") {
  RecordingTarget target;
  KeyboardDispatcher dispatcher(&target);
  dispatcher.attach();

  REQUIRE(dispatcher.dispatch(ctrl("Tab")));
  REQUIRE(dispatcher.dispatch(ctrl("Tab", true)));
  REQUIRE(dispatcher.dispatch(KeyEvent("t", false, true)));
  REQUIRE(dispatcher.dispatch(ctrl("w")));
  REQUIRE(dispatcher.dispatch(ctrl("3")));
  REQUIRE(target.actions ==
          vector<string>({"next", "previous", "new", "close", "tab2"}));

  // Shifted variants belong to someone else
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("t", true)));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("w", true)));
  // No modifier, no shortcut
  REQUIRE_FALSE(dispatcher.dispatch(KeyEvent("t")));
  REQUIRE_FALSE(dispatcher.dispatch(KeyEvent("Tab")));
  REQUIRE(target.actions.size() == 5);
}

TEST_CASE("KeyboardDispatcher focus-gated shortcuts", "[KeyboardDispatcher]") {
  RecordingTarget target;
  KeyboardDispatcher dispatcher(&target);
  dispatcher.attach();

  target.focused = false;
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("w")));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("f")));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("=")));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("-")));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("0")));
  // Tab switching works without focus
  REQUIRE(dispatcher.dispatch(ctrl("1")));
  REQUIRE(target.actions == vector<string>({"tab0"}));

  target.focused = true;
  REQUIRE(dispatcher.dispatch(ctrl("+")));
  REQUIRE(dispatcher.dispatch(ctrl("=")));
  REQUIRE(dispatcher.dispatch(ctrl("-")));
  REQUIRE(dispatcher.dispatch(ctrl("0")));
  REQUIRE(dispatcher.dispatch(ctrl("f")));
  REQUIRE(target.actions == vector<string>({"tab0", "zoomIn", "zoomIn",
                                            "zoomOut", "resetZoom",
                                            "search"}));
}

TEST_CASE("KeyboardDispatcher search shortcuts", "[KeyboardDispatcher]") {
  RecordingTarget target;
  KeyboardDispatcher dispatcher(&target);
  dispatcher.attach();

  REQUIRE_FALSE(dispatcher.dispatch(KeyEvent("Escape")));

  target.focused = false;
  target.searchOpen = true;
  REQUIRE(dispatcher.dispatch(ctrl("f")));
  REQUIRE(dispatcher.dispatch(KeyEvent("Escape")));
  REQUIRE(target.actions == vector<string>({"search", "closeSearch"}));
}

TEST_CASE("KeyboardDispatcher ignores other keys", "[KeyboardDispatcher]") {
  RecordingTarget target;
  KeyboardDispatcher dispatcher(&target);
  dispatcher.attach();
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("c")));
  REQUIRE_FALSE(dispatcher.dispatch(ctrl("x")));
  REQUIRE_FALSE(dispatcher.dispatch(KeyEvent("a")));
  REQUIRE(target.actions.empty());
}
