#include "ReorderController.hpp"

#include "TestHeaders.hpp"

using namespace mt;

namespace {
Point point(double x, double y) {
  Point p;
  p.x = x;
  p.y = y;
  return p;
}

Rect rect(double x, double y, double width, double height) {
  Rect r;
  r.x = x;
  r.y = y;
  r.width = width;
  r.height = height;
  return r;
}

struct ReorderFixture {
  ReorderFixture()
      : strip(rect(10, 0, 300, 30)),
        controller(
            [this](int from, int to) { moves.push_back(make_pair(from, to)); },
            [this](const string& id, const string& payload, const Point&) {
              detached.push_back(id + ":" + payload);
            }) {
    for (int a = 0; a < 3; a++) {
      tabs.push_back(rect(10 + a * 100, 0, 100, 30));
    }
  }

  Rect strip;
  vector<Rect> tabs;
  vector<pair<int, int>> moves;
  vector<string> detached;
  ReorderController controller;
};
}  // namespace

TEST_CASE("ReorderController needs movement before dragging",
          "[ReorderController]") {
  ReorderFixture f;
  f.controller.press(0, "a", "shell", point(20, 10));
  REQUIRE(std::holds_alternative<DragPressed>(f.controller.getState()));

  f.controller.dragOver(point(23, 13), f.strip, f.tabs);
  REQUIRE_FALSE(f.controller.isDragging());
  // A click without a drag never reorders
  REQUIRE_FALSE(f.controller.drop());
  REQUIRE(f.controller.isIdle());

  f.controller.press(0, "a", "shell", point(20, 10));
  f.controller.dragOver(point(80, 10), f.strip, f.tabs);
  REQUIRE(f.controller.isDragging());
  REQUIRE(f.controller.getDropTarget() == optional<int>(1));
}

TEST_CASE("ReorderController drop targets follow tab halves",
          "[ReorderController]") {
  ReorderFixture f;
  f.controller.beginDrag(2, "c", "c", point(260, 10));

  f.controller.dragOver(point(30, 10), f.strip, f.tabs);
  REQUIRE(f.controller.getDropTarget() == optional<int>(0));
  f.controller.dragOver(point(90, 10), f.strip, f.tabs);
  REQUIRE(f.controller.getDropTarget() == optional<int>(1));
  f.controller.dragOver(point(290, 10), f.strip, f.tabs);
  REQUIRE(f.controller.getDropTarget() == optional<int>(3));
}

TEST_CASE("ReorderController moves left and right", "[ReorderController]") {
  ReorderFixture f;

  SECTION("Left") {
    f.controller.beginDrag(2, "c", "c", point(260, 10));
    f.controller.dragOver(point(30, 10), f.strip, f.tabs);
    REQUIRE(f.controller.drop());
    REQUIRE(f.moves == vector<pair<int, int>>({{2, 0}}));
  }

  SECTION("Right") {
    f.controller.beginDrag(0, "a", "a", point(30, 10));
    f.controller.dragOver(point(290, 10), f.strip, f.tabs);
    REQUIRE(f.controller.drop());
    REQUIRE(f.moves == vector<pair<int, int>>({{0, 2}}));
  }

  SECTION("Onto its own slot") {
    f.controller.beginDrag(1, "b", "b", point(160, 10));
    // The right half of tab 0 and the left half of tab 2 both mean "stay"
    f.controller.dragOver(point(90, 10), f.strip, f.tabs);
    REQUIRE_FALSE(f.controller.drop());
    f.controller.beginDrag(1, "b", "b", point(160, 10));
    f.controller.dragOver(point(230, 10), f.strip, f.tabs);
    REQUIRE_FALSE(f.controller.drop());
    REQUIRE(f.moves.empty());
  }

  REQUIRE(f.controller.isIdle());
}

TEST_CASE("ReorderController drops outside the strip detach",
          "[ReorderController]") {
  ReorderFixture f;
  f.controller.beginDrag(1, "b", "build", point(160, 10));

  // Small vertical excursions still count as inside
  f.controller.dragOver(point(160, 70), f.strip, f.tabs);
  REQUIRE_FALSE(f.controller.isOutside());

  f.controller.dragOver(point(160, 81), f.strip, f.tabs);
  REQUIRE(f.controller.isOutside());
  REQUIRE_FALSE(f.controller.getDropTarget());

  REQUIRE_FALSE(f.controller.drop());
  REQUIRE(f.moves.empty());
  REQUIRE(f.detached == vector<string>({"b:build"}));

  f.controller.beginDrag(1, "b", "build", point(160, 10));
  f.controller.dragOver(point(5, 10), f.strip, f.tabs);
  REQUIRE(f.controller.isOutside());
  f.controller.dragEnd();
  REQUIRE(f.controller.isIdle());
  REQUIRE(f.detached.size() == 1);
}

TEST_CASE("ReorderController without a detach handler",
          "[ReorderController]") {
  vector<pair<int, int>> moves;
  ReorderController controller(
      [&moves](int from, int to) { moves.push_back(make_pair(from, to)); });
  controller.beginDrag(0, "a", "a", point(0, 0));
  controller.dragOver(point(-10, 0), rect(0, 0, 100, 30),
                      vector<Rect>({rect(0, 0, 50, 30), rect(50, 0, 50, 30)}));
  REQUIRE_NOTHROW(controller.drop());
  REQUIRE(moves.empty());
}
