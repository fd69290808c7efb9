#include "ResizeReconciler.hpp"

#include "FakeClock.hpp"
#include "HeadlessRenderEngine.hpp"
#include "TestHeaders.hpp"
#include "Viewport.hpp"

using namespace mt;

namespace {
const std::chrono::milliseconds DEBOUNCE(100);

struct ReconcilerFixture {
  ReconcilerFixture()
      : clock(new FakeClock()),
        loop(FakeClock::createLoop(clock)),
        viewport(new Viewport(800, 480)),
        engine(new HeadlessRenderEngine(RenderOptions(), EngineCapabilities())),
        reconciler(new ResizeReconciler(loop, DEBOUNCE)) {
    engine->open(viewport.get());
    engine->fit();
    reconciler->setReportedSize(engine->rows(), engine->cols());
    reconciler->start(viewport.get(), engine,
                      [this](int rows, int cols) {
                        reported.push_back(make_pair(rows, cols));
                      });
  }

  shared_ptr<FakeClock> clock;
  shared_ptr<EventLoop> loop;
  shared_ptr<Viewport> viewport;
  shared_ptr<HeadlessRenderEngine> engine;
  shared_ptr<ResizeReconciler> reconciler;
  vector<pair<int, int>> reported;
};
}  // namespace

TEST_CASE("ResizeReconciler debounces bursts", "[ResizeReconciler]") {
  ReconcilerFixture f;
  REQUIRE(f.reconciler->isRunning());
  for (int a = 0; a < 10; a++) {
    f.viewport->setSize(800 + a * 10, 480);
    FakeClock::advanceAndRun(f.clock, f.loop, std::chrono::milliseconds(20));
  }
  REQUIRE(f.reported.empty());
  REQUIRE(f.reconciler->isPending());

  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.size() == 1);
  REQUIRE(f.reported[0].first == f.engine->rows());
  REQUIRE(f.reported[0].second == f.engine->cols());
  REQUIRE(f.engine->cols() == int(890 / f.engine->cellWidth()));
  REQUIRE_FALSE(f.reconciler->isPending());
}

TEST_CASE("ResizeReconciler skips unchanged grids", "[ResizeReconciler]") {
  ReconcilerFixture f;
  // A couple of pixels does not change the cell grid
  f.viewport->setSize(802, 481);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.empty());
}

TEST_CASE("ResizeReconciler skips hidden targets", "[ResizeReconciler]") {
  ReconcilerFixture f;
  f.viewport->setSize(0, 0);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.empty());
  REQUIRE(f.engine->cols() == 95);

  f.viewport->setSize(400, 240);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.size() == 1);
  REQUIRE(f.reported[0] == make_pair(14, 47));
}

TEST_CASE("ResizeReconciler stop cancels the pending resize",
          "[ResizeReconciler]") {
  ReconcilerFixture f;
  f.viewport->setSize(400, 240);
  REQUIRE(f.reconciler->isPending());
  f.reconciler->stop();
  REQUIRE_FALSE(f.reconciler->isRunning());
  REQUIRE(f.viewport->numObservers() == 0);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.empty());

  f.viewport->setSize(200, 120);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.empty());
}

TEST_CASE("ResizeReconciler destructor detaches", "[ResizeReconciler]") {
  ReconcilerFixture f;
  f.viewport->setSize(400, 240);
  f.reconciler.reset();
  REQUIRE(f.viewport->numObservers() == 0);
  REQUIRE(f.loop->numPendingTimers() == 0);
  FakeClock::advanceAndRun(f.clock, f.loop, DEBOUNCE);
  REQUIRE(f.reported.empty());
}
