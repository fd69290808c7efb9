#include "EventRouter.hpp"

#include "FakeClock.hpp"
#include "FakeTerminalBackend.hpp"
#include "TestHeaders.hpp"

using namespace mt;

namespace {
struct Received {
  vector<string> output;
  vector<string> errors;
  vector<int> closed;

  RouteTarget target() {
    RouteTarget t;
    t.onOutput = [this](const string& data) { output.push_back(data); };
    t.onError = [this](const string& error) { errors.push_back(error); };
    t.onClosed = [this](int status) { closed.push_back(status); };
    return t;
  }
};

struct RouterFixture {
  RouterFixture()
      : clock(new FakeClock()),
        loop(FakeClock::createLoop(clock)),
        bus(new EventBus()),
        backend(new FakeTerminalBackend(loop, bus)),
        router(new EventRouter(bus)) {}

  shared_ptr<FakeClock> clock;
  shared_ptr<EventLoop> loop;
  shared_ptr<EventBus> bus;
  shared_ptr<FakeTerminalBackend> backend;
  shared_ptr<EventRouter> router;
};
}  // namespace

TEST_CASE("EventRouter routes each channel to its target", "[EventRouter]") {
  RouterFixture f;
  Received a, b;
  f.router->subscribe("conn-a", a.target());
  f.router->subscribe("conn-b", b.target());
  REQUIRE(f.router->size() == 2);

  f.backend->emitOutput("conn-a", "hello");
  f.backend->emitError("conn-a", "oops");
  f.backend->emitOutput("conn-b", "world");
  f.backend->emitClosed("conn-b", 3);

  REQUIRE(a.output == vector<string>({"hello"}));
  REQUIRE(a.errors == vector<string>({"oops"}));
  REQUIRE(a.closed.empty());
  REQUIRE(b.output == vector<string>({"world"}));
  REQUIRE(b.closed == vector<int>({3}));
}

TEST_CASE("EventRouter stops delivery after unsubscribe", "[EventRouter]") {
  RouterFixture f;
  Received a;
  f.router->subscribe("conn-a", a.target());
  REQUIRE(f.router->unsubscribe("conn-a"));
  REQUIRE_FALSE(f.router->unsubscribe("conn-a"));
  REQUIRE_FALSE(f.router->isSubscribed("conn-a"));
  REQUIRE(f.bus->numListeners() == 0);

  f.backend->emitOutput("conn-a", "late");
  f.backend->emitClosed("conn-a", 0);
  REQUIRE(a.output.empty());
  REQUIRE(a.closed.empty());
}

TEST_CASE("EventRouter subscribe replaces the previous target",
          "[EventRouter]") {
  RouterFixture f;
  Received first, second;
  f.router->subscribe("conn-a", first.target());
  f.router->subscribe("conn-a", second.target());
  REQUIRE(f.router->size() == 1);
  REQUIRE(f.bus->numListeners() == 3);

  f.backend->emitOutput("conn-a", "x");
  REQUIRE(first.output.empty());
  REQUIRE(second.output == vector<string>({"x"}));
}

TEST_CASE("EventRouter target may unsubscribe from its own callback",
          "[EventRouter]") {
  RouterFixture f;
  int closedCalls = 0;
  RouteTarget target;
  target.onClosed = [&](int) {
    closedCalls++;
    f.router->unsubscribe("conn-a");
  };
  f.router->subscribe("conn-a", target);
  f.backend->emitClosed("conn-a", 0);
  f.backend->emitClosed("conn-a", 0);
  REQUIRE(closedCalls == 1);
  REQUIRE(f.router->size() == 0);
}

TEST_CASE("EventRouter ignores missing callbacks", "[EventRouter]") {
  RouterFixture f;
  RouteTarget target;
  f.router->subscribe("conn-a", target);
  REQUIRE_NOTHROW(f.backend->emitOutput("conn-a", "x"));
  REQUIRE_NOTHROW(f.backend->emitError("conn-a", "y"));
}

TEST_CASE("EventRouter unlistens everything when destroyed",
          "[EventRouter]") {
  RouterFixture f;
  Received a;
  f.router->subscribe("conn-a", a.target());
  f.router->subscribe("conn-b", a.target());
  REQUIRE(f.bus->numListeners() == 6);
  f.router.reset();
  REQUIRE(f.bus->numListeners() == 0);
}
