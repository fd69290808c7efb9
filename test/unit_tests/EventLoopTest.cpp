#include "EventLoop.hpp"

#include "FakeClock.hpp"
#include "TestHeaders.hpp"

using namespace mt;

TEST_CASE("EventLoop runs posted tasks in order", "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  vector<int> order;
  loop->post([&order]() { order.push_back(1); });
  loop->post([&order]() { order.push_back(2); });
  REQUIRE(order.empty());
  REQUIRE(loop->runOnce() == 2);
  REQUIRE(order == vector<int>({1, 2}));
}

TEST_CASE("EventLoop tasks posted while running wait for the next pass",
          "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  int runs = 0;
  loop->post([&]() {
    runs++;
    loop->post([&runs]() { runs++; });
  });
  REQUIRE(loop->runOnce() == 1);
  REQUIRE(runs == 1);
  loop->runUntilIdle();
  REQUIRE(runs == 2);
}

TEST_CASE("EventLoop timers fire when due", "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  vector<string> fired;
  loop->postDelayed(std::chrono::milliseconds(200),
                    [&fired]() { fired.push_back("late"); });
  loop->postDelayed(std::chrono::milliseconds(100),
                    [&fired]() { fired.push_back("early"); });
  REQUIRE(loop->numPendingTimers() == 2);

  loop->runUntilIdle();
  REQUIRE(fired.empty());

  FakeClock::advanceAndRun(clock, loop, std::chrono::milliseconds(100));
  REQUIRE(fired == vector<string>({"early"}));

  FakeClock::advanceAndRun(clock, loop, std::chrono::milliseconds(500));
  REQUIRE(fired == vector<string>({"early", "late"}));
  REQUIRE(loop->numPendingTimers() == 0);
}

TEST_CASE("EventLoop cancelled timers never fire", "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  bool fired = false;
  auto id = loop->postDelayed(std::chrono::milliseconds(10),
                              [&fired]() { fired = true; });
  REQUIRE(loop->isPending(id));
  REQUIRE(loop->cancel(id));
  REQUIRE_FALSE(loop->isPending(id));
  REQUIRE_FALSE(loop->cancel(id));

  FakeClock::advanceAndRun(clock, loop, std::chrono::milliseconds(50));
  REQUIRE_FALSE(fired);
}

TEST_CASE("EventLoop timer cancelled by an earlier timer is skipped",
          "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  bool secondFired = false;
  EventLoop::TimerId second = 0;
  loop->postDelayed(std::chrono::milliseconds(10),
                    [&]() { loop->cancel(second); });
  second = loop->postDelayed(std::chrono::milliseconds(20),
                             [&secondFired]() { secondFired = true; });
  FakeClock::advanceAndRun(clock, loop, std::chrono::milliseconds(30));
  REQUIRE_FALSE(secondFired);
}

TEST_CASE("EventLoop survives throwing tasks", "[EventLoop]") {
  auto clock = make_shared<FakeClock>();
  auto loop = FakeClock::createLoop(clock);
  bool after = false;
  loop->post([]() { throw std::runtime_error("boom"); });
  loop->post([&after]() { after = true; });
  REQUIRE_NOTHROW(loop->runUntilIdle());
  REQUIRE(after);
}

TEST_CASE("EventLoop run returns after stop", "[EventLoop]") {
  shared_ptr<EventLoop> loop(new EventLoop());
  int ticks = 0;
  loop->postDelayed(std::chrono::milliseconds(5), [&]() {
    ticks++;
    loop->stop();
  });
  loop->run();
  REQUIRE(ticks == 1);
}

TEST_CASE("EventLoop post wakes a running loop from another thread",
          "[EventLoop]") {
  shared_ptr<EventLoop> loop(new EventLoop());
  std::atomic<bool> ran(false);
  std::thread poster([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    loop->post([&]() {
      ran = true;
      loop->stop();
    });
  });
  loop->run();
  poster.join();
  REQUIRE(ran);
}
