#include "EventQueue.hpp"

#include "ManualClock.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("EventQueue", "[EventQueue]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  EventQueue queue(clock);
  vector<string> ran;

  SECTION("Posted tasks run in order") {
    queue.post([&ran]() { ran.push_back("a"); });
    queue.post([&ran]() { ran.push_back("b"); });
    REQUIRE(queue.runReady() == 2);
    REQUIRE(ran == vector<string>{"a", "b"});
    REQUIRE(queue.empty());
  }

  SECTION("Tasks posted while running also run") {
    queue.post([&]() {
      ran.push_back("outer");
      queue.post([&ran]() { ran.push_back("inner"); });
    });
    REQUIRE(queue.runReady() == 2);
    REQUIRE(ran == vector<string>{"outer", "inner"});
  }

  SECTION("Timers wait for their deadline") {
    queue.schedule(200, [&ran]() { ran.push_back("late"); });
    queue.schedule(100, [&ran]() { ran.push_back("early"); });
    REQUIRE(queue.msUntilNextTimer() == 100);
    REQUIRE(queue.runReady() == 0);

    clock->advance(150);
    REQUIRE(queue.runReady() == 1);
    REQUIRE(ran == vector<string>{"early"});
    REQUIRE(queue.msUntilNextTimer() == 50);

    clock->advance(50);
    queue.runReady();
    REQUIRE(ran == vector<string>{"early", "late"});
    REQUIRE(queue.msUntilNextTimer() == -1);
  }

  SECTION("Cancelled timers never fire") {
    int64_t id = queue.schedule(10, [&ran]() { ran.push_back("x"); });
    queue.cancel(id);
    clock->advance(20);
    REQUIRE(queue.runReady() == 0);
    REQUIRE(ran.empty());
    // Cancelling twice is harmless
    queue.cancel(id);
  }

  SECTION("Posts from other threads") {
    atomic<int> count(0);
    vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
      threads.emplace_back([&]() {
        for (int j = 0; j < 100; j++) {
          queue.post([&count]() { count++; });
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    queue.runReady();
    REQUIRE(count == 400);
  }
}
