#include "nbhttp/blocking_queue.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace nbhttp;

TEST_CASE("BlockingQueue - FIFO order", "[queue]") {
  BlockingQueue<int> q(4);
  REQUIRE(q.push(1));
  REQUIRE(q.push(2));
  REQUIRE(q.push(3));
  REQUIRE(q.size() == 3);

  REQUIRE(q.pop().value() == 1);
  REQUIRE(q.pop().value() == 2);
  REQUIRE(q.try_pop().value() == 3);
  REQUIRE(q.empty());
}

TEST_CASE("BlockingQueue - try_push on full queue leaves item with caller", "[queue]") {
  BlockingQueue<std::unique_ptr<int>> q(1);
  auto first = std::make_unique<int>(1);
  auto second = std::make_unique<int>(2);

  REQUIRE(q.try_push(std::move(first)));
  REQUIRE_FALSE(q.try_push(std::move(second)));
  REQUIRE(second != nullptr);
  REQUIRE(*second == 2);
}

TEST_CASE("BlockingQueue - try_pop and pop_for on empty queue", "[queue]") {
  BlockingQueue<int> q(2);
  REQUIRE_FALSE(q.try_pop().has_value());

  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(q.pop_for(std::chrono::milliseconds(30)).has_value());
  REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));
}

TEST_CASE("BlockingQueue - close wakes blocked consumer", "[queue]") {
  BlockingQueue<int> q(2);
  std::atomic<bool> returned{false};
  std::atomic<bool> got_item{true};

  std::thread consumer([&]() {
    got_item = q.pop().has_value();
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE_FALSE(returned.load());
  q.close();
  consumer.join();
  REQUIRE(returned.load());
  REQUIRE_FALSE(got_item.load());
}

TEST_CASE("BlockingQueue - push after close fails, queued items still drain", "[queue]") {
  BlockingQueue<int> q(4);
  REQUIRE(q.push(7));
  q.close();

  REQUIRE(q.is_closed());
  REQUIRE_FALSE(q.push(8));
  REQUIRE_FALSE(q.try_push(9));
  REQUIRE(q.pop().value() == 7);
  REQUIRE_FALSE(q.pop().has_value());
}

TEST_CASE("BlockingQueue - full queue blocks producer until a pop", "[queue]") {
  BlockingQueue<int> q(1);
  REQUIRE(q.push(1));

  std::atomic<bool> pushed{false};
  std::thread producer([&]() { pushed = q.push(2); });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE_FALSE(pushed.load());

  REQUIRE(q.pop().value() == 1);
  producer.join();
  REQUIRE(pushed.load());
  REQUIRE(q.pop().value() == 2);
}

TEST_CASE("BlockingQueue - zero capacity is treated as one", "[queue]") {
  BlockingQueue<int> q(0);
  REQUIRE(q.capacity() == 1);
  REQUIRE(q.try_push(1));
  REQUIRE_FALSE(q.try_push(2));
}
