#include "nbhttp/admission.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace nbhttp;

// ============================================================================
// Headroom policy (admit only while free slots > 1)
// ============================================================================

TEST_CASE("AdmissionGate - two slots admit a single connection", "[admission]") {
  AdmissionGate gate(2);
  REQUIRE(gate.free_slots() == 2);

  REQUIRE(gate.try_acquire());
  REQUIRE(gate.free_slots() == 1);

  // 1 is not > 1
  REQUIRE_FALSE(gate.try_acquire());
  REQUIRE_FALSE(gate.try_acquire());
  REQUIRE(gate.free_slots() == 1);

  REQUIRE(gate.release());
  REQUIRE(gate.free_slots() == 2);
  REQUIRE(gate.try_acquire());
}

TEST_CASE("AdmissionGate - single slot never admits with headroom", "[admission]") {
  AdmissionGate gate(1);
  REQUIRE(gate.reserves_headroom());
  REQUIRE_FALSE(gate.try_acquire());
  REQUIRE(gate.free_slots() == 1);
}

TEST_CASE("AdmissionGate - release never exceeds capacity", "[admission]") {
  AdmissionGate gate(3);
  REQUIRE_FALSE(gate.release());
  REQUIRE(gate.free_slots() == 3);

  REQUIRE(gate.try_acquire());
  REQUIRE(gate.release());
  REQUIRE_FALSE(gate.release());
  REQUIRE(gate.free_slots() == 3);
}

TEST_CASE("AdmissionGate - without headroom every slot can be used", "[admission]") {
  AdmissionGate gate(2, false);
  REQUIRE_FALSE(gate.reserves_headroom());
  REQUIRE(gate.try_acquire());
  REQUIRE(gate.try_acquire());
  REQUIRE(gate.free_slots() == 0);
  REQUIRE(gate.in_use() == 2);
  REQUIRE_FALSE(gate.try_acquire());
}

TEST_CASE("AdmissionGate - random admit/close sequence keeps counter consistent", "[admission]") {
  const size_t max_clients = 8;
  AdmissionGate gate(max_clients);
  std::mt19937 rng(1234);
  size_t admitted = 0;
  size_t closed = 0;

  for (int i = 0; i < 10000; ++i) {
    if (rng() % 2 == 0) {
      if (gate.try_acquire())
        ++admitted;
    } else if (admitted > closed) {
      REQUIRE(gate.release());
      ++closed;
    }
    REQUIRE(gate.free_slots() <= max_clients);
    REQUIRE(gate.free_slots() == max_clients - (admitted - closed));
    REQUIRE(admitted - closed <= max_clients - 1);
  }
}

TEST_CASE("AdmissionGate - concurrent acquire admits exactly max - 1", "[admission]") {
  const size_t max_clients = 16;
  AdmissionGate gate(max_clients);
  std::atomic<size_t> granted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 100; ++i) {
        if (gate.try_acquire())
          granted.fetch_add(1);
      }
    });
  }
  for (auto& t : threads)
    t.join();

  REQUIRE(granted.load() == max_clients - 1);
  REQUIRE(gate.free_slots() == 1);
}

// ============================================================================
// WorkerStats
// ============================================================================

TEST_CASE("WorkerStats - reset clears counters", "[admission]") {
  WorkerStats stats;
  stats.admitted_connections = 5;
  stats.decode_errors = 2;
  stats.bytes_out = 1024;
  stats.reset();
  REQUIRE(stats.admitted_connections.load() == 0);
  REQUIRE(stats.decode_errors.load() == 0);
  REQUIRE(stats.bytes_out.load() == 0);
}
