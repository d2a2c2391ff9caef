/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_ADMISSION_HPP_
#define NBHTTP_ADMISSION_HPP_

#include <cstddef>
#include <cstdint>

#include <atomic>

namespace nbhttp {

// ============================================================================
// AdmissionGate - free client slots of one worker
// ============================================================================

// Counter of free slots, bounded in [0, max_clients]. try_acquire() and
// release() are lock-free and may race with each other from any thread.
//
// With reserve_headroom (the default) a socket is admitted only while more
// than one slot is free, so at most max_clients - 1 connections are live.
class AdmissionGate {
 public:
  explicit AdmissionGate(size_t max_clients, bool reserve_headroom = true)
      : max_clients_(max_clients), threshold_(reserve_headroom ? 1 : 0), free_slots_(max_clients) {}

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  // Takes one slot if the policy allows it
  bool try_acquire() {
    size_t current = free_slots_.load(std::memory_order_relaxed);
    while (current > threshold_) {
      if (free_slots_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                            std::memory_order_relaxed)) {
        return true;
      }
    }
    return false;
  }

  // Gives one slot back; never exceeds max_clients
  bool release() {
    size_t current = free_slots_.load(std::memory_order_relaxed);
    while (current < max_clients_) {
      if (free_slots_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                            std::memory_order_relaxed)) {
        return true;
      }
    }
    return false;
  }

  size_t free_slots() const { return free_slots_.load(std::memory_order_acquire); }
  size_t capacity() const { return max_clients_; }
  size_t in_use() const { return max_clients_ - free_slots(); }
  bool reserves_headroom() const { return threshold_ == 1; }

 private:
  const size_t max_clients_;
  const size_t threshold_;
  std::atomic<size_t> free_slots_;
};

// ============================================================================
// WorkerStats - Atomic counters
// ============================================================================

struct WorkerStats {
  // Connection counters
  std::atomic<uint64_t> admitted_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> closed_connections{0};
  std::atomic<uint64_t> active_connections{0};

  // Traffic
  std::atomic<uint64_t> payloads_queued{0};
  std::atomic<uint64_t> payloads_dropped{0};
  std::atomic<uint64_t> responses_written{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};

  // Errors
  std::atomic<uint64_t> decode_errors{0};
  std::atomic<uint64_t> read_errors{0};
  std::atomic<uint64_t> write_errors{0};
  std::atomic<uint64_t> missing_responses{0};
  std::atomic<uint64_t> poll_errors{0};

  void reset() {
    admitted_connections = 0;
    rejected_connections = 0;
    closed_connections = 0;
    active_connections = 0;
    payloads_queued = 0;
    payloads_dropped = 0;
    responses_written = 0;
    bytes_in = 0;
    bytes_out = 0;
    decode_errors = 0;
    read_errors = 0;
    write_errors = 0;
    missing_responses = 0;
    poll_errors = 0;
  }
};

}  // namespace nbhttp

#endif  // NBHTTP_ADMISSION_HPP_
