/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_PROCESSING_POOL_HPP_
#define NBHTTP_PROCESSING_POOL_HPP_

#include "http.hpp"
#include "worker.hpp"

#include <cstddef>

#include <atomic>
#include <thread>
#include <vector>

namespace nbhttp {

// ============================================================================
// ProcessingPool - turns queued payloads into responses
// ============================================================================

// Threads pop SocketReadPayload from the work queue, parse the request, run
// the handler and deliver the response to the worker that owns the
// connection. Unparseable requests get 400, handler exceptions get 500.
class ProcessingPool {
 public:
  ProcessingPool(WorkQueue& work_queue, RequestHandler handler, size_t threads);
  ~ProcessingPool();

  ProcessingPool(const ProcessingPool&) = delete;
  ProcessingPool& operator=(const ProcessingPool&) = delete;

  // Workers must be added before start()
  void add_worker(Worker* worker) { workers_.push_back(worker); }

  void start();

  // Closes the work queue and joins the threads. Payloads still queued are
  // processed before the threads exit.
  void stop();

  uint64_t processed() const { return processed_.load(std::memory_order_relaxed); }

  // Computes the response for one payload (exposed for tests)
  HttpResponse process(const SocketReadPayload& payload) const;

 private:
  void thread_loop();
  Worker* find_worker(const ConnectionHandle& handle) const;

  WorkQueue& work_queue_;
  RequestHandler handler_;
  size_t thread_count_;
  std::vector<Worker*> workers_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> processed_{0};
};

}  // namespace nbhttp

#endif  // NBHTTP_PROCESSING_POOL_HPP_
