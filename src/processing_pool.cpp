/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/processing_pool.hpp"

#include "nbhttp/log.hpp"

#include <exception>
#include <utility>

namespace nbhttp {

ProcessingPool::ProcessingPool(WorkQueue& work_queue, RequestHandler handler, size_t threads)
    : work_queue_(work_queue), handler_(std::move(handler)), thread_count_(threads == 0 ? 1 : threads) {}

ProcessingPool::~ProcessingPool() { stop(); }

void ProcessingPool::start() {
  if (running_.exchange(true))
    return;

  for (size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this]() { thread_loop(); });
  }
  NBHTTP_LOG_INFO("Processing pool started with " + std::to_string(thread_count_) + " threads");
}

void ProcessingPool::stop() {
  if (!running_.exchange(false))
    return;

  work_queue_.close();

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

void ProcessingPool::thread_loop() {
  while (true) {
    auto payload = work_queue_.pop();
    if (!payload.has_value())
      break;  // closed + empty

    HttpResponse response = process(*payload);
    processed_.fetch_add(1, std::memory_order_relaxed);

    Worker* worker = find_worker(payload->handle);
    if (worker == nullptr) {
      NBHTTP_LOG_ERROR("No worker handles connection #" + std::to_string(payload->handle.conn_id) + " (worker #" +
                       std::to_string(payload->handle.worker_id) + ")");
      continue;
    }
    worker->send_response(payload->handle, std::move(response));
  }
}

HttpResponse ProcessingPool::process(const SocketReadPayload& payload) const {
  auto request = HttpRequest::parse(payload.text);
  if (!request.has_value()) {
    NBHTTP_LOG_WARN("Malformed request on connection #" + std::to_string(payload.handle.conn_id));
    return HttpResponse::text(400, "Bad Request\n");
  }

  try {
    return handler_(request.value());
  } catch (const std::exception& e) {
    NBHTTP_LOG_ERROR("Request handler failed for " + request.value().target + ": " + e.what());
    return HttpResponse::text(500, "Internal Server Error\n");
  }
}

Worker* ProcessingPool::find_worker(const ConnectionHandle& handle) const {
  for (Worker* worker : workers_) {
    if (worker->is_handling_client(handle))
      return worker;
  }
  return nullptr;
}

}  // namespace nbhttp
