/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/worker.hpp"

#include "nbhttp/log.hpp"
#include "nbhttp/utf8.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace nbhttp {

Worker::Worker(uint32_t id, WorkQueue& work_queue, const WorkerConfig& config)
    : id_(id),
      config_(config),
      work_queue_(work_queue),
      gate_(config.max_clients, config.reserve_headroom_slot),
      new_clients_(config.admission_queue_capacity),
      read_buffer_(config.read_buffer_size == 0 ? 1 : config.read_buffer_size) {}

Worker::~Worker() = default;

void Worker::run() {
  is_running_.store(true, std::memory_order_release);
  NBHTTP_LOG_INFO(tag() + " started (max clients " + std::to_string(gate_.capacity()) + ")");

  while (!stop_requested_.load(std::memory_order_acquire)) {
    try {
      run_once();
    } catch (const std::exception& e) {
      NBHTTP_LOG_ERROR(tag() + " unexpected error in reactor loop: " + e.what());
    }
  }

  close_all();
  is_running_.store(false, std::memory_order_release);
  NBHTTP_LOG_INFO(tag() + " stopped");
}

void Worker::stop() {
  stop_requested_.store(true, std::memory_order_release);
  poller_.wakeup();
}

bool Worker::handle(sockpp::tcp_socket&& sock) {
  if (!sock.is_open() || stop_requested_.load(std::memory_order_acquire)) {
    return false;
  }

  if (!gate_.try_acquire()) {
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  // Counted before the push so a concurrent drain never sees closed > admitted
  stats_.admitted_connections.fetch_add(1, std::memory_order_relaxed);
  if (!new_clients_.try_push(std::move(sock))) {
    stats_.admitted_connections.fetch_sub(1, std::memory_order_relaxed);
    gate_.release();
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    NBHTTP_LOG_WARN(tag() + " admission queue full");
    return false;
  }

  // stop() raced with the push: the loop may already have drained the queue
  if (stop_requested_.load(std::memory_order_acquire)) {
    close_unregistered();
    return true;
  }

  poller_.wakeup();
  return true;
}

void Worker::send_response(const ConnectionHandle& handle, HttpResponse response) {
  if (!is_handling_client(handle)) {
    NBHTTP_LOG_ERROR(tag() + " received response for foreign connection (worker #" +
                     std::to_string(handle.worker_id) + ")");
    return;
  }
  pending_responses_.put(handle.conn_id, std::move(response));
  poller_.wakeup();
}

// ============================================================================
// Reactor loop
// ============================================================================

void Worker::run_once() {
  poll_entries_.clear();
  polled_.clear();
  ready_.clear();

  for (auto& conn : connections_) {
    if (conn->is_closed())
      continue;
    poll_entries_.push_back({conn->get_fd(), conn->get_interest() == Interest::kWrite});
    polled_.push_back(conn.get());
  }

  NBHTTP_LOG_DEBUG(tag() + " waiting for readiness on " + std::to_string(poll_entries_.size()) + " connections");

  auto wait_result = poller_.wait(poll_entries_, config_.poll_timeout_ms, ready_);
  if (!wait_result.has_value()) {
    stats_.poll_errors.fetch_add(1, std::memory_order_relaxed);
    NBHTTP_LOG_ERROR(tag() + " error while waiting for readiness: " +
                     error_code_to_string(wait_result.get_error()));
    return;
  }

  register_pending_client();
  apply_pending_responses();

  // Each ready event is handled once; the set is rebuilt by the next wait()
  for (const auto& ev : ready_) {
    dispatch(*polled_[ev.index], ev);
  }

  remove_closed_connections();
}

void Worker::register_pending_client() {
  // At most one new registration per iteration
  auto sock = new_clients_.try_pop();
  if (!sock.has_value())
    return;

  ConnectionHandle handle{id_, next_conn_id_++};
  auto conn = std::make_unique<Connection>(std::move(*sock), handle);
  conn->set_interest(Interest::kRead);
  by_id_[handle.conn_id] = conn.get();
  connections_.push_back(std::move(conn));
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);

  NBHTTP_LOG_DEBUG(tag() + " registered connection #" + std::to_string(handle.conn_id));

  // More sockets were handed over while this one waited; come straight back
  if (!new_clients_.empty()) {
    poller_.wakeup();
  }
}

void Worker::apply_pending_responses() {
  ready_ids_.clear();
  pending_responses_.drain_ready(ready_ids_);

  for (uint64_t conn_id : ready_ids_) {
    auto it = by_id_.find(conn_id);
    if (it == by_id_.end() || it->second->is_closed()) {
      if (pending_responses_.discard(conn_id)) {
        NBHTTP_LOG_WARN(tag() + " response for closed connection #" + std::to_string(conn_id) + " discarded");
      }
      continue;
    }
    it->second->set_interest(Interest::kWrite);
  }
}

void Worker::dispatch(Connection& conn, const ReadyEvent& ev) {
  if (conn.is_closed())
    return;

  if (conn.get_interest() == Interest::kRead) {
    if (ev.readable) {
      NBHTTP_LOG_DEBUG(tag() + " reading request from connection #" + std::to_string(conn.get_id()));
      read_request(conn);
      return;
    }
  } else if (ev.writable) {
    NBHTTP_LOG_DEBUG(tag() + " writing response to connection #" + std::to_string(conn.get_id()));
    write_response(conn);
    return;
  }

  if (ev.error) {
    NBHTTP_LOG_DEBUG(tag() + " connection #" + std::to_string(conn.get_id()) + " hung up");
    close_connection(conn);
  }
}

// ============================================================================
// Read / write handlers
// ============================================================================

void Worker::read_request(Connection& conn) {
  auto result = conn.read_some(read_buffer_.data(), read_buffer_.size());
  if (!result.has_value()) {
    ErrorCode err = result.get_error();
    if (err == ErrorCode::kWouldBlock)
      return;
    if (err == ErrorCode::kSocketError) {
      stats_.read_errors.fetch_add(1, std::memory_order_relaxed);
    }
    NBHTTP_LOG_DEBUG(tag() + " closing connection #" + std::to_string(conn.get_id()) + ": " +
                     error_code_to_string(err));
    close_connection(conn);
    return;
  }

  size_t n = result.value();
  stats_.bytes_in.fetch_add(n, std::memory_order_relaxed);

  auto text = utf8::decode(read_buffer_.data(), n);
  if (!text.has_value()) {
    // No response will be produced; the connection stays registered for read
    stats_.decode_errors.fetch_add(1, std::memory_order_relaxed);
    NBHTTP_LOG_ERROR(tag() + " error decoding message read from connection #" + std::to_string(conn.get_id()));
    return;
  }

  NBHTTP_LOG_DEBUG(tag() + " read from connection #" + std::to_string(conn.get_id()) + ": " + text.value());

  // Blocks the loop while the work queue is full
  if (!work_queue_.push(SocketReadPayload{conn.get_handle(), std::move(text.value())})) {
    stats_.payloads_dropped.fetch_add(1, std::memory_order_relaxed);
    NBHTTP_LOG_ERROR(tag() + " work queue closed, payload from connection #" + std::to_string(conn.get_id()) +
                     " dropped");
    return;
  }
  stats_.payloads_queued.fetch_add(1, std::memory_order_relaxed);
}

void Worker::write_response(Connection& conn) {
  if (!conn.has_data_to_send()) {
    auto response = pending_responses_.take(conn.get_id());
    if (!response.has_value()) {
      stats_.missing_responses.fetch_add(1, std::memory_order_relaxed);
      NBHTTP_LOG_ERROR(tag() + " no response available for connection #" + std::to_string(conn.get_id()));
      close_connection(conn);
      return;
    }
    conn.queue_output(response->raw_response());
  }

  size_t before = conn.bytes_pending();
  auto result = conn.flush();
  stats_.bytes_out.fetch_add(before - conn.bytes_pending(), std::memory_order_relaxed);

  if (!result.has_value()) {
    if (result.get_error() == ErrorCode::kWouldBlock) {
      // Resumed on the next write-readiness event
      NBHTTP_LOG_DEBUG(tag() + " connection #" + std::to_string(conn.get_id()) + " has " +
                       std::to_string(conn.bytes_pending()) + " bytes pending");
      return;
    }
    stats_.write_errors.fetch_add(1, std::memory_order_relaxed);
    NBHTTP_LOG_ERROR(tag() + " error writing to connection #" + std::to_string(conn.get_id()));
  } else {
    stats_.responses_written.fetch_add(1, std::memory_order_relaxed);
  }

  // One response per connection: no keep-alive
  close_connection(conn);
}

// ============================================================================
// Close / cleanup
// ============================================================================

void Worker::close_connection(Connection& conn) {
  if (!conn.close())
    return;

  pending_responses_.discard(conn.get_id());
  gate_.release();
  stats_.closed_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);

  NBHTTP_LOG_DEBUG(tag() + " closed connection #" + std::to_string(conn.get_id()));
}

void Worker::remove_closed_connections() {
  auto it = std::remove_if(connections_.begin(), connections_.end(), [this](const ConnPtr& conn) {
    if (!conn->is_closed())
      return false;
    by_id_.erase(conn->get_id());
    return true;
  });
  connections_.erase(it, connections_.end());
}

void Worker::close_all() {
  for (auto& conn : connections_) {
    close_connection(*conn);
  }
  connections_.clear();
  by_id_.clear();

  close_unregistered();
}

// Sockets admitted but never registered still hold a slot. Called by the loop
// on exit and by handle() when it loses a race with stop().
void Worker::close_unregistered() {
  while (auto sock = new_clients_.try_pop()) {
    if (sock->is_open() && !sock->close()) {
      NBHTTP_LOG_WARN(tag() + " error while closing unregistered socket: " + sock->last_error_str());
    }
    gate_.release();
    stats_.closed_connections.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string Worker::tag() const {
  return "Worker #" + std::to_string(id_);
}

}  // namespace nbhttp
