/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_WORKER_HPP_
#define NBHTTP_WORKER_HPP_

#include "admission.hpp"
#include "blocking_queue.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "http.hpp"
#include "poller.hpp"
#include "response_store.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <sockpp/tcp_socket.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace nbhttp {

// Text decoded from one read, handed to the processing pool.
struct SocketReadPayload {
  ConnectionHandle handle;
  std::string text;
};

using WorkQueue = BlockingQueue<SocketReadPayload>;

// ============================================================================
// Worker (single-threaded reactor over poll())
// ============================================================================
//
// One thread runs run(). It alone registers sockets, waits for readiness,
// reads, writes and closes. Other threads talk to it through exactly two
// entry points, both of which only enqueue state and wake the poller:
//
//   handle()         - acceptor thread hands over a freshly accepted socket
//   send_response()  - processing thread delivers the response for a request
//
// Lifecycle of a connection:
//   handle() -> registered for read -> payload pushed to the work queue
//   -> send_response() -> registered for write -> response flushed -> closed
//
// A connection is closed exactly once (peer EOF, I/O error or response
// written) and each close gives its admission slot back.
//
// The work queue push in the read path blocks when the queue is full. That
// stalls this worker entirely (admission, reads and writes of every other
// connection) until a processing thread pops; size the queue accordingly.
class Worker {
 public:
  Worker(uint32_t id, WorkQueue& work_queue, const WorkerConfig& config = WorkerConfig());
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Runs the reactor loop until stop(). Never throws.
  void run();

  // Thread-safe. Makes run() return after its current iteration; live
  // connections are closed and queued sockets released on the way out.
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  // --- Cross-thread entry points ---

  // Admission: accepts the socket if a slot is free and the handoff queue has
  // room. On false the socket is left untouched with the caller.
  bool handle(sockpp::tcp_socket&& sock);

  // Stores the response for `handle` and wakes the loop, which switches the
  // connection to write interest, flushes the response and closes it.
  void send_response(const ConnectionHandle& handle, HttpResponse response);

  // True if the handle was issued by this worker
  bool is_handling_client(const ConnectionHandle& handle) const { return handle.worker_id == id_; }

  // --- Status ---

  uint32_t id() const { return id_; }
  size_t free_slots() const { return gate_.free_slots(); }
  size_t max_clients() const { return gate_.capacity(); }
  size_t connection_count() const { return stats_.active_connections.load(std::memory_order_relaxed); }
  size_t pending_response_count() const { return pending_responses_.size(); }
  const WorkerStats& stats() const { return stats_; }
  const WorkerConfig& config() const { return config_; }

  // --- Configuration (before run()) ---

  Worker& set_poll_timeout_ms(int timeout) {
    config_.poll_timeout_ms = timeout;
    return *this;
  }

  Worker& set_read_buffer_size(size_t size) {
    config_.read_buffer_size = size == 0 ? 1 : size;
    read_buffer_.resize(config_.read_buffer_size);
    return *this;
  }

 private:
  uint32_t id_;
  WorkerConfig config_;
  WorkQueue& work_queue_;

  // Shared with other threads
  AdmissionGate gate_;
  BlockingQueue<sockpp::tcp_socket> new_clients_;
  ResponseStore pending_responses_;
  Poller poller_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> is_running_{false};
  WorkerStats stats_;

  // Loop-thread only
  std::vector<ConnPtr> connections_;  // registration order
  std::unordered_map<uint64_t, Connection*> by_id_;
  std::vector<PollEntry> poll_entries_;
  std::vector<Connection*> polled_;  // parallel to poll_entries_
  std::vector<ReadyEvent> ready_;
  std::vector<uint64_t> ready_ids_;
  std::vector<uint8_t> read_buffer_;
  uint64_t next_conn_id_ = 1;

  void run_once();
  void register_pending_client();
  void apply_pending_responses();
  void dispatch(Connection& conn, const ReadyEvent& ev);
  void read_request(Connection& conn);
  void write_response(Connection& conn);
  void close_connection(Connection& conn);
  void remove_closed_connections();
  void close_all();
  void close_unregistered();
  std::string tag() const;
};

}  // namespace nbhttp

#endif  // NBHTTP_WORKER_HPP_
