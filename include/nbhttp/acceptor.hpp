/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_ACCEPTOR_HPP_
#define NBHTTP_ACCEPTOR_HPP_

#include "worker.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>
#include <string>
#include <vector>

namespace nbhttp {

// ============================================================================
// Acceptor - listening socket that spreads connections over workers
// ============================================================================

class Acceptor {
 public:
  // Binds and listens; throws std::runtime_error on failure. Port 0 picks an
  // ephemeral port (see port()).
  explicit Acceptor(uint16_t port, const std::string& bind_addr = "", int backlog = 128);
  ~Acceptor();

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  // Workers must be added before run()
  void add_worker(Worker* worker) { workers_.push_back(worker); }

  // Accept loop (blocking) until stop()
  void run();

  // Thread-safe; may be called before run()
  void stop() { stop_requested_.store(true, std::memory_order_release); }

  // Offers the socket to each worker once, starting after the worker that
  // took the previous connection. Returns false and closes the socket if
  // every worker refuses it.
  bool dispatch(sockpp::tcp_socket&& sock);

  uint16_t port() const { return port_; }

  uint64_t accepted() const { return accepted_.load(std::memory_order_relaxed); }
  uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

  Acceptor& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

 private:
  sockpp::tcp_acceptor acceptor_;
  uint16_t port_ = 0;
  std::vector<Worker*> workers_;
  size_t next_worker_ = 0;
  int poll_timeout_ms_ = 100;
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_{0};
};

}  // namespace nbhttp

#endif  // NBHTTP_ACCEPTOR_HPP_
