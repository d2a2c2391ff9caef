/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_CONNECTION_HPP_
#define NBHTTP_CONNECTION_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <functional>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>

namespace nbhttp {

// ============================================================================
// ConnectionHandle (opaque registration identity)
// ============================================================================

// Issued by a worker when it registers a socket. Safe to copy across threads;
// it refers to the connection, it never grants access to the socket.
struct ConnectionHandle {
  uint32_t worker_id = 0;
  uint64_t conn_id = 0;

  bool operator==(const ConnectionHandle& other) const {
    return worker_id == other.worker_id && conn_id == other.conn_id;
  }
  bool operator!=(const ConnectionHandle& other) const { return !(*this == other); }
};

enum class Interest : uint8_t { kRead, kWrite };

enum class ConnectionState : uint8_t {
  kOpen,     // registered, socket usable
  kClosing,  // close in progress
  kClosed    // socket closed, registration cancelled
};

// ============================================================================
// Connection (one admitted socket, owned by the worker's loop thread)
// ============================================================================

class Connection {
 public:
  explicit Connection(sockpp::tcp_socket&& sock, ConnectionHandle handle = {});
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Reactor I/O API ---

  // Reads once into buf. Returns the byte count (> 0), error(kConnectionClosed)
  // on orderly peer shutdown, error(kWouldBlock) if nothing was available, or
  // error(kSocketError).
  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len);

  // Appends bytes to the pending output.
  void queue_output(const std::string& data);

  // Writes as much pending output as the socket accepts. Returns success()
  // once everything is written, error(kWouldBlock) if bytes remain for the
  // next write-readiness event, error(kSocketError) on failure.
  expected<void, ErrorCode> flush();

  bool has_data_to_send() const { return tx_offset_ < tx_buffer_.size(); }
  size_t bytes_pending() const { return tx_buffer_.size() - tx_offset_; }

  // Closes the socket and marks the connection closed. Only the first call
  // does anything; it returns true, later calls return false.
  bool close();

  bool is_closed() const { return state_ == ConnectionState::kClosed; }

  // --- Getters / setters ---

  ConnectionState get_state() const { return state_; }
  Interest get_interest() const { return interest_; }
  void set_interest(Interest interest) { interest_ = interest; }

  int get_fd() const { return static_cast<int>(socket_.handle()); }
  const ConnectionHandle& get_handle() const { return handle_; }
  uint64_t get_id() const { return handle_.conn_id; }

  ErrorCode get_last_error() const { return last_error_code_; }

 private:
  ConnectionHandle handle_;
  sockpp::tcp_socket socket_;
  ConnectionState state_ = ConnectionState::kOpen;
  Interest interest_ = Interest::kRead;

  std::string tx_buffer_;
  size_t tx_offset_ = 0;

  ErrorCode last_error_code_ = ErrorCode::kOk;
};

using ConnPtr = std::unique_ptr<Connection>;

}  // namespace nbhttp

namespace std {

template <>
struct hash<nbhttp::ConnectionHandle> {
  size_t operator()(const nbhttp::ConnectionHandle& h) const noexcept {
    return std::hash<uint64_t>()(h.conn_id) ^ (std::hash<uint32_t>()(h.worker_id) << 1);
  }
};

}  // namespace std

#endif  // NBHTTP_CONNECTION_HPP_
