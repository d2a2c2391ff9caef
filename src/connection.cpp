/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/connection.hpp"

#include "nbhttp/log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>

namespace nbhttp {

Connection::Connection(sockpp::tcp_socket&& sock, ConnectionHandle handle)
    : handle_(handle), socket_(std::move(sock)) {
  if (!socket_.set_non_blocking(true)) {
    NBHTTP_LOG_WARN("Connection #" + std::to_string(handle_.conn_id) +
                    ": failed to set non-blocking: " + socket_.last_error_str());
  }
}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

expected<size_t, ErrorCode> Connection::read_some(uint8_t* buf, size_t len) {
  if (state_ != ConnectionState::kOpen) {
    last_error_code_ = ErrorCode::kInvalidState;
    return expected<size_t, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  ssize_t n;
  do {
    n = ::recv(socket_.handle(), buf, len, 0);
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    last_error_code_ = ErrorCode::kOk;
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  if (n == 0) {
    last_error_code_ = ErrorCode::kConnectionClosed;
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK) {
    last_error_code_ = ErrorCode::kWouldBlock;
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  last_error_code_ = ErrorCode::kSocketError;
  NBHTTP_LOG_DEBUG("Connection #" + std::to_string(handle_.conn_id) + " read error: " + strerror(err));
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

void Connection::queue_output(const std::string& data) {
  if (tx_offset_ == tx_buffer_.size()) {
    tx_buffer_.clear();
    tx_offset_ = 0;
  }
  tx_buffer_.append(data);
}

expected<void, ErrorCode> Connection::flush() {
  if (state_ != ConnectionState::kOpen) {
    last_error_code_ = ErrorCode::kInvalidState;
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  while (tx_offset_ < tx_buffer_.size()) {
    // MSG_NOSIGNAL: a peer that already hung up must not raise SIGPIPE
    ssize_t n = ::send(socket_.handle(), tx_buffer_.data() + tx_offset_, tx_buffer_.size() - tx_offset_,
                       MSG_NOSIGNAL);
    if (n > 0) {
      tx_offset_ += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR)
      continue;
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) {
      last_error_code_ = ErrorCode::kWouldBlock;
      return expected<void, ErrorCode>::error(ErrorCode::kWouldBlock);
    }
    last_error_code_ = ErrorCode::kSocketError;
    NBHTTP_LOG_DEBUG("Connection #" + std::to_string(handle_.conn_id) + " write error: " + strerror(err));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  tx_buffer_.clear();
  tx_offset_ = 0;
  last_error_code_ = ErrorCode::kOk;
  return expected<void, ErrorCode>::success();
}

bool Connection::close() {
  if (state_ != ConnectionState::kOpen)
    return false;

  state_ = ConnectionState::kClosing;
  if (socket_.is_open() && !socket_.close()) {
    NBHTTP_LOG_WARN("Connection #" + std::to_string(handle_.conn_id) +
                    ": error while shutting down socket: " + socket_.last_error_str());
  }
  tx_buffer_.clear();
  tx_offset_ = 0;
  state_ = ConnectionState::kClosed;
  return true;
}

}  // namespace nbhttp
