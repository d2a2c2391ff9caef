/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/acceptor.hpp"

#include "nbhttp/log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sockpp/inet_address.h>
#include <stdexcept>

namespace nbhttp {

Acceptor::Acceptor(uint16_t port, const std::string& bind_addr, int backlog) {
  sockpp::inet_address addr = bind_addr.empty() ? sockpp::inet_address(port) : sockpp::inet_address(bind_addr, port);

  if (!acceptor_.open(addr, backlog)) {
    NBHTTP_THROW(std::runtime_error("Failed to bind port " + std::to_string(port) + ": " + acceptor_.last_error_str()));
  }

  // Non-blocking so run() can notice stop() between poll timeouts
  acceptor_.set_non_blocking(true);
  port_ = acceptor_.address().port();

  NBHTTP_LOG_INFO("Acceptor listening on " + (bind_addr.empty() ? std::string("0.0.0.0") : bind_addr) + ":" +
                  std::to_string(port_));
}

Acceptor::~Acceptor() {
  if (acceptor_.is_open()) {
    acceptor_.close();
  }
}

void Acceptor::run() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    pollfd pfd{static_cast<int>(acceptor_.handle()), POLLIN, 0};
    int ret = ::poll(&pfd, 1, poll_timeout_ms_);
    if (ret < 0) {
      int err = errno;
      if (err != EINTR) {
        NBHTTP_LOG_ERROR(std::string("Acceptor poll error: ") + strerror(err));
      }
      continue;
    }
    if (ret == 0 || !(pfd.revents & POLLIN))
      continue;

    sockpp::tcp_socket sock = acceptor_.accept();
    if (!sock) {
      int err = acceptor_.last_error();
      if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
        NBHTTP_LOG_ERROR("Accept error: " + acceptor_.last_error_str());
      }
      continue;
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    dispatch(std::move(sock));
  }

  NBHTTP_LOG_INFO("Acceptor stopped");
}

bool Acceptor::dispatch(sockpp::tcp_socket&& sock) {
  const size_t n = workers_.size();
  for (size_t i = 0; i < n; ++i) {
    size_t idx = (next_worker_ + i) % n;
    // handle() only moves from sock when it accepts it
    if (workers_[idx]->handle(std::move(sock))) {
      next_worker_ = (idx + 1) % n;
      return true;
    }
  }

  rejected_.fetch_add(1, std::memory_order_relaxed);
  NBHTTP_LOG_WARN("All workers busy, rejecting connection");
  if (sock.is_open() && !sock.close()) {
    NBHTTP_LOG_WARN("Error while closing rejected socket: " + sock.last_error_str());
  }
  return false;
}

}  // namespace nbhttp
