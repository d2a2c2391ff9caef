/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/poller.hpp"

#include "nbhttp/log.hpp"

#include <cerrno>
#include <cstring>

#include <stdexcept>
#include <string>
#include <sys/eventfd.h>
#include <unistd.h>

namespace nbhttp {

Poller::Poller() {
  wakeup_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeup_fd_ < 0) {
    int err = errno;
    NBHTTP_THROW(std::runtime_error(std::string("Failed to create wakeup eventfd: ") + strerror(err)));
  }
}

Poller::~Poller() {
  if (wakeup_fd_ >= 0) {
    ::close(wakeup_fd_);
  }
}

expected<void, ErrorCode> Poller::wait(const std::vector<PollEntry>& entries, int timeout_ms,
                                       std::vector<ReadyEvent>& ready) {
  woken_ = false;

  poll_fds_.clear();
  poll_fds_.reserve(entries.size() + 1);
  poll_fds_.push_back({wakeup_fd_, POLLIN, 0});
  for (const auto& entry : entries) {
    poll_fds_.push_back({entry.fd, static_cast<short>(entry.want_write ? POLLOUT : POLLIN), 0});
  }

  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), timeout_ms);
  if (ret < 0) {
    int err = errno;
    if (err == EINTR) {
      return expected<void, ErrorCode>::success();
    }
    NBHTTP_LOG_ERROR(std::string("poll() failed: ") + strerror(err));
    return expected<void, ErrorCode>::error(ErrorCode::kPollError);
  }

  if (ret == 0) {
    return expected<void, ErrorCode>::success();
  }

  if (poll_fds_[0].revents & POLLIN) {
    woken_ = true;
    drain_wakeup();
  }

  for (size_t i = 1; i < poll_fds_.size(); ++i) {
    short revents = poll_fds_[i].revents;
    if (revents == 0)
      continue;
    ReadyEvent ev;
    ev.index = i - 1;
    ev.readable = (revents & POLLIN) != 0;
    ev.writable = (revents & POLLOUT) != 0;
    ev.error = (revents & (POLLERR | POLLHUP | POLLNVAL)) != 0;
    ready.push_back(ev);
  }

  return expected<void, ErrorCode>::success();
}

void Poller::wakeup() {
  uint64_t one = 1;
  ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
  if (n != static_cast<ssize_t>(sizeof one)) {
    // EAGAIN means the counter is saturated; the loop is already due to wake
    if (errno != EAGAIN) {
      NBHTTP_LOG_ERROR("Poller::wakeup() wrote " + std::to_string(n) + " bytes instead of 8");
    }
  }
}

void Poller::drain_wakeup() {
  uint64_t value = 0;
  ssize_t n = ::read(wakeup_fd_, &value, sizeof value);
  if (n != static_cast<ssize_t>(sizeof value) && errno != EAGAIN) {
    NBHTTP_LOG_ERROR("Poller::drain_wakeup() read " + std::to_string(n) + " bytes instead of 8");
  }
}

}  // namespace nbhttp
