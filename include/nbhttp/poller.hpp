/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_POLLER_HPP_
#define NBHTTP_POLLER_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <poll.h>
#include <vector>

namespace nbhttp {

// ============================================================================
// Poller (poll() readiness multiplexer + eventfd wakeup)
// ============================================================================

// One watched socket for a single wait() call.
struct PollEntry {
  int fd;
  bool want_write;  // interest is write-only when set, read-only otherwise
};

// Readiness reported for entries[index] of the last wait() call.
struct ReadyEvent {
  size_t index;
  bool readable;
  bool writable;
  bool error;  // POLLERR / POLLHUP / POLLNVAL
};

class Poller {
 public:
  Poller();
  ~Poller();

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  // Blocks until at least one entry is ready, wakeup() is called, or the
  // timeout (ms, -1 = infinite) expires. Ready events are appended to `ready`
  // in the order of `entries`. An interrupted wait (EINTR) succeeds empty.
  expected<void, ErrorCode> wait(const std::vector<PollEntry>& entries, int timeout_ms, std::vector<ReadyEvent>& ready);

  // Thread-safe. Unblocks a pending or the next wait().
  void wakeup();

  // True if the last wait() returned because of wakeup()
  bool woken() const { return woken_; }

 private:
  void drain_wakeup();

  int wakeup_fd_ = -1;
  bool woken_ = false;

  // Index 0 is the wakeup eventfd; reused across calls
  std::vector<pollfd> poll_fds_;
};

}  // namespace nbhttp

#endif  // NBHTTP_POLLER_HPP_
