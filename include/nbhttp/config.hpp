/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_CONFIG_HPP_
#define NBHTTP_CONFIG_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>

namespace nbhttp {

// ============================================================================
// WorkerConfig
// ============================================================================

struct WorkerConfig {
  size_t max_clients = 64;                 // admission slots
  size_t read_buffer_size = 16384;         // bytes read per readiness event
  size_t admission_queue_capacity = 10;    // sockets handed off but not yet registered
  int poll_timeout_ms = -1;                // -1: block until readiness or wakeup
  bool reserve_headroom_slot = true;       // admit only while free slots > 1
};

// ============================================================================
// ServerConfig (acceptor + workers + processing pool)
// ============================================================================

struct ServerConfig {
  uint16_t port = 8080;
  std::string bind_addr;                   // empty: all interfaces
  size_t workers = 2;
  size_t processing_threads = 4;
  size_t work_queue_capacity = 10;
  std::string document_root = ".";
  bool verbose = false;
  bool show_help = false;
  WorkerConfig worker;
};

// Parses "--flag value" arguments. Unknown flags, missing values and
// out-of-range numbers yield error(kInvalidArgument); `error_msg` names the
// offending argument.
expected<ServerConfig, ErrorCode> parse_server_args(int argc, const char* const* argv, std::string* error_msg = nullptr);

std::string server_usage(const char* program);

}  // namespace nbhttp

#endif  // NBHTTP_CONFIG_HPP_
