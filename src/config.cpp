/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/config.hpp"

#include <cerrno>
#include <cstdlib>

#include <string>

namespace nbhttp {

namespace {

bool parse_range(const char* s, long lo, long hi, long& out) {
  if (s == nullptr || *s == '\0')
    return false;
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0')
    return false;
  if (v < lo || v > hi)
    return false;
  out = v;
  return true;
}

}  // namespace

expected<ServerConfig, ErrorCode> parse_server_args(int argc, const char* const* argv, std::string* error_msg) {
  ServerConfig config;

  auto fail = [&](const std::string& msg) {
    if (error_msg)
      *error_msg = msg;
    return expected<ServerConfig, ErrorCode>::error(ErrorCode::kInvalidArgument);
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];

    if (a == "--help" || a == "-h") {
      config.show_help = true;
      continue;
    }
    if (a == "--verbose" || a == "-v") {
      config.verbose = true;
      continue;
    }

    if (i + 1 >= argc)
      return fail("Missing value for " + a);
    const char* value = argv[++i];
    long v = 0;

    if (a == "--port") {
      if (!parse_range(value, 0, 65535, v))
        return fail("Invalid --port: " + std::string(value));
      config.port = static_cast<uint16_t>(v);
    } else if (a == "--bind") {
      config.bind_addr = value;
    } else if (a == "--workers") {
      if (!parse_range(value, 1, 256, v))
        return fail("Invalid --workers: " + std::string(value));
      config.workers = static_cast<size_t>(v);
    } else if (a == "--threads") {
      if (!parse_range(value, 1, 256, v))
        return fail("Invalid --threads: " + std::string(value));
      config.processing_threads = static_cast<size_t>(v);
    } else if (a == "--max-clients") {
      if (!parse_range(value, 1, 1000000, v))
        return fail("Invalid --max-clients: " + std::string(value));
      config.worker.max_clients = static_cast<size_t>(v);
    } else if (a == "--queue-cap") {
      if (!parse_range(value, 1, 1000000, v))
        return fail("Invalid --queue-cap: " + std::string(value));
      config.work_queue_capacity = static_cast<size_t>(v);
    } else if (a == "--read-buffer") {
      if (!parse_range(value, 512, 16 * 1024 * 1024, v))
        return fail("Invalid --read-buffer: " + std::string(value));
      config.worker.read_buffer_size = static_cast<size_t>(v);
    } else if (a == "--root") {
      config.document_root = value;
    } else {
      return fail("Unknown argument: " + a);
    }
  }

  return expected<ServerConfig, ErrorCode>::success(std::move(config));
}

std::string server_usage(const char* program) {
  std::string usage = "Usage: ";
  usage += program;
  usage +=
      " [--port N] [--bind ADDR] [--workers N] [--threads N]\n"
      "       [--max-clients N] [--queue-cap N] [--read-buffer BYTES]\n"
      "       [--root DIR] [--verbose] [--help]\n";
  return usage;
}

}  // namespace nbhttp
