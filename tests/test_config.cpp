#include "nbhttp/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace nbhttp;

namespace {

expected<ServerConfig, ErrorCode> parse(std::vector<const char*> args, std::string* error = nullptr) {
  args.insert(args.begin(), "nbhttp_server");
  return parse_server_args(static_cast<int>(args.size()), args.data(), error);
}

}  // namespace

TEST_CASE("parse_server_args - defaults", "[config]") {
  auto result = parse({});
  REQUIRE(result.has_value());
  const ServerConfig& config = result.value();
  REQUIRE(config.port == 8080);
  REQUIRE(config.workers == 2);
  REQUIRE(config.processing_threads == 4);
  REQUIRE(config.work_queue_capacity == 10);
  REQUIRE(config.worker.max_clients == 64);
  REQUIRE(config.worker.read_buffer_size == 16384);
  REQUIRE(config.worker.reserve_headroom_slot);
  REQUIRE_FALSE(config.show_help);
}

TEST_CASE("parse_server_args - all flags", "[config]") {
  auto result = parse({"--port", "9000", "--bind", "127.0.0.1", "--workers", "3", "--threads", "8", "--max-clients",
                       "100", "--queue-cap", "32", "--read-buffer", "4096", "--root", "/srv/www", "-v"});
  REQUIRE(result.has_value());
  const ServerConfig& config = result.value();
  REQUIRE(config.port == 9000);
  REQUIRE(config.bind_addr == "127.0.0.1");
  REQUIRE(config.workers == 3);
  REQUIRE(config.processing_threads == 8);
  REQUIRE(config.worker.max_clients == 100);
  REQUIRE(config.work_queue_capacity == 32);
  REQUIRE(config.worker.read_buffer_size == 4096);
  REQUIRE(config.document_root == "/srv/www");
  REQUIRE(config.verbose);
}

TEST_CASE("parse_server_args - help", "[config]") {
  auto result = parse({"--help"});
  REQUIRE(result.has_value());
  REQUIRE(result.value().show_help);
}

TEST_CASE("parse_server_args - errors", "[config]") {
  std::string error;

  SECTION("missing value") {
    auto result = parse({"--port"}, &error);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.get_error() == ErrorCode::kInvalidArgument);
    REQUIRE(error == "Missing value for --port");
  }
  SECTION("port out of range") {
    REQUIRE_FALSE(parse({"--port", "70000"}, &error).has_value());
    REQUIRE(error == "Invalid --port: 70000");
  }
  SECTION("non-numeric value") {
    REQUIRE_FALSE(parse({"--workers", "two"}, &error).has_value());
    REQUIRE(error == "Invalid --workers: two");
  }
  SECTION("zero workers") {
    REQUIRE_FALSE(parse({"--workers", "0"}).has_value());
  }
  SECTION("read buffer too small") {
    REQUIRE_FALSE(parse({"--read-buffer", "16"}).has_value());
  }
  SECTION("unknown flag") {
    REQUIRE_FALSE(parse({"--keepalive", "1"}, &error).has_value());
    REQUIRE(error == "Unknown argument: --keepalive");
  }
}

TEST_CASE("server_usage names the program", "[config]") {
  std::string usage = server_usage("nbhttp_server");
  REQUIRE(usage.find("Usage: nbhttp_server") == 0);
  REQUIRE(usage.find("--max-clients") != std::string::npos);
}
