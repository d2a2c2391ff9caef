/**
 * nbhttp static file server
 *
 * Build:
 *   cmake -B build -DNBHTTP_BUILD_EXAMPLES=ON && cmake --build build
 *
 * Run:
 *   ./build/nbhttp_server --port 8080 --workers 2 --root ./public
 *
 * Test:
 *   curl -v http://localhost:8080/index.html
 */

#include "nbhttp.hpp"

#include <csignal>

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<nbhttp::Acceptor*> g_acceptor{nullptr};

void on_signal(int) {
  nbhttp::Acceptor* acceptor = g_acceptor.load();
  if (acceptor != nullptr)
    acceptor->stop();
}

std::string content_type_for(const std::string& path) {
  auto dot = path.rfind('.');
  std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
  if (ext == "html" || ext == "htm")
    return "text/html; charset=utf-8";
  if (ext == "css")
    return "text/css";
  if (ext == "js")
    return "application/javascript";
  if (ext == "json")
    return "application/json";
  if (ext == "png")
    return "image/png";
  if (ext == "jpg" || ext == "jpeg")
    return "image/jpeg";
  return "text/plain; charset=utf-8";
}

// GET serves files under the document root; other methods get 405.
nbhttp::RequestHandler make_get_handler(const std::string& root) {
  return [root](const nbhttp::HttpRequest& request) {
    if (request.method != "GET") {
      nbhttp::HttpResponse response = nbhttp::HttpResponse::text(405, "Method Not Allowed\n");
      response.set_header("Allow", "GET");
      return response;
    }

    std::string target = request.target.substr(0, request.target.find('?'));
    if (target.empty() || target.front() != '/' || target.find("..") != std::string::npos) {
      return nbhttp::HttpResponse::text(403, "Forbidden\n");
    }
    if (target.back() == '/')
      target += "index.html";

    std::string path = root + target;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      return nbhttp::HttpResponse::text(404, "Not Found\n");
    }

    std::ostringstream body;
    body << file.rdbuf();
    nbhttp::HttpResponse response(200);
    response.set_body(body.str(), content_type_for(path));
    return response;
  };
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string error;
  auto parsed = nbhttp::parse_server_args(argc, argv, &error);
  if (!parsed.has_value()) {
    std::cerr << error << "\n" << nbhttp::server_usage(argv[0]);
    return 1;
  }
  const nbhttp::ServerConfig& config = parsed.value();
  if (config.show_help) {
    std::cout << nbhttp::server_usage(argv[0]);
    return 0;
  }
  if (config.verbose) {
    nbhttp::Logger::set_level(nbhttp::Logger::Level::kDebug);
  }

  try {
    nbhttp::WorkQueue work_queue(config.work_queue_capacity);

    std::vector<std::unique_ptr<nbhttp::Worker>> workers;
    for (size_t i = 0; i < config.workers; ++i) {
      workers.push_back(std::make_unique<nbhttp::Worker>(static_cast<uint32_t>(i), work_queue, config.worker));
    }

    nbhttp::ProcessingPool pool(work_queue, make_get_handler(config.document_root), config.processing_threads);
    nbhttp::Acceptor acceptor(config.port, config.bind_addr);

    for (auto& worker : workers) {
      pool.add_worker(worker.get());
      acceptor.add_worker(worker.get());
    }

    pool.start();
    std::vector<std::thread> worker_threads;
    for (auto& worker : workers) {
      nbhttp::Worker* w = worker.get();
      worker_threads.emplace_back([w]() { w->run(); });
    }

    g_acceptor.store(&acceptor);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    acceptor.run();
    g_acceptor.store(nullptr);

    // Unblock workers stuck on a full work queue before joining them
    pool.stop();
    for (auto& worker : workers) {
      worker->stop();
    }
    for (auto& t : worker_threads) {
      t.join();
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
