/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_RESPONSE_STORE_HPP_
#define NBHTTP_RESPONSE_STORE_HPP_

#include "http.hpp"

#include <cstddef>
#include <cstdint>

#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nbhttp {

// ============================================================================
// ResponseStore - responses waiting for their connection to become writable
// ============================================================================

// Processing threads put(); the worker loop is the only caller of
// drain_ready(), take() and discard().
class ResponseStore {
 public:
  // Stores (or replaces) the response for a connection and marks the
  // connection as ready to switch to write interest.
  void put(uint64_t conn_id, HttpResponse response) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = responses_.find(conn_id);
    if (it != responses_.end()) {
      it->second = std::move(response);
      return;
    }
    responses_.emplace(conn_id, std::move(response));
    ready_.push_back(conn_id);
  }

  // Moves the ids stored since the previous call into out (in put() order).
  void drain_ready(std::vector<uint64_t>& out) {
    std::lock_guard<std::mutex> lock(mu_);
    out.insert(out.end(), ready_.begin(), ready_.end());
    ready_.clear();
  }

  std::optional<HttpResponse> take(uint64_t conn_id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = responses_.find(conn_id);
    if (it == responses_.end())
      return std::nullopt;
    HttpResponse response = std::move(it->second);
    responses_.erase(it);
    return response;
  }

  bool discard(uint64_t conn_id) {
    std::lock_guard<std::mutex> lock(mu_);
    return responses_.erase(conn_id) > 0;
  }

  bool contains(uint64_t conn_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return responses_.count(conn_id) > 0;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return responses_.size();
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<uint64_t, HttpResponse> responses_;
  std::vector<uint64_t> ready_;
};

}  // namespace nbhttp

#endif  // NBHTTP_RESPONSE_STORE_HPP_
