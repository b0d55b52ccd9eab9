// ============================================================================
// reply_collector.cpp : implementation for reply_collector.hpp
// ============================================================================

#include "orbcomm/transport/reply_collector.hpp"

#include <utility>

namespace orbcomm::transport {

ReplyCollector::ReplyCollector(std::size_t max_replies) : max_(max_replies) {}

bool ReplyCollector::add(Sample sample) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || full_locked()) return false;   // late or surplus reply
    replies_.push_back(std::move(sample));
  }
  cv_.notify_all();
  return true;
}

std::vector<Sample> ReplyCollector::wait(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_until(lk, deadline, [this] { return closed_ || full_locked(); });
  closed_ = true;                         // later add() calls are dropped
  return std::move(replies_);
}

void ReplyCollector::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace orbcomm::transport
