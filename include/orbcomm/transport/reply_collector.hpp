#pragma once
/**
 * @file reply_collector.hpp
 * @brief Fan-in buffer for the replies of one query.
 *
 * Shared between the querying thread (wait()) and whatever threads deliver
 * replies (add()). Once `max_replies` replies arrived, or wait() returned,
 * the collector is closed and further replies are ignored.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm::transport {

class ReplyCollector {
public:
  /// max_replies == 0 collects until the timeout.
  explicit ReplyCollector(std::size_t max_replies);

  /// Returns false if the collector is closed or already full.
  bool add(Sample sample);

  /// Block until full or until `timeout` elapsed, close, return replies.
  std::vector<Sample> wait(std::chrono::milliseconds timeout);

  void close();

private:
  bool full_locked() const { return max_ != 0 && replies_.size() >= max_; }

  std::mutex              mu_;
  std::condition_variable cv_;
  std::size_t             max_;
  bool                    closed_ = false;
  std::vector<Sample>     replies_;
};

} // namespace orbcomm::transport
