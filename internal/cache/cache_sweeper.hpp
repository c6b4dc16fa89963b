#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace pricing::cache {

class KeyedCache;

/*
  Periodically reclaims expired cache entries.

  Lazy expiry on read keeps results correct without it; the sweeper
  only bounds memory held by entries nobody reads again.
*/
class CacheSweeper {
 public:
  CacheSweeper(std::shared_ptr<KeyedCache> cache, std::chrono::milliseconds interval);
  ~CacheSweeper();

  CacheSweeper(const CacheSweeper&)            = delete;
  CacheSweeper& operator=(const CacheSweeper&) = delete;

  void Start();

  // Wakes the loop and joins. Safe to call more than once.
  void Stop();

  bool Running() const {
    return running_;
  }

  uint64_t Passes() const {
    return passes_;
  }

 private:
  void Loop();

  std::shared_ptr<KeyedCache>     cache_;
  const std::chrono::milliseconds interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> passes_{0};
};

} // namespace pricing::cache
