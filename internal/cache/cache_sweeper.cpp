#include "internal/cache/cache_sweeper.hpp"

#include <stdexcept>

#include "internal/cache/keyed_cache.hpp"

namespace pricing::cache {

CacheSweeper::CacheSweeper(std::shared_ptr<KeyedCache> cache, std::chrono::milliseconds interval)
    : cache_(std::move(cache)), interval_(interval) {
  if (interval_.count() <= 0) throw std::invalid_argument("sweep interval must be positive");
}

CacheSweeper::~CacheSweeper() {
  Stop();
}

void CacheSweeper::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&CacheSweeper::Loop, this);
}

void CacheSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void CacheSweeper::Loop() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [&] { return stop_requested_; })) break;

    lock.unlock();
    cache_->Sweep();
    passes_.fetch_add(1, std::memory_order_relaxed);
    lock.lock();
  }
}

} // namespace pricing::cache
