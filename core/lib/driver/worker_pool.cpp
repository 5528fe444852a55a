// driftscan/driver/worker_pool.cpp - Fixed-size pool for per-file scan jobs
#include "driftscan/driver/worker_pool.hpp"

#include <algorithm>
#include <stdexcept>

namespace driftscan
{

namespace
{

constexpr size_t kMaxDefaultWorkers = 8;

}  // namespace

size_t adaptive_concurrency(size_t file_count, std::optional<size_t> requested)
{
  size_t workers = 0;
  if (requested) {
    workers = *requested;
  } else {
    // hardware_concurrency() may report 0 when unknown
    workers = std::clamp<size_t>(std::thread::hardware_concurrency(), 1, kMaxDefaultWorkers);
  }
  return std::max<size_t>(1, std::min(workers, file_count));
}

WorkerPool::WorkerPool(size_t workers)
{
  if (workers == 0) throw std::invalid_argument("WorkerPool needs at least one worker");
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this]() { run(); });
  }
}

WorkerPool::~WorkerPool()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  ready_.notify_all();
  for (auto & t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::run()
{
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ready_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop();
    }
    // packaged_task stores any exception in the job's future
    job();
  }
}

}  // namespace driftscan
