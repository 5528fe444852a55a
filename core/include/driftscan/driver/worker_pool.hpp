// driftscan/driver/worker_pool.hpp - Fixed-size pool for per-file scan jobs
#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace driftscan
{

/**
 * Worker count for a scan: the requested value, else the hardware
 * concurrency clamped to [1, 8]; never more than the number of files.
 */
[[nodiscard]] size_t adaptive_concurrency(size_t file_count, std::optional<size_t> requested);

/**
 * A fixed set of threads draining a FIFO job queue.
 *
 * Jobs report results and exceptions through the returned future, so callers
 * can collect them in submission order regardless of completion order. The
 * destructor finishes queued jobs and joins every thread.
 */
class WorkerPool
{
public:
  explicit WorkerPool(size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool & operator=(const WorkerPool &) = delete;

  template <class F>
  [[nodiscard]] auto submit(F && job) -> std::future<std::invoke_result_t<std::decay_t<F>>>
  {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
    auto future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs_.emplace([task]() { (*task)(); });
    }
    ready_.notify_one();
    return future;
  }

  [[nodiscard]] size_t size() const noexcept { return threads_.size(); }

private:
  void run();

  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  std::mutex mutex_;
  std::condition_variable ready_;
  bool stopping_ = false;
};

}  // namespace driftscan
