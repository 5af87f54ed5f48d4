#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "core/common/logger/logger.hpp"

namespace devinv::services::web_services::http {

// Fixed set of threads draining one FIFO job queue.
class WorkerPool {
public:
  using Job = std::function<void()>;

  explicit WorkerPool(std::size_t threads,
                      std::shared_ptr<devinv::core::common::log::Logger> logger = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Runs the jobs already queued, then joins the threads.
  void Stop();

  // False once Stop() has begun.
  bool Submit(Job job);

  std::size_t Size() const { return size_; }

private:
  void ProcessLoop();

private:
  std::size_t size_;
  std::shared_ptr<devinv::core::common::log::Logger> logger_;

  std::vector<std::thread> threads_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::queue<Job> job_queue_;
  std::atomic<bool> running_{false};
};

}  // namespace devinv::services::web_services::http
