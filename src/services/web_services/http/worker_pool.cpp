#include "services/web_services/http/worker_pool.hpp"

#include <exception>
#include <string>
#include <utility>

namespace devinv::services::web_services::http {

WorkerPool::WorkerPool(std::size_t threads,
                       std::shared_ptr<devinv::core::common::log::Logger> logger)
    : size_(threads == 0 ? 1 : threads), logger_(std::move(logger)) {}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  threads_.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    threads_.emplace_back(&WorkerPool::ProcessLoop, this);
  }
}

void WorkerPool::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_.exchange(false)) return;
  }
  queue_cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

bool WorkerPool::Submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_) return false;
    job_queue_.push(std::move(job));
  }
  queue_cv_.notify_one();
  return true;
}

void WorkerPool::ProcessLoop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !running_ || !job_queue_.empty(); });
      if (job_queue_.empty()) return;
      job = std::move(job_queue_.front());
      job_queue_.pop();
    }

    try {
      job();
    } catch (const std::exception& e) {
      if (logger_) logger_->Error(std::string("worker job failed: ") + e.what());
    }
  }
}

}  // namespace devinv::services::web_services::http
