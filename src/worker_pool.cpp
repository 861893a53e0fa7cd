#include "worker_pool.hpp"

#include <stdexcept>

WorkerPool::WorkerPool(std::size_t workers) {
  if(workers == 0) workers = 1;
  threads_.reserve(workers);
  for(std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this](){ worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  cv_.notify_all();
  for(auto& thread : threads_) {
    if(thread.joinable()) thread.join();
  }
}

std::future<void> WorkerPool::submit(std::function<void()> task) {
  std::packaged_task<void()> job(std::move(task));
  auto future = job.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(shutting_down_) {
      throw std::runtime_error("WorkerPool is shutting down");
    }
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
  return future;
}

void WorkerPool::worker_loop() {
  while(true) {
    std::packaged_task<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&]{ return shutting_down_ || !queue_.empty(); });
      if(queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    job();
  }
}
