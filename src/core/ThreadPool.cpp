/**
 * @file ThreadPool.cpp
 * @brief Worker pool implementation
 */

#include "ThreadPool.h"

namespace blockfuse {

ThreadPool::ThreadPool(size_t num_threads) : m_active_tasks(0), m_stop(false) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0)
      num_threads = 4; // Fallback
  }

  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back([this] {
      for (;;) {
        std::function<void()> task;

        {
          std::unique_lock<std::mutex> lock(this->m_queue_mutex);
          this->m_condition.wait(
              lock, [this] { return this->m_stop || !this->m_tasks.empty(); });

          if (this->m_stop && this->m_tasks.empty()) {
            return;
          }

          task = std::move(this->m_tasks.front());
          this->m_tasks.pop();
          ++this->m_active_tasks;
        }

        // Packaged tasks capture their own exceptions in the future
        task();

        {
          std::unique_lock<std::mutex> lock(this->m_queue_mutex);
          --this->m_active_tasks;
          if (this->m_tasks.empty() && this->m_active_tasks == 0) {
            this->m_idle_condition.notify_all();
          }
        }
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_stop = true;
  }

  m_condition.notify_all();

  for (std::thread &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void ThreadPool::WaitForCompletion() {
  std::unique_lock<std::mutex> lock(m_queue_mutex);
  m_idle_condition.wait(
      lock, [this] { return m_tasks.empty() && m_active_tasks == 0; });
}

} // namespace blockfuse
