/**
 * @file ThreadPool.h
 * @brief Fixed-size worker pool used to run block tasks concurrently
 */

#ifndef BLOCKFUSE_THREAD_POOL_H
#define BLOCKFUSE_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace blockfuse {

class ThreadPool {
private:
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_queue_mutex;
  std::condition_variable m_condition;
  std::condition_variable m_idle_condition;
  size_t m_active_tasks;
  std::atomic<bool> m_stop;

public:
  // Zero selects the hardware concurrency
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <class F, class... Args>
  auto Enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * @brief Block until the queue is drained and no worker is busy
   */
  void WaitForCompletion();
  size_t GetNumThreads() const { return m_workers.size(); }
};

template <class F, class... Args>
auto ThreadPool::Enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {

  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();

  {
    std::unique_lock<std::mutex> lock(m_queue_mutex);

    if (m_stop) {
      throw std::runtime_error("enqueue on stopped ThreadPool");
    }

    m_tasks.emplace([task]() { (*task)(); });
  }

  m_condition.notify_one();
  return res;
}

} // namespace blockfuse

#endif // BLOCKFUSE_THREAD_POOL_H
