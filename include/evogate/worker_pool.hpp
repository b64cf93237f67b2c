#pragma once

// evogate/worker_pool.hpp — Fixed-size thread pool with tracked completion.
//
// CONTRACT:
//   - submit() after shutdown() returns false and the task is not run.
//   - Tasks must not throw; the pool logs and drops any exception that
//     escapes one so a worker thread never terminates the process.
//   - wait_idle() returns when the queue is empty and no task is running.
//   - shutdown() stops intake, drains every queued task, then joins.
//     Idempotent; also run by the destructor.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace evogate {

class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  bool submit(std::function<void()> task);

  void wait_idle();

  void shutdown();

  // Queued plus running.
  std::size_t in_flight() const;

  std::size_t size() const { return threads_.size(); }

 private:
  void worker_loop();

  std::vector<std::thread> threads_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> queue_;
  std::size_t running_{0};
  bool stopping_{false};
};

}  // namespace evogate
