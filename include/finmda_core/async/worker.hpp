#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace finmda_core {
class ServiceProvider;
}

namespace finmda_core {
namespace async {

/**
 * @class Worker
 * @brief One background thread that claims tasks from the TaskQueueRepo and runs them.
 *
 * Successful tasks are marked COMPLETED; a task that throws is marked FAILED
 * with the exception message and the worker moves on. Non-copyable and
 * non-movable so the thread has a single owner.
 */
class Worker {
 public:
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds idle_sleep = std::chrono::milliseconds(200));

  /**
   * @brief Stops the loop and joins the thread before returning.
   */
  ~Worker();

  // Throws std::runtime_error if the worker is already running.
  void start();

  /**
   * @brief Signals the loop to exit after the current task. Does not block.
   */
  void stop();

  // Blocks until the thread has exited.
  void join();

  // Claims and runs one task on the calling thread. False when the queue had nothing claimable.
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds idle_sleep_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};
}  // namespace async
}  // namespace finmda_core
