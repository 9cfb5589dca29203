#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "finmda_core/async/worker.hpp"

namespace finmda_core::async {

/**
 * @class WorkerPool
 * @brief Owns N Worker threads for concurrent indexing.
 *
 * Documents are processed in parallel; the queue's claiming rule keeps the
 * tasks of one document in order. The destructor stops and joins every worker.
 */
class WorkerPool {
 public:
  WorkerPool(size_t num_threads,
             std::shared_ptr<ServiceProvider> services,
             std::chrono::milliseconds idle_sleep = std::chrono::milliseconds(200));

  ~WorkerPool();

  void start();

  /**
   * @brief Signals every worker and waits for their current tasks to finish.
   */
  void stop();

  // Waits until the queue has no PENDING or PROCESSING task. False on timeout.
  bool wait_until_idle(std::chrono::milliseconds timeout);

  bool is_running() const {
    return m_is_running;
  }
  size_t size() const {
    return m_workers.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::shared_ptr<ServiceProvider> m_services;
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace finmda_core::async
