#include "finmda_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

#include "finmda_core/async/service_provider.hpp"
#include "finmda_core/db/task_queue_repo.hpp"

namespace finmda_core::async {

WorkerPool::WorkerPool(size_t num_threads,
                       std::shared_ptr<ServiceProvider> services,
                       std::chrono::milliseconds idle_sleep)
    : m_services(services) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  m_workers.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), services, idle_sleep));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  if (m_is_running) {
    stop();
  }
}

void WorkerPool::start() {
  if (m_is_running) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  for (const auto& worker : m_workers) {
    worker->start();
  }
  m_is_running = true;
}

void WorkerPool::stop() {
  if (!m_is_running) {
    return;
  }
  std::cout << "Stopping all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->stop();
  }
  for (const auto& worker : m_workers) {
    worker->join();
  }
  m_is_running = false;
}

bool WorkerPool::wait_until_idle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  TaskQueueRepo& repo = m_services->get_task_queue_repo();
  while (repo.count_unfinished() > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}

}  // namespace finmda_core::async
