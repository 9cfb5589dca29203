#include "finmda_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "finmda_core/async/ITask.hpp"
#include "finmda_core/async/service_provider.hpp"
#include "finmda_core/async/task_factory.hpp"
#include "finmda_core/db/task_queue_repo.hpp"

namespace finmda_core {
namespace async {

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds idle_sleep)
    : worker_id_(worker_id), services_(std::move(services)), idle_sleep_(idle_sleep) {
  if (!services_) {
    throw std::invalid_argument("Worker requires a ServiceProvider.");
  }
}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::join() {
  if (thread.joinable()) {
    thread.join();
    std::cout << "Worker [" << worker_id_ << "] joined." << std::endl;
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop.load()) {
    bool did_work = false;
    try {
      did_work = run_one_task();
    } catch (const std::exception& e) {
      // The queue itself failed; back off and try again.
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling task queue: " << e.what()
                << std::endl;
    }
    if (!did_work) {
      std::this_thread::sleep_for(idle_sleep_);
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  std::optional<TaskRecord> record = task_repo.fetch_and_claim_next_task();
  if (!record) {
    return false;
  }

  try {
    ITaskPtr task = TaskFactory::create_task(*record);

    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      task_repo.upsert_task_progress(record->id, p, msg);
    };

    task->execute(*services_, on_progress);
    task_repo.update_task_status(record->id, TaskStatus::COMPLETED);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << record->id << " ("
              << record->task_type << " " << record->document_id << "): " << e.what()
              << std::endl;
    task_repo.mark_task_as_failed(record->id, e.what());
  }
  return true;
}
}  // namespace async
}  // namespace finmda_core
