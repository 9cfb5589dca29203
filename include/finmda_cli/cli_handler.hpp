#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "finmda_cli/config.hpp"
#include "finmda_core/async/service_provider.hpp"
#include "finmda_core/async/worker_pool.hpp"
#include "finmda_core/db/database_manager.hpp"
#include "finmda_core/db/task_queue_repo.hpp"
#include "finmda_core/embedding/embedding_provider.hpp"
#include "finmda_core/index/sqlite_vector_index.hpp"
#include "finmda_core/metrics/financial_analyzer.hpp"
#include "finmda_core/retrieval/retriever.hpp"
#include "finmda_core/services/document_indexer.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_cli {

enum class Command {
  Index,
  IndexData,
  Delete,
  Ask,
  Docs,
  Metrics,
  Forecast,
  Tasks,
  ClearTasks,
  Help
};

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  std::string document_id;
  std::string query;
  int top_k = 0;  // 0 uses the configured default
  std::string data_path;
  std::string company;
  std::string period;
  std::string concept_name = "Revenue";
  int horizon = 4;
  std::string method = "linear";
  std::string status_filter;
  int older_than_days = 7;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CliHandler
 * @brief Runs one command against the local index database and financial data files.
 *
 * The index, task queue and worker pool are opened on first use, so the
 * metrics and forecast commands work without a database or embedding server.
 * Index and delete commands enqueue a task and drain the queue before returning.
 * No command contacts the embedding server until it has text to embed, so
 * delete and the task commands work while it is down.
 */
class CliHandler {
 public:
  static constexpr std::chrono::minutes kDrainTimeout{30};

  // A null embedder means an OllamaEmbeddingProvider built from the config.
  explicit CliHandler(Config config,
                      std::shared_ptr<finmda_core::EmbeddingProvider> embedder = nullptr,
                      std::ostream& out = std::cout);
  ~CliHandler();

  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  static CliOptions parse_arguments(int argc, char* argv[]);

  void execute_command(const CliOptions& options);

  const Config& config() const {
    return config_;
  }

 private:
  void handle_index_command(const CliOptions& options);
  void handle_index_data_command(const CliOptions& options);
  void handle_delete_command(const CliOptions& options);
  void handle_ask_command(const CliOptions& options);
  void handle_docs_command(const CliOptions& options);
  void handle_metrics_command(const CliOptions& options);
  void handle_forecast_command(const CliOptions& options);
  void handle_tasks_command(const CliOptions& options);
  void handle_clear_tasks_command(const CliOptions& options);
  void print_help();

  // Opens the database, index and task queue once. Needs no embedding server.
  void ensure_storage();
  // Builds the configured OllamaEmbeddingProvider unless one was injected.
  void ensure_embedder();
  // Storage plus the indexer and worker pool that drain the queue.
  void ensure_index_services();
  // Runs the workers until the queue is empty or kDrainTimeout passes.
  void drain_queue();
  // drain_queue(), then reports the given task.
  finmda_core::TaskRecord drain_and_get(long long task_id);

  finmda_core::FinancialAnalyzer make_analyzer() const;
  std::vector<finmda_core::TimeSeriesPoint> load_points(const CliOptions& options) const;
  std::string resolve_company(const CliOptions& options,
                              const std::vector<finmda_core::TimeSeriesPoint>& points) const;
  size_t effective_top_k(const CliOptions& options) const;

  Config config_;
  std::ostream& out_;
  std::shared_ptr<finmda_core::EmbeddingProvider> embedder_;

  // Declaration order matters: the pool must stop before the services it uses go away.
  std::unique_ptr<finmda_core::DatabaseManager> db_manager_;
  std::shared_ptr<finmda_core::SqliteVectorIndex> index_;
  std::shared_ptr<finmda_core::TaskQueueRepo> task_repo_;
  std::shared_ptr<finmda_core::DocumentIndexer> indexer_;
  std::shared_ptr<finmda_core::ServiceProvider> services_;
  std::unique_ptr<finmda_core::async::WorkerPool> worker_pool_;
};

nlohmann::json summary_to_json(const finmda_core::FinancialSummary& summary);

}  // namespace finmda_cli
