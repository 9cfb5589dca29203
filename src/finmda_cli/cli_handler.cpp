#include "finmda_cli/cli_handler.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "finmda_core/data/financial_data_loader.hpp"
#include "finmda_core/embedding/ollama_embedding_provider.hpp"
#include "finmda_core/evidence/evidence_formatter.hpp"
#include "finmda_core/evidence/kpi_statement_builder.hpp"
#include "finmda_core/metrics/forecast_engine.hpp"
#include "finmda_core/metrics/ratio_ranges.hpp"

namespace finmda_cli {

using namespace finmda_core;

namespace {

int parse_int(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception&) {
    throw CliError("Invalid integer for " + flag + ": " + value);
  }
}

std::string read_text_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

nlohmann::json optional_to_json(const std::optional<double>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json forecast_to_json(const ForecastResult& result) {
  nlohmann::json points = nlohmann::json::array();
  for (const auto& point : result.points) {
    points.push_back({{"step", point.step},
                      {"value", point.value},
                      {"lower_bound", point.lower_bound},
                      {"upper_bound", point.upper_bound}});
  }
  nlohmann::json out = {{"concept", result.concept_name},
                        {"requested_method", to_string(result.requested)},
                        {"method", to_string(result.used)},
                        {"confidence_score", result.confidence_score},
                        {"points", points}};
  if (result.fallback_reason) {
    out["fallback_reason"] = *result.fallback_reason;
  }
  if (result.error) {
    out["error"] = *result.error;
  }
  return out;
}

nlohmann::json task_to_json(const TaskRecord& task, const std::optional<TaskProgress>& progress) {
  nlohmann::json out = {{"id", task.id},
                        {"type", task.task_type},
                        {"document_id", task.document_id},
                        {"status", to_string(task.status)},
                        {"priority", task.priority},
                        {"created_at", TaskQueueRepo::time_point_to_string(task.created_at)},
                        {"updated_at", TaskQueueRepo::time_point_to_string(task.updated_at)}};
  if (task.error_message) {
    out["error"] = *task.error_message;
  }
  if (progress) {
    out["progress"] = {{"percent", progress->progress_percent},
                       {"message", progress->status_message}};
  }
  return out;
}

}  // namespace

nlohmann::json summary_to_json(const FinancialSummary& summary) {
  nlohmann::json deltas = nlohmann::json::array();
  for (const auto& delta : summary.deltas) {
    deltas.push_back({{"concept", delta.concept_name},
                      {"period", delta.period},
                      {"value", delta.value},
                      {"qoq_pct", optional_to_json(delta.qoq_pct)},
                      {"yoy_pct", optional_to_json(delta.yoy_pct)},
                      {"derived_ratio", optional_to_json(delta.derived_ratio)}});
  }

  nlohmann::json trends = nlohmann::json::array();
  for (const auto& trend : summary.trends) {
    trends.push_back({{"concept", trend.concept_name},
                      {"direction", to_string(trend.direction)},
                      {"strength", trend.strength},
                      {"slope", trend.slope},
                      {"r_squared", trend.r_squared},
                      {"p_value", trend.p_value},
                      {"forecast_next", trend.forecast_next},
                      {"volatility", trend.volatility},
                      {"sample_size", trend.sample_size}});
  }

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto& warning : summary.warnings) {
    warnings.push_back({{"kind", to_string(warning.kind)},
                        {"subject", warning.subject},
                        {"period", warning.period},
                        {"severity", to_string(warning.severity)},
                        {"message", warning.message}});
  }

  return {{"company", summary.company},
          {"latest_period", summary.latest_period},
          {"ratios", summary.ratios},
          {"deltas", deltas},
          {"trends", trends},
          {"warnings", warnings}};
}

CliHandler::CliHandler(Config config,
                       std::shared_ptr<EmbeddingProvider> embedder,
                       std::ostream& out)
    : config_(std::move(config)), out_(out), embedder_(std::move(embedder)) {}

CliHandler::~CliHandler() {
  if (worker_pool_) {
    worker_pool_->stop();
  }
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "index" || command == "i") {
    options.command = Command::Index;
  } else if (command == "index-data" || command == "x") {
    options.command = Command::IndexData;
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "docs") {
    options.command = Command::Docs;
  } else if (command == "metrics" || command == "m") {
    options.command = Command::Metrics;
  } else if (command == "forecast" || command == "f") {
    options.command = Command::Forecast;
  } else if (command == "tasks" || command == "lt") {
    options.command = Command::Tasks;
  } else if (command == "clear-tasks" || command == "ct") {
    options.command = Command::ClearTasks;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--id" || flag == "-i") {
      options.document_id = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int(flag, value);
    } else if (flag == "--data") {
      options.data_path = value;
    } else if (flag == "--company" || flag == "-c") {
      options.company = value;
    } else if (flag == "--period" || flag == "-p") {
      options.period = value;
    } else if (flag == "--concept") {
      options.concept_name = value;
    } else if (flag == "--horizon") {
      options.horizon = parse_int(flag, value);
    } else if (flag == "--method") {
      options.method = value;
    } else if (flag == "--status" || flag == "-s") {
      options.status_filter = value;
    } else if (flag == "--days") {
      options.older_than_days = parse_int(flag, value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  switch (options.command) {
    case Command::Index:
      if (options.file_path.empty()) {
        throw CliError("Index command requires a file. Usage: index --file <path> [--id <doc>]");
      }
      break;
    case Command::Delete:
      if (options.document_id.empty()) {
        throw CliError("Delete command requires a document id. Usage: delete --id <doc>");
      }
      break;
    case Command::Ask:
    case Command::Docs:
      if (options.query.empty()) {
        throw CliError("Command requires a query. Usage: " + command + " --query <text>");
      }
      break;
    case Command::IndexData:
    case Command::Metrics:
    case Command::Forecast:
      if (options.data_path.empty()) {
        throw CliError("Command requires financial data. Usage: " + command +
                       " --data <csv file or directory>");
      }
      if (options.horizon <= 0) {
        throw CliError("--horizon must be greater than 0");
      }
      break;
    default:
      break;
  }
  if (options.top_k < 0) {
    throw CliError("--top-k must not be negative");
  }

  return options;
}

void CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::Index:
      handle_index_command(options);
      break;
    case Command::IndexData:
      handle_index_data_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Docs:
      handle_docs_command(options);
      break;
    case Command::Metrics:
      handle_metrics_command(options);
      break;
    case Command::Forecast:
      handle_forecast_command(options);
      break;
    case Command::Tasks:
      handle_tasks_command(options);
      break;
    case Command::ClearTasks:
      handle_clear_tasks_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::ensure_storage() {
  if (task_repo_) {
    return;
  }
  db_manager_ =
      std::make_unique<DatabaseManager>(config_.index_db_path, config_.num_workers + 2);
  index_ = std::make_shared<SqliteVectorIndex>(*db_manager_,
                                               static_cast<size_t>(config_.embedding_dimension));
  task_repo_ = std::make_shared<TaskQueueRepo>(*db_manager_);
}

void CliHandler::ensure_embedder() {
  if (embedder_) {
    return;
  }
  int timeout_seconds = (config_.embedding_timeout_ms + 999) / 1000;
  embedder_ = std::make_shared<OllamaEmbeddingProvider>(
      config_.ollama_url, config_.embedding_model,
      static_cast<size_t>(config_.embedding_dimension), timeout_seconds);
}

void CliHandler::ensure_index_services() {
  if (services_) {
    return;
  }
  ensure_storage();
  ensure_embedder();

  ChunkingOptions chunking;
  chunking.chunk_size = static_cast<size_t>(config_.chunk_size);
  chunking.overlap = static_cast<size_t>(config_.chunk_overlap);

  indexer_ = std::make_shared<DocumentIndexer>(TextChunker(chunking), embedder_, index_);
  services_ = std::make_shared<ServiceProvider>(task_repo_, indexer_);

  size_t requeued = task_repo_->requeue_interrupted_tasks();
  if (requeued > 0) {
    std::cout << "[CLI] Requeued " << requeued << " interrupted task(s)." << std::endl;
  }

  worker_pool_ = std::make_unique<async::WorkerPool>(
      static_cast<size_t>(config_.num_workers), services_);
}

void CliHandler::drain_queue() {
  worker_pool_->start();
  bool idle = worker_pool_->wait_until_idle(kDrainTimeout);
  worker_pool_->stop();
  if (!idle) {
    std::cerr << "[CLI] Warning: queue not drained; remaining tasks resume on the next run."
              << std::endl;
  }
}

TaskRecord CliHandler::drain_and_get(long long task_id) {
  drain_queue();

  std::optional<TaskRecord> task = task_repo_->get_task(task_id);
  if (!task) {
    throw CliError("Task " + std::to_string(task_id) + " disappeared from the queue");
  }
  return *task;
}

void CliHandler::handle_index_command(const CliOptions& options) {
  std::string text = read_text_file(options.file_path);
  std::string document_id = options.document_id.empty()
                                ? std::filesystem::path(options.file_path).stem().string()
                                : options.document_id;

  Metadata metadata;
  metadata["source"] = options.file_path;
  if (!options.company.empty()) {
    metadata["company"] = options.company;
  }
  if (!options.period.empty()) {
    metadata["period"] = options.period;
  }

  ensure_index_services();
  long long task_id = task_repo_->enqueue_index_document(document_id, text, metadata);
  out_ << "Indexing document '" << document_id << "' (task " << task_id << ")" << std::endl;

  TaskRecord task = drain_and_get(task_id);
  if (task.status == TaskStatus::FAILED) {
    throw CliError("Indexing failed: " + task.error_message.value_or("unknown error"));
  }
  MetadataFilter filter = MetadataFilter::by_document(document_id);
  out_ << "Document '" << document_id << "' indexed: " << index_->count(filter) << " chunk(s) ["
       << to_string(task.status) << "]" << std::endl;
}

void CliHandler::handle_index_data_command(const CliOptions& options) {
  std::vector<TimeSeriesPoint> points = load_points(options);
  std::vector<std::string> companies;
  if (options.company.empty()) {
    companies = FinancialAnalyzer::companies(points);
    if (companies.empty()) {
      throw CliError("Financial data contains no rows");
    }
  } else {
    companies.push_back(resolve_company(options, points));
  }

  FinancialAnalyzer analyzer = make_analyzer();
  KpiStatementBuilder builder;
  ensure_index_services();

  std::vector<long long> task_ids;
  for (const auto& company : companies) {
    for (const auto& statement : builder.build(analyzer.summarize(company, points))) {
      task_ids.push_back(task_repo_->enqueue_index_document(statement.document_id, statement.text,
                                                            statement.metadata));
    }
  }
  if (task_ids.empty()) {
    out_ << "No KPI statements to index." << std::endl;
    return;
  }

  drain_queue();
  size_t failed = 0;
  std::string first_error;
  for (long long task_id : task_ids) {
    std::optional<TaskRecord> task = task_repo_->get_task(task_id);
    if (!task || task->status == TaskStatus::FAILED) {
      if (failed++ == 0) {
        first_error = task ? task->error_message.value_or("unknown error") : "task disappeared";
      }
    }
  }
  if (failed > 0) {
    throw CliError(std::to_string(failed) + " of " + std::to_string(task_ids.size()) +
                   " KPI statements failed to index: " + first_error);
  }
  out_ << "Indexed " << task_ids.size() << " KPI statement(s) for " << companies.size()
       << " company(ies)." << std::endl;
}

void CliHandler::handle_delete_command(const CliOptions& options) {
  ensure_index_services();
  long long task_id = task_repo_->enqueue_delete_document(options.document_id);

  TaskRecord task = drain_and_get(task_id);
  if (task.status == TaskStatus::FAILED) {
    throw CliError("Delete failed: " + task.error_message.value_or("unknown error"));
  }
  out_ << "Document '" << options.document_id << "' removed from the index." << std::endl;
}

void CliHandler::handle_ask_command(const CliOptions& options) {
  ensure_storage();
  ensure_embedder();

  RetrieverOptions retriever_options;
  retriever_options.embedding_timeout = std::chrono::milliseconds(config_.embedding_timeout_ms);
  retriever_options.best_effort = config_.best_effort_retrieval;
  Retriever retriever(embedder_, index_, retriever_options);

  std::optional<std::string> document_filter;
  if (!options.document_id.empty()) {
    document_filter = options.document_id;
  }
  EvidenceBundle bundle = retriever.retrieve(options.query, document_filter, effective_top_k(options));

  std::vector<DeltaMetric> deltas;
  std::vector<TrendResult> trends;
  std::string company = options.company;
  if (!options.data_path.empty()) {
    std::vector<TimeSeriesPoint> points = load_points(options);
    company = resolve_company(options, points);
    FinancialSummary summary = make_analyzer().summarize(company, points);
    // Only the latest period's deltas belong next to the passages.
    for (const auto& delta : summary.deltas) {
      if (delta.period == summary.latest_period) {
        deltas.push_back(delta);
      }
    }
    trends = summary.trends;
  }

  EvidenceFormatter formatter;
  EvidenceFootnotes footnotes = formatter.build(bundle, deltas, trends, company);

  out_ << "Request: " << footnotes.request_id << std::endl;
  out_ << "Query: " << footnotes.query << std::endl;
  if (footnotes.empty()) {
    out_ << "No evidence found." << std::endl;
    return;
  }
  if (!footnotes.context.empty()) {
    out_ << "\n" << footnotes.context << "\n" << std::endl;
  }
  out_ << footnotes.render_markdown();
}

void CliHandler::handle_docs_command(const CliOptions& options) {
  ensure_storage();
  ensure_embedder();

  RetrieverOptions retriever_options;
  retriever_options.embedding_timeout = std::chrono::milliseconds(config_.embedding_timeout_ms);
  retriever_options.best_effort = config_.best_effort_retrieval;
  Retriever retriever(embedder_, index_, retriever_options);

  size_t top_k = options.top_k > 0 ? static_cast<size_t>(options.top_k) : 10;
  std::vector<SimilarDocument> documents = retriever.search_similar_documents(options.query, top_k);

  nlohmann::json response = nlohmann::json::array();
  for (const auto& doc : documents) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& chunk : doc.chunks) {
      chunks.push_back({{"chunk_id", chunk.chunk_id},
                        {"chunk_index", chunk.chunk_index},
                        {"relevance_score", chunk.relevance_score},
                        {"snippet", make_snippet(chunk.text, 120)}});
    }
    response.push_back({{"document_id", doc.document_id},
                        {"max_relevance", doc.max_relevance},
                        {"total_chunks", doc.total_chunks},
                        {"chunks", chunks}});
  }
  out_ << response.dump(2) << std::endl;
}

void CliHandler::handle_metrics_command(const CliOptions& options) {
  std::vector<TimeSeriesPoint> points = load_points(options);
  std::string company = resolve_company(options, points);
  FinancialSummary summary = make_analyzer().summarize(company, points);
  out_ << summary_to_json(summary).dump(2) << std::endl;
}

void CliHandler::handle_forecast_command(const CliOptions& options) {
  ForecastMethod method;
  try {
    method = forecast_method_from_string(options.method);
  } catch (const std::invalid_argument&) {
    throw CliError("Unknown forecast method: " + options.method + " (use linear or seasonal)");
  }

  std::vector<TimeSeriesPoint> points = load_points(options);
  std::string company = resolve_company(options, points);

  FinancialAnalyzer analyzer = make_analyzer();
  std::map<std::string, MetricSeries> series = analyzer.build_series(company, points);
  std::string concept_key = FinancialAnalyzer::canonical_concept(options.concept_name);
  auto it = series.find(concept_key);
  if (it == series.end()) {
    throw CliError("No data for concept '" + options.concept_name + "' of company '" + company +
                   "'");
  }

  ForecastEngine engine(std::make_shared<AdditiveSeasonalModel>(
      static_cast<size_t>(config_.yoy_lag > 1 ? config_.yoy_lag : 4)));
  ForecastResult result =
      engine.forecast(it->second, static_cast<size_t>(options.horizon), method);

  nlohmann::json response = forecast_to_json(result);
  response["company"] = company;
  response["last_period"] = it->second.points.back().period;
  out_ << response.dump(2) << std::endl;
}

void CliHandler::handle_tasks_command(const CliOptions& options) {
  ensure_storage();

  std::vector<TaskStatus> statuses;
  if (options.status_filter.empty()) {
    statuses = {TaskStatus::PENDING, TaskStatus::PROCESSING, TaskStatus::COMPLETED,
                TaskStatus::FAILED};
  } else {
    std::string upper = options.status_filter;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    try {
      statuses.push_back(task_status_from_string(upper));
    } catch (const std::invalid_argument&) {
      throw CliError("Unknown task status: " + options.status_filter);
    }
  }

  nlohmann::json response = nlohmann::json::array();
  for (TaskStatus status : statuses) {
    for (const auto& task : task_repo_->get_tasks_by_status(status)) {
      response.push_back(task_to_json(task, task_repo_->get_task_progress(task.id)));
    }
  }
  out_ << response.dump(2) << std::endl;
}

void CliHandler::handle_clear_tasks_command(const CliOptions& options) {
  ensure_storage();
  task_repo_->clear_completed_tasks(options.older_than_days);
  out_ << "Cleared finished tasks older than " << options.older_than_days << " day(s)."
       << std::endl;
}

FinancialAnalyzer CliHandler::make_analyzer() const {
  RatioRangeTable ranges = config_.ratio_ranges_path.empty()
                               ? RatioRangeTable::defaults()
                               : RatioRangeTable::from_file(config_.ratio_ranges_path);
  return FinancialAnalyzer(RatioCalculator(std::move(ranges)),
                           DeltaCalculator(static_cast<size_t>(config_.yoy_lag)), TrendAnalyzer());
}

std::vector<TimeSeriesPoint> CliHandler::load_points(const CliOptions& options) const {
  FinancialDataLoader loader;
  std::filesystem::path path(options.data_path);
  if (std::filesystem::is_directory(path)) {
    return loader.load_directory(path);
  }
  return loader.load_file(path);
}

std::string CliHandler::resolve_company(const CliOptions& options,
                                        const std::vector<TimeSeriesPoint>& points) const {
  std::vector<std::string> companies = FinancialAnalyzer::companies(points);
  if (!options.company.empty()) {
    if (std::find(companies.begin(), companies.end(), options.company) == companies.end()) {
      throw CliError("No financial data for company: " + options.company);
    }
    return options.company;
  }
  if (companies.size() == 1) {
    return companies.front();
  }
  if (companies.empty()) {
    throw CliError("Financial data contains no rows");
  }
  throw CliError("Data covers " + std::to_string(companies.size()) +
                 " companies; choose one with --company");
}

size_t CliHandler::effective_top_k(const CliOptions& options) const {
  return static_cast<size_t>(options.top_k > 0 ? options.top_k : config_.top_k);
}

void CliHandler::print_help() {
  out_ << "Financial document analysis CLI\n\n"
       << "Usage: finmda_cli <command> [options]\n\n"
       << "Commands:\n"
       << "  index, i        Chunk, embed and index a text document\n"
       << "                  --file <path> [--id <doc>] [--company <c>] [--period <p>]\n"
       << "  index-data, x   Index one KPI statement per company and period\n"
       << "                  --data <csv file or dir> [--company <c>]\n"
       << "  delete, d       Remove a document from the index\n"
       << "                  --id <doc>\n"
       << "  ask, a          Retrieve cited evidence for a question\n"
       << "                  --query <text> [--id <doc>] [--top-k <n>]\n"
       << "                  [--data <csv> [--company <c>]] adds metric footnotes\n"
       << "  docs            Rank indexed documents by relevance\n"
       << "                  --query <text> [--top-k <n>]\n"
       << "  metrics, m      Ratios, deltas, trends and warnings for a company\n"
       << "                  --data <csv file or dir> [--company <c>]\n"
       << "  forecast, f     Forecast one concept\n"
       << "                  --data <csv> [--company <c>] [--concept Revenue]\n"
       << "                  [--horizon 4] [--method linear|seasonal]\n"
       << "  tasks, lt       List indexing tasks [--status pending|processing|completed|failed]\n"
       << "  clear-tasks, ct Delete finished tasks [--days 7]\n"
       << "  help, h         Show this help\n\n"
       << "Configuration is read from finmdarc.json or the file named by FINMDA_CONFIG.\n";
}

}  // namespace finmda_cli
