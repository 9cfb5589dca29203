#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace finmda_cli {

class Config {
 public:
  std::string index_db_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_timeout_ms;

  // Chunking
  int chunk_size;
  int chunk_overlap;

  int top_k;
  int num_workers;
  int yoy_lag;

  // Optional JSON table overriding the default ratio normal ranges
  std::string ratio_ranges_path;
  bool best_effort_retrieval;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      config.index_db_path = json_config.value("index_db_path", std::string("./data/finmda.db"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);
      config.embedding_timeout_ms = json_config.value("embedding_timeout_ms", 30000);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);

      config.top_k = json_config.value("top_k", 5);
      config.num_workers = json_config.value("num_workers", 2);
      config.yoy_lag = json_config.value("yoy_lag", 4);

      config.ratio_ranges_path = json_config.value("ratio_ranges_path", std::string());
      config.best_effort_retrieval = json_config.value("best_effort_retrieval", false);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

 private:
  void validate() const {
    if (index_db_path.empty()) {
      throw std::runtime_error("index_db_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_timeout_ms < 100) {
      throw std::runtime_error("embedding_timeout_ms must be at least 100ms");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (yoy_lag <= 0) {
      throw std::runtime_error("yoy_lag must be greater than 0");
    }
  }
};

}  // namespace finmda_cli
