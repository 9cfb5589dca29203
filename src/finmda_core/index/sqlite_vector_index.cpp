#include "finmda_core/index/sqlite_vector_index.hpp"

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "finmda_core/db/pooled_connection.hpp"
#include "finmda_core/db/sqlite_error_utils.hpp"
#include "finmda_core/db/transaction.hpp"
#include "finmda_core/errors.hpp"
#include "finmda_core/services/compression_service.hpp"

namespace finmda_core {

namespace {

const char *const kDimensionKey = "embedding_dimension";

std::string now_string() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::string encode_metadata(const Metadata &metadata) {
  nlohmann::json json = metadata;
  return json.dump();
}

Metadata decode_metadata(const std::string &text) {
  return nlohmann::json::parse(text).get<Metadata>();
}

int chunk_index_of(const IndexItem &item) {
  auto it = item.metadata.find("chunk_index");
  if (it == item.metadata.end()) {
    return 0;
  }
  try {
    return std::stoi(it->second);
  } catch (const std::exception &) {
    return 0;
  }
}

std::string document_id_of(const IndexItem &item) {
  auto it = item.metadata.find("document_id");
  return it == item.metadata.end() ? std::string() : it->second;
}

}  // namespace

SqliteVectorIndex::SqliteVectorIndex(DatabaseManager &db_manager, size_t dimension)
    : db_manager_(db_manager), dimension_(dimension), cache_(dimension) {
  check_stored_dimension();
  rebuild();
}

void SqliteVectorIndex::check_stored_dimension() {
  try {
    PooledConnection conn(db_manager_);
    std::optional<std::string> stored;
    *conn << "SELECT value FROM index_info WHERE key = ?" << kDimensionKey >>
        [&](std::string value) { stored = value; };

    if (!stored) {
      *conn << "INSERT INTO index_info (key, value) VALUES (?, ?)" << kDimensionKey
            << std::to_string(dimension_);
      return;
    }
    if (*stored != std::to_string(dimension_)) {
      throw InvalidConfig("Index at " + db_manager_.db_path().string() + " stores " + *stored +
                          "-dimensional vectors, configured dimension is " +
                          std::to_string(dimension_));
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailable(format_db_error("check_stored_dimension", e));
  }
}

void SqliteVectorIndex::rebuild() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::vector<IndexItem> items;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, content, metadata, vector_blob FROM chunks ORDER BY document_id, "
             "chunk_index" >>
        [&](std::string id, std::optional<std::vector<char>> content, std::string metadata,
            std::vector<char> vector_blob) {
          if (vector_blob.size() != dimension_ * sizeof(float)) {
            std::cerr << "[SqliteVectorIndex] Warning: skipping chunk " << id
                      << " with a " << vector_blob.size() / sizeof(float)
                      << "-dimensional vector." << std::endl;
            return;
          }
          IndexItem item;
          item.id = id;
          try {
            if (content) {
              item.text = CompressionService::decompress(*content);
            }
            item.metadata = decode_metadata(metadata);
          } catch (const nlohmann::json::exception &e) {
            throw IndexUnavailable("Chunk " + id + " has unreadable metadata: " + e.what());
          } catch (const CompressionError &e) {
            throw IndexUnavailable("Chunk " + id + " has unreadable content: " + e.what());
          }
          const float *data = reinterpret_cast<const float *>(vector_blob.data());
          item.vector.assign(data, data + dimension_);
          items.push_back(std::move(item));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailable(format_db_error("rebuild", e));
  }

  cache_.reset(items);
  std::cout << "[SqliteVectorIndex] Loaded " << items.size() << " chunks from "
            << db_manager_.db_path().string() << std::endl;
}

size_t SqliteVectorIndex::write_locked(const std::vector<std::string> &remove_ids,
                                       const std::vector<IndexItem> &items) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    for (const auto &id : remove_ids) {
      *conn << "DELETE FROM chunks WHERE id = ?" << id;
    }
    const std::string updated_at = now_string();
    for (const auto &item : items) {
      *conn << "REPLACE INTO chunks (id, document_id, chunk_index, content, metadata, "
               "vector_blob, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
            << item.id << document_id_of(item) << chunk_index_of(item)
            << CompressionService::compress(item.text) << encode_metadata(item.metadata)
            << to_blob(item.vector) << updated_at;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailable(format_db_error("write_chunks", e));
  }
  return remove_ids.size();
}

void SqliteVectorIndex::upsert(const std::vector<IndexItem> &items) {
  for (const auto &item : items) {
    if (item.vector.size() != dimension_) {
      throw InvalidConfig("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                          ", got " + std::to_string(item.vector.size()));
    }
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  write_locked({}, items);
  cache_.upsert(items);
}

size_t SqliteVectorIndex::remove(const MetadataFilter &filter) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::vector<std::string> ids = cache_.ids_matching(filter);
  if (ids.empty()) {
    return 0;
  }
  write_locked(ids, {});
  return cache_.remove(filter);
}

size_t SqliteVectorIndex::replace(const MetadataFilter &filter,
                                  const std::vector<IndexItem> &items) {
  for (const auto &item : items) {
    if (item.vector.size() != dimension_) {
      throw InvalidConfig("Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                          ", got " + std::to_string(item.vector.size()));
    }
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  write_locked(cache_.ids_matching(filter), items);
  return cache_.replace(filter, items);
}

std::vector<IndexMatch> SqliteVectorIndex::query(const std::vector<float> &vector,
                                                 size_t top_k,
                                                 const std::optional<MetadataFilter> &filter) {
  return cache_.query(vector, top_k, filter);
}

size_t SqliteVectorIndex::count(const std::optional<MetadataFilter> &filter) {
  return cache_.count(filter);
}

std::vector<std::string> SqliteVectorIndex::list_documents() {
  std::vector<std::string> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT document_id FROM chunks ORDER BY document_id" >>
        [&](std::string document_id) { documents.push_back(document_id); };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailable(format_db_error("list_documents", e));
  }
  return documents;
}

}  // namespace finmda_core
