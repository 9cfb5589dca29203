#pragma once

#include <string>
#include <vector>

#include "finmda_core/types/chunk.hpp"

namespace finmda_core {

struct ChunkingOptions {
  size_t chunk_size = 1000;  // code points
  size_t overlap = 200;      // code points
};

/**
 * @brief Splits document text into overlapping, sentence-aware chunks.
 *
 * Sizes are measured in Unicode code points of the UTF-8 input. A window of
 * chunk_size code points is cut at the last '.' inside it when that full stop
 * lies past the middle of the window; the next window starts overlap code
 * points before the previous end.
 */
class TextChunker {
 public:
  // Throws InvalidConfig when overlap >= chunk_size or chunk_size == 0.
  explicit TextChunker(ChunkingOptions options = {});

  std::vector<Chunk> chunk(const std::string &document_id,
                           const std::string &text,
                           const Metadata &metadata = {}) const;

  // Plain text windows, without ids or metadata.
  std::vector<std::string> split(const std::string &text) const;

  const ChunkingOptions &options() const {
    return options_;
  }

  // Lowercase hex SHA-256 of the content.
  static std::string compute_content_hash(const std::string &content);

 private:
  static void validate(const ChunkingOptions &options);

  ChunkingOptions options_;
};

}  // namespace finmda_core
