#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "finmda_core/errors.hpp"

namespace finmda_core {

// A stored frame is corrupt, truncated or declares an implausible size.
class CompressionError : public FinmdaError {
 public:
  explicit CompressionError(const std::string &message) : FinmdaError(message) {}
};

/**
 * @brief Zstandard frames for chunk text and task payloads at rest.
 *
 * Each thread keeps one compression and one decompression context, so the
 * indexer's batch writes do not reallocate zstd state per chunk.
 */
class CompressionService {
 public:
  static constexpr int kDefaultLevel = 3;
  // Chunks and queued documents are far smaller; a larger header means a damaged row.
  static constexpr size_t kMaxContentSize = 256u * 1024u * 1024u;

  // Empty input gives an empty frame.
  static std::vector<char> compress(std::string_view text, int level = kDefaultLevel);

  // Throws CompressionError for anything compress() did not produce.
  static std::string decompress(const std::vector<char> &frame,
                                size_t max_content_size = kMaxContentSize);
};

}  // namespace finmda_core
