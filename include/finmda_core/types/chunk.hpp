#pragma once

#include <map>
#include <string>
#include <vector>

namespace finmda_core {

using Metadata = std::map<std::string, std::string>;

struct Chunk {
  std::string id;
  std::string document_id;
  int index = 0;
  std::string text;
  Metadata metadata;
};

// Chunk ids depend only on (document_id, index) so re-chunking is idempotent.
inline std::string make_chunk_id(const std::string &document_id, int index) {
  return "doc_" + document_id + "_chunk_" + std::to_string(index);
}

}  // namespace finmda_core
