#include "finmda_core/chunking/text_chunker.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

#include "finmda_core/errors.hpp"

namespace finmda_core {

namespace {

bool is_space(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\v' || c == U'\f' ||
         c == U'\u00A0' || c == U'\u2007' || c == U'\u202F';
}

std::u32string decode(const std::string &text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::u32string codepoints;
  codepoints.reserve(valid.size());
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(codepoints));
  return codepoints;
}

// Trims [begin, end) of the code point buffer and encodes the rest as UTF-8.
std::string trimmed_slice(const std::u32string &codepoints, size_t begin, size_t end) {
  while (begin < end && is_space(codepoints[begin])) {
    ++begin;
  }
  while (end > begin && is_space(codepoints[end - 1])) {
    --end;
  }
  std::string out;
  utf8::utf32to8(codepoints.begin() + begin, codepoints.begin() + end, std::back_inserter(out));
  return out;
}

}  // namespace

TextChunker::TextChunker(ChunkingOptions options) : options_(options) {
  validate(options_);
}

void TextChunker::validate(const ChunkingOptions &options) {
  if (options.chunk_size == 0) {
    throw InvalidConfig("chunk_size must be greater than 0");
  }
  if (options.overlap >= options.chunk_size) {
    throw InvalidConfig("overlap (" + std::to_string(options.overlap) +
                        ") must be smaller than chunk_size (" +
                        std::to_string(options.chunk_size) + ")");
  }
}

std::vector<std::string> TextChunker::split(const std::string &text) const {
  std::vector<std::string> out;
  const std::u32string codepoints = decode(text);
  const size_t length = codepoints.size();
  const size_t chunk_size = options_.chunk_size;

  if (length <= chunk_size) {
    std::string whole = trimmed_slice(codepoints, 0, length);
    if (!whole.empty()) {
      out.push_back(std::move(whole));
    }
    return out;
  }

  size_t start = 0;
  while (start < length) {
    // end is not clamped so the next start is computed from the nominal window
    size_t end = start + chunk_size;

    if (end < length) {
      const size_t midpoint = start + chunk_size / 2;
      for (size_t pos = end; pos > start; --pos) {
        if (codepoints[pos - 1] == U'.') {
          if (pos - 1 > midpoint) {
            end = pos;
          }
          break;
        }
      }
    }

    std::string piece = trimmed_slice(codepoints, start, std::min(end, length));
    if (!piece.empty()) {
      out.push_back(std::move(piece));
    }

    size_t next_start = end - options_.overlap;
    // A sentence cut shorter than the overlap would move the window backwards.
    if (next_start <= start) {
      next_start = end;
    }
    start = next_start;
  }

  return out;
}

std::vector<Chunk> TextChunker::chunk(const std::string &document_id,
                                      const std::string &text,
                                      const Metadata &metadata) const {
  std::vector<std::string> pieces = split(text);

  std::vector<Chunk> chunks;
  chunks.reserve(pieces.size());
  int index = 0;
  for (auto &piece : pieces) {
    Chunk chunk;
    chunk.document_id = document_id;
    chunk.index = index;
    chunk.id = make_chunk_id(document_id, index);
    chunk.metadata = metadata;
    chunk.metadata["document_id"] = document_id;
    chunk.metadata["chunk_index"] = std::to_string(index);
    chunk.metadata["chunk_length"] = std::to_string(utf8::distance(piece.begin(), piece.end()));
    chunk.text = std::move(piece);
    chunks.push_back(std::move(chunk));
    ++index;
  }
  return chunks;
}

std::string TextChunker::compute_content_hash(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw FinmdaError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw FinmdaError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw FinmdaError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw FinmdaError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace finmda_core
