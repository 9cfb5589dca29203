#include "finmda_core/services/compression_service.hpp"

#include <zstd.h>

#include <memory>

namespace finmda_core {

namespace {

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const {
    ZSTD_freeCCtx(ctx);
  }
};

struct DCtxDeleter {
  void operator()(ZSTD_DCtx *ctx) const {
    ZSTD_freeDCtx(ctx);
  }
};

ZSTD_CCtx &thread_compression_context() {
  thread_local std::unique_ptr<ZSTD_CCtx, CCtxDeleter> ctx(ZSTD_createCCtx());
  if (!ctx) {
    throw CompressionError("Could not allocate a zstd compression context");
  }
  return *ctx;
}

ZSTD_DCtx &thread_decompression_context() {
  thread_local std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
  if (!ctx) {
    throw CompressionError("Could not allocate a zstd decompression context");
  }
  return *ctx;
}

}  // namespace

std::vector<char> CompressionService::compress(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }
  std::vector<char> frame(ZSTD_compressBound(text.size()));
  size_t written = ZSTD_compressCCtx(&thread_compression_context(), frame.data(), frame.size(),
                                     text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression at level " + std::to_string(level) +
                           " failed: " + ZSTD_getErrorName(written));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &frame,
                                           size_t max_content_size) {
  if (frame.empty()) {
    return "";
  }

  unsigned long long declared = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (declared == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Stored " + std::to_string(frame.size()) +
                           "-byte value is not a zstd frame");
  }
  if (declared == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("zstd frame does not declare its content size");
  }
  if (declared > max_content_size) {
    throw CompressionError("zstd frame declares " + std::to_string(declared) +
                           " bytes, limit is " + std::to_string(max_content_size));
  }

  std::string text(static_cast<size_t>(declared), '\0');
  size_t read = ZSTD_decompressDCtx(&thread_decompression_context(), text.data(), text.size(),
                                    frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw CompressionError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(read));
  }
  if (read != declared) {
    throw CompressionError("zstd frame declares " + std::to_string(declared) + " bytes, held " +
                           std::to_string(read));
  }
  return text;
}

}  // namespace finmda_core
