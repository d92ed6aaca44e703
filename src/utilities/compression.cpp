#include "utilities/compression.hpp"
#include "utilities/logger.h"

#include <stdexcept>
#include <string>
#include <zstd.h>

namespace {

constexpr unsigned char kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};

} // namespace

StorageCodec::StorageCodec(bool enabled, int compression_level)
    : enabled_(enabled), compression_level_(compression_level) {
  if (compression_level_ < ZSTD_minCLevel() ||
      compression_level_ > ZSTD_maxCLevel()) {
    throw std::invalid_argument("zstd compression level out of range: " +
                                std::to_string(compression_level_));
  }
}

bool StorageCodec::isCompressed(std::span<const std::byte> data) {
  if (data.size() < sizeof(kZstdMagic)) {
    return false;
  }
  for (size_t i = 0; i < sizeof(kZstdMagic); ++i) {
    if (data[i] != std::byte{kZstdMagic[i]}) {
      return false;
    }
  }
  return true;
}

std::vector<std::byte>
StorageCodec::compressForStorage(std::span<const std::byte> data) const {
  std::vector<std::byte> unchanged(data.begin(), data.end());
  if (!enabled_ || data.empty() || isCompressed(data)) {
    return unchanged;
  }

  size_t const cBuffSize = ZSTD_compressBound(data.size());
  std::vector<std::byte> compressed(cBuffSize);
  size_t const cSize = ZSTD_compress(compressed.data(), cBuffSize, data.data(),
                                     data.size(), compression_level_);
  if (ZSTD_isError(cSize)) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("ZSTD_compress failed, storing "
                                          "payload uncompressed: ") +
                                  ZSTD_getErrorName(cSize));
    return unchanged;
  }
  if (cSize >= data.size()) {
    return unchanged; // Incompressible
  }
  compressed.resize(cSize);
  return compressed;
}

std::vector<std::byte>
StorageCodec::decompressExact(std::span<const std::byte> blob,
                              size_t expected_size) {
  if (!isCompressed(blob)) {
    throw std::runtime_error("ZSTD_decompress failed: missing frame magic");
  }
  unsigned long long const rSize =
      ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (rSize == ZSTD_CONTENTSIZE_ERROR) {
    throw std::runtime_error("ZSTD_decompress failed: invalid frame header");
  }
  if (rSize != ZSTD_CONTENTSIZE_UNKNOWN && rSize != expected_size) {
    throw std::runtime_error("ZSTD_decompress failed: frame holds " +
                             std::to_string(rSize) + " bytes, expected " +
                             std::to_string(expected_size));
  }

  std::vector<std::byte> out(expected_size);
  size_t const dSize =
      ZSTD_decompress(out.data(), out.size(), blob.data(), blob.size());
  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }
  if (dSize != expected_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return out;
}
