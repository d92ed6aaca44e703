#ifndef CHUNKVAULT_COMPRESSION_HPP
#define CHUNKVAULT_COMPRESSION_HPP

#include <cstddef>
#include <span>
#include <vector>

/**
 * @brief Fail-safe zstd codec for chunk payloads at rest.
 *
 * Compression never fails outward; whenever it is disabled, pointless or
 * errors out, the input bytes are returned unchanged. Callers tell the two
 * apart by length: a compressed payload is strictly shorter than its input.
 */
class StorageCodec {
public:
  /**
   * @param enabled Whether compressForStorage() compresses at all.
   * @param compression_level Zstd compression level to use.
   */
  explicit StorageCodec(bool enabled = true, int compression_level = 1);

  bool enabled() const { return enabled_; }
  int compressionLevel() const { return compression_level_; }

  /// True if @p data starts with the zstd frame magic (28 B5 2F FD).
  static bool isCompressed(std::span<const std::byte> data);

  /**
   * @brief Compress a payload for storage.
   *
   * Returns the input unchanged when compression is disabled, the input is
   * empty, the input already is a zstd frame, zstd reports an error, or the
   * compressed frame would not be strictly smaller than the input.
   */
  std::vector<std::byte>
  compressForStorage(std::span<const std::byte> data) const;

  /**
   * @brief Strict decompression of a zstd frame.
   * @param expected_size Exact decompressed size required.
   * @throws std::runtime_error if the data is not a frame or decodes to a
   *         different size.
   */
  static std::vector<std::byte> decompressExact(std::span<const std::byte> blob,
                                                size_t expected_size);

private:
  bool enabled_ = true;
  int compression_level_ = 1;
};

#endif // CHUNKVAULT_COMPRESSION_HPP
