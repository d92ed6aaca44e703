#ifndef CHUNKVAULT_CHUNKER_HPP
#define CHUNKVAULT_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <span>
#include <string>
#include <vector>

namespace chunkvault {

/// One fixed-size slice of a file, with its content hash.
struct Chunk {
  std::vector<std::byte> data;
  std::string hash; ///< Lowercase hex SHA-256 of data
  uint32_t index = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
};

/**
 * @brief Fixed-size chunking of buffers and streams.
 *
 * Both variants produce identical chunk boundaries for the same input: every
 * chunk but the last holds exactly chunkSize() bytes.
 */
class Chunker {
public:
  /// @throws StoreError (Kind::Config) if @p chunkSize is zero.
  explicit Chunker(size_t chunkSize);

  size_t chunkSize() const { return chunkSize_; }

  std::vector<Chunk> split(std::span<const std::byte> data) const;

  /// Read the whole stream into chunks. Prefer forEachChunk() for large input.
  std::vector<Chunk> splitStream(std::istream &in) const;

  /**
   * @brief Visit chunks of a stream one at a time.
   *
   * Only the chunk being visited is held in memory. Short reads are retried
   * until a chunk is full or the stream reaches end of input.
   *
   * @return Total number of bytes read.
   * @throws StoreError (Kind::Io) if the stream goes bad.
   */
  uint64_t forEachChunk(std::istream &in,
                        const std::function<void(Chunk &&)> &visit) const;

  /// Whole-file hash: SHA-256 over the concatenated chunk hash strings.
  static std::string fileHash(const std::vector<std::string> &chunkHashes);
  static std::string fileHash(const std::vector<Chunk> &chunks);

private:
  size_t chunkSize_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNKER_HPP
