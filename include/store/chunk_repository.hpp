#ifndef CHUNKVAULT_CHUNK_REPOSITORY_HPP
#define CHUNKVAULT_CHUNK_REPOSITORY_HPP

#include "utilities/sqlite_db.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/// Row of the `chunks` table.
struct ChunkRecord {
  std::string hash;
  uint64_t size = 0;           ///< Uncompressed length
  uint64_t compressedSize = 0; ///< Persisted payload length
  int64_t refCount = 0;
  std::string storagePath;

  /// Payload is a zstd frame rather than the raw bytes.
  bool isCompressed() const { return compressedSize < size; }
};

/// Aggregates over all chunk rows.
struct ChunkTotals {
  uint64_t totalChunks = 0;
  uint64_t totalRefs = 0;
  uint64_t totalSize = 0;
  uint64_t totalCompressedSize = 0;
};

/**
 * @brief Chunk metadata store on top of one SQLite connection.
 *
 * All reference count changes are single SQL updates so concurrent writers
 * never lose an update. decrementRef() must run inside a write transaction
 * owned by the caller so the caller can retire the payload before commit.
 */
class ChunkRepository {
public:
  explicit ChunkRepository(Database &db) : db_(db) {}

  static void createSchema(Database &db);

  std::optional<ChunkRecord> find(const std::string &hash);
  bool exists(const std::string &hash);
  /// 0 for unknown hashes.
  int64_t getRefCount(const std::string &hash);

  /**
   * @brief Atomically add one reference.
   * @return false if no row exists for @p hash.
   */
  bool incrementRef(const std::string &hash);

  /**
   * @brief Insert a new row with ref_count 1.
   * @throws SqliteError with isUniqueViolation() if the hash already exists.
   */
  void insert(const ChunkRecord &record);

  struct DecrementResult {
    bool found = false;   ///< A row existed for the hash
    bool removed = false; ///< The row reached zero and was deleted
    int64_t refCount = 0; ///< Count after the decrement
  };

  /**
   * @brief Drop one reference, deleting the row when it reaches zero.
   *
   * The count is clamped at zero, so a row whose count was already zero is
   * deleted as well.
   */
  DecrementResult decrementRef(const std::string &hash);

  ChunkTotals totals();

private:
  Database &db_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_REPOSITORY_HPP
