#ifndef CHUNKVAULT_FILE_MAPPING_REPOSITORY_HPP
#define CHUNKVAULT_FILE_MAPPING_REPOSITORY_HPP

#include "utilities/sqlite_db.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/// Row of `file_chunk_mappings`: one chunk occurrence inside a file.
struct MappingEntry {
  std::string chunkHash;
  uint32_t chunkIndex = 0;
  uint64_t chunkOffset = 0;
  uint64_t chunkSize = 0;
};

/// Row of `file_refs`: holders and summary of one stored file.
struct FileRefRecord {
  std::string fileHash;
  int64_t refCount = 0;
  uint64_t totalSize = 0;
  uint64_t chunkCount = 0;
};

/**
 * @brief File-to-chunk manifests and per-file holder counts.
 *
 * Mutating calls expect the caller to hold a write transaction so that a
 * manifest and its holder count always change together.
 */
class FileMappingRepository {
public:
  explicit FileMappingRepository(Database &db) : db_(db) {}

  static void createSchema(Database &db);

  /**
   * @brief Replace the manifest of @p fileHash with @p entries.
   * @return Chunk hashes of the rows that were replaced, in index order.
   */
  std::vector<std::string>
  replaceMapping(const std::string &fileHash,
                 const std::vector<MappingEntry> &entries);

  /// Manifest ordered by chunk_index; empty if unknown.
  std::vector<MappingEntry> getFileChunks(const std::string &fileHash);

  /// Delete the manifest and return its chunk hashes, one per occurrence.
  std::vector<std::string> deleteMapping(const std::string &fileHash);

  /// Distinct files whose manifests reference @p chunkHash.
  std::vector<std::string> getChunkFiles(const std::string &chunkHash);

  std::optional<FileRefRecord> findFileRef(const std::string &fileHash);

  /**
   * @brief Add one holder, creating the row if needed.
   * @return Holder count after the change.
   */
  int64_t addHolder(const std::string &fileHash, uint64_t totalSize,
                    uint64_t chunkCount);

  /**
   * @brief Release one holder; the row is deleted when none remain.
   * @return Holders left, or std::nullopt if the file is unknown.
   */
  std::optional<int64_t> releaseHolder(const std::string &fileHash);

  uint64_t fileCount();

private:
  Database &db_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_FILE_MAPPING_REPOSITORY_HPP
