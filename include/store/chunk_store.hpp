#ifndef CHUNKVAULT_CHUNK_STORE_HPP
#define CHUNKVAULT_CHUNK_STORE_HPP

#include "store/chunk_repository.hpp"
#include "store/chunker.hpp"
#include "store/file_mapping_repository.hpp"
#include "store/store_options.hpp"
#include "utilities/compression.hpp"
#include "utilities/sqlite_db.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkvault {

struct StoreChunkResult {
  bool isNew = false; ///< This call created the chunk
  std::string storagePath;
};

struct StoreResult {
  std::string fileHash;
  uint64_t totalSize = 0;
  uint64_t chunkCount = 0;
  uint64_t newChunks = 0; ///< Chunks created by this call rather than deduped
};

struct DeleteResult {
  uint64_t deletedChunks = 0;   ///< Decrements that destroyed a chunk
  uint64_t remainingChunks = 0; ///< Decrements that left the chunk alive
};

struct ChunkDescriptor {
  std::string hash;
  uint32_t index = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  uint64_t storedSize = 0; ///< Persisted payload length, 0 if the row is gone
};

struct FileInfo {
  std::string fileHash;
  uint64_t totalSize = 0;
  uint64_t chunkCount = 0;
  int64_t holders = 0;
  std::vector<ChunkDescriptor> chunks;
};

struct ChunkIssue {
  enum class Problem {
    MissingRow,
    MissingPayload,
    Undecodable,
    SizeMismatch,
    HashMismatch,
  };

  uint32_t index = 0;
  std::string hash;
  Problem problem = Problem::MissingRow;
  std::string detail;

  static const char *problemName(Problem problem);
};

struct VerifyReport {
  std::string fileHash;
  uint64_t chunksChecked = 0;
  uint64_t bytesChecked = 0;
  std::vector<ChunkIssue> issues;

  bool ok() const { return issues.empty(); }
};

struct StorageStats {
  uint64_t totalChunks = 0;
  uint64_t totalRefs = 0;
  uint64_t totalSize = 0;           ///< Uncompressed bytes over unique chunks
  uint64_t totalCompressedSize = 0; ///< Persisted bytes over unique chunks
  uint64_t totalFiles = 0;
  double compressionRatio = 0.0; ///< totalCompressedSize / totalSize
  double avgChunksPerFile = 0.0; ///< totalRefs / totalFiles
};

struct GCStats {
  uint64_t scannedFiles = 0;
  uint64_t orphanedChunks = 0;
  uint64_t orphanedBytes = 0;
  uint64_t removedChunks = 0;
  uint64_t removedBytes = 0;
  uint64_t strayFiles = 0; ///< Leftover temporary or tombstone files
};

/**
 * @brief Content-addressed, reference-counted chunk store.
 *
 * Files are split into fixed-size chunks that are stored once per distinct
 * content under `<root>/.chunks/<aa>/<hash>`, optionally zstd compressed.
 * Metadata lives in `<root>/metadata.db`. Every operation leases its own
 * SQLite connection, so one instance may be shared by any number of threads.
 */
class ChunkStore {
public:
  /// Age after which scanOrphanedChunks() treats temp and tombstone files as
  /// abandoned.
  static constexpr std::chrono::seconds STRAY_GRACE_PERIOD{3600};

  /**
   * @brief Open or create a store.
   * @throws StoreError Config if the chunk size is zero or differs from the
   *         one the store was created with.
   */
  explicit ChunkStore(StoreOptions options);

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  const StoreOptions &options() const { return options_; }
  const std::string &storageRoot() const { return options_.storageRoot; }

  // Chunk level

  /**
   * @brief Store one chunk or add a reference to an existing one.
   * @param hash Must be the hex SHA-256 of @p data.
   * @throws StoreError InvalidArgument if @p hash does not match @p data.
   */
  StoreChunkResult storeChunk(std::span<const std::byte> data,
                              const std::string &hash);

  /// Decompressed chunk bytes; nullopt if the row or its payload is missing.
  std::optional<std::vector<std::byte>> readChunk(const std::string &hash);

  /// Drop one reference; returns true if that destroyed the chunk.
  bool releaseChunk(const std::string &hash);

  int64_t getRefCount(const std::string &hash);
  bool chunkExists(const std::string &hash);

  // File level

  StoreResult storeFile(std::span<const std::byte> data);
  StoreResult storeFile(const std::string &data);

  /**
   * @brief Store a file read from @p in, one chunk in memory at a time.
   *
   * Produces the same file hash as storeFile() for the same bytes.
   */
  StoreResult storeFileStream(std::istream &in);

  /**
   * @brief Reassemble a file.
   * @return nullopt if the file is unknown.
   * @throws StoreError Integrity if any chunk is missing or damaged.
   */
  std::optional<std::vector<std::byte>> readFile(const std::string &fileHash);

  /**
   * @brief Stream a file to @p out.
   *
   * Chunks are written as they are verified; on an integrity error the
   * caller must discard whatever was written.
   * @return false if the file is unknown.
   */
  bool readFileTo(const std::string &fileHash, std::ostream &out);

  /// Release one holder of the file.
  DeleteResult deleteFile(const std::string &fileHash);

  /**
   * @brief Add a holder to a stored file, referencing its chunks again.
   * @return Holders after the call, 0 if the file is unknown.
   */
  int64_t incRef(const std::string &fileHash);

  bool fileExists(const std::string &fileHash);
  std::optional<FileInfo> getFileInfo(const std::string &fileHash);
  std::vector<std::string> getChunkFiles(const std::string &chunkHash);

  /// Re-hash every chunk of a file; nullopt if the file is unknown.
  std::optional<VerifyReport> verifyFile(const std::string &fileHash);

  // Maintenance

  StorageStats getStorageStats();

  /// Delete payload files that have no metadata row; returns how many.
  size_t cleanupOrphanedChunks();

  GCStats scanOrphanedChunks(bool dryRun);

  std::filesystem::path chunkPath(const std::string &hash) const;

private:
  struct Tombstone {
    std::filesystem::path live;
    std::filesystem::path grave;
  };

  /// Chunk references and manifest collected while storing one file.
  struct PendingFile {
    std::vector<MappingEntry> manifest;
    std::vector<std::string> chunkHashes;
    uint64_t totalSize = 0;
    uint64_t newChunks = 0;
  };

  void initialize();
  void pinChunkSize(Database &db);

  StoreChunkResult placeChunk(Database &db, std::span<const std::byte> data,
                              const std::string &hash);
  std::filesystem::path writeTempPayload(const std::filesystem::path &finalPath,
                                         std::span<const std::byte> payload);
  void addToPending(Database &db, PendingFile &pending, Chunk &&chunk);
  StoreResult commitFile(Database &db, PendingFile &pending);
  void releaseAcquired(Database &db, const std::vector<std::string> &hashes);

  DeleteResult decrementChunks(ChunkRepository &chunks,
                               const std::vector<std::string> &hashes,
                               std::vector<Tombstone> &graves);
  void commitRetirement(Transaction &tx, std::vector<Tombstone> &graves);
  void restoreTombstones(std::vector<Tombstone> &graves);

  struct PlannedChunk {
    MappingEntry entry;
    std::optional<ChunkRecord> record; ///< Empty if the chunk row is missing
  };

  /// Metadata snapshot of one file, taken in a single read transaction.
  struct FilePlan {
    FileRefRecord ref;
    std::vector<PlannedChunk> chunks;
  };

  std::optional<FilePlan> loadFilePlan(const std::string &fileHash);
  bool forEachFileChunk(
      const std::string &fileHash,
      const std::function<void(std::span<const std::byte>)> &sink);
  std::optional<std::vector<std::byte>> readPayload(const ChunkRecord &record);
  std::optional<std::vector<std::byte>>
  tryDecode(const ChunkRecord &record, std::span<const std::byte> payload,
            std::string &error);
  std::vector<std::byte> decodePayload(const ChunkRecord &record,
                                       std::span<const std::byte> payload);

  StoreOptions options_;
  Chunker chunker_;
  StorageCodec codec_;
  std::filesystem::path chunksDir_;
  ConnectionPool pool_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_STORE_HPP
