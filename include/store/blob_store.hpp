#ifndef CHUNKVAULT_BLOB_STORE_HPP
#define CHUNKVAULT_BLOB_STORE_HPP

#include "store/chunk_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault {

/**
 * @brief Whole-blob view over a ChunkStore.
 *
 * Callers that persist a placeholder instead of file content write a pointer
 * of the form `REF:<file hash>` (see makePointer()) and resolve it through
 * readBlob(). Each ensureBlob() or incRef() must be paired with one decRef().
 */
class BlobStore {
public:
  static constexpr std::string_view POINTER_PREFIX = "REF:";

  explicit BlobStore(ChunkStore &store) : store_(store) {}

  /// Store @p data and hold one reference to it; returns the file hash.
  std::string ensureBlob(std::span<const std::byte> data);
  std::string ensureBlob(const std::string &data);

  std::optional<std::vector<std::byte>> readBlob(const std::string &fileHash);

  /// Add a holder; returns the holder count, 0 if the blob is unknown.
  int64_t incRef(const std::string &fileHash);

  /// Release a holder; returns how many chunk references survived.
  uint64_t decRef(const std::string &fileHash);

  bool existsRef(const std::string &fileHash);

  StorageStats getStorageStats();
  size_t cleanupOrphanedBlobs();

  static bool isPointer(std::string_view content);
  static std::string makePointer(const std::string &fileHash);

  /// Hash inside a pointer; nullopt if @p content is not a valid pointer.
  static std::optional<std::string> parsePointer(std::string_view content);

private:
  ChunkStore &store_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_BLOB_STORE_HPP
