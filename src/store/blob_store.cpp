#include "store/blob_store.hpp"
#include "utilities/digest.hpp"

namespace chunkvault {

std::string BlobStore::ensureBlob(std::span<const std::byte> data) {
  return store_.storeFile(data).fileHash;
}

std::string BlobStore::ensureBlob(const std::string &data) {
  return store_.storeFile(data).fileHash;
}

std::optional<std::vector<std::byte>>
BlobStore::readBlob(const std::string &fileHash) {
  return store_.readFile(fileHash);
}

int64_t BlobStore::incRef(const std::string &fileHash) {
  return store_.incRef(fileHash);
}

uint64_t BlobStore::decRef(const std::string &fileHash) {
  return store_.deleteFile(fileHash).remainingChunks;
}

bool BlobStore::existsRef(const std::string &fileHash) {
  return store_.fileExists(fileHash);
}

StorageStats BlobStore::getStorageStats() { return store_.getStorageStats(); }

size_t BlobStore::cleanupOrphanedBlobs() {
  return store_.cleanupOrphanedChunks();
}

bool BlobStore::isPointer(std::string_view content) {
  return content.starts_with(POINTER_PREFIX);
}

std::string BlobStore::makePointer(const std::string &fileHash) {
  return std::string(POINTER_PREFIX) + fileHash;
}

std::optional<std::string> BlobStore::parsePointer(std::string_view content) {
  if (!isPointer(content)) {
    return std::nullopt;
  }
  std::string_view hash = content.substr(POINTER_PREFIX.size());
  // Pointer files may end with a newline when written by hand.
  while (!hash.empty() && (hash.back() == '\n' || hash.back() == '\r')) {
    hash.remove_suffix(1);
  }
  if (!utils::is_valid_hex_digest(hash)) {
    return std::nullopt;
  }
  return std::string(hash);
}

} // namespace chunkvault
