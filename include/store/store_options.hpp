#ifndef CHUNKVAULT_STORE_OPTIONS_HPP
#define CHUNKVAULT_STORE_OPTIONS_HPP

#include <cstddef>
#include <string>

namespace chunkvault {

inline constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024; // 4 MiB

struct StoreOptions {
  std::string storageRoot;               ///< Holds .chunks/ and metadata.db
  size_t chunkSize = DEFAULT_CHUNK_SIZE; ///< Store-wide, pinned on first open
  bool compressionEnabled = true;
  int compressionLevel = 1;
  int busyTimeoutMs = 5000; ///< SQLite busy handler timeout per connection
  size_t connectionPoolSize = 4;
};

} // namespace chunkvault

#endif // CHUNKVAULT_STORE_OPTIONS_HPP
