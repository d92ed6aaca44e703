#ifndef CHUNKVAULT_BLOCKIO_HPP
#define CHUNKVAULT_BLOCKIO_HPP

#include "utilities/digest.hpp"
#include <cstddef>  // For std::byte
#include <sodium.h> // For libsodium
#include <span>
#include <string>

struct DigestResult {
  chunkvault::utils::DigestArray digest; // 32 bytes for SHA-256
  std::string hex;                       // Lowercase hex rendering of digest
};

/**
 * @brief Incremental SHA-256 hashing.
 *
 * Data is fed with ingest() and the digest obtained once with
 * finalize_hashed(). Chunker::fileHash() streams chunk hashes through it.
 */
class BlockIO {
public:
  BlockIO();
  ~BlockIO();

  BlockIO(const BlockIO &) = delete;
  BlockIO &operator=(const BlockIO &) = delete;

  // Appends data to the digest.
  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data);

  // Finalizes the hash. May be called only once.
  DigestResult finalize_hashed();

  /// One-shot SHA-256 of a buffer, as lowercase hex.
  static std::string hash_hex(std::span<const std::byte> data);
  static std::string hash_hex(const std::string &data);

  /// Initialise libsodium. Safe to call repeatedly and from many threads.
  static void ensure_sodium();

private:
  crypto_hash_sha256_state sha_state_;
  bool finalized_ = false;
};

#endif // CHUNKVAULT_BLOCKIO_HPP
