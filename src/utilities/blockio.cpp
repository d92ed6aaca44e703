#include "utilities/blockio.hpp"

#include <cctype>
#include <stdexcept> // For std::runtime_error

namespace chunkvault::utils {

std::string digest_to_hex(const DigestArray &digest) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(HEX_DIGEST_SIZE);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

bool is_valid_hex_digest(std::string_view name) {
  if (name.size() != HEX_DIGEST_SIZE) {
    return false;
  }
  for (char c : name) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

} // namespace chunkvault::utils

void BlockIO::ensure_sodium() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

BlockIO::BlockIO() {
  ensure_sodium();
  crypto_hash_sha256_init(&sha_state_);
}

BlockIO::~BlockIO() { sodium_memzero(&sha_state_, sizeof(sha_state_)); }

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

void BlockIO::ingest(std::span<const std::byte> data) {
  ingest(data.data(), data.size());
}

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }
  DigestResult result;
  crypto_hash_sha256_final(&sha_state_, result.digest.data());
  result.hex = chunkvault::utils::digest_to_hex(result.digest);
  finalized_ = true;
  return result;
}

std::string BlockIO::hash_hex(std::span<const std::byte> data) {
  ensure_sodium();
  chunkvault::utils::DigestArray digest;
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return chunkvault::utils::digest_to_hex(digest);
}

std::string BlockIO::hash_hex(const std::string &data) {
  return hash_hex(std::as_bytes(std::span<const char>(data.data(), data.size())));
}
