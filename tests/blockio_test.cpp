#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "utilities/blockio.hpp"
#include <array>
#include <cstddef> // For std::byte
#include <stdexcept> // For std::logic_error, std::invalid_argument
#include <string>
#include <vector>

using test_helpers::create_byte_vector;
using test_helpers::string_to_byte_vector;

namespace {

const std::string kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

// Helper function to convert hex string to std::array<uint8_t, 32>
// Throws std::invalid_argument if the string length is incorrect.
std::array<uint8_t, 32> hex_string_to_digest(const std::string &hex_str) {
  if (hex_str.length() != 64) {
    throw std::invalid_argument("Hex string must be 64 characters long. Provided: " + hex_str);
  }
  std::array<uint8_t, 32> digest;
  for (size_t i = 0; i < 32; ++i) {
    digest[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
  }
  return digest;
}

} // namespace

TEST(BlockIOTest, FinalizeHashedEmpty) {
  BlockIO bio;
  DigestResult result = bio.finalize_hashed();
  EXPECT_EQ(result.hex, kEmptySha256);
  EXPECT_EQ(result.digest, hex_string_to_digest(kEmptySha256));
}

TEST(BlockIOTest, FinalizeHashedKnownVector) {
  BlockIO bio;
  std::vector<std::byte> data = string_to_byte_vector("abc");
  bio.ingest(data.data(), data.size());
  DigestResult result = bio.finalize_hashed();
  EXPECT_EQ(result.hex, kAbcSha256);
  EXPECT_EQ(result.digest, hex_string_to_digest(kAbcSha256));
}

TEST(BlockIOTest, IngestMultipleChunksMatchesOneShot) {
  std::vector<std::byte> data = create_byte_vector(3 * 64 * 1024 + 17);

  BlockIO bio;
  const size_t step = 4096;
  for (size_t off = 0; off < data.size(); off += step) {
    size_t len = std::min(step, data.size() - off);
    bio.ingest(std::span<const std::byte>(data).subspan(off, len));
  }
  DigestResult result = bio.finalize_hashed();

  EXPECT_EQ(result.hex, BlockIO::hash_hex(data));
}

TEST(BlockIOTest, FinalizeHashedStateManagement) {
  BlockIO bio;
  std::vector<std::byte> data = string_to_byte_vector("payload");
  bio.ingest(data);
  DigestResult first_result = bio.finalize_hashed(); // First call is fine
  EXPECT_FALSE(first_result.hex.empty());

  ASSERT_THROW(bio.finalize_hashed(), std::logic_error);
  ASSERT_THROW(bio.ingest(data), std::logic_error);
}

TEST(BlockIOTest, HashHexOverloadsAgree) {
  EXPECT_EQ(BlockIO::hash_hex(std::string("abc")), kAbcSha256);
  EXPECT_EQ(BlockIO::hash_hex(string_to_byte_vector("abc")), kAbcSha256);
  EXPECT_EQ(BlockIO::hash_hex(std::string()), kEmptySha256);
}

TEST(DigestTest, ValidHexDigest) {
  using chunkvault::utils::is_valid_hex_digest;
  EXPECT_TRUE(is_valid_hex_digest(kAbcSha256));
  EXPECT_TRUE(is_valid_hex_digest(std::string(64, 'F')));
  EXPECT_FALSE(is_valid_hex_digest(kAbcSha256.substr(1)));
  EXPECT_FALSE(is_valid_hex_digest(kAbcSha256 + "0"));
  EXPECT_FALSE(is_valid_hex_digest(std::string(63, 'a') + "g"));
  EXPECT_FALSE(is_valid_hex_digest(kAbcSha256.substr(0, 60) + ".tmp"));
}

TEST(DigestTest, DigestToHexIsLowercase) {
  chunkvault::utils::DigestArray digest{};
  digest[0] = 0xAB;
  digest[31] = 0x0F;
  std::string hex = chunkvault::utils::digest_to_hex(digest);
  ASSERT_EQ(hex.size(), chunkvault::utils::HEX_DIGEST_SIZE);
  EXPECT_EQ(hex.substr(0, 2), "ab");
  EXPECT_EQ(hex.substr(62, 2), "0f");
}
