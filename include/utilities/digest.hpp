#ifndef CHUNKVAULT_DIGEST_HPP
#define CHUNKVAULT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunkvault::utils {

/// Digest size of SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

/// Length of a digest rendered as lowercase hex.
inline constexpr size_t HEX_DIGEST_SIZE = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// Render a digest as 64 lowercase hex characters.
std::string digest_to_hex(const DigestArray &digest);

/**
 * @brief Check whether @p name is a syntactically valid content hash.
 *
 * A content hash is exactly 64 hex characters. Upper case is accepted so
 * that files copied through case-preserving tools are still recognised.
 */
bool is_valid_hex_digest(std::string_view name);

} // namespace chunkvault::utils

#endif // CHUNKVAULT_DIGEST_HPP
