// =============================================================================
// tid - Digest Primitives
// =============================================================================
// SHA-256 and HMAC-SHA256 over OpenSSL's EVP interface, used to derive
// deterministic identifiers from seed input.
// =============================================================================

#ifndef TID_CORE_DIGEST_H
#define TID_CORE_DIGEST_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tid/common/error.h"

namespace tid {

/// @brief Size of a SHA-256 digest in bytes.
inline constexpr std::size_t kSha256Size = 32;

/// @brief Raw SHA-256 digest.
using Sha256Digest = std::array<std::uint8_t, kSha256Size>;

/// @brief SHA-256 of a message.
/// @return Error kCryptoError when OpenSSL reports a failure.
[[nodiscard]] Result<Sha256Digest> sha256(std::string_view message);

/// @brief HMAC-SHA256 of a message under a key.
/// @return Error kCryptoError when OpenSSL reports a failure.
[[nodiscard]] Result<Sha256Digest> hmacSha256(std::string_view key, std::string_view message);

/// @brief First 8 bytes of a digest as a big-endian integer.
[[nodiscard]] constexpr std::uint64_t digestPrefix(const Sha256Digest& digest) noexcept {
    std::uint64_t prefix = 0;
    for (std::size_t i = 0; i < sizeof(prefix); ++i) {
        prefix = (prefix << 8) | digest[i];
    }
    return prefix;
}

}  // namespace tid

#endif  // TID_CORE_DIGEST_H
