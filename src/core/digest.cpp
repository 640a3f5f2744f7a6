// =============================================================================
// tid - Digest Primitives Implementation
// =============================================================================

#include "tid/core/digest.h"

#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <fmt/format.h>

#include "tid/common/logger.h"

namespace tid {

namespace {

/// @brief Drain the OpenSSL error queue into a readable string.
std::string lastOpenSslError() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256] = {};
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(buffer);
}

/// @brief Stand-in buffer so empty inputs never hand OpenSSL a null pointer.
constexpr unsigned char kEmptyInput[1] = {0};

const void* dataOrEmpty(std::string_view text) noexcept {
    return text.empty() ? static_cast<const void*>(kEmptyInput) : text.data();
}

Result<Sha256Digest> digestFailure(std::string_view primitive) {
    const std::string detail = lastOpenSslError();
    TID_LOG_ERROR("{} failed: {}", primitive, detail);
    return makeError<Sha256Digest>(ErrorCode::kCryptoError,
                                   fmt::format("{} failed: {}", primitive, detail));
}

}  // namespace

Result<Sha256Digest> sha256(std::string_view message) {
    Sha256Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(dataOrEmpty(message), message.size(), digest.data(), &length, EVP_sha256(),
                   nullptr) != 1 ||
        length != kSha256Size) {
        return digestFailure("SHA-256");
    }
    return digest;
}

Result<Sha256Digest> hmacSha256(std::string_view key, std::string_view message) {
    Sha256Digest digest{};
    unsigned int length = 0;
    const unsigned char* out =
        HMAC(EVP_sha256(), dataOrEmpty(key), static_cast<int>(key.size()),
             static_cast<const unsigned char*>(dataOrEmpty(message)), message.size(),
             digest.data(), &length);
    if (out == nullptr || length != kSha256Size) {
        return digestFailure("HMAC-SHA256");
    }
    return digest;
}

}  // namespace tid
